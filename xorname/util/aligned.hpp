#pragma once

#include "formattable.hpp"
#include "types.hpp"

#include <oxenc/hex.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstring>
#include <functional>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

namespace xorname
{
  /// aligned buffer that is sz bytes long and aligns to the nearest Alignment.  The contents are
  /// fixed once constructed; only whole-value assignment replaces them.
  template <size_t sz>
  // Microsoft C malloc(3C) cannot return pointers aligned wider than 8 ffs
#ifdef _WIN32
  struct alignas(uint64_t) AlignedBuffer
#else
  struct alignas(std::max_align_t) AlignedBuffer
#endif
  {
    static_assert(alignof(std::max_align_t) <= 16, "insane alignment");
    static_assert(
        sz >= 8,
        "AlignedBuffer cannot be used with buffers smaller than 8 "
        "bytes");

    static constexpr size_t SIZE = sz;

    AlignedBuffer()
    {
      _data.fill(0);
    }

    explicit AlignedBuffer(const byte_t* data)
    {
      std::memcpy(_data.data(), data, sz);
    }

    explicit AlignedBuffer(const std::array<byte_t, SIZE>& buf) : _data(buf)
    {}

    bool
    operator==(const AlignedBuffer& other) const
    {
      return _data == other._data;
    }

    bool
    operator!=(const AlignedBuffer& other) const
    {
      return _data != other._data;
    }

    bool
    operator<(const AlignedBuffer& other) const
    {
      return _data < other._data;
    }

    bool
    operator>(const AlignedBuffer& other) const
    {
      return _data > other._data;
    }

    bool
    operator<=(const AlignedBuffer& other) const
    {
      return _data <= other._data;
    }

    bool
    operator>=(const AlignedBuffer& other) const
    {
      return _data >= other._data;
    }

    AlignedBuffer
    operator^(const AlignedBuffer& other) const
    {
      std::array<byte_t, SIZE> ret;
      std::transform(begin(), end(), other.begin(), ret.begin(), std::bit_xor<byte_t>());
      return AlignedBuffer{ret};
    }

    const byte_t&
    operator[](size_t idx) const
    {
      return _data[idx];
    }

    static constexpr size_t
    size()
    {
      return sz;
    }

    const std::array<byte_t, SIZE>&
    as_array() const
    {
      return _data;
    }

    const byte_t*
    data() const
    {
      return _data.data();
    }

    bool
    IsZero() const
    {
      return std::all_of(begin(), end(), [](byte_t b) { return b == 0; });
    }

    typename std::array<byte_t, SIZE>::const_iterator
    begin() const
    {
      return _data.cbegin();
    }

    typename std::array<byte_t, SIZE>::const_iterator
    end() const
    {
      return _data.cend();
    }

    std::string_view
    ToView() const
    {
      return {reinterpret_cast<const char*>(data()), sz};
    }

    std::string
    ToHex() const
    {
      return oxenc::to_hex(begin(), end());
    }

   private:
    std::array<byte_t, SIZE> _data;
  };

  template <size_t sz>
  std::ostream&
  operator<<(std::ostream& out, const AlignedBuffer<sz>& buf)
  {
    return out << buf.ToHex();
  }

  namespace detail
  {
    template <size_t Sz>
    static std::true_type is_aligned_buffer_impl(AlignedBuffer<Sz>*);

    static std::false_type is_aligned_buffer_impl(...);
  }  // namespace detail
  // True if T is or is derived from AlignedBuffer<N> for any N
  template <typename T>
  constexpr inline bool is_aligned_buffer =
      decltype(detail::is_aligned_buffer_impl(static_cast<T*>(nullptr)))::value;

}  // namespace xorname

namespace fmt
{
  // Any AlignedBuffer<N> (or subclass) gets hex formatted when output:
  template <typename T>
  struct formatter<
      T,
      char,
      std::enable_if_t<xorname::is_aligned_buffer<T> && !xorname::IsToStringFormattable<T>>>
      : formatter<std::string_view>
  {
    template <typename FormatContext>
    auto
    format(const T& val, FormatContext& ctx) const
    {
      auto it = oxenc::hex_encoder{val.begin(), val.end()};
      return std::copy(it, it.end(), ctx.out());
    }
  };
}  // namespace fmt

namespace std
{
  template <size_t sz>
  struct hash<xorname::AlignedBuffer<sz>>
  {
    std::size_t
    operator()(const xorname::AlignedBuffer<sz>& buf) const noexcept
    {
      return std::hash<std::string_view>{}(buf.ToView());
    }
  };
}  // namespace std
