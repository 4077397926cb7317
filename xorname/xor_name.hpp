#pragma once

#include "decode_error.hpp"
#include "util/aligned.hpp"
#include "util/formattable.hpp"
#include "util/types.hpp"

#include <oxenc/bt.h>

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace xorname
{
  /// Byte length of a XorName.
  inline constexpr std::size_t XOR_NAME_LEN = 64;

  /// Bit length of a XorName.
  inline constexpr std::size_t XOR_NAME_BITS = XOR_NAME_LEN * 8;

  /// Three-way result of comparing two names, either as plain numbers or by their distance from
  /// some reference name.
  enum class Ordering
  {
    less = -1,
    equal = 0,
    greater = 1,
  };

  std::string_view
  ToString(Ordering o);

  template <>
  inline constexpr bool IsToStringFormattable<Ordering> = true;

  /// A XOR_NAME_BITS-bit number, viewed as a point in XOR space.
  ///
  /// The bytes are the big-endian digits of a number between 0 and 2^XOR_NAME_BITS - 1.  The
  /// distance between two names x and y is x xor y, read as a number of the same width (the
  /// Kademlia metric).
  struct XorName : public AlignedBuffer<XOR_NAME_LEN>
  {
    using Data = std::array<byte_t, SIZE>;

    XorName() = default;

    explicit XorName(const Data& data) : AlignedBuffer<SIZE>(data)
    {}

    explicit XorName(const byte_t* buf) : AlignedBuffer<SIZE>(buf)
    {}

    explicit XorName(const AlignedBuffer<SIZE>& data) : AlignedBuffer<SIZE>(data)
    {}

    /// Name with every byte drawn from libsodium's csprng.  For tests and examples only; real
    /// names come from hashing content.
    static XorName
    random();

    /// Builds a name from a runtime-sized byte range.  Throws DecodeError (InvalidLength) unless
    /// exactly SIZE bytes are given.
    static XorName
    from_bytes(ustring_view bytes);

    static XorName
    from_bytes(std::string_view bytes)
    {
      return from_bytes(to_usv(bytes));
    }

    /// Parses the lowercase or uppercase hex form.  Throws DecodeError: InvalidCharacter for the
    /// first non-hex character, otherwise InvalidLength unless there are exactly 2*SIZE digits.
    static XorName
    from_hex(std::string_view str);

    /// Same as from_hex, but returns nullopt instead of throwing.
    static std::optional<XorName>
    try_from_hex(std::string_view str);

    /// Decodes the bt list produced by bt_encode().
    static XorName
    bt_decode(std::string_view bt);

    /// Decodes a name from a list consumer, typically obtained from an enclosing dict with
    /// consume_list_consumer().  The element count is checked before any element is read.
    static XorName
    bt_decode(oxenc::bt_list_consumer btlc);

    static std::optional<XorName>
    try_bt_decode(std::string_view bt);

    Data
    raw_bytes() const
    {
      return as_array();
    }

    ustring_view
    byte_slice() const
    {
      return {data(), SIZE};
    }

    /// bytes [from, to)
    ustring_view
    byte_slice(std::size_t from, std::size_t to) const;

    /// bytes [0, n)
    ustring_view
    prefix(std::size_t n) const;

    /// bytes [from, SIZE)
    ustring_view
    suffix(std::size_t from) const;

    /// Returns the number of leading bits in which *this and `other` agree, i.e. the bucket index
    /// of `other` in a routing table centred on *this.
    ///
    /// E.g. for 10101... and 10011... this is 2: the common prefix is 10 and the third bit is the
    /// first one that differs.  The result is XOR_NAME_BITS only when the names are equal.
    std::size_t
    common_prefix_length(const XorName& other) const;

    /// Short form "xxyyzz..aabbcc" (first and last three bytes) for log output.  Not parseable.
    std::string
    ToString() const;

    /// l i<byte>e ... e, one integer per byte in index order
    std::string
    bt_encode() const;

    /// Appends the SIZE elements to a sublist of an enclosing producer, e.g.
    /// name.bt_encode(btdp.append_list("n"))
    void
    bt_encode(oxenc::bt_list_producer&& btlp) const;

    XorName
    operator^(const XorName& other) const
    {
      return XorName{AlignedBuffer<SIZE>::operator^(other)};
    }

   private:
    void
    append_elements(oxenc::bt_list_producer& btlp) const;
  };

  /// Compares `a` and `b` by their XOR distance from `reference`: Ordering::less means `a` is
  /// the closer one.  The distances are never materialized; only the first byte where `a` and
  /// `b` differ decides.
  Ordering
  closer(const XorName& reference, const XorName& a, const XorName& b);

  /// Returns true if `a` is strictly closer to `target` than `b`.
  ///
  /// Equivalently, in the most significant bit where `a` and `b` disagree, `a` agrees with
  /// `target`.
  inline bool
  is_closer(const XorName& a, const XorName& b, const XorName& target)
  {
    return closer(target, a, b) == Ordering::less;
  }

  /// Returns true if `a` is closer to `target` than `b`, or exactly as close (i.e. `a == b`).
  inline bool
  is_closer_or_equal(const XorName& a, const XorName& b, const XorName& target)
  {
    return closer(target, a, b) != Ordering::greater;
  }

  /// Plain numeric three-way comparison, the same order as operator<.  This is the order of
  /// distance from the all-zero name.
  Ordering
  compare(const XorName& a, const XorName& b);

  inline std::ostream&
  operator<<(std::ostream& out, const XorName& name)
  {
    return out << name.ToString();
  }

  template <>
  inline constexpr bool IsToStringFormattable<XorName> = true;
}  // namespace xorname

namespace std
{
  template <>
  struct hash<xorname::XorName> : hash<xorname::AlignedBuffer<xorname::XorName::SIZE>>
  {};
}  // namespace std
