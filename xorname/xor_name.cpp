#include "xor_name.hpp"

#include "util/bits.hpp"
#include "util/logging.hpp"

#include <fmt/format.h>
#include <oxenc/hex.h>
#include <sodium/core.h>
#include <sodium/randombytes.h>

#include <charconv>
#include <stdexcept>

namespace xorname
{
  namespace
  {
    // number of bytes shown at each end of the short form
    constexpr std::size_t SHORT_BYTES = 3;

    // nesting limit when measuring bt values; a name is a flat list
    constexpr int MAX_BT_DEPTH = 32;

    /// Returns the byte length of the complete bt value at the front of `s`, or nullopt if it is
    /// truncated or its framing is malformed.  Integer range is left for the consumer to check.
    std::optional<std::size_t>
    bt_value_size(std::string_view s, int depth = 0)
    {
      if (s.empty() || depth > MAX_BT_DEPTH)
        return std::nullopt;

      switch (s.front())
      {
        case 'i':
        {
          const auto end = s.find('e', 1);
          if (end == std::string_view::npos || end == 1)
            return std::nullopt;
          const std::size_t first = s[1] == '-' ? 2 : 1;
          if (end == first || s.find_first_not_of("0123456789", first) != end)
            return std::nullopt;
          return end + 1;
        }
        case 'l':
        case 'd':
        {
          std::size_t pos = 1;
          while (pos < s.size() && s[pos] != 'e')
          {
            const auto sz = bt_value_size(s.substr(pos), depth + 1);
            if (not sz)
              return std::nullopt;
            pos += *sz;
          }
          if (pos >= s.size())
            return std::nullopt;
          return pos + 1;
        }
        default:
        {
          const auto colon = s.find(':');
          if (colon == std::string_view::npos || colon == 0)
            return std::nullopt;
          std::size_t len;
          const auto* digits_end = s.data() + colon;
          auto [p, ec] = std::from_chars(s.data(), digits_end, len);
          if (ec != std::errc() || p != digits_end || len > s.size() - colon - 1)
            return std::nullopt;
          return colon + 1 + len;
        }
      }
    }
  }  // namespace

  std::string_view
  ToString(Ordering o)
  {
    switch (o)
    {
      case Ordering::less:
        return "less";
      case Ordering::equal:
        return "equal";
      case Ordering::greater:
        return "greater";
    }
    return "unknown";
  }

  XorName
  XorName::random()
  {
    static const bool sodium_ready = sodium_init() != -1;
    if (not sodium_ready)
      throw std::runtime_error("sodium_init() returned -1");

    Data data;
    randombytes_buf(data.data(), data.size());
    return XorName{data};
  }

  XorName
  XorName::from_bytes(ustring_view bytes)
  {
    if (bytes.size() != SIZE)
    {
      log::debug(codec_cat, "name from bytes: size mismatch {} != {}", bytes.size(), SIZE);
      throw DecodeError::invalid_length(
          fmt::format("invalid byte length: expected {} bytes, got {}", SIZE, bytes.size()));
    }
    return XorName{bytes.data()};
  }

  XorName
  XorName::from_hex(std::string_view str)
  {
    for (std::size_t i = 0; i < str.size(); ++i)
    {
      if (not oxenc::is_hex_digit(str[i]))
      {
        log::debug(codec_cat, "invalid hex character at position {} of {}", i, str.size());
        throw DecodeError::invalid_character(str[i], i);
      }
    }

    // odd lengths land here too: they cannot make whole bytes
    if (str.size() != 2 * SIZE)
    {
      log::debug(codec_cat, "hex name has {} digits, expected {}", str.size(), 2 * SIZE);
      throw DecodeError::invalid_length(fmt::format(
          "invalid hex length: expected {} characters, got {}", 2 * SIZE, str.size()));
    }

    Data data;
    oxenc::from_hex(str.begin(), str.end(), data.begin());
    return XorName{data};
  }

  std::optional<XorName>
  XorName::try_from_hex(std::string_view str)
  {
    if (str.size() != 2 * SIZE || !oxenc::is_hex(str))
      return std::nullopt;

    Data data;
    oxenc::from_hex(str.begin(), str.end(), data.begin());
    return XorName{data};
  }

  XorName
  XorName::bt_decode(std::string_view bt)
  {
    if (bt.empty() || bt.front() != 'l')
    {
      log::debug(codec_cat, "name is not a bt list ({} bytes)", bt.size());
      throw DecodeError::invalid_sequence("bt encoded name must be a list");
    }

    // the consumer reads past the end of a truncated list, so the framing is checked first
    const auto size = bt_value_size(bt);
    if (not size)
    {
      log::debug(codec_cat, "bt name list is truncated or malformed ({} bytes)", bt.size());
      throw DecodeError::invalid_sequence("bt encoded name list is truncated or malformed");
    }
    if (*size != bt.size())
    {
      log::debug(codec_cat, "bt name list followed by {} extra bytes", bt.size() - *size);
      throw DecodeError::invalid_sequence(
          fmt::format("{} unexpected bytes after bt encoded name list", bt.size() - *size));
    }
    return bt_decode(oxenc::bt_list_consumer{bt});
  }

  XorName
  XorName::bt_decode(oxenc::bt_list_consumer btlc)
  {
    try
    {
      std::size_t len = 0;
      for (auto counter = btlc; not counter.is_finished(); ++len)
        counter.skip_value();

      if (len != SIZE)
      {
        log::debug(codec_cat, "bt name list has {} elements, expected {}", len, SIZE);
        throw DecodeError::invalid_length(
            fmt::format("Expecting array of length: {}, but found {}", SIZE, len));
      }

      Data data;
      for (std::size_t i = 0; i < SIZE; ++i)
      {
        const auto val = btlc.consume_integer<uint64_t>();
        if (val > 0xff)
        {
          log::debug(codec_cat, "bt name element {} out of byte range: {}", i, val);
          throw DecodeError::invalid_sequence(
              fmt::format("element {} is not a byte value: {}", i, val));
        }
        data[i] = static_cast<byte_t>(val);
      }
      return XorName{data};
    }
    catch (const oxenc::bt_deserialize_invalid& e)
    {
      log::debug(codec_cat, "malformed bt name list: {}", e.what());
      throw DecodeError::invalid_sequence(e.what());
    }
    catch (const std::runtime_error& e)
    {
      // oxenc consumers report some framing problems this way rather than bt_deserialize_invalid
      log::debug(codec_cat, "unreadable bt name list: {}", e.what());
      throw DecodeError::invalid_sequence(e.what());
    }
  }

  std::optional<XorName>
  XorName::try_bt_decode(std::string_view bt)
  {
    try
    {
      return bt_decode(bt);
    }
    catch (const DecodeError&)
    {
      return std::nullopt;
    }
  }

  ustring_view
  XorName::byte_slice(std::size_t from, std::size_t to) const
  {
    if (from > to || to > SIZE)
      throw std::out_of_range{
          fmt::format("byte range [{}, {}) is outside of a {} byte name", from, to, SIZE)};
    return {data() + from, to - from};
  }

  ustring_view
  XorName::prefix(std::size_t n) const
  {
    return byte_slice(0, n);
  }

  ustring_view
  XorName::suffix(std::size_t from) const
  {
    return byte_slice(from, SIZE);
  }

  std::size_t
  XorName::common_prefix_length(const XorName& other) const
  {
    for (std::size_t i = 0; i < SIZE; ++i)
    {
      if (const byte_t diff = (*this)[i] ^ other[i]; diff != 0)
        return i * 8 + bits::count_leading_zeros(diff);
    }
    return XOR_NAME_BITS;
  }

  std::string
  XorName::ToString() const
  {
    return fmt::format(
        "{}..{}",
        oxenc::to_hex(begin(), begin() + SHORT_BYTES),
        oxenc::to_hex(end() - SHORT_BYTES, end()));
  }

  void
  XorName::append_elements(oxenc::bt_list_producer& btlp) const
  {
    for (const auto b : *this)
      btlp.append(static_cast<uint64_t>(b));
  }

  std::string
  XorName::bt_encode() const
  {
    oxenc::bt_list_producer btlp;
    append_elements(btlp);
    return std::string{btlp.view()};
  }

  void
  XorName::bt_encode(oxenc::bt_list_producer&& btlp) const
  {
    append_elements(btlp);
  }

  Ordering
  closer(const XorName& reference, const XorName& a, const XorName& b)
  {
    for (std::size_t i = 0; i < XorName::SIZE; ++i)
    {
      if (a[i] != b[i])
      {
        // equal prefixes of a and b contribute equally to both distances
        const byte_t da = a[i] ^ reference[i];
        const byte_t db = b[i] ^ reference[i];
        return da < db ? Ordering::less : Ordering::greater;
      }
    }
    return Ordering::equal;
  }

  Ordering
  compare(const XorName& a, const XorName& b)
  {
    if (a < b)
      return Ordering::less;
    if (b < a)
      return Ordering::greater;
    return Ordering::equal;
  }
}  // namespace xorname
