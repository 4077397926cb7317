#include "decode_error.hpp"

#include <fmt/format.h>

namespace xorname
{
  DecodeError::DecodeError(Kind kind, const std::string& msg, char c, std::size_t pos)
      : std::invalid_argument{msg}, _kind{kind}, _character{c}, _position{pos}
  {}

  DecodeError
  DecodeError::invalid_character(char c, std::size_t pos)
  {
    return DecodeError{
        Kind::InvalidCharacter,
        fmt::format("invalid hex character '{}' at position {}", c, pos),
        c,
        pos};
  }

  DecodeError
  DecodeError::invalid_length(const std::string& msg)
  {
    return DecodeError{Kind::InvalidLength, msg};
  }

  DecodeError
  DecodeError::invalid_sequence(const std::string& msg)
  {
    return DecodeError{Kind::InvalidSequence, msg};
  }

  std::string_view
  ToString(DecodeError::Kind kind)
  {
    switch (kind)
    {
      case DecodeError::Kind::InvalidCharacter:
        return "InvalidCharacter";
      case DecodeError::Kind::InvalidLength:
        return "InvalidLength";
      case DecodeError::Kind::InvalidSequence:
        return "InvalidSequence";
    }
    return "Unknown";
  }
}  // namespace xorname
