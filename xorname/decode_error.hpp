#pragma once

#include "util/formattable.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xorname
{
  /// Thrown when hex text or a bt-encoded sequence cannot be turned into a name.  Decoding is
  /// all-or-nothing: no partially filled name is ever returned alongside one of these.
  struct DecodeError : public std::invalid_argument
  {
    enum class Kind
    {
      /// a character that is not a hex digit; see character() and position()
      InvalidCharacter,
      /// wrong number of hex digits, bytes or sequence elements
      InvalidLength,
      /// malformed bt data, or a sequence element that is not a byte value
      InvalidSequence,
    };

    static DecodeError
    invalid_character(char c, std::size_t pos);

    static DecodeError
    invalid_length(const std::string& msg);

    static DecodeError
    invalid_sequence(const std::string& msg);

    Kind
    kind() const
    {
      return _kind;
    }

    char
    character() const
    {
      return _character;
    }

    std::size_t
    position() const
    {
      return _position;
    }

   private:
    DecodeError(Kind kind, const std::string& msg, char c = 0, std::size_t pos = 0);

    Kind _kind;
    char _character;
    std::size_t _position;
  };

  std::string_view
  ToString(DecodeError::Kind kind);

  template <>
  inline constexpr bool IsToStringFormattable<DecodeError::Kind> = true;
}  // namespace xorname
