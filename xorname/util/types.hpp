#pragma once

#include <cstdint>
#include <string_view>

using byte_t = uint8_t;

namespace xorname
{
  using ustring_view = std::basic_string_view<byte_t>;

  inline ustring_view
  to_usv(std::string_view v)
  {
    return {reinterpret_cast<const byte_t*>(v.data()), v.size()};
  }
}  // namespace xorname
