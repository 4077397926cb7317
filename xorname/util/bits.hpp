#pragma once

#include <cstddef>
#include <limits>
#include <type_traits>

namespace xorname
{
  namespace bits
  {
    /// Number of zero bits above the most significant set bit of `i`; the full bit width of
    /// Int_t when `i` is zero.
    template <typename Int_t>
    constexpr std::size_t
    count_leading_zeros(Int_t i)
    {
      static_assert(std::is_integral<Int_t>::value, "Int_t should be an integer");
      static_assert(std::is_unsigned<Int_t>::value, "Int_t should be unsigned");
      constexpr auto width = std::numeric_limits<Int_t>::digits;

      std::size_t n = 0;
      for (auto mask = static_cast<Int_t>(Int_t{1} << (width - 1)); mask != 0 && (i & mask) == 0;
           mask = static_cast<Int_t>(mask >> 1))
        ++n;
      return n;
    }
  }  // namespace bits
}  // namespace xorname
