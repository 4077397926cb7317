#pragma once

#include "xor_name.hpp"

namespace xorname
{
  /// Orders names closest-first by XOR distance from `us`; a strict weak ordering usable with
  /// std::sort, std::set and std::map.
  struct XorMetric
  {
    const XorName us;

    XorMetric(const XorName& ourKey) : us(ourKey)
    {}

    bool
    operator()(const XorName& left, const XorName& right) const
    {
      return is_closer(left, right, us);
    }
  };
}  // namespace xorname
