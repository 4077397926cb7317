#pragma once

// Header for making log statements such as log::debug(cat, ...) work inside xorname.

#include <oxen/log.hpp>

namespace xorname
{
  namespace log = oxen::log;
}

namespace
{
  static auto codec_cat = xorname::log::Cat("xorname.codec");
}  // namespace
