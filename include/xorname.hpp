#pragma once

// Public header for consumers of the xorname library (routing tables, message formats).

#include <xorname/decode_error.hpp>
#include <xorname/xor_metric.hpp>
#include <xorname/xor_name.hpp>
