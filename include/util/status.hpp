#pragma once

#include <boost/system/error_code.hpp>
#include <expected>

using error_code = boost::system::error_code;

// Result of an operation that either succeeds with nothing to return or fails
// with an error_code. Connection and streaming paths report failures this way
// instead of throwing.
using Status = std::expected<void, error_code>;

