#pragma once

#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

namespace collector {

enum class errc {
  missing_api_key = 1,
  invalid_endpoint,
  // Session replacement requested while a stream holds the session, or a
  // subscription requested while the session is being replaced.
  session_busy,
  // Vendor ended a subscription normally.
  stream_closed,
};

class ErrorCategory : public boost::system::error_category {
public:
  const char *name() const noexcept override { return "fiber_collector"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::missing_api_key:
      return "missing Fiber API key";
    case errc::invalid_endpoint:
      return "invalid Fiber endpoint (expected host:port)";
    case errc::session_busy:
      return "session is in use by an open stream or repoint";
    case errc::stream_closed:
      return "stream closed by the vendor";
    }
    return "unknown fiber_collector error";
  }
};

inline const boost::system::error_category &Category() {
  static const ErrorCategory category;
  return category;
}

inline boost::system::error_code make_error_code(errc e) {
  return {static_cast<int>(e), Category()};
}

} // namespace collector

namespace boost::system {
template <> struct is_error_code_enum<collector::errc> : std::true_type {};
} // namespace boost::system
