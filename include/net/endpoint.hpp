#pragma once

#include <boost/algorithm/string/predicate.hpp>
#include <charconv>
#include <optional>
#include <string>

namespace addr {

// Endpoint used when no override is configured.
inline constexpr const char *kDefaultFiberEndpoint = "beta.fiberapi.io:8080";

struct Endpoint {
  std::string host;
  std::string port;

  std::string ToString() const { return host + ":" + port; }
};

// Parses "host:port". An http:// or https:// prefix and a trailing '/' are
// accepted and dropped; the port is required and must be in 1..65535.
inline std::optional<Endpoint> ParseEndpoint(const std::string &text) {
  std::string rest = text;
  if (boost::algorithm::istarts_with(rest, "https://")) {
    rest = rest.substr(8);
  } else if (boost::algorithm::istarts_with(rest, "http://")) {
    rest = rest.substr(7);
  }
  if (!rest.empty() && rest.back() == '/') {
    rest.pop_back();
  }
  auto colon = rest.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == rest.size()) {
    return std::nullopt;
  }
  std::string host = rest.substr(0, colon);
  std::string port = rest.substr(colon + 1);
  if (host.find_first_of("/: ") != std::string::npos) {
    return std::nullopt;
  }
  unsigned int value = 0;
  auto [end, ec] =
      std::from_chars(port.data(), port.data() + port.size(), value);
  if (ec != std::errc{} || end != port.data() + port.size() || value == 0 ||
      value > 65535) {
    return std::nullopt;
  }
  return Endpoint{.host = host, .port = port};
}

} // namespace addr
