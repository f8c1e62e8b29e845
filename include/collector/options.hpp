#pragma once

#include "collector/event.hpp"
#include "fiber/types.hpp"
#include "net/endpoint.hpp"
#include <cstdlib>
#include <expected>
#include <optional>
#include <string>

namespace collector {

struct CollectorOptions {
  std::string api_key;
  StreamType stream = StreamType::Transactions;
  std::string endpoint = addr::kDefaultFiberEndpoint;
  // Only used by the transaction stream.
  std::optional<fiber::TxFilter> filter;
};

// Reads -k/--api-key, -s/--stream and -e/--endpoint. Without -k the key comes
// from FIBER_API_KEY.
inline std::expected<CollectorOptions, std::string> ParseOptions(int argc,
                                                                 char **argv) {
  CollectorOptions opt;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    bool known = a == "-k" || a == "--api-key" || a == "-s" ||
                 a == "--stream" || a == "-e" || a == "--endpoint";
    if (!known) {
      return std::unexpected("unknown option: " + a);
    }
    if (i + 1 >= argc) {
      return std::unexpected("missing value for " + a);
    }
    std::string v = argv[++i];
    if (a == "-k" || a == "--api-key") {
      opt.api_key = v;
    } else if (a == "-s" || a == "--stream") {
      auto type = ParseStreamType(v);
      if (!type) {
        return std::unexpected("unknown stream type: " + v);
      }
      opt.stream = *type;
    } else {
      auto ep = addr::ParseEndpoint(v);
      if (!ep) {
        return std::unexpected("invalid endpoint (expected host:port): " + v);
      }
      opt.endpoint = ep->ToString();
    }
  }
  if (opt.api_key.empty()) {
    if (const char *env = std::getenv("FIBER_API_KEY")) {
      opt.api_key = env;
    }
  }
  if (opt.api_key.empty()) {
    return std::unexpected(
        std::string("no API key: pass --api-key or set FIBER_API_KEY"));
  }
  return opt;
}

} // namespace collector
