#pragma once

#include "fiber/types.hpp"
#include "util/status.hpp"
#include <boost/asio/spawn.hpp>
#include <expected>
#include <memory>
#include <optional>
#include <string>

namespace net = boost::asio;

// Vendor collaborator. The Fiber transport lives behind these interfaces; the
// collector only depends on connecting, the two subscription calls, and
// pulling items from a subscription.
//
// All calls suspend the calling coroutine (net::yield_context) and must be
// made from the io_context the client was connected on.
namespace fiber {

// One open vendor subscription. Items come out in delivery order.
template <typename T> class Subscription {
public:
  virtual ~Subscription() = default;

  // Suspends until the next item arrives. Any error ends the subscription;
  // net::error::eof means the vendor closed it normally.
  virtual std::expected<T, error_code> Next(net::yield_context yield) = 0;
};

using TransactionSubscription = Subscription<TransactionRecord>;
using ExecutionPayloadSubscription = Subscription<Block>;

// An authenticated session with one Fiber endpoint.
class Client {
public:
  virtual ~Client() = default;

  virtual std::expected<std::unique_ptr<TransactionSubscription>, error_code>
  SubscribeNewTransactions(const std::optional<TxFilter> &filter,
                           net::yield_context yield) = 0;

  virtual std::expected<std::unique_ptr<ExecutionPayloadSubscription>,
                        error_code>
  SubscribeNewExecutionPayloads(net::yield_context yield) = 0;

  // "host:port" this session is connected to.
  virtual const std::string &endpoint() const = 0;
};

// Opens sessions. Fails if the endpoint is unreachable or the key rejected.
class Connector {
public:
  virtual ~Connector() = default;

  virtual std::expected<std::unique_ptr<Client>, error_code>
  Connect(const std::string &endpoint, const std::string &api_key,
          net::yield_context yield) = 0;
};

} // namespace fiber
