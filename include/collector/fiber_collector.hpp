#pragma once

#include "collector/collector.hpp"
#include "collector/error.hpp"
#include "collector/event.hpp"
#include "collector/mapped_stream.hpp"
#include "collector/options.hpp"
#include "fiber/client.hpp"
#include "net/endpoint.hpp"
#include "util/status.hpp"
#include <boost/asio/spawn.hpp>
#include <expected>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace net = boost::asio;

namespace collector {

// FiberCollector
// Turns one Fiber subscription into a stream of collector::Event.
// Threading model:
// - Runs as Boost.Asio coroutines (spawn) on the io_context the connector
//   uses; no threads of its own.
// - Suspends while connecting, while opening a subscription and on every
//   Next() of a stream it handed out. Mapping items is synchronous.
// - Exactly one session is alive at a time. SetFiberEndpoint() is refused
//   while any stream handed out is still open or being opened, and
//   OpenEventStream() is refused while a repoint is in flight.
// - The collector must outlive any in-flight Connect(), SetFiberEndpoint()
//   or OpenEventStream() call.
// Failures are returned as error_code through std::expected; a failed
// Connect() yields no collector at all.
class FiberCollector : public Collector<Event> {
public:
  using Ptr = std::unique_ptr<FiberCollector>;

  // Connects to the default endpoint.
  static std::expected<Ptr, error_code> Connect(fiber::Connector &connector,
                                                std::string api_key,
                                                StreamType type,
                                                net::yield_context yield) {
    CollectorOptions opt;
    opt.api_key = std::move(api_key);
    opt.stream = type;
    return Connect(connector, opt, yield);
  }

  static std::expected<Ptr, error_code>
  Connect(fiber::Connector &connector, const CollectorOptions &opt,
          net::yield_context yield) {
    if (opt.api_key.empty()) {
      return Fail("connect", errc::missing_api_key);
    }
    auto ep = addr::ParseEndpoint(opt.endpoint);
    if (!ep) {
      return Fail("connect", errc::invalid_endpoint);
    }
    auto client = connector.Connect(ep->ToString(), opt.api_key, yield);
    if (!client) {
      return Fail("connect", client.error());
    }
    return std::make_unique<FiberCollector>(Token{}, connector,
                                            std::move(*client), opt);
  }

private:
  struct Token {
    explicit Token() = default;
  };

public:
  FiberCollector(Token, fiber::Connector &connector,
                 std::unique_ptr<fiber::Client> client,
                 const CollectorOptions &opt)
      : connector_(connector), client_(std::move(client)),
        api_key_(opt.api_key), type_(opt.stream), filter_(opt.filter) {}

  FiberCollector(const FiberCollector &) = delete;
  FiberCollector &operator=(const FiberCollector &) = delete;

  // Replaces the session with one connected to `endpoint`, reusing the API
  // key. On failure the current session is kept and stays usable. Streams
  // still open on the current session must be dropped or ended first.
  Status SetFiberEndpoint(const std::string &endpoint,
                          net::yield_context yield) {
    auto ep = addr::ParseEndpoint(endpoint);
    if (!ep) {
      return Fail("set endpoint", errc::invalid_endpoint);
    }
    // Open streams and in-flight opens each hold a reference to client_.
    if (client_.use_count() > 1 || repointing_) {
      return Fail("set endpoint", errc::session_busy);
    }
    repointing_ = true;
    auto client = connector_.Connect(ep->ToString(), api_key_, yield);
    repointing_ = false;
    if (!client) {
      return Fail("set endpoint", client.error());
    }
    client_ = std::move(*client);
    return {};
  }

  // Opens a new vendor subscription and wraps it. Each call starts a fresh
  // stream; a finished stream cannot be resumed.
  std::expected<CollectorStream<Event>, error_code>
  OpenEventStream(net::yield_context yield) {
    if (repointing_) {
      return Fail("subscribe", errc::session_busy);
    }
    std::shared_ptr<fiber::Client> session = client_;
    if (type_ == StreamType::Transactions) {
      auto sub = session->SubscribeNewTransactions(filter_, yield);
      if (!sub) {
        return Fail("subscribe", sub.error());
      }
      return MakeMappedStream<Event>(
          std::move(session), std::move(*sub),
          [](fiber::TransactionRecord &&record) {
            return Event{std::in_place_type<fiber::Transaction>,
                         std::move(record).IntoInner()};
          });
    }
    auto sub = session->SubscribeNewExecutionPayloads(yield);
    if (!sub) {
      return Fail("subscribe", sub.error());
    }
    return MakeMappedStream<Event>(
        std::move(session), std::move(*sub), [](fiber::Block &&block) {
          return Event{std::in_place_type<fiber::Block>, std::move(block)};
        });
  }

  std::expected<CollectorStream<Event>, error_code>
  GetEventStream(net::yield_context yield) override {
    return OpenEventStream(yield);
  }

  const std::string &endpoint() const { return client_->endpoint(); }
  StreamType stream_type() const { return type_; }

private:
  static std::unexpected<error_code> Fail(const char *stage,
                                          const error_code &ec) {
    std::cerr << "[fiber_collector] " << stage << " error: " << ec.message()
              << "\n";
    return std::unexpected(ec);
  }

  fiber::Connector &connector_;
  std::shared_ptr<fiber::Client> client_;
  std::string api_key_;
  StreamType type_;
  std::optional<fiber::TxFilter> filter_;
  bool repointing_ = false;
};

} // namespace collector
