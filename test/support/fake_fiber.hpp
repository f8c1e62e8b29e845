#pragma once

#include "fiber/client.hpp"
#include "fiber/types.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <deque>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace net = boost::asio;

// In-process stand-in for the Fiber network. Everything runs on one
// io_context; tests push items into feeds and drive it with poll().
namespace fake {

// Items pushed by the test and pulled by one subscription. A pull with
// nothing queued parks on a timer that Push/Close cancel.
template <typename T> class Feed {
public:
  explicit Feed(net::io_context &ioc) : signal_(ioc) {
    signal_.expires_at(net::steady_timer::time_point::max());
  }

  void Push(T item) {
    items_.push_back(std::move(item));
    signal_.cancel();
  }

  void Close(error_code ec = net::error::eof) {
    closed_ = true;
    close_ec_ = ec;
    signal_.cancel();
  }

  std::expected<T, error_code> Pull(net::yield_context yield) {
    ++pulls_;
    for (;;) {
      if (!items_.empty()) {
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
      }
      if (closed_) {
        return std::unexpected(close_ec_);
      }
      error_code ec;
      signal_.async_wait(yield[ec]);
    }
  }

  std::size_t pulls() const { return pulls_; }
  bool closed() const { return closed_; }
  bool released() const { return released_; }
  void MarkReleased() { released_ = true; }

private:
  net::steady_timer signal_;
  std::deque<T> items_;
  bool closed_ = false;
  error_code close_ec_;
  std::size_t pulls_ = 0;
  bool released_ = false;
};

template <typename T> class FakeSubscription : public fiber::Subscription<T> {
public:
  explicit FakeSubscription(std::shared_ptr<Feed<T>> feed)
      : feed_(std::move(feed)) {}
  ~FakeSubscription() override { feed_->MarkReleased(); }

  std::expected<T, error_code> Next(net::yield_context yield) override {
    return feed_->Pull(yield);
  }

private:
  std::shared_ptr<Feed<T>> feed_;
};

struct TxSubscribeCall {
  std::string endpoint;
  std::optional<fiber::TxFilter> filter;
  std::shared_ptr<Feed<fiber::TransactionRecord>> feed;
};

struct PayloadSubscribeCall {
  std::string endpoint;
  std::shared_ptr<Feed<fiber::Block>> feed;
};

class FakeConnector;

class FakeClient : public fiber::Client {
public:
  FakeClient(FakeConnector &connector, std::string endpoint);
  ~FakeClient() override;

  std::expected<std::unique_ptr<fiber::TransactionSubscription>, error_code>
  SubscribeNewTransactions(const std::optional<fiber::TxFilter> &filter,
                           net::yield_context yield) override;

  std::expected<std::unique_ptr<fiber::ExecutionPayloadSubscription>,
                error_code>
  SubscribeNewExecutionPayloads(net::yield_context yield) override;

  const std::string &endpoint() const override { return endpoint_; }

private:
  FakeConnector &connector_;
  std::string endpoint_;
};

class FakeConnector : public fiber::Connector {
public:
  explicit FakeConnector(net::io_context &ioc) : ioc_(ioc), gate_(ioc) {
    gate_.expires_at(net::steady_timer::time_point::max());
  }

  std::expected<std::unique_ptr<fiber::Client>, error_code>
  Connect(const std::string &endpoint, const std::string &api_key,
          net::yield_context yield) override {
    attempts.push_back(endpoint);
    net::post(ioc_, yield);
    if (unreachable.count(endpoint) > 0) {
      return std::unexpected(error_code(net::error::connection_refused));
    }
    if (api_key != accepted_key) {
      return std::unexpected(
          make_error_code(boost::system::errc::permission_denied));
    }
    return std::make_unique<FakeClient>(*this, endpoint);
  }

  // Parks subscribe calls until ReleaseSubscribe().
  void HoldSubscribe() { hold_subscribe_ = true; }
  void ReleaseSubscribe() {
    hold_subscribe_ = false;
    gate_.cancel();
  }

  void WaitAtGate(net::yield_context yield) {
    while (hold_subscribe_) {
      error_code ec;
      gate_.async_wait(yield[ec]);
    }
  }

  // Ends every subscription so parked coroutines can finish.
  void CloseAll() {
    ReleaseSubscribe();
    for (auto &call : tx_calls) {
      call.feed->Close();
    }
    for (auto &call : payload_calls) {
      call.feed->Close();
    }
  }

  net::io_context &ioc() { return ioc_; }

  std::string accepted_key = "test-key";
  std::set<std::string> unreachable;
  std::optional<error_code> subscribe_error;

  std::vector<std::string> attempts;
  std::vector<TxSubscribeCall> tx_calls;
  std::vector<PayloadSubscribeCall> payload_calls;
  int sessions_alive = 0;

private:
  net::io_context &ioc_;
  net::steady_timer gate_;
  bool hold_subscribe_ = false;
};

inline FakeClient::FakeClient(FakeConnector &connector, std::string endpoint)
    : connector_(connector), endpoint_(std::move(endpoint)) {
  ++connector_.sessions_alive;
}

inline FakeClient::~FakeClient() { --connector_.sessions_alive; }

inline std::expected<std::unique_ptr<fiber::TransactionSubscription>,
                     error_code>
FakeClient::SubscribeNewTransactions(const std::optional<fiber::TxFilter> &filter,
                                     net::yield_context yield) {
  connector_.WaitAtGate(yield);
  if (connector_.subscribe_error) {
    return std::unexpected(*connector_.subscribe_error);
  }
  auto feed =
      std::make_shared<Feed<fiber::TransactionRecord>>(connector_.ioc());
  connector_.tx_calls.push_back({endpoint_, filter, feed});
  return std::make_unique<FakeSubscription<fiber::TransactionRecord>>(feed);
}

inline std::expected<std::unique_ptr<fiber::ExecutionPayloadSubscription>,
                     error_code>
FakeClient::SubscribeNewExecutionPayloads(net::yield_context yield) {
  connector_.WaitAtGate(yield);
  if (connector_.subscribe_error) {
    return std::unexpected(*connector_.subscribe_error);
  }
  auto feed = std::make_shared<Feed<fiber::Block>>(connector_.ioc());
  connector_.payload_calls.push_back({endpoint_, feed});
  return std::make_unique<FakeSubscription<fiber::Block>>(feed);
}

// Distinct transactions keyed by `tag`.
inline fiber::Transaction MakeTx(std::uint8_t tag) {
  fiber::Transaction tx;
  tx.type = fiber::TxType::Eip1559;
  tx.hash[0] = tag;
  tx.from[19] = tag;
  tx.to = fiber::Address{};
  (*tx.to)[0] = 0xaa;
  tx.nonce = tag;
  tx.gas_limit = 21000;
  tx.max_fee_per_gas = fiber::U256{};
  (*tx.max_fee_per_gas)[31] = 30;
  tx.value[31] = tag;
  tx.input = {0xa9, 0x05, 0x9c, 0xbb, tag};
  tx.chain_id = 1;
  return tx;
}

inline fiber::TransactionRecord MakeRecord(std::uint8_t tag) {
  return fiber::TransactionRecord(MakeTx(tag), 1'700'000'000'000'000'000ull + tag,
                                  "us-east");
}

inline fiber::Block MakeBlock(std::uint64_t number, std::uint8_t tx_count) {
  fiber::Block block;
  block.header.number = number;
  block.header.hash[0] = static_cast<std::uint8_t>(number);
  block.header.parent_hash[0] = static_cast<std::uint8_t>(number - 1);
  block.header.timestamp = 1'700'000'000 + number * 12;
  block.header.gas_limit = 30'000'000;
  block.header.gas_used = 21000ull * tx_count;
  block.header.base_fee_per_gas = fiber::U256{};
  for (std::uint8_t i = 0; i < tx_count; ++i) {
    block.transactions.push_back(MakeTx(i));
  }
  return block;
}

} // namespace fake
