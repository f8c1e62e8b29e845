#pragma once

#include "collector/collector.hpp"
#include "collector/error.hpp"
#include "fiber/client.hpp"
#include "util/branch.hpp"
#include <boost/asio/error.hpp>
#include <iostream>
#include <memory>
#include <optional>
#include <utility>

namespace collector {

// MappedStream
// Wraps one vendor subscription and turns each delivered item into an event
// with `map`. One pull from the vendor per Next(), nothing is buffered,
// filtered or reordered here.
// Keeps the session that opened the subscription alive until the stream ends
// or is dropped, even if the collector has since been re-pointed.
template <typename E, typename Item, typename Map>
class MappedStream : public EventStream<E> {
public:
  MappedStream(std::shared_ptr<fiber::Client> session,
               std::unique_ptr<fiber::Subscription<Item>> source, Map map)
      : session_(std::move(session)), source_(std::move(source)),
        map_(std::move(map)) {}

  std::optional<E> Next(net::yield_context yield) override {
    if (FIBER_UNLIKELY(done_)) {
      return std::nullopt;
    }
    auto item = source_->Next(yield);
    if (FIBER_UNLIKELY(!item)) {
      Finish(item.error());
      return std::nullopt;
    }
    return map_(std::move(*item));
  }

  bool Done() const override { return done_; }
  error_code Error() const override { return error_; }

private:
  void Finish(const error_code &ec) {
    done_ = true;
    source_.reset();
    session_.reset();
    if (ec == net::error::eof || ec == errc::stream_closed) {
      return;
    }
    error_ = ec;
    std::cerr << "[fiber_collector] stream error: " << ec.message() << "\n";
  }

  // Declared first so the subscription is destroyed before its session.
  std::shared_ptr<fiber::Client> session_;
  std::unique_ptr<fiber::Subscription<Item>> source_;
  Map map_;
  bool done_ = false;
  error_code error_;
};

template <typename E, typename Item, typename Map>
CollectorStream<E>
MakeMappedStream(std::shared_ptr<fiber::Client> session,
                 std::unique_ptr<fiber::Subscription<Item>> source, Map map) {
  return std::make_unique<MappedStream<E, Item, Map>>(
      std::move(session), std::move(source), std::move(map));
}

} // namespace collector
