#pragma once

#include "util/status.hpp"
#include <boost/asio/spawn.hpp>
#include <expected>
#include <memory>
#include <optional>

namespace net = boost::asio;

namespace collector {

// EventStream: lazy, unbounded, non-restartable sequence of events.
// Next() suspends the calling coroutine until the next event is available and
// returns std::nullopt once the stream has ended; it keeps returning
// std::nullopt after that. Dropping the stream is the only way to cancel it.
template <typename E> class EventStream {
public:
  virtual ~EventStream() = default;
  virtual std::optional<E> Next(net::yield_context yield) = 0;

  // True once Next() has returned std::nullopt.
  virtual bool Done() const = 0;
  // Why the stream ended. Empty while streaming and after a normal close.
  virtual error_code Error() const = 0;
};

template <typename E> using CollectorStream = std::unique_ptr<EventStream<E>>;

// Collector: the capability a host engine needs from an event source.
// The returned stream borrows from the collector and must not outlive it.
template <typename E> class Collector {
public:
  virtual ~Collector() = default;
  virtual std::expected<CollectorStream<E>, error_code>
  GetEventStream(net::yield_context yield) = 0;
};

} // namespace collector
