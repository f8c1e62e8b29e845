#pragma once

#include "fiber/types.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace collector {

// Which Fiber subscription a collector opens. Fixed at construction.
enum class StreamType {
  // New pending transactions as seen by the Fiber network.
  Transactions,
  // New execution payloads (blocks with full transaction data).
  ExecutionPayloads,
};

// Events emitted by the Fiber collector. Alternative 0 is the Transaction
// variant, alternative 1 the ExecutionPayload variant.
using Event = std::variant<fiber::Transaction, fiber::Block>;

inline StreamType KindOf(const Event &event) {
  return std::holds_alternative<fiber::Transaction>(event)
             ? StreamType::Transactions
             : StreamType::ExecutionPayloads;
}

inline const char *ToString(StreamType type) {
  switch (type) {
  case StreamType::Transactions:
    return "transactions";
  case StreamType::ExecutionPayloads:
    return "execution_payloads";
  }
  return "unknown";
}

inline std::optional<StreamType> ParseStreamType(std::string_view text) {
  std::string s(text);
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (s == "transactions" || s == "txs") {
    return StreamType::Transactions;
  }
  if (s == "execution_payloads" || s == "payloads" || s == "blocks") {
    return StreamType::ExecutionPayloads;
  }
  return std::nullopt;
}

} // namespace collector
