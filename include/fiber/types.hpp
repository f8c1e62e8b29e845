#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Decoded item shapes delivered by the Fiber network. Decoding from the wire
// happens inside the vendor client; these are plain values.
namespace fiber {

using Bytes = std::vector<std::uint8_t>;
using Hash = std::array<std::uint8_t, 32>;
using Address = std::array<std::uint8_t, 20>;
using Selector = std::array<std::uint8_t, 4>;
// 256-bit unsigned integer, big-endian.
using U256 = std::array<std::uint8_t, 32>;

enum class TxType : std::uint8_t {
  Legacy = 0,
  Eip2930 = 1,
  Eip1559 = 2,
  Eip4844 = 3,
  Eip7702 = 4,
};

struct Transaction {
  TxType type = TxType::Legacy;
  Hash hash{};
  Address from{};
  std::optional<Address> to; // empty for contract creation
  std::uint64_t nonce = 0;
  std::uint64_t gas_limit = 0;
  // Legacy and EIP-2930 only.
  std::optional<U256> gas_price;
  // EIP-1559 and later.
  std::optional<U256> max_fee_per_gas;
  std::optional<U256> max_priority_fee_per_gas;
  U256 value{};
  Bytes input;
  std::optional<std::uint64_t> chain_id;

  // First four bytes of the calldata, if there are that many.
  std::optional<Selector> MethodSelector() const {
    if (input.size() < 4) {
      return std::nullopt;
    }
    Selector s{};
    std::copy_n(input.begin(), 4, s.begin());
    return s;
  }

  bool operator==(const Transaction &) const = default;
};

struct BlockHeader {
  std::uint64_t number = 0;
  Hash hash{};
  Hash parent_hash{};
  Address fee_recipient{};
  std::uint64_t timestamp = 0;
  std::uint64_t gas_limit = 0;
  std::uint64_t gas_used = 0;
  std::optional<U256> base_fee_per_gas;

  bool operator==(const BlockHeader &) const = default;
};

// Execution payload: a header plus its full transactions, in block order.
struct Block {
  BlockHeader header;
  std::vector<Transaction> transactions;

  bool operator==(const Block &) const = default;
};

// Delivery record for a pending transaction as seen by the Fiber network.
class TransactionRecord {
public:
  TransactionRecord() = default;
  TransactionRecord(Transaction tx, std::uint64_t observed_ns,
                    std::string region)
      : tx_(std::move(tx)), observed_ns_(observed_ns),
        region_(std::move(region)) {}

  const Transaction &Inner() const { return tx_; }
  Transaction IntoInner() && { return std::move(tx_); }

  // Time the network first saw the transaction, ns since the epoch.
  std::uint64_t observed_ns() const { return observed_ns_; }
  const std::string &region() const { return region_; }

private:
  Transaction tx_;
  std::uint64_t observed_ns_ = 0;
  std::string region_;
};

// Server-side filter for the transaction subscription. An empty list matches
// anything; a non-empty one requires the field to be in it. All lists must
// match.
struct TxFilter {
  std::vector<Address> from;
  std::vector<Address> to;
  std::vector<Selector> method_ids;

  bool Empty() const { return from.empty() && to.empty() && method_ids.empty(); }

  bool Matches(const Transaction &tx) const {
    if (!from.empty() &&
        std::find(from.begin(), from.end(), tx.from) == from.end()) {
      return false;
    }
    if (!to.empty() &&
        (!tx.to || std::find(to.begin(), to.end(), *tx.to) == to.end())) {
      return false;
    }
    if (!method_ids.empty()) {
      auto sel = tx.MethodSelector();
      if (!sel || std::find(method_ids.begin(), method_ids.end(), *sel) ==
                      method_ids.end()) {
        return false;
      }
    }
    return true;
  }
};

} // namespace fiber
