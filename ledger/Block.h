#pragma once

#include "Transaction.h"

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pwl {

/**
 * Block under construction: chain linkage, version and the transactions to
 * include, keyed by transaction id.
 */
class Block {
public:
  Block() = default;
  Block(const std::string &previousBlockId, const std::string &version);

  const std::string &getPreviousBlockId() const { return previousBlockId_; }
  const std::string &getVersion() const { return version_; }
  const std::map<std::string, Transaction> &getData() const { return data_; }
  bool isGenesis() const { return previousBlockId_.empty(); }

  /**
   * Add a transaction under its id.
   * @return false if a transaction with the same id is already present, or
   *         if the transaction holds a string that is not valid UTF-8
   */
  bool addTransaction(const Transaction &tx);

  const Transaction *findTransaction(const std::string &transactionId) const;

  /**
   * Record that an output of an included transaction was consumed.
   * Spent markers are not part of the payload, so the cache stays valid.
   * @return false if the transaction or output does not exist
   */
  bool markOutputSpent(const std::string &transactionId, uint32_t outputIndex,
                       const std::string &spendingTransactionId);

  /**
   * Canonical mining payload:
   *   previous_block_id + canonical(data) + version
   * Computed on first use and cached until the data changes.
   */
  const std::string &getMiningPayload() const;

private:
  std::string previousBlockId_;
  std::string version_;
  std::map<std::string, Transaction> data_;
  mutable std::optional<std::string> payloadCache_;
};

/**
 * Mined block: the block plus the fields fixed by mining.
 */
struct ChainNode {
  constexpr static int32_t E_INVALID_RECORD = 1;

  Block block;
  std::string blockId;
  std::string timestamp;
  uint64_t miningProof{ 0 };

  nlohmann::ordered_json toJson() const;
  static Roe<ChainNode> fromJson(const nlohmann::json &j);
};

// SHA-256 of payload followed by the decimal nonce
std::string hashWithNonce(const std::string &payload, uint64_t nonce);

/**
 * Proof hashes of one payload for many nonces. The payload is absorbed
 * once; each hash() only feeds the nonce digits.
 */
class ProofHasher {
public:
  explicit ProofHasher(const std::string &payload);

  std::string hash(uint64_t nonce) const;

private:
  utl::Sha256 prefix_;
};

// True when the first `difficulty` hex digits of `hash` are all '0'
bool meetsDifficulty(const std::string &hash, uint32_t difficulty);

constexpr uint32_t MAX_DIFFICULTY = 64;

} // namespace pwl
