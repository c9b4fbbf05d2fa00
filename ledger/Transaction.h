#pragma once

#include "ResultOrError.hpp"
#include "Utilities.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace pwl {

/**
 * Reference to an earlier transaction output, consumed as an input.
 * Also the shape of an unspent output record in the ledger store.
 */
struct InputRef {
  std::string transactionId;
  std::string blockId;
  uint32_t outputIndex{ 0 };
  double amount{ 0 };

  // Identity of the referenced output; amount is not part of it
  std::string key() const;
  bool sameOutput(const InputRef &other) const { return key() == other.key(); }

  nlohmann::ordered_json toJson() const;
  static Roe<InputRef> fromJson(const nlohmann::json &j);
};

struct Output {
  std::string receiverAddress;
  double amount{ 0 };
  std::string spentTransactionId; // empty while unspent

  bool isSpent() const { return !spentTransactionId.empty(); }

  nlohmann::ordered_json toJson() const;
  // Fields covered by hashes and signatures
  nlohmann::ordered_json toHashJson() const;
  static Roe<Output> fromJson(const nlohmann::json &j);
};

struct Unlock {
  std::string senderPublicKey; // base64 raw X||Y, doubles as the address
  std::string signature;       // base64 raw r||s

  bool empty() const { return senderPublicKey.empty() && signature.empty(); }
  nlohmann::ordered_json toJson() const;
};

/**
 * A finalized transaction.
 *
 * Values of this type are either decoded from a record received from
 * elsewhere or produced by TransactionBuilder::finalize(); in both cases the
 * id and unlock are already fixed and nothing here re-signs them.
 *
 * A transaction without inputs is an issuance and is only valid inside a
 * genesis block.
 */
struct Transaction {
  constexpr static int32_t E_INVALID_RECORD = 1; // Malformed JSON record

  std::string transactionId;
  Unlock unlock;
  std::vector<InputRef> inputs;
  std::vector<Output> outputs;

  bool isIssuance() const { return inputs.empty(); }
  double inputTotal() const;
  double outputTotal() const;

  /**
   * Identity hash: SHA-256 over the canonical hashing form with the id
   * unset and unlock empty.
   * Fails only when a field holds a string that is not valid UTF-8.
   */
  Roe<std::string> computeId() const;

  /**
   * Bytes covered by the signature: the canonical hashing form with the id
   * fixed and unlock empty.
   */
  Roe<std::string> getMessage() const;

  /**
   * Hashing form: the full record minus spent bookkeeping on outputs.
   * This is what a block's mining payload embeds.
   */
  nlohmann::ordered_json toHashJson() const;

  nlohmann::ordered_json toJson() const;
  static Roe<Transaction> fromJson(const nlohmann::json &j);

private:
  nlohmann::ordered_json signingForm(const nlohmann::ordered_json &id) const;
};

} // namespace pwl
