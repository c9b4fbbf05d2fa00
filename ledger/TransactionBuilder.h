#pragma once

#include "LedgerStore.hpp"
#include "Module.h"
#include "Transaction.h"

#include <optional>
#include <string>
#include <vector>

namespace pwl {

/**
 * Composes a transaction and signs it.
 *
 * The builder is the mutable half of a transaction's life: outputs are added
 * until finalize() fixes the id and signature. After that the builder only
 * hands back the same finalized Transaction.
 *
 * Inputs selected by addOutput() stay reserved in the store until the
 * transaction is accepted in a block or discard() gives them back.
 */
class TransactionBuilder : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_AMOUNT = 1;     // Amount is not positive
  constexpr static int32_t E_INSUFFICIENT_FUNDS = 2; // Unspent outputs cannot cover amount
  constexpr static int32_t E_ALREADY_FINALIZED = 3;  // Builder was finalized
  constexpr static int32_t E_EMPTY = 4;              // Nothing to finalize
  constexpr static int32_t E_MIXED = 5;              // Issuance mixed with spending
  constexpr static int32_t E_CRYPTO = 6;             // Key decoding or signing failed
  constexpr static int32_t E_STORE_UNAVAILABLE = 7;  // Ledger store failed
  constexpr static int32_t E_INVALID_ADDRESS = 8;    // Not base64 of a 64-byte key

  explicit TransactionBuilder(LedgerStore &store);
  ~TransactionBuilder() override = default;

  /**
   * Pay `amount` to `receiverAddress` from the sender's unspent outputs.
   *
   * Selected inputs are appended along with an output to the receiver. When
   * they cover more than `amount`, a change output returns the surplus to
   * `senderAddress`, so outputs always sum to inputs.
   *
   * @return All outputs added so far
   */
  Roe<std::vector<Output>> addOutput(const std::string &senderAddress,
                                     const std::string &receiverAddress,
                                     double amount);

  /**
   * Create new value for `receiverAddress` without inputs.
   * Only valid for the genesis block.
   */
  Roe<std::vector<Output>> addIssuance(const std::string &receiverAddress,
                                       double amount);

  /**
   * Fix the transaction id and sign it with ECDSA P-256 / SHA-256.
   * Repeated calls return the transaction finalized by the first one.
   *
   * @param privateKey base64 of the 32-byte private scalar
   * @param publicKey base64 of the 64-byte public point
   */
  Roe<Transaction> finalize(const std::string &privateKey,
                            const std::string &publicKey);

  /**
   * Give reserved inputs back to the store. Only possible before
   * finalize().
   */
  Roe<void> discard();

  bool isFinalized() const { return finalized_.has_value(); }
  const std::vector<InputRef> &getInputs() const { return inputs_; }
  const std::vector<Output> &getOutputs() const { return outputs_; }

private:
  Roe<void> checkMutable(double amount) const;

  LedgerStore &store_;
  std::vector<InputRef> inputs_;
  std::vector<Output> outputs_;
  bool issuance_{ false };
  std::optional<Transaction> finalized_;
};

} // namespace pwl
