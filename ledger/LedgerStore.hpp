#ifndef POWLEDGER_LEDGER_STORE_HPP
#define POWLEDGER_LEDGER_STORE_HPP

#include "Block.h"
#include "Module.h"
#include "ResultOrError.hpp"
#include "Transaction.h"

#include <cstdint>
#include <string>
#include <vector>

namespace pwl {

/**
 * Durable state consumed by the builder, verifiers and miner: the archived
 * chain, the chain tip, the difficulty table and this wallet's registry of
 * unspent outputs.
 *
 * Implementations must make selection, release and block commit atomic with
 * respect to each other, so an unspent output is handed to at most one
 * consumer.
 */
class LedgerStore : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INSUFFICIENT_FUNDS = 1; // Selection cannot cover amount
  constexpr static int32_t E_INVALID_AMOUNT = 2;     // Amount is not positive
  constexpr static int32_t E_NOT_FOUND = 3;          // Block or output missing
  constexpr static int32_t E_STORE_UNAVAILABLE = 4;  // I/O failure or corrupt record
  constexpr static int32_t E_UNKNOWN_VERSION = 5;    // No difficulty for version
  constexpr static int32_t E_ALREADY_SPENT = 6;      // Output consumed before
  constexpr static int32_t E_BLOCK_EXISTS = 7;       // Block id already archived
  constexpr static int32_t E_INVALID_BLOCK = 8;      // Block breaks chain rules
  constexpr static int32_t E_INVALID_DIFFICULTY = 9; // Above MAX_DIFFICULTY

  /** Outputs picked to cover an amount; total may exceed the amount */
  struct Selection {
    double total{ 0 };
    std::vector<InputRef> inputs;
  };

  /** Outputs added to the registry by registerOwnedOutputs() */
  struct Registered {
    size_t count{ 0 };
    double total{ 0 };
  };

  explicit LedgerStore(const std::string &name) : Module(name) {}
  ~LedgerStore() override = default;

  /**
   * Select unspent outputs, in registry order, until their sum covers
   * `amount`, and reserve them so no other caller can select them.
   * Nothing is reserved when the available total is too small.
   * @return E_INVALID_AMOUNT, E_INSUFFICIENT_FUNDS on failure
   */
  virtual Roe<Selection> getUnspentCovering(double amount) = 0;

  /** Return reserved outputs that will not be spent after all */
  virtual Roe<void> release(const std::vector<InputRef> &inputs) = 0;

  /** Outputs currently held by getUnspentCovering() and not yet released */
  virtual Roe<std::vector<InputRef>> getReserved() const = 0;

  virtual Roe<Output> findOutput(const std::string &transactionId,
                                 const std::string &blockId,
                                 uint32_t outputIndex) const = 0;

  /**
   * Mark an archived output as consumed by `spendingTransactionId` and drop
   * it from the unspent registry.
   * @return E_NOT_FOUND, E_ALREADY_SPENT on failure
   */
  virtual Roe<void> markSpent(const std::string &transactionId,
                              const std::string &blockId, uint32_t outputIndex,
                              const std::string &spendingTransactionId) = 0;

  /** Archive a mined block without touching the tip */
  virtual Roe<std::string> appendBlock(const ChainNode &node) = 0;
  virtual Roe<ChainNode> getBlock(const std::string &blockId) const = 0;

  /** Chain tip; empty before the genesis block is accepted */
  virtual Roe<std::string> getTip() const = 0;
  virtual Roe<void> setTip(const std::string &blockId) = 0;

  virtual Roe<uint32_t> getDifficulty(const std::string &version) const = 0;
  virtual Roe<void> setDifficulty(const std::string &version, uint32_t difficulty) = 0;

  /**
   * Accept a mined block as the new tip, all or nothing.
   *
   * The block must extend the current tip, every input must reference an
   * existing unspent output exactly once, and issuance transactions are
   * only allowed in the genesis block. On success the block is archived,
   * consumed outputs are marked spent and the tip advances. Committing the
   * current tip again is a no-op.
   *
   * @return E_BLOCK_EXISTS, E_INVALID_BLOCK, E_NOT_FOUND, E_ALREADY_SPENT
   *         when the block is rejected, E_STORE_UNAVAILABLE on I/O failure
   */
  virtual Roe<void> commitBlock(const ChainNode &node) = 0;

  /**
   * Register every unspent output of an accepted block that is addressed to
   * `address`. Outputs already registered are skipped.
   */
  virtual Roe<Registered> registerOwnedOutputs(const ChainNode &node,
                                               const std::string &address) = 0;

  /** Sum of registered outputs that are neither reserved nor spent */
  virtual Roe<double> getBalance() const = 0;
};

} // namespace pwl

#endif // POWLEDGER_LEDGER_STORE_HPP
