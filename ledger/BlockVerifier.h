#pragma once

#include "Block.h"
#include "LedgerStore.hpp"
#include "Module.h"
#include "TransactionVerifier.h"

#include <string>

namespace pwl {

/**
 * Checks a mined block received from elsewhere and, when it holds up,
 * accepts it as the new chain tip.
 */
class BlockVerifier : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_STORE_UNAVAILABLE = 1;

  struct Result {
    bool valid{ false };
    std::string reason; // why the block was rejected
  };

  explicit BlockVerifier(LedgerStore &store);
  ~BlockVerifier() override = default;

  /**
   * Verify and accept a block.
   *
   * The proof hash SHA-256(payload + proof) must meet the difficulty of the
   * block's version and the block id must be SHA-256(payload). Unless the
   * block is already the tip, each transaction must verify and the store
   * must accept the block. A rejected block leaves the store unchanged.
   *
   * @return Error only when the store itself fails
   */
  Roe<Result> verify(const ChainNode &node);

  /**
   * Proof-of-work part of verify(), without touching the store.
   */
  static Result checkProof(const ChainNode &node, uint32_t difficulty);

  void setVerifyTransactions(bool value) { verifyTransactions_ = value; }

private:
  Result reject(const ChainNode &node, const std::string &reason) const;

  LedgerStore &store_;
  TransactionVerifier txVerifier_;
  bool verifyTransactions_{ true };
};

} // namespace pwl
