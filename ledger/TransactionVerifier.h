#pragma once

#include "LedgerStore.hpp"
#include "Module.h"
#include "Transaction.h"

#include <optional>

namespace pwl {

/**
 * Checks that a transaction is signed by its sender and that every input
 * it consumes is an existing, unspent output owned by that sender.
 */
class TransactionVerifier : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_STORE_UNAVAILABLE = 1;

  struct Result {
    bool authentic{ false };
    // First input that failed; never set for signature failures
    std::optional<InputRef> offender;
  };

  explicit TransactionVerifier(const LedgerStore &store);
  ~TransactionVerifier() override = default;

  /**
   * Verify the signature, then each input in order, stopping at the first
   * one that is missing, owned by someone else or already spent.
   *
   * Also rejects (without an offender) a transaction whose id is not the
   * hash of its content, or whose inputs do not cover its outputs.
   *
   * @return Error only when the store itself fails
   */
  Roe<Result> verify(const Transaction &tx) const;

private:
  bool checkSignature(const Transaction &tx) const;

  const LedgerStore &store_;
};

} // namespace pwl
