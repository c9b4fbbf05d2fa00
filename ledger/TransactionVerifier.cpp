#include "TransactionVerifier.h"
#include "Utilities.h"

#include <algorithm>
#include <cmath>

namespace pwl {

namespace {

// Tolerance for comparing sums of decimal amounts
bool sameTotal(double a, double b) {
  return std::fabs(a - b) <= 1e-9 * std::max({ 1.0, std::fabs(a), std::fabs(b) });
}

} // namespace

TransactionVerifier::TransactionVerifier(const LedgerStore &store)
    : Module("verifier"), store_(store) {}

bool TransactionVerifier::checkSignature(const Transaction &tx) const {
  auto publicKey = utl::base64Decode(tx.unlock.senderPublicKey);
  auto signature = utl::base64Decode(tx.unlock.signature);
  if (!publicKey || !signature) {
    log().warning << "Transaction " << tx.transactionId
                  << ": unlock is not valid base64";
    return false;
  }
  auto id = tx.computeId();
  auto message = tx.getMessage();
  if (!id || !message) {
    log().warning << "Transaction " << tx.transactionId << ": cannot be encoded";
    return false;
  }
  if (tx.transactionId != id.value()) {
    log().warning << "Transaction " << tx.transactionId
                  << ": id does not match content";
    return false;
  }
  if (!utl::ecdsaVerify(publicKey.value(), message.value(), signature.value())) {
    log().warning << "Transaction " << tx.transactionId << ": invalid signature";
    return false;
  }
  return true;
}

TransactionVerifier::Roe<TransactionVerifier::Result>
TransactionVerifier::verify(const Transaction &tx) const {
  Result result;
  if (!checkSignature(tx)) {
    return result;
  }

  for (const auto &output : tx.outputs) {
    if (!(output.amount > 0)) {
      log().warning << "Transaction " << tx.transactionId
                    << ": output amount must be positive";
      return result;
    }
  }
  if (tx.outputs.empty() ||
      (!tx.isIssuance() && !sameTotal(tx.inputTotal(), tx.outputTotal()))) {
    log().warning << "Transaction " << tx.transactionId << ": inputs "
                  << tx.inputTotal() << " do not balance outputs " << tx.outputTotal();
    return result;
  }

  const std::string &signer = tx.unlock.senderPublicKey;
  for (const auto &input : tx.inputs) {
    auto output = store_.findOutput(input.transactionId, input.blockId,
                                    input.outputIndex);
    std::string problem;
    if (!output) {
      if (output.error().code != LedgerStore::E_NOT_FOUND) {
        return Error(E_STORE_UNAVAILABLE, output.error().message);
      }
      problem = "does not exist";
    } else if (output.value().receiverAddress != signer) {
      problem = "is not owned by the signer";
    } else if (output.value().isSpent()) {
      problem = "was already spent by " + output.value().spentTransactionId;
    } else if (output.value().amount != input.amount) {
      problem = "has a different amount";
    }

    if (!problem.empty()) {
      log().warning << "Transaction " << tx.transactionId << ": input "
                    << input.key() << " " << problem;
      result.offender = input;
      return result;
    }
  }

  result.authentic = true;
  return result;
}

} // namespace pwl
