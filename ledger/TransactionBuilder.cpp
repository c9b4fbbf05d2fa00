#include "TransactionBuilder.h"
#include "Utilities.h"

namespace pwl {

namespace {

// An address is the base64 of a raw 64-byte public point
constexpr size_t ADDRESS_BYTES = 64;

bool isAddress(const std::string &address) {
  auto raw = utl::base64Decode(address);
  return raw && raw.value().size() == ADDRESS_BYTES;
}

} // namespace

TransactionBuilder::TransactionBuilder(LedgerStore &store)
    : Module("builder"), store_(store) {}

TransactionBuilder::Roe<void>
TransactionBuilder::checkMutable(double amount) const {
  if (finalized_) {
    return Error(E_ALREADY_FINALIZED, "Transaction " + finalized_->transactionId +
                                          " is already finalized");
  }
  if (!(amount > 0)) {
    return Error(E_INVALID_AMOUNT, "Amount must be positive");
  }
  return {};
}

TransactionBuilder::Roe<std::vector<Output>>
TransactionBuilder::addOutput(const std::string &senderAddress,
                              const std::string &receiverAddress, double amount) {
  auto check = checkMutable(amount);
  if (!check) {
    return check.error();
  }
  if (issuance_) {
    return Error(E_MIXED, "Cannot spend inputs in an issuance transaction");
  }
  if (!isAddress(receiverAddress)) {
    return Error(E_INVALID_ADDRESS, "Receiver is not a valid address");
  }
  if (!isAddress(senderAddress)) {
    return Error(E_INVALID_ADDRESS, "Sender is not a valid address");
  }

  auto selection = store_.getUnspentCovering(amount);
  if (!selection) {
    if (selection.error().code == LedgerStore::E_INSUFFICIENT_FUNDS) {
      return Error(E_INSUFFICIENT_FUNDS, selection.error().message);
    }
    return Error(E_STORE_UNAVAILABLE, selection.error().message);
  }

  const auto &picked = selection.value();
  inputs_.insert(inputs_.end(), picked.inputs.begin(), picked.inputs.end());

  Output payment;
  payment.receiverAddress = receiverAddress;
  payment.amount = amount;
  outputs_.push_back(payment);

  if (picked.total > amount) {
    Output change;
    change.receiverAddress = senderAddress;
    change.amount = picked.total - amount;
    outputs_.push_back(change);
  }

  log().debug << "Added output of " << amount << " using " << picked.inputs.size()
              << " inputs totalling " << picked.total;
  return outputs_;
}

TransactionBuilder::Roe<std::vector<Output>>
TransactionBuilder::addIssuance(const std::string &receiverAddress, double amount) {
  auto check = checkMutable(amount);
  if (!check) {
    return check.error();
  }
  if (!inputs_.empty()) {
    return Error(E_MIXED, "Cannot issue value in a transaction that spends inputs");
  }
  if (!isAddress(receiverAddress)) {
    return Error(E_INVALID_ADDRESS, "Receiver is not a valid address");
  }

  issuance_ = true;
  Output output;
  output.receiverAddress = receiverAddress;
  output.amount = amount;
  outputs_.push_back(output);
  return outputs_;
}

TransactionBuilder::Roe<Transaction>
TransactionBuilder::finalize(const std::string &privateKey,
                             const std::string &publicKey) {
  if (finalized_) {
    return *finalized_;
  }
  if (outputs_.empty()) {
    return Error(E_EMPTY, "Transaction has no outputs");
  }

  auto rawPrivate = utl::base64Decode(privateKey);
  if (!rawPrivate) {
    return Error(E_CRYPTO, "Private key is not valid base64");
  }
  auto derived = utl::ecdsaDerivePublic(rawPrivate.value());
  if (!derived) {
    return Error(E_CRYPTO, derived.error().message);
  }
  if (utl::base64Encode(derived.value()) != publicKey) {
    return Error(E_CRYPTO, "Public key does not belong to private key");
  }

  Transaction tx;
  tx.inputs = inputs_;
  tx.outputs = outputs_;
  auto id = tx.computeId();
  if (!id) {
    return Error(E_INVALID_ADDRESS, id.error().message);
  }
  tx.transactionId = id.value();

  auto message = tx.getMessage();
  if (!message) {
    return Error(E_INVALID_ADDRESS, message.error().message);
  }
  auto signature = utl::ecdsaSign(rawPrivate.value(), message.value());
  if (!signature) {
    return Error(E_CRYPTO, "Signing failed: " + signature.error().message);
  }
  tx.unlock.senderPublicKey = publicKey;
  tx.unlock.signature = utl::base64Encode(signature.value());

  finalized_ = tx;
  log().info << "Finalized transaction " << tx.transactionId << " ("
             << tx.inputs.size() << " inputs, " << tx.outputs.size() << " outputs)";
  return tx;
}

TransactionBuilder::Roe<void> TransactionBuilder::discard() {
  if (finalized_) {
    return Error(E_ALREADY_FINALIZED, "Finalized transactions keep their inputs");
  }
  auto released = store_.release(inputs_);
  if (!released) {
    return Error(E_STORE_UNAVAILABLE, released.error().message);
  }
  inputs_.clear();
  outputs_.clear();
  issuance_ = false;
  return {};
}

} // namespace pwl
