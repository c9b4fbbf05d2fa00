#include "Transaction.h"
#include "Canonical.h"

namespace pwl {

namespace {

Error invalidRecord(const std::string &what) {
  return Error(Transaction::E_INVALID_RECORD, "Invalid transaction record: " + what);
}

Roe<std::string> getString(const nlohmann::json &j, const char *field) {
  if (!j.contains(field) || !j[field].is_string()) {
    return invalidRecord(std::string("'") + field + "' must be a string");
  }
  return j[field].get<std::string>();
}

Roe<double> getAmount(const nlohmann::json &j) {
  if (!j.contains("amount") || !j["amount"].is_number()) {
    return invalidRecord("'amount' must be a number");
  }
  return j["amount"].get<double>();
}

} // namespace

// ----------------------------------------------------------------------------
// InputRef

std::string InputRef::key() const {
  return blockId + "/" + transactionId + "/" + std::to_string(outputIndex);
}

nlohmann::ordered_json InputRef::toJson() const {
  nlohmann::ordered_json j;
  j["transaction_id"] = transactionId;
  j["block_id"] = blockId;
  j["output_index"] = outputIndex;
  j["amount"] = amount;
  return j;
}

Roe<InputRef> InputRef::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return invalidRecord("input must be an object");
  }
  InputRef ref;
  auto txId = getString(j, "transaction_id");
  if (!txId) {
    return txId.error();
  }
  auto blockId = getString(j, "block_id");
  if (!blockId) {
    return blockId.error();
  }
  if (!j.contains("output_index") || !j["output_index"].is_number_integer() ||
      j["output_index"].get<int64_t>() < 0 ||
      j["output_index"].get<int64_t>() > UINT32_MAX) {
    return invalidRecord("'output_index' must be a non-negative integer");
  }
  auto amount = getAmount(j);
  if (!amount) {
    return amount.error();
  }
  ref.transactionId = txId.value();
  ref.blockId = blockId.value();
  ref.outputIndex = j["output_index"].get<uint32_t>();
  ref.amount = amount.value();
  return ref;
}

// ----------------------------------------------------------------------------
// Output

nlohmann::ordered_json Output::toJson() const {
  nlohmann::ordered_json j = toHashJson();
  j["spent_transaction_id"] = spentTransactionId;
  return j;
}

nlohmann::ordered_json Output::toHashJson() const {
  nlohmann::ordered_json j;
  j["receiver_address"] = receiverAddress;
  j["amount"] = amount;
  return j;
}

Roe<Output> Output::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return invalidRecord("output must be an object");
  }
  auto receiver = getString(j, "receiver_address");
  if (!receiver) {
    return receiver.error();
  }
  auto amount = getAmount(j);
  if (!amount) {
    return amount.error();
  }

  Output out;
  out.receiverAddress = receiver.value();
  out.amount = amount.value();
  // Absent or null both mean unspent
  if (j.contains("spent_transaction_id") && !j["spent_transaction_id"].is_null()) {
    if (!j["spent_transaction_id"].is_string()) {
      return invalidRecord("'spent_transaction_id' must be a string");
    }
    out.spentTransactionId = j["spent_transaction_id"].get<std::string>();
  }
  return out;
}

// ----------------------------------------------------------------------------
// Unlock

nlohmann::ordered_json Unlock::toJson() const {
  nlohmann::ordered_json j = nlohmann::ordered_json::object();
  if (!empty()) {
    j["sender_public_key"] = senderPublicKey;
    j["signature"] = signature;
  }
  return j;
}

// ----------------------------------------------------------------------------
// Transaction

double Transaction::inputTotal() const {
  double total = 0;
  for (const auto &input : inputs) {
    total += input.amount;
  }
  return total;
}

double Transaction::outputTotal() const {
  double total = 0;
  for (const auto &output : outputs) {
    total += output.amount;
  }
  return total;
}

nlohmann::ordered_json
Transaction::signingForm(const nlohmann::ordered_json &id) const {
  nlohmann::ordered_json j = toHashJson();
  j["transaction_id"] = id;
  j["unlock"] = nlohmann::ordered_json::object();
  return j;
}

Roe<std::string> Transaction::computeId() const {
  auto encoded = canonical::encode(signingForm(nullptr));
  if (!encoded) {
    return encoded.error();
  }
  return utl::sha256(encoded.value());
}

Roe<std::string> Transaction::getMessage() const {
  return canonical::encode(signingForm(transactionId));
}

nlohmann::ordered_json Transaction::toHashJson() const {
  nlohmann::ordered_json j;
  j["transaction_id"] = transactionId;
  j["unlock"] = unlock.toJson();
  j["input_count"] = inputs.size();
  nlohmann::ordered_json jInputs = nlohmann::ordered_json::array();
  for (const auto &input : inputs) {
    jInputs.push_back(input.toJson());
  }
  j["inputs"] = jInputs;
  j["output_count"] = outputs.size();
  nlohmann::ordered_json jOutputs = nlohmann::ordered_json::array();
  for (const auto &output : outputs) {
    jOutputs.push_back(output.toHashJson());
  }
  j["outputs"] = jOutputs;
  return j;
}

nlohmann::ordered_json Transaction::toJson() const {
  nlohmann::ordered_json j = toHashJson();
  nlohmann::ordered_json jOutputs = nlohmann::ordered_json::array();
  for (const auto &output : outputs) {
    jOutputs.push_back(output.toJson());
  }
  j["outputs"] = jOutputs;
  return j;
}

Roe<Transaction> Transaction::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return invalidRecord("transaction must be an object");
  }

  Transaction tx;
  auto txId = getString(j, "transaction_id");
  if (!txId || txId.value().empty()) {
    return invalidRecord("'transaction_id' must be a non-empty string");
  }
  tx.transactionId = txId.value();

  if (!j.contains("unlock") || !j["unlock"].is_object()) {
    return invalidRecord("'unlock' must be an object");
  }
  const auto &jUnlock = j["unlock"];
  auto pub = getString(jUnlock, "sender_public_key");
  if (!pub) {
    return pub.error();
  }
  auto sig = getString(jUnlock, "signature");
  if (!sig) {
    return sig.error();
  }
  tx.unlock.senderPublicKey = pub.value();
  tx.unlock.signature = sig.value();

  if (!j.contains("inputs") || !j["inputs"].is_array()) {
    return invalidRecord("'inputs' must be an array");
  }
  for (const auto &jInput : j["inputs"]) {
    auto input = InputRef::fromJson(jInput);
    if (!input) {
      return input.error();
    }
    tx.inputs.push_back(input.value());
  }

  if (!j.contains("outputs") || !j["outputs"].is_array()) {
    return invalidRecord("'outputs' must be an array");
  }
  for (const auto &jOutput : j["outputs"]) {
    auto output = Output::fromJson(jOutput);
    if (!output) {
      return output.error();
    }
    tx.outputs.push_back(output.value());
  }

  if (!j.contains("input_count") || !j["input_count"].is_number_integer() ||
      j["input_count"].get<int64_t>() != static_cast<int64_t>(tx.inputs.size())) {
    return invalidRecord("'input_count' does not match inputs");
  }
  if (!j.contains("output_count") || !j["output_count"].is_number_integer() ||
      j["output_count"].get<int64_t>() != static_cast<int64_t>(tx.outputs.size())) {
    return invalidRecord("'output_count' does not match outputs");
  }
  return tx;
}

} // namespace pwl
