#include "Block.h"
#include "Canonical.h"

namespace pwl {

Block::Block(const std::string &previousBlockId, const std::string &version)
    : previousBlockId_(previousBlockId), version_(version) {}

bool Block::addTransaction(const Transaction &tx) {
  if (data_.count(tx.transactionId) > 0 || !canonical::encode(tx.toHashJson())) {
    return false;
  }
  auto inserted = data_.emplace(tx.transactionId, tx).second;
  if (inserted) {
    payloadCache_.reset();
  }
  return inserted;
}

bool Block::markOutputSpent(const std::string &transactionId,
                            uint32_t outputIndex,
                            const std::string &spendingTransactionId) {
  auto it = data_.find(transactionId);
  if (it == data_.end() || outputIndex >= it->second.outputs.size()) {
    return false;
  }
  it->second.outputs[outputIndex].spentTransactionId = spendingTransactionId;
  return true;
}

const Transaction *Block::findTransaction(const std::string &transactionId) const {
  auto it = data_.find(transactionId);
  return it == data_.end() ? nullptr : &it->second;
}

const std::string &Block::getMiningPayload() const {
  if (!payloadCache_) {
    nlohmann::ordered_json data = nlohmann::ordered_json::object();
    for (const auto &[txId, tx] : data_) {
      data[txId] = tx.toHashJson();
    }
    // Every member passed the encoding check in addTransaction()
    payloadCache_ = previousBlockId_ + canonical::encode(data).value() + version_;
  }
  return *payloadCache_;
}

nlohmann::ordered_json ChainNode::toJson() const {
  nlohmann::ordered_json j;
  j["block_id"] = blockId;
  j["previous_block_id"] = block.getPreviousBlockId();
  j["timestamp"] = timestamp;
  nlohmann::ordered_json data = nlohmann::ordered_json::object();
  for (const auto &[txId, tx] : block.getData()) {
    data[txId] = tx.toJson();
  }
  j["data"] = data;
  j["version"] = block.getVersion();
  j["mining_proof"] = miningProof;
  return j;
}

Roe<ChainNode> ChainNode::fromJson(const nlohmann::json &j) {
  auto invalid = [](const std::string &what) {
    return Error(E_INVALID_RECORD, "Invalid block record: " + what);
  };

  if (!j.is_object()) {
    return invalid("block must be an object");
  }
  for (const char *field : { "block_id", "previous_block_id", "timestamp" }) {
    if (!j.contains(field) || !j[field].is_string()) {
      return invalid(std::string("'") + field + "' must be a string");
    }
  }
  if (!j.contains("mining_proof") || !j["mining_proof"].is_number_unsigned()) {
    return invalid("'mining_proof' must be a non-negative integer");
  }
  if (!j.contains("data") || !j["data"].is_object()) {
    return invalid("'data' must be an object");
  }

  // Versions written by other tools may be numeric
  std::string version;
  if (j.contains("version") && j["version"].is_string()) {
    version = j["version"].get<std::string>();
  } else if (j.contains("version") && j["version"].is_number()) {
    version = j["version"].dump();
  } else {
    return invalid("'version' must be a string");
  }

  ChainNode node;
  node.block = Block(j["previous_block_id"].get<std::string>(), version);
  for (auto it = j["data"].begin(); it != j["data"].end(); ++it) {
    auto tx = Transaction::fromJson(it.value());
    if (!tx) {
      return tx.error();
    }
    if (tx.value().transactionId != it.key()) {
      return invalid("data key " + it.key() + " does not match transaction id");
    }
    if (!node.block.addTransaction(tx.value())) {
      return invalid("transaction " + it.key() + " cannot be encoded");
    }
  }
  node.blockId = j["block_id"].get<std::string>();
  node.timestamp = j["timestamp"].get<std::string>();
  node.miningProof = j["mining_proof"].get<uint64_t>();
  return node;
}

std::string hashWithNonce(const std::string &payload, uint64_t nonce) {
  return ProofHasher(payload).hash(nonce);
}

ProofHasher::ProofHasher(const std::string &payload) { prefix_.update(payload); }

std::string ProofHasher::hash(uint64_t nonce) const {
  utl::Sha256 hasher = prefix_;
  hasher.update(std::to_string(nonce));
  return hasher.hexDigest();
}

bool meetsDifficulty(const std::string &hash, uint32_t difficulty) {
  if (difficulty > hash.size()) {
    return false;
  }
  for (uint32_t i = 0; i < difficulty; ++i) {
    if (hash[i] != '0') {
      return false;
    }
  }
  return true;
}

} // namespace pwl
