#include "MemoryLedgerStore.h"

#include <set>

namespace pwl {

MemoryLedgerStore::MemoryLedgerStore()
    : MemoryLedgerStore(std::map<std::string, uint32_t>{}) {}

MemoryLedgerStore::MemoryLedgerStore(
    const std::map<std::string, uint32_t> &difficulties)
    : MemoryLedgerStore("store", difficulties) {}

MemoryLedgerStore::MemoryLedgerStore(
    const std::string &name, const std::map<std::string, uint32_t> &difficulties)
    : LedgerStore(name), difficulties_(difficulties) {}

void MemoryLedgerStore::resetState(std::map<std::string, ChainNode> blocks,
                                   std::string tip,
                                   std::map<std::string, uint32_t> difficulties,
                                   std::vector<UnspentEntry> unspent) {
  std::lock_guard<std::mutex> lock(mutex_);
  blocks_ = std::move(blocks);
  tip_ = std::move(tip);
  difficulties_ = std::move(difficulties);
  unspent_ = std::move(unspent);
}

size_t MemoryLedgerStore::getBlockCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

MemoryLedgerStore::Roe<MemoryLedgerStore::Selection>
MemoryLedgerStore::getUnspentCovering(double amount) {
  if (!(amount > 0)) {
    return Error(E_INVALID_AMOUNT, "Amount must be positive");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  Selection selection;
  std::vector<UnspentEntry> updated = unspent_;
  for (auto &entry : updated) {
    if (selection.total >= amount) {
      break;
    }
    if (entry.reserved) {
      continue;
    }
    entry.reserved = true;
    selection.total += entry.ref.amount;
    selection.inputs.push_back(entry.ref);
  }

  if (selection.total < amount) {
    return Error(E_INSUFFICIENT_FUNDS,
                 "Insufficient funds: requested " + std::to_string(amount) +
                     ", available " + std::to_string(selection.total));
  }

  auto saved = saveUnspent(updated);
  if (!saved) {
    return saved.error();
  }
  unspent_ = std::move(updated);
  log().debug << "Reserved " << selection.inputs.size() << " outputs totalling "
              << selection.total;
  return selection;
}

MemoryLedgerStore::Roe<void>
MemoryLedgerStore::release(const std::vector<InputRef> &inputs) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<UnspentEntry> updated = unspent_;
  size_t released = 0;
  for (const auto &input : inputs) {
    for (auto &entry : updated) {
      if (entry.reserved && entry.ref.sameOutput(input)) {
        entry.reserved = false;
        ++released;
        break;
      }
    }
  }
  if (released == 0) {
    return {};
  }

  auto saved = saveUnspent(updated);
  if (!saved) {
    return saved;
  }
  unspent_ = std::move(updated);
  log().debug << "Released " << released << " reserved outputs";
  return {};
}

MemoryLedgerStore::Roe<const Output *>
MemoryLedgerStore::locateOutput(const std::map<std::string, ChainNode> &blocks,
                                const InputRef &ref) const {
  auto blockIt = blocks.find(ref.blockId);
  if (blockIt == blocks.end()) {
    return Error(E_NOT_FOUND, "Block not found: " + ref.blockId);
  }
  const Transaction *tx = blockIt->second.block.findTransaction(ref.transactionId);
  if (!tx) {
    return Error(E_NOT_FOUND, "Transaction " + ref.transactionId +
                                  " not found in block " + ref.blockId);
  }
  if (ref.outputIndex >= tx->outputs.size()) {
    return Error(E_NOT_FOUND, "Output " + ref.key() + " does not exist");
  }
  return &tx->outputs[ref.outputIndex];
}

MemoryLedgerStore::Roe<Output>
MemoryLedgerStore::findOutput(const std::string &transactionId,
                              const std::string &blockId,
                              uint32_t outputIndex) const {
  std::lock_guard<std::mutex> lock(mutex_);
  InputRef ref;
  ref.transactionId = transactionId;
  ref.blockId = blockId;
  ref.outputIndex = outputIndex;
  auto output = locateOutput(blocks_, ref);
  if (!output) {
    return output.error();
  }
  return *output.value();
}

MemoryLedgerStore::Roe<void>
MemoryLedgerStore::markSpent(const std::string &transactionId,
                             const std::string &blockId, uint32_t outputIndex,
                             const std::string &spendingTransactionId) {
  std::lock_guard<std::mutex> lock(mutex_);
  InputRef ref;
  ref.transactionId = transactionId;
  ref.blockId = blockId;
  ref.outputIndex = outputIndex;
  auto output = locateOutput(blocks_, ref);
  if (!output) {
    return output.error();
  }
  if (output.value()->isSpent()) {
    return Error(E_ALREADY_SPENT, "Output " + ref.key() + " already spent by " +
                                      output.value()->spentTransactionId);
  }

  ChainNode updated = blocks_.at(blockId);
  updated.block.markOutputSpent(transactionId, outputIndex, spendingTransactionId);
  std::vector<UnspentEntry> unspent;
  for (const auto &entry : unspent_) {
    if (!entry.ref.sameOutput(ref)) {
      unspent.push_back(entry);
    }
  }

  auto savedBlock = saveBlock(updated);
  if (!savedBlock) {
    return savedBlock;
  }
  auto savedUnspent = saveUnspent(unspent);
  if (!savedUnspent) {
    return savedUnspent;
  }
  blocks_[blockId] = std::move(updated);
  unspent_ = std::move(unspent);
  return {};
}

MemoryLedgerStore::Roe<std::string>
MemoryLedgerStore::appendBlock(const ChainNode &node) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (node.blockId.empty()) {
    return Error(E_INVALID_BLOCK, "Block has no id");
  }
  if (blocks_.count(node.blockId) > 0) {
    return Error(E_BLOCK_EXISTS, "Block already archived: " + node.blockId);
  }
  auto saved = saveBlock(node);
  if (!saved) {
    return saved.error();
  }
  blocks_[node.blockId] = node;
  return node.blockId;
}

MemoryLedgerStore::Roe<ChainNode>
MemoryLedgerStore::getBlock(const std::string &blockId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blocks_.find(blockId);
  if (it == blocks_.end()) {
    return Error(E_NOT_FOUND, "Block not found: " + blockId);
  }
  return it->second;
}

MemoryLedgerStore::Roe<std::string> MemoryLedgerStore::getTip() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tip_;
}

MemoryLedgerStore::Roe<void> MemoryLedgerStore::setTip(const std::string &blockId) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!blockId.empty() && blocks_.count(blockId) == 0) {
    return Error(E_NOT_FOUND, "Cannot set tip to unknown block: " + blockId);
  }
  auto saved = saveInfo(blockId, difficulties_);
  if (!saved) {
    return saved;
  }
  tip_ = blockId;
  return {};
}

MemoryLedgerStore::Roe<uint32_t>
MemoryLedgerStore::getDifficulty(const std::string &version) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = difficulties_.find(version);
  if (it == difficulties_.end()) {
    return Error(E_UNKNOWN_VERSION, "No difficulty for version '" + version + "'");
  }
  return it->second;
}

MemoryLedgerStore::Roe<void>
MemoryLedgerStore::setDifficulty(const std::string &version, uint32_t difficulty) {
  if (difficulty > MAX_DIFFICULTY) {
    return Error(E_INVALID_DIFFICULTY, "Difficulty " + std::to_string(difficulty) +
                                           " exceeds " + std::to_string(MAX_DIFFICULTY));
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto updated = difficulties_;
  updated[version] = difficulty;
  auto saved = saveInfo(tip_, updated);
  if (!saved) {
    return saved;
  }
  difficulties_ = std::move(updated);
  return {};
}

MemoryLedgerStore::Roe<void> MemoryLedgerStore::commitBlock(const ChainNode &node) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (node.blockId.empty()) {
    return Error(E_INVALID_BLOCK, "Block has no id");
  }
  if (blocks_.count(node.blockId) > 0) {
    if (tip_ == node.blockId) {
      return {};
    }
    return Error(E_BLOCK_EXISTS, "Block already archived: " + node.blockId);
  }
  if (node.block.getPreviousBlockId() != tip_) {
    return Error(E_INVALID_BLOCK, "Block " + node.blockId +
                                      " does not extend tip '" + tip_ + "'");
  }

  // Archived copy starts with clean spent markers
  ChainNode accepted = node;
  for (const auto &[txId, tx] : node.block.getData()) {
    for (uint32_t i = 0; i < tx.outputs.size(); ++i) {
      accepted.block.markOutputSpent(txId, i, "");
    }
  }

  std::map<std::string, ChainNode> touched;
  std::set<std::string> consumed;
  for (const auto &[txId, tx] : node.block.getData()) {
    if (tx.isIssuance() && !node.block.isGenesis()) {
      return Error(E_INVALID_BLOCK,
                   "Issuance transaction " + txId + " outside genesis block");
    }
    for (const auto &input : tx.inputs) {
      if (!consumed.insert(input.key()).second) {
        return Error(E_ALREADY_SPENT, "Output " + input.key() +
                                          " consumed twice in block " + node.blockId);
      }
      if (touched.count(input.blockId) == 0) {
        auto it = blocks_.find(input.blockId);
        if (it == blocks_.end()) {
          return Error(E_NOT_FOUND, "Block not found: " + input.blockId);
        }
        touched[input.blockId] = it->second;
      }
      auto output = locateOutput(touched, input);
      if (!output) {
        return output.error();
      }
      if (output.value()->isSpent()) {
        return Error(E_ALREADY_SPENT, "Output " + input.key() + " already spent by " +
                                          output.value()->spentTransactionId);
      }
      touched[input.blockId].block.markOutputSpent(input.transactionId,
                                                   input.outputIndex, txId);
    }
  }

  std::vector<UnspentEntry> unspent;
  for (const auto &entry : unspent_) {
    if (consumed.count(entry.ref.key()) == 0) {
      unspent.push_back(entry);
    }
  }

  // Tip is written last; on failure restore whatever was already written
  std::vector<std::string> rewritten;
  auto fail = [&](const Error &error) -> Roe<void> {
    for (const auto &blockId : rewritten) {
      auto restored = saveBlock(blocks_.at(blockId));
      if (!restored) {
        log().critical << "Failed to restore block " << blockId << ": "
                       << restored.error().message;
      }
    }
    auto erased = eraseBlock(accepted.blockId);
    if (!erased) {
      log().critical << "Failed to remove block " << accepted.blockId << ": "
                     << erased.error().message;
    }
    auto restoredUnspent = saveUnspent(unspent_);
    if (!restoredUnspent) {
      log().critical << "Failed to restore unspent registry: "
                     << restoredUnspent.error().message;
    }
    return error;
  };

  auto saved = saveBlock(accepted);
  if (!saved) {
    return fail(saved.error());
  }
  for (const auto &[blockId, updated] : touched) {
    saved = saveBlock(updated);
    if (!saved) {
      return fail(saved.error());
    }
    rewritten.push_back(blockId);
  }
  saved = saveUnspent(unspent);
  if (!saved) {
    return fail(saved.error());
  }
  saved = saveInfo(accepted.blockId, difficulties_);
  if (!saved) {
    return fail(saved.error());
  }

  for (auto &[blockId, updated] : touched) {
    blocks_[blockId] = std::move(updated);
  }
  blocks_[accepted.blockId] = std::move(accepted);
  unspent_ = std::move(unspent);
  tip_ = node.blockId;
  log().info << "Committed block " << node.blockId << " ("
             << node.block.getData().size() << " transactions, "
             << consumed.size() << " outputs spent)";
  return {};
}

MemoryLedgerStore::Roe<MemoryLedgerStore::Registered>
MemoryLedgerStore::registerOwnedOutputs(const ChainNode &node,
                                        const std::string &address) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blocks_.find(node.blockId);
  if (it == blocks_.end()) {
    return Error(E_NOT_FOUND, "Block not archived: " + node.blockId);
  }

  std::set<std::string> known;
  for (const auto &entry : unspent_) {
    known.insert(entry.ref.key());
  }

  Registered registered;
  std::vector<UnspentEntry> updated = unspent_;
  for (const auto &[txId, tx] : it->second.block.getData()) {
    for (uint32_t i = 0; i < tx.outputs.size(); ++i) {
      const Output &output = tx.outputs[i];
      if (output.receiverAddress != address || output.isSpent()) {
        continue;
      }
      UnspentEntry entry;
      entry.ref.transactionId = txId;
      entry.ref.blockId = node.blockId;
      entry.ref.outputIndex = i;
      entry.ref.amount = output.amount;
      if (!known.insert(entry.ref.key()).second) {
        continue;
      }
      updated.push_back(entry);
      ++registered.count;
      registered.total += output.amount;
    }
  }

  if (registered.count == 0) {
    return registered;
  }
  auto saved = saveUnspent(updated);
  if (!saved) {
    return saved.error();
  }
  unspent_ = std::move(updated);
  return registered;
}

MemoryLedgerStore::Roe<std::vector<InputRef>> MemoryLedgerStore::getReserved() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<InputRef> reserved;
  for (const auto &entry : unspent_) {
    if (entry.reserved) {
      reserved.push_back(entry.ref);
    }
  }
  return reserved;
}

MemoryLedgerStore::Roe<double> MemoryLedgerStore::getBalance() const {
  std::lock_guard<std::mutex> lock(mutex_);
  double balance = 0;
  for (const auto &entry : unspent_) {
    if (!entry.reserved) {
      balance += entry.ref.amount;
    }
  }
  return balance;
}

} // namespace pwl
