#pragma once

#include "LedgerStore.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace pwl {

/**
 * LedgerStore kept entirely in memory, guarded by one mutex.
 *
 * Subclasses add durability through the save/erase hooks. Every mutation
 * calls the hooks with the new state first and only updates memory when
 * they succeed, so a failed write never leaves memory ahead of storage.
 */
class MemoryLedgerStore : public LedgerStore {
public:
  MemoryLedgerStore();
  explicit MemoryLedgerStore(const std::map<std::string, uint32_t> &difficulties);
  ~MemoryLedgerStore() override = default;

  Roe<Selection> getUnspentCovering(double amount) override;
  Roe<void> release(const std::vector<InputRef> &inputs) override;
  Roe<std::vector<InputRef>> getReserved() const override;
  Roe<Output> findOutput(const std::string &transactionId,
                         const std::string &blockId,
                         uint32_t outputIndex) const override;
  Roe<void> markSpent(const std::string &transactionId,
                      const std::string &blockId, uint32_t outputIndex,
                      const std::string &spendingTransactionId) override;
  Roe<std::string> appendBlock(const ChainNode &node) override;
  Roe<ChainNode> getBlock(const std::string &blockId) const override;
  Roe<std::string> getTip() const override;
  Roe<void> setTip(const std::string &blockId) override;
  Roe<uint32_t> getDifficulty(const std::string &version) const override;
  Roe<void> setDifficulty(const std::string &version, uint32_t difficulty) override;
  Roe<void> commitBlock(const ChainNode &node) override;
  Roe<Registered> registerOwnedOutputs(const ChainNode &node,
                                       const std::string &address) override;
  Roe<double> getBalance() const override;

  size_t getBlockCount() const;

protected:
  struct UnspentEntry {
    InputRef ref;
    bool reserved{ false };
  };

  MemoryLedgerStore(const std::string &name,
                    const std::map<std::string, uint32_t> &difficulties);

  virtual Roe<void> saveBlock(const ChainNode &) { return {}; }
  virtual Roe<void> eraseBlock(const std::string &) { return {}; }
  virtual Roe<void> saveInfo(const std::string &,
                             const std::map<std::string, uint32_t> &) {
    return {};
  }
  virtual Roe<void> saveUnspent(const std::vector<UnspentEntry> &) { return {}; }

  /** Replace the whole state, e.g. after loading it from disk */
  void resetState(std::map<std::string, ChainNode> blocks, std::string tip,
                  std::map<std::string, uint32_t> difficulties,
                  std::vector<UnspentEntry> unspent);

private:
  Roe<const Output *> locateOutput(const std::map<std::string, ChainNode> &blocks,
                                   const InputRef &ref) const;

  mutable std::mutex mutex_;
  std::map<std::string, ChainNode> blocks_;
  std::string tip_;
  std::map<std::string, uint32_t> difficulties_;
  std::vector<UnspentEntry> unspent_;
};

} // namespace pwl
