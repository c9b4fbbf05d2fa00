#pragma once

#include "BlockMiner.h"
#include "BlockVerifier.h"
#include "FileLedgerStore.h"
#include "Module.h"
#include "ResultOrError.hpp"
#include "TransactionVerifier.h"
#include "Wallet.h"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace pwl {

/**
 * Node - one participant of the ledger
 *
 * Responsibilities:
 * - Own the file-backed ledger store and the node's wallet
 * - Keep a pool of verified transactions waiting for a block
 * - Mine the pool into blocks on top of the current tip
 * - Verify and accept blocks mined elsewhere
 *
 * Local mining and block acceptance never overlap: receiving a block
 * cancels the search in progress and waits for it to stop.
 */
class Node : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CONFIG = 1;
  constexpr static int32_t E_STORE = 2;
  constexpr static int32_t E_WALLET = 3;
  constexpr static int32_t E_NOT_INITIALIZED = 4; // init() not done or no genesis block
  constexpr static int32_t E_CHAIN_EXISTS = 5;    // Genesis already mined
  constexpr static int32_t E_INSUFFICIENT_FUNDS = 6;
  constexpr static int32_t E_BUILD = 7;           // Transaction could not be built
  constexpr static int32_t E_DUPLICATE = 8;       // Transaction already pending
  constexpr static int32_t E_REJECTED = 9;        // Transaction failed verification
  constexpr static int32_t E_CONFLICT = 10;       // Input used by a pending transaction
  constexpr static int32_t E_EMPTY_POOL = 11;
  constexpr static int32_t E_CANCELLED = 12;
  constexpr static int32_t E_MINING = 13;
  constexpr static int32_t E_NOT_FOUND = 14;

  constexpr static const char *DEFAULT_VERSION = "1.0";
  constexpr static uint32_t DEFAULT_DIFFICULTY = 5;
  constexpr static const char *DIR_PENDING = "pending";

  struct Config {
    std::string workDir;
    std::string version{ DEFAULT_VERSION };
    std::map<std::string, uint32_t> difficulties{ { DEFAULT_VERSION,
                                                    DEFAULT_DIFFICULTY } };
    std::string privateKey; // base64, generated when empty
    std::string publicKey;
    uint64_t checkInterval{ 1024 };
    std::optional<uint64_t> maxNonce;
    bool autoMine{ false };
    std::string logFile;

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  /**
   * Load a config file. A missing key pair is generated and written back
   * to the file so the node keeps its address across runs.
   */
  static Roe<Config> loadConfig(const std::string &path);

  Node();
  ~Node() override = default;

  // ----------------- accessors -------------------------------------
  const Config &getConfig() const { return config_; }
  const Wallet &getWallet() const { return wallet_; }
  Roe<double> getBalance() const;
  Roe<std::string> getTip() const;
  Roe<ChainNode> getBlock(const std::string &blockId) const;
  size_t getPendingCount() const;
  bool hasPending() const { return getPendingCount() > 0; }

  // ----------------- methods -------------------------------------
  Roe<void> init(const Config &config);

  /**
   * Mine the genesis block, issuing `amount` to this node's wallet.
   * Only possible on an empty chain.
   */
  Roe<ChainNode> initGenesis(double amount);

  /** Verify a transaction and add it to the pending pool */
  Roe<void> submit(const Transaction &tx);

  /** Pay `amount` from this node's wallet; the result is already pooled */
  Roe<Transaction> send(const std::string &receiverAddress, double amount);

  /** Mine all pending transactions into a new block on the tip */
  Roe<ChainNode> mine();

  /**
   * Verify and accept a block mined elsewhere. Pending transactions that
   * the block included or invalidated leave the pool.
   */
  Roe<BlockVerifier::Result> receiveBlock(const ChainNode &node);

  /** Stop the search in progress, if any, and wait for it to end */
  void cancelMining();

private:
  // Caller holds poolMutex_
  Roe<void> checkAdmissible(const Transaction &tx) const;
  Roe<void> loadPending();
  // Caller holds poolMutex_
  Roe<void> releaseOrphanedReservations();
  Roe<void> savePending(const Transaction &tx) const;
  void removePending(const std::string &transactionId);
  void prunePending(const ChainNode &node);
  Roe<void> registerOwned(const ChainNode &node);
  MiningOptions miningOptions() const;
  // Cancel the search in progress and take the mining lock
  std::unique_lock<std::mutex> interruptMining();
  std::string pendingPath(const std::string &transactionId) const;

  Config config_;
  Wallet wallet_;
  FileLedgerStore store_;
  BlockMiner miner_{ store_ };
  BlockVerifier blockVerifier_{ store_ };
  TransactionVerifier txVerifier_{ store_ };

  std::map<std::string, Transaction> pending_;
  mutable std::mutex poolMutex_;
  std::mutex miningMutex_;
  std::mutex cancelMutex_;
  uint32_t cancelWaiters_{ 0 }; // guarded by cancelMutex_
  std::atomic<bool> cancel_{ false };
  bool initialized_{ false };
};

} // namespace pwl
