#pragma once

#include "Block.h"
#include "LedgerStore.hpp"
#include "Module.h"

#include <atomic>
#include <cstdint>
#include <optional>

namespace pwl {

struct MiningOptions {
  // Attempts between two looks at the cancel flag
  uint64_t checkInterval{ 1024 };
  // Highest nonce to try; unbounded when empty
  std::optional<uint64_t> maxNonce;
  // Set from another thread to stop the search
  const std::atomic<bool> *cancel{ nullptr };
};

/**
 * Proof-of-work search over a block's canonical payload.
 *
 * Nonces are tried in increasing order from 0, so the same block always
 * yields the same proof and id.
 */
class BlockMiner : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CANCELLED = 1;         // Cancel flag was raised
  constexpr static int32_t E_NONCE_EXHAUSTED = 2;   // No proof up to maxNonce
  constexpr static int32_t E_UNKNOWN_VERSION = 3;   // No difficulty for block version
  constexpr static int32_t E_INVALID_DIFFICULTY = 4;
  constexpr static int32_t E_REJECTED = 5;          // Store refused the mined block
  constexpr static int32_t E_STORE_UNAVAILABLE = 6;

  explicit BlockMiner(LedgerStore &store);
  ~BlockMiner() override = default;

  /**
   * Mine a block and make it the new chain tip.
   *
   * On success the returned node carries the proof, the mining timestamp and
   * the block id (SHA-256 of the payload without nonce). If the store already
   * holds a block with that id, the stored one is returned unchanged.
   * A cancelled or exhausted search leaves the store untouched.
   */
  Roe<ChainNode> mine(const Block &block, const MiningOptions &options);
  Roe<ChainNode> mine(const Block &block);

  /** A mined block is returned as is */
  Roe<ChainNode> mine(const ChainNode &node) const { return node; }

  /**
   * Search for the first nonce whose proof hash meets `difficulty`.
   * Does not touch the store.
   */
  Roe<uint64_t> findProof(const std::string &payload, uint32_t difficulty,
                          const MiningOptions &options) const;

private:
  LedgerStore &store_;
};

} // namespace pwl
