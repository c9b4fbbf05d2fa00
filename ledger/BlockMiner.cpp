#include "BlockMiner.h"
#include "Utilities.h"

namespace pwl {

BlockMiner::BlockMiner(LedgerStore &store) : Module("miner"), store_(store) {}

BlockMiner::Roe<uint64_t>
BlockMiner::findProof(const std::string &payload, uint32_t difficulty,
                      const MiningOptions &options) const {
  if (difficulty > MAX_DIFFICULTY) {
    return Error(E_INVALID_DIFFICULTY,
                 "Difficulty " + std::to_string(difficulty) + " is unreachable");
  }

  const uint64_t interval = options.checkInterval == 0 ? 1 : options.checkInterval;
  const ProofHasher hasher(payload);
  for (uint64_t nonce = 0;; ++nonce) {
    if (options.maxNonce && nonce > *options.maxNonce) {
      return Error(E_NONCE_EXHAUSTED, "No proof found up to nonce " +
                                          std::to_string(*options.maxNonce));
    }
    if (options.cancel && nonce % interval == 0 && options.cancel->load()) {
      return Error(E_CANCELLED, "Mining cancelled at nonce " + std::to_string(nonce));
    }
    if (meetsDifficulty(hasher.hash(nonce), difficulty)) {
      return nonce;
    }
    if (nonce == UINT64_MAX) {
      return Error(E_NONCE_EXHAUSTED, "Nonce space exhausted");
    }
  }
}

BlockMiner::Roe<ChainNode> BlockMiner::mine(const Block &block) {
  return mine(block, MiningOptions{});
}

BlockMiner::Roe<ChainNode> BlockMiner::mine(const Block &block,
                                            const MiningOptions &options) {
  auto difficulty = store_.getDifficulty(block.getVersion());
  if (!difficulty) {
    if (difficulty.error().code == LedgerStore::E_UNKNOWN_VERSION) {
      return Error(E_UNKNOWN_VERSION, difficulty.error().message);
    }
    return Error(E_STORE_UNAVAILABLE, difficulty.error().message);
  }

  // Transactions are fixed for the whole search
  const std::string &payload = block.getMiningPayload();
  const std::string blockId = utl::sha256(payload);

  auto existing = store_.getBlock(blockId);
  if (existing) {
    log().info << "Block " << blockId << " already mined";
    return existing.value();
  }
  if (existing.error().code != LedgerStore::E_NOT_FOUND) {
    return Error(E_STORE_UNAVAILABLE, existing.error().message);
  }

  log().info << "Mining block with " << block.getData().size()
             << " transactions at difficulty " << difficulty.value();
  auto nonce = findProof(payload, difficulty.value(), options);
  if (!nonce) {
    log().warning << nonce.error().message;
    return nonce.error();
  }

  ChainNode node;
  node.block = block;
  node.miningProof = nonce.value();
  node.timestamp = utl::formatTimestamp(utl::getCurrentTime());
  node.blockId = blockId;

  auto committed = store_.commitBlock(node);
  if (!committed) {
    log().error << "Mined block " << blockId << " rejected: "
                << committed.error().message;
    if (committed.error().code == LedgerStore::E_STORE_UNAVAILABLE) {
      return Error(E_STORE_UNAVAILABLE, committed.error().message);
    }
    return Error(E_REJECTED, committed.error().message);
  }

  log().info << "Mined block " << blockId << " with proof " << node.miningProof
             << " (" << hashWithNonce(payload, node.miningProof) << ")";
  return node;
}

} // namespace pwl
