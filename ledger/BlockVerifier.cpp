#include "BlockVerifier.h"
#include "Utilities.h"

namespace pwl {

BlockVerifier::BlockVerifier(LedgerStore &store)
    : Module("block_verifier"), store_(store), txVerifier_(store) {}

BlockVerifier::Result BlockVerifier::reject(const ChainNode &node,
                                            const std::string &reason) const {
  log().warning << "Rejected block " << node.blockId << ": " << reason;
  Result result;
  result.reason = reason;
  return result;
}

BlockVerifier::Result BlockVerifier::checkProof(const ChainNode &node,
                                                uint32_t difficulty) {
  Result result;
  const std::string &payload = node.block.getMiningPayload();
  if (!meetsDifficulty(hashWithNonce(payload, node.miningProof), difficulty)) {
    result.reason = "proof " + std::to_string(node.miningProof) +
                    " does not meet difficulty " + std::to_string(difficulty);
    return result;
  }
  if (node.blockId != utl::sha256(payload)) {
    result.reason = "block id does not match content";
    return result;
  }
  result.valid = true;
  return result;
}

BlockVerifier::Roe<BlockVerifier::Result>
BlockVerifier::verify(const ChainNode &node) {
  auto difficulty = store_.getDifficulty(node.block.getVersion());
  if (!difficulty) {
    if (difficulty.error().code == LedgerStore::E_UNKNOWN_VERSION) {
      return reject(node, difficulty.error().message);
    }
    return Error(E_STORE_UNAVAILABLE, difficulty.error().message);
  }

  Result proof = checkProof(node, difficulty.value());
  if (!proof.valid) {
    return reject(node, proof.reason);
  }

  auto tip = store_.getTip();
  if (!tip) {
    return Error(E_STORE_UNAVAILABLE, tip.error().message);
  }
  if (tip.value() == node.blockId) {
    log().debug << "Block " << node.blockId << " is already the tip";
    return proof;
  }

  if (verifyTransactions_) {
    for (const auto &[txId, tx] : node.block.getData()) {
      auto checked = txVerifier_.verify(tx);
      if (!checked) {
        return Error(E_STORE_UNAVAILABLE, checked.error().message);
      }
      if (!checked.value().authentic) {
        std::string reason = "transaction " + txId + " is not authentic";
        if (checked.value().offender) {
          reason += " (input " + checked.value().offender->key() + ")";
        }
        return reject(node, reason);
      }
    }
  }

  auto committed = store_.commitBlock(node);
  if (!committed) {
    if (committed.error().code == LedgerStore::E_STORE_UNAVAILABLE) {
      return Error(E_STORE_UNAVAILABLE, committed.error().message);
    }
    return reject(node, committed.error().message);
  }

  log().info << "Accepted block " << node.blockId << " as new tip";
  return proof;
}

} // namespace pwl
