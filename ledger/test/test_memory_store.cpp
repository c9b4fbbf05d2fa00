#include "MemoryLedgerStore.h"
#include <gtest/gtest.h>

namespace pwl {

namespace {

Transaction makeIssuance(const std::vector<std::pair<std::string, double>> &payments) {
  Transaction tx;
  for (const auto &[receiver, amount] : payments) {
    Output output;
    output.receiverAddress = receiver;
    output.amount = amount;
    tx.outputs.push_back(output);
  }
  tx.transactionId = tx.computeId().value();
  return tx;
}

Transaction makeSpend(const std::vector<InputRef> &inputs, const std::string &receiver,
                      double amount) {
  Transaction tx;
  tx.inputs = inputs;
  Output output;
  output.receiverAddress = receiver;
  output.amount = amount;
  tx.outputs.push_back(output);
  tx.transactionId = tx.computeId().value();
  return tx;
}

ChainNode makeNode(const std::string &previous, const std::vector<Transaction> &txs) {
  ChainNode node;
  node.block = Block(previous, "1.0");
  for (const auto &tx : txs) {
    node.block.addTransaction(tx);
  }
  node.blockId = utl::sha256(node.block.getMiningPayload());
  node.timestamp = "2024-01-01 00:00:00";
  return node;
}

} // namespace

class MemoryLedgerStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    issuance_ = makeIssuance({ { "alice", 30 }, { "alice", 20 }, { "bob", 5 } });
    genesis_ = makeNode("", { issuance_ });
    auto committed = store_.commitBlock(genesis_);
    ASSERT_TRUE(committed.isOk()) << committed.error().message;
    auto registered = store_.registerOwnedOutputs(genesis_, "alice");
    ASSERT_TRUE(registered.isOk()) << registered.error().message;
    ASSERT_EQ(registered.value().count, 2u);
    ASSERT_DOUBLE_EQ(registered.value().total, 50);
  }

  InputRef output(uint32_t index, double amount) const {
    InputRef ref;
    ref.transactionId = issuance_.transactionId;
    ref.blockId = genesis_.blockId;
    ref.outputIndex = index;
    ref.amount = amount;
    return ref;
  }

  MemoryLedgerStore store_{ std::map<std::string, uint32_t>{ { "1.0", 2 } } };
  Transaction issuance_;
  ChainNode genesis_;
};

TEST_F(MemoryLedgerStoreTest, GenesisBecomesTip) {
  EXPECT_EQ(store_.getTip().value(), genesis_.blockId);
  EXPECT_EQ(store_.getBlockCount(), 1u);
  EXPECT_DOUBLE_EQ(store_.getBalance().value(), 50);
}

TEST_F(MemoryLedgerStoreTest, SelectionCoversAmountInRegistryOrder) {
  auto selection = store_.getUnspentCovering(25);
  ASSERT_TRUE(selection.isOk()) << selection.error().message;
  ASSERT_EQ(selection.value().inputs.size(), 1u);
  EXPECT_EQ(selection.value().inputs[0].outputIndex, 0u);
  EXPECT_DOUBLE_EQ(selection.value().total, 30);
  EXPECT_DOUBLE_EQ(store_.getBalance().value(), 20);

  selection = store_.getUnspentCovering(20);
  ASSERT_TRUE(selection.isOk()) << selection.error().message;
  EXPECT_EQ(selection.value().inputs[0].outputIndex, 1u);
  EXPECT_DOUBLE_EQ(store_.getBalance().value(), 0);
}

TEST_F(MemoryLedgerStoreTest, SelectionFailsWithoutReserving) {
  auto selection = store_.getUnspentCovering(51);
  ASSERT_TRUE(selection.isError());
  EXPECT_EQ(selection.error().code, LedgerStore::E_INSUFFICIENT_FUNDS);
  EXPECT_DOUBLE_EQ(store_.getBalance().value(), 50);

  selection = store_.getUnspentCovering(0);
  ASSERT_TRUE(selection.isError());
  EXPECT_EQ(selection.error().code, LedgerStore::E_INVALID_AMOUNT);
}

TEST_F(MemoryLedgerStoreTest, ReleaseMakesOutputsSelectableAgain) {
  auto selection = store_.getUnspentCovering(50);
  ASSERT_TRUE(selection.isOk());
  EXPECT_DOUBLE_EQ(store_.getBalance().value(), 0);

  auto reserved = store_.getReserved();
  ASSERT_TRUE(reserved.isOk());
  ASSERT_EQ(reserved.value().size(), selection.value().inputs.size());
  EXPECT_TRUE(reserved.value()[0].sameOutput(selection.value().inputs[0]));

  ASSERT_TRUE(store_.release(selection.value().inputs).isOk());
  EXPECT_DOUBLE_EQ(store_.getBalance().value(), 50);
  EXPECT_TRUE(store_.getReserved().value().empty());
  EXPECT_TRUE(store_.getUnspentCovering(50).isOk());
}

TEST_F(MemoryLedgerStoreTest, FindOutputReportsMissingParts) {
  auto found = store_.findOutput(issuance_.transactionId, genesis_.blockId, 2);
  ASSERT_TRUE(found.isOk());
  EXPECT_EQ(found.value().receiverAddress, "bob");

  EXPECT_EQ(store_.findOutput(issuance_.transactionId, genesis_.blockId, 3).error().code,
            LedgerStore::E_NOT_FOUND);
  EXPECT_EQ(store_.findOutput("nope", genesis_.blockId, 0).error().code,
            LedgerStore::E_NOT_FOUND);
  EXPECT_EQ(store_.findOutput(issuance_.transactionId, "nope", 0).error().code,
            LedgerStore::E_NOT_FOUND);
}

TEST_F(MemoryLedgerStoreTest, MarkSpentOnlyOnce) {
  auto first = store_.markSpent(issuance_.transactionId, genesis_.blockId, 0, "tx-1");
  ASSERT_TRUE(first.isOk()) << first.error().message;
  EXPECT_DOUBLE_EQ(store_.getBalance().value(), 20);

  auto second = store_.markSpent(issuance_.transactionId, genesis_.blockId, 0, "tx-2");
  ASSERT_TRUE(second.isError());
  EXPECT_EQ(second.error().code, LedgerStore::E_ALREADY_SPENT);

  auto output = store_.findOutput(issuance_.transactionId, genesis_.blockId, 0);
  EXPECT_EQ(output.value().spentTransactionId, "tx-1");
}

TEST_F(MemoryLedgerStoreTest, CommitSpendsInputsAndAdvancesTip) {
  Transaction spend = makeSpend({ output(0, 30) }, "bob", 30);
  ChainNode node = makeNode(genesis_.blockId, { spend });

  auto committed = store_.commitBlock(node);
  ASSERT_TRUE(committed.isOk()) << committed.error().message;
  EXPECT_EQ(store_.getTip().value(), node.blockId);
  EXPECT_EQ(store_.findOutput(issuance_.transactionId, genesis_.blockId, 0)
                .value()
                .spentTransactionId,
            spend.transactionId);
  EXPECT_DOUBLE_EQ(store_.getBalance().value(), 20);

  // Committing the tip again changes nothing
  ASSERT_TRUE(store_.commitBlock(node).isOk());
  EXPECT_EQ(store_.getBlockCount(), 2u);
}

TEST_F(MemoryLedgerStoreTest, CommitRejectsArchivedNonTipBlock) {
  ChainNode node = makeNode(genesis_.blockId, { makeSpend({ output(0, 30) }, "bob", 30) });
  ASSERT_TRUE(store_.commitBlock(node).isOk());

  auto again = store_.commitBlock(genesis_);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, LedgerStore::E_BLOCK_EXISTS);
}

TEST_F(MemoryLedgerStoreTest, CommitRejectsBlockNotExtendingTip) {
  ChainNode node = makeNode("somewhere-else", { makeSpend({ output(0, 30) }, "bob", 30) });
  auto committed = store_.commitBlock(node);
  ASSERT_TRUE(committed.isError());
  EXPECT_EQ(committed.error().code, LedgerStore::E_INVALID_BLOCK);
  EXPECT_EQ(store_.getTip().value(), genesis_.blockId);
}

TEST_F(MemoryLedgerStoreTest, CommitRejectsIssuanceOutsideGenesis) {
  ChainNode node = makeNode(genesis_.blockId, { makeIssuance({ { "mallory", 100 } }) });
  auto committed = store_.commitBlock(node);
  ASSERT_TRUE(committed.isError());
  EXPECT_EQ(committed.error().code, LedgerStore::E_INVALID_BLOCK);
}

TEST_F(MemoryLedgerStoreTest, CommitRejectsOutputConsumedTwiceInBlock) {
  ChainNode node = makeNode(genesis_.blockId, { makeSpend({ output(0, 30) }, "bob", 30),
                                                makeSpend({ output(0, 30) }, "carol", 30) });
  auto committed = store_.commitBlock(node);
  ASSERT_TRUE(committed.isError());
  EXPECT_EQ(committed.error().code, LedgerStore::E_ALREADY_SPENT);

  // All or nothing: the first spend was not applied either
  EXPECT_FALSE(store_.findOutput(issuance_.transactionId, genesis_.blockId, 0)
                   .value()
                   .isSpent());
  EXPECT_EQ(store_.getTip().value(), genesis_.blockId);
  EXPECT_EQ(store_.getBlockCount(), 1u);
}

TEST_F(MemoryLedgerStoreTest, CommitRejectsUnknownInput) {
  InputRef missing = output(9, 1);
  ChainNode node = makeNode(genesis_.blockId, { makeSpend({ missing }, "bob", 1) });
  auto committed = store_.commitBlock(node);
  ASSERT_TRUE(committed.isError());
  EXPECT_EQ(committed.error().code, LedgerStore::E_NOT_FOUND);
}

TEST_F(MemoryLedgerStoreTest, AcceptedBlockHasCleanSpentMarkers) {
  Transaction spend = makeSpend({ output(0, 30) }, "bob", 30);
  ChainNode node = makeNode(genesis_.blockId, { spend });
  node.block.markOutputSpent(spend.transactionId, 0, "claimed-by-sender");

  ASSERT_TRUE(store_.commitBlock(node).isOk());
  auto stored = store_.findOutput(spend.transactionId, node.blockId, 0);
  ASSERT_TRUE(stored.isOk());
  EXPECT_FALSE(stored.value().isSpent());
}

TEST_F(MemoryLedgerStoreTest, RegisterOwnedOutputsSkipsKnownAndSpent) {
  auto again = store_.registerOwnedOutputs(genesis_, "alice");
  ASSERT_TRUE(again.isOk());
  EXPECT_EQ(again.value().count, 0u);

  ASSERT_TRUE(store_.markSpent(issuance_.transactionId, genesis_.blockId, 2, "tx").isOk());
  auto bob = store_.registerOwnedOutputs(genesis_, "bob");
  ASSERT_TRUE(bob.isOk());
  EXPECT_EQ(bob.value().count, 0u);

  ChainNode unknown = makeNode(genesis_.blockId, {});
  EXPECT_EQ(store_.registerOwnedOutputs(unknown, "alice").error().code,
            LedgerStore::E_NOT_FOUND);
}

TEST_F(MemoryLedgerStoreTest, AppendAndTipAreIndependent) {
  ChainNode node = makeNode(genesis_.blockId, { makeSpend({ output(1, 20) }, "bob", 20) });
  auto appended = store_.appendBlock(node);
  ASSERT_TRUE(appended.isOk()) << appended.error().message;
  EXPECT_EQ(appended.value(), node.blockId);
  EXPECT_EQ(store_.getTip().value(), genesis_.blockId);

  EXPECT_EQ(store_.appendBlock(node).error().code, LedgerStore::E_BLOCK_EXISTS);
  ASSERT_TRUE(store_.setTip(node.blockId).isOk());
  EXPECT_EQ(store_.getTip().value(), node.blockId);
  EXPECT_EQ(store_.setTip("unknown").error().code, LedgerStore::E_NOT_FOUND);
}

TEST_F(MemoryLedgerStoreTest, DifficultyTable) {
  EXPECT_EQ(store_.getDifficulty("1.0").value(), 2u);
  EXPECT_EQ(store_.getDifficulty("2.0").error().code, LedgerStore::E_UNKNOWN_VERSION);

  ASSERT_TRUE(store_.setDifficulty("2.0", 4).isOk());
  EXPECT_EQ(store_.getDifficulty("2.0").value(), 4u);
  EXPECT_EQ(store_.setDifficulty("2.0", MAX_DIFFICULTY + 1).error().code,
            LedgerStore::E_INVALID_DIFFICULTY);
  EXPECT_EQ(store_.getDifficulty("2.0").value(), 4u);
}

} // namespace pwl
