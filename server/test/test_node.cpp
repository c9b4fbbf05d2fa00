#include "Node.h"
#include "TransactionBuilder.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace pwl {

class NodeTest : public ::testing::Test {
protected:
  void SetUp() override {
    testDir_ = std::filesystem::temp_directory_path() / "powledger_node_test";
    cleanupTestDir();
    std::filesystem::create_directories(testDir_);
  }

  void TearDown() override { cleanupTestDir(); }

  void cleanupTestDir() {
    std::error_code ec;
    if (std::filesystem::exists(testDir_, ec)) {
      std::filesystem::remove_all(testDir_, ec);
    }
  }

  Node::Config makeConfig(const std::string &name) const {
    Node::Config config;
    config.workDir = (testDir_ / name).string();
    config.difficulties = { { "1.0", 1 } };
    config.checkInterval = 16;
    return config;
  }

  static Transaction forge(const Wallet &wallet, const std::vector<InputRef> &inputs,
                           const std::string &receiver, double amount) {
    Transaction tx;
    tx.inputs = inputs;
    Output output;
    output.receiverAddress = receiver;
    output.amount = amount;
    tx.outputs.push_back(output);
    tx.transactionId = tx.computeId().value();
    auto key = utl::base64Decode(wallet.getPrivateKey());
    auto signature = utl::ecdsaSign(key.value(), tx.getMessage().value());
    tx.unlock.senderPublicKey = wallet.getPublicKey();
    tx.unlock.signature = utl::base64Encode(signature.value());
    return tx;
  }

  static std::string newAddress() { return Wallet::generate().value().getAddress(); }

  std::filesystem::path testDir_;
};

TEST_F(NodeTest, InitOpensStoreAndWallet) {
  Node node;
  auto result = node.init(makeConfig("a"));
  ASSERT_TRUE(result.isOk()) << result.error().message;

  EXPECT_FALSE(node.getWallet().isEmpty());
  EXPECT_EQ(node.getTip().value(), "");
  EXPECT_EQ(node.getPendingCount(), 0u);
  EXPECT_TRUE(std::filesystem::exists(testDir_ / "a" / FileLedgerStore::FILE_INFO));
  EXPECT_TRUE(std::filesystem::is_directory(testDir_ / "a" / Node::DIR_PENDING));

  EXPECT_EQ(node.init(makeConfig("a")).error().code, Node::E_CONFIG);
}

TEST_F(NodeTest, InitRejectsMismatchedKeys) {
  auto a = Wallet::generate();
  auto b = Wallet::generate();
  ASSERT_TRUE(a.isOk());
  ASSERT_TRUE(b.isOk());

  Node::Config config = makeConfig("a");
  config.privateKey = a.value().getPrivateKey();
  config.publicKey = b.value().getPublicKey();

  Node node;
  auto result = node.init(config);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Node::E_WALLET);
}

TEST_F(NodeTest, OperationsRequireInit) {
  Node node;
  EXPECT_EQ(node.mine().error().code, Node::E_NOT_INITIALIZED);
  EXPECT_EQ(node.send(newAddress(), 1).error().code, Node::E_NOT_INITIALIZED);
  EXPECT_EQ(node.initGenesis(1).error().code, Node::E_NOT_INITIALIZED);
}

TEST_F(NodeTest, GenesisCreditsWallet) {
  Node node;
  ASSERT_TRUE(node.init(makeConfig("a")).isOk());

  auto genesis = node.initGenesis(100);
  ASSERT_TRUE(genesis.isOk()) << genesis.error().message;
  EXPECT_TRUE(genesis.value().block.isGenesis());
  EXPECT_EQ(node.getTip().value(), genesis.value().blockId);
  EXPECT_DOUBLE_EQ(node.getBalance().value(), 100);

  auto again = node.initGenesis(100);
  ASSERT_TRUE(again.isError());
  EXPECT_EQ(again.error().code, Node::E_CHAIN_EXISTS);

  auto stored = node.getBlock(genesis.value().blockId);
  ASSERT_TRUE(stored.isOk());
  EXPECT_EQ(stored.value().miningProof, genesis.value().miningProof);
  EXPECT_EQ(node.getBlock(std::string(64, '0')).error().code, Node::E_NOT_FOUND);
}

TEST_F(NodeTest, MineRequiresGenesisAndPending) {
  Node node;
  ASSERT_TRUE(node.init(makeConfig("a")).isOk());
  EXPECT_EQ(node.mine().error().code, Node::E_NOT_INITIALIZED);

  ASSERT_TRUE(node.initGenesis(10).isOk());
  EXPECT_EQ(node.mine().error().code, Node::E_EMPTY_POOL);
}

TEST_F(NodeTest, SendThenMineMovesFunds) {
  Node node;
  ASSERT_TRUE(node.init(makeConfig("a")).isOk());
  ASSERT_TRUE(node.initGenesis(100).isOk());
  auto bob = Wallet::generate();
  ASSERT_TRUE(bob.isOk());

  auto tx = node.send(bob.value().getAddress(), 30);
  ASSERT_TRUE(tx.isOk()) << tx.error().message;
  EXPECT_EQ(node.getPendingCount(), 1u);
  EXPECT_DOUBLE_EQ(node.getBalance().value(), 0);
  EXPECT_TRUE(std::filesystem::exists(testDir_ / "a" / Node::DIR_PENDING /
                                      (tx.value().transactionId + ".json")));

  auto block = node.mine();
  ASSERT_TRUE(block.isOk()) << block.error().message;
  EXPECT_NE(block.value().block.findTransaction(tx.value().transactionId), nullptr);
  EXPECT_EQ(node.getTip().value(), block.value().blockId);
  EXPECT_EQ(node.getPendingCount(), 0u);
  EXPECT_DOUBLE_EQ(node.getBalance().value(), 70);
  EXPECT_FALSE(std::filesystem::exists(testDir_ / "a" / Node::DIR_PENDING /
                                       (tx.value().transactionId + ".json")));
}

TEST_F(NodeTest, SendWithInsufficientFundsKeepsBalance) {
  Node node;
  ASSERT_TRUE(node.init(makeConfig("a")).isOk());
  ASSERT_TRUE(node.initGenesis(10).isOk());

  auto tx = node.send(newAddress(), 11);
  ASSERT_TRUE(tx.isError());
  EXPECT_EQ(tx.error().code, Node::E_INSUFFICIENT_FUNDS);
  EXPECT_DOUBLE_EQ(node.getBalance().value(), 10);
  EXPECT_EQ(node.getPendingCount(), 0u);
}

TEST_F(NodeTest, SendToMalformedAddressKeepsBalance) {
  Node node;
  ASSERT_TRUE(node.init(makeConfig("a")).isOk());
  ASSERT_TRUE(node.initGenesis(10).isOk());

  for (const char *receiver : { "\xff", "not-an-address" }) {
    auto tx = node.send(receiver, 4);
    ASSERT_TRUE(tx.isError());
    EXPECT_EQ(tx.error().code, Node::E_BUILD);
  }
  EXPECT_DOUBLE_EQ(node.getBalance().value(), 10);
  EXPECT_EQ(node.getPendingCount(), 0u);
}

TEST_F(NodeTest, SubmitRejectsDuplicatesConflictsAndForgeries) {
  Node node;
  ASSERT_TRUE(node.init(makeConfig("a")).isOk());
  ASSERT_TRUE(node.initGenesis(10).isOk());

  auto tx = node.send(newAddress(), 4);
  ASSERT_TRUE(tx.isOk()) << tx.error().message;

  EXPECT_EQ(node.submit(tx.value()).error().code, Node::E_DUPLICATE);

  Transaction doubleSpend =
      forge(node.getWallet(), tx.value().inputs, newAddress(), 10);
  EXPECT_EQ(node.submit(doubleSpend).error().code, Node::E_CONFLICT);

  Transaction tampered = tx.value();
  tampered.outputs[0].amount = 5;
  tampered.outputs[1].amount = 5;
  EXPECT_EQ(node.submit(tampered).error().code, Node::E_REJECTED);

  Transaction issuance;
  Output output;
  output.receiverAddress = node.getWallet().getAddress();
  output.amount = 1000;
  issuance.outputs.push_back(output);
  issuance.transactionId = issuance.computeId().value();
  EXPECT_EQ(node.submit(issuance).error().code, Node::E_REJECTED);

  EXPECT_EQ(node.getPendingCount(), 1u);
}

TEST_F(NodeTest, PendingPoolSurvivesRestart) {
  Node::Config config = makeConfig("a");
  std::string txId;
  {
    Node node;
    ASSERT_TRUE(node.init(config).isOk());
    ASSERT_TRUE(node.initGenesis(10).isOk());
    auto tx = node.send(newAddress(), 3);
    ASSERT_TRUE(tx.isOk()) << tx.error().message;
    txId = tx.value().transactionId;
    config = node.getConfig();
  }

  Node node;
  auto result = node.init(config);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(node.getPendingCount(), 1u);
  EXPECT_DOUBLE_EQ(node.getBalance().value(), 0);

  auto block = node.mine();
  ASSERT_TRUE(block.isOk()) << block.error().message;
  EXPECT_NE(block.value().block.findTransaction(txId), nullptr);
  EXPECT_DOUBLE_EQ(node.getBalance().value(), 7);
}

TEST_F(NodeTest, RestartReleasesReservationsWithoutPendingTransaction) {
  Node::Config config = makeConfig("a");
  {
    Node node;
    ASSERT_TRUE(node.init(config).isOk());
    ASSERT_TRUE(node.initGenesis(10).isOk());
    config = node.getConfig();
  }
  {
    // A send that stopped after reserving its inputs, before pooling them
    FileLedgerStore store;
    ASSERT_TRUE(store.open(config.workDir, config.difficulties).isOk());
    TransactionBuilder builder(store);
    auto outputs = builder.addOutput(Wallet::fromKeys(config.privateKey).value().getAddress(),
                                     newAddress(), 6);
    ASSERT_TRUE(outputs.isOk()) << outputs.error().message;
    EXPECT_DOUBLE_EQ(store.getBalance().value(), 0);
  }

  Node node;
  auto result = node.init(config);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(node.getPendingCount(), 0u);
  EXPECT_DOUBLE_EQ(node.getBalance().value(), 10);

  auto tx = node.send(newAddress(), 10);
  ASSERT_TRUE(tx.isOk()) << tx.error().message;
}

TEST_F(NodeTest, ReceivedBlocksCreditPeer) {
  Node alice;
  Node bob;
  ASSERT_TRUE(alice.init(makeConfig("alice")).isOk());
  ASSERT_TRUE(bob.init(makeConfig("bob")).isOk());

  auto genesis = alice.initGenesis(50);
  ASSERT_TRUE(genesis.isOk()) << genesis.error().message;
  auto accepted = bob.receiveBlock(genesis.value());
  ASSERT_TRUE(accepted.isOk()) << accepted.error().message;
  EXPECT_TRUE(accepted.value().valid) << accepted.value().reason;
  EXPECT_DOUBLE_EQ(bob.getBalance().value(), 0);

  auto tx = alice.send(bob.getWallet().getAddress(), 20);
  ASSERT_TRUE(tx.isOk()) << tx.error().message;
  // Bob hears about the transaction before the block
  ASSERT_TRUE(bob.submit(tx.value()).isOk());

  auto block = alice.mine();
  ASSERT_TRUE(block.isOk()) << block.error().message;
  accepted = bob.receiveBlock(block.value());
  ASSERT_TRUE(accepted.isOk()) << accepted.error().message;
  EXPECT_TRUE(accepted.value().valid) << accepted.value().reason;

  EXPECT_EQ(bob.getTip().value(), block.value().blockId);
  EXPECT_DOUBLE_EQ(bob.getBalance().value(), 20);
  EXPECT_EQ(bob.getPendingCount(), 0u);
  EXPECT_DOUBLE_EQ(alice.getBalance().value(), 30);

  // Receiving the tip again is harmless
  accepted = bob.receiveBlock(block.value());
  ASSERT_TRUE(accepted.isOk());
  EXPECT_TRUE(accepted.value().valid);
  EXPECT_DOUBLE_EQ(bob.getBalance().value(), 20);
}

TEST_F(NodeTest, InvalidReceivedBlockIsReported) {
  Node alice;
  Node bob;
  ASSERT_TRUE(alice.init(makeConfig("alice")).isOk());
  ASSERT_TRUE(bob.init(makeConfig("bob")).isOk());

  auto genesis = alice.initGenesis(50);
  ASSERT_TRUE(genesis.isOk());
  ChainNode forged = genesis.value();
  forged.blockId = std::string(64, 'e');

  auto result = bob.receiveBlock(forged);
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_FALSE(result.value().valid);
  EXPECT_EQ(bob.getTip().value(), "");
}

TEST_F(NodeTest, ReceivedBlockDropsInvalidatedPending) {
  Node alice;
  ASSERT_TRUE(alice.init(makeConfig("alice")).isOk());
  auto genesis = alice.initGenesis(50);
  ASSERT_TRUE(genesis.isOk());

  // Same wallet on another node spends the same output first
  Node::Config twinConfig = makeConfig("twin");
  twinConfig.privateKey = alice.getConfig().privateKey;
  Node twin;
  ASSERT_TRUE(twin.init(twinConfig).isOk());
  ASSERT_TRUE(twin.receiveBlock(genesis.value()).value().valid);
  EXPECT_DOUBLE_EQ(twin.getBalance().value(), 50);

  auto pending = alice.send(newAddress(), 10);
  ASSERT_TRUE(pending.isOk()) << pending.error().message;
  ASSERT_TRUE(twin.send(newAddress(), 10).isOk());
  auto block = twin.mine();
  ASSERT_TRUE(block.isOk()) << block.error().message;

  auto accepted = alice.receiveBlock(block.value());
  ASSERT_TRUE(accepted.isOk()) << accepted.error().message;
  EXPECT_TRUE(accepted.value().valid) << accepted.value().reason;
  EXPECT_EQ(alice.getPendingCount(), 0u);
  EXPECT_DOUBLE_EQ(alice.getBalance().value(), 40);
}

TEST_F(NodeTest, CancelMiningWithoutSearchReturns) {
  Node node;
  ASSERT_TRUE(node.init(makeConfig("a")).isOk());
  node.cancelMining();
  ASSERT_TRUE(node.initGenesis(1).isOk());
}

class NodeConfigTest : public NodeTest {
protected:
  std::string writeConfig(const std::string &content) const {
    auto path = testDir_ / "config.json";
    std::ofstream file(path);
    file << content;
    return path.string();
  }
};

TEST_F(NodeConfigTest, LoadsDefaultsAndGeneratesKeys) {
  std::string path = writeConfig(R"({"workDir": "data"})");
  auto config = Node::loadConfig(path);
  ASSERT_TRUE(config.isOk()) << config.error().message;

  EXPECT_EQ(config.value().workDir, (testDir_ / "data").string());
  EXPECT_EQ(config.value().version, Node::DEFAULT_VERSION);
  EXPECT_EQ(config.value().difficulties.at("1.0"), Node::DEFAULT_DIFFICULTY);
  EXPECT_EQ(config.value().checkInterval, 1024u);
  EXPECT_FALSE(config.value().maxNonce.has_value());
  EXPECT_FALSE(config.value().autoMine);
  EXPECT_FALSE(config.value().privateKey.empty());

  // Generated keys were written back and are stable
  auto reloaded = Node::loadConfig(path);
  ASSERT_TRUE(reloaded.isOk()) << reloaded.error().message;
  EXPECT_EQ(reloaded.value().privateKey, config.value().privateKey);
  EXPECT_EQ(reloaded.value().publicKey, config.value().publicKey);
}

TEST_F(NodeConfigTest, ParsesAllFields) {
  Node::Config config;
  nlohmann::json j = nlohmann::json::parse(R"({
    "workDir": "/tmp/somewhere",
    "version": "2.0",
    "versions": {"1.0": {"difficulty": 3}, "2.0": {"difficulty": 4}},
    "mining": {"checkInterval": 8, "maxNonce": 1000, "auto": true},
    "logFile": "/tmp/node.log"
  })");
  auto parsed = config.ltsFromJson(j);
  ASSERT_TRUE(parsed.isOk()) << parsed.error().message;
  EXPECT_EQ(config.version, "2.0");
  EXPECT_EQ(config.difficulties.size(), 2u);
  EXPECT_EQ(config.difficulties.at("2.0"), 4u);
  EXPECT_EQ(config.checkInterval, 8u);
  EXPECT_EQ(config.maxNonce.value(), 1000u);
  EXPECT_TRUE(config.autoMine);
  EXPECT_EQ(config.logFile, "/tmp/node.log");

  Node::Config copy;
  ASSERT_TRUE(copy.ltsFromJson(config.ltsToJson()).isOk());
  EXPECT_EQ(copy.difficulties, config.difficulties);
  EXPECT_EQ(copy.maxNonce, config.maxNonce);
}

TEST_F(NodeConfigTest, RejectsBadFields) {
  const char *cases[] = {
    R"([])",
    R"({})",
    R"({"workDir": 5})",
    R"({"workDir": "d", "version": 1})",
    R"({"workDir": "d", "version": "3.0"})",
    R"({"workDir": "d", "versions": {"1.0": {"difficulty": 65}}})",
    R"({"workDir": "d", "versions": {"1.0": {"difficulty": -1}}})",
    R"({"workDir": "d", "wallet": {"privateKey": 7}})",
    R"({"workDir": "d", "wallet": {"publicKey": "abc"}})",
    R"({"workDir": "d", "mining": {"checkInterval": 0}})",
    R"({"workDir": "d", "mining": {"auto": "yes"}})",
    R"({"workDir": "d", "logFile": false})",
  };
  for (const char *text : cases) {
    Node::Config config;
    auto parsed = config.ltsFromJson(nlohmann::json::parse(text));
    ASSERT_TRUE(parsed.isError()) << text;
    EXPECT_EQ(parsed.error().code, Node::E_CONFIG) << text;
  }
}

TEST_F(NodeConfigTest, MissingFileIsConfigError) {
  auto config = Node::loadConfig((testDir_ / "missing.json").string());
  ASSERT_TRUE(config.isError());
  EXPECT_EQ(config.error().code, Node::E_CONFIG);
}

} // namespace pwl
