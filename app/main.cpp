#include "Logger.h"
#include "MiningService.h"
#include "Node.h"
#include "Utilities.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>

namespace {
std::atomic<bool> g_running{ true };
std::mutex g_mutex;
std::condition_variable g_cv;

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running = false;
    g_cv.notify_one();
  }
}

void printBlock(const pwl::ChainNode &node) {
  std::cout << node.toJson().dump(2) << "\n";
}

int openNode(pwl::Node &node, const std::string &configPath) {
  auto config = pwl::Node::loadConfig(configPath);
  if (!config) {
    std::cerr << "Error: " << config.error().message << "\n";
    return 1;
  }
  auto result = node.init(config.value());
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  return 0;
}

int runKeygen() {
  auto wallet = pwl::Wallet::generate();
  if (!wallet) {
    std::cerr << "Error: " << wallet.error().message << "\n";
    return 1;
  }
  std::cout << wallet.value().toJson().dump(2) << "\n";
  return 0;
}

int runInit(pwl::Node &node, double amount) {
  auto genesis = node.initGenesis(amount);
  if (!genesis) {
    std::cerr << "Error: " << genesis.error().message << "\n";
    return 1;
  }
  std::cout << "Genesis block: " << genesis.value().blockId << "\n";
  return 0;
}

int runSend(pwl::Node &node, const std::string &receiver, double amount) {
  auto tx = node.send(receiver, amount);
  if (!tx) {
    std::cerr << "Error: " << tx.error().message << "\n";
    return 1;
  }
  std::cout << "Transaction pending: " << tx.value().transactionId << "\n";
  return 0;
}

int runSubmit(pwl::Node &node, const std::string &file) {
  auto doc = pwl::utl::loadJsonFile(file);
  if (!doc) {
    std::cerr << "Error: " << doc.error().message << "\n";
    return 1;
  }
  auto tx = pwl::Transaction::fromJson(doc.value());
  if (!tx) {
    std::cerr << "Error: Invalid transaction file: " << tx.error().message << "\n";
    return 1;
  }
  auto result = node.submit(tx.value());
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  std::cout << "Transaction pending: " << tx.value().transactionId << "\n";
  return 0;
}

int runMine(pwl::Node &node) {
  auto mined = node.mine();
  if (!mined) {
    std::cerr << "Error: " << mined.error().message << "\n";
    return 1;
  }
  std::cout << "Mined block: " << mined.value().blockId << "\n";
  return 0;
}

int runShowBlock(pwl::Node &node, const std::string &blockId) {
  auto block = node.getBlock(blockId);
  if (!block) {
    std::cerr << "Error: " << block.error().message << "\n";
    return 1;
  }
  printBlock(block.value());
  return 0;
}

int runVerifyBlock(pwl::Node &node, const std::string &file) {
  auto doc = pwl::utl::loadJsonFile(file);
  if (!doc) {
    std::cerr << "Error: " << doc.error().message << "\n";
    return 1;
  }
  auto block = pwl::ChainNode::fromJson(doc.value());
  if (!block) {
    std::cerr << "Error: Invalid block file: " << block.error().message << "\n";
    return 1;
  }
  auto result = node.receiveBlock(block.value());
  if (!result) {
    std::cerr << "Error: " << result.error().message << "\n";
    return 1;
  }
  if (!result.value().valid) {
    std::cout << "Rejected: " << result.value().reason << "\n";
    return 2;
  }
  std::cout << "Accepted: " << block.value().blockId << "\n";
  return 0;
}

int runService(pwl::Node &node) {
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  pwl::MiningService service(node);
  auto started = service.start();
  if (!started) {
    std::cerr << "Error: " << started.error().message << "\n";
    return 1;
  }
  std::cout << "Mining pending transactions, press Ctrl+C to stop...\n";

  std::unique_lock<std::mutex> lock(g_mutex);
  g_cv.wait(lock, [] { return !g_running.load(); });

  service.stop();
  std::cout << "Mined " << service.getMinedCount() << " blocks\n";
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{ "powledger - proof-of-work ledger node" };
  app.require_subcommand(1);

  bool debug = false;
  app.add_flag("--debug", debug, "Enable debug logging");

  std::string configPath = "config.json";
  app.add_option("-c,--config", configPath, "Node configuration file")
      ->capture_default_str();

  auto *keygen = app.add_subcommand("keygen", "Generate a new ECDSA P-256 key pair");

  auto *init_cmd = app.add_subcommand("init", "Mine the genesis block");
  double genesisAmount = 1000;
  init_cmd->add_option("-a,--amount", genesisAmount, "Amount issued to this node")
      ->capture_default_str();

  auto *balance_cmd = app.add_subcommand("balance", "Show spendable balance");
  auto *address_cmd = app.add_subcommand("address", "Show this node's address");

  auto *send_cmd = app.add_subcommand("send", "Pay an address from this node's wallet");
  std::string receiver;
  double amount = 0;
  send_cmd->add_option("receiver", receiver, "Receiver address (base64 public key)")
      ->required();
  send_cmd->add_option("amount", amount, "Amount to transfer")->required();

  auto *submit_cmd = app.add_subcommand("submit-tx", "Add a signed transaction file to the pool");
  std::string submitFile;
  submit_cmd->add_option("file", submitFile, "Transaction JSON file")
      ->required()
      ->check(CLI::ExistingFile);

  auto *mine_cmd = app.add_subcommand("mine", "Mine pending transactions into a block");
  auto *run_cmd = app.add_subcommand("run", "Keep mining until interrupted");
  auto *tip_cmd = app.add_subcommand("tip", "Show the id of the last block");
  auto *pending_cmd = app.add_subcommand("pending", "Show the number of pending transactions");

  auto *show_cmd = app.add_subcommand("show-block", "Print a block by id");
  std::string blockId;
  show_cmd->add_option("blockId", blockId, "Block ID")->required();

  auto *verify_cmd = app.add_subcommand("verify-block", "Verify and accept a block file");
  std::string blockFile;
  verify_cmd->add_option("file", blockFile, "Block JSON file")
      ->required()
      ->check(CLI::ExistingFile);

  CLI11_PARSE(app, argc, argv);

  pwl::logging::getRootLogger().setLevel(debug ? pwl::logging::Level::DEBUG
                                               : pwl::logging::Level::WARNING);

  if (keygen->parsed()) {
    return runKeygen();
  }

  pwl::Node node;
  if (openNode(node, configPath) != 0) {
    return 1;
  }

  if (init_cmd->parsed()) {
    return runInit(node, genesisAmount);
  }
  if (balance_cmd->parsed()) {
    auto balance = node.getBalance();
    if (!balance) {
      std::cerr << "Error: " << balance.error().message << "\n";
      return 1;
    }
    std::cout << balance.value() << "\n";
    return 0;
  }
  if (address_cmd->parsed()) {
    std::cout << node.getWallet().getAddress() << "\n";
    return 0;
  }
  if (send_cmd->parsed() || submit_cmd->parsed()) {
    int rc = send_cmd->parsed() ? runSend(node, receiver, amount)
                                : runSubmit(node, submitFile);
    if (rc != 0 || !node.getConfig().autoMine) {
      return rc;
    }
    return runMine(node);
  }
  if (mine_cmd->parsed()) {
    return runMine(node);
  }
  if (run_cmd->parsed()) {
    return runService(node);
  }
  if (tip_cmd->parsed()) {
    auto tip = node.getTip();
    if (!tip) {
      std::cerr << "Error: " << tip.error().message << "\n";
      return 1;
    }
    std::cout << (tip.value().empty() ? "(empty chain)" : tip.value()) << "\n";
    return 0;
  }
  if (pending_cmd->parsed()) {
    std::cout << node.getPendingCount() << "\n";
    return 0;
  }
  if (show_cmd->parsed()) {
    return runShowBlock(node, blockId);
  }
  if (verify_cmd->parsed()) {
    return runVerifyBlock(node, blockFile);
  }
  return 0;
}
