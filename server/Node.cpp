#include "Node.h"
#include "Logger.h"
#include "TransactionBuilder.h"
#include "Utilities.h"

#include <filesystem>
#include <set>
#include <vector>

namespace pwl {

// ============ Config methods ============

nlohmann::json Node::Config::ltsToJson() const {
  nlohmann::json j;
  j["workDir"] = workDir;
  j["version"] = version;
  j["versions"] = nlohmann::json::object();
  for (const auto &[v, difficulty] : difficulties) {
    j["versions"][v]["difficulty"] = difficulty;
  }
  j["wallet"]["privateKey"] = privateKey;
  j["wallet"]["publicKey"] = publicKey;
  j["mining"]["checkInterval"] = checkInterval;
  if (maxNonce) {
    j["mining"]["maxNonce"] = *maxNonce;
  }
  j["mining"]["auto"] = autoMine;
  if (!logFile.empty()) {
    j["logFile"] = logFile;
  }
  return j;
}

Node::Roe<void> Node::Config::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Configuration must be a JSON object");
    }

    if (!jd.contains("workDir") || !jd["workDir"].is_string() ||
        jd["workDir"].get<std::string>().empty()) {
      return Error(E_CONFIG, "Field 'workDir' must be a non-empty string");
    }
    workDir = jd["workDir"].get<std::string>();

    if (jd.contains("version")) {
      if (!jd["version"].is_string()) {
        return Error(E_CONFIG, "Field 'version' must be a string");
      }
      version = jd["version"].get<std::string>();
    }

    if (jd.contains("versions")) {
      if (!jd["versions"].is_object()) {
        return Error(E_CONFIG, "Field 'versions' must be an object");
      }
      difficulties.clear();
      for (auto it = jd["versions"].begin(); it != jd["versions"].end(); ++it) {
        const auto &entry = it.value();
        if (!entry.is_object() || !entry.contains("difficulty") ||
            !entry["difficulty"].is_number_unsigned()) {
          return Error(E_CONFIG, "Field 'versions." + it.key() +
                                     ".difficulty' must be a non-negative integer");
        }
        uint64_t difficulty = entry["difficulty"].get<uint64_t>();
        if (difficulty > MAX_DIFFICULTY) {
          return Error(E_CONFIG, "Field 'versions." + it.key() +
                                     ".difficulty' must be at most " +
                                     std::to_string(MAX_DIFFICULTY));
        }
        difficulties[it.key()] = static_cast<uint32_t>(difficulty);
      }
    }
    if (difficulties.count(version) == 0) {
      return Error(E_CONFIG, "Version '" + version + "' has no difficulty in 'versions'");
    }

    if (jd.contains("wallet")) {
      const auto &jWallet = jd["wallet"];
      if (!jWallet.is_object()) {
        return Error(E_CONFIG, "Field 'wallet' must be an object");
      }
      for (const char *field : { "privateKey", "publicKey" }) {
        if (jWallet.contains(field) && !jWallet[field].is_string()) {
          return Error(E_CONFIG, std::string("Field 'wallet.") + field +
                                     "' must be a string");
        }
      }
      privateKey = jWallet.value("privateKey", "");
      publicKey = jWallet.value("publicKey", "");
      if (privateKey.empty() && !publicKey.empty()) {
        return Error(E_CONFIG, "Field 'wallet.privateKey' is required with 'wallet.publicKey'");
      }
    }

    if (jd.contains("mining")) {
      const auto &jMining = jd["mining"];
      if (!jMining.is_object()) {
        return Error(E_CONFIG, "Field 'mining' must be an object");
      }
      if (jMining.contains("checkInterval")) {
        if (!jMining["checkInterval"].is_number_unsigned() ||
            jMining["checkInterval"].get<uint64_t>() == 0) {
          return Error(E_CONFIG, "Field 'mining.checkInterval' must be a positive integer");
        }
        checkInterval = jMining["checkInterval"].get<uint64_t>();
      }
      if (jMining.contains("maxNonce")) {
        if (!jMining["maxNonce"].is_number_unsigned()) {
          return Error(E_CONFIG, "Field 'mining.maxNonce' must be a non-negative integer");
        }
        maxNonce = jMining["maxNonce"].get<uint64_t>();
      }
      if (jMining.contains("auto")) {
        if (!jMining["auto"].is_boolean()) {
          return Error(E_CONFIG, "Field 'mining.auto' must be a boolean");
        }
        autoMine = jMining["auto"].get<bool>();
      }
    }

    if (jd.contains("logFile")) {
      if (!jd["logFile"].is_string()) {
        return Error(E_CONFIG, "Field 'logFile' must be a string");
      }
      logFile = jd["logFile"].get<std::string>();
    }

    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG, "Failed to parse configuration: " + std::string(e.what()));
  }
}

Node::Roe<Node::Config> Node::loadConfig(const std::string &path) {
  auto jsonResult = utl::loadJsonFile(path);
  if (!jsonResult) {
    return Error(E_CONFIG, "Failed to load config file: " + jsonResult.error().message);
  }
  nlohmann::json jd = jsonResult.value();

  Config config;
  auto parsed = config.ltsFromJson(jd);
  if (!parsed) {
    return Error(E_CONFIG, path + ": " + parsed.error().message);
  }

  if (config.privateKey.empty()) {
    auto wallet = Wallet::generate();
    if (!wallet) {
      return Error(E_WALLET, wallet.error().message);
    }
    config.privateKey = wallet.value().getPrivateKey();
    config.publicKey = wallet.value().getPublicKey();
    jd["wallet"]["privateKey"] = config.privateKey;
    jd["wallet"]["publicKey"] = config.publicKey;
    auto written = utl::writeFileAtomic(path, jd.dump(2) + "\n");
    if (!written) {
      return Error(E_CONFIG, "Failed to save generated keys: " + written.error().message);
    }
    logging::getLogger("node").info << "Generated new key pair in " << path;
  }

  // Relative paths are taken from the config file's directory
  std::filesystem::path configDir = std::filesystem::path(path).parent_path();
  for (std::string *field : { &config.workDir, &config.logFile }) {
    if (!field->empty() && std::filesystem::path(*field).is_relative()) {
      *field = (configDir / *field).string();
    }
  }
  return config;
}

// ============ Node methods ============

Node::Node() : Module("node") {
  store_.redirectLogger(log().getFullName());
  miner_.redirectLogger(log().getFullName());
  blockVerifier_.redirectLogger(log().getFullName());
  txVerifier_.redirectLogger(log().getFullName());
}

Node::Roe<void> Node::init(const Config &config) {
  if (initialized_) {
    return Error(E_CONFIG, "Node is already initialized");
  }
  config_ = config;

  if (!config_.logFile.empty()) {
    logging::getRootLogger().addFileHandler(config_.logFile);
  }

  if (config_.privateKey.empty()) {
    auto generated = Wallet::generate();
    if (!generated) {
      return Error(E_WALLET, generated.error().message);
    }
    wallet_ = generated.value();
    config_.privateKey = wallet_.getPrivateKey();
    config_.publicKey = wallet_.getPublicKey();
  } else {
    auto loaded = Wallet::fromKeys(config_.privateKey, config_.publicKey);
    if (!loaded) {
      return Error(E_WALLET, "Invalid wallet keys: " + loaded.error().message);
    }
    wallet_ = loaded.value();
    config_.publicKey = wallet_.getPublicKey();
  }

  auto opened = store_.open(config_.workDir, config_.difficulties);
  if (!opened) {
    return Error(E_STORE, "Failed to open ledger store: " + opened.error().message);
  }
  for (const auto &[version, difficulty] : config_.difficulties) {
    auto current = store_.getDifficulty(version);
    if (current && current.value() == difficulty) {
      continue;
    }
    auto updated = store_.setDifficulty(version, difficulty);
    if (!updated) {
      return Error(E_STORE, updated.error().message);
    }
  }
  if (!store_.getDifficulty(config_.version)) {
    return Error(E_CONFIG, "Version '" + config_.version + "' has no difficulty");
  }

  std::error_code ec;
  std::filesystem::create_directories(
      std::filesystem::path(config_.workDir) / DIR_PENDING, ec);
  if (ec) {
    return Error(E_STORE, "Failed to create pending directory: " + ec.message());
  }
  auto loaded = loadPending();
  if (!loaded) {
    return loaded;
  }

  initialized_ = true;
  log().info << "Node initialized";
  log().info << "  Work dir: " << config_.workDir;
  log().info << "  Address: " << wallet_.getAddress();
  log().info << "  Version: " << config_.version << " (difficulty "
             << store_.getDifficulty(config_.version).value() << ")";
  log().info << "  Pending transactions: " << getPendingCount();
  return {};
}

Node::Roe<double> Node::getBalance() const {
  auto balance = store_.getBalance();
  if (!balance) {
    return Error(E_STORE, balance.error().message);
  }
  return balance.value();
}

Node::Roe<std::string> Node::getTip() const {
  auto tip = store_.getTip();
  if (!tip) {
    return Error(E_STORE, tip.error().message);
  }
  return tip.value();
}

Node::Roe<ChainNode> Node::getBlock(const std::string &blockId) const {
  auto block = store_.getBlock(blockId);
  if (!block) {
    if (block.error().code == LedgerStore::E_NOT_FOUND) {
      return Error(E_NOT_FOUND, block.error().message);
    }
    return Error(E_STORE, block.error().message);
  }
  return block.value();
}

size_t Node::getPendingCount() const {
  std::lock_guard<std::mutex> lock(poolMutex_);
  return pending_.size();
}

MiningOptions Node::miningOptions() const {
  MiningOptions options;
  options.checkInterval = config_.checkInterval;
  options.maxNonce = config_.maxNonce;
  options.cancel = &cancel_;
  return options;
}

std::string Node::pendingPath(const std::string &transactionId) const {
  return (std::filesystem::path(config_.workDir) / DIR_PENDING /
          (transactionId + ".json"))
      .string();
}

Node::Roe<void> Node::registerOwned(const ChainNode &node) {
  auto registered = store_.registerOwnedOutputs(node, wallet_.getAddress());
  if (!registered) {
    return Error(E_STORE, registered.error().message);
  }
  if (registered.value().count > 0) {
    log().info << "Received " << registered.value().count << " outputs totalling "
               << registered.value().total << " in block " << node.blockId;
  }
  return {};
}

Node::Roe<ChainNode> Node::initGenesis(double amount) {
  if (!initialized_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }
  std::lock_guard<std::mutex> mining(miningMutex_);

  auto tip = getTip();
  if (!tip) {
    return tip.error();
  }
  if (!tip.value().empty()) {
    return Error(E_CHAIN_EXISTS, "Chain already has a genesis block");
  }

  TransactionBuilder issuer(store_);
  issuer.redirectLogger(log().getFullName());
  auto issued = issuer.addIssuance(wallet_.getAddress(), amount);
  if (!issued) {
    return Error(E_BUILD, issued.error().message);
  }
  auto tx = issuer.finalize(wallet_.getPrivateKey(), wallet_.getPublicKey());
  if (!tx) {
    return Error(E_BUILD, tx.error().message);
  }

  Block block("", config_.version);
  if (!block.addTransaction(tx.value())) {
    return Error(E_BUILD, "Issuance cannot be added to the genesis block");
  }
  auto node = miner_.mine(block, miningOptions());
  if (!node) {
    if (node.error().code == BlockMiner::E_CANCELLED) {
      return Error(E_CANCELLED, node.error().message);
    }
    return Error(E_MINING, node.error().message);
  }

  auto registered = registerOwned(node.value());
  if (!registered) {
    return registered.error();
  }
  log().info << "Genesis block " << node.value().blockId << " issued " << amount;
  return node.value();
}

Node::Roe<void> Node::checkAdmissible(const Transaction &tx) const {
  if (pending_.count(tx.transactionId) > 0) {
    return Error(E_DUPLICATE, "Transaction " + tx.transactionId + " is already pending");
  }
  if (tx.isIssuance()) {
    return Error(E_REJECTED, "Issuance is only allowed in the genesis block");
  }

  auto verified = txVerifier_.verify(tx);
  if (!verified) {
    return Error(E_STORE, verified.error().message);
  }
  if (!verified.value().authentic) {
    std::string message = "Transaction " + tx.transactionId + " is not authentic";
    if (verified.value().offender) {
      message += ": input " + verified.value().offender->key() + " is invalid";
    }
    return Error(E_REJECTED, message);
  }

  for (const auto &[pendingId, pendingTx] : pending_) {
    for (const auto &input : tx.inputs) {
      for (const auto &used : pendingTx.inputs) {
        if (input.sameOutput(used)) {
          return Error(E_CONFLICT, "Input " + input.key() +
                                       " is already spent by pending transaction " +
                                       pendingId);
        }
      }
    }
  }
  return {};
}

Node::Roe<void> Node::savePending(const Transaction &tx) const {
  auto written = utl::writeFileAtomic(pendingPath(tx.transactionId), tx.toJson().dump(2));
  if (!written) {
    return Error(E_STORE, "Failed to save pending transaction: " + written.error().message);
  }
  return {};
}

void Node::removePending(const std::string &transactionId) {
  pending_.erase(transactionId);
  std::error_code ec;
  std::filesystem::remove(pendingPath(transactionId), ec);
  if (ec) {
    log().warning << "Failed to remove pending file for " << transactionId << ": "
                  << ec.message();
  }
}

Node::Roe<void> Node::loadPending() {
  std::lock_guard<std::mutex> lock(poolMutex_);
  std::filesystem::path dir = std::filesystem::path(config_.workDir) / DIR_PENDING;
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end;
       it.increment(ec)) {
    if (it->path().extension() == ".json") {
      files.push_back(it->path());
    }
  }
  if (ec) {
    return Error(E_STORE, "Failed to list pending transactions: " + ec.message());
  }

  for (const auto &path : files) {
    auto json = utl::loadJsonFile(path.string());
    if (!json) {
      return Error(E_STORE, json.error().message);
    }
    auto tx = Transaction::fromJson(json.value());
    if (!tx) {
      return Error(E_STORE, path.string() + ": " + tx.error().message);
    }
    if (tx.value().transactionId != path.stem().string()) {
      return Error(E_STORE, path.string() + ": transaction id does not match file name");
    }

    auto admissible = checkAdmissible(tx.value());
    if (!admissible) {
      if (admissible.error().code == E_STORE) {
        return admissible;
      }
      // Spent or invalidated while the node was down
      log().warning << "Dropping pending transaction " << tx.value().transactionId
                    << ": " << admissible.error().message;
      auto released = store_.release(tx.value().inputs);
      if (!released) {
        log().error << "Failed to release inputs: " << released.error().message;
      }
      removePending(tx.value().transactionId);
      continue;
    }
    pending_[tx.value().transactionId] = tx.value();
  }
  return releaseOrphanedReservations();
}

Node::Roe<void> Node::releaseOrphanedReservations() {
  auto reserved = store_.getReserved();
  if (!reserved) {
    return Error(E_STORE, reserved.error().message);
  }

  std::set<std::string> claimed;
  for (const auto &[txId, tx] : pending_) {
    for (const auto &input : tx.inputs) {
      claimed.insert(input.key());
    }
  }
  std::vector<InputRef> orphaned;
  for (const auto &ref : reserved.value()) {
    if (claimed.count(ref.key()) == 0) {
      orphaned.push_back(ref);
    }
  }
  if (orphaned.empty()) {
    return {};
  }

  // Reserved by a send that never reached the pool
  auto released = store_.release(orphaned);
  if (!released) {
    return Error(E_STORE, released.error().message);
  }
  log().warning << "Released " << orphaned.size()
                << " reserved outputs not used by any pending transaction";
  return {};
}

Node::Roe<void> Node::submit(const Transaction &tx) {
  if (!initialized_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }
  std::lock_guard<std::mutex> lock(poolMutex_);
  auto admissible = checkAdmissible(tx);
  if (!admissible) {
    log().warning << "Rejected transaction " << tx.transactionId << ": "
                  << admissible.error().message;
    return admissible;
  }
  auto saved = savePending(tx);
  if (!saved) {
    return saved;
  }
  pending_[tx.transactionId] = tx;
  log().info << "Pending transaction " << tx.transactionId << " (" << tx.outputTotal()
             << " in " << tx.outputs.size() << " outputs)";
  return {};
}

Node::Roe<Transaction> Node::send(const std::string &receiverAddress, double amount) {
  if (!initialized_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }

  TransactionBuilder builder(store_);
  builder.redirectLogger(log().getFullName());
  auto outputs = builder.addOutput(wallet_.getAddress(), receiverAddress, amount);
  if (!outputs) {
    if (outputs.error().code == TransactionBuilder::E_INSUFFICIENT_FUNDS) {
      return Error(E_INSUFFICIENT_FUNDS, outputs.error().message);
    }
    return Error(E_BUILD, outputs.error().message);
  }

  auto tx = builder.finalize(wallet_.getPrivateKey(), wallet_.getPublicKey());
  if (!tx) {
    auto discarded = builder.discard();
    if (!discarded) {
      log().error << "Failed to release inputs: " << discarded.error().message;
    }
    return Error(E_BUILD, tx.error().message);
  }

  auto submitted = submit(tx.value());
  if (!submitted) {
    auto released = store_.release(tx.value().inputs);
    if (!released) {
      log().error << "Failed to release inputs: " << released.error().message;
    }
    return submitted.error();
  }
  return tx.value();
}

Node::Roe<ChainNode> Node::mine() {
  if (!initialized_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }
  std::lock_guard<std::mutex> mining(miningMutex_);

  auto tip = getTip();
  if (!tip) {
    return tip.error();
  }
  if (tip.value().empty()) {
    return Error(E_NOT_INITIALIZED, "Chain has no genesis block");
  }

  Block block(tip.value(), config_.version);
  {
    std::lock_guard<std::mutex> lock(poolMutex_);
    std::vector<std::string> stale;
    for (const auto &[txId, tx] : pending_) {
      auto verified = txVerifier_.verify(tx);
      if (!verified) {
        return Error(E_STORE, verified.error().message);
      }
      if (!verified.value().authentic || !block.addTransaction(tx)) {
        stale.push_back(txId);
      }
    }
    for (const auto &txId : stale) {
      log().warning << "Dropping pending transaction " << txId << ": no longer valid";
      auto released = store_.release(pending_.at(txId).inputs);
      if (!released) {
        log().error << "Failed to release inputs: " << released.error().message;
      }
      removePending(txId);
    }
  }
  if (block.getData().empty()) {
    return Error(E_EMPTY_POOL, "No pending transactions to mine");
  }

  auto node = miner_.mine(block, miningOptions());
  if (!node) {
    if (node.error().code == BlockMiner::E_CANCELLED) {
      return Error(E_CANCELLED, node.error().message);
    }
    return Error(E_MINING, node.error().message);
  }

  auto registered = registerOwned(node.value());
  if (!registered) {
    return registered.error();
  }
  {
    std::lock_guard<std::mutex> lock(poolMutex_);
    for (const auto &[txId, tx] : node.value().block.getData()) {
      removePending(txId);
    }
  }
  return node.value();
}

void Node::prunePending(const ChainNode &node) {
  std::lock_guard<std::mutex> lock(poolMutex_);
  std::vector<std::string> included;
  std::vector<std::string> stale;
  for (const auto &[txId, tx] : pending_) {
    if (node.block.findTransaction(txId)) {
      included.push_back(txId);
      continue;
    }
    auto verified = txVerifier_.verify(tx);
    if (!verified) {
      log().error << "Cannot recheck pending transaction " << txId << ": "
                  << verified.error().message;
      continue;
    }
    if (!verified.value().authentic) {
      stale.push_back(txId);
    }
  }

  for (const auto &txId : included) {
    removePending(txId);
  }
  for (const auto &txId : stale) {
    log().warning << "Dropping pending transaction " << txId << ": invalidated by block "
                  << node.blockId;
    auto released = store_.release(pending_.at(txId).inputs);
    if (!released) {
      log().error << "Failed to release inputs: " << released.error().message;
    }
    removePending(txId);
  }
}

Node::Roe<BlockVerifier::Result> Node::receiveBlock(const ChainNode &node) {
  if (!initialized_) {
    return Error(E_NOT_INITIALIZED, "Node is not initialized");
  }

  auto mining = interruptMining();

  auto result = blockVerifier_.verify(node);
  if (!result) {
    return Error(E_STORE, result.error().message);
  }
  if (!result.value().valid) {
    return result.value();
  }

  auto registered = registerOwned(node);
  if (!registered) {
    return registered.error();
  }
  prunePending(node);
  return result.value();
}

void Node::cancelMining() { interruptMining(); }

std::unique_lock<std::mutex> Node::interruptMining() {
  {
    std::lock_guard<std::mutex> lock(cancelMutex_);
    ++cancelWaiters_;
    cancel_ = true;
  }
  std::unique_lock<std::mutex> mining(miningMutex_);
  {
    // The flag stays up until the last waiting caller has the mining lock
    std::lock_guard<std::mutex> lock(cancelMutex_);
    if (--cancelWaiters_ == 0) {
      cancel_ = false;
    }
  }
  return mining;
}

} // namespace pwl
