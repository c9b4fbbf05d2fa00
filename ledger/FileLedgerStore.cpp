#include "FileLedgerStore.h"
#include "Utilities.h"

namespace pwl {

namespace {

bool isBlockId(const std::string &id) {
  if (id.size() != 64) {
    return false;
  }
  for (char c : id) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}

} // namespace

FileLedgerStore::FileLedgerStore()
    : MemoryLedgerStore("store", std::map<std::string, uint32_t>{}) {}

FileLedgerStore::Roe<void>
FileLedgerStore::open(const std::string &workDir,
                      const std::map<std::string, uint32_t> &defaultDifficulties) {
  std::filesystem::path root(workDir);
  std::error_code ec;
  std::filesystem::create_directories(root / DIR_BLOCKS, ec);
  if (ec) {
    return Error(E_STORE_UNAVAILABLE,
                 "Failed to create " + (root / DIR_BLOCKS).string() + ": " + ec.message());
  }
  workDir_ = root;

  std::string tip;
  std::map<std::string, uint32_t> difficulties = defaultDifficulties;
  if (std::filesystem::exists(workDir_ / FILE_INFO)) {
    auto loaded = loadInfo(tip, difficulties);
    if (!loaded) {
      workDir_.clear();
      return loaded;
    }
  } else {
    auto saved = saveInfo(tip, difficulties);
    if (!saved) {
      workDir_.clear();
      return saved;
    }
    log().info << "Initialized ledger store in " << workDir_.string();
  }

  std::map<std::string, ChainNode> blocks;
  std::vector<UnspentEntry> unspent;
  auto loadedBlocks = loadBlocks(blocks);
  if (!loadedBlocks) {
    workDir_.clear();
    return loadedBlocks;
  }
  auto loadedUnspent = loadUnspent(unspent);
  if (!loadedUnspent) {
    workDir_.clear();
    return loadedUnspent;
  }

  if (!tip.empty() && blocks.count(tip) == 0) {
    workDir_.clear();
    return Error(E_STORE_UNAVAILABLE, "Chain tip " + tip + " has no block file");
  }

  log().info << "Opened ledger store: " << blocks.size() << " blocks, "
             << unspent.size() << " unspent outputs, tip '" << tip << "'";
  resetState(std::move(blocks), std::move(tip), std::move(difficulties),
             std::move(unspent));
  return {};
}

FileLedgerStore::Roe<void>
FileLedgerStore::loadInfo(std::string &tip,
                          std::map<std::string, uint32_t> &difficulties) const {
  auto info = utl::loadJsonFile((workDir_ / FILE_INFO).string());
  if (!info) {
    return Error(E_STORE_UNAVAILABLE, info.error().message);
  }
  const auto &j = info.value();
  if (!j.is_object() || !j.contains("tip") || !j["tip"].is_string()) {
    return Error(E_STORE_UNAVAILABLE, "info.json: 'tip' must be a string");
  }
  tip = j["tip"].get<std::string>();

  if (!j.contains("versions") || !j["versions"].is_object()) {
    return Error(E_STORE_UNAVAILABLE, "info.json: 'versions' must be an object");
  }
  difficulties.clear();
  for (auto it = j["versions"].begin(); it != j["versions"].end(); ++it) {
    const auto &entry = it.value();
    if (!entry.is_object() || !entry.contains("difficulty") ||
        !entry["difficulty"].is_number_unsigned() ||
        entry["difficulty"].get<uint64_t>() > MAX_DIFFICULTY) {
      return Error(E_STORE_UNAVAILABLE,
                   "info.json: invalid difficulty for version '" + it.key() + "'");
    }
    difficulties[it.key()] = entry["difficulty"].get<uint32_t>();
  }
  return {};
}

FileLedgerStore::Roe<void>
FileLedgerStore::loadBlocks(std::map<std::string, ChainNode> &blocks) const {
  std::error_code ec;
  for (std::filesystem::directory_iterator it(workDir_ / DIR_BLOCKS, ec), end;
       !ec && it != end; it.increment(ec)) {
    const auto &path = it->path();
    if (path.extension() != ".json") {
      continue;
    }
    auto json = utl::loadJsonFile(path.string());
    if (!json) {
      return Error(E_STORE_UNAVAILABLE, json.error().message);
    }
    auto node = ChainNode::fromJson(json.value());
    if (!node) {
      return Error(E_STORE_UNAVAILABLE, path.string() + ": " + node.error().message);
    }
    if (node.value().blockId != path.stem().string()) {
      return Error(E_STORE_UNAVAILABLE, path.string() + ": block id does not match file name");
    }
    blocks[node.value().blockId] = node.value();
  }
  if (ec) {
    return Error(E_STORE_UNAVAILABLE, "Failed to list blocks: " + ec.message());
  }
  return {};
}

FileLedgerStore::Roe<void>
FileLedgerStore::loadUnspent(std::vector<UnspentEntry> &unspent) const {
  auto path = workDir_ / FILE_UNSPENT;
  if (!std::filesystem::exists(path)) {
    return {};
  }
  auto json = utl::loadJsonFile(path.string());
  if (!json) {
    return Error(E_STORE_UNAVAILABLE, json.error().message);
  }
  if (!json.value().is_array()) {
    return Error(E_STORE_UNAVAILABLE, "unspent.json must hold an array");
  }
  for (const auto &jEntry : json.value()) {
    auto ref = InputRef::fromJson(jEntry);
    if (!ref) {
      return Error(E_STORE_UNAVAILABLE, "unspent.json: " + ref.error().message);
    }
    UnspentEntry entry;
    entry.ref = ref.value();
    entry.reserved = jEntry.contains("reserved") && jEntry["reserved"].is_boolean() &&
                     jEntry["reserved"].get<bool>();
    unspent.push_back(entry);
  }
  return {};
}

FileLedgerStore::Roe<std::filesystem::path>
FileLedgerStore::blockPath(const std::string &blockId) const {
  if (!isBlockId(blockId)) {
    return Error(E_INVALID_BLOCK, "Malformed block id: " + blockId);
  }
  return workDir_ / DIR_BLOCKS / (blockId + ".json");
}

FileLedgerStore::Roe<void>
FileLedgerStore::writeJson(const std::filesystem::path &path,
                           const std::string &content) const {
  if (!isOpen()) {
    return Error(E_STORE_UNAVAILABLE, "Ledger store is not open");
  }
  auto written = utl::writeFileAtomic(path.string(), content);
  if (!written) {
    log().error << "Write failed: " << written.error().message;
    return Error(E_STORE_UNAVAILABLE, written.error().message);
  }
  return {};
}

FileLedgerStore::Roe<void> FileLedgerStore::saveBlock(const ChainNode &node) {
  auto path = blockPath(node.blockId);
  if (!path) {
    return path.error();
  }
  return writeJson(path.value(), node.toJson().dump(2));
}

FileLedgerStore::Roe<void> FileLedgerStore::eraseBlock(const std::string &blockId) {
  if (!isBlockId(blockId)) {
    return {}; // never written
  }
  auto path = blockPath(blockId);
  if (!path) {
    return path.error();
  }
  std::error_code ec;
  std::filesystem::remove(path.value(), ec);
  if (ec) {
    return Error(E_STORE_UNAVAILABLE, "Failed to remove " + path.value().string());
  }
  return {};
}

FileLedgerStore::Roe<void>
FileLedgerStore::saveInfo(const std::string &tip,
                          const std::map<std::string, uint32_t> &difficulties) {
  nlohmann::ordered_json j;
  j["tip"] = tip;
  j["versions"] = nlohmann::ordered_json::object();
  for (const auto &[version, difficulty] : difficulties) {
    j["versions"][version]["difficulty"] = difficulty;
  }
  return writeJson(workDir_ / FILE_INFO, j.dump(2));
}

FileLedgerStore::Roe<void>
FileLedgerStore::saveUnspent(const std::vector<UnspentEntry> &unspent) {
  nlohmann::ordered_json j = nlohmann::ordered_json::array();
  for (const auto &entry : unspent) {
    nlohmann::ordered_json jEntry = entry.ref.toJson();
    jEntry["reserved"] = entry.reserved;
    j.push_back(jEntry);
  }
  return writeJson(workDir_ / FILE_UNSPENT, j.dump(2));
}

} // namespace pwl
