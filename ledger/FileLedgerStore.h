#pragma once

#include "MemoryLedgerStore.h"

#include <filesystem>
#include <map>
#include <string>

namespace pwl {

/**
 * LedgerStore persisted as JSON files under a work directory:
 *
 *   <workDir>/info.json         chain tip and difficulty table
 *   <workDir>/blocks/<id>.json  one archived block per file
 *   <workDir>/unspent.json      this wallet's unspent output registry
 *
 * The whole state is loaded by open() and served from memory afterwards.
 * Each write replaces its file via a temporary sibling and a rename.
 */
class FileLedgerStore : public MemoryLedgerStore {
public:
  constexpr static const char *FILE_INFO = "info.json";
  constexpr static const char *FILE_UNSPENT = "unspent.json";
  constexpr static const char *DIR_BLOCKS = "blocks";

  FileLedgerStore();
  ~FileLedgerStore() override = default;

  /**
   * Open (or create) the store in `workDir`.
   * @param defaultDifficulties Difficulty table written when info.json
   *        does not exist yet
   */
  Roe<void> open(const std::string &workDir,
                 const std::map<std::string, uint32_t> &defaultDifficulties);

  bool isOpen() const { return !workDir_.empty(); }

protected:
  Roe<void> saveBlock(const ChainNode &node) override;
  Roe<void> eraseBlock(const std::string &blockId) override;
  Roe<void> saveInfo(const std::string &tip,
                     const std::map<std::string, uint32_t> &difficulties) override;
  Roe<void> saveUnspent(const std::vector<UnspentEntry> &unspent) override;

private:
  Roe<std::filesystem::path> blockPath(const std::string &blockId) const;
  Roe<void> loadInfo(std::string &tip, std::map<std::string, uint32_t> &difficulties) const;
  Roe<void> loadBlocks(std::map<std::string, ChainNode> &blocks) const;
  Roe<void> loadUnspent(std::vector<UnspentEntry> &unspent) const;
  Roe<void> writeJson(const std::filesystem::path &path, const std::string &content) const;

  std::filesystem::path workDir_;
};

} // namespace pwl
