#pragma once

#include "autotrader/persistence/i_trade_store.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace autotrader {

// -----------------------------------------------------------------------------
// JsonFileTradeStore: ITradeStore on plain files
// -----------------------------------------------------------------------------
//
// @brief  Three files under one directory:
//           trades.jsonl        one Trade per line, append-only
//           positions.jsonl     one Position snapshot per line, append-only;
//                               the last line per id is the current state
//           engine_state.json   single document, replaced atomically
//
// @details
// Each append is flushed before the call returns. engine_state.json is
// written to a temporary file and renamed over the old one, so a crash
// leaves either the previous or the new state, never a torn file.
//
// A journal line that does not parse (for example a line cut short by a
// crash) is reported as a warning and skipped on load.
//
// Thread model: Every method locks an internal mutex.
// -----------------------------------------------------------------------------
class JsonFileTradeStore final : public ITradeStore {
 public:
  // Creates the directory if needed. @throws PersistenceError on failure.
  explicit JsonFileTradeStore(std::filesystem::path directory);

  JsonFileTradeStore(const JsonFileTradeStore&) = delete;
  JsonFileTradeStore& operator=(const JsonFileTradeStore&) = delete;

  void saveTrade(const domain::Trade& trade) override;
  void savePosition(const domain::Position& position) override;
  std::vector<domain::Position> loadOpenPositions() override;
  std::vector<domain::Trade> loadTrades() override;

  void saveEngineState(const EngineStateRecord& state) override;
  std::optional<EngineStateRecord> loadEngineState() override;

  const std::filesystem::path& directory() const { return directory_; }

 private:
  void appendLine(const std::filesystem::path& file, const std::string& line);

  const std::filesystem::path directory_;
  const std::filesystem::path trades_path_;
  const std::filesystem::path positions_path_;
  const std::filesystem::path state_path_;

  std::mutex mutex_;
};

}  // namespace autotrader
