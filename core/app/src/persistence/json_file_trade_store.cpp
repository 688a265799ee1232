#include "autotrader/persistence/json_file_trade_store.hpp"
#include "autotrader/errors.hpp"
#include "autotrader/persistence/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <map>
#include <system_error>
#include <utility>

namespace autotrader {

namespace {

// Calls fn(json) for every parseable line of a JSON-lines file. A missing
// file yields nothing.
template <typename Fn>
void forEachLine(const std::filesystem::path& file, Fn&& fn) {
  std::ifstream in(file);
  if (!in) {
    return;
  }
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    try {
      fn(nlohmann::json::parse(line));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[TradeStore] WARNING: skipping " << file.filename().string()
                << ":" << line_no << ": " << e.what() << "\n";
    }
  }
  if (in.bad()) {
    throw PersistenceError("read failed: " + file.string());
  }
}

}  // namespace

JsonFileTradeStore::JsonFileTradeStore(std::filesystem::path directory)
    : directory_(std::move(directory)),
      trades_path_(directory_ / "trades.jsonl"),
      positions_path_(directory_ / "positions.jsonl"),
      state_path_(directory_ / "engine_state.json") {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) {
    throw PersistenceError("cannot create data directory " +
                           directory_.string() + ": " + ec.message());
  }
}

void JsonFileTradeStore::saveTrade(const domain::Trade& trade) {
  nlohmann::json j = trade;
  std::lock_guard lock(mutex_);
  appendLine(trades_path_, j.dump());
}

void JsonFileTradeStore::savePosition(const domain::Position& position) {
  nlohmann::json j = position;
  std::lock_guard lock(mutex_);
  appendLine(positions_path_, j.dump());
}

// -----------------------------------------------------------------------------
// loadOpenPositions(): last snapshot per id wins
// -----------------------------------------------------------------------------
std::vector<domain::Position> JsonFileTradeStore::loadOpenPositions() {
  std::lock_guard lock(mutex_);

  std::map<domain::PositionId, domain::Position> latest;
  forEachLine(positions_path_, [&latest](const nlohmann::json& j) {
    auto p = j.get<domain::Position>();
    latest[p.id] = std::move(p);
  });

  std::vector<domain::Position> open;
  for (auto& [id, p] : latest) {
    if (p.status == domain::PositionStatus::Open) {
      open.push_back(std::move(p));
    }
  }
  return open;
}

std::vector<domain::Trade> JsonFileTradeStore::loadTrades() {
  std::lock_guard lock(mutex_);
  std::vector<domain::Trade> trades;
  forEachLine(trades_path_, [&trades](const nlohmann::json& j) {
    trades.push_back(j.get<domain::Trade>());
  });
  return trades;
}

// -----------------------------------------------------------------------------
// saveEngineState(): write temp file, then rename over the old one
// -----------------------------------------------------------------------------
void JsonFileTradeStore::saveEngineState(const EngineStateRecord& state) {
  nlohmann::json j = state;
  std::lock_guard lock(mutex_);

  std::filesystem::path tmp = state_path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    out << j.dump(2) << "\n";
    out.flush();
    if (!out) {
      throw PersistenceError("write failed: " + tmp.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp, state_path_, ec);
  if (ec) {
    throw PersistenceError("cannot replace " + state_path_.string() + ": " +
                           ec.message());
  }
}

std::optional<EngineStateRecord> JsonFileTradeStore::loadEngineState() {
  std::lock_guard lock(mutex_);
  std::ifstream in(state_path_);
  if (!in) {
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(in).get<EngineStateRecord>();
  } catch (const nlohmann::json::exception& e) {
    throw PersistenceError("corrupt " + state_path_.string() + ": " + e.what());
  }
}

void JsonFileTradeStore::appendLine(const std::filesystem::path& file,
                                    const std::string& line) {
  std::ofstream out(file, std::ios::app);
  out << line << "\n";
  out.flush();
  if (!out) {
    throw PersistenceError("append failed: " + file.string());
  }
}

}  // namespace autotrader
