#include "autotrader/strategy/signal_aggregator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace autotrader {

namespace {

void requireWeight(double weight) {
  if (std::isnan(weight) || weight < 0.0 || weight > 1.0) {
    throw std::invalid_argument("source weight must be between 0 and 1, got " +
                                std::to_string(weight));
  }
}

std::string formatScore(double score) {
  std::ostringstream out;
  out.precision(2);
  out << std::fixed << score;
  return out.str();
}

}  // namespace

SignalAggregator::SignalAggregator(double confidence_threshold)
    : confidence_threshold_(confidence_threshold) {}

// -----------------------------------------------------------------------------
// Registry
// -----------------------------------------------------------------------------
void SignalAggregator::registerSource(std::shared_ptr<IAnalysisModule> module,
                                      double weight, bool enabled) {
  if (!module) {
    throw std::invalid_argument("cannot register a null analysis module");
  }
  requireWeight(weight);

  std::string name = module->name();
  std::lock_guard lock(mutex_);
  if (find(name) != nullptr) {
    throw std::invalid_argument("analysis module already registered: " + name);
  }
  entries_.push_back(Entry{std::move(module), std::move(name), weight, enabled});
}

bool SignalAggregator::setWeight(const std::string& name, double weight) {
  requireWeight(weight);
  std::lock_guard lock(mutex_);
  Entry* entry = find(name);
  if (entry == nullptr) {
    return false;
  }
  entry->weight = weight;
  return true;
}

bool SignalAggregator::enable(const std::string& name) {
  std::lock_guard lock(mutex_);
  Entry* entry = find(name);
  if (entry == nullptr) {
    return false;
  }
  entry->enabled = true;
  return true;
}

bool SignalAggregator::disable(const std::string& name) {
  std::lock_guard lock(mutex_);
  Entry* entry = find(name);
  if (entry == nullptr) {
    return false;
  }
  entry->enabled = false;
  return true;
}

std::vector<SourceInfo> SignalAggregator::sources() const {
  std::lock_guard lock(mutex_);
  std::vector<SourceInfo> out;
  out.reserve(entries_.size());
  for (const auto& e : entries_) {
    out.push_back(SourceInfo{e.name, e.weight, e.enabled});
  }
  return out;
}

SignalAggregator::Entry* SignalAggregator::find(const std::string& name) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&name](const Entry& e) { return e.name == name; });
  return it == entries_.end() ? nullptr : &*it;
}

// -----------------------------------------------------------------------------
// evaluate(): snapshot the registry, run modules outside the lock, combine
// -----------------------------------------------------------------------------
AggregationResult SignalAggregator::evaluate(
    const domain::MarketSnapshot& snapshot) {
  std::vector<Entry> registry;
  {
    std::lock_guard lock(mutex_);
    registry = entries_;
  }

  AggregationResult result;
  result.opinions.reserve(registry.size());

  for (const auto& entry : registry) {
    domain::WeightedOpinion opinion;
    opinion.source_name = entry.name;
    opinion.weight = entry.weight;
    opinion.enabled = entry.enabled;

    if (entry.enabled) {
      try {
        domain::Signal s = entry.module->evaluate(snapshot);
        // Re-validate: a module may fill the struct directly.
        opinion.signal =
            domain::makeSignal(s.direction, s.confidence, std::move(s.rationale));
      } catch (const std::exception& e) {
        std::cerr << "[SignalAggregator] WARNING: source '" << entry.name
                  << "' failed, skipped this cycle: " << e.what() << "\n";
        opinion.enabled = false;
      }
    }

    result.opinions.push_back(std::move(opinion));
  }

  result.combined = combine(result.opinions, confidence_threshold_);
  return result;
}

// -----------------------------------------------------------------------------
// combine(): weighted buckets, strict winner, threshold downgrade
// -----------------------------------------------------------------------------
domain::Signal SignalAggregator::combine(
    const std::vector<domain::WeightedOpinion>& opinions,
    double confidence_threshold) {
  using domain::Direction;

  double buy = 0.0;
  double sell = 0.0;
  double hold = 0.0;
  std::string rationale;
  std::size_t active = 0;

  for (const auto& op : opinions) {
    if (!op.enabled) {
      continue;
    }
    ++active;

    const double score = op.signal.confidence * op.weight;
    switch (op.signal.direction) {
      case Direction::Buy:  buy += score;  break;
      case Direction::Sell: sell += score; break;
      case Direction::Hold: hold += score; break;
    }

    if (!rationale.empty()) {
      rationale += " | ";
    }
    rationale += op.source_name + ": " + op.signal.rationale;
  }

  domain::Signal out;
  if (active == 0) {
    out.direction = Direction::Hold;
    out.confidence = 0.0;
    out.rationale = "no active sources";
    return out;
  }

  if (buy > sell && buy > hold) {
    out.direction = Direction::Buy;
    out.confidence = buy;
  } else if (sell > buy && sell > hold) {
    out.direction = Direction::Sell;
    out.confidence = sell;
  } else {
    // HOLD either won outright or at least two buckets tied for the top.
    out.direction = Direction::Hold;
    out.confidence = std::max({buy, sell, hold});
  }
  out.confidence = std::min(out.confidence, 100.0);

  if (out.direction != Direction::Hold &&
      out.confidence < confidence_threshold) {
    rationale += " | downgraded to HOLD: " +
                 std::string(domain::directionToString(out.direction)) +
                 " score " + formatScore(out.confidence) +
                 " below threshold " + formatScore(confidence_threshold);
    out.direction = Direction::Hold;
  }

  out.rationale = std::move(rationale);
  return out;
}

}  // namespace autotrader
