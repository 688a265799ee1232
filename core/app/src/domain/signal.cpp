#include "autotrader/domain/signal.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace autotrader {
namespace domain {

Signal makeSignal(Direction direction, double confidence,
                  std::string rationale) {
  if (std::isnan(confidence) || confidence < 0.0 || confidence > 100.0) {
    throw std::invalid_argument("Signal confidence must be between 0 and 100, got " +
                                std::to_string(confidence));
  }
  Signal s;
  s.direction = direction;
  s.confidence = confidence;
  s.rationale = std::move(rationale);
  return s;
}

const char* directionToString(Direction d) {
  switch (d) {
    case Direction::Buy:  return "BUY";
    case Direction::Sell: return "SELL";
    case Direction::Hold: return "HOLD";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace autotrader
