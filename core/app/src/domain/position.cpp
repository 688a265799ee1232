#include "autotrader/domain/position.hpp"

namespace autotrader {
namespace domain {

const char* positionStatusToString(PositionStatus s) {
  switch (s) {
    case PositionStatus::Open:   return "OPEN";
    case PositionStatus::Closed: return "CLOSED";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace autotrader
