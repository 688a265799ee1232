#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace autotrader {

// Venue-native shape of a stop-loss request.
struct StopOrderRequest {
  std::string type;
  nlohmann::json params;
};

// -----------------------------------------------------------------------------
// VenueProfile: per-venue mapping of generic requests to wire parameters
// -----------------------------------------------------------------------------
//
// @brief  Selected once when the live adapter is built; callers never see
//         venue-specific fields.
//
// @details
//   binance, binanceus  type "stop_loss", params {"stopPrice": p}
//   okx                 type "trigger",   params {"triggerPrice": p,
//                                                 "orderPx": "-1"}
//                       (orderPx -1 makes the triggered order a market order)
// -----------------------------------------------------------------------------
class VenueProfile {
 public:
  virtual ~VenueProfile() = default;

  virtual std::string name() const = 0;
  virtual StopOrderRequest stopLoss(double stop_price) const = 0;
};

// @throws ConfigError for an unknown venue name (case-insensitive match).
std::unique_ptr<VenueProfile> makeVenueProfile(const std::string& venue);

}  // namespace autotrader
