#include "autotrader/execution/venue_profile.hpp"
#include "autotrader/errors.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace autotrader {

namespace {

class BinanceVenueProfile final : public VenueProfile {
 public:
  explicit BinanceVenueProfile(std::string name) : name_(std::move(name)) {}

  std::string name() const override { return name_; }

  StopOrderRequest stopLoss(double stop_price) const override {
    return StopOrderRequest{"stop_loss", {{"stopPrice", stop_price}}};
  }

 private:
  std::string name_;
};

class OkxVenueProfile final : public VenueProfile {
 public:
  std::string name() const override { return "okx"; }

  StopOrderRequest stopLoss(double stop_price) const override {
    return StopOrderRequest{
        "trigger", {{"triggerPrice", stop_price}, {"orderPx", "-1"}}};
  }
};

}  // namespace

std::unique_ptr<VenueProfile> makeVenueProfile(const std::string& venue) {
  std::string key = venue;
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (key == "okx") {
    return std::make_unique<OkxVenueProfile>();
  }
  if (key == "binance" || key == "binanceus") {
    return std::make_unique<BinanceVenueProfile>(key);
  }
  throw ConfigError("unsupported venue '" + venue +
                    "' (expected okx, binance or binanceus)");
}

}  // namespace autotrader
