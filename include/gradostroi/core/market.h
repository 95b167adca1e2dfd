#pragma once

#include <array>
#include <cstddef>
#include <vector>

#include "gradostroi/core/action_result.h"
#include "gradostroi/core/resources.h"
#include "gradostroi/util/hash_rng.h"

namespace gradostroi {

inline constexpr std::size_t kPriceHistoryWindow = 20;

// Lowest instantaneous price the market will ever quote.
inline constexpr double kMinPrice = 0.1;

using PriceTable = std::array<double, kResourceCount>;

struct MarketState {
  // Slow global drift applied to every price.
  double trend{1.0};

  // Last <= kPriceHistoryWindow instantaneous prices per resource, oldest first.
  std::array<std::vector<double>, kResourceCount> history;
};

struct MarketRules {
  // Symmetric noise amplitude (0.04 = +/-4%).
  double noise{0.04};
};

// Stock/capacity pressure. The currency compares against 10x capacity.
double saturation_modifier(double stock, double capacity, bool currency);

// Noise-free estimate for displays: instantaneous price at zero noise averaged
// with the recorded history. Reads only; nothing is copied or recorded.
double quote_market_price(Resource r, const MarketState& market, const ResourceStock& stock, double capacity,
                          const PriceTable& base_prices, double event_modifier);

// Pricing and trade execution for one settlement. Holds references only;
// build one around the live state whenever a price or trade is needed.
class MarketModel {
 public:
  MarketModel(MarketState& market, ResourceLedger& ledger, const PriceTable& base_prices, double event_modifier,
              util::HashRng& rng, MarketRules rules = {});

  // Noisy instantaneous price, recorded in the history; returns the average
  // of that price and the history mean.
  double current_price(Resource r);

  // Noise-free estimate that leaves the history and the RNG alone.
  double quote_price(Resource r) const;

  // Buy or sell at current_price(). Atomic: on failure no stock changes.
  ActionResult trade(Resource r, double amount, bool buying);

  // Purchase at a caller-supplied unit price (character deals).
  ActionResult buy_at(Resource r, double amount, double unit_price);

 private:
  double instant_price(Resource r, double noise_factor) const;
  void record(Resource r, double price);

  MarketState& market_;
  ResourceLedger& ledger_;
  const PriceTable& base_prices_;
  double event_modifier_{1.0};
  util::HashRng& rng_;
  MarketRules rules_;
};

} // namespace gradostroi
