#include "gradostroi/core/market.h"

#include <algorithm>
#include <cstddef>
#include <numeric>
#include <string>

#include "gradostroi/core/enum_strings.h"
#include "gradostroi/util/strings.h"

namespace gradostroi {

double saturation_modifier(double stock, double capacity, bool currency) {
  const double effective = std::max(1.0, currency ? capacity * 10.0 : capacity);
  const double sat = stock / effective;
  if (sat > 0.9) return 0.6;
  if (sat < 0.15) return 1.9;
  if (sat < 0.3) return 1.3;
  return 1.0;
}

namespace {

double base_price(Resource r, double stock, double capacity, const PriceTable& base_prices, double event_modifier,
                  double trend, double noise_factor) {
  const double sat = saturation_modifier(stock, capacity, r == kCurrencyResource);
  return std::max(kMinPrice, base_prices[resource_index(r)] * sat * event_modifier * trend * noise_factor);
}

double smoothed(double price, const std::vector<double>& history) {
  if (history.empty()) return price;
  const double avg = std::accumulate(history.begin(), history.end(), 0.0) / static_cast<double>(history.size());
  return (price + avg) / 2.0;
}

} // namespace

double quote_market_price(Resource r, const MarketState& market, const ResourceStock& stock, double capacity,
                          const PriceTable& base_prices, double event_modifier) {
  const double price =
      base_price(r, stock[resource_index(r)], capacity, base_prices, event_modifier, market.trend, 1.0);
  return smoothed(price, market.history[resource_index(r)]);
}

MarketModel::MarketModel(MarketState& market, ResourceLedger& ledger, const PriceTable& base_prices,
                         double event_modifier, util::HashRng& rng, MarketRules rules)
    : market_(market),
      ledger_(ledger),
      base_prices_(base_prices),
      event_modifier_(event_modifier),
      rng_(rng),
      rules_(rules) {}

double MarketModel::instant_price(Resource r, double noise_factor) const {
  return base_price(r, ledger_.get(r), ledger_.capacity(), base_prices_, event_modifier_, market_.trend,
                    noise_factor);
}

void MarketModel::record(Resource r, double price) {
  auto& h = market_.history[resource_index(r)];
  h.push_back(price);
  if (h.size() > kPriceHistoryWindow) {
    h.erase(h.begin(), h.end() - static_cast<std::ptrdiff_t>(kPriceHistoryWindow));
  }
}

double MarketModel::current_price(Resource r) {
  const double noise = 1.0 + rng_.range(-rules_.noise, rules_.noise);
  const double price = instant_price(r, noise);
  record(r, price);
  return smoothed(price, market_.history[resource_index(r)]);
}

double MarketModel::quote_price(Resource r) const {
  return smoothed(instant_price(r, 1.0), market_.history[resource_index(r)]);
}

ActionResult MarketModel::trade(Resource r, double amount, bool buying) {
  if (!(amount > 0.0)) return ActionResult::failure(ActionStatus::InvalidQuantity, "trade amount must be positive");
  if (r == kCurrencyResource) {
    return ActionResult::failure(ActionStatus::InvalidReference, "cannot trade the currency for itself");
  }

  const double price = current_price(r);
  if (buying) return buy_at(r, amount, price);

  if (ledger_.get(r) < amount) {
    return ActionResult::failure(ActionStatus::Unaffordable, "not enough " + resource_to_string(r) + " to sell");
  }
  const double total = price * amount;
  ledger_.adjust(r, -amount);
  ledger_.adjust(kCurrencyResource, total);
  return ActionResult::success("sold " + format_fixed(amount) + " " + resource_to_string(r) + " for " +
                               format_fixed(total) + " wine");
}

ActionResult MarketModel::buy_at(Resource r, double amount, double unit_price) {
  if (!(amount > 0.0)) return ActionResult::failure(ActionStatus::InvalidQuantity, "trade amount must be positive");
  if (r == kCurrencyResource) {
    return ActionResult::failure(ActionStatus::InvalidReference, "cannot trade the currency for itself");
  }
  const double total = unit_price * amount;
  if (ledger_.get(kCurrencyResource) < total) {
    return ActionResult::failure(ActionStatus::Unaffordable,
                                 "need " + format_fixed(total) + " wine to buy " + resource_to_string(r));
  }
  ledger_.adjust(kCurrencyResource, -total);
  ledger_.adjust(r, amount);
  return ActionResult::success("bought " + format_fixed(amount) + " " + resource_to_string(r) + " for " +
                               format_fixed(total) + " wine");
}

} // namespace gradostroi
