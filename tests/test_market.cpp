#include <cmath>
#include <iostream>

#include "gradostroi/core/market.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

gradostroi::PriceTable flat_prices() {
  gradostroi::PriceTable t{};
  t.fill(1.0);
  t[gradostroi::resource_index(gradostroi::Resource::Wine)] = 2.0;
  t[gradostroi::resource_index(gradostroi::Resource::Rock)] = 1.5;
  return t;
}

} // namespace

int test_market() {
  using namespace gradostroi;

  // Saturation bands.
  GD_ASSERT(approx(saturation_modifier(120.0, 125.0, false), 0.6));
  GD_ASSERT(approx(saturation_modifier(10.0, 125.0, false), 1.9));
  GD_ASSERT(approx(saturation_modifier(30.0, 125.0, false), 1.3));
  GD_ASSERT(approx(saturation_modifier(60.0, 125.0, false), 1.0));
  // The currency is measured against ten times the capacity.
  GD_ASSERT(approx(saturation_modifier(100.0, 125.0, true), 1.9));
  GD_ASSERT(approx(saturation_modifier(1200.0, 125.0, true), 0.6));
  // Zero capacity does not divide by zero.
  GD_ASSERT(approx(saturation_modifier(0.0, 0.0, false), 1.9));

  const PriceTable prices = flat_prices();

  // Noise-free quotes leave history and RNG alone.
  {
    MarketState market;
    ResourceStock stock{};
    stock[resource_index(Resource::Wood)] = 60.0;
    ResourceLedger ledger(stock, 125.0);
    util::HashRng rng(5);
    MarketModel model(market, ledger, prices, 1.25, rng);

    GD_ASSERT(approx(model.quote_price(Resource::Wood), 1.25));
    GD_ASSERT(market.history[resource_index(Resource::Wood)].empty());
    GD_ASSERT(rng.state() == 5);
  }

  // Instantaneous prices never drop below the floor.
  {
    MarketState market;
    market.trend = 1e-6;
    ResourceStock stock{};
    ResourceLedger ledger(stock, 125.0);
    util::HashRng rng(9);
    MarketModel model(market, ledger, prices, 1.0, rng);
    GD_ASSERT(approx(model.quote_price(Resource::Wood), kMinPrice));
    GD_ASSERT(approx(model.current_price(Resource::Wood), kMinPrice));
  }

  // Observed prices are recorded and the window is bounded.
  {
    MarketState market;
    ResourceStock stock{};
    stock[resource_index(Resource::Wood)] = 60.0;
    ResourceLedger ledger(stock, 125.0);
    util::HashRng rng(11);
    MarketModel model(market, ledger, prices, 1.0, rng);

    for (int i = 0; i < 25; ++i) {
      const double p = model.current_price(Resource::Wood);
      GD_ASSERT(p >= 0.96 - 1e-9 && p <= 1.04 + 1e-9);
    }
    GD_ASSERT(market.history[resource_index(Resource::Wood)].size() == kPriceHistoryWindow);

    // The read-only quote matches the model's over a populated history.
    const double quoted = quote_market_price(Resource::Wood, market, stock, 125.0, prices, 1.0);
    GD_ASSERT(approx(quoted, model.quote_price(Resource::Wood)));
    GD_ASSERT(market.history[resource_index(Resource::Wood)].size() == kPriceHistoryWindow);
  }

  // Without noise the price is exact: base * saturation * event * trend.
  {
    MarketState market;
    ResourceStock stock{};
    stock[resource_index(Resource::Rock)] = 10.0;
    ResourceLedger ledger(stock, 125.0);
    util::HashRng rng(3);
    MarketRules rules;
    rules.noise = 0.0;
    MarketModel model(market, ledger, prices, 1.0, rng, rules);
    GD_ASSERT(approx(model.current_price(Resource::Rock), 1.5 * 1.9));
  }

  // Buying without enough currency changes no stock, but the price was observed.
  {
    MarketState market;
    ResourceStock stock{};
    stock[resource_index(Resource::Wood)] = 20.0;
    ResourceLedger ledger(stock, 125.0);
    util::HashRng rng(21);
    MarketModel model(market, ledger, prices, 1.0, rng);

    const ActionResult r = model.trade(Resource::Wood, 5.0, true);
    GD_ASSERT(r.status == ActionStatus::Unaffordable);
    GD_ASSERT(approx(ledger.get(Resource::Wood), 20.0));
    GD_ASSERT(approx(ledger.get(Resource::Wine), 0.0));
    GD_ASSERT(market.history[resource_index(Resource::Wood)].size() == 1);
  }

  // Selling.
  {
    MarketState market;
    ResourceStock stock{};
    stock[resource_index(Resource::Wood)] = 50.0;
    ResourceLedger ledger(stock, 125.0);
    util::HashRng rng(22);
    MarketModel model(market, ledger, prices, 1.0, rng);

    const ActionResult r = model.trade(Resource::Wood, 10.0, false);
    GD_ASSERT(r.ok());
    GD_ASSERT(approx(ledger.get(Resource::Wood), 40.0));
    GD_ASSERT(ledger.get(Resource::Wine) > 0.0);

    const double wine = ledger.get(Resource::Wine);
    const ActionResult over = model.trade(Resource::Wood, 41.0, false);
    GD_ASSERT(over.status == ActionStatus::Unaffordable);
    GD_ASSERT(approx(ledger.get(Resource::Wood), 40.0));
    GD_ASSERT(approx(ledger.get(Resource::Wine), wine));
  }

  // Malformed trades.
  {
    MarketState market;
    ResourceStock stock{};
    stock[resource_index(Resource::Wine)] = 100.0;
    ResourceLedger ledger(stock, 125.0);
    util::HashRng rng(23);
    MarketModel model(market, ledger, prices, 1.0, rng);

    GD_ASSERT(model.trade(Resource::Wood, 0.0, true).status == ActionStatus::InvalidQuantity);
    GD_ASSERT(model.trade(Resource::Wood, -3.0, false).status == ActionStatus::InvalidQuantity);
    GD_ASSERT(model.trade(Resource::Wine, 5.0, true).status == ActionStatus::InvalidReference);
    GD_ASSERT(approx(ledger.get(Resource::Wine), 100.0));
  }

  // Fixed-price purchase.
  {
    MarketState market;
    ResourceStock stock{};
    stock[resource_index(Resource::Wine)] = 100.0;
    ResourceLedger ledger(stock, 125.0);
    util::HashRng rng(24);
    MarketModel model(market, ledger, prices, 1.0, rng);

    GD_ASSERT(model.buy_at(Resource::Rock, 10.0, 2.0).ok());
    GD_ASSERT(approx(ledger.get(Resource::Wine), 80.0));
    GD_ASSERT(approx(ledger.get(Resource::Rock), 10.0));
    GD_ASSERT(model.buy_at(Resource::Rock, 100.0, 2.0).status == ActionStatus::Unaffordable);
    GD_ASSERT(approx(ledger.get(Resource::Rock), 10.0));
  }

  return 0;
}
