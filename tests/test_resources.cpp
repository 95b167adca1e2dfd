#include <cmath>
#include <iostream>

#include "gradostroi/core/resources.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool approx(double a, double b, double eps = 1e-9) { return std::fabs(a - b) <= eps; }

} // namespace

int test_resources() {
  using namespace gradostroi;

  const StorageRules rules;
  GD_ASSERT(approx(storage_capacity(0, rules), 50.0));
  GD_ASSERT(approx(storage_capacity(1, rules), 125.0));
  GD_ASSERT(approx(storage_capacity(3, rules), 275.0));

  // Gains clamp at capacity, losses stop at zero.
  {
    ResourceStock stock{};
    stock[resource_index(Resource::Wood)] = 120.0;
    ResourceLedger ledger(stock, storage_capacity(1, rules));

    ledger.adjust(Resource::Wood, 10.0);
    GD_ASSERT(approx(ledger.get(Resource::Wood), 125.0));

    ledger.adjust(Resource::Wood, -200.0);
    GD_ASSERT(approx(ledger.get(Resource::Wood), 0.0));
  }

  // The currency ignores the cap.
  {
    ResourceStock stock{};
    ResourceLedger ledger(stock, 125.0);
    ledger.adjust(kCurrencyResource, 1000.0);
    GD_ASSERT(approx(ledger.get(Resource::Wine), 1000.0));
  }

  // Stock above the cap is not pulled down by a gain.
  {
    ResourceStock stock{};
    stock[resource_index(Resource::Rock)] = 200.0;
    ResourceLedger ledger(stock, 125.0);
    ledger.adjust(Resource::Rock, 5.0);
    GD_ASSERT(approx(ledger.get(Resource::Rock), 200.0));
    ledger.adjust(Resource::Rock, -20.0);
    GD_ASSERT(approx(ledger.get(Resource::Rock), 180.0));
  }

  // Scaled affordability, debit and credit.
  {
    ResourceStock stock{};
    stock[resource_index(Resource::Wood)] = 16.0;
    stock[resource_index(Resource::Rock)] = 6.0;
    ResourceLedger ledger(stock, 125.0);

    const ResourceBundle cost = {{Resource::Wood, 15.0}, {Resource::Rock, 5.0}};
    GD_ASSERT(ledger.affordable(cost));
    GD_ASSERT(!ledger.affordable(cost, 1.1));

    ledger.debit(cost);
    GD_ASSERT(approx(ledger.get(Resource::Wood), 1.0));
    GD_ASSERT(approx(ledger.get(Resource::Rock), 1.0));

    ledger.credit({{Resource::Food, 3.0}}, 2.0);
    GD_ASSERT(approx(ledger.get(Resource::Food), 6.0));
  }

  // Wealth excludes the currency.
  {
    ResourceStock stock{};
    stock[resource_index(Resource::Wood)] = 10.0;
    stock[resource_index(Resource::Iron)] = 5.0;
    stock[resource_index(Resource::Wine)] = 500.0;
    ResourceLedger ledger(stock, 125.0);
    GD_ASSERT(approx(ledger.non_currency_total(), 15.0));
  }

  GD_ASSERT(all_resources().size() == kResourceCount);
  GD_ASSERT(all_resources().front() == Resource::Wood);

  return 0;
}
