#include "gradostroi/core/resources.h"

#include <algorithm>

namespace gradostroi {

const std::array<Resource, kResourceCount>& all_resources() {
  static const std::array<Resource, kResourceCount> kAll = [] {
    std::array<Resource, kResourceCount> out{};
    for (std::size_t i = 0; i < kResourceCount; ++i) out[i] = static_cast<Resource>(i);
    return out;
  }();
  return kAll;
}

double storage_capacity(int storage_units, const StorageRules& rules) {
  return rules.base + rules.per_unit * static_cast<double>(std::max(0, storage_units));
}

ResourceLedger::ResourceLedger(ResourceStock& stock, double capacity) : stock_(stock), capacity_(capacity) {}

void ResourceLedger::adjust(Resource r, double delta) {
  double& v = stock_[resource_index(r)];
  if (r == kCurrencyResource) {
    v += delta;
    return;
  }
  if (delta > 0.0) {
    // A stock already above the cap (capacity can only grow, but saves may
    // be hand edited) is not pulled down by a gain.
    v = std::max(v, std::min(v + delta, capacity_));
  } else {
    v = std::max(0.0, v + delta);
  }
}

bool ResourceLedger::affordable(const ResourceBundle& cost, double scale) const {
  for (const auto& c : cost) {
    if (get(c.resource) < c.amount * scale) return false;
  }
  return true;
}

void ResourceLedger::debit(const ResourceBundle& cost, double scale) {
  for (const auto& c : cost) adjust(c.resource, -c.amount * scale);
}

void ResourceLedger::credit(const ResourceBundle& gain, double scale) {
  for (const auto& g : gain) adjust(g.resource, g.amount * scale);
}

double ResourceLedger::non_currency_total() const {
  double total = 0.0;
  for (Resource r : all_resources()) {
    if (r != kCurrencyResource) total += get(r);
  }
  return total;
}

} // namespace gradostroi
