#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace gradostroi {

enum class Resource : std::uint8_t {
  Wood,
  Wine,
  Rock,
  Food,
  Water,
  Sand,
  Clay,
  Iron,
  Copper,
  Tin,
  Nickel,
  Lead,
  Salt,
  Sulfur,
  Coal,
  Steel,
  Bronze,
  SulfuricAcid,
  Chlorine,
  BuilderMaterials,
  Instrument,
  AncientTool,
  Herbs,
};

inline constexpr std::size_t kResourceCount = 23;

// Wine doubles as money: it is never capped by storage and every market
// price is quoted in it.
inline constexpr Resource kCurrencyResource = Resource::Wine;

constexpr std::size_t resource_index(Resource r) { return static_cast<std::size_t>(r); }

// All resources in declaration order.
const std::array<Resource, kResourceCount>& all_resources();

using ResourceStock = std::array<double, kResourceCount>;

struct ResourceAmount {
  Resource resource{Resource::Wood};
  double amount{0.0};
};

using ResourceBundle = std::vector<ResourceAmount>;

// Price of a one-shot unlock. `research` is a threshold on the research
// counter; it is checked but never consumed.
struct Cost {
  ResourceBundle resources;
  double research{0.0};
};

struct StorageRules {
  double base{50.0};
  double per_unit{75.0};
};

double storage_capacity(int storage_units, const StorageRules& rules);

// Typed view over a ResourceStock that enforces the storage cap.
//
// The ledger does not own the stock; it is constructed on demand around
// GameState::resources with the capacity in effect at that moment.
class ResourceLedger {
 public:
  ResourceLedger(ResourceStock& stock, double capacity);

  double capacity() const { return capacity_; }
  double get(Resource r) const { return stock_[resource_index(r)]; }

  // Currency: applied as-is. Everything else: gains clamp at capacity,
  // losses stop at zero. Callers check affordability first.
  void adjust(Resource r, double delta);

  // True iff every entry (times scale) is covered by the current stock.
  bool affordable(const ResourceBundle& cost, double scale = 1.0) const;

  void debit(const ResourceBundle& cost, double scale = 1.0);
  void credit(const ResourceBundle& gain, double scale = 1.0);

  double non_currency_total() const;

 private:
  ResourceStock& stock_;
  double capacity_{0.0};
};

} // namespace gradostroi
