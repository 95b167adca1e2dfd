#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace gradostroi {

// Outcome of a player action. Every non-Ok status guarantees the state was
// left untouched.
enum class ActionStatus : std::uint8_t {
  Ok,
  Unaffordable,
  InvalidReference,
  PrerequisiteUnmet,
  InvalidQuantity,
  AlreadyUnlocked,
};

struct ActionResult {
  ActionStatus status{ActionStatus::Ok};
  std::string message;

  bool ok() const { return status == ActionStatus::Ok; }

  static ActionResult success(std::string msg = {}) { return {ActionStatus::Ok, std::move(msg)}; }
  static ActionResult failure(ActionStatus status, std::string msg) { return {status, std::move(msg)}; }
};

} // namespace gradostroi
