#pragma once

#include <cstdint>
#include <string>

#include "gradostroi/core/game_state.h"

namespace gradostroi {

struct DigestOptions {
  // Include the persistent SimEvent log.
  bool include_events{true};
};

// Stable 64-bit digest of the in-memory game state.
//
// Deterministic across runs and platforms (maps are visited in key order).
// Set-like id lists are order-insensitive; character memory and the event
// log are order-sensitive.
std::uint64_t digest_game_state64(const GameState& state, const DigestOptions& opt = {});

// Stable 64-bit digest of the loaded content database.
std::uint64_t digest_content_db64(const ContentDB& content);

// Fixed-width lowercase hex.
std::string digest64_to_hex(std::uint64_t v);

} // namespace gradostroi
