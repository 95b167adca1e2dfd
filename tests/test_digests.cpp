#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

#include "gradostroi/core/content.h"
#include "gradostroi/core/simulation.h"
#include "gradostroi/util/digest.h"

#define GD_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_digests() {
  using namespace gradostroi;

  Simulation sim(default_content_db(), SimConfig{});
  sim.advance_days(5);
  const GameState base = sim.state();

  GD_ASSERT(digest_game_state64(base) == digest_game_state64(base));

  // Set-like id lists are order-insensitive.
  {
    GameState a = base;
    GameState b = base;
    a.researched_techs = {"basic_agriculture", "ecology"};
    b.researched_techs = {"ecology", "basic_agriculture"};
    GD_ASSERT(digest_game_state64(a) == digest_game_state64(b));

    b.researched_techs.push_back("advanced_mining");
    GD_ASSERT(digest_game_state64(a) != digest_game_state64(b));
  }

  // Character map iteration order does not matter; memory order does.
  {
    GameState a = base;
    GameState b = base;
    b.characters.clear();
    for (auto it = a.characters.begin(); it != a.characters.end(); ++it) b.characters.insert(*it);
    GD_ASSERT(digest_game_state64(a) == digest_game_state64(b));

    a.characters.at("forest_elder").memory = {"x", "y"};
    b.characters.at("forest_elder").memory = {"y", "x"};
    GD_ASSERT(digest_game_state64(a) != digest_game_state64(b));
  }

  // Any simulation value change shows up.
  {
    GameState a = base;
    a.resources[resource_index(Resource::Clay)] += 0.5;
    GD_ASSERT(digest_game_state64(a) != digest_game_state64(base));

    GameState b = base;
    b.ecosystem.biomes[biome_index(Biome::Air)] += 1.0;
    GD_ASSERT(digest_game_state64(b) != digest_game_state64(base));
  }

  // The event log can be left out.
  {
    GameState a = base;
    SimEvent ev;
    ev.seq = a.next_event_seq;
    ev.message = "extra";
    a.events.push_back(ev);

    GD_ASSERT(digest_game_state64(a) != digest_game_state64(base));
    DigestOptions opt;
    opt.include_events = false;
    GD_ASSERT(digest_game_state64(a, opt) == digest_game_state64(base, opt));
  }

  // Content digests.
  {
    const ContentDB c1 = default_content_db();
    ContentDB c2 = default_content_db();
    GD_ASSERT(digest_content_db64(c1) == digest_content_db64(c2));
    c2.base_prices[resource_index(Resource::Iron)] = 4.0;
    GD_ASSERT(digest_content_db64(c1) != digest_content_db64(c2));
  }

  const std::string hex = digest64_to_hex(0xABCDEFULL);
  GD_ASSERT(hex == "0000000000abcdef");
  GD_ASSERT(std::all_of(hex.begin(), hex.end(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); }));

  return 0;
}
