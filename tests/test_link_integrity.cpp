#include <iostream>

#include "slingnet/core/entity_store.h"
#include "slingnet/core/link_integrity.h"

#define SN_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

slingnet::Id add(slingnet::GameState& s, slingnet::EntityType type, const slingnet::PlayerId& owner, double x,
                 double y, bool starter = false) {
  slingnet::EntitySpec spec;
  spec.type = type;
  spec.owner = owner;
  spec.position = slingnet::Vec2{x, y};
  spec.is_starter = starter;
  return slingnet::create_entity(s, slingnet::RulesConfig{}, spec).id;
}

} // namespace

int test_link_integrity() {
  using namespace slingnet;

  // Chain reaction: cutting the middle of a chain collapses everything behind it.
  {
    GameState s;
    s.players["p1"] = Player{"p1", 0, "", true};
    const Id hub = add(s, EntityType::Hub, "p1", 100, 100, true);
    const Id a = add(s, EntityType::Extractor, "p1", 200, 100);
    const Id b = add(s, EntityType::Extractor, "p1", 300, 100);
    const Id c = add(s, EntityType::Defense, "p1", 400, 100);
    const Id loose = add(s, EntityType::Weapon, "p1", 500, 500);
    create_link(s, hub, a, "p1");
    create_link(s, a, b, "p1");
    create_link(s, b, c, "p1");

    SN_ASSERT(check_link_integrity(s) == 1);
    SN_ASSERT(find_entity(s, loose) == nullptr);
    SN_ASSERT(s.entities.size() == 4);
    SN_ASSERT(check_link_integrity(s) == 0);

    DestructionSet cut;
    cut.mark(a);
    apply_destruction(s, cut);
    SN_ASSERT(s.links.size() == 1);

    SN_ASSERT(check_link_integrity(s) == 2);
    SN_ASSERT(s.entities.size() == 1);
    SN_ASSERT(s.entities[0].id == hub);
    SN_ASSERT(s.links.empty());

    // Idempotent.
    SN_ASSERT(check_link_integrity(s) == 0);
    SN_ASSERT(s.entities.size() == 1);
  }

  // Links are walked in both directions.
  {
    GameState s;
    s.players["p1"] = Player{"p1", 0, "", true};
    const Id hub = add(s, EntityType::Hub, "p1", 100, 100, true);
    const Id a = add(s, EntityType::Extractor, "p1", 200, 100);
    create_link(s, a, hub, "p1");
    SN_ASSERT(check_link_integrity(s) == 0);
    SN_ASSERT(find_entity(s, a) != nullptr);
  }

  // Only entities owned by the same player carry connectivity.
  {
    GameState s;
    s.players["p1"] = Player{"p1", 0, "", true};
    s.players["p2"] = Player{"p2", 0, "", true};
    const Id hub1 = add(s, EntityType::Hub, "p1", 100, 100, true);
    const Id foreign = add(s, EntityType::Extractor, "p2", 200, 100);
    const Id behind = add(s, EntityType::Extractor, "p1", 300, 100);
    create_link(s, hub1, foreign, "p1");
    create_link(s, foreign, behind, "p1");

    SN_ASSERT(check_link_integrity(s) == 1);
    SN_ASSERT(find_entity(s, behind) == nullptr);
    // p2 has no starter hub: its structures are left alone.
    SN_ASSERT(find_entity(s, foreign) != nullptr);
    SN_ASSERT(s.links.size() == 1);
  }

  // Several players are pruned in one batch.
  {
    GameState s;
    s.players["p1"] = Player{"p1", 0, "", true};
    s.players["p2"] = Player{"p2", 0, "", true};
    const Id hub1 = add(s, EntityType::Hub, "p1", 100, 100, true);
    const Id hub2 = add(s, EntityType::Hub, "p2", 600, 600, true);
    const Id ok1 = add(s, EntityType::Defense, "p1", 150, 100);
    add(s, EntityType::Defense, "p1", 150, 900);
    add(s, EntityType::Weapon, "p2", 650, 600);
    const Id neutral = add(s, EntityType::Extractor, "", 500, 500);
    create_link(s, hub1, ok1, "p1");

    SN_ASSERT(check_link_integrity(s) == 2);
    SN_ASSERT(s.entities.size() == 4);
    SN_ASSERT(find_entity(s, hub1) && find_entity(s, hub2) && find_entity(s, ok1) && find_entity(s, neutral));
  }

  return 0;
}
