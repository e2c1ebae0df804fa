#include "slingnet/core/link_integrity.h"

#include <deque>
#include <unordered_map>
#include <unordered_set>

#include "slingnet/core/entity_store.h"
#include "slingnet/util/log.h"

namespace slingnet {
namespace {

// Undirected adjacency over all links.
std::unordered_map<Id, std::vector<Id>> build_adjacency(const GameState& s) {
  std::unordered_map<Id, std::vector<Id>> adj;
  adj.reserve(s.links.size() * 2);
  for (const Link& l : s.links) {
    adj[l.from_id].push_back(l.to_id);
    adj[l.to_id].push_back(l.from_id);
  }
  return adj;
}

} // namespace

std::size_t check_link_integrity(GameState& s) {
  std::unordered_map<Id, const Entity*> by_id;
  by_id.reserve(s.entities.size());
  for (const Entity& e : s.entities) by_id[e.id] = &e;

  const auto adj = build_adjacency(s);
  DestructionSet doomed;

  for (const PlayerId& pid : sorted_player_ids(s)) {
    const Entity* starter = find_starter_hub(s, pid);
    if (!starter) continue;

    std::unordered_set<Id> reached{starter->id};
    std::deque<Id> frontier{starter->id};
    while (!frontier.empty()) {
      const Id cur = frontier.front();
      frontier.pop_front();
      auto it = adj.find(cur);
      if (it == adj.end()) continue;
      for (const Id next : it->second) {
        if (reached.count(next)) continue;
        auto e = by_id.find(next);
        if (e == by_id.end() || e->second->owner != pid) continue;
        reached.insert(next);
        frontier.push_back(next);
      }
    }

    for (const Entity& e : s.entities) {
      if (e.owner == pid && !reached.count(e.id)) doomed.mark(e.id);
    }
  }

  if (doomed.empty()) return 0;
  const std::size_t removed = apply_destruction(s, doomed);
  log::debug("Link integrity: " + std::to_string(removed) + " disconnected structure(s) collapsed");
  return removed;
}

} // namespace slingnet
