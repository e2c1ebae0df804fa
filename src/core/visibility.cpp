#include "slingnet/core/visibility.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>
#include <unordered_set>

#include "slingnet/core/toroidal.h"

namespace slingnet {
namespace {

// Points along a link's flown path, both endpoints included.
std::vector<Vec2> sample_link_path(const Vec2& from, const Vec2& path, double step, double width,
                                   double height) {
  const double len = path.length();
  const int segments = std::max(1, static_cast<int>(std::ceil(len / step)));
  std::vector<Vec2> points;
  points.reserve(static_cast<std::size_t>(segments) + 1);
  for (int i = 0; i <= segments; ++i) {
    const double t = static_cast<double>(i) / static_cast<double>(segments);
    points.push_back(wrap_position(from + path * t, width, height));
  }
  return points;
}

} // namespace

std::vector<VisionCircle> gather_vision_circles(const RulesConfig& cfg, const GameState& s,
                                                const PlayerId& viewer) {
  std::vector<VisionCircle> out;
  if (viewer.empty()) return out;
  for (const Entity& e : s.entities) {
    if (e.owner != viewer) continue;
    const double r = vision_radius_for(cfg, e.type);
    if (r <= 0.0) continue;
    out.push_back(VisionCircle{e.position, r, e.id});
  }
  return out;
}

bool any_circle_covers(const std::vector<VisionCircle>& circles, const Vec2& p, double width,
                       double height) {
  return std::any_of(circles.begin(), circles.end(), [&](const VisionCircle& c) {
    return shortest_distance(c.center, p, width, height) <= c.radius;
  });
}

bool is_position_visible(const RulesConfig& cfg, const GameState& s, const PlayerId& viewer, const Vec2& p) {
  if (is_spectator(viewer)) return true;
  return any_circle_covers(gather_vision_circles(cfg, s, viewer), p, s.map.width, s.map.height);
}

GameState project_visible_state(const RulesConfig& cfg, const GameState& s, const PlayerId& viewer) {
  if (is_spectator(viewer)) return s;

  const double w = s.map.width;
  const double h = s.map.height;
  const auto circles = gather_vision_circles(cfg, s, viewer);

  std::unordered_map<Id, const Entity*> by_id;
  std::unordered_set<Id> seen;
  by_id.reserve(s.entities.size());
  for (const Entity& e : s.entities) {
    by_id[e.id] = &e;
    if (e.owner == viewer || any_circle_covers(circles, e.position, w, h)) seen.insert(e.id);
  }

  std::unordered_set<Id> bridged;
  std::vector<const Link*> kept_links;
  for (const Link& l : s.links) {
    auto from = by_id.find(l.from_id);
    auto to = by_id.find(l.to_id);
    if (from == by_id.end() || to == by_id.end()) continue;

    bool keep = seen.count(l.from_id) || seen.count(l.to_id);
    if (!keep) {
      const Vec2& a = from->second->position;
      const Vec2 path = l.intended ? *l.intended : shortest_vector(a, to->second->position, w, h);
      for (const Vec2& p : sample_link_path(a, path, cfg.link_sample_step, w, h)) {
        if (any_circle_covers(circles, p, w, h)) {
          keep = true;
          break;
        }
      }
    }
    if (!keep) continue;

    kept_links.push_back(&l);
    bridged.insert(l.from_id);
    bridged.insert(l.to_id);
  }

  GameState out;
  out.turn = s.turn;
  out.next_id = s.next_id;
  out.players = s.players;
  out.map = s.map;
  out.winner = s.winner;

  for (const Entity& e : s.entities) {
    const bool in_view = seen.count(e.id) != 0;
    if (!in_view && !bridged.count(e.id)) continue;
    Entity copy = e;
    copy.scouted = in_view;
    out.entities.push_back(std::move(copy));
  }
  out.links.reserve(kept_links.size());
  for (const Link* l : kept_links) out.links.push_back(*l);
  return out;
}

Snapshot project_visible_snapshot(const RulesConfig& cfg, const Snapshot& snap, const PlayerId& viewer) {
  if (is_spectator(viewer)) return snap;

  Snapshot out;
  out.type = snap.type;
  out.round = snap.round;
  out.sub_tick = snap.sub_tick;
  out.state = project_visible_state(cfg, snap.state, viewer);

  const double w = snap.state.map.width;
  const double h = snap.state.map.height;
  const auto circles = gather_vision_circles(cfg, snap.state, viewer);

  for (const Projectile& p : snap.projectiles) {
    if (p.owner == viewer || any_circle_covers(circles, p.position, w, h)) out.projectiles.push_back(p);
  }
  for (const LaserBeam& b : snap.beams) {
    if (b.owner == viewer || any_circle_covers(circles, b.from, w, h) || any_circle_covers(circles, b.to, w, h)) {
      out.beams.push_back(b);
    }
  }
  return out;
}

} // namespace slingnet
