#pragma once

#include "slingnet/core/vec2.h"

#include <algorithm>
#include <cmath>

namespace slingnet {

// Toroidal geometry helpers.
//
// The world is a width x height rectangle whose edges wrap to the opposite
// edge. All helpers are pure and take the extents explicitly so they can be
// used on any snapshot, not just the live game.

// Normalize a coordinate into [0, extent).
//
// Negative inputs wrap from the far edge: wrap(-100, 1000) == 900.
// A non-positive extent leaves the value untouched.
inline double wrap(double v, double extent) {
  if (!(extent > 0.0)) return v;
  return std::fmod(std::fmod(v, extent) + extent, extent);
}

inline Vec2 wrap_position(const Vec2& p, double width, double height) {
  return {wrap(p.x, width), wrap(p.y, height)};
}

namespace detail {
// Shortest absolute separation along one wrapped axis.
inline double axis_separation(double a, double b, double extent) {
  const double d = std::abs(a - b);
  if (!(extent > 0.0)) return d;
  const double m = std::fmod(d, extent);
  return std::min(m, extent - m);
}

// Signed delta a->b along one axis, folded to the shorter wrap direction.
inline double axis_delta(double a, double b, double extent) {
  double d = b - a;
  if (!(extent > 0.0)) return d;
  const double half = extent * 0.5;
  if (d > half) d -= extent;
  if (d < -half) d += extent;
  return d;
}
} // namespace detail

// Shortest distance between two points on the torus.
inline double shortest_distance(const Vec2& a, const Vec2& b, double width, double height) {
  const double dx = detail::axis_separation(a.x, b.x, width);
  const double dy = detail::axis_separation(a.y, b.y, height);
  return std::sqrt(dx * dx + dy * dy);
}

inline double shortest_distance(double x1, double y1, double x2, double y2, double width, double height) {
  return shortest_distance(Vec2{x1, y1}, Vec2{x2, y2}, width, height);
}

// Displacement a->b choosing, per axis, the shorter of the two wrap directions.
//
// Only meant for aiming math and for links that were stored without an
// intended vector. A projectile already in flight must keep the vector it was
// launched with: at exactly half the map extent this function may pick the
// opposite direction from the one actually flown.
inline Vec2 shortest_vector(const Vec2& a, const Vec2& b, double width, double height) {
  return {detail::axis_delta(a.x, b.x, width), detail::axis_delta(a.y, b.y, height)};
}

} // namespace slingnet
