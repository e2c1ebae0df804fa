#pragma once
#include <cmath>

namespace slingnet {

// 2D vector in map units. Positions are always stored wrapped into the map
// rectangle; displacement vectors (launch vectors, link directions) are not.
struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  Vec2(double x_, double y_) : x(x_), y(y_) {}

  Vec2 operator+(const Vec2& rhs) const { return {x + rhs.x, y + rhs.y}; }
  Vec2 operator-(const Vec2& rhs) const { return {x - rhs.x, y - rhs.y}; }
  Vec2 operator*(double s) const { return {x * s, y * s}; }

  // Exact equality; meant for stored/serialized coordinates.
  bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }

  Vec2& operator+=(const Vec2& rhs) {
    x += rhs.x;
    y += rhs.y;
    return *this;
  }

  double length() const { return std::sqrt(x * x + y * y); }
  double length_squared() const { return x * x + y * y; }
};

} // namespace slingnet
