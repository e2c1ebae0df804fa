#include "slingnet/util/digest.h"

#include <cstring>
#include <type_traits>

namespace slingnet {
namespace {

// FNV-1a, 64 bit. Multi-byte values are fed little-endian.
class Fnv1a64 {
 public:
  void byte(std::uint8_t b) {
    h_ ^= b;
    h_ *= kPrime;
  }

  void u64(std::uint64_t v) {
    for (int i = 0; i < 8; ++i) byte(static_cast<std::uint8_t>(v >> (8 * i)));
  }

  void i64(std::int64_t v) { u64(static_cast<std::uint64_t>(v)); }
  void flag(bool b) { byte(b ? 1 : 0); }

  template <typename E>
  void tag(E e) {
    static_assert(std::is_enum_v<E>);
    u64(static_cast<std::uint64_t>(e));
  }

  void str(const std::string& s) {
    u64(s.size());
    for (const unsigned char c : s) byte(c);
  }

  void real(double d) {
    // -0.0 and +0.0 compare equal and must hash equal.
    if (d == 0.0) d = 0.0;
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(d));
    std::memcpy(&bits, &d, sizeof(bits));
    u64(bits);
  }

  void vec(const Vec2& v) {
    real(v.x);
    real(v.y);
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffsetBasis = 14695981039346656037ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffsetBasis};
};

void hash_entity(Fnv1a64& h, const Entity& e) {
  h.u64(e.id);
  h.tag(e.type);
  h.str(e.owner);
  h.vec(e.position);
  h.real(e.hp);
  h.flag(e.fuel.has_value());
  if (e.fuel) {
    h.i64(e.fuel->fuel);
    h.i64(e.fuel->max_fuel);
  }
  h.flag(e.is_starter);
  h.flag(e.deployed);
}

void hash_link(Fnv1a64& h, const Link& l) {
  h.u64(l.from_id);
  h.u64(l.to_id);
  h.str(l.owner);
  h.flag(l.intended.has_value());
  if (l.intended) h.vec(*l.intended);
}

} // namespace

std::uint64_t digest_game_state64(const GameState& state) {
  Fnv1a64 h;
  h.i64(state.turn);
  h.u64(state.next_id);

  const std::vector<PlayerId> ids = sorted_player_ids(state);
  h.u64(ids.size());
  for (const PlayerId& pid : ids) {
    const Player& p = state.players.at(pid);
    h.str(p.id);
    h.i64(p.energy);
    h.str(p.color);
    h.flag(p.alive);
  }

  h.u64(state.entities.size());
  for (const Entity& e : state.entities) hash_entity(h, e);

  h.u64(state.links.size());
  for (const Link& l : state.links) hash_link(h, l);

  h.real(state.map.width);
  h.real(state.map.height);
  h.u64(state.map.resources.size());
  for (const ResourceNode& r : state.map.resources) {
    h.str(r.id);
    h.vec(r.position);
    h.i64(r.value);
  }

  h.flag(state.winner.has_value());
  if (state.winner) h.str(*state.winner);
  return h.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  static const char* kHex = "0123456789abcdef";
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = kHex[v & 0xFu];
    v >>= 4;
  }
  return out;
}

} // namespace slingnet
