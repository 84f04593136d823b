#ifndef COMET_COLLISION_H
#define COMET_COLLISION_H

#include "fracture_system.h"
#include "projectile_pool.h"
#include <cstdint>
#include <vector>

namespace comet {

// ─── Asteroid storage (world singleton) ───────────────────
// Serials only ever grow, so field order == spawn order.
struct AsteroidField {
  std::vector<AsteroidFragment> bodies;
  uint64_t next_serial = 1;

  void add(AsteroidFragment f) {
    f.serial = next_serial++;
    bodies.push_back(f);
  }
  void add_all(const std::vector<AsteroidFragment> &fragments) {
    for (const AsteroidFragment &f : fragments)
      add(f);
  }

  int size() const { return (int)bodies.size(); }
  bool empty() const { return bodies.empty(); }
  void clear() { bodies.clear(); }
};

// ─── Tick output (consumed by scoring / UI collaborators) ─
enum class CollisionKind : uint8_t {
  AsteroidDestroyed = 0, // entity_id = projectile owner
  ShipHit = 1            // entity_id = ship
};

struct CollisionEvent {
  CollisionKind kind = CollisionKind::AsteroidDestroyed;
  uint64_t entity_id = 0;
  uint64_t asteroid_serial = 0;
  int tier = 0;
  int points = 0;
  Vec2 position;
};

struct TickReport {
  std::vector<CollisionEvent> events;
  int shots_fired = 0; // autopilot gunnery
  int projectiles_expired = 0;
  int projectiles_recycled = 0; // returned on impact
  int asteroids_destroyed = 0;
  int fragments_spawned = 0;
  int ship_hits = 0;
  int score = 0;
  int wave_spawned = 0; // wave number started this tick, 0 = none

  void clear() { *this = TickReport{}; }
};

// distance <= ra + rb, compared squared
inline bool circles_overlap(Vec2 a, float ra, Vec2 b, float rb) {
  float r = ra + rb;
  return (b - a).length_sq() <= r * r;
}

// Same test across the wrap seam
inline bool circles_overlap(Vec2 a, float ra, Vec2 b, float rb,
                            const WrapBounds &bounds) {
  float r = ra + rb;
  return toroidal_delta(a, b, bounds).length_sq() <= r * r;
}

// ═════════════════════════════════════════════════════════════
// Projectile ↔ asteroid broadphase.
//
// Projectiles in firing order, asteroids in field order. The
// first unstruck asteroid a projectile overlaps takes the hit:
// the projectile goes back to the pool, the asteroid is swapped
// for its fragments (or dropped at the terminal tier). Each
// asteroid can be struck once per sweep; fragments join the
// field after the sweep, in spawn order.
//
// Returns the number of asteroids destroyed.
// ═════════════════════════════════════════════════════════════
int resolve_projectile_hits(ProjectileSystem &projectiles,
                            AsteroidField &field,
                            const FractureSystem &fracture, SimRng &rng,
                            TickReport &report);

// Indices (field order) of every asteroid overlapping the ship. Pure.
std::vector<int> detect_ship_hits(const KineticEntity &ship, float ship_radius,
                                  const AsteroidField &field);

} // namespace comet

#endif // COMET_COLLISION_H
