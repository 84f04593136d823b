#ifndef COMET_PROJECTILE_POOL_H
#define COMET_PROJECTILE_POOL_H

#include "comet_status.h"
#include "kinetics.h"
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace comet {

struct ProjectileConfig {
  int pool_size = 64;
  float cooldown_ms = 250.0f;
  float lifetime = 1.0f; // seconds of simulation time
  float radius = 1.0f;
  float speed = 120.0f;  // default muzzle speed (gunnery, GDScript fire)
  float damage = 1.0f;
  WrapBounds bounds;
};

// Exactly one KineticEntity per projectile, never shared.
struct Projectile {
  KineticEntity body;
  uint64_t owner_id = 0;
  float damage = 0.0f;
  float radius = 1.0f;
  double spawn_time = 0.0;
  float lifetime = 1.0f;
  uint32_t generation = 0; // bumped on every recycle
  bool active = false;
};

// Stale generation == projectile already returned to the pool.
struct ProjectileHandle {
  uint32_t slot = 0;
  uint32_t generation = 0;

  bool operator==(const ProjectileHandle &o) const {
    return slot == o.slot && generation == o.generation;
  }
};

// ═════════════════════════════════════════════════════════════
// ProjectileSystem — fixed pool + per-owner fire cooldowns.
//
// Slots are preallocated once. free_slots is a recycling stack
// (O(1) push/pop); active_slots keeps firing order so collision
// sweeps visit projectiles in a stable sequence.
//
// Invariant: pool_count() + active_count() == capacity().
// Not thread-safe: one world, one thread.
// ═════════════════════════════════════════════════════════════
class ProjectileSystem {
public:
  ProjectileSystem() = default; // empty, can never fire
  explicit ProjectileSystem(const ProjectileConfig &config);

  bool can_fire(uint64_t owner_id, double now) const;

  Result<ProjectileHandle> fire_projectile(uint64_t owner_id, Vec2 origin,
                                           float angle, double now,
                                           float damage, float speed);

  // Physics for every active projectile
  void integrate(float dt);

  // Recycles projectiles with now - spawn_time > lifetime. Returns count.
  int sweep_expired(double now);

  // integrate() then sweep_expired()
  int update(float dt, double now);

  Status release(ProjectileHandle handle);
  Result<const Projectile *> get(ProjectileHandle handle) const;

  // 0 for owners that never fired; exactly 0 from last_fire + cooldown on
  double get_cooldown_remaining(uint64_t owner_id, double now) const;
  void reset_cooldown(uint64_t owner_id) { last_fire_time_.erase(owner_id); }

  // Recycle every active projectile (cooldowns are kept)
  void clear();

  // Active projectiles in firing order
  template <class Fn> void each_active(Fn &&fn) const {
    for (uint32_t slot : active_slots_)
      fn(ProjectileHandle{slot, slots_[slot].generation}, slots_[slot]);
  }

  int capacity() const { return (int)slots_.size(); }
  int pool_count() const { return (int)free_slots_.size(); }
  int active_count() const { return (int)active_slots_.size(); }
  const ProjectileConfig &config() const { return config_; }

  uint64_t total_fired() const { return total_fired_; }
  uint64_t total_expired() const { return total_expired_; }
  uint64_t total_recycled() const { return total_recycled_; }

private:
  void recycle_slot(uint32_t slot);
  bool is_live(ProjectileHandle handle) const;

  ProjectileConfig config_;
  double cooldown_s_ = 0.0;
  std::vector<Projectile> slots_;
  std::vector<uint32_t> free_slots_;   // Recycling stack
  std::vector<uint32_t> active_slots_; // Firing order
  std::unordered_map<uint64_t, double> last_fire_time_;

  uint64_t total_fired_ = 0;
  uint64_t total_expired_ = 0;
  uint64_t total_recycled_ = 0;
};

} // namespace comet

#endif // COMET_PROJECTILE_POOL_H
