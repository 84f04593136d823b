#ifndef COMET_COMPONENTS_H
#define COMET_COMPONENTS_H

#include "collision.h"
#include "kinetics.h"
#include "sim_config.h"
#include "steering_pilot.h"
#include <cstdint>
#include <vector>

/**
 * The Comet Engine — ECS Component Definitions
 *
 * Ships are flecs entities. Projectiles and asteroids are NOT:
 * they live in the ProjectileSystem pool and the AsteroidField
 * singleton, which keeps their iteration order stable for
 * deterministic replay.
 */

namespace comet {

// ─── Ships ────────────────────────────────────────────────
// KineticEntity itself is the ship's physics component.
struct ShipHull {
  float radius;
}; // 4 bytes

struct Autopilot {
  SteeringPilot pilot;
  Vec2 last_steering; // for debug draw / telemetry
};

struct Gunner {
  float damage;
  bool auto_fire; // fire along heading whenever the cooldown allows
};

struct IsAlive {};    // Tag (0 bytes)
struct PlayerShip {}; // Tag — centre of the wave safe zone

// ─── Singletons ───────────────────────────────────────────
struct SimClock {
  double now = 0.0; // seconds of simulation time
  uint64_t tick = 0;
};

struct WaveState {
  int wave = 0; // 0 = no wave started yet
  bool auto_advance = true;
  int waves_cleared = 0;
};

// Asteroid positions frozen at the end of the previous tick.
// Built once per tick, read by every autopilot.
struct ThreatBoard {
  std::vector<Threat> threats;
};

// ─── Frame output (read once per tick by the renderer) ────
struct BodyFrame {
  float x, y;
  float heading;
  float radius;
  int tier;     // asteroids only, 0 otherwise
  uint64_t id;  // ship entity id / asteroid serial / projectile owner
};

struct FrameSnapshot {
  uint64_t tick = 0;
  double now = 0.0;
  std::vector<BodyFrame> ships;
  std::vector<BodyFrame> asteroids;
  std::vector<BodyFrame> projectiles;
  int pool_available = 0;
  int pool_active = 0;
};

} // namespace comet

#endif // COMET_COMPONENTS_H
