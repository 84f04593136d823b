#ifndef COMET_SYSTEMS_H
#define COMET_SYSTEMS_H

#include "comet_components.h"
#include <flecs.h>
#include <optional>

namespace comet {

// Names every component and singleton type with the world.
void register_components(flecs::world &ecs);

// Validates the config, seeds the singletons (clock, rng, pool,
// fracture table, asteroid field, wave state, reports) and
// registers every simulation system. Throws ConfigError.
void install_simulation(flecs::world &ecs, const SimConfig &config);

// Per-tick pipeline, phase by phase:
//   OnLoad     clock
//   PreUpdate  threat snapshot, autopilot steering, gunnery
//   OnUpdate   ship / asteroid / projectile kinematics
//   OnValidate projectile expiry
//   PostUpdate collisions, wave progression
//   OnStore    frame snapshot
void register_simulation_systems(flecs::world &ecs);

// ── Spawning ────────────────────────────────────────────────
flecs::entity spawn_ship(flecs::world &ecs, Vec2 position, float heading,
                         bool player);
flecs::entity spawn_autopilot_ship(flecs::world &ecs, Vec2 position,
                                   float heading, bool auto_fire);

// Fires from the ship's nose along its heading at the configured
// muzzle speed. UnknownEntity for a dead or non-ship entity.
Result<ProjectileHandle> fire_from_ship(flecs::world &ecs,
                                        flecs::entity ship);

// Wave `wave` from the difficulty curve, kept clear of the player.
// Returns the number of asteroids spawned.
int start_wave(flecs::world &ecs, int wave);
int spawn_initial_asteroids(flecs::world &ecs, int count);

// Circle around the first live PlayerShip, if any.
std::optional<SafeZone> player_safe_zone(flecs::world &ecs);

} // namespace comet

#endif // COMET_SYSTEMS_H
