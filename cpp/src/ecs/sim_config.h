#ifndef COMET_SIM_CONFIG_H
#define COMET_SIM_CONFIG_H

#include "fracture_system.h"
#include "projectile_pool.h"
#include "steering_pilot.h"
#include <cstdint>

namespace comet {

struct ShipConfig {
  float radius = 4.0f;
  float mass = 1.0f;
  float thrust_power = 20.0f;
  float drag = 0.02f; // per tick
  float max_velocity = 60.0f;
  float gun_damage = 1.0f;
};

// Everything install_simulation() needs. Loaded from JSON by
// config_loader, or built in code by tests.
struct SimConfig {
  WrapBounds world;
  float tick_rate = 60.0f; // Hz, fixed step for the host loop
  ProjectileConfig projectiles;
  FractureConfig fracture; // tiers + waves live here
  SteeringConfig steering;
  ShipConfig ship;
  uint64_t seed = 42;
};

// Throws ConfigError on the first violated rule. Runs every
// subsystem's own constructor checks as well.
void validate_config(const SimConfig &config);

} // namespace comet

#endif // COMET_SIM_CONFIG_H
