#ifndef COMET_FRACTURE_SYSTEM_H
#define COMET_FRACTURE_SYSTEM_H

#include "kinetics.h"
#include "sim_rng.h"
#include <array>
#include <cstdint>
#include <optional>
#include <vector>

namespace comet {

// One row of the size-tier table. child_count == 0 marks a terminal tier.
struct TierSpec {
  int tier = 1;
  float radius = 2.0f;
  float health = 1.0f;
  int points = 100;
  int child_count = 0;
  int child_tier = 0;
};

struct AsteroidFragment {
  KineticEntity body;
  int tier = 1;
  float health = 1.0f;
  float radius = 2.0f;
  int points = 0;
  uint64_t serial = 0; // spawn order, assigned by the owning field
};

// Circle the spawner keeps clear (usually around the player ship)
struct SafeZone {
  Vec2 center;
  float radius = 40.0f;
};

// Five weighted draws: e.g. {3,3,2,2,1} = 40% large, 40% medium, 20% small
using SizeWeights = std::array<int, 5>;

struct WaveDifficulty {
  int wave_number = 1;
  int asteroid_count = 4;
  float speed_multiplier = 1.0f;
  SizeWeights size_weights{{3, 3, 2, 2, 1}};
};

struct WaveConfig {
  int base_count = 4;
  int per_wave = 2;
  int max_count = 12;
  float speed_step = 0.1f;
  float safe_radius = 40.0f;
  bool auto_advance = true; // next wave spawns when the field empties
};

struct FractureConfig {
  std::vector<TierSpec> tiers{
      {3, 8.0f, 3.0f, 20, 2, 2}, // Large
      {2, 4.0f, 2.0f, 50, 2, 1}, // Medium
      {1, 2.0f, 1.0f, 100, 0, 0} // Small (terminal)
  };
  float scatter_speed_min = 15.0f;
  float scatter_speed_max = 40.0f;
  float scatter_cone = PI / 3.0f; // 60° cone around the impact direction
  float spawn_jitter = 2.0f;      // ± offset so children never overlap exactly
  float spawn_margin = 20.0f;     // wave bodies stay this far from edges
  float safe_zone_buffer = 10.0f;
  int placement_retries = 50;
  float initial_speed_min = 15.0f;
  float initial_speed_max = 30.0f;
  float angular_speed_max = 1.0f;
  float max_speed = 200.0f; // hard cap for any fragment
  SizeWeights initial_size_weights{{3, 3, 2, 2, 1}};
  WaveConfig waves;
};

// ═════════════════════════════════════════════════════════════
// FractureSystem — cascading splits driven by the tier table.
//
// Owns no bodies. Every method is const: fragments come back by
// value and the caller (AsteroidField) stores them. Randomness
// always comes from the SimRng passed in.
// ═════════════════════════════════════════════════════════════
class FractureSystem {
public:
  FractureSystem(); // default table, default bounds
  FractureSystem(const FractureConfig &config, const WrapBounds &bounds);

  const TierSpec *tier(int tier) const;
  int largest_tier() const { return largest_tier_; }
  int terminal_tier() const { return terminal_tier_; }

  AsteroidFragment make_fragment(int tier, Vec2 position, Vec2 velocity,
                                 SimRng &rng) const;

  // Terminal tier → empty (the body just vanishes)
  std::vector<AsteroidFragment>
  fracture_asteroid(const AsteroidFragment &asteroid,
                    std::optional<float> impact_angle, SimRng &rng) const;

  std::vector<AsteroidFragment>
  create_initial_asteroids(int count, std::optional<SafeZone> safe_zone,
                           SimRng &rng) const;

  std::vector<AsteroidFragment> create_wave(const WaveDifficulty &difficulty,
                                            std::optional<SafeZone> safe_zone,
                                            SimRng &rng) const;

  WaveDifficulty calculate_wave_difficulty(int wave_number) const;

  Vec2 find_spawn_position(std::optional<SafeZone> safe_zone,
                           SimRng &rng) const;

  const FractureConfig &config() const { return config_; }
  const WrapBounds &bounds() const { return bounds_; }

private:
  void validate() const;

  FractureConfig config_;
  WrapBounds bounds_;
  int largest_tier_ = 0;
  int terminal_tier_ = 0;
};

} // namespace comet

#endif // COMET_FRACTURE_SYSTEM_H
