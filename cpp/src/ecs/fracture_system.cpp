#include "fracture_system.h"
#include "comet_status.h"
#include <algorithm>
#include <cstdint>
#include <string>

namespace comet {

FractureSystem::FractureSystem() : FractureSystem(FractureConfig{}, {}) {}

FractureSystem::FractureSystem(const FractureConfig &config,
                               const WrapBounds &bounds)
    : config_(config), bounds_(bounds) {
  validate();

  largest_tier_ = config_.tiers.front().tier;
  terminal_tier_ = config_.tiers.front().tier;
  for (const TierSpec &t : config_.tiers) {
    largest_tier_ = std::max(largest_tier_, t.tier);
    terminal_tier_ = std::min(terminal_tier_, t.tier);
  }
}

void FractureSystem::validate() const {
  const auto &tiers = config_.tiers;
  if (tiers.empty())
    throw ConfigError("size-tier table is empty");

  auto find = [&](int id) -> const TierSpec * {
    for (const TierSpec &t : tiers)
      if (t.tier == id)
        return &t;
    return nullptr;
  };

  int smallest = tiers.front().tier;
  for (size_t i = 0; i < tiers.size(); i++) {
    const TierSpec &t = tiers[i];
    std::string name = "tier " + std::to_string(t.tier);

    if (t.tier < 1)
      throw ConfigError(name + ": tier ids start at 1");
    for (size_t j = i + 1; j < tiers.size(); j++)
      if (tiers[j].tier == t.tier)
        throw ConfigError(name + ": duplicate tier id");
    if (t.radius <= 0.0f)
      throw ConfigError(name + ": radius must be > 0");
    if (t.health <= 0.0f)
      throw ConfigError(name + ": health must be > 0");
    if (t.points < 0)
      throw ConfigError(name + ": points must be >= 0");
    if (t.child_count < 0)
      throw ConfigError(name + ": child_count must be >= 0");

    // Children must be strictly smaller: guarantees every cascade ends
    if (t.child_count > 0) {
      if (!find(t.child_tier))
        throw ConfigError(name + ": child_tier " +
                          std::to_string(t.child_tier) + " is not in the table");
      if (t.child_tier >= t.tier)
        throw ConfigError(name + ": child_tier must be smaller than the parent");
    }
    smallest = std::min(smallest, t.tier);
  }

  if (find(smallest)->child_count != 0)
    throw ConfigError("smallest tier " + std::to_string(smallest) +
                      " must be terminal (child_count 0)");

  if (config_.scatter_speed_min < 0.0f ||
      config_.scatter_speed_max < config_.scatter_speed_min)
    throw ConfigError("scatter speed range is invalid");
  if (config_.initial_speed_min < 0.0f ||
      config_.initial_speed_max < config_.initial_speed_min)
    throw ConfigError("initial speed range is invalid");
  if (config_.scatter_cone < 0.0f || config_.spawn_jitter < 0.0f)
    throw ConfigError("scatter cone and spawn jitter must be >= 0");
  if (config_.placement_retries < 0)
    throw ConfigError("placement_retries must be >= 0");
  if (config_.max_speed <= 0.0f)
    throw ConfigError("fragment max_speed must be > 0");
  if (bounds_.width <= 0.0f || bounds_.height <= 0.0f)
    throw ConfigError("world bounds must be positive");
  if (config_.spawn_margin < 0.0f || config_.spawn_margin * 2.0f >= bounds_.width ||
      config_.spawn_margin * 2.0f >= bounds_.height)
    throw ConfigError("spawn_margin leaves no room inside the world bounds");

  for (int w : config_.initial_size_weights)
    if (!find(w))
      throw ConfigError("initial size weight names unknown tier " +
                        std::to_string(w));

  const WaveConfig &wv = config_.waves;
  if (wv.base_count < 0 || wv.per_wave < 0 || wv.max_count < wv.base_count)
    throw ConfigError("wave asteroid counts are invalid");
  if (wv.speed_step < 0.0f || wv.safe_radius < 0.0f)
    throw ConfigError("wave speed_step and safe_radius must be >= 0");
}

const TierSpec *FractureSystem::tier(int tier) const {
  for (const TierSpec &t : config_.tiers)
    if (t.tier == tier)
      return &t;
  return nullptr;
}

AsteroidFragment FractureSystem::make_fragment(int tier_id, Vec2 position,
                                               Vec2 velocity,
                                               SimRng &rng) const {
  // Unknown tiers collapse to the terminal tier
  const TierSpec *row = tier(tier_id);
  if (!row)
    row = tier(terminal_tier_);

  AsteroidFragment f;
  f.tier = row->tier;
  f.health = row->health;
  f.radius = row->radius;
  f.points = row->points;

  f.body.bounds = bounds_;
  f.body.position = position;
  f.body.velocity = velocity;
  f.body.max_velocity = config_.max_speed;
  f.body.mass = row->radius * 2.0f;
  f.body.drag = 0.0f; // rocks coast forever
  f.body.heading = rng.uniform(0.0f, TWO_PI);
  f.body.angular_velocity =
      rng.uniform(-config_.angular_speed_max, config_.angular_speed_max);
  f.body.wrap_position();
  return f;
}

std::vector<AsteroidFragment>
FractureSystem::fracture_asteroid(const AsteroidFragment &asteroid,
                                  std::optional<float> impact_angle,
                                  SimRng &rng) const {
  std::vector<AsteroidFragment> children;

  const TierSpec *row = tier(asteroid.tier);
  if (!row || row->child_count == 0)
    return children;

  float base_angle =
      impact_angle ? *impact_angle : rng.uniform(0.0f, TWO_PI);
  int n = row->child_count;
  children.reserve((size_t)n);

  for (int i = 0; i < n; i++) {
    // Evenly spread across the cone, centred on the impact direction
    float offset =
        (n > 1) ? (((float)i + 0.5f) / (float)n - 0.5f) * config_.scatter_cone
                : 0.0f;
    float speed =
        rng.uniform(config_.scatter_speed_min, config_.scatter_speed_max);
    Vec2 velocity = asteroid.body.velocity * 0.5f +
                    Vec2::from_angle(base_angle + offset, speed);

    Vec2 jitter{rng.uniform(-config_.spawn_jitter, config_.spawn_jitter),
                rng.uniform(-config_.spawn_jitter, config_.spawn_jitter)};

    children.push_back(make_fragment(row->child_tier,
                                     asteroid.body.position + jitter, velocity,
                                     rng));
  }
  return children;
}

Vec2 FractureSystem::find_spawn_position(std::optional<SafeZone> safe_zone,
                                         SimRng &rng) const {
  float m = config_.spawn_margin;
  float max_x = bounds_.width - m;
  float max_y = bounds_.height - m;

  if (!safe_zone)
    return {rng.uniform(m, max_x), rng.uniform(m, max_y)};

  float keep_out = safe_zone->radius + config_.safe_zone_buffer;
  for (int attempt = 0; attempt < config_.placement_retries; attempt++) {
    Vec2 p{rng.uniform(m, max_x), rng.uniform(m, max_y)};
    Vec2 d = toroidal_delta(safe_zone->center, p, bounds_);
    if (d.length_sq() > keep_out * keep_out)
      return p;
  }

  // Retries exhausted: drop it on one of the four margin edges
  switch (rng.index(4)) {
  case 0:
    return {m, rng.uniform(m, max_y)};
  case 1:
    return {max_x, rng.uniform(m, max_y)};
  case 2:
    return {rng.uniform(m, max_x), m};
  default:
    return {rng.uniform(m, max_x), max_y};
  }
}

std::vector<AsteroidFragment>
FractureSystem::create_wave(const WaveDifficulty &difficulty,
                            std::optional<SafeZone> safe_zone,
                            SimRng &rng) const {
  std::vector<AsteroidFragment> wave;
  if (difficulty.asteroid_count <= 0)
    return wave;
  wave.reserve((size_t)difficulty.asteroid_count);

  for (int i = 0; i < difficulty.asteroid_count; i++) {
    int size = difficulty.size_weights[rng.index(
        (uint32_t)difficulty.size_weights.size())];
    Vec2 pos = find_spawn_position(safe_zone, rng);

    float speed =
        rng.uniform(config_.initial_speed_min, config_.initial_speed_max) *
        difficulty.speed_multiplier;
    float angle = rng.uniform(0.0f, TWO_PI);

    wave.push_back(make_fragment(size, pos, Vec2::from_angle(angle, speed), rng));
  }
  return wave;
}

std::vector<AsteroidFragment>
FractureSystem::create_initial_asteroids(int count,
                                         std::optional<SafeZone> safe_zone,
                                         SimRng &rng) const {
  WaveDifficulty d;
  d.wave_number = 1;
  d.asteroid_count = count;
  d.speed_multiplier = 1.0f;
  d.size_weights = config_.initial_size_weights;
  return create_wave(d, safe_zone, rng);
}

WaveDifficulty FractureSystem::calculate_wave_difficulty(int wave_number) const {
  // Weights shift toward small, fast rocks every two waves
  static constexpr SizeWeights RAMP[] = {
      {{3, 3, 2, 2, 1}}, // waves 1-2
      {{3, 2, 2, 1, 1}}, // waves 3-4
      {{2, 2, 1, 1, 1}}, // waves 5-6
      {{2, 1, 1, 1, 1}}, // waves 7+
  };
  constexpr int RAMP_LEN = (int)(sizeof(RAMP) / sizeof(RAMP[0]));

  if (wave_number < 1)
    wave_number = 1;

  const WaveConfig &wv = config_.waves;
  WaveDifficulty d;
  d.wave_number = wave_number;
  // 64-bit so huge wave numbers saturate at the cap instead of wrapping
  int64_t count =
      (int64_t)wv.base_count + (int64_t)(wave_number - 1) * wv.per_wave;
  d.asteroid_count = (int)std::min<int64_t>(count, wv.max_count);
  d.speed_multiplier = 1.0f + (float)(wave_number - 1) * wv.speed_step;

  int idx = std::min((wave_number - 1) / 2, RAMP_LEN - 1);
  d.size_weights = RAMP[idx];

  // Tables without tier 3 (or 2) fold the ramp onto their own range
  for (int &w : d.size_weights) {
    if (!tier(w))
      w = (w > largest_tier_) ? largest_tier_ : terminal_tier_;
  }
  return d;
}

} // namespace comet
