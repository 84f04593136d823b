#include "config_loader.h"
#include "comet_status.h"

using json = nlohmann::json;

namespace comet {

void validate_config(const SimConfig &config) {
  // Negated compares so NaN fails too
  if (!(config.world.width > 0.0f) || !(config.world.height > 0.0f))
    throw ConfigError("world width and height must be > 0");
  if (!(config.tick_rate > 0.0f))
    throw ConfigError("world tick_rate must be > 0");

  const ShipConfig &s = config.ship;
  if (!(s.radius > 0.0f) || !(s.mass > 0.0f) || !(s.max_velocity > 0.0f))
    throw ConfigError("ship radius, mass and max_velocity must be > 0");
  if (!(s.drag >= 0.0f && s.drag < 1.0f))
    throw ConfigError("ship drag must be in [0, 1)");
  if (!(s.thrust_power >= 0.0f))
    throw ConfigError("ship thrust_power must be >= 0");

  if (!(config.projectiles.speed > 0.0f))
    throw ConfigError("projectile speed must be > 0");

  // Subsystem constructors carry the remaining rules
  ProjectileConfig pc = config.projectiles;
  pc.bounds = config.world;
  ProjectileSystem pool(pc);
  FractureSystem fracture(config.fracture, config.world);
  SteeringPilot pilot(config.steering);
}

// ── Section readers ─────────────────────────────────────────
static void read_tiers(const json &arr, std::vector<TierSpec> &out) {
  if (!arr.is_array())
    throw ConfigError("'tiers' must be an array");
  out.clear();
  for (const json &t : arr) {
    TierSpec row;
    row.tier = t.at("tier").get<int>();
    row.radius = t.value("radius", row.radius);
    row.health = t.value("health", row.health);
    row.points = t.value("points", row.points);
    row.child_count = t.value("child_count", row.child_count);
    row.child_tier = t.value("child_tier", row.child_tier);
    out.push_back(row);
  }
}

static void read_weights(const json &arr, SizeWeights &out) {
  if (!arr.is_array() || arr.size() != out.size())
    throw ConfigError("size weights must be an array of 5 tier ids");
  for (size_t i = 0; i < out.size(); i++)
    out[i] = arr[i].get<int>();
}

SimConfig config_from_json(const json &j) {
  SimConfig c;
  try {
    if (!j.is_object())
      throw ConfigError("top level must be an object");

    if (j.contains("world")) {
      const json &w = j["world"];
      c.world.width = w.value("width", c.world.width);
      c.world.height = w.value("height", c.world.height);
      c.tick_rate = w.value("tick_rate", c.tick_rate);
    }

    if (j.contains("projectiles")) {
      const json &p = j["projectiles"];
      auto &pc = c.projectiles;
      pc.pool_size = p.value("pool_size", pc.pool_size);
      pc.cooldown_ms = p.value("cooldown_ms", pc.cooldown_ms);
      pc.lifetime = p.value("lifetime", pc.lifetime);
      pc.radius = p.value("radius", pc.radius);
      pc.speed = p.value("speed", pc.speed);
      pc.damage = p.value("damage", pc.damage);
    }

    if (j.contains("fracture")) {
      const json &f = j["fracture"];
      auto &fc = c.fracture;
      fc.scatter_speed_min = f.value("scatter_speed_min", fc.scatter_speed_min);
      fc.scatter_speed_max = f.value("scatter_speed_max", fc.scatter_speed_max);
      fc.scatter_cone = f.value("scatter_cone", fc.scatter_cone);
      fc.spawn_jitter = f.value("spawn_jitter", fc.spawn_jitter);
      fc.spawn_margin = f.value("spawn_margin", fc.spawn_margin);
      fc.safe_zone_buffer = f.value("safe_zone_buffer", fc.safe_zone_buffer);
      fc.placement_retries = f.value("placement_retries", fc.placement_retries);
      fc.initial_speed_min = f.value("initial_speed_min", fc.initial_speed_min);
      fc.initial_speed_max = f.value("initial_speed_max", fc.initial_speed_max);
      fc.angular_speed_max = f.value("angular_speed_max", fc.angular_speed_max);
      fc.max_speed = f.value("max_speed", fc.max_speed);
      if (f.contains("initial_size_weights"))
        read_weights(f["initial_size_weights"], fc.initial_size_weights);
    }

    if (j.contains("tiers"))
      read_tiers(j["tiers"], c.fracture.tiers);

    if (j.contains("steering")) {
      const json &s = j["steering"];
      auto &sc = c.steering;
      sc.seek_weight = s.value("seek_weight", sc.seek_weight);
      sc.avoid_weight = s.value("avoid_weight", sc.avoid_weight);
      sc.turn_rate = s.value("turn_rate", sc.turn_rate);
      sc.danger_radius = s.value("danger_radius", sc.danger_radius);
      sc.arrival_tolerance = s.value("arrival_tolerance", sc.arrival_tolerance);
      sc.max_steer_force = s.value("max_steer_force", sc.max_steer_force);
      sc.waypoint_margin = s.value("waypoint_margin", sc.waypoint_margin);
      sc.waypoint_candidates =
          s.value("waypoint_candidates", sc.waypoint_candidates);
      sc.maneuver_cooldown_ticks =
          s.value("maneuver_cooldown_ticks", sc.maneuver_cooldown_ticks);
    }

    if (j.contains("ship")) {
      const json &s = j["ship"];
      auto &sh = c.ship;
      sh.radius = s.value("radius", sh.radius);
      sh.mass = s.value("mass", sh.mass);
      sh.thrust_power = s.value("thrust_power", sh.thrust_power);
      sh.drag = s.value("drag", sh.drag);
      sh.max_velocity = s.value("max_velocity", sh.max_velocity);
      sh.gun_damage = s.value("gun_damage", sh.gun_damage);
    }

    if (j.contains("waves")) {
      const json &w = j["waves"];
      auto &wc = c.fracture.waves;
      wc.base_count = w.value("base_count", wc.base_count);
      wc.per_wave = w.value("per_wave", wc.per_wave);
      wc.max_count = w.value("max_count", wc.max_count);
      wc.speed_step = w.value("speed_step", wc.speed_step);
      wc.safe_radius = w.value("safe_radius", wc.safe_radius);
      wc.auto_advance = w.value("auto_advance", wc.auto_advance);
    }

    if (j.contains("seed")) {
      if (!j["seed"].is_number_unsigned())
        throw ConfigError("seed must be an unsigned integer");
      c.seed = j["seed"].get<uint64_t>();
    }
  } catch (const json::exception &e) {
    throw ConfigError(std::string("bad value: ") + e.what());
  }

  c.projectiles.bounds = c.world;
  validate_config(c);
  return c;
}

SimConfig parse_config(const std::string &text) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error &e) {
    throw ConfigError(std::string("parse error: ") + e.what());
  }
  return config_from_json(j);
}

json config_to_json(const SimConfig &c) {
  json tiers = json::array();
  for (const TierSpec &t : c.fracture.tiers) {
    tiers.push_back({{"tier", t.tier},
                     {"radius", t.radius},
                     {"health", t.health},
                     {"points", t.points},
                     {"child_count", t.child_count},
                     {"child_tier", t.child_tier}});
  }

  const auto &pc = c.projectiles;
  const auto &fc = c.fracture;
  const auto &sc = c.steering;
  const auto &sh = c.ship;
  const auto &wc = c.fracture.waves;

  return {
      {"world",
       {{"width", c.world.width},
        {"height", c.world.height},
        {"tick_rate", c.tick_rate}}},
      {"projectiles",
       {{"pool_size", pc.pool_size},
        {"cooldown_ms", pc.cooldown_ms},
        {"lifetime", pc.lifetime},
        {"radius", pc.radius},
        {"speed", pc.speed},
        {"damage", pc.damage}}},
      {"fracture",
       {{"scatter_speed_min", fc.scatter_speed_min},
        {"scatter_speed_max", fc.scatter_speed_max},
        {"scatter_cone", fc.scatter_cone},
        {"spawn_jitter", fc.spawn_jitter},
        {"spawn_margin", fc.spawn_margin},
        {"safe_zone_buffer", fc.safe_zone_buffer},
        {"placement_retries", fc.placement_retries},
        {"initial_speed_min", fc.initial_speed_min},
        {"initial_speed_max", fc.initial_speed_max},
        {"angular_speed_max", fc.angular_speed_max},
        {"max_speed", fc.max_speed},
        {"initial_size_weights", fc.initial_size_weights}}},
      {"tiers", tiers},
      {"steering",
       {{"seek_weight", sc.seek_weight},
        {"avoid_weight", sc.avoid_weight},
        {"turn_rate", sc.turn_rate},
        {"danger_radius", sc.danger_radius},
        {"arrival_tolerance", sc.arrival_tolerance},
        {"max_steer_force", sc.max_steer_force},
        {"waypoint_margin", sc.waypoint_margin},
        {"waypoint_candidates", sc.waypoint_candidates},
        {"maneuver_cooldown_ticks", sc.maneuver_cooldown_ticks}}},
      {"ship",
       {{"radius", sh.radius},
        {"mass", sh.mass},
        {"thrust_power", sh.thrust_power},
        {"drag", sh.drag},
        {"max_velocity", sh.max_velocity},
        {"gun_damage", sh.gun_damage}}},
      {"waves",
       {{"base_count", wc.base_count},
        {"per_wave", wc.per_wave},
        {"max_count", wc.max_count},
        {"speed_step", wc.speed_step},
        {"safe_radius", wc.safe_radius},
        {"auto_advance", wc.auto_advance}}},
      {"seed", c.seed},
  };
}

} // namespace comet
