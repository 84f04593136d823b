#include "world_manager.h"
#include "comet_systems.h"
#include "config_loader.h"
#include "rendering_bridge.h"
#include <cmath>
#include <godot_cpp/classes/engine.hpp>
#include <godot_cpp/classes/file_access.hpp>
#include <godot_cpp/variant/utility_functions.hpp>

// Catch-up cap: a long hitch runs at most this many fixed ticks
static constexpr int MAX_TICKS_PER_FRAME = 5;
static constexpr int MAX_PENDING_EVENTS = 4096;
static constexpr uint64_t DIAG_INTERVAL_TICKS = 600;

// ── Config file (res://) → SimConfig. Throws ConfigError. ───
static comet::SimConfig load_config_file(const godot::String &path) {
  if (!godot::FileAccess::file_exists(path)) {
    godot::UtilityFunctions::print("[CometEngine] No config at ", path,
                                   ", using defaults.");
    return comet::SimConfig{};
  }
  godot::String content = godot::FileAccess::get_file_as_string(path);
  return comet::parse_config(content.utf8().get_data());
}

// Id → live ship entity, or an invalid entity
static flecs::entity find_ship(const flecs::world &ecs, int64_t ship_id) {
  if (ship_id <= 0)
    return flecs::entity();
  flecs::entity e(ecs, (flecs::entity_t)ship_id);
  if (!e.is_alive() || !e.has<comet::ShipHull>())
    return flecs::entity();
  return e;
}

namespace godot {

CometServer::CometServer() {}

CometServer::~CometServer() {}

void CometServer::_bind_methods() {
  // Setup
  ClassDB::bind_method(D_METHOD("set_config_path", "path"),
                       &CometServer::set_config_path);
  ClassDB::bind_method(D_METHOD("get_config_path"),
                       &CometServer::get_config_path);
  ClassDB::bind_method(D_METHOD("init_ecs"), &CometServer::init_ecs);
  ClassDB::bind_method(D_METHOD("is_running"), &CometServer::is_running);

  // Spawning + orders
  ClassDB::bind_method(
      D_METHOD("spawn_ship", "x", "y", "heading", "is_player"),
      &CometServer::spawn_ship);
  ClassDB::bind_method(
      D_METHOD("spawn_autopilot_ship", "x", "y", "heading", "auto_fire"),
      &CometServer::spawn_autopilot_ship);
  ClassDB::bind_method(D_METHOD("fire", "ship_id"), &CometServer::fire);
  ClassDB::bind_method(D_METHOD("start_wave", "wave"),
                       &CometServer::start_wave);
  ClassDB::bind_method(D_METHOD("spawn_asteroids", "count"),
                       &CometServer::spawn_asteroids);
  ClassDB::bind_method(D_METHOD("get_wave"), &CometServer::get_wave);

  // Rendering
  ClassDB::bind_method(D_METHOD("get_ship_buffer"),
                       &CometServer::get_ship_buffer);
  ClassDB::bind_method(D_METHOD("get_ship_count"),
                       &CometServer::get_ship_count);
  ClassDB::bind_method(D_METHOD("get_asteroid_buffer"),
                       &CometServer::get_asteroid_buffer);
  ClassDB::bind_method(D_METHOD("get_asteroid_count"),
                       &CometServer::get_asteroid_count);
  ClassDB::bind_method(D_METHOD("get_projectile_buffer"),
                       &CometServer::get_projectile_buffer);
  ClassDB::bind_method(D_METHOD("get_projectile_count"),
                       &CometServer::get_projectile_count);

  // Scoring + telemetry
  ClassDB::bind_method(D_METHOD("get_score_events"),
                       &CometServer::get_score_events);
  ClassDB::bind_method(D_METHOD("get_pilot_telemetry", "ship_id"),
                       &CometServer::get_pilot_telemetry);
  ClassDB::bind_method(D_METHOD("get_pool_status"),
                       &CometServer::get_pool_status);
}

void CometServer::_ready() {
  if (Engine::get_singleton()->is_editor_hint()) {
    return;
  }
  init_ecs();
}

bool CometServer::init_ecs() {
  if (running) {
    UtilityFunctions::printerr("[CometEngine] Already running.");
    return false;
  }

  UtilityFunctions::print("[CometEngine] Initializing ECS from ", config_path,
                          "...");
  try {
    comet::SimConfig config = load_config_file(config_path);
    comet::install_simulation(ecs, config);
    fixed_dt = 1.0 / (double)config.tick_rate;
  } catch (const comet::ConfigError &e) {
    // InvalidConfiguration is fatal: the simulation never starts
    UtilityFunctions::printerr(e.what());
    return false;
  }

  running = true;
  const comet::SimConfig &cfg = ecs.get<comet::SimConfig>();
  UtilityFunctions::print("[CometEngine] ECS ready: world ", cfg.world.width,
                          "x", cfg.world.height, ", pool ",
                          cfg.projectiles.pool_size, ", ",
                          (int)cfg.fracture.tiers.size(), " tiers, seed ",
                          (int64_t)cfg.seed, ".");
  return true;
}

void CometServer::_process(double delta) {
  if (Engine::get_singleton()->is_editor_hint() || !running) {
    return;
  }

  // Fixed tick: damping is per call, so the step must not vary
  accumulator += delta;
  int ticks = 0;
  while (accumulator >= fixed_dt && ticks < MAX_TICKS_PER_FRAME) {
    ecs.progress((float)fixed_dt);
    collect_tick_events();
    accumulator -= fixed_dt;
    ticks++;
  }
  if (ticks == MAX_TICKS_PER_FRAME)
    accumulator = 0.0; // drop the backlog rather than spiral

  const comet::FrameSnapshot &snap = ecs.get<comet::FrameSnapshot>();
  comet::sync_ships(snap, ship_buffer, ship_count);
  comet::sync_asteroids(snap, asteroid_buffer, asteroid_count);
  comet::sync_projectiles(snap, projectile_buffer, projectile_count);

  // Diagnostic (every 10s at 60Hz)
  if (ticks > 0 && snap.tick % DIAG_INTERVAL_TICKS < (uint64_t)ticks) {
    const comet::ProjectileSystem &pool = ecs.get<comet::ProjectileSystem>();
    UtilityFunctions::print("[TICK ", (int64_t)snap.tick,
                            "] wave=", get_wave(), " ships=", ship_count,
                            " asteroids=", asteroid_count,
                            " shots=", pool.active_count(), "/",
                            pool.capacity());
  }
}

void CometServer::collect_tick_events() {
  const comet::TickReport &report = ecs.get<comet::TickReport>();
  uint64_t tick = ecs.get<comet::SimClock>().tick;

  for (const comet::CollisionEvent &ev : report.events) {
    if (pending_events.size() >= MAX_PENDING_EVENTS)
      pending_events.pop_front(); // nobody is draining: keep the newest

    Dictionary d;
    d["kind"] = ev.kind == comet::CollisionKind::ShipHit
                    ? String("ship_hit")
                    : String("asteroid_destroyed");
    d["entity_id"] = (int64_t)ev.entity_id;
    d["asteroid_serial"] = (int64_t)ev.asteroid_serial;
    d["tier"] = ev.tier;
    d["points"] = ev.points;
    d["x"] = ev.position.x;
    d["y"] = ev.position.y;
    d["tick"] = (int64_t)tick;
    pending_events.push_back(d);
  }

  if (report.wave_spawned > 0) {
    UtilityFunctions::print("[CometEngine] Field cleared, wave ",
                            report.wave_spawned, " incoming.");
  }
}

// ═══════════════════════════════════════════════════════════════
// GDScript API
// ═══════════════════════════════════════════════════════════════

void CometServer::set_config_path(const String &path) {
  if (running) {
    UtilityFunctions::printerr(
        "[CometEngine] config_path is read once at startup; ignored.");
    return;
  }
  config_path = path;
}

String CometServer::get_config_path() const { return config_path; }

bool CometServer::is_running() const { return running; }

int64_t CometServer::spawn_ship(float x, float y, float heading,
                                bool is_player) {
  if (!running)
    return 0;
  flecs::entity e = comet::spawn_ship(ecs, {x, y}, heading, is_player);
  UtilityFunctions::print("[CometEngine] Ship #", (int64_t)e.id(),
                          is_player ? " (player)" : "", " at (", x, ", ", y,
                          ")");
  return (int64_t)e.id();
}

int64_t CometServer::spawn_autopilot_ship(float x, float y, float heading,
                                          bool auto_fire) {
  if (!running)
    return 0;
  flecs::entity e =
      comet::spawn_autopilot_ship(ecs, {x, y}, heading, auto_fire);
  UtilityFunctions::print("[CometEngine] Autopilot ship #", (int64_t)e.id(),
                          " at (", x, ", ", y, ")",
                          auto_fire ? " [guns free]" : "");
  return (int64_t)e.id();
}

bool CometServer::fire(int64_t ship_id) {
  if (!running)
    return false;

  flecs::entity ship = find_ship(ecs, ship_id);
  if (!ship.is_valid()) {
    UtilityFunctions::printerr("[CometEngine] fire: no ship #", ship_id);
    return false;
  }

  comet::Result<comet::ProjectileHandle> shot =
      comet::fire_from_ship(ecs, ship);
  if (shot.status == comet::Status::UnknownEntity) {
    UtilityFunctions::printerr("[CometEngine] fire: ship #", ship_id, " ",
                               comet::status_name(shot.status));
  }
  // ResourceExhausted (cooldown / empty pool) is routine: just false
  return shot.ok();
}

int CometServer::start_wave(int wave) {
  if (!running)
    return 0;
  int count = comet::start_wave(ecs, wave);
  UtilityFunctions::print("[CometEngine] Wave ", get_wave(), ": ", count,
                          " asteroids.");
  return count;
}

int CometServer::spawn_asteroids(int count) {
  if (!running)
    return 0;
  return comet::spawn_initial_asteroids(ecs, count);
}

int CometServer::get_wave() const {
  if (!running)
    return 0;
  return ecs.get<comet::WaveState>().wave;
}

PackedFloat32Array CometServer::get_ship_buffer() const { return ship_buffer; }

int CometServer::get_ship_count() const { return ship_count; }

PackedFloat32Array CometServer::get_asteroid_buffer() const {
  return asteroid_buffer;
}

int CometServer::get_asteroid_count() const { return asteroid_count; }

PackedFloat32Array CometServer::get_projectile_buffer() const {
  return projectile_buffer;
}

int CometServer::get_projectile_count() const { return projectile_count; }

Array CometServer::get_score_events() {
  Array out = pending_events;
  pending_events = Array();
  return out;
}

Dictionary CometServer::get_pilot_telemetry(int64_t ship_id) const {
  Dictionary d;
  if (!running)
    return d;

  flecs::entity ship = find_ship(ecs, ship_id);
  if (!ship.is_valid() || !ship.has<comet::Autopilot>()) {
    UtilityFunctions::printerr("[CometEngine] telemetry: no autopilot #",
                               ship_id);
    return d;
  }

  const comet::Autopilot &ap = ship.get<comet::Autopilot>();
  const comet::SurvivalLog &log = ap.pilot.log();
  float tick_rate = ecs.get<comet::SimConfig>().tick_rate;

  d["frames_survived"] = log.frames_survived;
  d["time_survived_s"] = (float)log.frames_survived / tick_rate;
  d["avoidance_maneuvers"] = log.avoidance_maneuvers;
  // -1 = nothing has come near yet
  d["closest_call"] =
      std::isinf(log.closest_call_distance) ? -1.0f : log.closest_call_distance;
  d["waypoints_reached"] = log.waypoints_reached;
  d["total_collisions"] = log.total_collisions;
  d["avg_steering"] = log.average_steering();
  d["steering_x"] = ap.last_steering.x;
  d["steering_y"] = ap.last_steering.y;
  if (ap.pilot.waypoint()) {
    d["waypoint_x"] = ap.pilot.waypoint()->x;
    d["waypoint_y"] = ap.pilot.waypoint()->y;
  }
  return d;
}

Dictionary CometServer::get_pool_status() const {
  Dictionary d;
  if (!running)
    return d;

  const comet::ProjectileSystem &pool = ecs.get<comet::ProjectileSystem>();
  d["capacity"] = pool.capacity();
  d["available"] = pool.pool_count();
  d["active"] = pool.active_count();
  d["total_fired"] = (int64_t)pool.total_fired();
  d["total_expired"] = (int64_t)pool.total_expired();
  d["total_recycled"] = (int64_t)pool.total_recycled();
  return d;
}

} // namespace godot
