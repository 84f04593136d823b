#include "comet_systems.h"
#include <algorithm>
#include <limits>

namespace comet {

void register_components(flecs::world &ecs) {
  // Ship components
  ecs.component<KineticEntity>("KineticEntity");
  ecs.component<ShipHull>("ShipHull");
  ecs.component<Autopilot>("Autopilot");
  ecs.component<Gunner>("Gunner");
  ecs.component<IsAlive>("IsAlive");
  ecs.component<PlayerShip>("PlayerShip");

  // Singletons
  ecs.component<SimConfig>("SimConfig");
  ecs.component<SimClock>("SimClock");
  ecs.component<SimRng>("SimRng");
  ecs.component<ProjectileSystem>("ProjectileSystem");
  ecs.component<FractureSystem>("FractureSystem");
  ecs.component<AsteroidField>("AsteroidField");
  ecs.component<WaveState>("WaveState");
  ecs.component<ThreatBoard>("ThreatBoard");
  ecs.component<TickReport>("TickReport");
  ecs.component<FrameSnapshot>("FrameSnapshot");
}

void install_simulation(flecs::world &ecs, const SimConfig &config) {
  validate_config(config);

  SimConfig cfg = config;
  cfg.projectiles.bounds = cfg.world;

  register_components(ecs);

  ecs.set<SimConfig>(cfg);
  ecs.set<SimClock>({});
  ecs.set<SimRng>(SimRng(cfg.seed));
  ecs.set<ProjectileSystem>(ProjectileSystem(cfg.projectiles));
  ecs.set<FractureSystem>(FractureSystem(cfg.fracture, cfg.world));
  ecs.set<AsteroidField>({});
  ecs.set<WaveState>({0, cfg.fracture.waves.auto_advance, 0});
  ecs.set<ThreatBoard>({});
  ecs.set<TickReport>({});
  ecs.set<FrameSnapshot>({});

  register_simulation_systems(ecs);
}

// ── Shared firing path (gunnery system + GDScript fire) ─────
static Result<ProjectileHandle> fire_along_heading(flecs::world &w,
                                                   uint64_t owner_id,
                                                   const KineticEntity &body,
                                                   float hull_radius,
                                                   float damage) {
  const SimConfig &cfg = w.get<SimConfig>();
  const SimClock &clock = w.get<SimClock>();
  ProjectileSystem &pool = w.ensure<ProjectileSystem>();

  // Spawn at the nose so the shot never starts inside its own hull
  Vec2 origin = body.position + body.forward() * hull_radius;
  return pool.fire_projectile(owner_id, origin, body.heading, clock.now,
                              damage, cfg.projectiles.speed);
}

void register_simulation_systems(flecs::world &ecs) {

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 1: Simulation clock (OnLoad)
  //
  // Lifetime and cooldown are measured against SimClock::now,
  // never wall time. The tick report is per-tick: clear it first.
  // ═════════════════════════════════════════════════════════════
  ecs.system("SimClockAdvance")
      .kind(flecs::OnLoad)
      .run([](flecs::iter &it) {
        flecs::world w = it.world();
        SimClock &clock = w.ensure<SimClock>();
        clock.now += (double)it.delta_time();
        clock.tick++;
        w.ensure<TickReport>().clear();
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 2: Threat snapshot (PreUpdate)
  //
  // Asteroids have not moved yet this tick, so this is the field
  // as it stood at the end of the previous tick. Every autopilot
  // reads the same frozen list.
  // ═════════════════════════════════════════════════════════════
  ecs.system("ThreatSnapshot")
      .kind(flecs::PreUpdate)
      .run([](flecs::iter &it) {
        flecs::world w = it.world();
        const AsteroidField &field = w.get<AsteroidField>();
        ThreatBoard &board = w.ensure<ThreatBoard>();

        board.threats.clear();
        board.threats.reserve(field.bodies.size());
        for (const AsteroidFragment &rock : field.bodies)
          board.threats.push_back({rock.body.position, rock.radius});
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 3: Autopilot steering (PreUpdate)
  //
  // Control law first, then the actuator. Position is untouched
  // here; ShipKinematics integrates it in OnUpdate.
  // ═════════════════════════════════════════════════════════════
  ecs.system<KineticEntity, Autopilot>("AutopilotSteering")
      .kind(flecs::PreUpdate)
      .with<IsAlive>()
      .each([](flecs::entity e, KineticEntity &body, Autopilot &ap) {
        float dt = e.world().delta_time();
        if (dt <= 0.0f)
          return;

        flecs::world w = e.world();
        const ThreatBoard &board = w.get<ThreatBoard>();
        SimRng &rng = w.ensure<SimRng>();

        Vec2 steering =
            ap.pilot.compute_steering(body, board.threats, body.bounds, rng);
        SteeringPilot::apply_to_ship(steering, body, dt,
                                     ap.pilot.config().turn_rate);
        ap.last_steering = steering;
      });

  // ── System 4: Autopilot gunnery (PreUpdate) ─────────────────
  // Cooldown or empty pool → ResourceExhausted, skip silently.
  ecs.system<const KineticEntity, const ShipHull, const Gunner>(
         "AutopilotGunnery")
      .kind(flecs::PreUpdate)
      .with<IsAlive>()
      .each([](flecs::entity e, const KineticEntity &body,
               const ShipHull &hull, const Gunner &gun) {
        if (!gun.auto_fire)
          return;
        flecs::world w = e.world();
        Result<ProjectileHandle> shot =
            fire_along_heading(w, e.id(), body, hull.radius, gun.damage);
        if (shot.ok())
          w.ensure<TickReport>().shots_fired++;
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 5-7: Kinematics (OnUpdate)
  // ═════════════════════════════════════════════════════════════
  ecs.system<KineticEntity>("ShipKinematics")
      .kind(flecs::OnUpdate)
      .with<ShipHull>()
      .with<IsAlive>()
      .each([](flecs::entity e, KineticEntity &body) {
        body.update(e.world().delta_time());
      });

  ecs.system("AsteroidKinematics")
      .kind(flecs::OnUpdate)
      .run([](flecs::iter &it) {
        flecs::world w = it.world();
        float dt = it.delta_time();
        AsteroidField &field = w.ensure<AsteroidField>();
        for (AsteroidFragment &rock : field.bodies)
          rock.body.update(dt);
      });

  ecs.system("ProjectileKinematics")
      .kind(flecs::OnUpdate)
      .run([](flecs::iter &it) {
        flecs::world w = it.world();
        w.ensure<ProjectileSystem>().integrate(it.delta_time());
      });

  // ── System 8: Expiry sweep (OnValidate) ─────────────────────
  ecs.system("ProjectileExpirySweep")
      .kind(flecs::OnValidate)
      .run([](flecs::iter &it) {
        flecs::world w = it.world();
        const SimClock &clock = w.get<SimClock>();
        int expired = w.ensure<ProjectileSystem>().sweep_expired(clock.now);
        w.ensure<TickReport>().projectiles_expired += expired;
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 9: Projectile ↔ asteroid (PostUpdate)
  //
  // Broadphase + fracture + recycle in one sweep. See collision.h
  // for the ordering rules that keep replays identical.
  // ═════════════════════════════════════════════════════════════
  ecs.system("ProjectileAsteroidCollisions")
      .kind(flecs::PostUpdate)
      .run([](flecs::iter &it) {
        flecs::world w = it.world();
        resolve_projectile_hits(
            w.ensure<ProjectileSystem>(), w.ensure<AsteroidField>(),
            w.get<FractureSystem>(), w.ensure<SimRng>(),
            w.ensure<TickReport>());
      });

  // ── System 10: Ship ↔ asteroid (PostUpdate) ─────────────────
  // Report only. What a hit costs is the host's call.
  ecs.system<const KineticEntity, const ShipHull, Autopilot *>(
         "ShipAsteroidCollisions")
      .kind(flecs::PostUpdate)
      .with<IsAlive>()
      .each([](flecs::entity e, const KineticEntity &body,
               const ShipHull &hull, Autopilot *ap) {
        flecs::world w = e.world();
        const AsteroidField &field = w.get<AsteroidField>();
        std::vector<int> hits = detect_ship_hits(body, hull.radius, field);
        if (hits.empty())
          return;

        TickReport &report = w.ensure<TickReport>();
        for (int idx : hits) {
          const AsteroidFragment &rock = field.bodies[(size_t)idx];
          CollisionEvent ev;
          ev.kind = CollisionKind::ShipHit;
          ev.entity_id = e.id();
          ev.asteroid_serial = rock.serial;
          ev.tier = rock.tier;
          ev.points = 0;
          ev.position = body.position;
          report.events.push_back(ev);
          report.ship_hits++;
          if (ap)
            ap->pilot.record_collision();
        }
      });

  // ── System 11: Wave progression (PostUpdate) ────────────────
  // A started wave whose field is empty rolls into the next one.
  ecs.system("WaveProgression")
      .kind(flecs::PostUpdate)
      .run([](flecs::iter &it) {
        flecs::world w = it.world();
        const WaveState &ws = w.get<WaveState>();
        if (!ws.auto_advance || ws.wave <= 0)
          return;
        if (!w.get<AsteroidField>().empty())
          return;

        // Saturates: the last wave just repeats
        int next = ws.wave < std::numeric_limits<int>::max() ? ws.wave + 1
                                                             : ws.wave;
        w.ensure<WaveState>().waves_cleared++;
        start_wave(w, next);
        w.ensure<TickReport>().wave_spawned = next;
      });

  // ═════════════════════════════════════════════════════════════
  // SYSTEM 12: Frame snapshot (OnStore)
  //
  // Last thing each tick. The renderer reads this, read-only,
  // after progress() returns.
  // ═════════════════════════════════════════════════════════════
  ecs.system("FrameTelemetry")
      .kind(flecs::OnStore)
      .run([](flecs::iter &it) {
        flecs::world w = it.world();
        const SimClock &clock = w.get<SimClock>();
        const AsteroidField &field = w.get<AsteroidField>();
        const ProjectileSystem &pool = w.get<ProjectileSystem>();
        FrameSnapshot &snap = w.ensure<FrameSnapshot>();

        snap.tick = clock.tick;
        snap.now = clock.now;
        snap.ships.clear();
        snap.asteroids.clear();
        snap.projectiles.clear();

        w.each([&](flecs::entity e, const KineticEntity &b,
                   const ShipHull &h) {
          if (!e.has<IsAlive>())
            return;
          snap.ships.push_back({b.position.x, b.position.y, b.heading,
                                h.radius, 0, e.id()});
        });

        for (const AsteroidFragment &rock : field.bodies) {
          snap.asteroids.push_back({rock.body.position.x, rock.body.position.y,
                                    rock.body.heading, rock.radius, rock.tier,
                                    rock.serial});
        }

        pool.each_active([&](ProjectileHandle, const Projectile &p) {
          snap.projectiles.push_back({p.body.position.x, p.body.position.y,
                                      p.body.heading, p.radius, 0,
                                      p.owner_id});
        });

        snap.pool_available = pool.pool_count();
        snap.pool_active = pool.active_count();
      });
}

// ═════════════════════════════════════════════════════════════
// Spawning
// ═════════════════════════════════════════════════════════════

flecs::entity spawn_ship(flecs::world &ecs, Vec2 position, float heading,
                         bool player) {
  const SimConfig &cfg = ecs.get<SimConfig>();

  KineticEntity body;
  body.bounds = cfg.world;
  body.position = position;
  body.mass = cfg.ship.mass;
  body.thrust_power = cfg.ship.thrust_power;
  body.drag = cfg.ship.drag;
  body.max_velocity = cfg.ship.max_velocity;
  body.set_rotation(heading);
  body.wrap_position();

  flecs::entity e = ecs.entity()
                        .set<KineticEntity>(body)
                        .set<ShipHull>({cfg.ship.radius})
                        .set<Gunner>({cfg.ship.gun_damage, false})
                        .add<IsAlive>();
  if (player)
    e.add<PlayerShip>();
  return e;
}

flecs::entity spawn_autopilot_ship(flecs::world &ecs, Vec2 position,
                                   float heading, bool auto_fire) {
  const SimConfig &cfg = ecs.get<SimConfig>();
  flecs::entity e = spawn_ship(ecs, position, heading, false);
  e.set<Autopilot>({SteeringPilot(cfg.steering), Vec2{}});
  e.set<Gunner>({cfg.ship.gun_damage, auto_fire});
  return e;
}

Result<ProjectileHandle> fire_from_ship(flecs::world &ecs,
                                        flecs::entity ship) {
  if (!ship.is_alive() || !ship.has<IsAlive>() ||
      !ship.has<KineticEntity>() || !ship.has<ShipHull>())
    return {Status::UnknownEntity, {}};

  float damage = ecs.get<SimConfig>().ship.gun_damage;
  if (ship.has<Gunner>())
    damage = ship.get<Gunner>().damage;

  return fire_along_heading(ecs, ship.id(), ship.get<KineticEntity>(),
                            ship.get<ShipHull>().radius, damage);
}

std::optional<SafeZone> player_safe_zone(flecs::world &ecs) {
  std::optional<SafeZone> zone;
  float radius = ecs.get<SimConfig>().fracture.waves.safe_radius;

  auto q = ecs.query_builder<const KineticEntity>()
               .with<PlayerShip>()
               .with<IsAlive>()
               .build();
  q.each([&](const KineticEntity &body) {
    if (!zone)
      zone = SafeZone{body.position, radius};
  });
  return zone;
}

int start_wave(flecs::world &ecs, int wave) {
  if (wave < 1)
    wave = 1;

  const FractureSystem &fracture = ecs.get<FractureSystem>();
  WaveDifficulty difficulty = fracture.calculate_wave_difficulty(wave);
  std::optional<SafeZone> safe = player_safe_zone(ecs);

  std::vector<AsteroidFragment> rocks =
      fracture.create_wave(difficulty, safe, ecs.ensure<SimRng>());
  ecs.ensure<AsteroidField>().add_all(rocks);
  ecs.ensure<WaveState>().wave = wave;
  return (int)rocks.size();
}

int spawn_initial_asteroids(flecs::world &ecs, int count) {
  const FractureSystem &fracture = ecs.get<FractureSystem>();
  std::optional<SafeZone> safe = player_safe_zone(ecs);

  std::vector<AsteroidFragment> rocks =
      fracture.create_initial_asteroids(count, safe, ecs.ensure<SimRng>());
  ecs.ensure<AsteroidField>().add_all(rocks);

  WaveState &ws = ecs.ensure<WaveState>();
  ws.wave = std::max(ws.wave, 1);
  return (int)rocks.size();
}

} // namespace comet
