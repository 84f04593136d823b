// ═════════════════════════════════════════════════════════════
// Category 7: PIPELINE — collisions, waves, full-tick behaviour
// ═════════════════════════════════════════════════════════════

// Bare pool with no cooldown, for driving the broadphase by hand
static ProjectileSystem open_pool() {
  ProjectileConfig pc;
  pc.cooldown_ms = 0.0f;
  pc.bounds = ARENA;
  return ProjectileSystem(pc);
}

TEST_CASE("Cat7: Projectile hit fractures a large asteroid") {
  ProjectileSystem pool = open_pool();
  FractureSystem fs;
  AsteroidField field;
  SimRng rng(5);
  TickReport report;

  field.add(fs.make_fragment(3, {80.0f, 72.0f}, {}, rng));
  uint64_t parent_serial = field.bodies[0].serial;

  Result<ProjectileHandle> shot =
      pool.fire_projectile(7, {80.0f, 72.0f}, 0.0f, 0.0, 1.0f, 120.0f);
  REQUIRE(shot.ok());

  int destroyed = resolve_projectile_hits(pool, field, fs, rng, report);
  CHECK(destroyed == 1);
  CHECK(pool.active_count() == 0);
  CHECK(pool.get(shot.value).status == Status::UnknownEntity);
  CHECK(report.projectiles_recycled == 1);

  REQUIRE(field.size() == 2);
  for (const AsteroidFragment &k : field.bodies) {
    CHECK(k.tier == 2);
    CHECK(k.serial > parent_serial);
  }

  REQUIRE(report.events.size() == 1);
  const CollisionEvent &ev = report.events[0];
  CHECK(ev.kind == CollisionKind::AsteroidDestroyed);
  CHECK(ev.entity_id == 7);
  CHECK(ev.asteroid_serial == parent_serial);
  CHECK(ev.tier == 3);
  CHECK(ev.points == 20);
  CHECK(report.score == 20);
  CHECK(report.fragments_spawned == 2);
}

TEST_CASE("Cat7: Terminal hit leaves nothing behind") {
  ProjectileSystem pool = open_pool();
  FractureSystem fs;
  AsteroidField field;
  SimRng rng(5);
  TickReport report;

  field.add(fs.make_fragment(1, {40.0f, 40.0f}, {}, rng));
  REQUIRE(pool.fire_projectile(1, {41.0f, 40.0f}, 0.0f, 0.0, 1.0f, 120.0f)
              .ok());

  CHECK(resolve_projectile_hits(pool, field, fs, rng, report) == 1);
  CHECK(field.empty());
  CHECK(report.fragments_spawned == 0);
  CHECK(report.score == 100);
}

TEST_CASE("Cat7: Each asteroid takes at most one hit per sweep") {
  ProjectileSystem pool = open_pool();
  FractureSystem fs;
  AsteroidField field;
  SimRng rng(5);
  TickReport report;

  field.add(fs.make_fragment(1, {40.0f, 40.0f}, {}, rng));
  REQUIRE(pool.fire_projectile(1, {40.0f, 40.0f}, 0.0f, 0.0, 1.0f, 120.0f)
              .ok());
  REQUIRE(pool.fire_projectile(2, {40.0f, 40.0f}, 0.0f, 0.0, 1.0f, 120.0f)
              .ok());

  CHECK(resolve_projectile_hits(pool, field, fs, rng, report) == 1);
  CHECK(report.events.size() == 1);
  CHECK(report.events[0].entity_id == 1); // firing order wins

  // The second projectile found nothing left to hit
  CHECK(pool.active_count() == 1);
  pool.each_active([](ProjectileHandle, const Projectile &p) {
    CHECK(p.owner_id == 2);
  });
}

TEST_CASE("Cat7: One projectile destroys only the first overlap") {
  ProjectileSystem pool = open_pool();
  FractureSystem fs;
  AsteroidField field;
  SimRng rng(5);
  TickReport report;

  field.add(fs.make_fragment(1, {40.0f, 40.0f}, {}, rng));
  field.add(fs.make_fragment(1, {41.0f, 40.0f}, {}, rng));
  uint64_t second = field.bodies[1].serial;
  REQUIRE(pool.fire_projectile(1, {40.5f, 40.0f}, 0.0f, 0.0, 1.0f, 120.0f)
              .ok());

  CHECK(resolve_projectile_hits(pool, field, fs, rng, report) == 1);
  REQUIRE(field.size() == 1);
  CHECK(field.bodies[0].serial == second);
}

TEST_CASE("Cat7: Hits register across the wrap seam") {
  ProjectileSystem pool = open_pool();
  FractureSystem fs;
  AsteroidField field;
  SimRng rng(5);
  TickReport report;

  field.add(fs.make_fragment(1, {1.0f, 72.0f}, {}, rng));
  REQUIRE(pool.fire_projectile(1, {159.5f, 72.0f}, 0.0f, 0.0, 1.0f, 120.0f)
              .ok());

  CHECK(resolve_projectile_hits(pool, field, fs, rng, report) == 1);
}

TEST_CASE("Cat7: Misses leave pool and field untouched") {
  ProjectileSystem pool = open_pool();
  FractureSystem fs;
  AsteroidField field;
  SimRng rng(5);
  TickReport report;

  field.add(fs.make_fragment(2, {40.0f, 40.0f}, {}, rng));
  REQUIRE(pool.fire_projectile(1, {100.0f, 100.0f}, 0.0f, 0.0, 1.0f, 120.0f)
              .ok());

  CHECK(resolve_projectile_hits(pool, field, fs, rng, report) == 0);
  CHECK(field.size() == 1);
  CHECK(pool.active_count() == 1);
  CHECK(report.events.empty());
}

// ─── Full ticks ───────────────────────────────────────────

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Shot fractures a rock in flight") {
  flecs::entity ship = spawn_ship(ecs, {60.0f, 72.0f}, 0.0f, true);
  place_asteroid(2, {80.0f, 72.0f});

  REQUIRE(fire_from_ship(ecs, ship).ok());

  int destroyed = 0, spawned = 0, score = 0;
  uint64_t shooter = 0;
  for (int i = 0; i < 20; i++) {
    step();
    destroyed += report().asteroids_destroyed;
    spawned += report().fragments_spawned;
    score += report().score;
    for (const CollisionEvent &ev : report().events)
      if (ev.kind == CollisionKind::AsteroidDestroyed)
        shooter = ev.entity_id;
  }

  CHECK(destroyed == 1);
  CHECK(spawned == 2);
  CHECK(score == 50);
  CHECK(shooter == ship.id());
  CHECK(pool().active_count() == 0);
  REQUIRE(field().size() == 2);
  for (const AsteroidFragment &k : field().bodies)
    CHECK(k.tier == 1);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Ship overlap reports a hit") {
  flecs::entity ship = spawn_autopilot_ship(ecs, {80.0f, 72.0f}, 0.0f, false);
  place_asteroid(3, {84.0f, 72.0f});

  step();
  CHECK(report().ship_hits == 1);
  REQUIRE(report().events.size() == 1);
  CHECK(report().events[0].kind == CollisionKind::ShipHit);
  CHECK(report().events[0].entity_id == ship.id());
  CHECK(report().events[0].tier == 3);
  CHECK(ship.get<Autopilot>().pilot.log().total_collisions == 1);

  // Reported, not destroyed
  CHECK(field().size() == 1);
  CHECK(ship.has<IsAlive>());
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Empty world ticks cleanly") {
  step(10);
  CHECK(clock().tick == 10);
  CHECK(clock().now == doctest::Approx(10.0 * TEST_DT));
  CHECK(waves().wave == 0);
  CHECK(report().events.empty());
  CHECK(snapshot().ships.empty());
  CHECK(snapshot().asteroids.empty());
  CHECK(snapshot().projectiles.empty());
  CHECK(snapshot().pool_available == pool().capacity());
}

TEST_CASE("Cat7: Gunnery stops at pool exhaustion") {
  SimConfig cfg = test_config();
  cfg.projectiles.pool_size = 4;
  cfg.projectiles.cooldown_ms = 0.0f;
  cfg.projectiles.lifetime = 10.0f;
  EngineTestHarness h(cfg);

  for (int i = 0; i < 6; i++)
    spawn_autopilot_ship(h.ecs, {20.0f + 20.0f * (float)i, 72.0f}, 0.0f, true);

  h.step();
  CHECK(h.report().shots_fired == 4);
  CHECK(h.snapshot().pool_available == 0);
  CHECK(h.snapshot().pool_active == 4);

  h.step(5);
  CHECK(h.report().shots_fired == 0);
  CHECK(h.pool().pool_count() + h.pool().active_count() == 4);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Projectiles expire by sim time") {
  flecs::entity ship = spawn_ship(ecs, {80.0f, 72.0f}, 0.0f, false);
  REQUIRE(fire_from_ship(ecs, ship).ok());

  step(59);
  CHECK(pool().active_count() == 1);

  int expired = 0;
  for (int i = 0; i < 3; i++) {
    step();
    expired += report().projectiles_expired;
  }
  CHECK(expired == 1);
  CHECK(pool().active_count() == 0);
  CHECK(pool().total_expired() == 1);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Dead or bare entities cannot fire") {
  flecs::entity ship = spawn_ship(ecs, {80.0f, 72.0f}, 0.0f, false);
  ship.destruct();
  CHECK(fire_from_ship(ecs, ship).status == Status::UnknownEntity);

  flecs::entity bare = ecs.entity();
  CHECK(fire_from_ship(ecs, bare).status == Status::UnknownEntity);

  flecs::entity downed = spawn_ship(ecs, {40.0f, 40.0f}, 0.0f, false);
  downed.remove<IsAlive>();
  CHECK(fire_from_ship(ecs, downed).status == Status::UnknownEntity);
  CHECK(pool().active_count() == 0);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat7: Threat board holds last tick's positions") {
  spawn_autopilot_ship(ecs, {20.0f, 20.0f}, 0.0f, false);
  place_asteroid(1, {100.0f, 100.0f}, {30.0f, 0.0f});

  step();
  const ThreatBoard &board = ecs.get<ThreatBoard>();
  REQUIRE(board.threats.size() == 1);
  CHECK(board.threats[0].position.x == doctest::Approx(100.0f));
  CHECK(field().bodies[0].body.position.x == doctest::Approx(100.5f));
}

TEST_CASE("Cat7: Cleared wave rolls into the next") {
  SimConfig cfg = test_config();
  cfg.fracture.waves.auto_advance = true;
  EngineTestHarness h(cfg);

  // Nothing started, nothing spawns
  h.step(3);
  CHECK(h.waves().wave == 0);
  CHECK(h.field().empty());

  CHECK(start_wave(h.ecs, 1) == 4);
  CHECK(h.waves().wave == 1);

  h.field().clear();
  h.step();
  CHECK(h.waves().wave == 2);
  CHECK(h.waves().waves_cleared == 1);
  CHECK(h.report().wave_spawned == 2);
  CHECK(h.field().size() == 6);
}

TEST_CASE("Cat7: Wave counter saturates at the last wave") {
  SimConfig cfg = test_config();
  cfg.fracture.waves.auto_advance = true;
  EngineTestHarness h(cfg);

  const int last = std::numeric_limits<int>::max();
  start_wave(h.ecs, last);
  h.field().clear();
  h.step();
  CHECK(h.waves().wave == last);
  CHECK(h.report().wave_spawned == last);
  CHECK(h.field().size() == cfg.fracture.waves.max_count);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Manual waves stay put when cleared") {
  start_wave(ecs, 1);
  field().clear();
  step();
  CHECK(waves().wave == 1);
  CHECK(field().empty());
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Waves spawn clear of the player") {
  spawn_ship(ecs, {80.0f, 72.0f}, 0.0f, true);
  REQUIRE(player_safe_zone(ecs).has_value());

  int n = start_wave(ecs, 3);
  REQUIRE(n == field().size());

  const SimConfig &cfg = ecs.get<SimConfig>();
  float keep_out =
      cfg.fracture.waves.safe_radius + cfg.fracture.safe_zone_buffer;
  for (const AsteroidFragment &rock : field().bodies)
    CHECK(toroidal_delta({80.0f, 72.0f}, rock.body.position, cfg.world)
              .length() > keep_out);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Absurd wave numbers stay capped") {
  const SimConfig &cfg = ecs.get<SimConfig>();
  int n = start_wave(ecs, std::numeric_limits<int>::max());
  CHECK(n == cfg.fracture.waves.max_count);
  CHECK(waves().wave == std::numeric_limits<int>::max());

  step();
  for (const AsteroidFragment &rock : field().bodies) {
    CHECK(rock.body.speed() <= cfg.fracture.max_speed + 1e-3f);
    CHECK(inside_bounds(rock.body.position, cfg.world));
  }
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Initial asteroids start wave one") {
  CHECK(spawn_initial_asteroids(ecs, 5) == 5);
  CHECK(field().size() == 5);
  CHECK(waves().wave == 1);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat7: Snapshot mirrors the world") {
  flecs::entity ship = spawn_ship(ecs, {80.0f, 72.0f}, 0.0f, false);
  place_asteroid(3, {20.0f, 20.0f});
  place_asteroid(1, {140.0f, 120.0f});
  REQUIRE(fire_from_ship(ecs, ship).ok());

  step();
  const FrameSnapshot &s = snapshot();
  CHECK(s.tick == 1);

  REQUIRE(s.ships.size() == 1);
  CHECK(s.ships[0].id == ship.id());
  CHECK(s.ships[0].radius == doctest::Approx(4.0f));

  REQUIRE(s.asteroids.size() == 2);
  CHECK(s.asteroids[0].tier == 3);
  CHECK(s.asteroids[1].tier == 1);
  CHECK(s.asteroids[0].id < s.asteroids[1].id);

  REQUIRE(s.projectiles.size() == 1);
  CHECK(s.projectiles[0].id == ship.id());
  CHECK(s.pool_active == 1);
  CHECK(s.pool_available == pool().capacity() - 1);
}

TEST_CASE("Cat7: Same seed, same run") {
  auto run = [](EngineTestHarness &h) {
    spawn_autopilot_ship(h.ecs, {40.0f, 40.0f}, 0.0f, true);
    spawn_autopilot_ship(h.ecs, {120.0f, 100.0f}, 1.5f, true);
    start_wave(h.ecs, 2);
    h.step(300);
  };

  EngineTestHarness a, b;
  run(a);
  run(b);

  const FrameSnapshot &sa = a.snapshot();
  const FrameSnapshot &sb = b.snapshot();
  REQUIRE(sa.asteroids.size() == sb.asteroids.size());
  for (size_t i = 0; i < sa.asteroids.size(); i++) {
    CHECK(sa.asteroids[i].id == sb.asteroids[i].id);
    CHECK(sa.asteroids[i].x == sb.asteroids[i].x);
    CHECK(sa.asteroids[i].y == sb.asteroids[i].y);
  }
  REQUIRE(sa.ships.size() == sb.ships.size());
  for (size_t i = 0; i < sa.ships.size(); i++) {
    CHECK(sa.ships[i].x == sb.ships[i].x);
    CHECK(sa.ships[i].heading == sb.ships[i].heading);
  }
  CHECK(sa.pool_active == sb.pool_active);
  CHECK(a.pool().total_fired() == b.pool().total_fired());
}
