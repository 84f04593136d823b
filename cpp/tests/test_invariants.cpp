// ═════════════════════════════════════════════════════════════
// Category 1: INVARIANTS — must ALWAYS hold
// ═════════════════════════════════════════════════════════════

TEST_CASE("Cat1: Component Memory Layout") {
  SUBCASE("Vec2 and WrapBounds are two floats") {
    CHECK(sizeof(Vec2) == 8);
    CHECK(sizeof(WrapBounds) == 8);
  }

  SUBCASE("ShipHull is a single float") { CHECK(sizeof(ShipHull) == 4); }
}

TEST_CASE("Cat1: Status names") {
  CHECK(std::string(status_name(Status::Ok)) == "Ok");
  CHECK(std::string(status_name(Status::ResourceExhausted)) ==
        "ResourceExhausted");
  CHECK(std::string(status_name(Status::UnknownEntity)) == "UnknownEntity");
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat1: Every projectile is pooled XOR active, every tick") {
  for (int i = 0; i < 4; i++)
    spawn_autopilot_ship(ecs, {20.0f + 30.0f * (float)i, 20.0f},
                         0.5f * (float)i, true);
  spawn_initial_asteroids(ecs, 6);

  const int capacity = pool().capacity();
  for (int t = 0; t < 600; t++) {
    step(1);
    REQUIRE(pool().pool_count() + pool().active_count() == capacity);
    CHECK(snapshot().pool_available + snapshot().pool_active == capacity);
  }
  CHECK(pool().total_fired() > 0);
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat1: Bodies stay inside the torus and under max speed") {
  for (int i = 0; i < 3; i++)
    spawn_autopilot_ship(ecs, {40.0f * (float)(i + 1), 72.0f}, 0.0f, true);
  spawn_initial_asteroids(ecs, 8);

  const SimConfig &cfg = ecs.get<SimConfig>();
  for (int t = 0; t < 900; t++) {
    step(1);

    for (const AsteroidFragment &rock : field().bodies) {
      REQUIRE(inside_bounds(rock.body.position, cfg.world));
      CHECK(rock.body.speed() <= rock.body.max_velocity + 1e-3f);
    }

    ecs.each([&](const KineticEntity &body, const ShipHull &) {
      REQUIRE(inside_bounds(body.position, cfg.world));
      CHECK(body.speed() <= body.max_velocity + 1e-3f);
    });

    pool().each_active([&](ProjectileHandle, const Projectile &p) {
      REQUIRE(inside_bounds(p.body.position, cfg.world));
    });
  }
}

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat1: Asteroid serials strictly increase in field order") {
  spawn_initial_asteroids(ecs, 5);
  spawn_autopilot_ship(ecs, {80.0f, 72.0f}, 0.0f, true);
  step(300);

  const auto &bodies = field().bodies;
  for (size_t i = 1; i < bodies.size(); i++)
    CHECK(bodies[i - 1].serial < bodies[i].serial);
}
