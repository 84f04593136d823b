// ═════════════════════════════════════════════════════════════
// Category 6: PERFORMANCE — Regression Bounds
// ═════════════════════════════════════════════════════════════
#include <chrono>

TEST_CASE_FIXTURE(EngineTestHarness,
                  "Cat6: 200 asteroids + 20 autopilots tick under 50ms") {
  // Every autopilot scans every asteroid, and every projectile is
  // tested against the whole field: O(ships * rocks) per tick.
  SimConfig cfg = ecs.get<SimConfig>();
  for (int i = 0; i < 20; i++) {
    float x = 10.0f + (float)(i % 5) * 30.0f;
    float y = 10.0f + (float)(i / 5) * 30.0f;
    spawn_autopilot_ship(ecs, {x, y}, 0.0f, true);
  }
  for (int i = 0; i < 200; i++) {
    Vec2 p{rng().uniform(0.0f, cfg.world.width),
           rng().uniform(0.0f, cfg.world.height)};
    field().add(fracture().make_fragment(3 - i % 3, p,
                                         Vec2::from_angle((float)i, 20.0f),
                                         rng()));
  }

  // Warmup — build Flecs archetypes and CPU caches
  step(1);

  // Measure a single 60Hz frame
  auto start = std::chrono::high_resolution_clock::now();
  step(1);
  auto end = std::chrono::high_resolution_clock::now();

  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
                .count();

  MESSAGE("200 rock / 20 pilot tick: ", ms, "ms");
  CHECK(ms < 50);
}

TEST_CASE_FIXTURE(EngineTestHarness, "Cat6: 600 sustained ticks under 2s") {
  for (int i = 0; i < 8; i++)
    spawn_autopilot_ship(ecs, {20.0f * (float)(i + 1), 72.0f}, 0.0f, true);
  start_wave(ecs, 5);

  auto start = std::chrono::high_resolution_clock::now();
  step(600);
  auto end = std::chrono::high_resolution_clock::now();

  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
                .count();

  MESSAGE("600 tick run: ", ms, "ms, ", field().size(), " rocks left");
  CHECK(ms < 2000);
}
