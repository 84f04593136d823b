// ═════════════════════════════════════════════════════════════
// COMET ENGINE: TEST UNITY BUILD
// ═════════════════════════════════════════════════════════════
// Headless test binary. No Godot dependency.
// Build: cmake --build build --target comet_tests
// Run:   ctest --test-dir build
// ═════════════════════════════════════════════════════════════

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

// ── Flecs ───────────────────────────────────────────────────
#include <flecs.h>

// ── Pure C++ engine code (Godot-free) ───────────────────────
#include "../src/ecs/comet_systems.h"
#include "../src/ecs/config_loader.h"

#include "../src/ecs/kinetics.cpp"
#include "../src/ecs/projectile_pool.cpp"
#include "../src/ecs/fracture_system.cpp"
#include "../src/ecs/steering_pilot.cpp"
#include "../src/ecs/collision.cpp"
#include "../src/ecs/config_loader.cpp"
#include "../src/ecs/comet_systems.cpp"

// ── Test Infrastructure ─────────────────────────────────────
#include "test_harness.h"

// ── Test Suites (domain-based) ──────────────────────────────
#include "test_invariants.cpp"
#include "test_kinetics.cpp"
#include "test_projectiles.cpp"
#include "test_fracture.cpp"
#include "test_steering.cpp"
#include "test_pipeline.cpp"
#include "test_config.cpp"
#include "test_perf.cpp"
