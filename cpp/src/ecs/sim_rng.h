#ifndef COMET_SIM_RNG_H
#define COMET_SIM_RNG_H

#include <cstdint>

namespace comet {

// ═════════════════════════════════════════════════════════════
// Seeded PRNG for deterministic replay.
//
// splitmix64 core (same finalizer family as the volley hash).
// One instance lives in the world as a singleton and is passed
// by reference to every random draw: fracture scatter, wave
// placement, waypoint selection. Never an ambient global.
// ═════════════════════════════════════════════════════════════
class SimRng {
public:
  explicit SimRng(uint64_t seed = 42) : state_(seed) {}

  uint64_t next_u64() {
    uint64_t z = (state_ += 0x9E3779B97F4A7C15ULL);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
  }

  // [0, 1) with 24 bits of mantissa
  float next_float() { return (float)(next_u64() >> 40) / 16777216.0f; }

  // [a, b)
  float uniform(float a, float b) { return a + next_float() * (b - a); }

  // [0, n) — n must be > 0
  uint32_t index(uint32_t n) { return (uint32_t)(next_u64() % n); }

private:
  uint64_t state_;
};

} // namespace comet

#endif // COMET_SIM_RNG_H
