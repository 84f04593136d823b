#ifndef COMET_KINETICS_H
#define COMET_KINETICS_H

#include <cmath>

namespace comet {

constexpr float PI = 3.14159265358979323846f;
constexpr float TWO_PI = 2.0f * PI;

// ─── Vector ───────────────────────────────────────────────
struct Vec2 {
  float x = 0.0f, y = 0.0f;

  Vec2 operator+(Vec2 o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(Vec2 o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(float s) const { return {x * s, y * s}; }
  Vec2 &operator+=(Vec2 o) {
    x += o.x;
    y += o.y;
    return *this;
  }

  float length_sq() const { return x * x + y * y; }
  float length() const { return std::sqrt(length_sq()); }

  // Zero vector stays zero
  Vec2 normalized() const {
    float len_sq = length_sq();
    if (len_sq <= 0.0f)
      return {};
    float inv = 1.0f / std::sqrt(len_sq);
    return {x * inv, y * inv};
  }

  static Vec2 from_angle(float radians, float magnitude = 1.0f) {
    return {std::cos(radians) * magnitude, std::sin(radians) * magnitude};
  }
}; // 8 bytes

struct WrapBounds {
  float width = 160.0f;
  float height = 144.0f;
}; // 8 bytes

// Wraps one coordinate into [0, extent). fmod can return exactly `extent`
// after the negative fix-up when v is a tiny negative; fold that to 0.
float wrap_axis(float v, float extent);

// Wraps an angle into [0, 2π).
float wrap_angle(float radians);

// Shortest displacement from `from` to `to` on the torus.
Vec2 toroidal_delta(Vec2 from, Vec2 to, const WrapBounds &bounds);

// ═════════════════════════════════════════════════════════════
// KineticEntity — rigid-body state for every moving body.
//
// Ships, projectiles and asteroid fragments each own exactly
// one of these by value. Plain data + pure math: no method
// fails, nothing allocates.
//
// Damping is a fixed multiplier (1 - drag) applied once per
// update() call, NOT scaled by dt. Behaviour is therefore tied
// to the tick rate; the engine always runs at a fixed tick.
// ═════════════════════════════════════════════════════════════
struct KineticEntity {
  static constexpr float REST_EPSILON = 0.01f; // |v| below this snaps to 0

  Vec2 position;
  Vec2 velocity;
  float heading = 0.0f;          // radians, [0, 2π)
  float angular_velocity = 0.0f; // rad/s
  float mass = 1.0f;
  float thrust_power = 1.0f;
  float drag = 0.0f; // per-call damping fraction, 0 = frictionless
  float max_velocity = 100.0f;
  WrapBounds bounds;

  // Accelerate along the heading; clamps to max_velocity.
  void apply_thrust(float magnitude, float dt);

  void set_rotation(float radians) { heading = wrap_angle(radians); }
  void apply_rotation(float delta) { heading = wrap_angle(heading + delta); }

  // Integrate, wrap, damp, snap, clamp.
  void update(float dt);

  // Modulo wrap of the position alone (freshly placed bodies).
  void wrap_position() {
    position.x = wrap_axis(position.x, bounds.width);
    position.y = wrap_axis(position.y, bounds.height);
  }

  float speed() const { return velocity.length(); }

  Vec2 forward() const { return Vec2::from_angle(heading); }

private:
  void clamp_speed();
};

} // namespace comet

#endif // COMET_KINETICS_H
