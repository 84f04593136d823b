#include "kinetics.h"

namespace comet {

float wrap_axis(float v, float extent) {
  if (extent <= 0.0f)
    return 0.0f;
  float r = std::fmod(v, extent);
  if (r < 0.0f)
    r += extent;
  if (r >= extent) // -1e-8 + extent rounds up to extent
    r = 0.0f;
  return r;
}

float wrap_angle(float radians) { return wrap_axis(radians, TWO_PI); }

Vec2 toroidal_delta(Vec2 from, Vec2 to, const WrapBounds &bounds) {
  float dx = to.x - from.x;
  float dy = to.y - from.y;
  float half_w = bounds.width * 0.5f;
  float half_h = bounds.height * 0.5f;

  if (dx > half_w)
    dx -= bounds.width;
  else if (dx < -half_w)
    dx += bounds.width;

  if (dy > half_h)
    dy -= bounds.height;
  else if (dy < -half_h)
    dy += bounds.height;

  return {dx, dy};
}

void KineticEntity::apply_thrust(float magnitude, float dt) {
  if (dt <= 0.0f || mass <= 0.0f)
    return;
  float accel = magnitude * thrust_power / mass;
  velocity += forward() * (accel * dt);
  clamp_speed();
}

void KineticEntity::clamp_speed() {
  float speed_sq = velocity.length_sq();
  if (speed_sq > max_velocity * max_velocity) {
    float ratio = max_velocity / std::sqrt(speed_sq);
    velocity = velocity * ratio;
  }
}

void KineticEntity::update(float dt) {
  clamp_speed();

  if (dt > 0.0f) {
    heading = wrap_angle(heading + angular_velocity * dt);
    position += velocity * dt;
  }

  // Toroidal wrap: each axis independently, orthogonal coordinate kept
  wrap_position();

  // Fixed per-call damping (see header: not dt-scaled)
  float damping = 1.0f - drag;
  velocity = velocity * damping;
  angular_velocity *= damping;

  // Kill sub-epsilon drift
  if (velocity.length_sq() < REST_EPSILON * REST_EPSILON)
    velocity = {};
}

} // namespace comet
