#include "steering_pilot.h"
#include "comet_status.h"
#include <algorithm>
#include <cmath>

namespace comet {

SteeringPilot::SteeringPilot(const SteeringConfig &config) : config_(config) {
  if (config_.seek_weight < 0.0f || config_.avoid_weight < 0.0f)
    throw ConfigError("steering weights must be >= 0");
  if (config_.turn_rate <= 0.0f)
    throw ConfigError("steering turn_rate must be > 0");
  if (config_.danger_radius <= 0.0f)
    throw ConfigError("steering danger_radius must be > 0");
  if (config_.arrival_tolerance < 0.0f || config_.waypoint_margin < 0.0f)
    throw ConfigError("steering arrival_tolerance and waypoint_margin must "
                      "be >= 0");
  if (config_.max_steer_force <= 0.0f)
    throw ConfigError("steering max_steer_force must be > 0");
  if (config_.waypoint_candidates < 1 || config_.maneuver_cooldown_ticks < 0)
    throw ConfigError("steering waypoint_candidates must be >= 1 and "
                      "maneuver_cooldown_ticks >= 0");
}

void SteeringPilot::select_waypoint(const std::vector<Threat> &threats,
                                    const WrapBounds &bounds, SimRng &rng) {
  float m = config_.waypoint_margin;
  float lo_x = std::min(m, bounds.width * 0.5f);
  float lo_y = std::min(m, bounds.height * 0.5f);
  float hi_x = bounds.width - lo_x;
  float hi_y = bounds.height - lo_y;

  // Best of N random candidates by clearance from the nearest threat
  Vec2 best{bounds.width * 0.5f, bounds.height * 0.5f};
  float best_clearance = -1.0f;
  for (int i = 0; i < config_.waypoint_candidates; i++) {
    Vec2 candidate{rng.uniform(lo_x, hi_x), rng.uniform(lo_y, hi_y)};

    float clearance = std::numeric_limits<float>::infinity();
    for (const Threat &t : threats) {
      float d = toroidal_delta(candidate, t.position, bounds).length();
      clearance = std::min(clearance, d);
    }

    if (clearance > best_clearance) {
      best_clearance = clearance;
      best = candidate;
    }
  }
  waypoint_ = best;
}

Vec2 SteeringPilot::avoid(const KineticEntity &ship,
                          const std::vector<Threat> &threats,
                          const WrapBounds &bounds, bool &dodging) {
  Vec2 force;
  dodging = false;

  for (const Threat &t : threats) {
    Vec2 to_threat = toroidal_delta(ship.position, t.position, bounds);

    // Surface distance, floored so contact never divides by zero
    float surface = to_threat.length() - t.radius;
    if (surface < 0.1f)
      surface = 0.1f;

    if (surface < log_.closest_call_distance)
      log_.closest_call_distance = surface;

    if (surface > config_.danger_radius)
      continue;

    Vec2 away = (to_threat * -1.0f).normalized();
    if (away.length_sq() <= 0.0f)
      away = ship.forward() * -1.0f; // dead centre: back off along heading
    force += away * (config_.avoid_weight / surface);
    dodging = true;
  }
  return force;
}

Vec2 SteeringPilot::compute_steering(const KineticEntity &ship,
                                     const std::vector<Threat> &threats,
                                     const WrapBounds &bounds, SimRng &rng) {
  if (!waypoint_)
    select_waypoint(threats, bounds, rng);

  float tol = config_.arrival_tolerance;
  if (toroidal_delta(ship.position, *waypoint_, bounds).length_sq() <
      tol * tol) {
    log_.waypoints_reached++;
    select_waypoint(threats, bounds, rng);
  }

  Vec2 seek = toroidal_delta(ship.position, *waypoint_, bounds).normalized() *
              config_.seek_weight;

  bool dodging = false;
  Vec2 steering = seek + avoid(ship, threats, bounds, dodging);

  // One maneuver per cooldown window, however long the threat lingers
  if (maneuver_cooldown_ > 0)
    maneuver_cooldown_--;
  if (dodging && maneuver_cooldown_ == 0) {
    log_.avoidance_maneuvers++;
    maneuver_cooldown_ = config_.maneuver_cooldown_ticks;
  }

  float mag_sq = steering.length_sq();
  float cap = config_.max_steer_force;
  if (mag_sq > cap * cap)
    steering = steering * (cap / std::sqrt(mag_sq));

  log_.total_steering_magnitude += steering.length();
  log_.frames_survived++;
  return steering;
}

void SteeringPilot::apply_to_ship(Vec2 steering, KineticEntity &ship, float dt,
                                  float turn_rate) {
  if (steering.length_sq() <= 0.0f || dt <= 0.0f)
    return;

  float desired = std::atan2(steering.y, steering.x);

  // Shortest signed turn, [-π, π)
  float diff = wrap_angle(desired - ship.heading + PI) - PI;
  float max_turn = turn_rate * dt;
  if (std::fabs(diff) <= max_turn)
    ship.set_rotation(desired);
  else
    ship.apply_rotation(diff > 0.0f ? max_turn : -max_turn);

  float thrust = std::min(steering.length(), ship.max_velocity * 0.6f);
  ship.apply_thrust(thrust, dt);
}

} // namespace comet
