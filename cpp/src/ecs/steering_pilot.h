#ifndef COMET_STEERING_PILOT_H
#define COMET_STEERING_PILOT_H

#include "kinetics.h"
#include "sim_rng.h"
#include <limits>
#include <optional>
#include <vector>

namespace comet {

struct SteeringConfig {
  float seek_weight = 0.8f;
  float avoid_weight = 25.0f;
  float turn_rate = 6.0f;       // rad/s
  float danger_radius = 25.0f;  // surface distance that counts as a threat
  float arrival_tolerance = 8.0f;
  float max_steer_force = 80.0f;
  float waypoint_margin = 20.0f;
  int waypoint_candidates = 10;
  int maneuver_cooldown_ticks = 15;
};

// Anything the pilot should steer around
struct Threat {
  Vec2 position;
  float radius = 0.0f;
};

struct SurvivalLog {
  int frames_survived = 0;
  int avoidance_maneuvers = 0;
  float closest_call_distance = std::numeric_limits<float>::infinity();
  int waypoints_reached = 0;
  int total_collisions = 0;
  float total_steering_magnitude = 0.0f;

  float average_steering() const {
    return frames_survived > 0
               ? total_steering_magnitude / (float)frames_survived
               : 0.0f;
  }
};

// ═════════════════════════════════════════════════════════════
// SteeringPilot — seek + avoid control law.
//
// compute_steering() is the control law: it reads the ship and
// updates waypoint/telemetry, never the ship. apply_to_ship()
// is the actuator: heading + thrust on a KineticEntity.
// Callers feed positions frozen at the end of the previous
// tick, so the law never sees half-integrated state.
// ═════════════════════════════════════════════════════════════
class SteeringPilot {
public:
  SteeringPilot() = default;
  explicit SteeringPilot(const SteeringConfig &config);

  Vec2 compute_steering(const KineticEntity &ship,
                        const std::vector<Threat> &threats,
                        const WrapBounds &bounds, SimRng &rng);

  // Rotate toward the steering angle (capped at turn_rate * dt), then
  // thrust forward. A zero steering vector leaves the ship coasting.
  static void apply_to_ship(Vec2 steering, KineticEntity &ship, float dt,
                            float turn_rate);

  void set_waypoint(std::optional<Vec2> waypoint) { waypoint_ = waypoint; }
  std::optional<Vec2> waypoint() const { return waypoint_; }

  void record_collision() { log_.total_collisions++; }

  const SurvivalLog &log() const { return log_; }
  const SteeringConfig &config() const { return config_; }
  int maneuver_cooldown() const { return maneuver_cooldown_; }

private:
  Vec2 avoid(const KineticEntity &ship, const std::vector<Threat> &threats,
             const WrapBounds &bounds, bool &dodging);
  void select_waypoint(const std::vector<Threat> &threats,
                       const WrapBounds &bounds, SimRng &rng);

  SteeringConfig config_;
  std::optional<Vec2> waypoint_;
  int maneuver_cooldown_ = 0; // ticks until the next maneuver may count
  SurvivalLog log_;
};

} // namespace comet

#endif // COMET_STEERING_PILOT_H
