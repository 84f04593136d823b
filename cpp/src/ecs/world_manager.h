#ifndef COMET_WORLD_MANAGER_H
#define COMET_WORLD_MANAGER_H

#include <flecs.h>
#include <godot_cpp/classes/node.hpp>
#include <godot_cpp/variant/array.hpp>
#include <godot_cpp/variant/dictionary.hpp>
#include <godot_cpp/variant/packed_float32_array.hpp>
#include <godot_cpp/variant/string.hpp>

namespace godot {

class CometServer : public Node {
  GDCLASS(CometServer, Node)

private:
  flecs::world ecs;
  bool running = false;

  String config_path = "res://res/data/comet.json";
  double fixed_dt = 1.0 / 60.0;
  double accumulator = 0.0;

  // Frame buffers (see rendering_bridge.h for the record layout)
  PackedFloat32Array ship_buffer;
  int ship_count = 0;
  PackedFloat32Array asteroid_buffer;
  int asteroid_count = 0;
  PackedFloat32Array projectile_buffer;
  int projectile_count = 0;

  // Drained by get_score_events()
  Array pending_events;

  void collect_tick_events();

protected:
  static void _bind_methods();

public:
  CometServer();
  ~CometServer();

  void _ready() override;
  void _process(double delta) override;

  bool init_ecs();

  // --- GDScript API ---
  void set_config_path(const String &path);
  String get_config_path() const;
  bool is_running() const;

  int64_t spawn_ship(float x, float y, float heading, bool is_player);
  int64_t spawn_autopilot_ship(float x, float y, float heading,
                               bool auto_fire);
  bool fire(int64_t ship_id);
  int start_wave(int wave);
  int spawn_asteroids(int count);
  int get_wave() const;

  PackedFloat32Array get_ship_buffer() const;
  int get_ship_count() const;
  PackedFloat32Array get_asteroid_buffer() const;
  int get_asteroid_count() const;
  PackedFloat32Array get_projectile_buffer() const;
  int get_projectile_count() const;

  Array get_score_events();
  Dictionary get_pilot_telemetry(int64_t ship_id) const;
  Dictionary get_pool_status() const;
};

} // namespace godot

#endif // COMET_WORLD_MANAGER_H
