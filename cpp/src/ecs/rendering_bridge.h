#ifndef COMET_RENDERING_BRIDGE_H
#define COMET_RENDERING_BRIDGE_H

#include "comet_components.h"
#include <godot_cpp/variant/packed_float32_array.hpp>

namespace comet {

// ═══════════════════════════════════════════════════════════════
// FRAME BUFFERS (read by GDScript once per tick)
//
// Flat float arrays, one fixed-size record per body, in the
// same order as the FrameSnapshot vectors. C++ writes through
// .ptrw(); the buffer is only resized when the count changes.
// ═══════════════════════════════════════════════════════════════
constexpr int FLOATS_PER_SHIP = 4;       // x, y, heading, radius
constexpr int FLOATS_PER_ASTEROID = 5;   // x, y, heading, radius, tier
constexpr int FLOATS_PER_PROJECTILE = 4; // x, y, heading, radius

void sync_ships(const FrameSnapshot &snap,
                godot::PackedFloat32Array &buffer_out, int &count_out);

void sync_asteroids(const FrameSnapshot &snap,
                    godot::PackedFloat32Array &buffer_out, int &count_out);

void sync_projectiles(const FrameSnapshot &snap,
                      godot::PackedFloat32Array &buffer_out, int &count_out);

} // namespace comet

#endif // COMET_RENDERING_BRIDGE_H
