#include "rendering_bridge.h"

namespace comet {

// ── Helper: resize (only on count change) + pack records ──────
static void pack_frames(const std::vector<BodyFrame> &frames, int stride,
                        godot::PackedFloat32Array &buffer_out,
                        int &count_out) {
  count_out = (int)frames.size();

  if (count_out == 0) {
    if (buffer_out.size() != 0)
      buffer_out.resize(0);
    return;
  }

  int required_size = count_out * stride;
  if (buffer_out.size() != required_size)
    buffer_out.resize(required_size);

  float *dest = buffer_out.ptrw();
  for (int i = 0; i < count_out; i++) {
    const BodyFrame &f = frames[(size_t)i];
    int offset = i * stride;
    dest[offset + 0] = f.x;
    dest[offset + 1] = f.y;
    dest[offset + 2] = f.heading;
    dest[offset + 3] = f.radius;
    if (stride > 4)
      dest[offset + 4] = (float)f.tier;
  }
}

void sync_ships(const FrameSnapshot &snap,
                godot::PackedFloat32Array &buffer_out, int &count_out) {
  pack_frames(snap.ships, FLOATS_PER_SHIP, buffer_out, count_out);
}

void sync_asteroids(const FrameSnapshot &snap,
                    godot::PackedFloat32Array &buffer_out, int &count_out) {
  pack_frames(snap.asteroids, FLOATS_PER_ASTEROID, buffer_out, count_out);
}

void sync_projectiles(const FrameSnapshot &snap,
                      godot::PackedFloat32Array &buffer_out, int &count_out) {
  pack_frames(snap.projectiles, FLOATS_PER_PROJECTILE, buffer_out, count_out);
}

} // namespace comet
