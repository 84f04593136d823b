// ═════════════════════════════════════════════════════════════════════════════
// THE COMET ENGINE: UNITY BUILD
// ═════════════════════════════════════════════════════════════════════════════
// Compile ONLY this file into the GDExtension. One Translation Unit means one
// copy of every flecs::type_id<T>::id static, so component IDs registered in
// install_simulation() match the ones the GDScript-facing code resolves.
//
// ORDER MATTERS: leaf math first, then the ECS pipeline, then Godot glue.
// ═════════════════════════════════════════════════════════════════════════════

// 1. Core math + subsystems (Godot-free, also built into comet_tests)
#include "kinetics.cpp"
#include "projectile_pool.cpp"
#include "fracture_system.cpp"
#include "steering_pilot.cpp"
#include "collision.cpp"

// 2. Data (JSON config loader)
#include "config_loader.cpp"

// 3. Systems (flecs pipeline + spawn helpers)
#include "comet_systems.cpp"

// 4. Rendering Bridge (frame buffers)
#include "rendering_bridge.cpp"

// 5. Godot node + extension entry point
#include "world_manager.cpp"
#include "register_types.cpp"
