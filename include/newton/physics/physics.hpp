/// @file physics.hpp
/// @brief Main include header for newton_physics
///
/// newton_physics is a deterministic 2D simulation core for driving layer
/// transforms:
/// - Rigid bodies (circle, box, capsule) with impulse collision response
/// - Verlet soft bodies and cloth with breakable constraints
/// - Animated force fields (gravity, wind, attraction, explosion, buoyancy,
///   vortex, drag)
/// - Humanoid ragdolls built from capsules and pivot joints
/// - Frame-addressable evaluation with checkpoint replay for scrubbing
/// - Keyframe export
///
/// ## Quick Start
///
/// ### Dropping a Ball
/// ```cpp
/// #include <newton/physics/physics.hpp>
///
/// newton_physics::PhysicsEngine engine;
///
/// auto floor = newton_physics::make_box_body("floor", "", {0, 500}, 1000, 20);
/// floor.type = newton_physics::BodyType::Static;
/// engine.add_rigid_body(floor).unwrap();
/// engine.add_rigid_body(newton_physics::make_circle_body("ball", "ball_layer", {0, 0}, 10)).unwrap();
///
/// auto state = engine.evaluate_frame(90);
/// if (state) {
///     for (const auto& body : state->rigid_bodies) {
///         spdlog::info("{} at ({}, {})", body.id, body.position.x, body.position.y);
///     }
/// }
/// ```
///
/// ### Ragdolls
/// ```cpp
/// newton_physics::RagdollBuilder builder("hero", "hero_layer");
/// builder.set_position(200, 100);
/// builder.from_preset("adult").unwrap();
/// engine.add_ragdoll(builder.build()).unwrap();
/// ```
///
/// ### Baking Keyframes
/// ```cpp
/// newton_physics::KeyframeExportOptions options;
/// options.start_frame = 0;
/// options.end_frame = 120;
/// options.simplify = true;
///
/// auto tracks = engine.export_keyframes(options);
/// if (tracks) {
///     std::string document = newton_physics::to_json(*tracks).dump(2);
/// }
/// ```

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "shape.hpp"
#include "random.hpp"
#include "body.hpp"
#include "collision.hpp"
#include "joint.hpp"
#include "verlet.hpp"
#include "soft_body.hpp"
#include "cloth.hpp"
#include "force_field.hpp"
#include "ragdoll.hpp"
#include "snapshot.hpp"
#include "keyframe_export.hpp"
#include "engine.hpp"
#include "serialization.hpp"

namespace newton_physics {

/// Prelude - commonly used types
namespace prelude {
    using newton_physics::PhysicsEngine;
    using newton_physics::PhysicsSpaceConfig;
    using newton_physics::PhysicsSimulationState;

    using newton_physics::RigidBodyConfig;
    using newton_physics::RigidBodyState;
    using newton_physics::BodyType;
    using newton_physics::PhysicsMaterial;
    using newton_physics::CollisionFilter;
    using newton_physics::CollisionResponse;

    using newton_physics::Shape;
    using newton_physics::CircleShape;
    using newton_physics::BoxShape;
    using newton_physics::CapsuleShape;

    using newton_physics::SoftBodyConfig;
    using newton_physics::ClothConfig;
    using newton_physics::PivotJointConfig;

    using newton_physics::ForceField;
    using newton_physics::ForceFieldKind;

    using newton_physics::RagdollBuilder;
    using newton_physics::RagdollConfig;

    using newton_physics::KeyframeExportOptions;
    using newton_physics::ExportedKeyframes;
}

} // namespace newton_physics
