#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for newton_physics

#include <cstdint>

namespace newton_physics {

// Enums
enum class BodyType : std::uint8_t;
enum class CollisionResponse : std::uint8_t;
enum class Falloff : std::uint8_t;
enum class ClothConstraintKind : std::uint8_t;
enum class KeyframeProperty : std::uint8_t;
enum class KeyframeInterpolation : std::uint8_t;

// Core types
struct PhysicsMaterial;
struct CollisionFilter;
struct ContactInfo;
struct PhysicsSpaceConfig;

// Shapes
struct CircleShape;
struct BoxShape;
struct CapsuleShape;

// Random
class PhysicsRandom;

// Rigid bodies
struct RigidBodyConfig;
struct RigidBodyState;
class RigidBody;
class RigidBodySimulator;

// Collision
struct CollisionPair;
class CollisionDetector;
class CollisionResolver;

// Joints
struct PivotJointConfig;
class JointSystem;

// Verlet
struct VerletParticle;
struct VerletConstraint;
struct SoftBodyConfig;
struct SoftBodyState;
class SoftBodySimulator;
struct ClothConfig;
struct ClothState;
class ClothSimulator;

// Force fields
template<typename T>
struct AnimatableProperty;
class IPropertyEvaluator;
struct ForceField;
class ForceFieldProcessor;

// Ragdolls
struct RagdollBone;
struct RagdollConfig;
struct RagdollState;
struct HumanoidPreset;
class RagdollBuilder;

// Engine
struct Checkpoint;
class CheckpointStore;
struct PhysicsSimulationState;
struct KeyframeExportOptions;
struct ExportedKeyframes;
class PhysicsEngine;

} // namespace newton_physics
