/// @file collision.hpp
/// @brief Collision detection for newton_physics

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace newton_physics {

class RigidBody;

// =============================================================================
// Contact Data
// =============================================================================

/// Result of a narrow-phase test
///
/// The normal always points from the first shape towards the second.
struct Manifold {
    newton_math::Vec2 normal{1.0f, 0.0f};
    float depth = 0.0f;
    newton_math::Vec2 point{0.0f, 0.0f};
};

/// Overlapping body pair found by the detector
struct CollisionPair {
    std::size_t body_a = 0;     ///< Index into the body list
    std::size_t body_b = 0;
    Manifold manifold;
};

// =============================================================================
// Narrow Phase
// =============================================================================

namespace narrow_phase {

/// Circle against circle
[[nodiscard]] std::optional<Manifold> circle_vs_circle(
    const newton_math::Vec2& center_a, float radius_a,
    const newton_math::Vec2& center_b, float radius_b);

/// Circle against a rotated box; the normal points from the circle to the box
[[nodiscard]] std::optional<Manifold> circle_vs_box(
    const newton_math::Vec2& center, float radius,
    const newton_math::Vec2& box_center, float box_angle,
    float half_width, float half_height);

/// Box against box, rotation ignored (axis-aligned overlap only)
[[nodiscard]] std::optional<Manifold> box_vs_box(
    const newton_math::Vec2& center_a, float half_width_a, float half_height_a,
    const newton_math::Vec2& center_b, float half_width_b, float half_height_b);

} // namespace narrow_phase

// =============================================================================
// CollisionDetector
// =============================================================================

/// Exhaustive pairwise broad phase plus shape-pair narrow phase
class CollisionDetector {
public:
    using BodyPairSet = std::set<std::pair<std::string, std::string>>;

    /// Broad-phase rejection rules (immovable pairs, dead bodies, response, filter)
    [[nodiscard]] static bool can_collide(const RigidBody& a, const RigidBody& b);

    /// Narrow phase for one pair; unhandled shape pairs are tested as circles
    [[nodiscard]] static std::optional<Manifold> test_pair(const RigidBody& a, const RigidBody& b);

    /// Find all overlapping pairs in list order
    [[nodiscard]] std::vector<CollisionPair> detect(const std::vector<RigidBody>& bodies) const;

    /// Pairs that never collide regardless of filters (jointed bodies)
    void set_excluded_pairs(BodyPairSet pairs) { m_excluded = std::move(pairs); }
    [[nodiscard]] const BodyPairSet& excluded_pairs() const noexcept { return m_excluded; }

private:
    [[nodiscard]] bool is_excluded(const std::string& a, const std::string& b) const;

    BodyPairSet m_excluded;
};

// =============================================================================
// CollisionResolver
// =============================================================================

/// Impulse resolution with restitution, friction, and positional correction
class CollisionResolver {
public:
    /// Resolve one pair; returns contact data unless the bodies are separating
    /// or both are immovable
    std::optional<ContactInfo> resolve(const CollisionPair& pair, std::vector<RigidBody>& bodies,
                                       const PhysicsSpaceConfig& space) const;

    /// Resolve every pair in order
    std::vector<ContactInfo> resolve_all(const std::vector<CollisionPair>& pairs, std::vector<RigidBody>& bodies,
                                         const PhysicsSpaceConfig& space) const;
};

} // namespace newton_physics
