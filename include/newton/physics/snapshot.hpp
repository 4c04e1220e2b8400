/// @file snapshot.hpp
/// @brief Checkpoint snapshots for frame replay

#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace newton_physics {

class RigidBody;
class RigidBodySimulator;
class SoftBodySimulator;
class ClothSimulator;
struct VerletParticle;
struct VerletConstraint;

// =============================================================================
// Body Snapshot
// =============================================================================

/// Complete mutable state of one rigid body
struct BodySnapshot {
    std::string id;
    newton_math::Vec2 position{0.0f, 0.0f};
    newton_math::Vec2 velocity{0.0f, 0.0f};
    float angle = 0.0f;
    float angular_velocity = 0.0f;
    bool sleeping = false;
    float sleep_time = 0.0f;

    [[nodiscard]] static BodySnapshot capture(const RigidBody& body);

    /// Restore into a body (forces are cleared)
    void restore_to(RigidBody& body) const;
};

// =============================================================================
// Particle Snapshot
// =============================================================================

/// Complete mutable state of a particle container (soft body or cloth)
struct VerletSnapshot {
    std::string id;
    std::vector<newton_math::Vec2> positions;
    std::vector<newton_math::Vec2> previous_positions;
    std::vector<bool> broken;

    [[nodiscard]] static VerletSnapshot capture(const std::string& id,
                                                const std::vector<VerletParticle>& particles,
                                                const std::vector<VerletConstraint>& constraints);

    /// Restore into matching containers (sizes must agree)
    void restore_to(std::vector<VerletParticle>& particles, std::vector<VerletConstraint>& constraints) const;
};

// =============================================================================
// Checkpoint
// =============================================================================

/// Full world state after a given frame's step
struct Checkpoint {
    int frame = 0;
    std::vector<BodySnapshot> bodies;
    std::vector<VerletSnapshot> soft_bodies;
    std::vector<VerletSnapshot> cloths;
    std::uint32_t random_state = 0;

    [[nodiscard]] static Checkpoint capture(int frame,
                                            const RigidBodySimulator& bodies,
                                            const SoftBodySimulator& soft_bodies,
                                            const ClothSimulator& cloths,
                                            std::uint32_t random_state);

    /// Restore entity state; entities missing from either side are skipped
    void restore_to(RigidBodySimulator& bodies, SoftBodySimulator& soft_bodies, ClothSimulator& cloths) const;
};

/// Frame-indexed checkpoint storage
class CheckpointStore {
public:
    void save(Checkpoint checkpoint);

    [[nodiscard]] bool contains(int frame) const { return m_checkpoints.count(frame) != 0; }

    /// Newest checkpoint with frame <= `frame`, or null
    [[nodiscard]] const Checkpoint* latest_at_or_before(int frame) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_checkpoints.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_checkpoints.empty(); }
    [[nodiscard]] std::vector<int> frames() const;

    void clear() { m_checkpoints.clear(); }

private:
    std::map<int, Checkpoint> m_checkpoints;
};

} // namespace newton_physics
