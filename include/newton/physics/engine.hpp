/// @file engine.hpp
/// @brief Frame-addressable physics engine with checkpoint replay

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "random.hpp"
#include "body.hpp"
#include "collision.hpp"
#include "joint.hpp"
#include "soft_body.hpp"
#include "cloth.hpp"
#include "force_field.hpp"
#include "ragdoll.hpp"
#include "snapshot.hpp"
#include "keyframe_export.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace newton_physics {

// =============================================================================
// Simulation State
// =============================================================================

/// Everything the renderer needs for one frame
struct PhysicsSimulationState {
    int frame = 0;
    std::vector<RigidBodyState> rigid_bodies;
    std::vector<SoftBodyState> soft_bodies;
    std::vector<ClothState> cloths;
    std::vector<RagdollState> ragdolls;
    std::vector<ContactInfo> contacts;
};

// =============================================================================
// PhysicsEngine
// =============================================================================

/// Owns every simulator and answers "what does the world look like at frame N"
///
/// The state at frame N is the initial configuration advanced by the fixed
/// steps for frames 0..N. Evaluation resumes from the newest checkpoint at or
/// before N (or from the live state when it is newer and still behind N), so
/// scrubbing in any order yields the same result as one linear run. Every
/// mutation drops the checkpoints and the cached frame.
///
/// Not thread safe; callers serialize access.
class PhysicsEngine {
public:
    explicit PhysicsEngine(PhysicsSpaceConfig config = PhysicsSpaceConfig::defaults());
    ~PhysicsEngine() = default;

    PhysicsEngine(const PhysicsEngine&) = delete;
    PhysicsEngine& operator=(const PhysicsEngine&) = delete;
    PhysicsEngine(PhysicsEngine&&) = default;
    PhysicsEngine& operator=(PhysicsEngine&&) = default;

    // =========================================================================
    // Configuration
    // =========================================================================

    [[nodiscard]] const PhysicsSpaceConfig& config() const noexcept { return m_config; }

    /// Replace the space configuration; invalid configs leave the engine unchanged
    [[nodiscard]] newton_core::Result<void> set_config(const PhysicsSpaceConfig& config);

    [[nodiscard]] newton_core::Result<void> set_force_fields(std::vector<ForceField> fields);
    [[nodiscard]] newton_core::Result<void> add_force_field(ForceField field);
    [[nodiscard]] newton_core::Result<bool> remove_force_field(const std::string& id);
    [[nodiscard]] const std::vector<ForceField>& force_fields() const noexcept { return m_force_fields.fields(); }

    /// Source of animated force field parameters; null restores static values
    [[nodiscard]] newton_core::Result<void> set_property_evaluator(std::shared_ptr<const IPropertyEvaluator> evaluator);

    // =========================================================================
    // Entities
    // =========================================================================

    [[nodiscard]] newton_core::Result<void> add_rigid_body(RigidBodyConfig config);

    /// Remove a body and every joint attached to it
    [[nodiscard]] newton_core::Result<bool> remove_rigid_body(const std::string& id);

    [[nodiscard]] newton_core::Result<void> add_soft_body(SoftBodyConfig config);
    [[nodiscard]] newton_core::Result<bool> remove_soft_body(const std::string& id);

    [[nodiscard]] newton_core::Result<void> add_cloth(ClothConfig config);
    [[nodiscard]] newton_core::Result<bool> remove_cloth(const std::string& id);

    [[nodiscard]] newton_core::Result<void> add_joint(PivotJointConfig config);
    [[nodiscard]] newton_core::Result<bool> remove_joint(const std::string& id);

    /// Convert a ragdoll, add its bodies and joints, and register it
    ///
    /// Nothing is added when any body or joint would be rejected.
    [[nodiscard]] newton_core::Result<void> add_ragdoll(const RagdollConfig& config);

    /// Track a ragdoll whose bodies were added separately
    [[nodiscard]] newton_core::Result<void> register_ragdoll(const std::string& id, std::vector<RagdollBone> bones);

    /// Stop tracking a ragdoll; its bodies and joints stay
    [[nodiscard]] newton_core::Result<bool> remove_ragdoll(const std::string& id);

    /// Make a ragdoll state the initial state of its bodies
    [[nodiscard]] newton_core::Result<void> apply_ragdoll_state(const RagdollState& state);

    // =========================================================================
    // Evaluation
    // =========================================================================

    /// State after the step for `frame`
    [[nodiscard]] newton_core::Result<PhysicsSimulationState> evaluate_frame(int frame);

    /// Sample body transforms over a frame range as layer keyframes
    [[nodiscard]] newton_core::Result<std::vector<ExportedKeyframes>> export_keyframes(
        const KeyframeExportOptions& options);

    // =========================================================================
    // Queries
    // =========================================================================

    /// Current live state of one entity; empty for an unknown id
    [[nodiscard]] newton_core::Result<std::optional<RigidBodyState>> rigid_body_state(const std::string& id) const;
    [[nodiscard]] newton_core::Result<std::optional<SoftBodyState>> soft_body_state(const std::string& id) const;
    [[nodiscard]] newton_core::Result<std::optional<ClothState>> cloth_state(const std::string& id) const;
    [[nodiscard]] newton_core::Result<std::optional<RagdollState>> ragdoll_state(const std::string& id) const;

    /// Entity ids in insertion order
    [[nodiscard]] newton_core::Result<std::vector<std::string>> rigid_body_ids() const;
    [[nodiscard]] newton_core::Result<std::vector<std::string>> soft_body_ids() const;
    [[nodiscard]] newton_core::Result<std::vector<std::string>> cloth_ids() const;
    [[nodiscard]] newton_core::Result<std::vector<std::string>> joint_ids() const;
    [[nodiscard]] newton_core::Result<std::vector<std::string>> ragdoll_ids() const;

    /// Last evaluated frame, or -1 when nothing is cached
    [[nodiscard]] int last_simulated_frame() const noexcept { return m_last_frame; }

    [[nodiscard]] std::vector<int> checkpoint_frames() const { return m_checkpoints.frames(); }

    [[nodiscard]] const PhysicsRandom& random() const noexcept { return m_random; }

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Drop checkpoints and the cached frame
    [[nodiscard]] newton_core::Result<void> clear_cache();

    /// Release all entities; every later call fails with a Disposed error
    void dispose();

    [[nodiscard]] bool is_disposed() const noexcept { return m_disposed; }

private:
    [[nodiscard]] newton_core::Result<void> check_alive(const char* operation) const;
    void invalidate(const char* reason);
    void refresh_excluded_pairs();

    /// Move the live world to the state before the step for `frame`
    void rewind_for(int frame);

    /// Advance the live world by one fixed step
    void step(int frame);

    [[nodiscard]] PhysicsSimulationState capture_state(int frame) const;
    [[nodiscard]] std::vector<ContactInfo> current_contacts() const;

    PhysicsSpaceConfig m_config;
    PhysicsRandom m_random;

    RigidBodySimulator m_rigid_bodies;
    SoftBodySimulator m_soft_bodies;
    ClothSimulator m_cloths;
    JointSystem m_joints;
    CollisionDetector m_detector;
    CollisionResolver m_resolver;
    ForceFieldProcessor m_force_fields;
    std::map<std::string, std::vector<RagdollBone>> m_ragdolls;

    CheckpointStore m_checkpoints;
    int m_last_frame = -1;
    std::optional<PhysicsSimulationState> m_cached_state;
    bool m_disposed = false;
};

} // namespace newton_physics
