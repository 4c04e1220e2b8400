/// @file soft_body.hpp
/// @brief Soft bodies built from Verlet particles

#pragma once

#include "fwd.hpp"
#include "verlet.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace newton_physics {

// =============================================================================
// Soft Body Configuration
// =============================================================================

/// Particle description
struct SoftBodyParticleConfig {
    std::string id;
    newton_math::Vec2 position{0.0f, 0.0f};
    std::optional<newton_math::Vec2> previous_position;    ///< Defaults to position (at rest)
    float mass = 1.0f;
    bool pinned = false;
    float radius = 1.0f;
};

/// Constraint description, particles referenced by id
struct SoftBodyConstraintConfig {
    std::string id;
    std::string particle_a;
    std::string particle_b;
    std::optional<float> rest_length;      ///< Defaults to the initial distance
    float stiffness = 1.0f;
    std::optional<float> break_threshold;  ///< At least 1; zero disables breaking
};

struct SoftBodyConfig {
    std::string id;
    std::string layer_id;
    std::vector<SoftBodyParticleConfig> particles;
    std::vector<SoftBodyConstraintConfig> constraints;
};

/// Exported particle state
struct ParticleState {
    std::string id;
    newton_math::Vec2 position{0.0f, 0.0f};
    newton_math::Vec2 velocity{0.0f, 0.0f};    ///< position - previous_position
};

struct SoftBodyState {
    std::string id;
    std::vector<ParticleState> particles;
    std::vector<std::string> broken_constraints;
};

// =============================================================================
// SoftBody
// =============================================================================

/// A soft body's particles and constraints, resolved to indices
class SoftBody {
public:
    /// Build from configuration; fails on duplicate or unknown particle ids
    [[nodiscard]] static newton_core::Result<SoftBody> create(SoftBodyConfig config);

    [[nodiscard]] const std::string& id() const noexcept { return m_config.id; }
    [[nodiscard]] const SoftBodyConfig& config() const noexcept { return m_config; }

    [[nodiscard]] std::vector<VerletParticle>& particles() noexcept { return m_particles; }
    [[nodiscard]] const std::vector<VerletParticle>& particles() const noexcept { return m_particles; }
    [[nodiscard]] std::vector<VerletConstraint>& constraints() noexcept { return m_constraints; }
    [[nodiscard]] const std::vector<VerletConstraint>& constraints() const noexcept { return m_constraints; }

    [[nodiscard]] std::optional<std::size_t> particle_index(const std::string& particle_id) const;

    [[nodiscard]] SoftBodyState state() const;

    /// Overwrite particle positions and broken flags; unknown ids are ignored
    void load_state(const SoftBodyState& state);

    /// Rebuild particles and constraints from the configuration
    void reset();

private:
    SoftBody() = default;

    SoftBodyConfig m_config;
    std::vector<VerletParticle> m_particles;
    std::vector<VerletConstraint> m_constraints;
    std::unordered_map<std::string, std::size_t> m_particle_index;
};

// =============================================================================
// SoftBodySimulator
// =============================================================================

class SoftBodySimulator {
public:
    [[nodiscard]] newton_core::Result<void> add_soft_body(SoftBodyConfig config);
    bool remove_soft_body(const std::string& id);

    [[nodiscard]] SoftBody* find(const std::string& id);
    [[nodiscard]] const SoftBody* find(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const { return find(id) != nullptr; }

    [[nodiscard]] std::vector<SoftBody>& soft_bodies() noexcept { return m_soft_bodies; }
    [[nodiscard]] const std::vector<SoftBody>& soft_bodies() const noexcept { return m_soft_bodies; }
    [[nodiscard]] std::size_t size() const noexcept { return m_soft_bodies.size(); }

    /// Add an acceleration to one soft body's particles
    void apply_acceleration(const std::string& id, const newton_math::Vec2& acceleration);

    /// Add an acceleration to every soft body's particles
    void apply_acceleration_to_all(const newton_math::Vec2& acceleration);

    void integrate(float dt, float damping);

    /// Relax every soft body's constraints, returns how many broke
    std::size_t solve_constraints(std::uint32_t iterations);

    [[nodiscard]] std::vector<SoftBodyState> states() const;
    void load_state(const SoftBodyState& state);

    void reset_all();
    void clear() { m_soft_bodies.clear(); }

private:
    std::vector<SoftBody> m_soft_bodies;
};

} // namespace newton_physics
