/// @file cloth.hpp
/// @brief Grid cloth built from Verlet particles

#pragma once

#include "fwd.hpp"
#include "verlet.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace newton_physics {

// =============================================================================
// Cloth Configuration
// =============================================================================

/// Constraint family within the cloth grid
enum class ClothConstraintKind : std::uint8_t {
    Structural,     ///< Right and below neighbors
    Shear,          ///< Diagonal neighbors
    Bend,           ///< Skip-one neighbors
};

[[nodiscard]] const char* to_string(ClothConstraintKind kind);

/// Pin layout used by make_cloth_config
enum class ClothPinMode : std::uint8_t {
    None,
    TopRow,
    TopCorners,
};

struct ClothConfig {
    std::string id;
    std::string layer_id;

    std::uint32_t width = 10;                   ///< Particles per row
    std::uint32_t height = 10;                  ///< Rows
    float spacing = 10.0f;
    newton_math::Vec2 origin{0.0f, 0.0f};       ///< Position of particle (0, 0)
    std::vector<std::size_t> pinned_particles;  ///< Row-major indices

    float structural_stiffness = 0.8f;
    float shear_stiffness = 0.5f;               ///< Zero disables shear links
    float bend_stiffness = 0.3f;                ///< Zero disables bend links

    std::uint32_t iterations = 5;               ///< Relaxation passes per step
    float damping = 0.98f;
    float particle_mass = 0.1f;
    float collision_radius = 3.0f;
    float tear_threshold = 0.0f;                ///< Structural links snap beyond rest * threshold; zero disables

    [[nodiscard]] newton_core::Result<void> validate() const;
};

/// Config with default tuning for a grid, pinned per `pin_mode`
[[nodiscard]] ClothConfig make_cloth_config(const std::string& id, const std::string& layer_id,
                                            const newton_math::Vec2& origin,
                                            std::uint32_t width, std::uint32_t height,
                                            float spacing = 10.0f,
                                            ClothPinMode pin_mode = ClothPinMode::TopRow);

/// Grid location of a torn link (row and column of its first particle)
struct TornConstraint {
    std::uint32_t row = 0;
    std::uint32_t col = 0;
    ClothConstraintKind kind = ClothConstraintKind::Structural;

    bool operator==(const TornConstraint& other) const noexcept {
        return row == other.row && col == other.col && kind == other.kind;
    }
};

struct ClothState {
    std::string id;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<newton_math::Vec2> positions;   ///< Row-major
    std::vector<TornConstraint> torn;
};

// =============================================================================
// Cloth
// =============================================================================

class Cloth {
public:
    /// Build the grid; fails on invalid dimensions or pinned indices
    [[nodiscard]] static newton_core::Result<Cloth> create(ClothConfig config);

    [[nodiscard]] const std::string& id() const noexcept { return m_config.id; }
    [[nodiscard]] const ClothConfig& config() const noexcept { return m_config; }

    [[nodiscard]] std::vector<VerletParticle>& particles() noexcept { return m_particles; }
    [[nodiscard]] const std::vector<VerletParticle>& particles() const noexcept { return m_particles; }
    [[nodiscard]] std::vector<VerletConstraint>& constraints() noexcept { return m_constraints; }
    [[nodiscard]] const std::vector<VerletConstraint>& constraints() const noexcept { return m_constraints; }

    /// Grid location of each constraint, parallel to constraints()
    [[nodiscard]] const std::vector<TornConstraint>& constraint_locations() const noexcept { return m_locations; }

    [[nodiscard]] const VerletParticle& particle_at(std::uint32_t row, std::uint32_t col) const {
        return m_particles[static_cast<std::size_t>(row) * m_config.width + col];
    }

    [[nodiscard]] ClothState state() const;

    /// Overwrite positions (at rest) and torn links
    void load_state(const ClothState& state);

    void reset();

private:
    Cloth() = default;

    void add_link(std::size_t a, std::size_t b, float rest, float stiffness,
                  std::uint32_t row, std::uint32_t col, ClothConstraintKind kind);

    ClothConfig m_config;
    std::vector<VerletParticle> m_particles;
    std::vector<VerletConstraint> m_constraints;
    std::vector<TornConstraint> m_locations;
};

// =============================================================================
// ClothSimulator
// =============================================================================

class ClothSimulator {
public:
    [[nodiscard]] newton_core::Result<void> add_cloth(ClothConfig config);
    bool remove_cloth(const std::string& id);

    [[nodiscard]] Cloth* find(const std::string& id);
    [[nodiscard]] const Cloth* find(const std::string& id) const;
    [[nodiscard]] bool contains(const std::string& id) const { return find(id) != nullptr; }

    [[nodiscard]] std::vector<Cloth>& cloths() noexcept { return m_cloths; }
    [[nodiscard]] const std::vector<Cloth>& cloths() const noexcept { return m_cloths; }
    [[nodiscard]] std::size_t size() const noexcept { return m_cloths.size(); }

    void apply_acceleration(const std::string& id, const newton_math::Vec2& acceleration);
    void apply_acceleration_to_all(const newton_math::Vec2& acceleration);

    /// Integrate each cloth with its own damping
    void integrate(float dt);

    /// Relax each cloth with its own iteration count, returns links torn
    std::size_t solve_constraints();

    [[nodiscard]] std::vector<ClothState> states() const;
    void load_state(const ClothState& state);

    void reset_all();
    void clear() { m_cloths.clear(); }

private:
    std::vector<Cloth> m_cloths;
};

} // namespace newton_physics
