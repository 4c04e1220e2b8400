/// @file cloth.cpp
/// @brief Cloth grid generation and simulation

#include <newton/physics/cloth.hpp>

#include <algorithm>
#include <cmath>

namespace newton_physics {

using newton_core::SimulationError;
using newton_math::Vec2;

const char* to_string(ClothConstraintKind kind) {
    switch (kind) {
        case ClothConstraintKind::Structural: return "structural";
        case ClothConstraintKind::Shear: return "shear";
        case ClothConstraintKind::Bend: return "bend";
    }
    return "unknown";
}

// =============================================================================
// ClothConfig
// =============================================================================

newton_core::Result<void> ClothConfig::validate() const {
    if (id.empty()) {
        return newton_core::Err(SimulationError::invalid_config("cloth id must not be empty"));
    }
    if (width == 0 || height == 0) {
        return newton_core::Err(SimulationError::invalid_config(id, "cloth grid must be at least 1x1"));
    }
    if (!(spacing > 0.0f)) {
        return newton_core::Err(SimulationError::invalid_config(id, "cloth spacing must be positive"));
    }
    if (!(particle_mass > 0.0f)) {
        return newton_core::Err(SimulationError::invalid_config(id, "cloth particle mass must be positive"));
    }
    for (float stiffness : {structural_stiffness, shear_stiffness, bend_stiffness}) {
        if (!(stiffness >= 0.0f && stiffness <= 1.0f)) {
            return newton_core::Err(SimulationError::invalid_config(id, "cloth stiffness must be in [0, 1]"));
        }
    }
    if (iterations < 1) {
        return newton_core::Err(SimulationError::invalid_config(id, "cloth needs at least one solver iteration"));
    }
    if (!(damping >= 0.0f && damping <= 1.0f)) {
        return newton_core::Err(SimulationError::invalid_config(id, "cloth damping must be in [0, 1]"));
    }
    if (!(tear_threshold == 0.0f || (std::isfinite(tear_threshold) && tear_threshold >= 1.0f))) {
        return newton_core::Err(SimulationError::invalid_config(id, "cloth tear threshold must be zero or at least 1"));
    }
    const std::size_t count = static_cast<std::size_t>(width) * height;
    for (auto index : pinned_particles) {
        if (index >= count) {
            return newton_core::Err(SimulationError::invalid_config(
                id, "pinned particle index " + std::to_string(index) + " is outside the grid"));
        }
    }
    return newton_core::Ok();
}

ClothConfig make_cloth_config(const std::string& id, const std::string& layer_id, const Vec2& origin,
                              std::uint32_t width, std::uint32_t height,
                              float spacing, ClothPinMode pin_mode) {
    ClothConfig config;
    config.id = id;
    config.layer_id = layer_id;
    config.width = width;
    config.height = height;
    config.spacing = spacing;
    config.origin = origin;
    config.collision_radius = spacing * 0.3f;

    switch (pin_mode) {
        case ClothPinMode::TopRow:
            for (std::uint32_t x = 0; x < width; ++x) {
                config.pinned_particles.push_back(x);
            }
            break;
        case ClothPinMode::TopCorners:
            if (width > 0) {
                config.pinned_particles.push_back(0);
                if (width > 1) {
                    config.pinned_particles.push_back(width - 1);
                }
            }
            break;
        case ClothPinMode::None:
            break;
    }

    return config;
}

// =============================================================================
// Cloth
// =============================================================================

newton_core::Result<Cloth> Cloth::create(ClothConfig config) {
    auto valid = config.validate();
    if (!valid) {
        return newton_core::Err<Cloth>(valid.error());
    }

    Cloth cloth;
    cloth.m_config = std::move(config);
    cloth.reset();
    return newton_core::Ok(std::move(cloth));
}

void Cloth::add_link(std::size_t a, std::size_t b, float rest, float stiffness,
                     std::uint32_t row, std::uint32_t col, ClothConstraintKind kind) {
    VerletConstraint c;
    c.id = std::string(to_string(kind)) + "_" + std::to_string(a) + "_" + std::to_string(b);
    c.particle_a = a;
    c.particle_b = b;
    c.rest_length = rest;
    c.stiffness = stiffness;
    if (kind == ClothConstraintKind::Structural && m_config.tear_threshold > 0.0f) {
        c.break_threshold = m_config.tear_threshold;
    }
    m_constraints.push_back(std::move(c));
    m_locations.push_back(TornConstraint{row, col, kind});
}

void Cloth::reset() {
    const std::uint32_t w = m_config.width;
    const std::uint32_t h = m_config.height;
    const float s = m_config.spacing;

    m_particles.clear();
    m_particles.reserve(static_cast<std::size_t>(w) * h);
    for (std::uint32_t y = 0; y < h; ++y) {
        for (std::uint32_t x = 0; x < w; ++x) {
            VerletParticle p;
            p.id = std::to_string(y) + "_" + std::to_string(x);
            p.position = m_config.origin + Vec2(static_cast<float>(x) * s, static_cast<float>(y) * s);
            p.previous_position = p.position;
            p.mass = m_config.particle_mass;
            p.inverse_mass = 1.0f / m_config.particle_mass;
            p.radius = m_config.collision_radius;
            m_particles.push_back(std::move(p));
        }
    }

    for (auto index : m_config.pinned_particles) {
        m_particles[index].pinned = true;
        m_particles[index].inverse_mass = 0.0f;
    }

    m_constraints.clear();
    m_locations.clear();

    auto index = [w](std::uint32_t x, std::uint32_t y) {
        return static_cast<std::size_t>(y) * w + x;
    };

    // Structural
    for (std::uint32_t y = 0; y < h; ++y) {
        for (std::uint32_t x = 0; x < w; ++x) {
            if (x + 1 < w) {
                add_link(index(x, y), index(x + 1, y), s, m_config.structural_stiffness,
                         y, x, ClothConstraintKind::Structural);
            }
            if (y + 1 < h) {
                add_link(index(x, y), index(x, y + 1), s, m_config.structural_stiffness,
                         y, x, ClothConstraintKind::Structural);
            }
        }
    }

    // Shear
    if (m_config.shear_stiffness > 0.0f) {
        const float diagonal = s * newton_math::consts::SQRT_2;
        for (std::uint32_t y = 0; y + 1 < h; ++y) {
            for (std::uint32_t x = 0; x + 1 < w; ++x) {
                add_link(index(x, y), index(x + 1, y + 1), diagonal, m_config.shear_stiffness,
                         y, x, ClothConstraintKind::Shear);
                add_link(index(x + 1, y), index(x, y + 1), diagonal, m_config.shear_stiffness,
                         y, x, ClothConstraintKind::Shear);
            }
        }
    }

    // Bend
    if (m_config.bend_stiffness > 0.0f) {
        for (std::uint32_t y = 0; y < h; ++y) {
            for (std::uint32_t x = 0; x + 2 < w; ++x) {
                add_link(index(x, y), index(x + 2, y), s * 2.0f, m_config.bend_stiffness,
                         y, x, ClothConstraintKind::Bend);
            }
        }
        for (std::uint32_t y = 0; y + 2 < h; ++y) {
            for (std::uint32_t x = 0; x < w; ++x) {
                add_link(index(x, y), index(x, y + 2), s * 2.0f, m_config.bend_stiffness,
                         y, x, ClothConstraintKind::Bend);
            }
        }
    }
}

ClothState Cloth::state() const {
    ClothState s;
    s.id = m_config.id;
    s.width = m_config.width;
    s.height = m_config.height;
    s.positions.reserve(m_particles.size());
    for (const auto& p : m_particles) {
        s.positions.push_back(p.position);
    }
    for (std::size_t i = 0; i < m_constraints.size(); ++i) {
        if (m_constraints[i].broken) {
            s.torn.push_back(m_locations[i]);
        }
    }
    return s;
}

void Cloth::load_state(const ClothState& state) {
    const std::size_t count = std::min(state.positions.size(), m_particles.size());
    for (std::size_t i = 0; i < count; ++i) {
        m_particles[i].position = state.positions[i];
        m_particles[i].previous_position = state.positions[i];
        m_particles[i].acceleration = newton_math::vec2::ZERO;
    }

    // Horizontal and vertical structural links share a location, so both are marked
    for (std::size_t i = 0; i < m_constraints.size(); ++i) {
        m_constraints[i].broken =
            std::find(state.torn.begin(), state.torn.end(), m_locations[i]) != state.torn.end();
    }
}

// =============================================================================
// ClothSimulator
// =============================================================================

newton_core::Result<void> ClothSimulator::add_cloth(ClothConfig config) {
    if (contains(config.id)) {
        return newton_core::Err(SimulationError::duplicate_id(config.id));
    }

    auto cloth = Cloth::create(std::move(config));
    if (!cloth) {
        return newton_core::Err(cloth.error());
    }

    m_cloths.push_back(std::move(cloth).value());
    return newton_core::Ok();
}

bool ClothSimulator::remove_cloth(const std::string& id) {
    auto it = std::find_if(m_cloths.begin(), m_cloths.end(),
                           [&id](const Cloth& c) { return c.id() == id; });
    if (it == m_cloths.end()) {
        return false;
    }
    m_cloths.erase(it);
    return true;
}

Cloth* ClothSimulator::find(const std::string& id) {
    for (auto& cloth : m_cloths) {
        if (cloth.id() == id) {
            return &cloth;
        }
    }
    return nullptr;
}

const Cloth* ClothSimulator::find(const std::string& id) const {
    for (const auto& cloth : m_cloths) {
        if (cloth.id() == id) {
            return &cloth;
        }
    }
    return nullptr;
}

void ClothSimulator::apply_acceleration(const std::string& id, const Vec2& acceleration) {
    if (auto* cloth = find(id)) {
        verlet::accelerate(cloth->particles(), acceleration);
    }
}

void ClothSimulator::apply_acceleration_to_all(const Vec2& acceleration) {
    for (auto& cloth : m_cloths) {
        verlet::accelerate(cloth.particles(), acceleration);
    }
}

void ClothSimulator::integrate(float dt) {
    for (auto& cloth : m_cloths) {
        verlet::integrate(cloth.particles(), dt, cloth.config().damping);
    }
}

std::size_t ClothSimulator::solve_constraints() {
    std::size_t torn = 0;
    for (auto& cloth : m_cloths) {
        torn += verlet::solve(cloth.particles(), cloth.constraints(), cloth.config().iterations);
    }
    return torn;
}

std::vector<ClothState> ClothSimulator::states() const {
    std::vector<ClothState> result;
    result.reserve(m_cloths.size());
    for (const auto& cloth : m_cloths) {
        result.push_back(cloth.state());
    }
    return result;
}

void ClothSimulator::load_state(const ClothState& state) {
    if (auto* cloth = find(state.id)) {
        cloth->load_state(state);
    }
}

void ClothSimulator::reset_all() {
    for (auto& cloth : m_cloths) {
        cloth.reset();
    }
}

} // namespace newton_physics
