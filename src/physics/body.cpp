/// @file body.cpp
/// @brief Rigid body integration and storage

#include <newton/physics/body.hpp>

#include <cmath>

namespace newton_physics {

using newton_core::SimulationError;
using newton_math::Vec2;

// =============================================================================
// RigidBodyConfig
// =============================================================================

namespace {

bool positive(float v) {
    return std::isfinite(v) && v > 0.0f;
}

bool shape_is_valid(const Shape& shape) {
    if (const auto* c = std::get_if<CircleShape>(&shape)) {
        return positive(c->radius);
    }
    if (const auto* b = std::get_if<BoxShape>(&shape)) {
        return positive(b->width) && positive(b->height);
    }
    if (const auto* c = std::get_if<CapsuleShape>(&shape)) {
        return positive(c->radius) && c->length >= 0.0f;
    }
    return false;
}

} // anonymous namespace

newton_core::Result<void> RigidBodyConfig::validate() const {
    if (id.empty()) {
        return newton_core::Err(SimulationError::invalid_config("rigid body id must not be empty"));
    }
    if (type == BodyType::Dynamic && !positive(mass)) {
        return newton_core::Err(SimulationError::invalid_config(id, "dynamic body mass must be positive"));
    }
    if (moment && !positive(*moment)) {
        return newton_core::Err(SimulationError::invalid_config(id, "moment of inertia must be positive"));
    }
    if (!shape_is_valid(shape)) {
        return newton_core::Err(SimulationError::invalid_config(id, "shape dimensions must be positive"));
    }
    if (linear_damping < 0.0f || angular_damping < 0.0f) {
        return newton_core::Err(SimulationError::invalid_config(id, "damping must not be negative"));
    }
    return newton_core::Ok();
}

RigidBodyConfig make_circle_body(const std::string& id, const std::string& layer_id,
                                 const Vec2& position, float radius, float mass) {
    RigidBodyConfig config;
    config.id = id;
    config.layer_id = layer_id;
    config.mass = mass;
    config.position = position;
    config.shape = CircleShape{radius};
    return config;
}

RigidBodyConfig make_box_body(const std::string& id, const std::string& layer_id,
                              const Vec2& position, float width, float height, float mass) {
    RigidBodyConfig config;
    config.id = id;
    config.layer_id = layer_id;
    config.mass = mass;
    config.position = position;
    config.shape = BoxShape{width, height};
    return config;
}

// =============================================================================
// RigidBody
// =============================================================================

RigidBody::RigidBody(RigidBodyConfig config)
    : m_config(std::move(config))
{
    const bool immovable = m_config.type != BodyType::Dynamic;

    m_inertia = m_config.moment.value_or(compute_moment_of_inertia(m_config.shape, m_config.mass));
    if (!(m_inertia > 0.0f)) {
        m_inertia = 1.0f;
    }

    m_inverse_mass = immovable || m_config.mass <= 0.0f ? 0.0f : 1.0f / m_config.mass;
    m_inverse_inertia = immovable || m_config.fixed_rotation ? 0.0f : 1.0f / m_inertia;

    reset();
}

void RigidBody::apply_force(const Vec2& force, std::optional<Vec2> point) {
    if (m_inverse_mass == 0.0f) {
        return;
    }

    m_force += force;

    if (point) {
        m_torque += newton_math::cross(*point - m_position, force);
    }
}

void RigidBody::apply_impulse(const Vec2& impulse, std::optional<Vec2> point) {
    if (m_inverse_mass == 0.0f) {
        return;
    }

    m_velocity += impulse * m_inverse_mass;

    if (point) {
        m_angular_velocity += m_inverse_inertia * newton_math::cross(*point - m_position, impulse);
    }

    wake();
}

void RigidBody::integrate(float dt, const PhysicsSpaceConfig& space) {
    if (m_config.type != BodyType::Dynamic || m_sleeping) {
        clear_forces();
        return;
    }

    m_velocity += m_force * (m_inverse_mass * dt);
    m_angular_velocity += m_torque * m_inverse_inertia * dt;

    m_velocity *= 1.0f - m_config.linear_damping * dt;
    m_angular_velocity *= 1.0f - m_config.angular_damping * dt;

    m_position += m_velocity * dt;
    m_angle += m_angular_velocity * dt;

    clear_forces();

    if (!space.sleep_enabled || !m_config.can_sleep) {
        return;
    }

    const float speed = newton_math::length(m_velocity);
    const float angular_speed = std::abs(m_angular_velocity);
    if (speed < space.sleep_velocity_threshold &&
        angular_speed < space.sleep_velocity_threshold * 0.1f) {
        m_sleep_time += dt;
        if (m_sleep_time > space.sleep_time_threshold) {
            m_sleeping = true;
            m_velocity = newton_math::vec2::ZERO;
            m_angular_velocity = 0.0f;
        }
    } else {
        m_sleep_time = 0.0f;
    }
}

RigidBodyState RigidBody::state() const {
    RigidBodyState s;
    s.id = m_config.id;
    s.position = m_position;
    s.velocity = m_velocity;
    s.angle = m_angle;
    s.angular_velocity = m_angular_velocity;
    s.is_sleeping = m_sleeping;
    return s;
}

void RigidBody::load_state(const RigidBodyState& state) {
    m_position = state.position;
    m_velocity = state.velocity;
    m_angle = state.angle;
    m_angular_velocity = state.angular_velocity;
    m_sleeping = state.is_sleeping;
    m_sleep_time = 0.0f;
    clear_forces();
}

void RigidBody::reset() {
    m_position = m_config.position;
    m_velocity = m_config.velocity;
    m_angle = m_config.angle;
    m_angular_velocity = m_config.angular_velocity;
    m_sleeping = false;
    m_sleep_time = 0.0f;
    clear_forces();
}

void RigidBody::set_initial_state(const Vec2& position, const Vec2& velocity,
                                  float angle, float angular_velocity) {
    m_config.position = position;
    m_config.velocity = velocity;
    m_config.angle = angle;
    m_config.angular_velocity = angular_velocity;
}

// =============================================================================
// RigidBodySimulator
// =============================================================================

newton_core::Result<void> RigidBodySimulator::add_body(RigidBodyConfig config) {
    auto valid = config.validate();
    if (!valid) {
        return valid;
    }
    if (contains(config.id)) {
        return newton_core::Err(SimulationError::duplicate_id(config.id));
    }

    m_index.emplace(config.id, m_bodies.size());
    m_bodies.emplace_back(std::move(config));
    return newton_core::Ok();
}

bool RigidBodySimulator::remove_body(const std::string& id) {
    auto it = m_index.find(id);
    if (it == m_index.end()) {
        return false;
    }

    m_bodies.erase(m_bodies.begin() + static_cast<std::ptrdiff_t>(it->second));
    rebuild_index();
    return true;
}

RigidBody* RigidBodySimulator::find(const std::string& id) {
    auto it = m_index.find(id);
    return it != m_index.end() ? &m_bodies[it->second] : nullptr;
}

const RigidBody* RigidBodySimulator::find(const std::string& id) const {
    auto it = m_index.find(id);
    return it != m_index.end() ? &m_bodies[it->second] : nullptr;
}

std::vector<std::string> RigidBodySimulator::ids() const {
    std::vector<std::string> result;
    result.reserve(m_bodies.size());
    for (const auto& body : m_bodies) {
        result.push_back(body.id());
    }
    return result;
}

void RigidBodySimulator::apply_force(const std::string& id, const Vec2& force, std::optional<Vec2> point) {
    if (auto* body = find(id)) {
        body->apply_force(force, point);
    }
}

void RigidBodySimulator::apply_impulse(const std::string& id, const Vec2& impulse, std::optional<Vec2> point) {
    if (auto* body = find(id)) {
        body->apply_impulse(impulse, point);
    }
}

void RigidBodySimulator::integrate(float dt, const PhysicsSpaceConfig& space) {
    for (auto& body : m_bodies) {
        body.integrate(dt, space);
    }
}

std::vector<RigidBodyState> RigidBodySimulator::states() const {
    std::vector<RigidBodyState> result;
    result.reserve(m_bodies.size());
    for (const auto& body : m_bodies) {
        result.push_back(body.state());
    }
    return result;
}

void RigidBodySimulator::load_states(const std::vector<RigidBodyState>& states) {
    for (const auto& state : states) {
        if (auto* body = find(state.id)) {
            body->load_state(state);
        }
    }
}

void RigidBodySimulator::reset_all() {
    for (auto& body : m_bodies) {
        body.reset();
    }
}

void RigidBodySimulator::clear() {
    m_bodies.clear();
    m_index.clear();
}

void RigidBodySimulator::rebuild_index() {
    m_index.clear();
    for (std::size_t i = 0; i < m_bodies.size(); ++i) {
        m_index.emplace(m_bodies[i].id(), i);
    }
}

} // namespace newton_physics
