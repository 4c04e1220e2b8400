/// @file joint.cpp
/// @brief Pivot joint solver

#include <newton/physics/joint.hpp>
#include <newton/physics/body.hpp>

#include <algorithm>
#include <cmath>

namespace newton_physics {

using newton_core::SimulationError;
using newton_math::Vec2;

newton_core::Result<void> PivotJointConfig::validate() const {
    if (id.empty()) {
        return newton_core::Err(SimulationError::invalid_config("joint id must not be empty"));
    }
    if (body_a == body_b) {
        return newton_core::Err(SimulationError::invalid_config(id, "joint must connect two different bodies"));
    }
    if (limits && limits->min > limits->max) {
        return newton_core::Err(SimulationError::invalid_config(id, "angle limit min exceeds max"));
    }
    if (motor && motor->max_torque < 0.0f) {
        return newton_core::Err(SimulationError::invalid_config(id, "motor torque must not be negative"));
    }
    return newton_core::Ok();
}

// =============================================================================
// JointSystem
// =============================================================================

newton_core::Result<void> JointSystem::add_joint(PivotJointConfig config, const RigidBodySimulator& bodies) {
    auto valid = config.validate();
    if (!valid) {
        return valid;
    }
    if (contains(config.id)) {
        return newton_core::Err(SimulationError::duplicate_id(config.id));
    }
    if (!bodies.contains(config.body_a)) {
        return newton_core::Err(SimulationError::unknown_entity(config.body_a));
    }
    if (!bodies.contains(config.body_b)) {
        return newton_core::Err(SimulationError::unknown_entity(config.body_b));
    }

    m_joints.push_back(std::move(config));
    return newton_core::Ok();
}

bool JointSystem::remove_joint(const std::string& id) {
    auto it = std::find_if(m_joints.begin(), m_joints.end(),
                           [&id](const PivotJointConfig& j) { return j.id == id; });
    if (it == m_joints.end()) {
        return false;
    }
    m_joints.erase(it);
    return true;
}

std::size_t JointSystem::remove_joints_for_body(const std::string& body_id) {
    const auto before = m_joints.size();
    m_joints.erase(std::remove_if(m_joints.begin(), m_joints.end(),
                                  [&body_id](const PivotJointConfig& j) {
                                      return j.body_a == body_id || j.body_b == body_id;
                                  }),
                   m_joints.end());
    return before - m_joints.size();
}

bool JointSystem::contains(const std::string& id) const {
    return find(id) != nullptr;
}

const PivotJointConfig* JointSystem::find(const std::string& id) const {
    for (const auto& joint : m_joints) {
        if (joint.id == id) {
            return &joint;
        }
    }
    return nullptr;
}

CollisionDetector::BodyPairSet JointSystem::non_colliding_pairs() const {
    CollisionDetector::BodyPairSet pairs;
    for (const auto& joint : m_joints) {
        if (joint.collide_connected) {
            continue;
        }
        if (joint.body_a < joint.body_b) {
            pairs.emplace(joint.body_a, joint.body_b);
        } else {
            pairs.emplace(joint.body_b, joint.body_a);
        }
    }
    return pairs;
}

void JointSystem::solve(RigidBodySimulator& bodies, float dt) const {
    for (const auto& joint : m_joints) {
        RigidBody* a = bodies.find(joint.body_a);
        RigidBody* b = bodies.find(joint.body_b);
        if (!a || !b) {
            continue;
        }

        // Sleeping bodies act as anchors until something wakes them
        const float im_a = a->is_sleeping() ? 0.0f : a->inverse_mass();
        const float im_b = b->is_sleeping() ? 0.0f : b->inverse_mass();
        const float ii_a = a->is_sleeping() ? 0.0f : a->inverse_inertia();
        const float ii_b = b->is_sleeping() ? 0.0f : b->inverse_inertia();

        if (im_a + im_b + ii_a + ii_b == 0.0f) {
            continue;
        }

        // -----------------------------------------------------------------
        // Point constraint (velocity)
        // -----------------------------------------------------------------

        const Vec2 r_a = newton_math::rotate(joint.anchor_a, a->angle());
        const Vec2 r_b = newton_math::rotate(joint.anchor_b, b->angle());

        const Vec2 vel_a = a->velocity() + newton_math::perpendicular(r_a) * a->angular_velocity();
        const Vec2 vel_b = b->velocity() + newton_math::perpendicular(r_b) * b->angular_velocity();
        const Vec2 cdot = vel_b - vel_a;

        // Effective mass matrix K = [k11 k12; k12 k22]
        const float k11 = im_a + im_b + ii_a * r_a.y * r_a.y + ii_b * r_b.y * r_b.y;
        const float k12 = -ii_a * r_a.x * r_a.y - ii_b * r_b.x * r_b.y;
        const float k22 = im_a + im_b + ii_a * r_a.x * r_a.x + ii_b * r_b.x * r_b.x;
        const float det = k11 * k22 - k12 * k12;

        if (std::abs(det) > newton_math::consts::EPSILON) {
            const float inv_det = 1.0f / det;
            const Vec2 impulse{
                -(k22 * cdot.x - k12 * cdot.y) * inv_det,
                -(k11 * cdot.y - k12 * cdot.x) * inv_det,
            };

            a->set_velocity(a->velocity() - impulse * im_a);
            a->set_angular_velocity(a->angular_velocity() - ii_a * newton_math::cross(r_a, impulse));
            b->set_velocity(b->velocity() + impulse * im_b);
            b->set_angular_velocity(b->angular_velocity() + ii_b * newton_math::cross(r_b, impulse));
        }

        // -----------------------------------------------------------------
        // Angle limits and motor
        // -----------------------------------------------------------------

        const float angular_mass_inv = ii_a + ii_b;
        if (angular_mass_inv > 0.0f) {
            if (joint.motor && joint.motor->enabled) {
                const float relative_w = b->angular_velocity() - a->angular_velocity();
                const float max_impulse = joint.motor->max_torque * dt;
                const float lambda = std::clamp((joint.motor->speed - relative_w) / angular_mass_inv,
                                                -max_impulse, max_impulse);
                a->set_angular_velocity(a->angular_velocity() - ii_a * lambda);
                b->set_angular_velocity(b->angular_velocity() + ii_b * lambda);
            }

            if (joint.limits) {
                const float relative_angle = b->angle() - a->angle();
                const float relative_w = b->angular_velocity() - a->angular_velocity();

                float lambda = 0.0f;
                if (relative_angle < joint.limits->min) {
                    const float c = relative_angle - joint.limits->min;
                    lambda = std::max(-(relative_w + k_limit_bias * c / dt) / angular_mass_inv, 0.0f);
                } else if (relative_angle > joint.limits->max) {
                    const float c = relative_angle - joint.limits->max;
                    lambda = std::min(-(relative_w + k_limit_bias * c / dt) / angular_mass_inv, 0.0f);
                }

                if (lambda != 0.0f) {
                    a->set_angular_velocity(a->angular_velocity() - ii_a * lambda);
                    b->set_angular_velocity(b->angular_velocity() + ii_b * lambda);
                }
            }
        }

        // -----------------------------------------------------------------
        // Anchor drift (position)
        // -----------------------------------------------------------------

        const float linear_mass_inv = im_a + im_b;
        if (linear_mass_inv > 0.0f) {
            const Vec2 gap = (b->position() + r_b) - (a->position() + r_a);
            const Vec2 correction = gap * (k_position_correction / linear_mass_inv);
            a->set_position(a->position() + correction * im_a);
            b->set_position(b->position() - correction * im_b);
        }
    }
}

} // namespace newton_physics
