/// @file collision.cpp
/// @brief Pairwise collision detection and impulse resolution

#include <newton/physics/collision.hpp>
#include <newton/physics/body.hpp>

#include <algorithm>
#include <cmath>

namespace newton_physics {

using newton_math::Vec2;

// =============================================================================
// Narrow Phase
// =============================================================================

namespace narrow_phase {

std::optional<Manifold> circle_vs_circle(const Vec2& center_a, float radius_a,
                                         const Vec2& center_b, float radius_b) {
    const Vec2 diff = center_b - center_a;
    const float dist_sq = newton_math::length_squared(diff);
    const float radius_sum = radius_a + radius_b;

    if (dist_sq >= radius_sum * radius_sum) {
        return std::nullopt;
    }

    const float dist = std::sqrt(dist_sq);

    Manifold m;
    m.normal = dist > 0.0f ? diff / dist : newton_math::vec2::X;
    m.depth = radius_sum - dist;
    m.point = center_a + m.normal * radius_a;
    return m;
}

std::optional<Manifold> circle_vs_box(const Vec2& center, float radius,
                                      const Vec2& box_center, float box_angle,
                                      float half_width, float half_height) {
    // Work in the box's local frame
    const Vec2 local = newton_math::rotate(center - box_center, -box_angle);

    Vec2 closest{
        std::clamp(local.x, -half_width, half_width),
        std::clamp(local.y, -half_height, half_height),
    };

    const bool inside = closest == local;
    if (inside) {
        // Push the closest point out to the nearest edge
        const float dx = half_width - std::abs(local.x);
        const float dy = half_height - std::abs(local.y);
        if (dx < dy) {
            closest.x = local.x > 0.0f ? half_width : -half_width;
        } else {
            closest.y = local.y > 0.0f ? half_height : -half_height;
        }
    }

    const Vec2 local_diff = local - closest;
    const float dist = newton_math::length(local_diff);

    if (!inside && dist >= radius) {
        return std::nullopt;
    }

    // Unit vector from the box surface towards the circle center
    const Vec2 outward = dist > 0.0f
        ? newton_math::rotate(local_diff / dist, box_angle)
        : newton_math::rotate(newton_math::vec2::X, box_angle);

    Manifold m;
    if (inside) {
        // Center is past the surface, so the separating direction flips
        m.normal = outward;
        m.depth = radius + dist;
    } else {
        m.normal = -outward;
        m.depth = radius - dist;
    }
    m.point = center + m.normal * radius;
    return m;
}

std::optional<Manifold> box_vs_box(const Vec2& center_a, float half_width_a, float half_height_a,
                                   const Vec2& center_b, float half_width_b, float half_height_b) {
    const float dx = center_b.x - center_a.x;
    const float dy = center_b.y - center_a.y;

    const float overlap_x = half_width_a + half_width_b - std::abs(dx);
    if (overlap_x <= 0.0f) {
        return std::nullopt;
    }

    const float overlap_y = half_height_a + half_height_b - std::abs(dy);
    if (overlap_y <= 0.0f) {
        return std::nullopt;
    }

    Manifold m;
    if (overlap_x < overlap_y) {
        m.normal = Vec2(dx > 0.0f ? 1.0f : -1.0f, 0.0f);
        m.depth = overlap_x;
        m.point = center_a + m.normal * half_width_a;
    } else {
        m.normal = Vec2(0.0f, dy > 0.0f ? 1.0f : -1.0f);
        m.depth = overlap_y;
        m.point = center_a + m.normal * half_height_a;
    }
    return m;
}

} // namespace narrow_phase

// =============================================================================
// CollisionDetector
// =============================================================================

bool CollisionDetector::can_collide(const RigidBody& a, const RigidBody& b) {
    if (a.is_immovable() && b.is_immovable()) {
        return false;
    }
    if (a.type() == BodyType::Dead || b.type() == BodyType::Dead) {
        return false;
    }
    if (a.config().response == CollisionResponse::None || b.config().response == CollisionResponse::None) {
        return false;
    }
    return CollisionFilter::should_collide(a.config().filter, b.config().filter);
}

std::optional<Manifold> CollisionDetector::test_pair(const RigidBody& a, const RigidBody& b) {
    const auto* circle_a = std::get_if<CircleShape>(&a.shape());
    const auto* circle_b = std::get_if<CircleShape>(&b.shape());
    const auto* box_a = std::get_if<BoxShape>(&a.shape());
    const auto* box_b = std::get_if<BoxShape>(&b.shape());

    if (circle_a && circle_b) {
        return narrow_phase::circle_vs_circle(a.position(), circle_a->radius, b.position(), circle_b->radius);
    }

    if (circle_a && box_b) {
        return narrow_phase::circle_vs_box(a.position(), circle_a->radius, b.position(), b.angle(),
                                           box_b->width * 0.5f, box_b->height * 0.5f);
    }

    if (box_a && circle_b) {
        auto m = narrow_phase::circle_vs_box(b.position(), circle_b->radius, a.position(), a.angle(),
                                             box_a->width * 0.5f, box_a->height * 0.5f);
        if (m) {
            m->normal = -m->normal;
        }
        return m;
    }

    if (box_a && box_b) {
        return narrow_phase::box_vs_box(a.position(), box_a->width * 0.5f, box_a->height * 0.5f,
                                        b.position(), box_b->width * 0.5f, box_b->height * 0.5f);
    }

    // Capsules and any other pairing
    return narrow_phase::circle_vs_circle(a.position(), nominal_radius(a.shape()),
                                          b.position(), nominal_radius(b.shape()));
}

std::vector<CollisionPair> CollisionDetector::detect(const std::vector<RigidBody>& bodies) const {
    std::vector<CollisionPair> pairs;

    for (std::size_t i = 0; i < bodies.size(); ++i) {
        for (std::size_t j = i + 1; j < bodies.size(); ++j) {
            const auto& a = bodies[i];
            const auto& b = bodies[j];

            if (!can_collide(a, b) || is_excluded(a.id(), b.id())) {
                continue;
            }

            if (auto m = test_pair(a, b)) {
                pairs.push_back(CollisionPair{i, j, *m});
            }
        }
    }

    return pairs;
}

bool CollisionDetector::is_excluded(const std::string& a, const std::string& b) const {
    if (m_excluded.empty()) {
        return false;
    }
    return a < b ? m_excluded.count({a, b}) != 0 : m_excluded.count({b, a}) != 0;
}

// =============================================================================
// CollisionResolver
// =============================================================================

std::optional<ContactInfo> CollisionResolver::resolve(const CollisionPair& pair, std::vector<RigidBody>& bodies,
                                                      const PhysicsSpaceConfig& space) const {
    RigidBody& a = bodies[pair.body_a];
    RigidBody& b = bodies[pair.body_b];
    const Manifold& m = pair.manifold;

    const Vec2 r_a = m.point - a.position();
    const Vec2 r_b = m.point - b.position();

    // Velocity of the contact point on each body
    const Vec2 vel_a = a.velocity() + newton_math::perpendicular(r_a) * a.angular_velocity();
    const Vec2 vel_b = b.velocity() + newton_math::perpendicular(r_b) * b.angular_velocity();
    const Vec2 relative = vel_b - vel_a;

    const float normal_velocity = newton_math::dot(relative, m.normal);
    if (normal_velocity > 0.0f) {
        return std::nullopt;
    }

    const float inv_mass_a = a.inverse_mass();
    const float inv_mass_b = b.inverse_mass();
    const float inv_inertia_a = a.inverse_inertia();
    const float inv_inertia_b = b.inverse_inertia();

    const float rn_a = newton_math::cross(r_a, m.normal);
    const float rn_b = newton_math::cross(r_b, m.normal);
    const float inv_mass_sum = inv_mass_a + inv_mass_b
        + rn_a * rn_a * inv_inertia_a
        + rn_b * rn_b * inv_inertia_b;

    if (inv_mass_sum == 0.0f) {
        return std::nullopt;
    }

    const auto& mat_a = a.config().material;
    const auto& mat_b = b.config().material;
    const float restitution = std::min(mat_a.restitution, mat_b.restitution);

    const float j = -(1.0f + restitution) * normal_velocity / inv_mass_sum;

    const bool sensor = a.config().response == CollisionResponse::Sensor ||
                        b.config().response == CollisionResponse::Sensor;

    if (!sensor) {
        const Vec2 impulse = m.normal * j;
        a.set_velocity(a.velocity() - impulse * inv_mass_a);
        a.set_angular_velocity(a.angular_velocity() - inv_inertia_a * newton_math::cross(r_a, impulse));
        b.set_velocity(b.velocity() + impulse * inv_mass_b);
        b.set_angular_velocity(b.angular_velocity() + inv_inertia_b * newton_math::cross(r_b, impulse));

        // Coulomb friction along the tangential relative velocity
        const Vec2 tangent = newton_math::normalize_or_zero(relative - m.normal * normal_velocity);
        if (tangent != newton_math::vec2::ZERO) {
            const float rt_a = newton_math::cross(r_a, tangent);
            const float rt_b = newton_math::cross(r_b, tangent);
            const float inv_mass_tangent = inv_mass_a + inv_mass_b
                + rt_a * rt_a * inv_inertia_a
                + rt_b * rt_b * inv_inertia_b;

            if (inv_mass_tangent > 0.0f) {
                const float mu = std::sqrt(mat_a.friction * mat_b.friction);
                const float max_friction = j * mu;
                const float jt = std::clamp(-newton_math::dot(relative, tangent) / inv_mass_tangent,
                                            -max_friction, max_friction);

                const Vec2 friction_impulse = tangent * jt;
                a.set_velocity(a.velocity() - friction_impulse * inv_mass_a);
                a.set_angular_velocity(a.angular_velocity() - inv_inertia_a * newton_math::cross(r_a, friction_impulse));
                b.set_velocity(b.velocity() + friction_impulse * inv_mass_b);
                b.set_angular_velocity(b.angular_velocity() + inv_inertia_b * newton_math::cross(r_b, friction_impulse));
            }
        }

        // Positional correction beyond the allowed slop
        const float correction_depth = std::max(m.depth - space.collision_slop, 0.0f);
        const Vec2 correction = m.normal * (correction_depth * space.collision_bias / inv_mass_sum);
        a.set_position(a.position() - correction * inv_mass_a);
        b.set_position(b.position() + correction * inv_mass_b);

        a.wake();
        b.wake();
    }

    ContactInfo contact;
    contact.body_a = a.id();
    contact.body_b = b.id();
    contact.point = m.point;
    contact.normal = m.normal;
    contact.depth = m.depth;
    contact.impulse = j;
    return contact;
}

std::vector<ContactInfo> CollisionResolver::resolve_all(const std::vector<CollisionPair>& pairs,
                                                        std::vector<RigidBody>& bodies,
                                                        const PhysicsSpaceConfig& space) const {
    std::vector<ContactInfo> contacts;
    contacts.reserve(pairs.size());
    for (const auto& pair : pairs) {
        if (auto contact = resolve(pair, bodies, space)) {
            contacts.push_back(std::move(*contact));
        }
    }
    return contacts;
}

} // namespace newton_physics
