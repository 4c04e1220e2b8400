/// @file snapshot.cpp
/// @brief Checkpoint capture and restore

#include <newton/physics/snapshot.hpp>
#include <newton/physics/body.hpp>
#include <newton/physics/soft_body.hpp>
#include <newton/physics/cloth.hpp>

namespace newton_physics {

// =============================================================================
// BodySnapshot
// =============================================================================

BodySnapshot BodySnapshot::capture(const RigidBody& body) {
    BodySnapshot snapshot;
    snapshot.id = body.id();
    snapshot.position = body.position();
    snapshot.velocity = body.velocity();
    snapshot.angle = body.angle();
    snapshot.angular_velocity = body.angular_velocity();
    snapshot.sleeping = body.is_sleeping();
    snapshot.sleep_time = body.sleep_time();
    return snapshot;
}

void BodySnapshot::restore_to(RigidBody& body) const {
    body.set_position(position);
    body.set_velocity(velocity);
    body.set_angle(angle);
    body.set_angular_velocity(angular_velocity);
    body.set_sleep_state(sleeping, sleep_time);
    body.clear_forces();
}

// =============================================================================
// VerletSnapshot
// =============================================================================

VerletSnapshot VerletSnapshot::capture(const std::string& id,
                                       const std::vector<VerletParticle>& particles,
                                       const std::vector<VerletConstraint>& constraints) {
    VerletSnapshot snapshot;
    snapshot.id = id;
    snapshot.positions.reserve(particles.size());
    snapshot.previous_positions.reserve(particles.size());
    for (const auto& p : particles) {
        snapshot.positions.push_back(p.position);
        snapshot.previous_positions.push_back(p.previous_position);
    }
    snapshot.broken.reserve(constraints.size());
    for (const auto& c : constraints) {
        snapshot.broken.push_back(c.broken);
    }
    return snapshot;
}

void VerletSnapshot::restore_to(std::vector<VerletParticle>& particles,
                                std::vector<VerletConstraint>& constraints) const {
    if (particles.size() != positions.size() || constraints.size() != broken.size()) {
        return;
    }

    for (std::size_t i = 0; i < particles.size(); ++i) {
        particles[i].position = positions[i];
        particles[i].previous_position = previous_positions[i];
        particles[i].acceleration = newton_math::vec2::ZERO;
    }
    for (std::size_t i = 0; i < constraints.size(); ++i) {
        constraints[i].broken = broken[i];
    }
}

// =============================================================================
// Checkpoint
// =============================================================================

Checkpoint Checkpoint::capture(int frame,
                               const RigidBodySimulator& bodies,
                               const SoftBodySimulator& soft_bodies,
                               const ClothSimulator& cloths,
                               std::uint32_t random_state) {
    Checkpoint checkpoint;
    checkpoint.frame = frame;
    checkpoint.random_state = random_state;

    checkpoint.bodies.reserve(bodies.size());
    for (const auto& body : bodies.bodies()) {
        checkpoint.bodies.push_back(BodySnapshot::capture(body));
    }

    checkpoint.soft_bodies.reserve(soft_bodies.size());
    for (const auto& soft_body : soft_bodies.soft_bodies()) {
        checkpoint.soft_bodies.push_back(
            VerletSnapshot::capture(soft_body.id(), soft_body.particles(), soft_body.constraints()));
    }

    checkpoint.cloths.reserve(cloths.size());
    for (const auto& cloth : cloths.cloths()) {
        checkpoint.cloths.push_back(VerletSnapshot::capture(cloth.id(), cloth.particles(), cloth.constraints()));
    }

    return checkpoint;
}

void Checkpoint::restore_to(RigidBodySimulator& bodies, SoftBodySimulator& soft_bodies,
                            ClothSimulator& cloths) const {
    for (const auto& snapshot : this->bodies) {
        if (auto* body = bodies.find(snapshot.id)) {
            snapshot.restore_to(*body);
        }
    }

    for (const auto& snapshot : this->soft_bodies) {
        if (auto* soft_body = soft_bodies.find(snapshot.id)) {
            snapshot.restore_to(soft_body->particles(), soft_body->constraints());
        }
    }

    for (const auto& snapshot : this->cloths) {
        if (auto* cloth = cloths.find(snapshot.id)) {
            snapshot.restore_to(cloth->particles(), cloth->constraints());
        }
    }
}

// =============================================================================
// CheckpointStore
// =============================================================================

void CheckpointStore::save(Checkpoint checkpoint) {
    const int frame = checkpoint.frame;
    m_checkpoints.insert_or_assign(frame, std::move(checkpoint));
}

const Checkpoint* CheckpointStore::latest_at_or_before(int frame) const {
    auto it = m_checkpoints.upper_bound(frame);
    if (it == m_checkpoints.begin()) {
        return nullptr;
    }
    --it;
    return &it->second;
}

std::vector<int> CheckpointStore::frames() const {
    std::vector<int> result;
    result.reserve(m_checkpoints.size());
    for (const auto& entry : m_checkpoints) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace newton_physics
