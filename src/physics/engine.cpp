/// @file engine.cpp
/// @brief PhysicsEngine implementation

#include <newton/physics/engine.hpp>
#include <newton/core/log.hpp>

#include <algorithm>
#include <limits>

namespace newton_physics {

using newton_core::SimulationError;
using newton_math::Vec2;

namespace {

/// Replays longer than this are traced with a LogScope
constexpr int k_long_replay_frames = 120;

template<typename T>
std::vector<std::string> collect_ids(const std::vector<T>& entities) {
    std::vector<std::string> ids;
    ids.reserve(entities.size());
    for (const auto& entity : entities) {
        ids.push_back(entity.id());
    }
    return ids;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

PhysicsEngine::PhysicsEngine(PhysicsSpaceConfig config)
    : m_config(std::move(config))
    , m_random(m_config.seed)
{
    if (auto valid = m_config.validate(); !valid) {
        newton_core::physics_logger()->warn("PhysicsEngine: invalid space config ({}), using defaults",
                                            valid.error().message());
        m_config = PhysicsSpaceConfig::defaults();
        m_random.reseed(m_config.seed);
    }
}

// =============================================================================
// Configuration
// =============================================================================

newton_core::Result<void> PhysicsEngine::set_config(const PhysicsSpaceConfig& config) {
    if (auto alive = check_alive("set_config"); !alive) {
        return alive;
    }

    auto valid = config.validate();
    if (!valid) {
        newton_core::physics_logger()->error("PhysicsEngine: rejected space config: {}", valid.error().message());
        return valid;
    }

    m_config = config;
    m_random.reseed(m_config.seed);
    invalidate("config changed");
    return newton_core::Ok();
}

newton_core::Result<void> PhysicsEngine::set_force_fields(std::vector<ForceField> fields) {
    if (auto alive = check_alive("set_force_fields"); !alive) {
        return alive;
    }

    for (std::size_t i = 0; i < fields.size(); ++i) {
        for (std::size_t j = i + 1; j < fields.size(); ++j) {
            if (fields[i].id == fields[j].id) {
                return newton_core::Err(SimulationError::duplicate_id(fields[i].id));
            }
        }
    }

    m_force_fields.set_fields(std::move(fields));
    invalidate("force fields replaced");
    return newton_core::Ok();
}

newton_core::Result<void> PhysicsEngine::add_force_field(ForceField field) {
    if (auto alive = check_alive("add_force_field"); !alive) {
        return alive;
    }

    const auto& existing = m_force_fields.fields();
    auto it = std::find_if(existing.begin(), existing.end(),
                           [&field](const ForceField& f) { return f.id == field.id; });
    if (it != existing.end()) {
        return newton_core::Err(SimulationError::duplicate_id(field.id));
    }

    NEWTON_LOG_DEBUG("PhysicsEngine: added {} field '{}'", to_string(field.kind()), field.id);
    auto fields = existing;
    fields.push_back(std::move(field));
    m_force_fields.set_fields(std::move(fields));
    invalidate("force field added");
    return newton_core::Ok();
}

newton_core::Result<bool> PhysicsEngine::remove_force_field(const std::string& id) {
    if (auto alive = check_alive("remove_force_field"); !alive) {
        return newton_core::Err<bool>(alive.error());
    }

    auto fields = m_force_fields.fields();
    auto it = std::find_if(fields.begin(), fields.end(), [&id](const ForceField& f) { return f.id == id; });
    if (it == fields.end()) {
        return newton_core::Ok(false);
    }

    fields.erase(it);
    m_force_fields.set_fields(std::move(fields));
    invalidate("force field removed");
    return newton_core::Ok(true);
}

newton_core::Result<void> PhysicsEngine::set_property_evaluator(std::shared_ptr<const IPropertyEvaluator> evaluator) {
    if (auto alive = check_alive("set_property_evaluator"); !alive) {
        return alive;
    }

    m_force_fields.set_evaluator(std::move(evaluator));
    invalidate("property evaluator replaced");
    return newton_core::Ok();
}

// =============================================================================
// Entities
// =============================================================================

newton_core::Result<void> PhysicsEngine::add_rigid_body(RigidBodyConfig config) {
    if (auto alive = check_alive("add_rigid_body"); !alive) {
        return alive;
    }

    const std::string id = config.id;
    auto added = m_rigid_bodies.add_body(std::move(config));
    if (!added) {
        return added;
    }

    NEWTON_LOG_DEBUG("PhysicsEngine: added rigid body '{}'", id);
    invalidate("rigid body added");
    return newton_core::Ok();
}

newton_core::Result<bool> PhysicsEngine::remove_rigid_body(const std::string& id) {
    if (auto alive = check_alive("remove_rigid_body"); !alive) {
        return newton_core::Err<bool>(alive.error());
    }

    if (!m_rigid_bodies.remove_body(id)) {
        return newton_core::Ok(false);
    }

    const std::size_t joints = m_joints.remove_joints_for_body(id);
    if (joints > 0) {
        refresh_excluded_pairs();
    }

    NEWTON_LOG_DEBUG("PhysicsEngine: removed rigid body '{}' ({} joints dropped)", id, joints);
    invalidate("rigid body removed");
    return newton_core::Ok(true);
}

newton_core::Result<void> PhysicsEngine::add_soft_body(SoftBodyConfig config) {
    if (auto alive = check_alive("add_soft_body"); !alive) {
        return alive;
    }

    const std::string id = config.id;
    auto added = m_soft_bodies.add_soft_body(std::move(config));
    if (!added) {
        return added;
    }

    NEWTON_LOG_DEBUG("PhysicsEngine: added soft body '{}'", id);
    invalidate("soft body added");
    return newton_core::Ok();
}

newton_core::Result<bool> PhysicsEngine::remove_soft_body(const std::string& id) {
    if (auto alive = check_alive("remove_soft_body"); !alive) {
        return newton_core::Err<bool>(alive.error());
    }

    if (!m_soft_bodies.remove_soft_body(id)) {
        return newton_core::Ok(false);
    }

    NEWTON_LOG_DEBUG("PhysicsEngine: removed soft body '{}'", id);
    invalidate("soft body removed");
    return newton_core::Ok(true);
}

newton_core::Result<void> PhysicsEngine::add_cloth(ClothConfig config) {
    if (auto alive = check_alive("add_cloth"); !alive) {
        return alive;
    }

    const std::string id = config.id;
    auto added = m_cloths.add_cloth(std::move(config));
    if (!added) {
        return added;
    }

    NEWTON_LOG_DEBUG("PhysicsEngine: added cloth '{}'", id);
    invalidate("cloth added");
    return newton_core::Ok();
}

newton_core::Result<bool> PhysicsEngine::remove_cloth(const std::string& id) {
    if (auto alive = check_alive("remove_cloth"); !alive) {
        return newton_core::Err<bool>(alive.error());
    }

    if (!m_cloths.remove_cloth(id)) {
        return newton_core::Ok(false);
    }

    NEWTON_LOG_DEBUG("PhysicsEngine: removed cloth '{}'", id);
    invalidate("cloth removed");
    return newton_core::Ok(true);
}

newton_core::Result<void> PhysicsEngine::add_joint(PivotJointConfig config) {
    if (auto alive = check_alive("add_joint"); !alive) {
        return alive;
    }

    const std::string id = config.id;
    auto added = m_joints.add_joint(std::move(config), m_rigid_bodies);
    if (!added) {
        return added;
    }

    NEWTON_LOG_DEBUG("PhysicsEngine: added joint '{}'", id);
    refresh_excluded_pairs();
    invalidate("joint added");
    return newton_core::Ok();
}

newton_core::Result<bool> PhysicsEngine::remove_joint(const std::string& id) {
    if (auto alive = check_alive("remove_joint"); !alive) {
        return newton_core::Err<bool>(alive.error());
    }

    if (!m_joints.remove_joint(id)) {
        return newton_core::Ok(false);
    }

    refresh_excluded_pairs();
    invalidate("joint removed");
    return newton_core::Ok(true);
}

newton_core::Result<void> PhysicsEngine::add_ragdoll(const RagdollConfig& config) {
    if (auto alive = check_alive("add_ragdoll"); !alive) {
        return alive;
    }

    if (m_ragdolls.count(config.id)) {
        return newton_core::Err(SimulationError::duplicate_id(config.id));
    }

    auto physics = convert_ragdoll_to_physics(config);
    if (!physics) {
        newton_core::physics_logger()->warn("PhysicsEngine: ragdoll '{}' rejected: {}",
                                            config.id, physics.error().message());
        return newton_core::Err(physics.error());
    }

    // Validate everything up front so a failure adds nothing
    for (const auto& body : physics->bodies) {
        if (m_rigid_bodies.contains(body.id)) {
            return newton_core::Err(SimulationError::duplicate_id(body.id));
        }
        if (auto valid = body.validate(); !valid) {
            return valid;
        }
    }
    for (const auto& joint : physics->joints) {
        if (m_joints.contains(joint.id)) {
            return newton_core::Err(SimulationError::duplicate_id(joint.id));
        }
        if (auto valid = joint.validate(); !valid) {
            return valid;
        }
    }

    for (auto& body : physics->bodies) {
        auto added = m_rigid_bodies.add_body(std::move(body));
        if (!added) {
            return added;
        }
    }
    for (auto& joint : physics->joints) {
        auto added = m_joints.add_joint(std::move(joint), m_rigid_bodies);
        if (!added) {
            return added;
        }
    }

    m_ragdolls.emplace(config.id, config.bones);
    refresh_excluded_pairs();

    NEWTON_LOG_DEBUG("PhysicsEngine: added ragdoll '{}' ({} bones)", config.id, config.bones.size());
    invalidate("ragdoll added");
    return newton_core::Ok();
}

newton_core::Result<void> PhysicsEngine::register_ragdoll(const std::string& id, std::vector<RagdollBone> bones) {
    if (auto alive = check_alive("register_ragdoll"); !alive) {
        return alive;
    }

    if (id.empty()) {
        return newton_core::Err(SimulationError::invalid_config("ragdoll id must not be empty"));
    }
    if (m_ragdolls.count(id)) {
        return newton_core::Err(SimulationError::duplicate_id(id));
    }

    m_ragdolls.emplace(id, std::move(bones));
    return newton_core::Ok();
}

newton_core::Result<bool> PhysicsEngine::remove_ragdoll(const std::string& id) {
    if (auto alive = check_alive("remove_ragdoll"); !alive) {
        return newton_core::Err<bool>(alive.error());
    }
    return newton_core::Ok(m_ragdolls.erase(id) > 0);
}

newton_core::Result<void> PhysicsEngine::apply_ragdoll_state(const RagdollState& state) {
    if (auto alive = check_alive("apply_ragdoll_state"); !alive) {
        return alive;
    }

    if (!m_ragdolls.count(state.id)) {
        return newton_core::Err(SimulationError::unknown_entity(state.id));
    }

    for (const auto& bone : state.bones) {
        if (auto* body = m_rigid_bodies.find(ragdoll_body_id(state.id, bone.id))) {
            body->set_initial_state(bone.position, bone.velocity, bone.angle, bone.angular_velocity);
        }
    }

    invalidate("ragdoll state applied");
    return newton_core::Ok();
}

// =============================================================================
// Evaluation
// =============================================================================

newton_core::Result<PhysicsSimulationState> PhysicsEngine::evaluate_frame(int frame) {
    if (auto alive = check_alive("evaluate_frame"); !alive) {
        return newton_core::Err<PhysicsSimulationState>(alive.error());
    }
    if (frame < 0 || frame == std::numeric_limits<int>::max()) {
        return newton_core::Err<PhysicsSimulationState>(SimulationError::invalid_frame(frame));
    }

    if (frame == m_last_frame && m_cached_state) {
        return newton_core::Ok(*m_cached_state);
    }

    int first = frame + 1;
    if (m_last_frame >= 0 && m_last_frame < frame) {
        const Checkpoint* checkpoint = m_checkpoints.latest_at_or_before(frame);
        if (!checkpoint || checkpoint->frame <= m_last_frame) {
            first = m_last_frame + 1;
        }
    }
    if (first > frame) {
        rewind_for(frame);
        const Checkpoint* checkpoint = m_checkpoints.latest_at_or_before(frame);
        first = checkpoint ? checkpoint->frame + 1 : 0;
    }

    const int steps = frame - first + 1;
    std::optional<newton_core::LogScope> scope;
    if (steps > k_long_replay_frames) {
        scope.emplace("PhysicsEngine::replay");
    }
    newton_core::physics_logger()->trace("PhysicsEngine: frame {} replays {} steps from {}", frame, steps, first);

    const auto interval = static_cast<int>(m_config.checkpoint_interval);
    for (int f = first; f <= frame; ++f) {
        step(f);
        if (f > 0 && f % interval == 0 && !m_checkpoints.contains(f)) {
            m_checkpoints.save(Checkpoint::capture(f, m_rigid_bodies, m_soft_bodies, m_cloths, m_random.state()));
            newton_core::physics_logger()->trace("PhysicsEngine: checkpoint saved at frame {}", f);
        }
    }

    m_last_frame = frame;
    m_cached_state = capture_state(frame);
    return newton_core::Ok(*m_cached_state);
}

newton_core::Result<std::vector<ExportedKeyframes>> PhysicsEngine::export_keyframes(
    const KeyframeExportOptions& options) {
    using ResultType = std::vector<ExportedKeyframes>;

    if (auto alive = check_alive("export_keyframes"); !alive) {
        return newton_core::Err<ResultType>(alive.error());
    }
    if (auto valid = options.validate(); !valid) {
        return newton_core::Err<ResultType>(valid.error());
    }

    NEWTON_LOG_SCOPE("PhysicsEngine::export_keyframes");

    struct Sample {
        int frame;
        Vec2 position;
        float angle;
    };
    std::map<std::string, std::vector<Sample>> samples;

    for (int frame = options.start_frame; frame <= options.end_frame; frame += options.frame_step) {
        auto state = evaluate_frame(frame);
        if (!state) {
            return newton_core::Err<ResultType>(state.error());
        }
        for (const auto& body : state->rigid_bodies) {
            samples[body.id].push_back(Sample{frame, body.position, body.angle});
        }
    }

    const bool want_position = std::find(options.properties.begin(), options.properties.end(),
                                         KeyframeProperty::Position) != options.properties.end();
    const bool want_rotation = std::find(options.properties.begin(), options.properties.end(),
                                         KeyframeProperty::Rotation) != options.properties.end();

    auto finish = [&options](std::vector<ExportedKeyframe> keyframes) {
        return options.simplify ? simplify_keyframes(keyframes, options.simplify_tolerance) : keyframes;
    };

    ResultType result;
    for (const auto& body : m_rigid_bodies.bodies()) {
        const std::string& layer_id = body.config().layer_id;
        auto it = samples.find(body.id());
        if (it == samples.end()) {
            continue;
        }

        if (want_position) {
            std::vector<ExportedKeyframe> keyframes;
            keyframes.reserve(it->second.size());
            for (const auto& s : it->second) {
                keyframes.push_back(ExportedKeyframe{s.frame, s.position, options.interpolation});
            }
            result.push_back(ExportedKeyframes{layer_id, to_string(KeyframeProperty::Position),
                                               finish(std::move(keyframes))});
        }

        if (want_rotation) {
            std::vector<ExportedKeyframe> keyframes;
            keyframes.reserve(it->second.size());
            for (const auto& s : it->second) {
                keyframes.push_back(ExportedKeyframe{s.frame, s.angle * newton_math::consts::RAD_TO_DEG, options.interpolation});
            }
            result.push_back(ExportedKeyframes{layer_id, to_string(KeyframeProperty::Rotation),
                                               finish(std::move(keyframes))});
        }
    }

    NEWTON_LOG_DEBUG("PhysicsEngine: exported {} keyframe tracks for frames {}..{}",
                     result.size(), options.start_frame, options.end_frame);
    return newton_core::Ok(std::move(result));
}

// =============================================================================
// Queries
// =============================================================================

newton_core::Result<std::optional<RigidBodyState>> PhysicsEngine::rigid_body_state(const std::string& id) const {
    using ResultType = std::optional<RigidBodyState>;
    if (auto alive = check_alive("rigid_body_state"); !alive) {
        return newton_core::Err<ResultType>(alive.error());
    }
    if (const auto* body = m_rigid_bodies.find(id)) {
        return newton_core::Ok(ResultType(body->state()));
    }
    return newton_core::Ok(ResultType());
}

newton_core::Result<std::optional<SoftBodyState>> PhysicsEngine::soft_body_state(const std::string& id) const {
    using ResultType = std::optional<SoftBodyState>;
    if (auto alive = check_alive("soft_body_state"); !alive) {
        return newton_core::Err<ResultType>(alive.error());
    }
    if (const auto* body = m_soft_bodies.find(id)) {
        return newton_core::Ok(ResultType(body->state()));
    }
    return newton_core::Ok(ResultType());
}

newton_core::Result<std::optional<ClothState>> PhysicsEngine::cloth_state(const std::string& id) const {
    using ResultType = std::optional<ClothState>;
    if (auto alive = check_alive("cloth_state"); !alive) {
        return newton_core::Err<ResultType>(alive.error());
    }
    if (const auto* cloth = m_cloths.find(id)) {
        return newton_core::Ok(ResultType(cloth->state()));
    }
    return newton_core::Ok(ResultType());
}

newton_core::Result<std::optional<RagdollState>> PhysicsEngine::ragdoll_state(const std::string& id) const {
    using ResultType = std::optional<RagdollState>;
    if (auto alive = check_alive("ragdoll_state"); !alive) {
        return newton_core::Err<ResultType>(alive.error());
    }
    auto it = m_ragdolls.find(id);
    if (it == m_ragdolls.end()) {
        return newton_core::Ok(ResultType());
    }
    return newton_core::Ok(ResultType(extract_ragdoll_state(it->first, it->second, m_rigid_bodies)));
}

newton_core::Result<std::vector<std::string>> PhysicsEngine::rigid_body_ids() const {
    if (auto alive = check_alive("rigid_body_ids"); !alive) {
        return newton_core::Err<std::vector<std::string>>(alive.error());
    }
    return newton_core::Ok(m_rigid_bodies.ids());
}

newton_core::Result<std::vector<std::string>> PhysicsEngine::soft_body_ids() const {
    if (auto alive = check_alive("soft_body_ids"); !alive) {
        return newton_core::Err<std::vector<std::string>>(alive.error());
    }
    return newton_core::Ok(collect_ids(m_soft_bodies.soft_bodies()));
}

newton_core::Result<std::vector<std::string>> PhysicsEngine::cloth_ids() const {
    if (auto alive = check_alive("cloth_ids"); !alive) {
        return newton_core::Err<std::vector<std::string>>(alive.error());
    }
    return newton_core::Ok(collect_ids(m_cloths.cloths()));
}

newton_core::Result<std::vector<std::string>> PhysicsEngine::joint_ids() const {
    if (auto alive = check_alive("joint_ids"); !alive) {
        return newton_core::Err<std::vector<std::string>>(alive.error());
    }
    std::vector<std::string> ids;
    ids.reserve(m_joints.size());
    for (const auto& joint : m_joints.joints()) {
        ids.push_back(joint.id);
    }
    return newton_core::Ok(std::move(ids));
}

newton_core::Result<std::vector<std::string>> PhysicsEngine::ragdoll_ids() const {
    if (auto alive = check_alive("ragdoll_ids"); !alive) {
        return newton_core::Err<std::vector<std::string>>(alive.error());
    }
    std::vector<std::string> ids;
    ids.reserve(m_ragdolls.size());
    for (const auto& entry : m_ragdolls) {
        ids.push_back(entry.first);
    }
    return newton_core::Ok(std::move(ids));
}

// =============================================================================
// Lifecycle
// =============================================================================

newton_core::Result<void> PhysicsEngine::clear_cache() {
    if (auto alive = check_alive("clear_cache"); !alive) {
        return alive;
    }
    invalidate("cache cleared");
    return newton_core::Ok();
}

void PhysicsEngine::dispose() {
    if (m_disposed) {
        return;
    }

    m_checkpoints.clear();
    m_cached_state.reset();
    m_last_frame = -1;
    m_rigid_bodies.clear();
    m_soft_bodies.clear();
    m_cloths.clear();
    m_joints.clear();
    m_detector.set_excluded_pairs({});
    m_force_fields.set_fields({});
    m_ragdolls.clear();
    m_disposed = true;

    newton_core::physics_logger()->debug("PhysicsEngine: disposed");
}

// =============================================================================
// Internals
// =============================================================================

newton_core::Result<void> PhysicsEngine::check_alive(const char* operation) const {
    if (m_disposed) {
        newton_core::physics_logger()->warn("PhysicsEngine::{} called after dispose", operation);
        return newton_core::Err(SimulationError::disposed());
    }
    return newton_core::Ok();
}

void PhysicsEngine::invalidate(const char* reason) {
    if (!m_checkpoints.empty() || m_last_frame >= 0) {
        NEWTON_LOG_DEBUG("PhysicsEngine: cache invalidated ({})", reason);
    }
    m_checkpoints.clear();
    m_cached_state.reset();
    m_last_frame = -1;
}

void PhysicsEngine::refresh_excluded_pairs() {
    m_detector.set_excluded_pairs(m_joints.non_colliding_pairs());
}

void PhysicsEngine::rewind_for(int frame) {
    if (const Checkpoint* checkpoint = m_checkpoints.latest_at_or_before(frame)) {
        checkpoint->restore_to(m_rigid_bodies, m_soft_bodies, m_cloths);
        m_random.set_state(checkpoint->random_state);
        newton_core::physics_logger()->trace("PhysicsEngine: restored checkpoint {} for frame {}",
                                             checkpoint->frame, frame);
        return;
    }

    m_rigid_bodies.reset_all();
    m_soft_bodies.reset_all();
    m_cloths.reset_all();
    m_random.reset();
}

void PhysicsEngine::step(int frame) {
    const float dt = m_config.time_step;
    auto& bodies = m_rigid_bodies.bodies();

    for (auto& body : bodies) {
        if (!body.is_immovable()) {
            body.apply_force(m_config.gravity * body.mass());
        }
    }

    m_force_fields.process(frame, bodies);
    m_rigid_bodies.integrate(dt, m_config);

    for (std::uint32_t i = 0; i < m_config.velocity_iterations; ++i) {
        const auto pairs = m_detector.detect(bodies);
        m_resolver.resolve_all(pairs, bodies, m_config);
        m_joints.solve(m_rigid_bodies, dt);
    }

    m_soft_bodies.apply_acceleration_to_all(m_config.gravity);
    m_cloths.apply_acceleration_to_all(m_config.gravity);

    m_soft_bodies.integrate(dt, m_config.soft_body_damping);
    m_cloths.integrate(dt);

    const std::size_t broken = m_soft_bodies.solve_constraints(m_config.position_iterations)
                               + m_cloths.solve_constraints();
    if (broken > 0) {
        newton_core::physics_logger()->debug("PhysicsEngine: {} constraints broke at frame {}", broken, frame);
    }
}

PhysicsSimulationState PhysicsEngine::capture_state(int frame) const {
    PhysicsSimulationState state;
    state.frame = frame;
    state.rigid_bodies = m_rigid_bodies.states();
    state.soft_bodies = m_soft_bodies.states();
    state.cloths = m_cloths.states();
    state.ragdolls.reserve(m_ragdolls.size());
    for (const auto& [id, bones] : m_ragdolls) {
        state.ragdolls.push_back(extract_ragdoll_state(id, bones, m_rigid_bodies));
    }
    state.contacts = current_contacts();
    return state;
}

std::vector<ContactInfo> PhysicsEngine::current_contacts() const {
    const auto& bodies = m_rigid_bodies.bodies();
    std::vector<ContactInfo> contacts;
    for (const auto& pair : m_detector.detect(bodies)) {
        ContactInfo contact;
        contact.body_a = bodies[pair.body_a].id();
        contact.body_b = bodies[pair.body_b].id();
        contact.point = pair.manifold.point;
        contact.normal = pair.manifold.normal;
        contact.depth = pair.manifold.depth;
        contacts.push_back(std::move(contact));
    }
    return contacts;
}

} // namespace newton_physics
