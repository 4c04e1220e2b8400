/// @file main.cpp
/// @brief Keyframe Bake Demo
///
/// Builds a small scene (a floor, a few bodies, a ragdoll and a flag), scrubs
/// through it the way an editor timeline would, then bakes the layered bodies
/// to keyframes and writes them as JSON.
///
/// Usage: newton_bake_demo [--config space.json] [--frames N] [--out tracks.json] [--log level]
///                          [--log-dir DIR]

#include <newton/physics/physics.hpp>
#include <newton/core/log.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace {

struct DemoOptions {
    std::string config_path;
    std::string output_path;
    std::string log_directory;
    int frames = 180;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

bool parse_args(int argc, char* argv[], DemoOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--config" && has_value) {
            options.config_path = argv[++i];
        } else if (arg == "--out" && has_value) {
            options.output_path = argv[++i];
        } else if (arg == "--log-dir" && has_value) {
            options.log_directory = argv[++i];
        } else if (arg == "--frames" && has_value) {
            try {
                options.frames = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                spdlog::error("--frames expects an integer, got '{}'", argv[i]);
                return false;
            }
        } else if (arg == "--log" && has_value) {
            auto level = newton_core::parse_log_level(argv[++i]);
            if (!level) {
                spdlog::error("Unknown log level '{}'", argv[i]);
                return false;
            }
            options.log_level = *level;
        } else {
            spdlog::error("Unrecognized argument '{}'", arg);
            return false;
        }
    }
    return true;
}

/// Load the space configuration, falling back to defaults without a file
newton_core::Result<newton_physics::PhysicsSpaceConfig> load_config(const std::string& path) {
    if (path.empty()) {
        return newton_core::Ok(newton_physics::PhysicsSpaceConfig::defaults());
    }

    std::ifstream file(path);
    if (!file) {
        return newton_core::Err<newton_physics::PhysicsSpaceConfig>(
            newton_core::Error(newton_core::ErrorCode::NotFound, "Cannot open config file: " + path));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return newton_physics::space_config_from_json_string(buffer.str());
}

newton_core::Result<void> build_scene(newton_physics::PhysicsEngine& engine) {
    using namespace newton_physics;
    using newton_math::Vec2;

    auto floor = make_box_body("floor", "floor_layer", Vec2(960.0f, 1000.0f), 1920.0f, 40.0f);
    floor.type = BodyType::Static;
    floor.material = PhysicsMaterial::stone();
    if (auto r = engine.add_rigid_body(floor); !r) return r;

    auto ball = make_circle_body("ball", "ball_layer", Vec2(600.0f, 200.0f), 40.0f, 2.0f);
    ball.material = PhysicsMaterial::rubber();
    if (auto r = engine.add_rigid_body(ball); !r) return r;

    auto crate = make_box_body("crate", "crate_layer", Vec2(900.0f, 400.0f), 120.0f, 120.0f, 8.0f);
    crate.material = PhysicsMaterial::wood();
    crate.angular_velocity = 0.5f;
    if (auto r = engine.add_rigid_body(crate); !r) return r;

    RagdollBuilder builder("stuntman", "stuntman_layer");
    builder.set_position(1200.0f, 300.0f).set_rotation(0.3f);
    if (auto r = builder.from_preset("adult"); !r) return r;
    if (auto r = engine.add_ragdoll(builder.build()); !r) return r;

    auto flag = make_cloth_config("flag", "flag_layer", Vec2(200.0f, 100.0f), 12, 8, 15.0f,
                                  ClothPinMode::TopCorners);
    flag.tear_threshold = 3.0f;
    if (auto r = engine.add_cloth(flag); !r) return r;

    ForceField wind;
    wind.id = "breeze";
    wind.params = WindField{AnimatableProperty<Vec2>::constant(Vec2(60.0f, 0.0f)),
                            AnimatableProperty<float>::constant(20.0f), 0.02f, 3.0f};
    if (auto r = engine.add_force_field(wind); !r) return r;

    ForceField blast;
    blast.id = "blast";
    blast.params = ExplosionField{Vec2(1000.0f, 980.0f), 4000.0f, 500.0f, 90};
    return engine.add_force_field(blast);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    DemoOptions options;
    if (!parse_args(argc, argv, options)) {
        return EXIT_FAILURE;
    }

    newton_core::LogConfig log_config;
    log_config.level = options.log_level;
    log_config.file_enabled = !options.log_directory.empty();
    log_config.log_directory = options.log_directory;
    newton_core::configure_logging(log_config);

    spdlog::info("=== Keyframe Bake Demo === (log level {})", newton_core::log_level_name(options.log_level));

    auto config = load_config(options.config_path);
    if (!config) {
        spdlog::error("{}", newton_core::build_error_chain(config.error()));
        return EXIT_FAILURE;
    }

    newton_physics::PhysicsEngine engine(*config);
    if (auto built = build_scene(engine); !built) {
        spdlog::error("Failed to build scene: {}", newton_core::build_error_chain(built.error()));
        return EXIT_FAILURE;
    }

    spdlog::info("Scene: {} rigid bodies, {} joints, {} cloths, {} force fields",
                 engine.rigid_body_ids()->size(), engine.joint_ids()->size(),
                 engine.cloth_ids()->size(), engine.force_fields().size());

    // Scrub like a timeline: jump ahead, step back, then replay forward
    const int last = std::max(options.frames - 1, 0);
    for (int frame : {last, last / 2, last / 3, last}) {
        auto state = engine.evaluate_frame(frame);
        if (!state) {
            spdlog::error("Frame {} failed: {}", frame, newton_core::build_error_chain(state.error()));
            return EXIT_FAILURE;
        }
        spdlog::info("Frame {:>4}: {} contacts, checkpoints at {} frames",
                     frame, state->contacts.size(), engine.checkpoint_frames().size());
    }

    auto ragdoll = engine.ragdoll_state("stuntman");
    if (ragdoll && ragdoll->has_value()) {
        const auto& pelvis = (*ragdoll)->bones.front();
        spdlog::info("Stuntman pelvis at ({:.1f}, {:.1f})", pelvis.position.x, pelvis.position.y);
    }

    newton_physics::KeyframeExportOptions export_options;
    export_options.start_frame = 0;
    export_options.end_frame = last;
    export_options.simplify = true;
    export_options.simplify_tolerance = 0.5f;

    auto tracks = engine.export_keyframes(export_options);
    if (!tracks) {
        spdlog::error("Export failed: {}", newton_core::build_error_chain(tracks.error()));
        return EXIT_FAILURE;
    }

    std::size_t keyframe_count = 0;
    for (const auto& track : *tracks) {
        keyframe_count += track.keyframes.size();
        spdlog::debug("  {} {}: {} keyframes", track.layer_id, track.property, track.keyframes.size());
    }
    spdlog::info("Exported {} tracks with {} keyframes", tracks->size(), keyframe_count);

    const std::string document = newton_physics::to_json(*tracks).dump(2);
    if (options.output_path.empty()) {
        std::cout << document << std::endl;
    } else {
        std::ofstream out(options.output_path);
        if (!out) {
            spdlog::error("Cannot write {}", options.output_path);
            return EXIT_FAILURE;
        }
        out << document << '\n';
        spdlog::info("Wrote {}", options.output_path);
    }

    engine.dispose();
    newton_core::shutdown_logging();
    return EXIT_SUCCESS;
}
