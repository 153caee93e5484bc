/**
 * @file main.cpp
 * @brief Kinetic sandbox: drops a crate on a static floor
 *
 * Usage:
 *   ./kinetic_sandbox                              # Default (physics.json)
 *   ./kinetic_sandbox --config other.json          # Custom configuration
 *   ./kinetic_sandbox --ticks 240                  # Simulate longer
 *
 * Every step's body transforms are logged, followed by the ground contact
 * state of the crate.
 */

#include "core/Logger.hpp"
#include "core/PhysicsConfig.hpp"
#include "modules/PhysicEngine/Bullet/BulletPhysicEngine.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {
    const uint64_t kSandboxSource = 1;
    const uint64_t kCrateId = 1;
    const uint64_t kFloorId = 2;

    void printHelp() {
        std::cout << "Kinetic Sandbox - Usage:\n"
                  << "  ./kinetic_sandbox [options]\n"
                  << "\nOptions:\n"
                  << "  --config <path>          -> configuration file (default assets/config/physics.json)\n"
                  << "  --ticks <n>              -> number of steps to simulate (default 120)\n"
                  << "  --help   | -h            -> show this help\n"
                  << "\nEnvironment Variables:\n"
                  << "  KINETIC_DEBUG=1          Enable debug logging\n";
    }

    struct ParsedArgs {
        std::string configPath = "assets/config/physics.json";
        int ticks = 120;
        bool ok = true;
    };

    ParsedArgs parseArgs(int argc, char** argv) {
        ParsedArgs parsed;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--config" || arg == "-c") {
                if (i + 1 < argc) {
                    parsed.configPath = argv[++i];
                } else {
                    std::cerr << "ERROR: --config requires a path argument" << std::endl;
                    parsed.ok = false;
                    return parsed;
                }
            } else if (arg == "--ticks" || arg == "-t") {
                if (i + 1 < argc) {
                    parsed.ticks = std::stoi(argv[++i]);
                } else {
                    std::cerr << "ERROR: --ticks requires a number" << std::endl;
                    parsed.ok = false;
                    return parsed;
                }
            } else if (arg == "--help" || arg == "-h") {
                printHelp();
                parsed.ok = false;
                return parsed;
            } else {
                std::cerr << "ERROR: Unknown argument: " << arg << "\n\n";
                printHelp();
                parsed.ok = false;
                return parsed;
            }
        }

        return parsed;
    }

    std::vector<kineticEngine::PhysicsMessage> buildScene() {
        using namespace kineticEngine;

        CreateBodyMessage crate;
        crate.sourceSimulant = "Sandbox/Crate";
        crate.sourceId = kSandboxSource;
        crate.bodyProperties.bodyId = kCrateId;
        crate.bodyProperties.center = Vec3(0.0f, 4.0f, 0.0f);
        crate.bodyProperties.rotation = Quat::fromYawPitchRoll(0.3f, 0.0f, 0.2f);
        crate.bodyProperties.bodyShape = BodyBox();
        crate.bodyProperties.substance = Mass{2.0f};
        crate.bodyProperties.restitution = 0.2f;
        crate.bodyProperties.sensor = true;

        BodyBox slab;
        slab.size = Vec3(20.0f, 1.0f, 20.0f);
        CreateBodyMessage floor;
        floor.sourceSimulant = "Sandbox/Floor";
        floor.sourceId = kSandboxSource;
        floor.bodyProperties.bodyId = kFloorId;
        floor.bodyProperties.center = Vec3(0.0f, -0.5f, 0.0f);
        floor.bodyProperties.bodyShape = slab;
        floor.bodyProperties.bodyType = BodyType::Static;
        floor.bodyProperties.sensor = true;

        return {crate, floor};
    }

    kineticEngine::StepTime stepFor(const kineticEngine::FrameRate& frameRate) {
        if (std::holds_alternative<kineticEngine::StaticFrameRate>(frameRate)) {
            return kineticEngine::UpdateTime{1};
        }
        return kineticEngine::ClockTime{1.0f / 60.0f};
    }
}

int main(int argc, char** argv) {
    using namespace kineticEngine;

    try {
        ParsedArgs parsed = parseArgs(argc, argv);
        if (!parsed.ok) {
            return 1;
        }

        Logger::Info("[Main] Configuration: " + parsed.configPath);
        PhysicsConfig config = loadPhysicsConfig(parsed.configPath);

        BulletPhysicEngine engine(config);
        for (auto& message : buildScene()) {
            engine.enqueueMessage(message);
        }

        const StepTime step = stepFor(config.frameRate);
        const PhysicsId crate{kSandboxSource, kCrateId};
        for (int tick = 0; tick < parsed.ticks; ++tick) {
            std::vector<IntegrationMessage> results = engine.integrate(step, engine.popMessages());

            for (const auto& result : results) {
                const auto& transform = std::get<BodyTransformMessage>(result);
                Logger::Debug("[Main] Tick " + std::to_string(tick) + " " + transform.bodySource.simulant +
                              " center " + transform.center.toString() +
                              " velocity " + transform.linearVelocity.toString());
            }
        }

        auto normal = engine.getBodyToGroundContactNormalOpt(crate);
        Logger::Info("[Main] Crate on ground: " + std::string(engine.isBodyOnGround(crate) ? "yes" : "no") +
                     (normal ? ", normal " + normal->toString() : std::string()));
        Logger::Info("[Main] Sandbox stopped gracefully");
        return 0;

    } catch (const std::runtime_error& e) {
        // Configuration errors
        Logger::Error(std::string("[Main] FATAL ERROR: ") + e.what());
        return 1;

    } catch (const std::exception& e) {
        Logger::Error(std::string("[Main] UNEXPECTED ERROR: ") + e.what());
        return 2;
    }
}
