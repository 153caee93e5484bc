#include "PhysicsConfig.hpp"
#include "Logger.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kineticEngine {

namespace {
    PhysicsConfig fromJson(const json& config) {
        PhysicsConfig result;

        // Parse physics settings
        if (config.contains("physics")) {
            auto& physicsCfg = config["physics"];

            if (physicsCfg.contains("frame_rate")) {
                auto& rateCfg = physicsCfg["frame_rate"];
                std::string mode = rateCfg.value("mode", std::string("static"));

                if (mode == "static") {
                    StaticFrameRate rate;
                    if (rateCfg.contains("ticks_per_second")) {
                        rate.ticksPerSecond = rateCfg["ticks_per_second"].get<int64_t>();
                    }
                    result.frameRate = rate;
                } else if (mode == "dynamic") {
                    result.frameRate = DynamicFrameRate{};
                } else {
                    throw std::runtime_error("Configuration error: physics.frame_rate.mode must be 'static' or 'dynamic'");
                }
            }

            if (physicsCfg.contains("gravity")) {
                auto& gravityCfg = physicsCfg["gravity"];
                if (!gravityCfg.is_array() || gravityCfg.size() != 3) {
                    throw std::runtime_error("Configuration error: physics.gravity must be an array of 3 numbers");
                }
                result.gravity = Vec3(gravityCfg[0].get<float>(), gravityCfg[1].get<float>(), gravityCfg[2].get<float>());
            }

            if (physicsCfg.contains("max_sub_steps")) {
                result.maxSubSteps = physicsCfg["max_sub_steps"].get<int>();
            }

            if (physicsCfg.contains("immediate_messages")) {
                result.immediateMessages = physicsCfg["immediate_messages"].get<bool>();
            }
        }

        // Parse logging settings
        if (config.contains("logging")) {
            auto& loggingCfg = config["logging"];

            if (loggingCfg.contains("debug")) {
                result.debugLogging = loggingCfg["debug"].get<bool>();
            }
        }

        return result;
    }
}

PhysicsConfig parsePhysicsConfig(const std::string& text, const std::string& origin) {
    json config;
    try {
        config = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("JSON parse error in " + origin + ": " + e.what());
    }

    PhysicsConfig result;
    try {
        result = fromJson(config);
    } catch (const json::exception& e) {
        throw std::runtime_error("Configuration error in " + origin + ": " + e.what());
    }

    validatePhysicsConfig(result);

    if (result.debugLogging) {
        Logger::setDebugEnabled(true);
        Logger::Debug("[PhysicsConfig] Configuration loaded from " + origin + ":");
        if (auto* rate = std::get_if<StaticFrameRate>(&result.frameRate)) {
            Logger::Debug("  - Frame rate: static, " + std::to_string(rate->ticksPerSecond) + " ticks/s");
        } else {
            Logger::Debug("  - Frame rate: dynamic");
        }
        Logger::Debug("  - Gravity: " + result.gravity.toString());
        Logger::Debug("  - Max sub steps: " + std::to_string(result.maxSubSteps));
        Logger::Debug(std::string("  - Immediate messages: ") + (result.immediateMessages ? "yes" : "no"));
    }

    return result;
}

PhysicsConfig loadPhysicsConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parsePhysicsConfig(buffer.str(), path);
}

void validatePhysicsConfig(const PhysicsConfig& config) {
    if (auto* rate = std::get_if<StaticFrameRate>(&config.frameRate)) {
        if (rate->ticksPerSecond <= 0) {
            throw std::runtime_error("Configuration error: physics.frame_rate.ticks_per_second must be positive");
        }
    }

    if (config.maxSubSteps < 1) {
        throw std::runtime_error("Configuration error: physics.max_sub_steps must be at least 1");
    }
}

}  // namespace kineticEngine
