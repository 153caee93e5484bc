#pragma once

#include "../types/GameTime.hpp"
#include "../types/Vec3.hpp"

#include <string>

namespace kineticEngine {

/**
 * @brief Physics engine configuration (parsed from JSON)
 *
 * Example:
 * @code
 * {
 *   "physics": {
 *     "frame_rate": { "mode": "static", "ticks_per_second": 60 },
 *     "gravity": [0.0, -9.81, 0.0],
 *     "max_sub_steps": 1,
 *     "immediate_messages": false
 *   },
 *   "logging": { "debug": false }
 * }
 * @endcode
 */
struct PhysicsConfig {
    // Timing configuration
    FrameRate frameRate = StaticFrameRate{60};
    int maxSubSteps = 1;

    // World
    Vec3 gravity = Vec3(0.0f, -9.81f, 0.0f);

    // Apply messages as they are enqueued instead of at integrate time.
    // Read once when the engine is constructed.
    bool immediateMessages = false;

    bool debugLogging = false;
};

/**
 * @brief Parse and validate a JSON configuration file
 * @throws std::runtime_error if the file is missing, malformed, or invalid
 */
PhysicsConfig loadPhysicsConfig(const std::string& path);

/**
 * @brief Parse and validate configuration from JSON text
 * @throws std::runtime_error on parse error or invalid values
 */
PhysicsConfig parsePhysicsConfig(const std::string& text, const std::string& origin = "<string>");

/// @throws std::runtime_error if a value is out of range
void validatePhysicsConfig(const PhysicsConfig& config);

}  // namespace kineticEngine
