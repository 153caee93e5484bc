#pragma once

#include <cmath>
#include <string>
#include <sstream>

namespace kineticEngine {

struct Quat {
    float x, y, z, w;

    Quat(float x = 0, float y = 0, float z = 0, float w = 1)
        : x(x), y(y), z(z), w(w) {}

    static Quat identity() { return Quat(0, 0, 0, 1); }

    // Yaw around Y, pitch around X, roll around Z, all in radians.
    static Quat fromYawPitchRoll(float yaw, float pitch, float roll) {
        float cy = std::cos(yaw * 0.5f), sy = std::sin(yaw * 0.5f);
        float cp = std::cos(pitch * 0.5f), sp = std::sin(pitch * 0.5f);
        float cr = std::cos(roll * 0.5f), sr = std::sin(roll * 0.5f);
        return Quat(cy * sp * cr + sy * cp * sr,
                    sy * cp * cr - cy * sp * sr,
                    cy * cp * sr - sy * sp * cr,
                    cy * cp * cr + sy * sp * sr);
    }

    bool operator==(const Quat& other) const {
        return x == other.x && y == other.y && z == other.z && w == other.w;
    }

    bool operator!=(const Quat& other) const {
        return !(*this == other);
    }

    float length() const {
        return std::sqrt(x * x + y * y + z * z + w * w);
    }

    std::string toString() const {
        std::ostringstream oss;
        oss << "(" << x << ", " << y << ", " << z << ", " << w << ")";
        return oss.str();
    }
};

}  // namespace kineticEngine
