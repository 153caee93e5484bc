#pragma once

#include "../../../types/Quat.hpp"
#include "../../../types/Vec3.hpp"

#include <btBulletDynamicsCommon.h>

namespace kineticEngine {

inline btVector3 toBullet(const Vec3& v) {
    return btVector3(v.x, v.y, v.z);
}

inline btQuaternion toBullet(const Quat& q) {
    return btQuaternion(q.x, q.y, q.z, q.w);
}

inline btTransform toBullet(const Vec3& center, const Quat& rotation) {
    return btTransform(toBullet(rotation), toBullet(center));
}

inline Vec3 fromBullet(const btVector3& v) {
    return Vec3(static_cast<float>(v.x()), static_cast<float>(v.y()), static_cast<float>(v.z()));
}

inline Quat fromBullet(const btQuaternion& q) {
    return Quat(static_cast<float>(q.x()), static_cast<float>(q.y()), static_cast<float>(q.z()), static_cast<float>(q.w()));
}

}  // namespace kineticEngine
