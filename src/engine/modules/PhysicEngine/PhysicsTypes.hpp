/**
 * @file PhysicsTypes.hpp
 * @brief Backend-agnostic physics data model
 *
 * @details Identifiers, declarative body shapes, body and joint properties.
 * Nothing here depends on Bullet: these types cross the message boundary.
 *
 * @see PhysicsMessages.hpp for the message vocabulary built on them
 */

#pragma once

#include "../../types/Quat.hpp"
#include "../../types/Vec3.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kineticEngine {

/// Stable logical name of a tracked body or joint.
struct PhysicsId {
    uint64_t sourceId = 0;
    uint64_t correlationId = 0;

    bool operator==(const PhysicsId& other) const {
        return sourceId == other.sourceId && correlationId == other.correlationId;
    }

    bool operator!=(const PhysicsId& other) const {
        return !(*this == other);
    }

    std::string toString() const {
        return "[" + std::to_string(sourceId) + " " + std::to_string(correlationId) + "]";
    }
};

struct PhysicsIdHash {
    std::size_t operator()(const PhysicsId& id) const {
        std::size_t h = std::hash<uint64_t>{}(id.sourceId);
        return h ^ (std::hash<uint64_t>{}(id.correlationId) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

/// The simulant a body was created for, plus the caller's body correlation id.
struct BodySource {
    std::string simulant;
    uint64_t bodyId = 0;

    bool operator==(const BodySource& other) const {
        return simulant == other.simulant && bodyId == other.bodyId;
    }
};

/// Back-reference attached to every child collision shape.
struct BodyShapeSource {
    std::string simulant;
    uint64_t bodyId = 0;
    uint64_t shapeId = 0;
};

struct BodyShapeProperties {
    uint64_t bodyShapeId = 0;
};

// ---------------------------------------------------------------------------
// Declarative shapes
// ---------------------------------------------------------------------------

struct BodyEmpty {};

struct BodyBox {
    Vec3 center;
    Vec3 size = Vec3::one();
    std::optional<BodyShapeProperties> propertiesOpt;
};

struct BodySphere {
    Vec3 center;
    float radius = 0.5f;
    std::optional<BodyShapeProperties> propertiesOpt;
};

/// Height is the length of the cylindrical section, caps excluded.
struct BodyCapsule {
    Vec3 center;
    float height = 1.0f;
    float radius = 0.25f;
    std::optional<BodyShapeProperties> propertiesOpt;
};

struct BodyBoxRounded {
    Vec3 center;
    Vec3 size = Vec3::one();
    float radius = 0.1f;
    std::optional<BodyShapeProperties> propertiesOpt;
};

struct BodyPolygon {
    Vec3 center;
    std::vector<Vec3> vertices;
    std::optional<BodyShapeProperties> propertiesOpt;
};

struct BodyShape;

struct BodyShapes {
    std::vector<BodyShape> shapes;
};

struct BodyShape {
    using Variant = std::variant<BodyEmpty, BodyBox, BodySphere, BodyCapsule, BodyBoxRounded, BodyPolygon, BodyShapes>;

    Variant value;

    BodyShape() : value(BodyEmpty{}) {}
    BodyShape(BodyEmpty shape) : value(std::move(shape)) {}
    BodyShape(BodyBox shape) : value(std::move(shape)) {}
    BodyShape(BodySphere shape) : value(std::move(shape)) {}
    BodyShape(BodyCapsule shape) : value(std::move(shape)) {}
    BodyShape(BodyBoxRounded shape) : value(std::move(shape)) {}
    BodyShape(BodyPolygon shape) : value(std::move(shape)) {}
    BodyShape(BodyShapes shapes) : value(std::move(shapes)) {}
};

// ---------------------------------------------------------------------------
// Body properties
// ---------------------------------------------------------------------------

struct Density {
    float value = 1.0f;
};

struct Mass {
    float value = 1.0f;
};

using Substance = std::variant<Density, Mass>;

enum class BodyType {
    Static,
    Dynamic,
    Kinematic
};

struct Discontinuous {};

struct Continuous {
    float continuousMotionThreshold = 0.0f;
    float sweptSphereRadius = 0.0f;
};

using CollisionDetection = std::variant<Discontinuous, Continuous>;

struct BodyProperties {
    uint64_t bodyId = 0;
    Vec3 center;
    Quat rotation;
    BodyShape bodyShape;
    BodyType bodyType = BodyType::Dynamic;
    Substance substance = Density{1.0f};
    bool awake = true;
    bool awakeAlways = false;
    bool enabled = true;
    float friction = 0.5f;
    float restitution = 0.0f;
    Vec3 linearVelocity;
    float linearDamping = 0.0f;
    Vec3 angularVelocity;
    float angularDamping = 0.0f;
    Vec3 angularFactor = Vec3::one();
    std::optional<Vec3> gravityOverrideOpt;
    CollisionDetection collisionDetection = Discontinuous{};
    int collisionCategories = 1;
    int collisionMask = -1;
    bool sensor = false;
};

// ---------------------------------------------------------------------------
// Joints
// ---------------------------------------------------------------------------

struct JointEmpty {};

/// Hinge between two bodies, limited to [angleMin, angleMax] radians.
struct JointAngle {
    PhysicsId targetId;
    PhysicsId targetId2;
    Vec3 anchor;
    Vec3 anchor2;
    Vec3 axis = Vec3::up();
    Vec3 axis2 = Vec3::up();
    float angleMin = -3.14159265f;
    float angleMax = 3.14159265f;
    float softness = 0.9f;
    float biasFactor = 0.3f;
    float relaxationFactor = 1.0f;
    float breakImpulseThreshold = 3.4e38f;
};

struct JointDistance {
    PhysicsId targetId;
    PhysicsId targetId2;
    Vec3 anchor;
    Vec3 anchor2;
    float length = 1.0f;
};

struct JointWeld {
    PhysicsId targetId;
    PhysicsId targetId2;
    Vec3 anchor;
    Vec3 anchor2;
};

using JointDevice = std::variant<JointEmpty, JointAngle, JointDistance, JointWeld>;

struct JointProperties {
    uint64_t jointId = 0;
    JointDevice jointDevice = JointEmpty{};
};

}  // namespace kineticEngine
