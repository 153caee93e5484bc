/**
 * @file PhysicsMessages.hpp
 * @brief Inbound command and outbound integration messages
 *
 * @details Callers never touch the backend: every mutation is one of the
 * PhysicsMessage alternatives below, applied in arrival order. Each step
 * produces a batch of IntegrationMessage values.
 *
 * @section inbound Inbound Messages
 * | Message | Effect |
 * |---------|--------|
 * | `CreateBodyMessage` / `CreateBodiesMessage` | Create rigid body or sensor ghost |
 * | `DestroyBodyMessage` / `DestroyBodiesMessage` | Remove body or ghost |
 * | `CreateJointMessage` / `CreateJointsMessage` | Bind two bodies |
 * | `DestroyJointMessage` / `DestroyJointsMessage` | Remove joint |
 * | `SetBodyEnabledMessage` | Toggle simulation of a body |
 * | `SetBodyCenterMessage` / `SetBodyRotationMessage` | Teleport |
 * | `SetBodyLinearVelocityMessage` / `SetBodyAngularVelocityMessage` | Set velocity |
 * | `ApplyBodyLinearImpulseMessage` / `ApplyBodyAngularImpulseMessage` | Impulse |
 * | `ApplyBodyForceMessage` / `ApplyBodyTorqueMessage` | Force for next step |
 * | `SetGravityMessage` | World gravity (overrides are kept) |
 * | `RebuildPhysicsHackMessage` | Drop every tracked entity |
 *
 * @section outbound Outbound Messages
 * | Message | Payload |
 * |---------|---------|
 * | `BodyTransformMessage` | Source, center, rotation, linear/angular velocity |
 */

#pragma once

#include "PhysicsTypes.hpp"

#include <string>
#include <variant>
#include <vector>

namespace kineticEngine {

struct CreateBodyMessage {
    std::string sourceSimulant;
    uint64_t sourceId = 0;
    BodyProperties bodyProperties;
};

struct CreateBodiesMessage {
    std::string sourceSimulant;
    uint64_t sourceId = 0;
    std::vector<BodyProperties> bodiesProperties;
};

struct DestroyBodyMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
};

struct DestroyBodiesMessage {
    std::string sourceSimulant;
    std::vector<PhysicsId> physicsIds;
};

struct CreateJointMessage {
    std::string sourceSimulant;
    uint64_t sourceId = 0;
    JointProperties jointProperties;
};

struct CreateJointsMessage {
    std::string sourceSimulant;
    uint64_t sourceId = 0;
    std::vector<JointProperties> jointsProperties;
};

struct DestroyJointMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
};

struct DestroyJointsMessage {
    std::string sourceSimulant;
    std::vector<PhysicsId> physicsIds;
};

struct SetBodyEnabledMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
    bool enabled = true;
};

struct SetBodyCenterMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
    Vec3 center;
};

struct SetBodyRotationMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
    Quat rotation;
};

struct SetBodyLinearVelocityMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
    Vec3 linearVelocity;
};

struct SetBodyAngularVelocityMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
    Vec3 angularVelocity;
};

struct ApplyBodyLinearImpulseMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
    Vec3 linearImpulse;
    Vec3 offset;
};

struct ApplyBodyAngularImpulseMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
    Vec3 angularImpulse;
};

struct ApplyBodyForceMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
    Vec3 force;
    Vec3 offset;
};

struct ApplyBodyTorqueMessage {
    std::string sourceSimulant;
    PhysicsId physicsId;
    Vec3 torque;
};

struct SetGravityMessage {
    Vec3 gravity;
};

/// Drops every tracked entity; the caller resubmits its authoritative state.
struct RebuildPhysicsHackMessage {};

using PhysicsMessage = std::variant<
    CreateBodyMessage,
    CreateBodiesMessage,
    DestroyBodyMessage,
    DestroyBodiesMessage,
    CreateJointMessage,
    CreateJointsMessage,
    DestroyJointMessage,
    DestroyJointsMessage,
    SetBodyEnabledMessage,
    SetBodyCenterMessage,
    SetBodyRotationMessage,
    SetBodyLinearVelocityMessage,
    SetBodyAngularVelocityMessage,
    ApplyBodyLinearImpulseMessage,
    ApplyBodyAngularImpulseMessage,
    ApplyBodyForceMessage,
    ApplyBodyTorqueMessage,
    SetGravityMessage,
    RebuildPhysicsHackMessage>;

struct BodyTransformMessage {
    BodySource bodySource;
    Vec3 center;
    Quat rotation;
    Vec3 linearVelocity;
    Vec3 angularVelocity;
};

using IntegrationMessage = std::variant<BodyTransformMessage>;

}  // namespace kineticEngine
