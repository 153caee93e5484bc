/**
 * @file IPhysicEngine.hpp
 * @brief Interface for physics engine modules
 *
 * @details Defines the contract for physics simulation implementations:
 * a message queue in, a batch of integration messages out, and a few
 * read-only queries between steps.
 *
 * @see BulletPhysicEngine for Bullet3 implementation
 * @see PhysicsMessages.hpp for the message reference
 */

#pragma once

#include "../../types/GameTime.hpp"
#include "PhysicsMessages.hpp"

#include <optional>
#include <vector>

namespace kineticEngine {
class IPhysicEngine {
  public:
    virtual ~IPhysicEngine() = default;

    virtual void enqueueMessage(const PhysicsMessage& message) = 0;
    virtual std::vector<PhysicsMessage> popMessages() = 0;
    virtual void clearMessages() = 0;

    /**
     * @brief Apply a batch of messages, advance time, collect results
     * @throws std::logic_error if stepTime does not match the configured frame rate
     */
    virtual std::vector<IntegrationMessage> integrate(const StepTime& stepTime,
                                                      const std::vector<PhysicsMessage>& messages) = 0;

    virtual bool bodyExists(const PhysicsId& physicsId) const = 0;

    /// @throws std::runtime_error if the id is neither a body nor a ghost
    virtual Vec3 getBodyLinearVelocity(const PhysicsId& physicsId) const = 0;

    virtual std::vector<Vec3> getBodyContactNormals(const PhysicsId& physicsId) const = 0;
    virtual std::vector<Vec3> getBodyToGroundContactNormals(const PhysicsId& physicsId) const = 0;
    virtual std::optional<Vec3> getBodyToGroundContactNormalOpt(const PhysicsId& physicsId) const = 0;
    virtual std::optional<Vec3> getBodyToGroundContactTangentOpt(const PhysicsId& physicsId) const = 0;
    virtual bool isBodyOnGround(const PhysicsId& physicsId) const = 0;
};
}  // namespace kineticEngine
