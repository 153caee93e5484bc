/**
 * @file BulletPhysicEngine.hpp
 * @brief Bullet3-based physics simulation module
 *
 * @details Applies PhysicsMessage commands to a Bullet world, steps it and
 * reports the transform of every awake dynamic body. Messages are either
 * queued until the next integrate() call or, when the engine is built with
 * immediate messages, applied as soon as they are enqueued.
 *
 * @section step Integration Step
 * 1. Apply the batch in order (rebuild suppression ends with the batch)
 * 2. Resolve the step delta from the configured frame rate
 * 3. stepSimulation() once
 * 4. One BodyTransformMessage per body that is neither asleep nor static
 *
 * @see PhysicsMessages.hpp for the message reference
 */

#pragma once

#include "../IPhysicEngine.hpp"
#include "../../../core/PhysicsConfig.hpp"
#include "BulletWorld.hpp"
#include "BulletBodyManager.hpp"

#include <btBulletDynamicsCommon.h>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace kineticEngine {

class BulletPhysicEngine : public IPhysicEngine {
  public:
    explicit BulletPhysicEngine(const PhysicsConfig& config = PhysicsConfig());
    ~BulletPhysicEngine() override;

    BulletPhysicEngine(const BulletPhysicEngine&) = delete;
    BulletPhysicEngine& operator=(const BulletPhysicEngine&) = delete;

    void init();
    void cleanup();

    void enqueueMessage(const PhysicsMessage& message) override;
    std::vector<PhysicsMessage> popMessages() override;
    void clearMessages() override;

    std::vector<IntegrationMessage> integrate(const StepTime& stepTime,
                                              const std::vector<PhysicsMessage>& messages) override;

    bool bodyExists(const PhysicsId& physicsId) const override;
    Vec3 getBodyLinearVelocity(const PhysicsId& physicsId) const override;

    std::vector<Vec3> getBodyContactNormals(const PhysicsId& physicsId) const override;
    std::vector<Vec3> getBodyToGroundContactNormals(const PhysicsId& physicsId) const override;
    std::optional<Vec3> getBodyToGroundContactNormalOpt(const PhysicsId& physicsId) const override;
    std::optional<Vec3> getBodyToGroundContactTangentOpt(const PhysicsId& physicsId) const override;
    bool isBodyOnGround(const PhysicsId& physicsId) const override;

    bool isImmediate() const { return _immediate; }
    std::size_t pendingCount() const { return _pending.size(); }
    const BulletBodyManager& bodies() const { return *_bodyManager; }

    /// Seconds to advance for one step; throws std::logic_error on a frame rate mismatch.
    float resolveStepAmount(const StepTime& stepTime) const;

    /// Pairwise running fold (a + b) / 2, not a true mean once there are more than two normals.
    static std::optional<Vec3> foldContactNormals(const std::vector<Vec3>& normals);

  private:
    void handleMessages(const std::vector<PhysicsMessage>& messages);
    void handleMessage(const PhysicsMessage& message);
    void rebuild();
    void createIntegrationMessages();
    std::vector<IntegrationMessage> drainIntegrationMessages();

    const bool _immediate;
    const FrameRate _frameRate;
    const int _maxSubSteps;
    const Vec3 _gravity;

    // The world must outlive the objects registered in it
    std::unique_ptr<BulletWorld> _bulletWorld;
    std::unique_ptr<BulletBodyManager> _bodyManager;

    std::vector<PhysicsMessage> _pending;

    std::mutex _integrationMutex;
    std::deque<IntegrationMessage> _integrationMessages;
};

} // namespace kineticEngine
