#include "BulletPhysicEngine.hpp"
#include "BulletConversions.hpp"
#include "../../../core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace kineticEngine {

BulletPhysicEngine::BulletPhysicEngine(const PhysicsConfig& config)
    : _immediate(config.immediateMessages),
      _frameRate(config.frameRate),
      _maxSubSteps(config.maxSubSteps),
      _gravity(config.gravity) {
    validatePhysicsConfig(config);
    init();
}

BulletPhysicEngine::~BulletPhysicEngine() {
    cleanup();
}

void BulletPhysicEngine::init() {
    if (_bulletWorld) return;

    _bulletWorld = std::make_unique<BulletWorld>();
    _bulletWorld->init(toBullet(_gravity));
    _bodyManager = std::make_unique<BulletBodyManager>(_bulletWorld->getWorld());

    Logger::Info(std::string("[BulletPhysicEngine] Initialized (") + (_immediate ? "immediate" : "deferred") +
                 " messages, gravity " + _gravity.toString() + ")");
}

void BulletPhysicEngine::cleanup() {
    // Objects first, the world they live in last
    _bodyManager.reset();
    _bulletWorld.reset();
    _pending.clear();

    std::lock_guard<std::mutex> lock(_integrationMutex);
    _integrationMessages.clear();
}

// ---------------------------------------------------------------------------
// Message queue
// ---------------------------------------------------------------------------

void BulletPhysicEngine::enqueueMessage(const PhysicsMessage& message) {
    if (_immediate) {
        handleMessages({message});
    } else {
        _pending.push_back(message);
    }
}

std::vector<PhysicsMessage> BulletPhysicEngine::popMessages() {
    std::vector<PhysicsMessage> messages;
    messages.swap(_pending);
    return messages;
}

void BulletPhysicEngine::clearMessages() {
    _pending.clear();
}

void BulletPhysicEngine::handleMessages(const std::vector<PhysicsMessage>& messages) {
    try {
        for (const auto& message : messages) {
            handleMessage(message);
        }
    } catch (...) {
        _bodyManager->setRebuilding(false);
        throw;
    }
    _bodyManager->setRebuilding(false);
}

void BulletPhysicEngine::handleMessage(const PhysicsMessage& message) {
    BulletBodyManager& manager = *_bodyManager;

    std::visit([this, &manager](const auto& msg) {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, CreateBodyMessage>) {
            manager.createBody(msg.sourceSimulant, msg.sourceId, msg.bodyProperties);
        } else if constexpr (std::is_same_v<T, CreateBodiesMessage>) {
            for (const auto& bodyProperties : msg.bodiesProperties) {
                manager.createBody(msg.sourceSimulant, msg.sourceId, bodyProperties);
            }
        } else if constexpr (std::is_same_v<T, DestroyBodyMessage>) {
            manager.destroyBody(msg.physicsId);
        } else if constexpr (std::is_same_v<T, DestroyBodiesMessage>) {
            for (const auto& physicsId : msg.physicsIds) {
                manager.destroyBody(physicsId);
            }
        } else if constexpr (std::is_same_v<T, CreateJointMessage>) {
            manager.createJoint(msg.sourceId, msg.jointProperties);
        } else if constexpr (std::is_same_v<T, CreateJointsMessage>) {
            for (const auto& jointProperties : msg.jointsProperties) {
                manager.createJoint(msg.sourceId, jointProperties);
            }
        } else if constexpr (std::is_same_v<T, DestroyJointMessage>) {
            manager.destroyJoint(msg.physicsId);
        } else if constexpr (std::is_same_v<T, DestroyJointsMessage>) {
            for (const auto& physicsId : msg.physicsIds) {
                manager.destroyJoint(physicsId);
            }
        } else if constexpr (std::is_same_v<T, SetBodyEnabledMessage>) {
            manager.setBodyEnabled(msg.physicsId, msg.enabled);
        } else if constexpr (std::is_same_v<T, SetBodyCenterMessage>) {
            manager.setBodyCenter(msg.physicsId, msg.center);
        } else if constexpr (std::is_same_v<T, SetBodyRotationMessage>) {
            manager.setBodyRotation(msg.physicsId, msg.rotation);
        } else if constexpr (std::is_same_v<T, SetBodyLinearVelocityMessage>) {
            manager.setBodyLinearVelocity(msg.physicsId, msg.linearVelocity);
        } else if constexpr (std::is_same_v<T, SetBodyAngularVelocityMessage>) {
            manager.setBodyAngularVelocity(msg.physicsId, msg.angularVelocity);
        } else if constexpr (std::is_same_v<T, ApplyBodyLinearImpulseMessage>) {
            manager.applyBodyLinearImpulse(msg.physicsId, msg.linearImpulse, msg.offset);
        } else if constexpr (std::is_same_v<T, ApplyBodyAngularImpulseMessage>) {
            manager.applyBodyAngularImpulse(msg.physicsId, msg.angularImpulse);
        } else if constexpr (std::is_same_v<T, ApplyBodyForceMessage>) {
            manager.applyBodyForce(msg.physicsId, msg.force, msg.offset);
        } else if constexpr (std::is_same_v<T, ApplyBodyTorqueMessage>) {
            manager.applyBodyTorque(msg.physicsId, msg.torque);
        } else if constexpr (std::is_same_v<T, SetGravityMessage>) {
            manager.setGravity(msg.gravity);
        } else if constexpr (std::is_same_v<T, RebuildPhysicsHackMessage>) {
            rebuild();
        }
    }, message);
}

void BulletPhysicEngine::rebuild() {
    Logger::Debug("[BulletPhysicEngine] Rebuilding: dropping " + std::to_string(_bodyManager->objectCount()) +
                  " objects and " + std::to_string(_bodyManager->jointCount()) + " joints");

    _bodyManager->setRebuilding(true);
    _bodyManager->clear();

    std::lock_guard<std::mutex> lock(_integrationMutex);
    _integrationMessages.clear();
}

// ---------------------------------------------------------------------------
// Integration
// ---------------------------------------------------------------------------

float BulletPhysicEngine::resolveStepAmount(const StepTime& stepTime) const {
    if (auto* rate = std::get_if<StaticFrameRate>(&_frameRate)) {
        if (auto* updateTime = std::get_if<UpdateTime>(&stepTime)) {
            return static_cast<float>(updateTime->ticks) / static_cast<float>(rate->ticksPerSecond);
        }
        throw std::logic_error("[BulletPhysicEngine] Static frame rate requires an UpdateTime step.");
    }

    if (auto* clockTime = std::get_if<ClockTime>(&stepTime)) {
        return clockTime->seconds;
    }
    throw std::logic_error("[BulletPhysicEngine] Dynamic frame rate requires a ClockTime step.");
}

std::vector<IntegrationMessage> BulletPhysicEngine::integrate(const StepTime& stepTime,
                                                              const std::vector<PhysicsMessage>& messages) {
    handleMessages(messages);

    float stepAmount = resolveStepAmount(stepTime);
    if (stepAmount > 0.0f) {
        float fixedTimeStep = stepAmount;
        if (auto* rate = std::get_if<StaticFrameRate>(&_frameRate)) {
            fixedTimeStep = 1.0f / static_cast<float>(rate->ticksPerSecond);
        }
        _bulletWorld->step(stepAmount, _maxSubSteps, fixedTimeStep);
    }

    createIntegrationMessages();
    return drainIntegrationMessages();
}

void BulletPhysicEngine::createIntegrationMessages() {
    std::lock_guard<std::mutex> lock(_integrationMutex);

    for (const auto& pair : _bodyManager->getBodies()) {
        btRigidBody* body = pair.second.object->asRigidBody();
        // Sleeping and about-to-sleep bodies both carry the ISLAND_SLEEPING bit
        if ((body->getActivationState() & ISLAND_SLEEPING) != 0 || body->isStaticObject()) continue;

        btTransform trans;
        if (body->getMotionState()) {
            body->getMotionState()->getWorldTransform(trans);
        } else {
            trans = body->getWorldTransform();
        }

        BodyTransformMessage message;
        message.bodySource = *static_cast<const BodySource*>(body->getUserPointer());
        message.center = fromBullet(trans.getOrigin());
        message.rotation = fromBullet(trans.getRotation());
        message.linearVelocity = fromBullet(body->getLinearVelocity());
        message.angularVelocity = fromBullet(body->getAngularVelocity());
        _integrationMessages.push_back(message);
    }
}

std::vector<IntegrationMessage> BulletPhysicEngine::drainIntegrationMessages() {
    std::deque<IntegrationMessage> drained;
    {
        std::lock_guard<std::mutex> lock(_integrationMutex);
        drained.swap(_integrationMessages);
    }
    return std::vector<IntegrationMessage>(std::make_move_iterator(drained.begin()),
                                           std::make_move_iterator(drained.end()));
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool BulletPhysicEngine::bodyExists(const PhysicsId& physicsId) const {
    return _bodyManager->hasObject(physicsId);
}

Vec3 BulletPhysicEngine::getBodyLinearVelocity(const PhysicsId& physicsId) const {
    const SimulationObject* object = _bodyManager->getObject(physicsId);
    if (!object) {
        throw std::runtime_error("[BulletPhysicEngine] Body with PhysicsId = " + physicsId.toString() + " not found.");
    }
    if (btRigidBody* body = object->asRigidBody()) {
        return fromBullet(body->getLinearVelocity());
    }
    return Vec3::zero();
}

std::vector<Vec3> BulletPhysicEngine::getBodyContactNormals(const PhysicsId& physicsId) const {
    std::vector<Vec3> normals;
    const SimulationObject* object = _bodyManager->getObject(physicsId);
    if (!object) return normals;

    const btCollisionObject* collisionObject = object->collisionObject();
    btCollisionDispatcher* dispatcher = _bulletWorld->getDispatcher();
    int numManifolds = dispatcher->getNumManifolds();
    for (int i = 0; i < numManifolds; i++) {
        btPersistentManifold* contactManifold = dispatcher->getManifoldByIndexInternal(i);
        if (!contactManifold || contactManifold->getBody0() != collisionObject) continue;

        int numContacts = contactManifold->getNumContacts();
        for (int j = 0; j < numContacts; j++) {
            const btManifoldPoint& pt = contactManifold->getContactPoint(j);
            normals.push_back(fromBullet(pt.m_normalWorldOnB));
        }
    }
    return normals;
}

std::vector<Vec3> BulletPhysicEngine::getBodyToGroundContactNormals(const PhysicsId& physicsId) const {
    const float groundAngleMax = static_cast<float>(M_PI) * 0.25f;
    const Vec3 up = Vec3::up();

    std::vector<Vec3> groundNormals;
    for (const auto& normal : getBodyContactNormals(physicsId)) {
        float cosine = std::max(-1.0f, std::min(1.0f, normal.dot(up)));
        if (std::acos(cosine) < groundAngleMax) {
            groundNormals.push_back(normal);
        }
    }
    return groundNormals;
}

std::optional<Vec3> BulletPhysicEngine::foldContactNormals(const std::vector<Vec3>& normals) {
    if (normals.empty()) return std::nullopt;

    Vec3 averageNormal = normals.front();
    for (std::size_t i = 1; i < normals.size(); i++) {
        averageNormal = (averageNormal + normals[i]) * 0.5f;
    }
    return averageNormal;
}

std::optional<Vec3> BulletPhysicEngine::getBodyToGroundContactNormalOpt(const PhysicsId& physicsId) const {
    return foldContactNormals(getBodyToGroundContactNormals(physicsId));
}

std::optional<Vec3> BulletPhysicEngine::getBodyToGroundContactTangentOpt(const PhysicsId& physicsId) const {
    std::optional<Vec3> normal = getBodyToGroundContactNormalOpt(physicsId);
    if (!normal) return std::nullopt;
    return Vec3::forward().cross(*normal);
}

bool BulletPhysicEngine::isBodyOnGround(const PhysicsId& physicsId) const {
    return !getBodyToGroundContactNormals(physicsId).empty();
}

} // namespace kineticEngine
