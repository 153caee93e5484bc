#include "BulletBodyManager.hpp"
#include "BulletConversions.hpp"
#include "../../../core/Logger.hpp"

#include <stdexcept>
#include <type_traits>
#include <variant>

namespace kineticEngine {

    BulletBodyManager::BulletBodyManager(btDiscreteDynamicsWorld* world)
        : _dynamicsWorld(world) {}

    BulletBodyManager::~BulletBodyManager() {
        clear();
    }

    void BulletBodyManager::clear() {
        for (auto& pair : _joints) {
            if (pair.second.inWorld) {
                _dynamicsWorld->removeConstraint(pair.second.constraint.get());
            }
        }
        _joints.clear();

        for (auto& pair : _ghosts) {
            _dynamicsWorld->removeCollisionObject(pair.second->collisionObject());
        }
        _ghosts.clear();

        for (auto& pair : _bodies) {
            _dynamicsWorld->removeRigidBody(pair.second.object->asRigidBody());
        }
        _bodies.clear();

        _objects.clear();
    }

    // ---------------------------------------------------------------------
    // Configuration
    // ---------------------------------------------------------------------

    void BulletBodyManager::configureCollisionObject(const BodyProperties& bodyProperties, btCollisionObject& object) {
        ActivationFlags flags{bodyProperties.awake, bodyProperties.awakeAlways, bodyProperties.enabled};
        object.forceActivationState(flags.toActivationState());

        object.setFriction(bodyProperties.friction);
        object.setRestitution(bodyProperties.restitution);

        if (auto* continuous = std::get_if<Continuous>(&bodyProperties.collisionDetection)) {
            object.setCcdMotionThreshold(continuous->continuousMotionThreshold);
            object.setCcdSweptSphereRadius(continuous->sweptSphereRadius);
        } else {
            object.setCcdMotionThreshold(0.0f);
            object.setCcdSweptSphereRadius(0.0f);
        }

        int collisionFlags = object.getCollisionFlags() & ~(btCollisionObject::CF_STATIC_OBJECT | btCollisionObject::CF_KINEMATIC_OBJECT);
        switch (bodyProperties.bodyType) {
            case BodyType::Static: collisionFlags |= btCollisionObject::CF_STATIC_OBJECT; break;
            case BodyType::Kinematic: collisionFlags |= btCollisionObject::CF_KINEMATIC_OBJECT; break;
            case BodyType::Dynamic: break;
        }
        object.setCollisionFlags(collisionFlags);
    }

    void BulletBodyManager::configureBody(const BodyProperties& bodyProperties, btRigidBody& body, const btVector3& worldGravity) {
        configureCollisionObject(bodyProperties, body);

        btTransform transform = toBullet(bodyProperties.center, bodyProperties.rotation);
        body.setCenterOfMassTransform(transform);
        if (body.getMotionState()) {
            body.getMotionState()->setWorldTransform(transform);
        }

        body.setLinearVelocity(toBullet(bodyProperties.linearVelocity));
        body.setAngularVelocity(toBullet(bodyProperties.angularVelocity));
        body.setAngularFactor(toBullet(bodyProperties.angularFactor));
        body.setDamping(bodyProperties.linearDamping, bodyProperties.angularDamping);

        // Overridden bodies must not be reset by later world gravity changes
        if (bodyProperties.gravityOverrideOpt) {
            body.setFlags(body.getFlags() | BT_DISABLE_WORLD_GRAVITY);
            body.setGravity(toBullet(*bodyProperties.gravityOverrideOpt));
        } else {
            body.setFlags(body.getFlags() & ~BT_DISABLE_WORLD_GRAVITY);
            body.setGravity(worldGravity);
        }
    }

    // ---------------------------------------------------------------------
    // Bodies
    // ---------------------------------------------------------------------

    void BulletBodyManager::createBody(const std::string& sourceSimulant, uint64_t sourceId, const BodyProperties& bodyProperties) {
        PhysicsId physicsId{sourceId, bodyProperties.bodyId};

        if (_objects.contains(physicsId)) {
            Logger::Debug("[BulletBodyManager] Could not add body with duplicate PhysicsId = " + physicsId.toString() + ".");
            return;
        }

        // The sensor flag selects the dynamic path; everything else is an overlap-only ghost
        if (bodyProperties.sensor) {
            createRigidBody(physicsId, sourceSimulant, bodyProperties);
        } else {
            createGhost(physicsId, sourceSimulant, bodyProperties);
        }
    }

    void BulletBodyManager::createRigidBody(const PhysicsId& physicsId, const std::string& sourceSimulant, const BodyProperties& bodyProperties) {
        BulletCompound shape = BulletShapeBuilder::build(sourceSimulant, bodyProperties);

        // Bullet treats zero mass as static; kinematic bodies are moved by hand
        btScalar mass = bodyProperties.bodyType == BodyType::Dynamic ? shape.mass : 0.0f;
        btVector3 localInertia(0, 0, 0);
        if (mass != 0.f) {
            shape.compound->calculateLocalInertia(mass, localInertia);
        }

        auto motionState = std::make_unique<btDefaultMotionState>(toBullet(bodyProperties.center, bodyProperties.rotation));
        btRigidBody::btRigidBodyConstructionInfo rbInfo(mass, motionState.get(), shape.compound.get(), localInertia);
        auto body = std::make_unique<btRigidBody>(rbInfo);

        auto bodySource = std::make_unique<BodySource>();
        bodySource->simulant = sourceSimulant;
        bodySource->bodyId = bodyProperties.bodyId;
        body->setUserPointer(bodySource.get());

        configureBody(bodyProperties, *body, _dynamicsWorld->getGravity());
        _dynamicsWorld->addRigidBody(body.get(), bodyProperties.collisionCategories, bodyProperties.collisionMask);

        ActivationFlags flags{bodyProperties.awake, bodyProperties.awakeAlways, bodyProperties.enabled};
        auto object = std::make_unique<SimulationObject>(std::move(body), std::move(motionState), std::move(shape), std::move(bodySource), flags);
        SimulationObject* raw = object.get();
        _objects.tryAdd(physicsId, std::move(object));
        _bodies.tryAdd(physicsId, BodyEntry{bodyProperties.gravityOverrideOpt, raw});

        Logger::Debug("[BulletBodyManager] Created body " + physicsId.toString() + " (Mass: " + std::to_string(mass) + ")");
    }

    void BulletBodyManager::createGhost(const PhysicsId& physicsId, const std::string& sourceSimulant, const BodyProperties& bodyProperties) {
        BulletCompound shape = BulletShapeBuilder::build(sourceSimulant, bodyProperties);

        auto ghost = std::make_unique<btGhostObject>();
        ghost->setCollisionShape(shape.compound.get());
        ghost->setWorldTransform(toBullet(bodyProperties.center, bodyProperties.rotation));
        ghost->setCollisionFlags(ghost->getCollisionFlags() & ~btCollisionObject::CF_NO_CONTACT_RESPONSE);
        configureCollisionObject(bodyProperties, *ghost);

        auto bodySource = std::make_unique<BodySource>();
        bodySource->simulant = sourceSimulant;
        bodySource->bodyId = bodyProperties.bodyId;
        ghost->setUserPointer(bodySource.get());

        _dynamicsWorld->addCollisionObject(ghost.get(), bodyProperties.collisionCategories, bodyProperties.collisionMask);

        ActivationFlags flags{bodyProperties.awake, bodyProperties.awakeAlways, bodyProperties.enabled};
        auto object = std::make_unique<SimulationObject>(std::move(ghost), std::move(shape), std::move(bodySource), flags);
        SimulationObject* raw = object.get();
        _objects.tryAdd(physicsId, std::move(object));
        _ghosts.tryAdd(physicsId, raw);

        Logger::Debug("[BulletBodyManager] Created ghost " + physicsId.toString());
    }

    void BulletBodyManager::destroyBody(const PhysicsId& physicsId) {
        auto* owned = _objects.find(physicsId);
        if (!owned) {
            if (!_rebuilding) {
                Logger::Debug("[BulletBodyManager] Could not destroy non-existent body with PhysicsId = " + physicsId.toString() + ".");
            }
            return;
        }

        SimulationObject* object = owned->get();
        if (btRigidBody* body = object->asRigidBody()) {
            detachJointsOf(body);
            _dynamicsWorld->removeRigidBody(body);
            _bodies.erase(physicsId);
        } else {
            _dynamicsWorld->removeCollisionObject(object->collisionObject());
            _ghosts.erase(physicsId);
        }
        _objects.erase(physicsId);

        Logger::Debug("[BulletBodyManager] Destroyed body " + physicsId.toString());
    }

    // ---------------------------------------------------------------------
    // Joints
    // ---------------------------------------------------------------------

    void BulletBodyManager::createJoint(uint64_t sourceId, const JointProperties& jointProperties) {
        std::visit([this, sourceId, &jointProperties](const auto& device) {
            using T = std::decay_t<decltype(device)>;
            if constexpr (std::is_same_v<T, JointAngle>) {
                createHinge(sourceId, jointProperties.jointId, device);
            } else if constexpr (std::is_same_v<T, JointEmpty>) {
                // nothing to create
            } else {
                throw std::logic_error("[BulletBodyManager] Unsupported joint device for joint " +
                                       PhysicsId{sourceId, jointProperties.jointId}.toString());
            }
        }, jointProperties.jointDevice);
    }

    void BulletBodyManager::createHinge(uint64_t sourceId, uint64_t jointId, const JointAngle& jointAngle) {
        const BodyEntry* entryA = _bodies.find(jointAngle.targetId);
        const BodyEntry* entryB = _bodies.find(jointAngle.targetId2);
        if (!entryA || !entryB) {
            Logger::Debug("[BulletBodyManager] Could not create a joint for one or more non-existent bodies.");
            return;
        }

        PhysicsId physicsId{sourceId, jointId};
        if (_joints.contains(physicsId)) {
            Logger::Debug("[BulletBodyManager] Could not add joint with duplicate PhysicsId = " + physicsId.toString() + ".");
            return;
        }

        auto hinge = std::make_unique<btHingeConstraint>(
            *entryA->object->asRigidBody(), *entryB->object->asRigidBody(),
            toBullet(jointAngle.anchor), toBullet(jointAngle.anchor2),
            toBullet(jointAngle.axis), toBullet(jointAngle.axis2));
        hinge->setLimit(jointAngle.angleMin, jointAngle.angleMax, jointAngle.softness, jointAngle.biasFactor, jointAngle.relaxationFactor);
        hinge->setBreakingImpulseThreshold(jointAngle.breakImpulseThreshold);
        _dynamicsWorld->addConstraint(hinge.get());
        _joints.tryAdd(physicsId, JointEntry{std::move(hinge), true});

        Logger::Debug("[BulletBodyManager] Created joint " + physicsId.toString());
    }

    void BulletBodyManager::destroyJoint(const PhysicsId& physicsId) {
        JointEntry* entry = _joints.find(physicsId);
        if (!entry) {
            if (!_rebuilding) {
                Logger::Debug("[BulletBodyManager] Could not destroy non-existent joint with PhysicsId = " + physicsId.toString() + ".");
            }
            return;
        }

        if (entry->inWorld) {
            _dynamicsWorld->removeConstraint(entry->constraint.get());
        }
        _joints.erase(physicsId);
    }

    bool BulletBodyManager::isJointInWorld(const PhysicsId& physicsId) const {
        const JointEntry* entry = _joints.find(physicsId);
        return entry && entry->inWorld;
    }

    // A joint whose endpoint goes away stays tracked until the caller destroys
    // it, but it no longer takes part in the simulation.
    void BulletBodyManager::detachJointsOf(const btRigidBody* body) {
        for (auto& pair : _joints) {
            JointEntry& entry = pair.second;
            if (!entry.inWorld) continue;

            btTypedConstraint* constraint = entry.constraint.get();
            if (&constraint->getRigidBodyA() == body || &constraint->getRigidBodyB() == body) {
                _dynamicsWorld->removeConstraint(constraint);
                entry.inWorld = false;
                Logger::Debug("[BulletBodyManager] Joint " + pair.first.toString() + " detached; one of its bodies was destroyed.");
            }
        }
    }

    // ---------------------------------------------------------------------
    // Per-field updates
    // ---------------------------------------------------------------------

    SimulationObject* BulletBodyManager::findObject(const PhysicsId& physicsId, const char* operation) const {
        auto* owned = _objects.find(physicsId);
        if (!owned) {
            Logger::Debug(std::string("[BulletBodyManager] Could not ") + operation + " of non-existent body with PhysicsId = " + physicsId.toString() + ".");
            return nullptr;
        }
        return owned->get();
    }

    const SimulationObject* BulletBodyManager::getObject(const PhysicsId& physicsId) const {
        auto* owned = _objects.find(physicsId);
        return owned ? owned->get() : nullptr;
    }

    btRigidBody* BulletBodyManager::getBody(const PhysicsId& physicsId) const {
        const BodyEntry* entry = _bodies.find(physicsId);
        return entry ? entry->object->asRigidBody() : nullptr;
    }

    void BulletBodyManager::setBodyEnabled(const PhysicsId& physicsId, bool enabled) {
        SimulationObject* object = findObject(physicsId, "set enabled");
        if (!object) return;

        ActivationFlags& flags = object->activation();
        flags.enabled = enabled;
        if (enabled) {
            flags.awake = true;
        }
        object->collisionObject()->forceActivationState(flags.toActivationState());
    }

    void BulletBodyManager::setBodyCenter(const PhysicsId& physicsId, const Vec3& center) {
        SimulationObject* object = findObject(physicsId, "set center");
        if (!object) return;

        btTransform trans = object->collisionObject()->getWorldTransform();
        trans.setOrigin(toBullet(center));

        if (btRigidBody* body = object->asRigidBody()) {
            body->setCenterOfMassTransform(trans);
            if (body->getMotionState()) {
                body->getMotionState()->setWorldTransform(trans);
            }
            body->activate(true);
        } else {
            object->collisionObject()->setWorldTransform(trans);
        }
    }

    void BulletBodyManager::setBodyRotation(const PhysicsId& physicsId, const Quat& rotation) {
        SimulationObject* object = findObject(physicsId, "set rotation");
        if (!object) return;

        btTransform trans = object->collisionObject()->getWorldTransform();
        trans.setRotation(toBullet(rotation));

        if (btRigidBody* body = object->asRigidBody()) {
            body->setCenterOfMassTransform(trans);
            if (body->getMotionState()) {
                body->getMotionState()->setWorldTransform(trans);
            }
            body->activate(true);
        } else {
            object->collisionObject()->setWorldTransform(trans);
        }
    }

    void BulletBodyManager::setBodyLinearVelocity(const PhysicsId& physicsId, const Vec3& velocity) {
        SimulationObject* object = findObject(physicsId, "set linear velocity");
        if (!object) return;

        if (btRigidBody* body = object->asRigidBody()) {
            body->activate(true);
            body->setLinearVelocity(toBullet(velocity));
        }
    }

    void BulletBodyManager::setBodyAngularVelocity(const PhysicsId& physicsId, const Vec3& velocity) {
        SimulationObject* object = findObject(physicsId, "set angular velocity");
        if (!object) return;

        if (btRigidBody* body = object->asRigidBody()) {
            body->activate(true);
            body->setAngularVelocity(toBullet(velocity));
        }
    }

    void BulletBodyManager::applyBodyLinearImpulse(const PhysicsId& physicsId, const Vec3& impulse, const Vec3& offset) {
        SimulationObject* object = findObject(physicsId, "apply linear impulse");
        if (!object) return;

        if (btRigidBody* body = object->asRigidBody()) {
            body->activate(true);
            body->applyImpulse(toBullet(impulse), toBullet(offset));
        }
    }

    void BulletBodyManager::applyBodyAngularImpulse(const PhysicsId& physicsId, const Vec3& impulse) {
        SimulationObject* object = findObject(physicsId, "apply angular impulse");
        if (!object) return;

        if (btRigidBody* body = object->asRigidBody()) {
            body->activate(true);
            body->applyTorqueImpulse(toBullet(impulse));
        }
    }

    void BulletBodyManager::applyBodyForce(const PhysicsId& physicsId, const Vec3& force, const Vec3& offset) {
        SimulationObject* object = findObject(physicsId, "apply force");
        if (!object) return;

        if (btRigidBody* body = object->asRigidBody()) {
            body->activate(true);
            body->applyForce(toBullet(force), toBullet(offset));
        }
    }

    void BulletBodyManager::applyBodyTorque(const PhysicsId& physicsId, const Vec3& torque) {
        SimulationObject* object = findObject(physicsId, "apply torque");
        if (!object) return;

        if (btRigidBody* body = object->asRigidBody()) {
            body->activate(true);
            body->applyTorque(toBullet(torque));
        }
    }

    void BulletBodyManager::setGravity(const Vec3& gravity) {
        _dynamicsWorld->setGravity(toBullet(gravity));

        // The world only pushes gravity to active bodies; sleeping ones are set here too
        for (auto& pair : _bodies) {
            btRigidBody* body = pair.second.object->asRigidBody();
            if (pair.second.gravityOverride) {
                body->setGravity(toBullet(*pair.second.gravityOverride));
            } else {
                body->setGravity(toBullet(gravity));
            }
        }
    }

}
