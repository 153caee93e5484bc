#pragma once

#include "SimulationObject.hpp"
#include "../PhysicsTypes.hpp"
#include "../../../types/OrderedMap.hpp"

#include <btBulletDynamicsCommon.h>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace kineticEngine {

    /**
     * @brief Creates, tracks and mutates backend objects by PhysicsId
     *
     * Every live object is owned by the objects map and referenced from
     * exactly one of the bodies or ghosts maps. All maps iterate in
     * insertion order. Lookups on unknown ids are logged at debug level
     * and otherwise ignored.
     */
    class BulletBodyManager {
    public:
        struct BodyEntry {
            std::optional<Vec3> gravityOverride;
            SimulationObject* object;
        };

        struct JointEntry {
            std::unique_ptr<btTypedConstraint> constraint;
            // False once an endpoint body was destroyed under the joint
            bool inWorld;
        };

        explicit BulletBodyManager(btDiscreteDynamicsWorld* world);
        ~BulletBodyManager();

        BulletBodyManager(const BulletBodyManager&) = delete;
        BulletBodyManager& operator=(const BulletBodyManager&) = delete;

        void createBody(const std::string& sourceSimulant, uint64_t sourceId, const BodyProperties& bodyProperties);
        void destroyBody(const PhysicsId& physicsId);

        /// @throws std::logic_error for a joint device this backend does not know
        void createJoint(uint64_t sourceId, const JointProperties& jointProperties);
        void destroyJoint(const PhysicsId& physicsId);

        /// Removes every joint, ghost and body from the world.
        void clear();

        void setBodyEnabled(const PhysicsId& physicsId, bool enabled);
        void setBodyCenter(const PhysicsId& physicsId, const Vec3& center);
        void setBodyRotation(const PhysicsId& physicsId, const Quat& rotation);
        void setBodyLinearVelocity(const PhysicsId& physicsId, const Vec3& velocity);
        void setBodyAngularVelocity(const PhysicsId& physicsId, const Vec3& velocity);
        void applyBodyLinearImpulse(const PhysicsId& physicsId, const Vec3& impulse, const Vec3& offset);
        void applyBodyAngularImpulse(const PhysicsId& physicsId, const Vec3& impulse);
        void applyBodyForce(const PhysicsId& physicsId, const Vec3& force, const Vec3& offset);
        void applyBodyTorque(const PhysicsId& physicsId, const Vec3& torque);
        void setGravity(const Vec3& gravity);

        // Suppresses "not found" logs for destroy requests while set
        void setRebuilding(bool rebuilding) { _rebuilding = rebuilding; }
        bool isRebuilding() const { return _rebuilding; }

        const SimulationObject* getObject(const PhysicsId& physicsId) const;
        btRigidBody* getBody(const PhysicsId& physicsId) const;
        bool hasObject(const PhysicsId& physicsId) const { return _objects.contains(physicsId); }
        bool hasBody(const PhysicsId& physicsId) const { return _bodies.contains(physicsId); }
        bool hasGhost(const PhysicsId& physicsId) const { return _ghosts.contains(physicsId); }
        bool hasJoint(const PhysicsId& physicsId) const { return _joints.contains(physicsId); }
        bool isJointInWorld(const PhysicsId& physicsId) const;

        const OrderedMap<PhysicsId, BodyEntry, PhysicsIdHash>& getBodies() const { return _bodies; }
        std::size_t objectCount() const { return _objects.size(); }
        std::size_t ghostCount() const { return _ghosts.size(); }
        std::size_t jointCount() const { return _joints.size(); }

        static void configureCollisionObject(const BodyProperties& bodyProperties, btCollisionObject& object);
        static void configureBody(const BodyProperties& bodyProperties, btRigidBody& body, const btVector3& worldGravity);

    private:
        void createRigidBody(const PhysicsId& physicsId, const std::string& sourceSimulant, const BodyProperties& bodyProperties);
        void createGhost(const PhysicsId& physicsId, const std::string& sourceSimulant, const BodyProperties& bodyProperties);
        void createHinge(uint64_t sourceId, uint64_t jointId, const JointAngle& jointAngle);
        void detachJointsOf(const btRigidBody* body);
        SimulationObject* findObject(const PhysicsId& physicsId, const char* operation) const;

        btDiscreteDynamicsWorld* _dynamicsWorld; // Weak reference
        OrderedMap<PhysicsId, std::unique_ptr<SimulationObject>, PhysicsIdHash> _objects;
        OrderedMap<PhysicsId, BodyEntry, PhysicsIdHash> _bodies;
        OrderedMap<PhysicsId, SimulationObject*, PhysicsIdHash> _ghosts;
        OrderedMap<PhysicsId, JointEntry, PhysicsIdHash> _joints;
        bool _rebuilding = false;
    };
}
