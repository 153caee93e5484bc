#pragma once

#include "BulletShapeBuilder.hpp"
#include "../PhysicsTypes.hpp"

#include <btBulletDynamicsCommon.h>
#include <BulletCollision/CollisionDispatch/btGhostObject.h>
#include <memory>
#include <utility>

namespace kineticEngine {

    /// Named activation flags, folded into one Bullet activation state.
    struct ActivationFlags {
        bool awake = true;
        bool awakeAlways = false;
        bool enabled = true;

        int toActivationState() const {
            if (!enabled) return DISABLE_SIMULATION;
            if (awakeAlways) return DISABLE_DEACTIVATION;
            if (!awake) return ISLAND_SLEEPING;
            return ACTIVE_TAG;
        }
    };

    /**
     * @brief One tracked backend object: a rigid body or a sensor ghost
     *
     * Owns the collision object together with its compound shape, motion
     * state and user-pointer targets. Dynamics-only accessors return null
     * for ghosts.
     */
    class SimulationObject {
    public:
        enum class Kind {
            RigidBody,
            Ghost
        };

        SimulationObject(std::unique_ptr<btRigidBody> body, std::unique_ptr<btMotionState> motionState,
                         BulletCompound shape, std::unique_ptr<BodySource> bodySource, const ActivationFlags& flags)
            : _kind(Kind::RigidBody),
              _activation(flags),
              _shape(std::move(shape)),
              _motionState(std::move(motionState)),
              _bodySource(std::move(bodySource)),
              _object(std::move(body)) {}

        SimulationObject(std::unique_ptr<btGhostObject> ghost, BulletCompound shape,
                         std::unique_ptr<BodySource> bodySource, const ActivationFlags& flags)
            : _kind(Kind::Ghost),
              _activation(flags),
              _shape(std::move(shape)),
              _bodySource(std::move(bodySource)),
              _object(std::move(ghost)) {}

        SimulationObject(const SimulationObject&) = delete;
        SimulationObject& operator=(const SimulationObject&) = delete;

        Kind kind() const { return _kind; }
        btCollisionObject* collisionObject() const { return _object.get(); }

        btRigidBody* asRigidBody() const {
            return _kind == Kind::RigidBody ? static_cast<btRigidBody*>(_object.get()) : nullptr;
        }

        btGhostObject* asGhost() const {
            return _kind == Kind::Ghost ? static_cast<btGhostObject*>(_object.get()) : nullptr;
        }

        const BodySource& bodySource() const { return *_bodySource; }
        const BulletCompound& shape() const { return _shape; }

        ActivationFlags& activation() { return _activation; }
        const ActivationFlags& activation() const { return _activation; }

    private:
        Kind _kind;
        ActivationFlags _activation;
        BulletCompound _shape;
        std::unique_ptr<btMotionState> _motionState;
        std::unique_ptr<BodySource> _bodySource;
        // Declared last so it is destroyed before the shape it references
        std::unique_ptr<btCollisionObject> _object;
    };

}
