#pragma once
#include <btBulletDynamicsCommon.h>
#include <BulletCollision/CollisionDispatch/btGhostObject.h>

namespace kineticEngine {
    class BulletWorld {
    public:
        BulletWorld();
        ~BulletWorld();

        BulletWorld(const BulletWorld&) = delete;
        BulletWorld& operator=(const BulletWorld&) = delete;

        void init(const btVector3& gravity);
        void cleanup();
        int step(float deltaTime, int maxSubSteps, float fixedTimeStep);

        btDiscreteDynamicsWorld* getWorld() const { return _dynamicsWorld; }
        btCollisionDispatcher* getDispatcher() const { return _dispatcher; }

    private:
        btDefaultCollisionConfiguration* _collisionConfiguration;
        btCollisionDispatcher* _dispatcher;
        btBroadphaseInterface* _overlappingPairCache;
        btGhostPairCallback* _ghostPairCallback;
        btSequentialImpulseConstraintSolver* _solver;
        btDiscreteDynamicsWorld* _dynamicsWorld;
    };
}
