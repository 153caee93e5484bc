#include "BulletWorld.hpp"

namespace kineticEngine {

    BulletWorld::BulletWorld()
        : _collisionConfiguration(nullptr),
          _dispatcher(nullptr),
          _overlappingPairCache(nullptr),
          _ghostPairCallback(nullptr),
          _solver(nullptr),
          _dynamicsWorld(nullptr) {}

    BulletWorld::~BulletWorld() {
        cleanup();
    }

    void BulletWorld::init(const btVector3& gravity) {
        _collisionConfiguration = new btDefaultCollisionConfiguration();
        _dispatcher = new btCollisionDispatcher(_collisionConfiguration);
        _overlappingPairCache = new btDbvtBroadphase();
        _solver = new btSequentialImpulseConstraintSolver;
        _dynamicsWorld = new btDiscreteDynamicsWorld(_dispatcher, _overlappingPairCache, _solver, _collisionConfiguration);

        // Ghosts only track their overlapping pairs with this callback installed
        _ghostPairCallback = new btGhostPairCallback();
        _overlappingPairCache->getOverlappingPairCache()->setInternalGhostPairCallback(_ghostPairCallback);

        _dynamicsWorld->setGravity(gravity);
        // Motion states report the transform of the last step, not one step behind
        _dynamicsWorld->setLatencyMotionStateInterpolation(false);
    }

    void BulletWorld::cleanup() {
        if (_dynamicsWorld) { delete _dynamicsWorld; _dynamicsWorld = nullptr; }
        if (_solver) { delete _solver; _solver = nullptr; }
        if (_overlappingPairCache) { delete _overlappingPairCache; _overlappingPairCache = nullptr; }
        if (_ghostPairCallback) { delete _ghostPairCallback; _ghostPairCallback = nullptr; }
        if (_dispatcher) { delete _dispatcher; _dispatcher = nullptr; }
        if (_collisionConfiguration) { delete _collisionConfiguration; _collisionConfiguration = nullptr; }
    }

    int BulletWorld::step(float deltaTime, int maxSubSteps, float fixedTimeStep) {
        if (!_dynamicsWorld) return 0;
        return _dynamicsWorld->stepSimulation(deltaTime, maxSubSteps, fixedTimeStep);
    }
}
