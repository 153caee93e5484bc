#include <gtest/gtest.h>
#include "../Bullet/BulletPhysicEngine.hpp"
#include "../../../core/Logger.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace kineticEngine {

namespace {
    const uint64_t kSource = 7;

    CreateBodyMessage createBox(uint64_t bodyId, const Vec3& center, const std::string& simulant = "Scene/Crate") {
        CreateBodyMessage message;
        message.sourceSimulant = simulant;
        message.sourceId = kSource;
        message.bodyProperties.bodyId = bodyId;
        message.bodyProperties.center = center;
        message.bodyProperties.bodyShape = BodyBox();
        message.bodyProperties.sensor = true;
        return message;
    }

    DestroyBodyMessage destroyBody(uint64_t bodyId) {
        DestroyBodyMessage message;
        message.sourceSimulant = "Scene/Crate";
        message.physicsId = PhysicsId{kSource, bodyId};
        return message;
    }

    PhysicsConfig staticConfig() {
        PhysicsConfig config;
        config.frameRate = StaticFrameRate{60};
        config.gravity = Vec3(0.0f, -9.8f, 0.0f);
        return config;
    }

    const BodyTransformMessage& asTransform(const IntegrationMessage& message) {
        return std::get<BodyTransformMessage>(message);
    }
}

class BulletPhysicEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        engine = std::make_unique<BulletPhysicEngine>(staticConfig());
    }

    void TearDown() override {
        engine.reset();
        Logger::setDebugEnabled(false);
    }

    std::vector<IntegrationMessage> tick(const std::vector<PhysicsMessage>& messages = {}) {
        return engine->integrate(UpdateTime{1}, messages);
    }

    std::unique_ptr<BulletPhysicEngine> engine;
};

// --- Message queue ---

TEST_F(BulletPhysicEngineTest, DeferredMessagesWaitForIntegrate) {
    engine->enqueueMessage(createBox(1, Vec3()));
    EXPECT_FALSE(engine->bodyExists(PhysicsId{kSource, 1}));
    EXPECT_EQ(engine->pendingCount(), 1u);

    std::vector<PhysicsMessage> batch = engine->popMessages();
    EXPECT_EQ(batch.size(), 1u);
    EXPECT_EQ(engine->pendingCount(), 0u);

    tick(batch);
    EXPECT_TRUE(engine->bodyExists(PhysicsId{kSource, 1}));
}

TEST_F(BulletPhysicEngineTest, PopPreservesArrivalOrder) {
    engine->enqueueMessage(createBox(1, Vec3()));
    engine->enqueueMessage(destroyBody(1));

    std::vector<PhysicsMessage> batch = engine->popMessages();
    ASSERT_EQ(batch.size(), 2u);
    EXPECT_TRUE(std::holds_alternative<CreateBodyMessage>(batch[0]));
    EXPECT_TRUE(std::holds_alternative<DestroyBodyMessage>(batch[1]));

    tick(batch);
    EXPECT_FALSE(engine->bodyExists(PhysicsId{kSource, 1}));
}

TEST_F(BulletPhysicEngineTest, ClearMessagesDiscardsPending) {
    engine->enqueueMessage(createBox(1, Vec3()));
    engine->clearMessages();

    EXPECT_TRUE(engine->popMessages().empty());
    tick(engine->popMessages());
    EXPECT_FALSE(engine->bodyExists(PhysicsId{kSource, 1}));
}

TEST_F(BulletPhysicEngineTest, ImmediateModeAppliesOnEnqueue) {
    PhysicsConfig config = staticConfig();
    config.immediateMessages = true;
    BulletPhysicEngine immediate(config);

    EXPECT_TRUE(immediate.isImmediate());
    immediate.enqueueMessage(createBox(1, Vec3()));
    EXPECT_TRUE(immediate.bodyExists(PhysicsId{kSource, 1}));
    EXPECT_EQ(immediate.pendingCount(), 0u);
    EXPECT_TRUE(immediate.popMessages().empty());
}

TEST_F(BulletPhysicEngineTest, BodyExistsOnlyBetweenCreateAndDestroy) {
    PhysicsId id{kSource, 1};
    EXPECT_FALSE(engine->bodyExists(id));
    tick({createBox(1, Vec3())});
    EXPECT_TRUE(engine->bodyExists(id));
    tick({destroyBody(1)});
    EXPECT_FALSE(engine->bodyExists(id));
}

TEST_F(BulletPhysicEngineTest, CreateBodiesAndDestroyBodies) {
    CreateBodiesMessage create;
    create.sourceSimulant = "Scene/Stack";
    create.sourceId = kSource;
    for (uint64_t i = 1; i <= 3; i++) {
        BodyProperties props;
        props.bodyId = i;
        props.center = Vec3(static_cast<float>(i) * 3.0f, 0.0f, 0.0f);
        props.bodyShape = BodySphere();
        props.sensor = true;
        create.bodiesProperties.push_back(props);
    }
    tick({create});
    EXPECT_EQ(engine->bodies().objectCount(), 3u);

    DestroyBodiesMessage destroy;
    destroy.physicsIds = {PhysicsId{kSource, 1}, PhysicsId{kSource, 3}};
    tick({destroy});
    EXPECT_FALSE(engine->bodyExists(PhysicsId{kSource, 1}));
    EXPECT_TRUE(engine->bodyExists(PhysicsId{kSource, 2}));
    EXPECT_FALSE(engine->bodyExists(PhysicsId{kSource, 3}));
}

TEST_F(BulletPhysicEngineTest, DestroyingUnknownBodyNeverThrows) {
    tick({createBox(1, Vec3())});
    EXPECT_NO_THROW(tick({destroyBody(42)}));
    EXPECT_TRUE(engine->bodyExists(PhysicsId{kSource, 1}));
    EXPECT_EQ(engine->bodies().objectCount(), 1u);
}

// --- Rebuild ---

TEST_F(BulletPhysicEngineTest, RebuildReplacesTrackedEntitiesQuietly) {
    tick({createBox(1, Vec3())});

    Logger::setDebugEnabled(true);
    testing::internal::CaptureStdout();
    tick({RebuildPhysicsHackMessage{}, destroyBody(1), createBox(2, Vec3(0, 5, 0))});
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_EQ(output.find("Could not destroy"), std::string::npos);
    EXPECT_FALSE(engine->bodyExists(PhysicsId{kSource, 1}));
    EXPECT_TRUE(engine->bodyExists(PhysicsId{kSource, 2}));
    EXPECT_FALSE(engine->bodies().isRebuilding());
}

TEST_F(BulletPhysicEngineTest, RebuildSuppressionEndsWithBatch) {
    tick({RebuildPhysicsHackMessage{}});

    Logger::setDebugEnabled(true);
    testing::internal::CaptureStdout();
    tick({destroyBody(1)});
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Could not destroy non-existent body with PhysicsId = [7 1]"), std::string::npos);
}

TEST_F(BulletPhysicEngineTest, RebuildSuppressionEndsWhenBatchThrows) {
    JointWeld weld;
    weld.targetId = PhysicsId{kSource, 1};
    weld.targetId2 = PhysicsId{kSource, 2};
    CreateJointMessage joint;
    joint.sourceId = kSource;
    joint.jointProperties.jointId = 50;
    joint.jointProperties.jointDevice = weld;

    EXPECT_THROW(tick({RebuildPhysicsHackMessage{}, joint}), std::logic_error);
    EXPECT_FALSE(engine->bodies().isRebuilding());

    Logger::setDebugEnabled(true);
    testing::internal::CaptureStdout();
    tick({destroyBody(1)});
    std::string output = testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Could not destroy non-existent body with PhysicsId = [7 1]"), std::string::npos);
}

// --- Integration ---

TEST_F(BulletPhysicEngineTest, FallingBoxAfterOneTick) {
    std::vector<IntegrationMessage> results = tick({createBox(1, Vec3(0, 0, 0), "Scene/Falling")});

    ASSERT_EQ(results.size(), 1u);
    const BodyTransformMessage& transform = asTransform(results[0]);
    EXPECT_EQ(transform.bodySource.simulant, "Scene/Falling");
    EXPECT_EQ(transform.bodySource.bodyId, 1u);
    EXPECT_NEAR(transform.linearVelocity.y, -9.8f / 60.0f, 1e-3f);
    EXPECT_LT(transform.center.y, 0.0f);
    EXPECT_NEAR(engine->getBodyLinearVelocity(PhysicsId{kSource, 1}).y, -9.8f / 60.0f, 1e-3f);
}

TEST_F(BulletPhysicEngineTest, SleepingBodyIsSilentUntilWoken) {
    CreateBodyMessage create = createBox(1, Vec3(0, 10, 0));
    create.bodyProperties.awake = false;

    EXPECT_TRUE(tick({create}).empty());
    EXPECT_TRUE(tick().empty());

    ApplyBodyLinearImpulseMessage impulse;
    impulse.physicsId = PhysicsId{kSource, 1};
    impulse.linearImpulse = Vec3(0, 1, 0);
    EXPECT_EQ(tick({impulse}).size(), 1u);
}

TEST_F(BulletPhysicEngineTest, BodyWaitingToSleepIsNotReported) {
    CreateBodyMessage create = createBox(1, Vec3(0, 10, 0));
    tick({create});

    btRigidBody* body = engine->bodies().getBody(PhysicsId{kSource, 1});
    ASSERT_NE(body, nullptr);
    body->forceActivationState(WANTS_DEACTIVATION);

    EXPECT_TRUE(engine->integrate(UpdateTime{0}, {}).empty());
}

TEST_F(BulletPhysicEngineTest, StaticBodiesAreNotReported) {
    CreateBodyMessage ground = createBox(1, Vec3(0, -5, 0), "Scene/Ground");
    ground.bodyProperties.bodyType = BodyType::Static;

    std::vector<IntegrationMessage> results = tick({ground, createBox(2, Vec3(0, 5, 0))});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(asTransform(results[0]).bodySource.bodyId, 2u);
}

TEST_F(BulletPhysicEngineTest, ResultsFollowCreationOrder) {
    std::vector<IntegrationMessage> results =
        tick({createBox(3, Vec3(0, 0, 0)), createBox(1, Vec3(5, 0, 0)), createBox(2, Vec3(10, 0, 0))});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(asTransform(results[0]).bodySource.bodyId, 3u);
    EXPECT_EQ(asTransform(results[1]).bodySource.bodyId, 1u);
    EXPECT_EQ(asTransform(results[2]).bodySource.bodyId, 2u);
}

TEST_F(BulletPhysicEngineTest, ZeroTicksDoesNotStep) {
    std::vector<IntegrationMessage> results = engine->integrate(UpdateTime{0}, {createBox(1, Vec3(0, 2, 0))});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_FLOAT_EQ(asTransform(results[0]).center.y, 2.0f);
    EXPECT_FLOAT_EQ(asTransform(results[0]).linearVelocity.y, 0.0f);
}

TEST_F(BulletPhysicEngineTest, InvalidConfigurationIsRejectedOnConstruction) {
    PhysicsConfig zeroRate = staticConfig();
    zeroRate.frameRate = StaticFrameRate{0};
    EXPECT_THROW(BulletPhysicEngine{zeroRate}, std::runtime_error);

    PhysicsConfig noSubSteps = staticConfig();
    noSubSteps.maxSubSteps = 0;
    EXPECT_THROW(BulletPhysicEngine{noSubSteps}, std::runtime_error);
}

TEST_F(BulletPhysicEngineTest, StepAmountFromTicks) {
    EXPECT_FLOAT_EQ(engine->resolveStepAmount(UpdateTime{30}), 0.5f);
}

TEST_F(BulletPhysicEngineTest, ClockTimeWithStaticRateIsFatal) {
    EXPECT_THROW(engine->integrate(ClockTime{0.016f}, {}), std::logic_error);
}

TEST_F(BulletPhysicEngineTest, UpdateTimeWithDynamicRateIsFatal) {
    PhysicsConfig config = staticConfig();
    config.frameRate = DynamicFrameRate{};
    BulletPhysicEngine dynamicEngine(config);

    EXPECT_THROW(dynamicEngine.integrate(UpdateTime{1}, {}), std::logic_error);
}

TEST_F(BulletPhysicEngineTest, DynamicRateStepsByClockTime) {
    PhysicsConfig config = staticConfig();
    config.frameRate = DynamicFrameRate{};
    BulletPhysicEngine dynamicEngine(config);

    EXPECT_FLOAT_EQ(dynamicEngine.resolveStepAmount(ClockTime{0.25f}), 0.25f);

    std::vector<IntegrationMessage> results = dynamicEngine.integrate(ClockTime{1.0f / 60.0f}, {createBox(1, Vec3())});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NEAR(asTransform(results[0]).linearVelocity.y, -9.8f / 60.0f, 1e-3f);
}

TEST_F(BulletPhysicEngineTest, MessagesBeforeFatalStepStayApplied) {
    EXPECT_THROW(engine->integrate(ClockTime{0.016f}, {createBox(1, Vec3())}), std::logic_error);
    EXPECT_TRUE(engine->bodyExists(PhysicsId{kSource, 1}));
}

TEST_F(BulletPhysicEngineTest, SetGravityKeepsOverrides) {
    CreateBodyMessage balloon = createBox(1, Vec3(0, 0, 0), "Scene/Balloon");
    balloon.bodyProperties.gravityOverrideOpt = Vec3(0, 0, 0);
    SetGravityMessage gravity;
    gravity.gravity = Vec3(0, -20, 0);

    tick({balloon, createBox(2, Vec3(5, 0, 0)), gravity});

    EXPECT_NEAR(engine->getBodyLinearVelocity(PhysicsId{kSource, 1}).y, 0.0f, 1e-5f);
    EXPECT_NEAR(engine->getBodyLinearVelocity(PhysicsId{kSource, 2}).y, -20.0f / 60.0f, 1e-3f);
}

TEST_F(BulletPhysicEngineTest, TeleportIsReported) {
    tick({createBox(1, Vec3())});

    SetBodyCenterMessage center;
    center.physicsId = PhysicsId{kSource, 1};
    center.center = Vec3(0, 100, 0);
    std::vector<IntegrationMessage> results = tick({center});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_NEAR(asTransform(results[0]).center.y, 100.0f, 0.1f);
}

// --- Joints ---

TEST_F(BulletPhysicEngineTest, DanglingJointDoesNotCrashNextStep) {
    JointAngle angle;
    angle.targetId = PhysicsId{kSource, 1};
    angle.targetId2 = PhysicsId{kSource, 2};
    angle.anchor = Vec3(1, 0, 0);
    angle.anchor2 = Vec3(-1, 0, 0);
    CreateJointMessage joint;
    joint.sourceId = kSource;
    joint.jointProperties.jointId = 50;
    joint.jointProperties.jointDevice = angle;

    tick({createBox(1, Vec3(0, 0, 0)), createBox(2, Vec3(2, 0, 0)), joint});
    ASSERT_TRUE(engine->bodies().isJointInWorld(PhysicsId{kSource, 50}));

    EXPECT_NO_THROW(tick({destroyBody(2)}));
    EXPECT_NO_THROW(tick());

    DestroyJointMessage destroyJoint;
    destroyJoint.physicsId = PhysicsId{kSource, 50};
    EXPECT_NO_THROW(tick({destroyJoint}));
    EXPECT_FALSE(engine->bodies().hasJoint(PhysicsId{kSource, 50}));
}

TEST_F(BulletPhysicEngineTest, UnrecognizedJointDeviceIsFatal) {
    JointWeld weld;
    weld.targetId = PhysicsId{kSource, 1};
    weld.targetId2 = PhysicsId{kSource, 2};
    CreateJointMessage joint;
    joint.sourceId = kSource;
    joint.jointProperties.jointId = 50;
    joint.jointProperties.jointDevice = weld;

    EXPECT_THROW(tick({createBox(1, Vec3()), createBox(2, Vec3(2, 0, 0)), joint}), std::logic_error);
}

// --- Queries ---

TEST_F(BulletPhysicEngineTest, LinearVelocityOfGhostIsZero) {
    CreateBodyMessage trigger = createBox(1, Vec3(), "Scene/Trigger");
    trigger.bodyProperties.sensor = false;
    trigger.bodyProperties.linearVelocity = Vec3(3, 0, 0);
    tick({trigger});

    EXPECT_EQ(engine->getBodyLinearVelocity(PhysicsId{kSource, 1}), Vec3::zero());
}

TEST_F(BulletPhysicEngineTest, LinearVelocityOfUnknownIdThrows) {
    EXPECT_THROW(engine->getBodyLinearVelocity(PhysicsId{kSource, 99}), std::runtime_error);
}

TEST_F(BulletPhysicEngineTest, GhostIsNeverReported) {
    CreateBodyMessage trigger = createBox(1, Vec3(), "Scene/Trigger");
    trigger.bodyProperties.sensor = false;
    EXPECT_TRUE(tick({trigger}).empty());
    EXPECT_TRUE(engine->bodies().hasGhost(PhysicsId{kSource, 1}));
}

} // namespace kineticEngine
