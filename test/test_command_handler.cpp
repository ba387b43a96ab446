#include <gtest/gtest.h>
#include "CommandHandler.h"
#include "fakes.h"

class CommandHandlerTest : public ::testing::Test {
protected:
    CommandHandlerTest()
        : shared(stateLock, SpeedTable({13, 4, 1}, 1), false, TriggerMode::WIRED)
        , camera(shutter, clock)
        , handler(shared, camera, CommandDefaults())
    {
    }

    static RemoteCommand command(CommandType type) {
        RemoteCommand cmd;
        cmd.type = type;
        cmd.name = commandTypeName(type);
        return cmd;
    }

    FakeShutter shutter;
    FakeClock clock;
    HostLock stateLock;
    SharedState shared;
    CameraTrigger camera;
    CommandHandler handler;
};

TEST_F(CommandHandlerTest, NamesMapToTypes) {
    EXPECT_EQ(commandTypeFromName("start_photo_sequence"), CommandType::START_PHOTO_SEQUENCE);
    EXPECT_EQ(commandTypeFromName("debug_wired_shutter"), CommandType::DEBUG_WIRED_SHUTTER);
    EXPECT_EQ(commandTypeFromName("dance"), CommandType::UNKNOWN);
    EXPECT_EQ(commandTypeFromName(nullptr), CommandType::UNKNOWN);
    EXPECT_STREQ(commandTypeName(CommandType::STOP), "stop");
}

TEST_F(CommandHandlerTest, StartSpinSelectsMatchingTableEntry) {
    RemoteCommand cmd = command(CommandType::START_SPIN);
    cmd.hasSpeed = true;
    cmd.speed = 13;
    ASSERT_TRUE(handler.apply(cmd));

    OperationState state = shared.copyState();
    EXPECT_EQ(state.mode, OperationMode::SPIN);
    EXPECT_EQ(state.params.speed, 13u);
    EXPECT_EQ(shared.copySpeeds().currentIndex(), 0u);
}

TEST_F(CommandHandlerTest, StartSpinWithoutSpeedUsesNormalSpeed) {
    ASSERT_TRUE(handler.apply(command(CommandType::START_SPIN)));
    OperationState state = shared.copyState();
    EXPECT_EQ(state.mode, OperationMode::SPIN);
    EXPECT_EQ(state.params.speed, 4u);
}

TEST_F(CommandHandlerTest, OffTableSpeedKeepsIndex) {
    RemoteCommand cmd = command(CommandType::START_SPIN);
    cmd.hasSpeed = true;
    cmd.speed = 9;
    ASSERT_TRUE(handler.apply(cmd));

    EXPECT_EQ(shared.copyState().params.speed, 9u);
    EXPECT_EQ(shared.copySpeeds().currentIndex(), 1u);
}

TEST_F(CommandHandlerTest, SetSpeedWhileSpinningMovesIndex) {
    ASSERT_TRUE(handler.apply(command(CommandType::START_SPIN)));
    uint32_t epoch = shared.copyState().epoch;

    RemoteCommand cmd = command(CommandType::SET_SPEED);
    cmd.hasSpeed = true;
    cmd.speed = 1;
    ASSERT_TRUE(handler.apply(cmd));

    OperationState state = shared.copyState();
    EXPECT_EQ(state.mode, OperationMode::SPIN);
    EXPECT_EQ(state.params.speed, 1u);
    EXPECT_EQ(state.epoch, epoch);
    EXPECT_EQ(shared.copySpeeds().currentIndex(), 2u);
}

TEST_F(CommandHandlerTest, SetSpeedOutsideSpinIsIgnored) {
    RemoteCommand cmd = command(CommandType::SET_SPEED);
    cmd.hasSpeed = true;
    cmd.speed = 1;
    EXPECT_FALSE(handler.apply(cmd));

    OperationState state = shared.copyState();
    EXPECT_EQ(state.mode, OperationMode::IDLE);
    EXPECT_FALSE(state.params.hasSpeed);
    EXPECT_EQ(shared.copySpeeds().currentIndex(), 1u);
}

TEST_F(CommandHandlerTest, PhotoSequenceUsesDefaultsForMissingFields) {
    ASSERT_TRUE(handler.apply(command(CommandType::START_PHOTO_SEQUENCE)));

    OperationState state = shared.copyState();
    EXPECT_EQ(state.mode, OperationMode::SEQUENCE);
    EXPECT_EQ(state.subState, SequencePhase::DONE);
    EXPECT_EQ(state.params.speed, 4u);
    EXPECT_FLOAT_EQ(state.params.degreesPerStep, 45.0f);
    EXPECT_EQ(state.params.delayMs, 1000u);
}

TEST_F(CommandHandlerTest, PhotoSequenceTakesRequestedFields) {
    RemoteCommand cmd = command(CommandType::START_PHOTO_SEQUENCE);
    cmd.hasDegrees = true;
    cmd.degrees = 30.0f;
    cmd.hasSpeed = true;
    cmd.speed = 13;
    cmd.hasDelay = true;
    cmd.delayMs = 2000;
    ASSERT_TRUE(handler.apply(cmd));

    OperationState state = shared.copyState();
    EXPECT_FLOAT_EQ(state.params.degreesPerStep, 30.0f);
    EXPECT_EQ(state.params.speed, 13u);
    EXPECT_EQ(state.params.delayMs, 2000u);
}

TEST_F(CommandHandlerTest, StopAfterSpinLeavesNoSequenceState) {
    RemoteCommand spin = command(CommandType::START_SPIN);
    spin.hasSpeed = true;
    spin.speed = 4;
    ASSERT_TRUE(handler.apply(spin));
    ASSERT_TRUE(handler.apply(command(CommandType::STOP)));

    OperationState state = shared.copyState();
    EXPECT_EQ(state.mode, OperationMode::IDLE);
    EXPECT_EQ(state.subState, SequencePhase::DONE);
    EXPECT_EQ(state.progress.totalSteps, 0u);
    EXPECT_EQ(state.progress.stepsRemainingThisRotation, 0u);
}

TEST_F(CommandHandlerTest, SetTriggerModeRequiresValidMode) {
    RemoteCommand cmd = command(CommandType::SET_TRIGGER_MODE);
    EXPECT_FALSE(handler.apply(cmd));

    cmd.hasTriggerMode = true;
    cmd.triggerMode = TriggerMode::IR;
    EXPECT_TRUE(handler.apply(cmd));
    EXPECT_EQ(shared.copyState().triggerMode, TriggerMode::IR);
    EXPECT_EQ(shared.copyState().mode, OperationMode::IDLE);
}

TEST_F(CommandHandlerTest, TakePictureInstallsPicture) {
    ASSERT_TRUE(handler.apply(command(CommandType::TAKE_PICTURE)));
    EXPECT_EQ(shared.copyState().mode, OperationMode::PICTURE);
}

TEST_F(CommandHandlerTest, UnknownCommandIsNoOp) {
    OperationState before = shared.copyState();
    EXPECT_FALSE(handler.apply(command(CommandType::UNKNOWN)));
    OperationState after = shared.copyState();
    EXPECT_EQ(after.mode, before.mode);
    EXPECT_EQ(after.epoch, before.epoch);
}

TEST_F(CommandHandlerTest, DebugCommandsBypassState) {
    uint32_t epoch = shared.copyState().epoch;

    RemoteCommand wired = command(CommandType::DEBUG_WIRED_SHUTTER);
    wired.wiredState = true;
    EXPECT_TRUE(handler.apply(wired));
    EXPECT_TRUE(handler.apply(command(CommandType::DEBUG_IR_TRIGGER)));

    std::vector<std::string> expected = {"wired:on", "ir"};
    EXPECT_EQ(shutter.events, expected);
    EXPECT_EQ(shared.copyState().epoch, epoch);
    EXPECT_EQ(shared.copyState().mode, OperationMode::IDLE);
}
