#include <gtest/gtest.h>
#include <ArduinoJson.h>
#include "MessageCodec.h"

TEST(MessageCodecTest, DecodesPhotoSequence) {
    RemoteCommand cmd;
    std::string error;
    ASSERT_TRUE(decodeCommand(R"({"command":"start_photo_sequence","deg":90,"speed":4,"delay":1000})", cmd, error))
        << error;

    EXPECT_EQ(cmd.type, CommandType::START_PHOTO_SEQUENCE);
    EXPECT_EQ(cmd.name, "start_photo_sequence");
    EXPECT_TRUE(cmd.hasDegrees);
    EXPECT_FLOAT_EQ(cmd.degrees, 90.0f);
    EXPECT_TRUE(cmd.hasSpeed);
    EXPECT_EQ(cmd.speed, 4u);
    EXPECT_TRUE(cmd.hasDelay);
    EXPECT_EQ(cmd.delayMs, 1000u);
}

TEST(MessageCodecTest, OptionalFieldsMayBeAbsent) {
    RemoteCommand cmd;
    std::string error;
    ASSERT_TRUE(decodeCommand(R"({"command":"start_spin"})", cmd, error));
    EXPECT_EQ(cmd.type, CommandType::START_SPIN);
    EXPECT_FALSE(cmd.hasSpeed);
    EXPECT_FALSE(cmd.hasDegrees);
    EXPECT_FALSE(cmd.hasDelay);
}

TEST(MessageCodecTest, DegreesAliasAndFractionalAngle) {
    RemoteCommand cmd;
    std::string error;
    ASSERT_TRUE(decodeCommand(R"({"command":"start_photo_sequence","degrees":22.5})", cmd, error));
    EXPECT_TRUE(cmd.hasDegrees);
    EXPECT_FLOAT_EQ(cmd.degrees, 22.5f);
}

TEST(MessageCodecTest, TriggerModeAndWiredState) {
    RemoteCommand cmd;
    std::string error;
    ASSERT_TRUE(decodeCommand(R"({"command":"set_trigger_mode","mode":"IR"})", cmd, error));
    EXPECT_TRUE(cmd.hasTriggerMode);
    EXPECT_EQ(cmd.triggerMode, TriggerMode::IR);

    ASSERT_TRUE(decodeCommand(R"({"command":"set_trigger_mode","mode":"laser"})", cmd, error));
    EXPECT_FALSE(cmd.hasTriggerMode);

    ASSERT_TRUE(decodeCommand(R"({"command":"debug_wired_shutter","state":1})", cmd, error));
    EXPECT_TRUE(cmd.wiredState);
    ASSERT_TRUE(decodeCommand(R"({"command":"debug_wired_shutter","state":false})", cmd, error));
    EXPECT_FALSE(cmd.wiredState);
}

TEST(MessageCodecTest, UnknownCommandStillDecodes) {
    RemoteCommand cmd;
    std::string error;
    ASSERT_TRUE(decodeCommand(R"({"command":"moonwalk"})", cmd, error));
    EXPECT_EQ(cmd.type, CommandType::UNKNOWN);
    EXPECT_EQ(cmd.name, "moonwalk");
}

TEST(MessageCodecTest, RejectsMalformedLines) {
    RemoteCommand cmd;
    std::string error;

    EXPECT_FALSE(decodeCommand("{\"command\":", cmd, error));
    EXPECT_NE(error.find("invalid JSON"), std::string::npos);

    EXPECT_FALSE(decodeCommand("[1,2,3]", cmd, error));
    EXPECT_FALSE(decodeCommand(R"({"speed":4})", cmd, error));
    EXPECT_NE(error.find("command"), std::string::npos);
    EXPECT_FALSE(decodeCommand(R"({"command":42})", cmd, error));
}

TEST(MessageCodecTest, RejectsBadFieldTypes) {
    RemoteCommand cmd;
    std::string error;
    EXPECT_FALSE(decodeCommand(R"({"command":"start_spin","speed":0})", cmd, error));
    EXPECT_FALSE(decodeCommand(R"({"command":"start_spin","speed":-4})", cmd, error));
    EXPECT_FALSE(decodeCommand(R"({"command":"start_spin","speed":"fast"})", cmd, error));
    EXPECT_FALSE(decodeCommand(R"({"command":"start_photo_sequence","deg":"ninety"})", cmd, error));
    EXPECT_FALSE(decodeCommand(R"({"command":"start_photo_sequence","delay":-1})", cmd, error));
}

TEST(MessageCodecTest, EncodesStatusFields) {
    StatusSnapshot snap;
    snap.message = "Sequence 2/4: Rotating...";
    snap.mode = OperationMode::SEQUENCE;
    snap.speed = 13;
    snap.triggerMode = TriggerMode::IR;

    std::string payload = encodeStatus(snap);

    StaticJsonDocument<256> doc;
    ASSERT_FALSE(deserializeJson(doc, payload));
    EXPECT_STREQ(doc["message"].as<const char*>(), "Sequence 2/4: Rotating...");
    EXPECT_STREQ(doc["mode"].as<const char*>(), "SEQUENCE");
    EXPECT_EQ(doc["speed"].as<int>(), 13);
    EXPECT_STREQ(doc["trigger_mode"].as<const char*>(), "IR");
    EXPECT_EQ(payload.find('\n'), std::string::npos);
}
