#include <gtest/gtest.h>

#include <ArduinoJson.h>

#include <cmath>
#include <vector>

#include "Params.h"
#include "comms/FrameDecoder.h"
#include "comms/Protocol.h"

namespace {

std::vector<uint8_t> pack(const JsonDocument& doc) {
  std::vector<uint8_t> out(measureMsgPack(doc));
  serializeMsgPack(doc, out.data(), out.size());
  return out;
}

bool decode(const std::vector<uint8_t>& payload, CommandFrame& cmd) {
  return protocol::decodeCommand(payload.data(), payload.size(), cmd);
}

TEST(ProtocolTest, FrameLengthBounds) {
  EXPECT_FALSE(protocol::frameLengthValid(0));
  EXPECT_TRUE(protocol::frameLengthValid(1));
  EXPECT_TRUE(protocol::frameLengthValid(1024));
  EXPECT_FALSE(protocol::frameLengthValid(1025));
  EXPECT_FALSE(protocol::frameLengthValid(0xFFFFFFFFu));
}

TEST(ProtocolTest, ReadsBigEndianLength) {
  const uint8_t header[4] = {0x00, 0x00, 0x07, 0xD0};
  EXPECT_EQ(protocol::readFrameLength(header), 2000u);

  const uint8_t big[4] = {0x12, 0x34, 0x56, 0x78};
  EXPECT_EQ(protocol::readFrameLength(big), 0x12345678u);
}

TEST(ProtocolTest, AppendFrameRejectsBadLengths) {
  std::vector<uint8_t> out;
  std::vector<uint8_t> big(MAX_FRAME_BYTES + 1, 0x00);
  EXPECT_FALSE(protocol::appendFrame(big.data(), big.size(), out));
  EXPECT_FALSE(protocol::appendFrame(big.data(), 0, out));
  EXPECT_TRUE(out.empty());

  const uint8_t one = 0x80;
  ASSERT_TRUE(protocol::appendFrame(&one, 1, out));
  EXPECT_EQ(out, (std::vector<uint8_t>{0, 0, 0, 1, 0x80}));
}

TEST(ProtocolTest, DecodesMotionCommand) {
  StaticJsonDocument<512> doc;
  doc["lf"] = 0.5f;
  doc["lr"] = -0.25f;
  doc["rf"] = 1;
  doc["rr"] = -1;
  doc["cmd_id"] = 7;

  CommandFrame cmd;
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_TRUE(cmd.valid);
  EXPECT_EQ(cmd.directive, Directive::NONE);
  EXPECT_FLOAT_EQ(cmd.wheels.lf, 0.5f);
  EXPECT_FLOAT_EQ(cmd.wheels.lr, -0.25f);
  EXPECT_FLOAT_EQ(cmd.wheels.rf, 1.0f);
  EXPECT_FLOAT_EQ(cmd.wheels.rr, -1.0f);
  ASSERT_TRUE(cmd.has_cmd_id);
  EXPECT_EQ(cmd.cmd_id, 7);
}

TEST(ProtocolTest, MissingWheelsDefaultToZero) {
  StaticJsonDocument<512> doc;
  doc["rf"] = 0.3f;

  CommandFrame cmd;
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_EQ(cmd.wheels.lf, 0.0f);
  EXPECT_EQ(cmd.wheels.lr, 0.0f);
  EXPECT_FLOAT_EQ(cmd.wheels.rf, 0.3f);
  EXPECT_EQ(cmd.wheels.rr, 0.0f);
  EXPECT_FALSE(cmd.has_cmd_id);
}

TEST(ProtocolTest, EmptyMapIsAStopCommand) {
  const std::vector<uint8_t> empty_map = {0x80};

  CommandFrame cmd;
  ASSERT_TRUE(decode(empty_map, cmd));
  EXPECT_EQ(cmd.directive, Directive::NONE);
  EXPECT_EQ(cmd.wheels.lf, 0.0f);
  EXPECT_EQ(cmd.wheels.rr, 0.0f);
}

TEST(ProtocolTest, WheelValuesAreClamped) {
  StaticJsonDocument<512> doc;
  doc["lf"] = 4.0f;
  doc["lr"] = -2.5f;
  doc["rf"] = 1.0001f;
  doc["rr"] = -0.5f;

  CommandFrame cmd;
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_EQ(cmd.wheels.lf, 1.0f);
  EXPECT_EQ(cmd.wheels.lr, -1.0f);
  EXPECT_EQ(cmd.wheels.rf, 1.0f);
  EXPECT_FLOAT_EQ(cmd.wheels.rr, -0.5f);

  // Finite float64 values outside float range still clamp
  doc["lf"] = 1e40;
  doc["rr"] = -1e300;
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_EQ(cmd.wheels.lf, 1.0f);
  EXPECT_EQ(cmd.wheels.rr, -1.0f);
}

TEST(ProtocolTest, NonNumericAndNonFiniteWheelsReadAsZero) {
  StaticJsonDocument<512> doc;
  doc["lf"] = "fast";
  doc["lr"] = true;
  doc["rf"] = std::nan("");
  doc["rr"] = 0.4f;

  CommandFrame cmd;
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_EQ(cmd.wheels.lf, 0.0f);
  EXPECT_EQ(cmd.wheels.lr, 0.0f);
  EXPECT_EQ(cmd.wheels.rf, 0.0f);
  EXPECT_FLOAT_EQ(cmd.wheels.rr, 0.4f);
}

TEST(ProtocolTest, NonIntegerCmdIdIsIgnored) {
  StaticJsonDocument<512> doc;
  doc["lf"] = 0.1f;
  doc["cmd_id"] = "seven";

  CommandFrame cmd;
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_FALSE(cmd.has_cmd_id);
}

TEST(ProtocolTest, DirectiveOverridesMotion) {
  StaticJsonDocument<512> doc;
  doc["command"] = "restart";
  doc["lf"] = 0.9f;
  doc["rr"] = 0.9f;
  doc["cmd_id"] = 11;

  CommandFrame cmd;
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_EQ(cmd.directive, Directive::RESTART);
  EXPECT_EQ(cmd.wheels.lf, 0.0f);
  EXPECT_EQ(cmd.wheels.rr, 0.0f);
  EXPECT_TRUE(cmd.has_cmd_id);
  EXPECT_EQ(cmd.cmd_id, 11);
}

TEST(ProtocolTest, ShutdownAndUnknownDirectives) {
  StaticJsonDocument<512> doc;
  doc["command"] = "shutdown";

  CommandFrame cmd;
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_EQ(cmd.directive, Directive::SHUTDOWN);

  doc["command"] = "dance";
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_EQ(cmd.directive, Directive::UNKNOWN);

  doc["command"] = 3;
  ASSERT_TRUE(decode(pack(doc), cmd));
  EXPECT_EQ(cmd.directive, Directive::UNKNOWN);
}

TEST(ProtocolTest, RejectsMalformedPayloads) {
  CommandFrame cmd;

  // map of one entry, key truncated
  EXPECT_FALSE(decode({0x81, 0xA2, 'l'}, cmd));
  EXPECT_FALSE(cmd.valid);

  // array instead of map
  EXPECT_FALSE(decode({0x92, 0x01, 0x02}, cmd));

  // bare integer
  EXPECT_FALSE(decode({0x05}, cmd));

  EXPECT_FALSE(protocol::decodeCommand(nullptr, 0, cmd));
}

TEST(ProtocolTest, AckContainsOnlyCmdId) {
  std::vector<uint8_t> frame;
  ASSERT_TRUE(protocol::encodeAck(123456789012LL, frame));
  ASSERT_GT(frame.size(), FRAME_HEADER_BYTES);
  EXPECT_EQ(protocol::readFrameLength(frame.data()), frame.size() - FRAME_HEADER_BYTES);

  StaticJsonDocument<512> doc;
  ASSERT_FALSE(deserializeMsgPack(doc, frame.data() + FRAME_HEADER_BYTES,
                                  frame.size() - FRAME_HEADER_BYTES));
  JsonObject obj = doc.as<JsonObject>();
  ASSERT_FALSE(obj.isNull());
  EXPECT_EQ(obj.size(), 1u);
  EXPECT_EQ(obj["cmd_id"].as<int64_t>(), 123456789012LL);
}

TEST(ProtocolTest, CommandSurvivesEncodeAndDecode) {
  CommandFrame sent;
  sent.wheels.lf = 0.5f;
  sent.wheels.lr = -0.125f;
  sent.wheels.rf = 0.0f;
  sent.wheels.rr = -1.0f;
  sent.cmd_id = 42;
  sent.has_cmd_id = true;

  std::vector<uint8_t> frame;
  ASSERT_TRUE(protocol::encodeCommand(sent, frame));

  FrameDecoder decoder;
  decoder.push(frame.data(), frame.size());

  std::vector<uint8_t> payload;
  ASSERT_EQ(decoder.next(payload), FrameDecoder::Result::FRAME);
  EXPECT_EQ(decoder.buffered(), 0u);

  CommandFrame got;
  ASSERT_TRUE(decode(payload, got));
  EXPECT_FLOAT_EQ(got.wheels.lf, sent.wheels.lf);
  EXPECT_FLOAT_EQ(got.wheels.lr, sent.wheels.lr);
  EXPECT_FLOAT_EQ(got.wheels.rf, sent.wheels.rf);
  EXPECT_FLOAT_EQ(got.wheels.rr, sent.wheels.rr);
  EXPECT_TRUE(got.has_cmd_id);
  EXPECT_EQ(got.cmd_id, 42);
}

TEST(ProtocolTest, DirectiveSurvivesEncodeAndDecode) {
  CommandFrame sent;
  sent.directive = Directive::SHUTDOWN;

  std::vector<uint8_t> frame;
  ASSERT_TRUE(protocol::encodeCommand(sent, frame));

  std::vector<uint8_t> payload(frame.begin() + FRAME_HEADER_BYTES, frame.end());
  CommandFrame got;
  ASSERT_TRUE(decode(payload, got));
  EXPECT_EQ(got.directive, Directive::SHUTDOWN);
  EXPECT_FALSE(got.has_cmd_id);

  sent.directive = Directive::UNKNOWN;
  EXPECT_FALSE(protocol::encodeCommand(sent, frame));
}

}  // namespace
