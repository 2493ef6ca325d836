/**
 * messages_test.cpp - Command encoding and incoming message classification
 */

#include "protocol/messages.hpp"

#include <gtest/gtest.h>

using namespace vibium::protocol;
using nlohmann::json;

/******************************************************************************
 * Encoding Tests
 ******************************************************************************/

TEST(EncodeCommandTest, CarriesIdMethodAndParams) {
    Command command;
    command.id = 7;
    command.method = "browsingContext.navigate";
    command.params = {{"url", "https://example.com"}};

    json j = json::parse(encode_command(command));
    EXPECT_EQ(j["id"], 7);
    EXPECT_EQ(j["method"], "browsingContext.navigate");
    EXPECT_EQ(j["params"]["url"], "https://example.com");
}

TEST(EncodeCommandTest, NullParamsBecomeEmptyObject) {
    Command command;
    command.id = 1;
    command.method = "session.status";
    command.params = nullptr;

    json j = json::parse(encode_command(command));
    ASSERT_TRUE(j["params"].is_object());
    EXPECT_TRUE(j["params"].empty());
}

/******************************************************************************
 * Response Decoding Tests
 ******************************************************************************/

TEST(DecodeMessageTest, SuccessResponse) {
    IncomingMessage msg = decode_message(R"({"id":3,"type":"success","result":{"ready":true}})");

    ASSERT_EQ(msg.kind, MessageKind::RESPONSE);
    EXPECT_EQ(msg.response.id, 3);
    EXPECT_TRUE(msg.response.success);
    EXPECT_EQ(msg.response.result["ready"], true);
}

TEST(DecodeMessageTest, MissingResultIsEmptyObject) {
    IncomingMessage msg = decode_message(R"({"id":4,"type":"success"})");

    ASSERT_EQ(msg.kind, MessageKind::RESPONSE);
    EXPECT_TRUE(msg.response.result.is_object());
    EXPECT_TRUE(msg.response.result.empty());

    msg = decode_message(R"({"id":5,"result":null})");
    ASSERT_EQ(msg.kind, MessageKind::RESPONSE);
    EXPECT_TRUE(msg.response.result.is_object());
}

TEST(DecodeMessageTest, ErrorResponseFields) {
    IncomingMessage msg = decode_message(
        R"({"id":9,"type":"error","error":"no such element","message":"#missing","stacktrace":"at find"})");

    ASSERT_EQ(msg.kind, MessageKind::RESPONSE);
    EXPECT_FALSE(msg.response.success);
    EXPECT_EQ(msg.response.error.code, "no such element");
    EXPECT_EQ(msg.response.error.message, "#missing");
    ASSERT_TRUE(msg.response.error.trace.has_value());
    EXPECT_EQ(*msg.response.error.trace, "at find");
}

TEST(DecodeMessageTest, ErrorResponseDefaults) {
    IncomingMessage msg = decode_message(R"({"id":10,"type":"error"})");

    ASSERT_EQ(msg.kind, MessageKind::RESPONSE);
    EXPECT_FALSE(msg.response.success);
    EXPECT_EQ(msg.response.error.code, "unknown error");
    EXPECT_EQ(msg.response.error.message, "Unknown error");
    EXPECT_FALSE(msg.response.error.trace.has_value());
}

TEST(DecodeMessageTest, NonStringErrorFieldsKeptAsJsonText) {
    IncomingMessage msg = decode_message(R"({"id":11,"type":"error","error":42,"message":{"a":1}})");

    ASSERT_EQ(msg.kind, MessageKind::RESPONSE);
    EXPECT_EQ(msg.response.error.code, "42");
    EXPECT_EQ(msg.response.error.message, R"({"a":1})");
}

/******************************************************************************
 * Event Decoding Tests
 ******************************************************************************/

TEST(DecodeMessageTest, EventHasNoId) {
    IncomingMessage msg = decode_message(R"({"method":"log.entryAdded","params":{"text":"hi"}})");

    ASSERT_EQ(msg.kind, MessageKind::EVENT);
    EXPECT_EQ(msg.event.method, "log.entryAdded");
    EXPECT_EQ(msg.event.params["text"], "hi");
}

TEST(DecodeMessageTest, NullIdWithMethodIsEvent) {
    IncomingMessage msg = decode_message(R"({"id":null,"method":"browsingContext.load"})");

    ASSERT_EQ(msg.kind, MessageKind::EVENT);
    EXPECT_TRUE(msg.event.params.is_object());
}

/******************************************************************************
 * Invalid Input Tests
 ******************************************************************************/

TEST(DecodeMessageTest, InvalidInputNeverThrows) {
    EXPECT_EQ(decode_message("not json").kind, MessageKind::INVALID);
    EXPECT_EQ(decode_message("[1,2,3]").kind, MessageKind::INVALID);
    EXPECT_EQ(decode_message(R"({"id":"7","type":"success"})").kind, MessageKind::INVALID);
    EXPECT_EQ(decode_message(R"({"id":1.5})").kind, MessageKind::INVALID);
    EXPECT_EQ(decode_message(R"({"params":{}})").kind, MessageKind::INVALID);
    EXPECT_EQ(decode_message("").kind, MessageKind::INVALID);
}

TEST(DecodeMessageTest, InvalidCarriesReason) {
    IncomingMessage msg = decode_message("{broken");
    EXPECT_EQ(msg.kind, MessageKind::INVALID);
    EXPECT_FALSE(msg.error.empty());
}
