#include <gtest/gtest.h>

#include "ipc/codec.hpp"
#include "ipc/message.hpp"

using namespace tether::ipc;

// ═══════════════════════════════════════════════════════════════════════════════
// decode_event
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Codec, DecodeEventWithData)
{
    auto ev = decode_event(R"({"type":"break_due","data":{"break_type":"stretch","duration_seconds":30}})");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->event_type, "break_due");
    ASSERT_TRUE(ev->data.has_value());
    EXPECT_EQ((*ev->data)["break_type"], "stretch");
    EXPECT_EQ((*ev->data)["duration_seconds"], 30);
}

TEST(Codec, DecodeEventWithoutData)
{
    auto ev = decode_event(R"({"type":"ready"})");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->event_type, "ready");
    EXPECT_FALSE(ev->data.has_value());
}

TEST(Codec, NullDataIsTreatedAsAbsent)
{
    auto ev = decode_event(R"({"type":"status","data":null})");
    ASSERT_TRUE(ev.has_value());
    EXPECT_FALSE(ev->data.has_value());
}

TEST(Codec, ScalarDataIsKept)
{
    auto ev = decode_event(R"({"type":"metrics","data":42})");
    ASSERT_TRUE(ev.has_value());
    ASSERT_TRUE(ev->data.has_value());
    EXPECT_EQ(*ev->data, 42);
}

TEST(Codec, TrailingCarriageReturnIgnored)
{
    auto ev = decode_event("{\"type\":\"ready\"}\r");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->event_type, "ready");
}

TEST(Codec, ExtraKeysIgnored)
{
    auto ev = decode_event(R"({"type":"ready","version":"1.2","data":{}})");
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->event_type, "ready");
    EXPECT_TRUE(ev->data->is_object());
}

TEST(Codec, NonJsonNoiseFails)
{
    std::string error;
    EXPECT_FALSE(decode_event("Loading model weights...", &error).has_value());
    EXPECT_NE(error.find("invalid JSON"), std::string::npos);
}

TEST(Codec, EmptyLineFails)
{
    std::string error;
    EXPECT_FALSE(decode_event("", &error).has_value());
    EXPECT_EQ(error, "empty line");
    EXPECT_FALSE(decode_event("   ").has_value());
}

TEST(Codec, NonObjectFails)
{
    std::string error;
    EXPECT_FALSE(decode_event("[1,2,3]", &error).has_value());
    EXPECT_NE(error.find("array"), std::string::npos);
    EXPECT_FALSE(decode_event("\"ready\"").has_value());
}

TEST(Codec, MissingTypeFails)
{
    std::string error;
    EXPECT_FALSE(decode_event(R"({"data":{}})", &error).has_value());
    EXPECT_EQ(error, "missing \"type\"");
}

TEST(Codec, NonStringTypeFails)
{
    std::string error;
    EXPECT_FALSE(decode_event(R"({"type":7})", &error).has_value());
    EXPECT_EQ(error, "\"type\" is not a string");
}

TEST(Codec, EmptyTypeFails)
{
    EXPECT_FALSE(decode_event(R"({"type":""})").has_value());
}

TEST(Codec, TruncatedJsonFails)
{
    EXPECT_FALSE(decode_event(R"({"type":"break_due","data":{"break_)").has_value());
}

// ═══════════════════════════════════════════════════════════════════════════════
// encode_command
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Codec, EncodeBareCommand)
{
    EXPECT_EQ(encode_command(OutboundCommand("get_status")), R"({"cmd":"get_status"})");
}

TEST(Codec, EncodeIsDeterministic)
{
    OutboundCommand a("update_setting", Json{{"value", "x"}, {"key", "k"}});
    OutboundCommand b("update_setting", Json{{"key", "k"}, {"value", "x"}});
    EXPECT_EQ(encode_command(a), encode_command(b));
    EXPECT_EQ(encode_command(a), R"({"cmd":"update_setting","key":"k","value":"x"})");
}

TEST(Codec, EncodeKeepsExplicitNulls)
{
    OutboundCommand cmd("pause", Json{{"minutes", nullptr}});
    EXPECT_EQ(encode_command(cmd), R"({"cmd":"pause","minutes":null})");
}

TEST(Codec, EncodeHasNoNewline)
{
    OutboundCommand cmd("export_data", Json{{"path", "/tmp/a\nb"}});
    auto            line = encode_command(cmd);
    EXPECT_EQ(line.find('\n'), std::string::npos);
}

TEST(Codec, EncodeReplacesInvalidUtf8)
{
    OutboundCommand cmd("update_setting", Json{{"key", "name"}, {"value", std::string("a\xff" "b")}});
    std::string     line;
    EXPECT_NO_THROW(line = encode_command(cmd));
    auto back = decode_command(line);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->field("key"), "name");
}

TEST(Codec, CmdFieldCannotBeOverridden)
{
    OutboundCommand cmd("resume", Json{{"cmd", "shutdown"}});
    EXPECT_EQ(cmd.cmd(), "resume");
    EXPECT_EQ(encode_command(cmd), R"({"cmd":"resume"})");
}

TEST(Codec, NonObjectFieldsThrow)
{
    EXPECT_THROW(OutboundCommand("pause", Json::array({1, 2})), std::invalid_argument);
}

TEST(Codec, FieldLookupReturnsNullWhenAbsent)
{
    OutboundCommand cmd("log_hydration", Json{{"amount_ml", 250}});
    EXPECT_EQ(cmd.field("amount_ml"), 250);
    EXPECT_TRUE(cmd.field("missing").is_null());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Worker side / raw commands
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Codec, WorkerDecodesHostCommand)
{
    OutboundCommand cmd("add_schedule_rule",
                        Json{{"time", "09:00"},
                             {"action", "start_session"},
                             {"days", Json::array({"mon", "tue"})},
                             {"title", ""}});
    auto back = decode_command(encode_command(cmd));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, cmd);
}

TEST(Codec, DecodeCommandRejectsMissingCmd)
{
    std::string error;
    EXPECT_FALSE(decode_command(R"({"minutes":5})", &error).has_value());
    EXPECT_NE(error.find("cmd"), std::string::npos);
}

TEST(Codec, CommandFromJson)
{
    auto cmd = command_from_json(Json{{"cmd", "pause"}, {"minutes", 30}});
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(cmd->cmd(), "pause");
    EXPECT_EQ(cmd->field("minutes"), 30);
    EXPECT_FALSE(cmd->fields().contains("cmd"));
}

TEST(Codec, CommandFromJsonRejectsBadShapes)
{
    EXPECT_FALSE(command_from_json(Json("pause")).has_value());
    EXPECT_FALSE(command_from_json(Json{{"cmd", 3}}).has_value());
    EXPECT_FALSE(command_from_json(Json{{"cmd", ""}}).has_value());
}

TEST(Codec, EncodeEventRoundTrip)
{
    InboundEvent ev{"state_change", Json{{"state", "paused"}}};
    auto         back = decode_event(encode_event(ev));
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(*back, ev);

    InboundEvent bare{"ready", std::nullopt};
    EXPECT_EQ(encode_event(bare), R"({"type":"ready"})");
}

TEST(Codec, EventToJsonCarriesNullData)
{
    auto j = event_to_json(InboundEvent{"ready", std::nullopt});
    EXPECT_EQ(j["type"], "ready");
    EXPECT_TRUE(j.contains("data"));
    EXPECT_TRUE(j["data"].is_null());
}

// ═══════════════════════════════════════════════════════════════════════════════
// IpcStatus
// ═══════════════════════════════════════════════════════════════════════════════

TEST(IpcStatus, DefaultIsSuccess)
{
    IpcStatus s;
    EXPECT_TRUE(s.ok());
    EXPECT_EQ(s.to_string(), "Ok");
}

TEST(IpcStatus, ToStringNamesTheCode)
{
    IpcStatus s(ErrorCode::NotRunning, "worker is not running");
    EXPECT_FALSE(s.ok());
    EXPECT_EQ(s.to_string(), "NotRunningError: worker is not running");
    EXPECT_STREQ(error_code_name(ErrorCode::WriteFailed), "WriteError");
}
