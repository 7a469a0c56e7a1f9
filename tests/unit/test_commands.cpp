#include <gtest/gtest.h>

#include "ipc/codec.hpp"
#include "ipc/commands.hpp"

#include <set>

using namespace tether::ipc;

namespace
{

std::set<std::string> keys_of(const OutboundCommand& cmd)
{
    std::set<std::string> keys;
    for (auto it = cmd.fields().begin(); it != cmd.fields().end(); ++it)
        keys.insert(it.key());
    return keys;
}

}   // namespace

TEST(Commands, BareCommandsHaveNoFields)
{
    for (const auto& cmd : {make_complete_break(),
                            make_skip_break(),
                            make_resume(),
                            make_get_status(),
                            make_get_training_stats(),
                            make_get_settings(),
                            make_start_session(),
                            make_pause_session(),
                            make_resume_session(),
                            make_end_session(),
                            make_reset_all_timers(),
                            make_get_schedule_rules(),
                            make_get_breaks_today(),
                            make_shutdown()})
    {
        EXPECT_TRUE(cmd.fields().empty()) << cmd.cmd();
        EXPECT_EQ(encode_command(cmd), R"({"cmd":")" + cmd.cmd() + R"("})");
    }
}

TEST(Commands, LogHydration)
{
    auto cmd = make_log_hydration(250);
    EXPECT_EQ(encode_command(cmd), R"({"amount_ml":250,"cmd":"log_hydration"})");
}

TEST(Commands, SnoozeBreak)
{
    auto cmd = make_snooze_break(5);
    EXPECT_EQ(cmd.cmd(), "snooze_break");
    EXPECT_EQ(cmd.field("minutes"), 5);
}

TEST(Commands, PauseWithMinutes)
{
    EXPECT_EQ(encode_command(make_pause(30)), R"({"cmd":"pause","minutes":30})");
}

TEST(Commands, PauseIndefinitelySendsExplicitNull)
{
    auto cmd = make_pause(std::nullopt);
    EXPECT_EQ(keys_of(cmd), keys_of(make_pause(60)));
    EXPECT_EQ(encode_command(cmd), R"({"cmd":"pause","minutes":null})");
}

TEST(Commands, UpdateSettingAndExport)
{
    auto set = make_update_setting("break_interval", "45");
    EXPECT_EQ(set.field("key"), "break_interval");
    EXPECT_EQ(set.field("value"), "45");

    auto exp = make_export_data("/tmp/export.csv");
    EXPECT_EQ(exp.field("path"), "/tmp/export.csv");
}

TEST(Commands, AddScheduleRuleDefaultsTitleToEmpty)
{
    ScheduleRule rule{"09:00", "start_session", {"mon", "wed"}, std::nullopt};
    auto         cmd = make_add_schedule_rule(rule);

    EXPECT_EQ(keys_of(cmd), (std::set<std::string>{"action", "days", "time", "title"}));
    EXPECT_EQ(cmd.field("title"), "");
    EXPECT_EQ(cmd.field("days"), Json::array({"mon", "wed"}));

    rule.title = "Standup";
    EXPECT_EQ(make_add_schedule_rule(rule).field("title"), "Standup");
}

TEST(Commands, UpdateScheduleRuleCarriesIdAndEnabled)
{
    ScheduleRule rule{"18:00", "end_session", {"fri"}, std::string("Wrap up")};
    auto         cmd = make_update_schedule_rule(3, rule, false);

    EXPECT_EQ(cmd.cmd(), "update_schedule_rule");
    EXPECT_EQ(keys_of(cmd), (std::set<std::string>{"action", "days", "enabled", "id", "time", "title"}));
    EXPECT_EQ(cmd.field("id"), 3);
    EXPECT_EQ(cmd.field("enabled"), false);
}

TEST(Commands, DeleteScheduleRule)
{
    EXPECT_EQ(encode_command(make_delete_schedule_rule(12)), R"({"cmd":"delete_schedule_rule","id":12})");
}

TEST(Commands, AnalyticsDefaultToOneWeek)
{
    EXPECT_EQ(make_get_break_stats().field("days"), DEFAULT_HISTORY_DAYS);
    EXPECT_EQ(make_get_break_history().field("days"), 7);
    EXPECT_EQ(make_get_hydration_history(30).field("days"), 30);
    EXPECT_EQ(make_get_focus_stats(14).field("days"), 14);
    EXPECT_EQ(make_get_activity_heatmap().cmd(), "get_activity_heatmap");
}

TEST(Commands, WorkerStubSeesSameFields)
{
    ScheduleRule rule{"12:30", "pause", {"sat", "sun"}, std::nullopt};
    for (const auto& cmd : {make_log_hydration(500),
                            make_pause(std::nullopt),
                            make_update_setting("sound", "off"),
                            make_update_schedule_rule(1, rule, true),
                            make_get_focus_stats(3)})
    {
        auto back = decode_command(encode_command(cmd));
        ASSERT_TRUE(back.has_value()) << cmd.cmd();
        EXPECT_EQ(back->cmd(), cmd.cmd());
        EXPECT_EQ(back->fields(), cmd.fields());
    }
}
