#include "commands.hpp"

namespace tether::ipc
{

namespace
{

OutboundCommand bare(const char* name)
{
    return OutboundCommand(name);
}

OutboundCommand with_days(const char* name, int days)
{
    return OutboundCommand(name, Json{{"days", days}});
}

Json rule_fields(const ScheduleRule& rule)
{
    return Json{{"time", rule.time},
                {"action", rule.action},
                {"days", rule.days},
                {"title", rule.title.value_or(std::string())}};
}

}   // namespace

OutboundCommand make_log_hydration(int amount_ml)
{
    return OutboundCommand("log_hydration", Json{{"amount_ml", amount_ml}});
}

OutboundCommand make_complete_break()
{
    return bare("complete_break");
}

OutboundCommand make_snooze_break(int minutes)
{
    return OutboundCommand("snooze_break", Json{{"minutes", minutes}});
}

OutboundCommand make_skip_break()
{
    return bare("skip_break");
}

OutboundCommand make_pause(std::optional<int> minutes)
{
    Json fields = Json::object();
    fields["minutes"] = minutes ? Json(*minutes) : Json(nullptr);
    return OutboundCommand("pause", std::move(fields));
}

OutboundCommand make_resume()
{
    return bare("resume");
}

OutboundCommand make_get_status()
{
    return bare("get_status");
}

OutboundCommand make_get_training_stats()
{
    return bare("get_training_stats");
}

OutboundCommand make_get_settings()
{
    return bare("get_settings");
}

OutboundCommand make_update_setting(const std::string& key, const std::string& value)
{
    return OutboundCommand("update_setting", Json{{"key", key}, {"value", value}});
}

OutboundCommand make_export_data(const std::string& path)
{
    return OutboundCommand("export_data", Json{{"path", path}});
}

OutboundCommand make_start_session()
{
    return bare("start_session");
}

OutboundCommand make_pause_session()
{
    return bare("pause_session");
}

OutboundCommand make_resume_session()
{
    return bare("resume_session");
}

OutboundCommand make_end_session()
{
    return bare("end_session");
}

OutboundCommand make_reset_all_timers()
{
    return bare("reset_all_timers");
}

OutboundCommand make_get_schedule_rules()
{
    return bare("get_schedule_rules");
}

OutboundCommand make_add_schedule_rule(const ScheduleRule& rule)
{
    return OutboundCommand("add_schedule_rule", rule_fields(rule));
}

OutboundCommand make_update_schedule_rule(int id, const ScheduleRule& rule, bool enabled)
{
    Json fields       = rule_fields(rule);
    fields["id"]      = id;
    fields["enabled"] = enabled;
    return OutboundCommand("update_schedule_rule", std::move(fields));
}

OutboundCommand make_delete_schedule_rule(int id)
{
    return OutboundCommand("delete_schedule_rule", Json{{"id", id}});
}

OutboundCommand make_get_break_stats(int days)
{
    return with_days("get_break_stats", days);
}

OutboundCommand make_get_breaks_today()
{
    return bare("get_breaks_today");
}

OutboundCommand make_get_break_history(int days)
{
    return with_days("get_break_history", days);
}

OutboundCommand make_get_hydration_history(int days)
{
    return with_days("get_hydration_history", days);
}

OutboundCommand make_get_focus_stats(int days)
{
    return with_days("get_focus_stats", days);
}

OutboundCommand make_get_activity_heatmap(int days)
{
    return with_days("get_activity_heatmap", days);
}

OutboundCommand make_shutdown()
{
    return bare("shutdown");
}

}   // namespace tether::ipc
