// Binds invoke names to HostCommands so every front end (the console host,
// tests) exposes the same command set.

#include "register_invokes.hpp"

#include "host_commands.hpp"
#include "invoke_dispatcher.hpp"
#include "tray_actions.hpp"

#include "../daemon/event_router.hpp"
#include "../daemon/surface_host.hpp"
#include "../ipc/commands.hpp"

#include <tether/logger.hpp>

#include <functional>
#include <string>

namespace tether::app
{

namespace
{

bool read_schedule_rule(InvokeArgs& a, ipc::ScheduleRule& rule)
{
    return a.read_string("time", rule.time) && a.read_string("action", rule.action)
           && a.read_string_list("days", rule.days) && a.read_nullable_string("title", rule.title);
}

InvokeResult from_payload(const std::optional<ipc::Json>& payload)
{
    return InvokeResult::success(payload ? *payload : ipc::Json());
}

}   // namespace

void register_host_invokes(InvokeDispatcher& d, const InvokeBindings& b)
{
    if (!b.commands || !b.router || !b.surfaces)
    {
        TETHER_LOG_ERROR("host", "register_host_invokes: missing bindings");
        return;
    }

    HostCommands&        cmds     = *b.commands;
    daemon::EventRouter& router   = *b.router;
    daemon::SurfaceHost& surfaces = *b.surfaces;
    TrayController*      tray     = b.tray;

    // Commands without arguments that map straight onto a worker command.
    auto simple = [&](const std::string& name, ipc::IpcStatus (HostCommands::*fn)())
    {
        d.register_handler(name, [&cmds, fn](InvokeArgs&) { return InvokeResult::from_status((cmds.*fn)()); });
    };

    // Analytics queries: optional "days", default one week.
    auto history = [&](const std::string& name, ipc::IpcStatus (HostCommands::*fn)(int))
    {
        d.register_handler(name,
                           [&cmds, fn](InvokeArgs& a)
                           {
                               int days = ipc::DEFAULT_HISTORY_DAYS;
                               if (!a.read_int_or("days", ipc::DEFAULT_HISTORY_DAYS, days))
                                   return a.failure();
                               return InvokeResult::from_status((cmds.*fn)(days));
                           });
    };

    // ─── Worker ──────────────────────────────────────────────────────────
    d.register_handler("send_to_worker",
                       [&cmds](InvokeArgs& a)
                       {
                           ipc::Json command;
                           if (!a.read_object("command", command))
                               return a.failure();
                           return InvokeResult::from_status(cmds.send_command(command));
                       });
    d.register_handler("is_worker_running",
                       [&cmds](InvokeArgs&) { return InvokeResult::success(cmds.is_worker_running()); });

    // ─── Breaks ──────────────────────────────────────────────────────────
    d.register_handler("log_hydration",
                       [&cmds](InvokeArgs& a)
                       {
                           int amount = 0;
                           if (!a.read_int("amount_ml", amount))
                               return a.failure();
                           return InvokeResult::from_status(cmds.log_hydration(amount));
                       });
    simple("complete_break", &HostCommands::complete_break);
    d.register_handler("snooze_break",
                       [&cmds](InvokeArgs& a)
                       {
                           int minutes = 0;
                           if (!a.read_int("minutes", minutes))
                               return a.failure();
                           return InvokeResult::from_status(cmds.snooze_break(minutes));
                       });
    simple("skip_break", &HostCommands::skip_break);
    simple("show_overlay", &HostCommands::show_overlay);
    simple("hide_overlay", &HostCommands::hide_overlay);

    d.register_handler("trigger_test_break",
                       [&cmds](InvokeArgs& a)
                       {
                           std::string type;
                           std::string color;
                           int         duration = 0;
                           if (!a.read_string("break_type", type) || !a.read_int("duration_seconds", duration)
                               || !a.read_string("theme_color", color))
                               return a.failure();
                           return InvokeResult::from_status(cmds.trigger_test_break(type, duration, color));
                       });

    d.register_handler("get_pending_break",
                       [&cmds](InvokeArgs&) { return from_payload(cmds.get_pending_break()); });
    d.register_handler("clear_pending_break",
                       [&cmds](InvokeArgs&)
                       {
                           cmds.clear_pending_break();
                           return InvokeResult::success();
                       });
    d.register_handler("get_pending_schedule_warning",
                       [&cmds](InvokeArgs&) { return from_payload(cmds.get_pending_schedule_warning()); });
    d.register_handler("clear_pending_schedule_warning",
                       [&cmds](InvokeArgs&)
                       {
                           cmds.clear_pending_schedule_warning();
                           return InvokeResult::success();
                       });

    // ─── Reminders, queries, settings ────────────────────────────────────
    d.register_handler("pause_reminders",
                       [&cmds](InvokeArgs& a)
                       {
                           std::optional<int> minutes;
                           if (!a.read_nullable_int("minutes", minutes))
                               return a.failure();
                           return InvokeResult::from_status(cmds.pause_reminders(minutes));
                       });
    simple("resume_reminders", &HostCommands::resume_reminders);
    simple("get_status", &HostCommands::get_status);
    simple("get_training_stats", &HostCommands::get_training_stats);
    simple("get_settings", &HostCommands::get_settings);
    d.register_handler("update_setting",
                       [&cmds](InvokeArgs& a)
                       {
                           std::string key;
                           std::string value;
                           if (!a.read_string("key", key) || !a.read_string("value", value))
                               return a.failure();
                           return InvokeResult::from_status(cmds.update_setting(key, value));
                       });
    d.register_handler("export_data",
                       [&cmds](InvokeArgs& a)
                       {
                           std::string path;
                           if (!a.read_string("path", path))
                               return a.failure();
                           return InvokeResult::from_status(cmds.export_data(path));
                       });

    // ─── Work session ────────────────────────────────────────────────────
    simple("start_session", &HostCommands::start_session);
    simple("pause_session", &HostCommands::pause_session);
    simple("resume_session", &HostCommands::resume_session);
    simple("end_session", &HostCommands::end_session);

    // ─── Schedule rules ──────────────────────────────────────────────────
    simple("get_schedule_rules", &HostCommands::get_schedule_rules);
    d.register_handler("add_schedule_rule",
                       [&cmds](InvokeArgs& a)
                       {
                           ipc::ScheduleRule rule;
                           if (!read_schedule_rule(a, rule))
                               return a.failure();
                           return InvokeResult::from_status(cmds.add_schedule_rule(rule));
                       });
    d.register_handler("update_schedule_rule",
                       [&cmds](InvokeArgs& a)
                       {
                           ipc::ScheduleRule rule;
                           int               id      = 0;
                           bool              enabled = true;
                           if (!a.read_int("id", id) || !read_schedule_rule(a, rule) || !a.read_bool("enabled", enabled))
                               return a.failure();
                           return InvokeResult::from_status(cmds.update_schedule_rule(id, rule, enabled));
                       });
    d.register_handler("delete_schedule_rule",
                       [&cmds](InvokeArgs& a)
                       {
                           int id = 0;
                           if (!a.read_int("id", id))
                               return a.failure();
                           return InvokeResult::from_status(cmds.delete_schedule_rule(id));
                       });
    simple("reset_all_timers", &HostCommands::reset_all_timers);

    // ─── Analytics ───────────────────────────────────────────────────────
    history("get_break_stats", &HostCommands::get_break_stats);
    simple("get_breaks_today", &HostCommands::get_breaks_today);
    history("get_break_history", &HostCommands::get_break_history);
    history("get_hydration_history", &HostCommands::get_hydration_history);
    history("get_focus_stats", &HostCommands::get_focus_stats);
    history("get_activity_heatmap", &HostCommands::get_activity_heatmap);

    // ─── Diagnostics ─────────────────────────────────────────────────────
    d.register_handler("debug_notification",
                       [&cmds](InvokeArgs&)
                       {
                           cmds.trigger_debug_notification();
                           return InvokeResult::success();
                       });

    // ─── Autostart ───────────────────────────────────────────────────────
    simple("enable_autostart", &HostCommands::enable_autostart);
    simple("disable_autostart", &HostCommands::disable_autostart);
    d.register_handler("is_autostart_enabled",
                       [&cmds](InvokeArgs&)
                       {
                           bool enabled = false;
                           auto status  = cmds.is_autostart_enabled(enabled);
                           if (!status.ok())
                               return InvokeResult::failure(status.message());
                           return InvokeResult::success(enabled);
                       });

    // ─── Surfaces ────────────────────────────────────────────────────────
    d.register_handler("surface_ready",
                       [&router](InvokeArgs& a)
                       {
                           std::string surface;
                           if (!a.read_string("surface", surface))
                               return a.failure();
                           return InvokeResult::success(router.surface_ready(surface));
                       });
    d.register_handler("close_surface",
                       [&surfaces](InvokeArgs& a)
                       {
                           std::string surface;
                           if (!a.read_string("surface", surface))
                               return a.failure();
                           if (!surfaces.hide(surface))
                               return InvokeResult::failure("unknown surface: " + surface);
                           return InvokeResult::success();
                       });

    // ─── Tray ────────────────────────────────────────────────────────────
    if (tray)
    {
        d.register_handler("tray_action",
                           [tray](InvokeArgs& a)
                           {
                               std::string id;
                               if (!a.read_string("action", id))
                                   return a.failure();
                               if (!tray->on_menu_event(id))
                                   return InvokeResult::failure("unknown tray action: " + id);
                               return InvokeResult::success();
                           });
        d.register_handler("tray_click",
                           [tray](InvokeArgs&)
                           {
                               tray->on_icon_click();
                               return InvokeResult::success();
                           });
    }
}

}   // namespace tether::app
