#include "host_commands.hpp"

#include "../ipc/codec.hpp"

#include <tether/logger.hpp>

namespace tether::app
{

using ipc::IpcStatus;

HostCommands::HostCommands(daemon::Supervisor&       supervisor,
                           daemon::EventRouter&      router,
                           daemon::HandoffState&     handoff,
                           daemon::SurfaceHost&      surfaces,
                           Autostart&                autostart,
                           std::chrono::milliseconds debug_notification_delay)
    : supervisor_(supervisor),
      router_(router),
      handoff_(handoff),
      surfaces_(surfaces),
      autostart_(autostart),
      debug_notification_delay_(debug_notification_delay)
{
}

IpcStatus HostCommands::submit(const ipc::OutboundCommand& cmd)
{
    return supervisor_.submit(cmd);
}

// ─── Worker ──────────────────────────────────────────────────────────────────

IpcStatus HostCommands::send_command(const ipc::Json& command)
{
    std::string error;
    auto        cmd = ipc::command_from_json(command, &error);
    if (!cmd)
        return {ipc::ErrorCode::InvalidCommand, error};
    return submit(*cmd);
}

bool HostCommands::is_worker_running() const
{
    return supervisor_.is_running();
}

// ─── Breaks ──────────────────────────────────────────────────────────────────

IpcStatus HostCommands::log_hydration(int amount_ml)
{
    return submit(ipc::make_log_hydration(amount_ml));
}

IpcStatus HostCommands::complete_break()
{
    surfaces_.hide(daemon::SURFACE_OVERLAY);
    return submit(ipc::make_complete_break());
}

IpcStatus HostCommands::snooze_break(int minutes)
{
    surfaces_.hide(daemon::SURFACE_OVERLAY);
    return submit(ipc::make_snooze_break(minutes));
}

IpcStatus HostCommands::skip_break()
{
    surfaces_.hide(daemon::SURFACE_OVERLAY);
    return submit(ipc::make_skip_break());
}

IpcStatus HostCommands::show_overlay()
{
    if (!surfaces_.show(daemon::SURFACE_OVERLAY))
        return {ipc::ErrorCode::SurfaceMissing, "Overlay window not found"};
    surfaces_.focus(daemon::SURFACE_OVERLAY);
    return IpcStatus::success();
}

IpcStatus HostCommands::hide_overlay()
{
    if (!surfaces_.hide(daemon::SURFACE_OVERLAY))
        return {ipc::ErrorCode::SurfaceMissing, "Overlay window not found"};
    return IpcStatus::success();
}

IpcStatus HostCommands::trigger_test_break(const std::string& break_type,
                                           int                duration_seconds,
                                           const std::string& theme_color)
{
    ipc::Json data = {
        {"break_type", break_type},
        {"duration_seconds", duration_seconds},
        {"theme_color", theme_color},
        {"record_id", TEST_BREAK_RECORD_ID},
    };
    TETHER_LOG_INFO("host", "Triggering test break ({})", break_type);
    router_.present(ipc::EVT_BREAK_DUE, data);
    return IpcStatus::success();
}

std::optional<ipc::Json> HostCommands::get_pending_break() const
{
    return handoff_.pending_break().get_and_peek();
}

void HostCommands::clear_pending_break()
{
    handoff_.pending_break().clear();
}

std::optional<ipc::Json> HostCommands::get_pending_schedule_warning() const
{
    return handoff_.pending_schedule_warning().get_and_peek();
}

void HostCommands::clear_pending_schedule_warning()
{
    handoff_.pending_schedule_warning().clear();
}

// ─── Reminders, queries, settings ────────────────────────────────────────────

IpcStatus HostCommands::pause_reminders(std::optional<int> minutes)
{
    return submit(ipc::make_pause(minutes));
}

IpcStatus HostCommands::resume_reminders()
{
    return submit(ipc::make_resume());
}

IpcStatus HostCommands::get_status()
{
    return submit(ipc::make_get_status());
}

IpcStatus HostCommands::get_training_stats()
{
    return submit(ipc::make_get_training_stats());
}

IpcStatus HostCommands::get_settings()
{
    return submit(ipc::make_get_settings());
}

IpcStatus HostCommands::update_setting(const std::string& key, const std::string& value)
{
    return submit(ipc::make_update_setting(key, value));
}

IpcStatus HostCommands::export_data(const std::string& path)
{
    return submit(ipc::make_export_data(path));
}

// ─── Work session ────────────────────────────────────────────────────────────

IpcStatus HostCommands::start_session()
{
    return submit(ipc::make_start_session());
}

IpcStatus HostCommands::pause_session()
{
    return submit(ipc::make_pause_session());
}

IpcStatus HostCommands::resume_session()
{
    return submit(ipc::make_resume_session());
}

IpcStatus HostCommands::end_session()
{
    return submit(ipc::make_end_session());
}

// ─── Schedule rules ──────────────────────────────────────────────────────────

IpcStatus HostCommands::get_schedule_rules()
{
    return submit(ipc::make_get_schedule_rules());
}

IpcStatus HostCommands::add_schedule_rule(const ipc::ScheduleRule& rule)
{
    return submit(ipc::make_add_schedule_rule(rule));
}

IpcStatus HostCommands::update_schedule_rule(int id, const ipc::ScheduleRule& rule, bool enabled)
{
    return submit(ipc::make_update_schedule_rule(id, rule, enabled));
}

IpcStatus HostCommands::delete_schedule_rule(int id)
{
    return submit(ipc::make_delete_schedule_rule(id));
}

IpcStatus HostCommands::reset_all_timers()
{
    return submit(ipc::make_reset_all_timers());
}

// ─── Analytics ───────────────────────────────────────────────────────────────

IpcStatus HostCommands::get_break_stats(int days)
{
    return submit(ipc::make_get_break_stats(days));
}

IpcStatus HostCommands::get_breaks_today()
{
    return submit(ipc::make_get_breaks_today());
}

IpcStatus HostCommands::get_break_history(int days)
{
    return submit(ipc::make_get_break_history(days));
}

IpcStatus HostCommands::get_hydration_history(int days)
{
    return submit(ipc::make_get_hydration_history(days));
}

IpcStatus HostCommands::get_focus_stats(int days)
{
    return submit(ipc::make_get_focus_stats(days));
}

IpcStatus HostCommands::get_activity_heatmap(int days)
{
    return submit(ipc::make_get_activity_heatmap(days));
}

// ─── Diagnostics ─────────────────────────────────────────────────────────────

void HostCommands::trigger_debug_notification()
{
    ipc::Json dummy = {
        {"title", "Debug Test Warning"},
        {"action", "pause"},
        {"seconds_remaining", 60},
    };
    daemon::PresentOptions options;
    options.push_delay = debug_notification_delay_;
    options.stage      = false;
    router_.present(ipc::EVT_SCHEDULE_WARNING, dummy, options);
}

// ─── Autostart ───────────────────────────────────────────────────────────────

IpcStatus HostCommands::enable_autostart()
{
    return autostart_.enable();
}

IpcStatus HostCommands::disable_autostart()
{
    return autostart_.disable();
}

IpcStatus HostCommands::is_autostart_enabled(bool& enabled) const
{
    return autostart_.is_enabled(enabled);
}

}   // namespace tether::app
