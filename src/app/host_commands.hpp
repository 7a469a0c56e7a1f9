#pragma once

#include "../daemon/event_router.hpp"
#include "../daemon/handoff_store.hpp"
#include "../daemon/supervisor.hpp"
#include "../daemon/surface_host.hpp"
#include "../ipc/commands.hpp"
#include "../ipc/message.hpp"
#include "autostart.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace tether::app
{

// Record id carried by test breaks so the worker never confuses them with
// a real break.
static constexpr int TEST_BREAK_RECORD_ID = 999;

// Operations the presentation layer can request.  Each worker-bound command
// is a thin wrapper over Supervisor::submit(); the status message is the
// error string returned to the caller.
class HostCommands
{
   public:
    HostCommands(daemon::Supervisor&   supervisor,
                 daemon::EventRouter&  router,
                 daemon::HandoffState& handoff,
                 daemon::SurfaceHost&  surfaces,
                 Autostart&            autostart,
                 std::chrono::milliseconds debug_notification_delay = std::chrono::milliseconds(500));

    // ─── Worker ──────────────────────────────────────────────────────────
    // Raw {"cmd": ..., ...} object.
    ipc::IpcStatus send_command(const ipc::Json& command);
    bool           is_worker_running() const;

    // ─── Breaks ──────────────────────────────────────────────────────────
    ipc::IpcStatus log_hydration(int amount_ml);
    // The three break replies hide the overlay before notifying the worker.
    ipc::IpcStatus complete_break();
    ipc::IpcStatus snooze_break(int minutes);
    ipc::IpcStatus skip_break();

    ipc::IpcStatus show_overlay();   // show + focus
    ipc::IpcStatus hide_overlay();

    ipc::IpcStatus trigger_test_break(const std::string& break_type,
                                      int                duration_seconds,
                                      const std::string& theme_color);

    std::optional<ipc::Json> get_pending_break() const;
    void                     clear_pending_break();
    std::optional<ipc::Json> get_pending_schedule_warning() const;
    void                     clear_pending_schedule_warning();

    // ─── Reminders, queries, settings ────────────────────────────────────
    ipc::IpcStatus pause_reminders(std::optional<int> minutes);
    ipc::IpcStatus resume_reminders();
    ipc::IpcStatus get_status();
    ipc::IpcStatus get_training_stats();
    ipc::IpcStatus get_settings();
    ipc::IpcStatus update_setting(const std::string& key, const std::string& value);
    ipc::IpcStatus export_data(const std::string& path);

    // ─── Work session ────────────────────────────────────────────────────
    ipc::IpcStatus start_session();
    ipc::IpcStatus pause_session();
    ipc::IpcStatus resume_session();
    ipc::IpcStatus end_session();

    // ─── Schedule rules ──────────────────────────────────────────────────
    ipc::IpcStatus get_schedule_rules();
    ipc::IpcStatus add_schedule_rule(const ipc::ScheduleRule& rule);
    ipc::IpcStatus update_schedule_rule(int id, const ipc::ScheduleRule& rule, bool enabled);
    ipc::IpcStatus delete_schedule_rule(int id);
    ipc::IpcStatus reset_all_timers();

    // ─── Analytics ───────────────────────────────────────────────────────
    ipc::IpcStatus get_break_stats(int days);
    ipc::IpcStatus get_breaks_today();
    ipc::IpcStatus get_break_history(int days);
    ipc::IpcStatus get_hydration_history(int days);
    ipc::IpcStatus get_focus_stats(int days);
    ipc::IpcStatus get_activity_heatmap(int days);

    // ─── Diagnostics ─────────────────────────────────────────────────────
    // Presents a dummy schedule warning on the notification surface.
    void trigger_debug_notification();

    // ─── Autostart ───────────────────────────────────────────────────────
    ipc::IpcStatus enable_autostart();
    ipc::IpcStatus disable_autostart();
    ipc::IpcStatus is_autostart_enabled(bool& enabled) const;

   private:
    ipc::IpcStatus submit(const ipc::OutboundCommand& cmd);

    daemon::Supervisor&       supervisor_;
    daemon::EventRouter&      router_;
    daemon::HandoffState&     handoff_;
    daemon::SurfaceHost&      surfaces_;
    Autostart&                autostart_;
    std::chrono::milliseconds debug_notification_delay_;
};

}   // namespace tether::app
