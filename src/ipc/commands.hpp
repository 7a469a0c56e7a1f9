#pragma once

#include "message.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tether::ipc
{

// Builders for every command the worker understands.  Each one always emits
// the same key set for its command name; optional values become null.

static constexpr int DEFAULT_HISTORY_DAYS = 7;

// ─── Breaks and hydration ────────────────────────────────────────────────────
OutboundCommand make_log_hydration(int amount_ml);
OutboundCommand make_complete_break();
OutboundCommand make_snooze_break(int minutes);
OutboundCommand make_skip_break();

// ─── Reminders ───────────────────────────────────────────────────────────────
// minutes == nullopt pauses until an explicit resume.
OutboundCommand make_pause(std::optional<int> minutes);
OutboundCommand make_resume();

// ─── Queries and settings ────────────────────────────────────────────────────
OutboundCommand make_get_status();
OutboundCommand make_get_training_stats();
OutboundCommand make_get_settings();
OutboundCommand make_update_setting(const std::string& key, const std::string& value);
OutboundCommand make_export_data(const std::string& path);

// ─── Work session ────────────────────────────────────────────────────────────
OutboundCommand make_start_session();
OutboundCommand make_pause_session();
OutboundCommand make_resume_session();
OutboundCommand make_end_session();
OutboundCommand make_reset_all_timers();

// ─── Schedule rules ──────────────────────────────────────────────────────────
struct ScheduleRule
{
    std::string              time;     // "HH:MM"
    std::string              action;   // e.g. "start_session", "pause"
    std::vector<std::string> days;     // e.g. {"mon", "tue"}
    std::optional<std::string> title;  // serialized as "" when absent
};

OutboundCommand make_get_schedule_rules();
OutboundCommand make_add_schedule_rule(const ScheduleRule& rule);
OutboundCommand make_update_schedule_rule(int id, const ScheduleRule& rule, bool enabled);
OutboundCommand make_delete_schedule_rule(int id);

// ─── Analytics ───────────────────────────────────────────────────────────────
OutboundCommand make_get_break_stats(int days = DEFAULT_HISTORY_DAYS);
OutboundCommand make_get_breaks_today();
OutboundCommand make_get_break_history(int days = DEFAULT_HISTORY_DAYS);
OutboundCommand make_get_hydration_history(int days = DEFAULT_HISTORY_DAYS);
OutboundCommand make_get_focus_stats(int days = DEFAULT_HISTORY_DAYS);
OutboundCommand make_get_activity_heatmap(int days = DEFAULT_HISTORY_DAYS);

// ─── Lifecycle ───────────────────────────────────────────────────────────────
OutboundCommand make_shutdown();

}   // namespace tether::ipc
