#include "tray_actions.hpp"

#include "../ipc/commands.hpp"

#include <tether/logger.hpp>

namespace tether::app
{

namespace
{

struct ActionInfo
{
    TrayAction  action;
    const char* id;
    const char* label;
    int         pause_minutes;
};

constexpr ActionInfo ACTIONS[] = {
    {TrayAction::Show, "show", "Show Dashboard", 0},
    {TrayAction::Pause30m, "pause_30m", "Pause 30 min", 30},
    {TrayAction::Pause1h, "pause_1h", "Pause 1 hour", 60},
    {TrayAction::Pause2h, "pause_2h", "Pause 2 hours", 120},
    {TrayAction::PauseMovie, "pause_movie", "Movie mode (8h)", 480},
    {TrayAction::Resume, "resume", "Resume", 0},
    {TrayAction::Quit, "quit", "Quit", 0},
};

const ActionInfo* info_for(TrayAction action)
{
    for (const auto& info : ACTIONS)
    {
        if (info.action == action)
            return &info;
    }
    return nullptr;
}

}   // namespace

const char* tray_action_id(TrayAction action)
{
    const ActionInfo* info = info_for(action);
    return info ? info->id : "unknown";
}

std::optional<TrayAction> parse_tray_action(std::string_view id)
{
    for (const auto& info : ACTIONS)
    {
        if (id == info.id)
            return info.action;
    }
    return std::nullopt;
}

int tray_pause_minutes(TrayAction action)
{
    const ActionInfo* info = info_for(action);
    return info ? info->pause_minutes : 0;
}

std::vector<TrayMenuItem> tray_menu()
{
    auto item = [](TrayAction a) { return TrayMenuItem{info_for(a)->id, info_for(a)->label, true}; };

    return {
        item(TrayAction::Show),
        {"sep1", "", false},
        item(TrayAction::Pause30m),
        item(TrayAction::Pause1h),
        item(TrayAction::Pause2h),
        item(TrayAction::PauseMovie),
        item(TrayAction::Resume),
        {"sep2", "", false},
        item(TrayAction::Quit),
    };
}

// ─── TrayController ──────────────────────────────────────────────────────────

TrayController::TrayController(daemon::Supervisor&       supervisor,
                               daemon::SurfaceHost&      surfaces,
                               std::string               channel_prefix,
                               std::chrono::milliseconds shutdown_grace,
                               QuitCallback              on_quit)
    : supervisor_(supervisor),
      surfaces_(surfaces),
      channel_prefix_(std::move(channel_prefix)),
      shutdown_grace_(shutdown_grace),
      on_quit_(std::move(on_quit))
{
}

void TrayController::on_action(TrayAction action)
{
    TETHER_LOG_DEBUG("tray", "Action {}", tray_action_id(action));
    switch (action)
    {
        case TrayAction::Show:
            show_session();
            break;
        case TrayAction::Pause30m:
        case TrayAction::Pause1h:
        case TrayAction::Pause2h:
        case TrayAction::PauseMovie:
            pause(tray_pause_minutes(action));
            break;
        case TrayAction::Resume:
            resume();
            break;
        case TrayAction::Quit:
            quit();
            break;
    }
}

bool TrayController::on_menu_event(std::string_view id)
{
    auto action = parse_tray_action(id);
    if (!action)
    {
        TETHER_LOG_DEBUG("tray", "Ignoring menu id {}", id);
        return false;
    }
    on_action(*action);
    return true;
}

void TrayController::on_icon_click()
{
    show_session();
}

void TrayController::show_session()
{
    surfaces_.show(daemon::SURFACE_SESSION);
    surfaces_.focus(daemon::SURFACE_SESSION);
}

void TrayController::pause(int minutes)
{
    auto status = supervisor_.submit(ipc::make_pause(minutes));
    if (!status.ok())
        TETHER_LOG_WARN("tray", "Pause not delivered: {}", status.to_string());
    surfaces_.broadcast(channel_prefix_ + "paused", ipc::Json{{"minutes", minutes}});
}

void TrayController::resume()
{
    auto status = supervisor_.submit(ipc::make_resume());
    if (!status.ok())
        TETHER_LOG_WARN("tray", "Resume not delivered: {}", status.to_string());
    surfaces_.broadcast(channel_prefix_ + "resumed", ipc::Json::object());
}

void TrayController::quit()
{
    TETHER_LOG_INFO("tray", "Quit requested");
    supervisor_.shutdown(shutdown_grace_);
    if (on_quit_)
        on_quit_();
}

}   // namespace tether::app
