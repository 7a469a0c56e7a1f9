#pragma once

#include "../daemon/supervisor.hpp"
#include "../daemon/surface_host.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tether::app
{

enum class TrayAction : uint8_t
{
    Show,
    Pause30m,
    Pause1h,
    Pause2h,
    PauseMovie,
    Resume,
    Quit,
};

const char*               tray_action_id(TrayAction action);
std::optional<TrayAction> parse_tray_action(std::string_view id);

// Pause length for the pause actions, 0 for everything else.
int tray_pause_minutes(TrayAction action);

struct TrayMenuItem
{
    std::string id;
    std::string label;
    bool        enabled = true;   // separators are disabled items
};

// Menu in display order.
std::vector<TrayMenuItem> tray_menu();

// Tray menu behavior.  Worker-bound actions are best effort: a failed
// submission is logged and the listener notification still goes out.
class TrayController
{
   public:
    using QuitCallback = std::function<void()>;

    TrayController(daemon::Supervisor&       supervisor,
                   daemon::SurfaceHost&      surfaces,
                   std::string               channel_prefix,
                   std::chrono::milliseconds shutdown_grace,
                   QuitCallback              on_quit);

    void on_action(TrayAction action);

    // Returns false for an unknown menu id.
    bool on_menu_event(std::string_view id);

    // Left click on the tray icon.
    void on_icon_click();

   private:
    void show_session();
    void pause(int minutes);
    void resume();
    void quit();

    daemon::Supervisor&       supervisor_;
    daemon::SurfaceHost&      surfaces_;
    std::string               channel_prefix_;
    std::chrono::milliseconds shutdown_grace_;
    QuitCallback              on_quit_;
};

}   // namespace tether::app
