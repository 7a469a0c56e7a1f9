#pragma once

#include "../daemon/surface_host.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace tether::app
{

struct SurfaceState
{
    bool                visible       = false;
    bool                focused       = false;
    bool                always_on_top = false;
    daemon::ScreenPoint position;
};

// Headless SurfaceHost.  Tracks the state of each named surface and writes
// every state change, push and broadcast to `out` as one JSON line:
//
//   {"kind":"surface","surface":"overlay","visible":true,...}
//   {"kind":"push","surface":"overlay","event":"show-break","payload":{...}}
//   {"kind":"broadcast","event":"worker-status","payload":{...}}
//
// Thread-safe; lines never interleave.
class ConsoleSurfaceHost : public daemon::SurfaceHost
{
   public:
    // Creates main, session, overlay and notification.
    explicit ConsoleSurfaceHost(std::ostream&                     out,
                                std::optional<daemon::ScreenSize> display = std::nullopt);

    void add_surface(std::string_view surface);
    void remove_surface(std::string_view surface);

    // A close request hides the surface instead of destroying it.
    bool close_requested(std::string_view surface);

    std::optional<SurfaceState> surface_state(std::string_view surface) const;

    // Writes an arbitrary JSON line (invoke responses).
    void write_line(const ipc::Json& line);

    // daemon::SurfaceHost
    bool has_surface(std::string_view surface) const override;
    bool show(std::string_view surface) override;
    bool hide(std::string_view surface) override;
    bool focus(std::string_view surface) override;
    bool set_position(std::string_view surface, daemon::ScreenPoint p) override;
    bool set_always_on_top(std::string_view surface, bool on) override;
    std::optional<daemon::ScreenSize> display_size(std::string_view surface) const override;
    bool push_event(std::string_view surface, std::string_view event, const ipc::Json& payload) override;
    void broadcast(std::string_view event, const ipc::Json& payload) override;

   private:
    SurfaceState* find_locked(std::string_view surface);
    void          emit_state_locked(const std::string& surface, const SurfaceState& state);
    void          write_locked(const ipc::Json& line);

    mutable std::mutex                  mu_;
    std::ostream&                       out_;
    std::optional<daemon::ScreenSize>   display_;
    std::map<std::string, SurfaceState, std::less<>> surfaces_;
};

}   // namespace tether::app
