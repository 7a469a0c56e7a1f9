#pragma once

#include "../ipc/message.hpp"

#include <optional>
#include <string_view>

namespace tether::daemon
{

// Logical surface names used by the routing rules and host commands.
inline constexpr std::string_view SURFACE_MAIN         = "main";
inline constexpr std::string_view SURFACE_SESSION      = "session";
inline constexpr std::string_view SURFACE_OVERLAY      = "overlay";
inline constexpr std::string_view SURFACE_NOTIFICATION = "notification";

struct ScreenSize
{
    int width  = 0;
    int height = 0;

    bool operator==(const ScreenSize&) const = default;
};

struct ScreenPoint
{
    int x = 0;
    int y = 0;

    bool operator==(const ScreenPoint&) const = default;
};

// Presentation layer seen from the router: named surfaces that can be shown,
// positioned and pushed to, plus a broadcast channel for every listener.
// Every operation addressed to a surface returns false if the surface does
// not exist; callers treat that as a silent no-op.
// Implementations must be callable from any thread.
class SurfaceHost
{
   public:
    virtual ~SurfaceHost() = default;

    virtual bool has_surface(std::string_view surface) const = 0;

    virtual bool show(std::string_view surface)                        = 0;
    virtual bool hide(std::string_view surface)                        = 0;
    virtual bool focus(std::string_view surface)                       = 0;
    virtual bool set_position(std::string_view surface, ScreenPoint p) = 0;
    virtual bool set_always_on_top(std::string_view surface, bool on)  = 0;

    // Size of the display the surface is on (current monitor, else primary).
    virtual std::optional<ScreenSize> display_size(std::string_view surface) const = 0;

    // Deliver a named event to one surface.
    virtual bool push_event(std::string_view surface, std::string_view event, const ipc::Json& payload) = 0;

    // Deliver a named event to every listener.
    virtual void broadcast(std::string_view event, const ipc::Json& payload) = 0;
};

}   // namespace tether::daemon
