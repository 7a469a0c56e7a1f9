#include "console_surface_host.hpp"

#include "../ipc/codec.hpp"

#include <tether/logger.hpp>

namespace tether::app
{

ConsoleSurfaceHost::ConsoleSurfaceHost(std::ostream& out, std::optional<daemon::ScreenSize> display)
    : out_(out), display_(display)
{
    for (auto name : {daemon::SURFACE_MAIN,
                      daemon::SURFACE_SESSION,
                      daemon::SURFACE_OVERLAY,
                      daemon::SURFACE_NOTIFICATION})
        surfaces_.emplace(std::string(name), SurfaceState{});
}

void ConsoleSurfaceHost::add_surface(std::string_view surface)
{
    std::lock_guard lock(mu_);
    surfaces_.emplace(std::string(surface), SurfaceState{});
}

void ConsoleSurfaceHost::remove_surface(std::string_view surface)
{
    std::lock_guard lock(mu_);
    auto            it = surfaces_.find(surface);
    if (it != surfaces_.end())
        surfaces_.erase(it);
}

bool ConsoleSurfaceHost::close_requested(std::string_view surface)
{
    return hide(surface);
}

std::optional<SurfaceState> ConsoleSurfaceHost::surface_state(std::string_view surface) const
{
    std::lock_guard lock(mu_);
    auto            it = surfaces_.find(surface);
    if (it == surfaces_.end())
        return std::nullopt;
    return it->second;
}

void ConsoleSurfaceHost::write_line(const ipc::Json& line)
{
    std::lock_guard lock(mu_);
    write_locked(line);
}

// ─── SurfaceHost ─────────────────────────────────────────────────────────────

bool ConsoleSurfaceHost::has_surface(std::string_view surface) const
{
    std::lock_guard lock(mu_);
    return surfaces_.find(surface) != surfaces_.end();
}

bool ConsoleSurfaceHost::show(std::string_view surface)
{
    std::lock_guard lock(mu_);
    SurfaceState*   s = find_locked(surface);
    if (!s)
        return false;
    s->visible = true;
    emit_state_locked(std::string(surface), *s);
    return true;
}

bool ConsoleSurfaceHost::hide(std::string_view surface)
{
    std::lock_guard lock(mu_);
    SurfaceState*   s = find_locked(surface);
    if (!s)
        return false;
    s->visible = false;
    s->focused = false;
    emit_state_locked(std::string(surface), *s);
    return true;
}

bool ConsoleSurfaceHost::focus(std::string_view surface)
{
    std::lock_guard lock(mu_);
    SurfaceState*   s = find_locked(surface);
    if (!s)
        return false;
    for (auto& [name, state] : surfaces_)
        state.focused = false;
    s->focused = true;
    emit_state_locked(std::string(surface), *s);
    return true;
}

bool ConsoleSurfaceHost::set_position(std::string_view surface, daemon::ScreenPoint p)
{
    std::lock_guard lock(mu_);
    SurfaceState*   s = find_locked(surface);
    if (!s)
        return false;
    s->position = p;
    emit_state_locked(std::string(surface), *s);
    return true;
}

bool ConsoleSurfaceHost::set_always_on_top(std::string_view surface, bool on)
{
    std::lock_guard lock(mu_);
    SurfaceState*   s = find_locked(surface);
    if (!s)
        return false;
    s->always_on_top = on;
    emit_state_locked(std::string(surface), *s);
    return true;
}

std::optional<daemon::ScreenSize> ConsoleSurfaceHost::display_size(std::string_view surface) const
{
    std::lock_guard lock(mu_);
    if (surfaces_.find(surface) == surfaces_.end())
        return std::nullopt;
    return display_;
}

bool ConsoleSurfaceHost::push_event(std::string_view surface, std::string_view event, const ipc::Json& payload)
{
    std::lock_guard lock(mu_);
    if (!find_locked(surface))
        return false;
    write_locked({{"kind", "push"},
                  {"surface", std::string(surface)},
                  {"event", std::string(event)},
                  {"payload", payload}});
    return true;
}

void ConsoleSurfaceHost::broadcast(std::string_view event, const ipc::Json& payload)
{
    std::lock_guard lock(mu_);
    write_locked({{"kind", "broadcast"}, {"event", std::string(event)}, {"payload", payload}});
}

// ─── Internals ───────────────────────────────────────────────────────────────

SurfaceState* ConsoleSurfaceHost::find_locked(std::string_view surface)
{
    auto it = surfaces_.find(surface);
    return it == surfaces_.end() ? nullptr : &it->second;
}

void ConsoleSurfaceHost::emit_state_locked(const std::string& surface, const SurfaceState& state)
{
    write_locked({
        {"kind", "surface"},
        {"surface", surface},
        {"visible", state.visible},
        {"focused", state.focused},
        {"always_on_top", state.always_on_top},
        {"x", state.position.x},
        {"y", state.position.y},
    });
}

void ConsoleSurfaceHost::write_locked(const ipc::Json& line)
{
    out_ << line.dump(-1, ' ', false, ipc::Json::error_handler_t::replace) << '\n';
    out_.flush();
    if (!out_)
        TETHER_LOG_WARN("host", "Presentation stream write failed");
}

}   // namespace tether::app
