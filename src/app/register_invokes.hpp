#pragma once

namespace tether::daemon
{
class EventRouter;
class SurfaceHost;
}   // namespace tether::daemon

namespace tether::app
{

class HostCommands;
class InvokeDispatcher;
class TrayController;

// Objects the invoke handlers call into.  All must outlive the dispatcher.
struct InvokeBindings
{
    HostCommands*        commands = nullptr;
    daemon::EventRouter* router   = nullptr;
    daemon::SurfaceHost* surfaces = nullptr;
    TrayController*      tray     = nullptr;   // optional
};

// Registers every host command under its snake_case invoke name, plus the
// surface handshake ("surface_ready", "close_surface") and tray entry points
// ("tray_action", "tray_click").
void register_host_invokes(InvokeDispatcher& dispatcher, const InvokeBindings& bindings);

}   // namespace tether::app
