#pragma once

#include "../ipc/message.hpp"

#include <string>

namespace tether::app
{

// Login autostart through an XDG desktop entry.  The entry launches the
// host with --minimized so it comes up in the background.
class Autostart
{
   public:
    // `autostart_dir` defaults to default_dir().
    explicit Autostart(std::string executable, std::string autostart_dir = default_dir());

    ipc::IpcStatus enable();
    ipc::IpcStatus disable();   // not an error if already disabled

    // Sets `enabled`; fails only if the entry exists but cannot be inspected.
    ipc::IpcStatus is_enabled(bool& enabled) const;

    std::string entry_path() const;
    std::string desktop_entry() const;

    // $XDG_CONFIG_HOME/autostart, else ~/.config/autostart.
    static std::string default_dir();

    static constexpr const char* ENTRY_FILE = "tether.desktop";

   private:
    std::string executable_;
    std::string dir_;
};

}   // namespace tether::app
