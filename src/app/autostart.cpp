#include "autostart.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

#include <tether/logger.hpp>

namespace tether::app
{

namespace fs = std::filesystem;

Autostart::Autostart(std::string executable, std::string autostart_dir)
    : executable_(std::move(executable)), dir_(std::move(autostart_dir))
{
}

std::string Autostart::default_dir()
{
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg)
        return (fs::path(xdg) / "autostart").string();

    const char* home = std::getenv("HOME");
    if (!home)
        return "autostart";
    return (fs::path(home) / ".config" / "autostart").string();
}

std::string Autostart::entry_path() const
{
    return (fs::path(dir_) / ENTRY_FILE).string();
}

std::string Autostart::desktop_entry() const
{
    std::string exec = executable_;
    if (exec.find(' ') != std::string::npos)
        exec = "\"" + exec + "\"";

    return "[Desktop Entry]\n"
           "Type=Application\n"
           "Name=Tether\n"
           "Comment=Worker supervisor\n"
           "Exec=" + exec + " --minimized\n"
           "Terminal=false\n"
           "X-GNOME-Autostart-enabled=true\n";
}

ipc::IpcStatus Autostart::enable()
{
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec)
        return {ipc::ErrorCode::Io, "cannot create " + dir_ + ": " + ec.message()};

    std::ofstream f(entry_path(), std::ios::trunc);
    if (!f.is_open())
        return {ipc::ErrorCode::Io, "cannot write " + entry_path()};
    f << desktop_entry();
    f.close();
    if (!f)
        return {ipc::ErrorCode::Io, "failed writing " + entry_path()};

    TETHER_LOG_INFO("autostart", "Enabled ({})", entry_path());
    return ipc::IpcStatus::success();
}

ipc::IpcStatus Autostart::disable()
{
    std::error_code ec;
    bool            removed = fs::remove(entry_path(), ec);
    if (ec)
        return {ipc::ErrorCode::Io, "cannot remove " + entry_path() + ": " + ec.message()};

    if (removed)
        TETHER_LOG_INFO("autostart", "Disabled");
    return ipc::IpcStatus::success();
}

ipc::IpcStatus Autostart::is_enabled(bool& enabled) const
{
    std::error_code ec;
    enabled = fs::is_regular_file(entry_path(), ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        return {ipc::ErrorCode::Io, "cannot inspect " + entry_path() + ": " + ec.message()};
    return ipc::IpcStatus::success();
}

}   // namespace tether::app
