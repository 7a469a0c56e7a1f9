#include <gtest/gtest.h>

#include "app/console_surface_host.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace tether;
using namespace tether::app;
using tether::ipc::Json;

namespace
{

std::vector<Json> lines(const std::ostringstream& out)
{
    std::vector<Json>  result;
    std::istringstream in(out.str());
    std::string        line;
    while (std::getline(in, line))
        result.push_back(Json::parse(line));
    return result;
}

}   // namespace

TEST(ConsoleSurfaceHost, StandardSurfacesExist)
{
    std::ostringstream out;
    ConsoleSurfaceHost host(out);
    for (auto name : {daemon::SURFACE_MAIN,
                      daemon::SURFACE_SESSION,
                      daemon::SURFACE_OVERLAY,
                      daemon::SURFACE_NOTIFICATION})
    {
        EXPECT_TRUE(host.has_surface(name));
        auto state = host.surface_state(name);
        ASSERT_TRUE(state.has_value());
        EXPECT_FALSE(state->visible);
    }
    EXPECT_FALSE(host.has_surface("settings"));
    EXPECT_TRUE(out.str().empty());
}

TEST(ConsoleSurfaceHost, ShowWritesStateLine)
{
    std::ostringstream out;
    ConsoleSurfaceHost host(out);
    ASSERT_TRUE(host.show(daemon::SURFACE_OVERLAY));

    auto written = lines(out);
    ASSERT_EQ(written.size(), 1u);
    EXPECT_EQ(written[0]["kind"], "surface");
    EXPECT_EQ(written[0]["surface"], "overlay");
    EXPECT_EQ(written[0]["visible"], true);
    EXPECT_EQ(written[0]["focused"], false);
}

TEST(ConsoleSurfaceHost, FocusIsExclusive)
{
    std::ostringstream out;
    ConsoleSurfaceHost host(out);
    host.focus(daemon::SURFACE_MAIN);
    host.focus(daemon::SURFACE_OVERLAY);

    EXPECT_FALSE(host.surface_state(daemon::SURFACE_MAIN)->focused);
    EXPECT_TRUE(host.surface_state(daemon::SURFACE_OVERLAY)->focused);

    host.hide(daemon::SURFACE_OVERLAY);
    EXPECT_FALSE(host.surface_state(daemon::SURFACE_OVERLAY)->focused);
}

TEST(ConsoleSurfaceHost, CloseRequestHides)
{
    std::ostringstream out;
    ConsoleSurfaceHost host(out);
    host.show(daemon::SURFACE_NOTIFICATION);
    ASSERT_TRUE(host.close_requested(daemon::SURFACE_NOTIFICATION));

    EXPECT_TRUE(host.has_surface(daemon::SURFACE_NOTIFICATION));
    EXPECT_FALSE(host.surface_state(daemon::SURFACE_NOTIFICATION)->visible);
}

TEST(ConsoleSurfaceHost, PositionAndOnTop)
{
    std::ostringstream out;
    ConsoleSurfaceHost host(out);
    host.set_position(daemon::SURFACE_NOTIFICATION, {1620, 740});
    host.set_always_on_top(daemon::SURFACE_NOTIFICATION, true);

    auto state = host.surface_state(daemon::SURFACE_NOTIFICATION);
    EXPECT_EQ(state->position.x, 1620);
    EXPECT_EQ(state->position.y, 740);
    EXPECT_TRUE(state->always_on_top);

    auto written = lines(out);
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[1]["x"], 1620);
    EXPECT_EQ(written[1]["always_on_top"], true);
}

TEST(ConsoleSurfaceHost, PushAndBroadcastLines)
{
    std::ostringstream out;
    ConsoleSurfaceHost host(out);
    ASSERT_TRUE(host.push_event(daemon::SURFACE_OVERLAY, "show-break", Json{{"break_type", "eyes"}}));
    host.broadcast("worker-status", Json{{"type", "status"}, {"data", nullptr}});

    auto written = lines(out);
    ASSERT_EQ(written.size(), 2u);
    EXPECT_EQ(written[0], (Json{{"kind", "push"},
                                {"surface", "overlay"},
                                {"event", "show-break"},
                                {"payload", {{"break_type", "eyes"}}}}));
    EXPECT_EQ(written[1]["kind"], "broadcast");
    EXPECT_EQ(written[1]["event"], "worker-status");
}

TEST(ConsoleSurfaceHost, MissingSurfaceOperationsFail)
{
    std::ostringstream out;
    ConsoleSurfaceHost host(out);
    host.remove_surface(daemon::SURFACE_OVERLAY);

    EXPECT_FALSE(host.show(daemon::SURFACE_OVERLAY));
    EXPECT_FALSE(host.push_event(daemon::SURFACE_OVERLAY, "show-break", Json::object()));
    EXPECT_FALSE(host.display_size(daemon::SURFACE_OVERLAY).has_value());
    EXPECT_TRUE(out.str().empty());

    host.add_surface("settings");
    EXPECT_TRUE(host.show("settings"));
}

TEST(ConsoleSurfaceHost, DisplaySizeIsUnknownUnlessGiven)
{
    std::ostringstream out;
    ConsoleSurfaceHost headless(out);
    EXPECT_FALSE(headless.display_size(daemon::SURFACE_MAIN).has_value());

    ConsoleSurfaceHost sized(out, daemon::ScreenSize{2560, 1440});
    auto               size = sized.display_size(daemon::SURFACE_MAIN);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(size->width, 2560);
}
