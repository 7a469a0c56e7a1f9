#pragma once

#include "../core/task_scheduler.hpp"
#include "../ipc/message.hpp"
#include "handoff_store.hpp"
#include "surface_host.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tether::daemon
{

enum class Corner : uint8_t
{
    TopLeft,
    TopRight,
    BottomLeft,
    BottomRight,
};

// Top-left position that places a `window`-sized surface `inset` pixels from
// the given corner of `display`.
ScreenPoint corner_position(ScreenSize display, ScreenSize window, int inset, Corner corner);

// ─── Routing rules ───────────────────────────────────────────────────────────

struct SideEffect
{
    enum class Kind : uint8_t
    {
        StageHandoff,         // copy event data into a handoff slot
        ShowSurface,
        FocusSurface,
        PositionSurface,      // place at a corner of its display
        KeepOnTop,            // always-on-top
        PushAfterDelay,       // deferred push of the event data
        ForwardToListeners,   // broadcast {type, data} under the derived channel name
    };

    Kind                      kind = Kind::ForwardToListeners;
    std::string               surface;
    HandoffSlot               slot   = HandoffSlot::PendingBreak;
    Corner                    corner = Corner::BottomRight;
    ScreenSize                window_size;
    int                       inset = 0;
    std::string               push_event;
    std::chrono::milliseconds delay{0};

    static SideEffect stage(HandoffSlot slot);
    static SideEffect show(std::string_view surface);
    static SideEffect focus(std::string_view surface);
    static SideEffect position(std::string_view surface, Corner corner, ScreenSize window_size, int inset);
    static SideEffect keep_on_top(std::string_view surface);
    static SideEffect push_after(std::string_view surface, std::string_view event, std::chrono::milliseconds delay);
    static SideEffect forward();
};

struct RoutingRule
{
    std::string             event_type;
    std::vector<SideEffect> effects;   // applied in order
};

// Overrides for present().
struct PresentOptions
{
    std::optional<std::chrono::milliseconds> push_delay;   // replaces the rule's delay
    bool                                     stage = true;  // false skips StageHandoff
};

struct RouterConfig
{
    std::chrono::milliseconds break_push_delay{300};
    std::chrono::milliseconds warning_push_delay{800};
    ScreenSize                notification_size{280, 320};
    int                       notification_padding = 20;
    ScreenSize                fallback_display{1920, 1080};
    std::string               channel_prefix = "worker-";
};

// Static event_type -> side effects mapping.  Types without a rule get the
// default rule: forward only.
class RoutingTable
{
   public:
    void set_rule(RoutingRule rule);

    // nullptr when the type has no explicit rule.
    const RoutingRule* find(std::string_view event_type) const;

    size_t size() const { return rules_.size(); }

    // break_due and schedule_warning rules built from `config`.
    static RoutingTable with_defaults(const RouterConfig& config);

   private:
    std::unordered_map<std::string, RoutingRule> rules_;
};

// ─── EventRouter ─────────────────────────────────────────────────────────────
// Consumes decoded worker events and turns them into surface operations.
//
// Delayed pushes are fire-and-forget tasks on the TaskScheduler.  The delay
// only gives a freshly shown surface time to initialize; it is not a
// synchronization guarantee.  A surface that calls surface_ready() gets its
// pending push immediately instead.  Each surface has at most one pending
// push; a newer one replaces the older.  If the surface is gone when the
// push fires, the push is dropped and the payload stays in the handoff store.
class EventRouter
{
   public:
    EventRouter(SurfaceHost& host, HandoffState& handoff, TaskScheduler& scheduler, RouterConfig config = {});
    EventRouter(SurfaceHost&   host,
                HandoffState&  handoff,
                TaskScheduler& scheduler,
                RouterConfig   config,
                RoutingTable   table);
    ~EventRouter();

    EventRouter(const EventRouter&)            = delete;
    EventRouter& operator=(const EventRouter&) = delete;

    // Returns immediately; delayed pushes run later on the scheduler.
    void dispatch(const ipc::InboundEvent& event);

    // Applies the rule for `event_type` without forwarding to listeners.
    // Returns false if the type has no explicit rule.
    bool present(std::string_view                event_type,
                 const std::optional<ipc::Json>& data,
                 const PresentOptions&           options = {});

    // Readiness handshake: flush the surface's pending push now.
    // Returns true if a push was delivered.
    bool surface_ready(std::string_view surface);

    bool has_pending_push(std::string_view surface) const;

    // "<prefix><event_type>"
    std::string channel_name(std::string_view event_type) const;

    const RouterConfig& config() const { return config_; }
    const RoutingTable& table() const { return table_; }

   private:
    struct PendingPush
    {
        TaskId      task = INVALID_TASK;
        uint64_t    seq  = 0;
        std::string event;
        ipc::Json   payload;
    };

    // Shared with scheduled tasks so they become no-ops once the router is gone.
    struct Lifetime
    {
        std::mutex mu;
        bool       alive = true;
    };

    void apply(const RoutingRule& rule, const ipc::InboundEvent& event, bool forward, const PresentOptions& options);
    void schedule_push(const std::string& surface,
                       const std::string& push_event,
                       const ipc::Json&   payload,
                       std::chrono::milliseconds delay);
    void fire_push(const std::string& surface, uint64_t seq);

    SurfaceHost&   host_;
    HandoffState&  handoff_;
    TaskScheduler& scheduler_;
    RouterConfig   config_;
    RoutingTable   table_;

    mutable std::mutex                           mu_;
    std::unordered_map<std::string, PendingPush> pending_;
    uint64_t                                     next_seq_ = 1;
    std::shared_ptr<Lifetime>                    lifetime_ = std::make_shared<Lifetime>();
};

}   // namespace tether::daemon
