#include "event_router.hpp"

#include "../ipc/codec.hpp"

#include <tether/logger.hpp>

namespace tether::daemon
{

ScreenPoint corner_position(ScreenSize display, ScreenSize window, int inset, Corner corner)
{
    int left   = inset;
    int top    = inset;
    int right  = display.width - window.width - inset;
    int bottom = display.height - window.height - inset;

    switch (corner)
    {
        case Corner::TopLeft:
            return {left, top};
        case Corner::TopRight:
            return {right, top};
        case Corner::BottomLeft:
            return {left, bottom};
        case Corner::BottomRight:
            return {right, bottom};
    }
    return {right, bottom};
}

// ─── SideEffect ──────────────────────────────────────────────────────────────

SideEffect SideEffect::stage(HandoffSlot slot)
{
    SideEffect e;
    e.kind = Kind::StageHandoff;
    e.slot = slot;
    return e;
}

SideEffect SideEffect::show(std::string_view surface)
{
    SideEffect e;
    e.kind    = Kind::ShowSurface;
    e.surface = surface;
    return e;
}

SideEffect SideEffect::focus(std::string_view surface)
{
    SideEffect e;
    e.kind    = Kind::FocusSurface;
    e.surface = surface;
    return e;
}

SideEffect SideEffect::position(std::string_view surface, Corner corner, ScreenSize window_size, int inset)
{
    SideEffect e;
    e.kind        = Kind::PositionSurface;
    e.surface     = surface;
    e.corner      = corner;
    e.window_size = window_size;
    e.inset       = inset;
    return e;
}

SideEffect SideEffect::keep_on_top(std::string_view surface)
{
    SideEffect e;
    e.kind    = Kind::KeepOnTop;
    e.surface = surface;
    return e;
}

SideEffect SideEffect::push_after(std::string_view surface, std::string_view event, std::chrono::milliseconds delay)
{
    SideEffect e;
    e.kind       = Kind::PushAfterDelay;
    e.surface    = surface;
    e.push_event = event;
    e.delay      = delay;
    return e;
}

SideEffect SideEffect::forward()
{
    return SideEffect{};
}

// ─── RoutingTable ────────────────────────────────────────────────────────────

void RoutingTable::set_rule(RoutingRule rule)
{
    auto key    = rule.event_type;
    rules_[key] = std::move(rule);
}

const RoutingRule* RoutingTable::find(std::string_view event_type) const
{
    auto it = rules_.find(std::string(event_type));
    return it == rules_.end() ? nullptr : &it->second;
}

RoutingTable RoutingTable::with_defaults(const RouterConfig& config)
{
    RoutingTable table;

    // Staging precedes show so a surface that polls on mount finds the data.
    table.set_rule({std::string(ipc::EVT_BREAK_DUE),
                    {SideEffect::stage(HandoffSlot::PendingBreak),
                     SideEffect::show(SURFACE_OVERLAY),
                     SideEffect::focus(SURFACE_OVERLAY),
                     SideEffect::push_after(SURFACE_OVERLAY, ipc::PUSH_SHOW_BREAK, config.break_push_delay),
                     SideEffect::forward()}});

    table.set_rule({std::string(ipc::EVT_SCHEDULE_WARNING),
                    {SideEffect::stage(HandoffSlot::PendingScheduleWarning),
                     SideEffect::show(SURFACE_NOTIFICATION),
                     SideEffect::position(SURFACE_NOTIFICATION,
                                          Corner::BottomRight,
                                          config.notification_size,
                                          config.notification_padding),
                     SideEffect::keep_on_top(SURFACE_NOTIFICATION),
                     SideEffect::push_after(SURFACE_NOTIFICATION,
                                            ipc::PUSH_SHOW_SCHEDULE_WARNING,
                                            config.warning_push_delay),
                     SideEffect::forward()}});

    return table;
}

// ─── EventRouter ─────────────────────────────────────────────────────────────

EventRouter::EventRouter(SurfaceHost& host, HandoffState& handoff, TaskScheduler& scheduler, RouterConfig config)
    : EventRouter(host, handoff, scheduler, config, RoutingTable::with_defaults(config))
{
}

EventRouter::EventRouter(SurfaceHost&   host,
                         HandoffState&  handoff,
                         TaskScheduler& scheduler,
                         RouterConfig   config,
                         RoutingTable   table)
    : host_(host),
      handoff_(handoff),
      scheduler_(scheduler),
      config_(std::move(config)),
      table_(std::move(table))
{
}

EventRouter::~EventRouter()
{
    {
        // Waits for an in-flight push to finish.
        std::lock_guard life(lifetime_->mu);
        lifetime_->alive = false;
    }
    std::lock_guard lock(mu_);
    for (auto& [surface, push] : pending_)
        scheduler_.cancel(push.task);
    pending_.clear();
}

std::string EventRouter::channel_name(std::string_view event_type) const
{
    return config_.channel_prefix + std::string(event_type);
}

void EventRouter::dispatch(const ipc::InboundEvent& event)
{
    TETHER_LOG_DEBUG("router", "Dispatching {}", event.event_type);

    if (const RoutingRule* rule = table_.find(event.event_type))
    {
        apply(*rule, event, true, PresentOptions{});
        return;
    }

    // Unknown types are still visible to every listener.
    host_.broadcast(channel_name(event.event_type), ipc::event_to_json(event));
}

bool EventRouter::present(std::string_view                event_type,
                          const std::optional<ipc::Json>& data,
                          const PresentOptions&           options)
{
    const RoutingRule* rule = table_.find(event_type);
    if (!rule)
    {
        TETHER_LOG_WARN("router", "No routing rule for {}", event_type);
        return false;
    }
    apply(*rule, ipc::InboundEvent{std::string(event_type), data}, false, options);
    return true;
}

void EventRouter::apply(const RoutingRule&       rule,
                        const ipc::InboundEvent& event,
                        bool                     forward,
                        const PresentOptions&    options)
{
    for (const auto& effect : rule.effects)
    {
        switch (effect.kind)
        {
            case SideEffect::Kind::StageHandoff:
                if (event.data && options.stage)
                    handoff_.slot(effect.slot).set(*event.data);
                break;

            case SideEffect::Kind::ShowSurface:
                if (!host_.show(effect.surface))
                    TETHER_LOG_DEBUG("router", "{}: surface {} not found", rule.event_type, effect.surface);
                break;

            case SideEffect::Kind::FocusSurface:
                host_.focus(effect.surface);
                break;

            case SideEffect::Kind::PositionSurface:
            {
                auto display = host_.display_size(effect.surface).value_or(config_.fallback_display);
                auto pos     = corner_position(display, effect.window_size, effect.inset, effect.corner);
                host_.set_position(effect.surface, pos);
                break;
            }

            case SideEffect::Kind::KeepOnTop:
                host_.set_always_on_top(effect.surface, true);
                break;

            case SideEffect::Kind::PushAfterDelay:
                if (event.data)
                    schedule_push(effect.surface,
                                  effect.push_event,
                                  *event.data,
                                  options.push_delay.value_or(effect.delay));
                break;

            case SideEffect::Kind::ForwardToListeners:
                if (forward)
                    host_.broadcast(channel_name(event.event_type), ipc::event_to_json(event));
                break;
        }
    }
}

void EventRouter::schedule_push(const std::string&        surface,
                                const std::string&        push_event,
                                const ipc::Json&          payload,
                                std::chrono::milliseconds delay)
{
    std::lock_guard lock(mu_);

    auto existing = pending_.find(surface);
    if (existing != pending_.end())
    {
        scheduler_.cancel(existing->second.task);
        TETHER_LOG_DEBUG("router", "Replacing pending {} for {}", existing->second.event, surface);
    }

    uint64_t seq = next_seq_++;
    std::weak_ptr<Lifetime> weak_life = lifetime_;
    TaskId task = scheduler_.schedule_after(delay,
                                            [this, weak_life, surface, seq]
                                            {
                                                auto life = weak_life.lock();
                                                if (!life)
                                                    return;
                                                std::lock_guard guard(life->mu);
                                                if (life->alive)
                                                    fire_push(surface, seq);
                                            });
    if (task == INVALID_TASK)
    {
        pending_.erase(surface);
        TETHER_LOG_WARN("router", "Scheduler stopped; dropping {} for {}", push_event, surface);
        return;
    }
    pending_[surface] = PendingPush{task, seq, push_event, payload};
}

void EventRouter::fire_push(const std::string& surface, uint64_t seq)
{
    PendingPush push;
    {
        std::lock_guard lock(mu_);
        auto            it = pending_.find(surface);
        if (it == pending_.end() || it->second.seq != seq)
            return;   // flushed by surface_ready() or replaced
        push = std::move(it->second);
        pending_.erase(it);
    }

    if (!host_.push_event(surface, push.event, push.payload))
        TETHER_LOG_DEBUG("router", "{} dropped: surface {} is gone", push.event, surface);
}

bool EventRouter::surface_ready(std::string_view surface)
{
    PendingPush push;
    {
        std::lock_guard lock(mu_);
        auto            it = pending_.find(std::string(surface));
        if (it == pending_.end())
            return false;
        push = std::move(it->second);
        pending_.erase(it);
        scheduler_.cancel(push.task);
    }

    TETHER_LOG_DEBUG("router", "{} ready; flushing {} early", surface, push.event);
    return host_.push_event(surface, push.event, push.payload);
}

bool EventRouter::has_pending_push(std::string_view surface) const
{
    std::lock_guard lock(mu_);
    return pending_.count(std::string(surface)) > 0;
}

}   // namespace tether::daemon
