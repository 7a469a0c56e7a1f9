#include "handoff_store.hpp"

#include <tether/logger.hpp>

namespace tether::daemon
{

void HandoffStore::set(ipc::Json payload)
{
    std::lock_guard lock(mu_);
    if (payload_ && !peeked_)
    {
        ++dropped_;
        TETHER_LOG_WARN("handoff", "{}: unconsumed payload overwritten ({} dropped so far)", name_, dropped_);
    }
    payload_ = std::move(payload);
    peeked_  = false;
}

std::optional<ipc::Json> HandoffStore::get_and_peek() const
{
    std::lock_guard lock(mu_);
    if (payload_)
        peeked_ = true;
    return payload_;
}

void HandoffStore::clear()
{
    std::lock_guard lock(mu_);
    payload_.reset();
    peeked_ = false;
}

bool HandoffStore::has_payload() const
{
    std::lock_guard lock(mu_);
    return payload_.has_value();
}

uint64_t HandoffStore::dropped_count() const
{
    std::lock_guard lock(mu_);
    return dropped_;
}

const char* handoff_slot_name(HandoffSlot slot)
{
    switch (slot)
    {
        case HandoffSlot::PendingBreak:
            return "pending-break";
        case HandoffSlot::PendingScheduleWarning:
            return "pending-schedule-warning";
    }
    return "unknown";
}

HandoffState::HandoffState()
    : pending_break_(handoff_slot_name(HandoffSlot::PendingBreak)),
      pending_schedule_warning_(handoff_slot_name(HandoffSlot::PendingScheduleWarning))
{
}

HandoffStore& HandoffState::slot(HandoffSlot which)
{
    return which == HandoffSlot::PendingBreak ? pending_break_ : pending_schedule_warning_;
}

const HandoffStore& HandoffState::slot(HandoffSlot which) const
{
    return which == HandoffSlot::PendingBreak ? pending_break_ : pending_schedule_warning_;
}

}   // namespace tether::daemon
