#pragma once

#include "../ipc/message.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace tether::daemon
{

// Single-slot payload store bridging "event arrived" and "surface ready".
// Last write wins: a payload that is overwritten before anyone peeks or
// clears it is lost (counted in dropped_count()).
// Thread-safe: all public methods lock the internal mutex.
class HandoffStore
{
   public:
    explicit HandoffStore(std::string name) : name_(std::move(name)) {}

    HandoffStore(const HandoffStore&)            = delete;
    HandoffStore& operator=(const HandoffStore&) = delete;

    void set(ipc::Json payload);

    // Current payload without clearing it.
    std::optional<ipc::Json> get_and_peek() const;

    // Consumer acknowledgment.  Idempotent.
    void clear();

    bool has_payload() const;

    // Overwrites of a payload that was never peeked.
    uint64_t dropped_count() const;

    const std::string& name() const { return name_; }

   private:
    mutable std::mutex       mu_;
    std::string              name_;
    std::optional<ipc::Json> payload_;
    mutable bool             peeked_  = false;
    uint64_t                 dropped_ = 0;
};

enum class HandoffSlot : uint8_t
{
    PendingBreak,
    PendingScheduleWarning,
};

const char* handoff_slot_name(HandoffSlot slot);

// One store per kind of pending item.  Owned by the host and shared by
// reference between the router and the host commands.
class HandoffState
{
   public:
    HandoffState();

    HandoffStore&       slot(HandoffSlot which);
    const HandoffStore& slot(HandoffSlot which) const;

    HandoffStore& pending_break() { return pending_break_; }
    HandoffStore& pending_schedule_warning() { return pending_schedule_warning_; }

   private:
    HandoffStore pending_break_;
    HandoffStore pending_schedule_warning_;
};

}   // namespace tether::daemon
