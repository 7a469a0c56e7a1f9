#include <gtest/gtest.h>

#include "daemon/handoff_store.hpp"

#include <thread>
#include <vector>

using namespace tether::daemon;
using tether::ipc::Json;

TEST(HandoffStore, EmptyByDefault)
{
    HandoffStore store("test");
    EXPECT_FALSE(store.has_payload());
    EXPECT_FALSE(store.get_and_peek().has_value());
    EXPECT_EQ(store.dropped_count(), 0u);
    EXPECT_EQ(store.name(), "test");
}

TEST(HandoffStore, PeekDoesNotClear)
{
    HandoffStore store("test");
    store.set(Json{{"break_type", "stretch"}});

    auto first  = store.get_and_peek();
    auto second = store.get_and_peek();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ((*first)["break_type"], "stretch");
}

TEST(HandoffStore, ClearIsIdempotent)
{
    HandoffStore store("test");
    store.set(Json{{"a", 1}});
    store.clear();
    EXPECT_FALSE(store.has_payload());
    store.clear();
    EXPECT_FALSE(store.get_and_peek().has_value());
}

TEST(HandoffStore, LastWriteWins)
{
    HandoffStore store("test");
    store.set(Json{{"n", 1}});
    store.set(Json{{"n", 2}});

    auto payload = store.get_and_peek();
    ASSERT_TRUE(payload.has_value());
    EXPECT_EQ((*payload)["n"], 2);
    EXPECT_EQ(store.dropped_count(), 1u);
}

TEST(HandoffStore, OverwriteAfterPeekIsNotADrop)
{
    HandoffStore store("test");
    store.set(Json{{"n", 1}});
    (void)store.get_and_peek();
    store.set(Json{{"n", 2}});
    EXPECT_EQ(store.dropped_count(), 0u);

    store.clear();
    store.set(Json{{"n", 3}});
    EXPECT_EQ(store.dropped_count(), 0u);
}

TEST(HandoffStore, ConcurrentWritersLeaveOneWholePayload)
{
    HandoffStore             store("test");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t)
    {
        threads.emplace_back(
            [&store, t]
            {
                for (int i = 0; i < 200; ++i)
                {
                    store.set(Json{{"writer", t}, {"seq", i}});
                    (void)store.get_and_peek();
                }
            });
    }
    for (auto& th : threads)
        th.join();

    auto payload = store.get_and_peek();
    ASSERT_TRUE(payload.has_value());
    EXPECT_TRUE(payload->contains("writer"));
    EXPECT_TRUE(payload->contains("seq"));
}

TEST(HandoffState, SlotsAreIndependent)
{
    HandoffState state;
    state.pending_break().set(Json{{"kind", "break"}});

    EXPECT_TRUE(state.slot(HandoffSlot::PendingBreak).has_payload());
    EXPECT_FALSE(state.slot(HandoffSlot::PendingScheduleWarning).has_payload());

    state.slot(HandoffSlot::PendingScheduleWarning).set(Json{{"kind", "warning"}});
    state.pending_break().clear();
    EXPECT_FALSE(state.pending_break().has_payload());
    EXPECT_TRUE(state.pending_schedule_warning().has_payload());
}

TEST(HandoffState, SlotNames)
{
    HandoffState state;
    EXPECT_EQ(state.pending_break().name(), "pending-break");
    EXPECT_EQ(state.pending_schedule_warning().name(), "pending-schedule-warning");
    EXPECT_STREQ(handoff_slot_name(HandoffSlot::PendingBreak), "pending-break");
}
