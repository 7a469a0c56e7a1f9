#include <benchmark/benchmark.h>
#include <string>

#include "ipc/codec.hpp"
#include "ipc/commands.hpp"

using namespace tether::ipc;

// --- Helpers ---

static std::string make_metrics_line(int samples)
{
    Json data = {{"cpu", 12.5}, {"keystrokes", 1830}, {"idle_seconds", 4}};
    Json list = Json::array();
    for (int i = 0; i < samples; ++i)
        list.push_back({{"t", i}, {"v", i * 0.5}});
    data["samples"] = std::move(list);
    return encode_event(InboundEvent{"metrics", data});
}

// --- Decode ---

static void BM_DecodeSmallEvent(benchmark::State& state)
{
    const std::string line = R"({"type":"break_due","data":{"break_type":"stretch","duration_seconds":30}})";
    for (auto _ : state)
    {
        auto ev = decode_event(line);
        benchmark::DoNotOptimize(ev);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(line.size()));
}
BENCHMARK(BM_DecodeSmallEvent);

static void BM_DecodeMetrics(benchmark::State& state)
{
    const std::string line = make_metrics_line(static_cast<int>(state.range(0)));
    for (auto _ : state)
    {
        auto ev = decode_event(line);
        benchmark::DoNotOptimize(ev);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(line.size()));
}
BENCHMARK(BM_DecodeMetrics)->Arg(10)->Arg(100)->Arg(1000);

static void BM_DecodeNoise(benchmark::State& state)
{
    const std::string line = "Loading model weights from /var/lib/tether/model.bin ...";
    for (auto _ : state)
    {
        auto ev = decode_event(line);
        benchmark::DoNotOptimize(ev);
    }
}
BENCHMARK(BM_DecodeNoise);

// --- Encode ---

static void BM_EncodeBareCommand(benchmark::State& state)
{
    const auto cmd = make_get_status();
    for (auto _ : state)
    {
        auto line = encode_command(cmd);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_EncodeBareCommand);

static void BM_EncodeScheduleRule(benchmark::State& state)
{
    ScheduleRule rule{"09:00", "start_session", {"mon", "tue", "wed", "thu", "fri"}, std::string("Workday")};
    const auto   cmd = make_update_schedule_rule(7, rule, true);
    for (auto _ : state)
    {
        auto line = encode_command(cmd);
        benchmark::DoNotOptimize(line);
    }
}
BENCHMARK(BM_EncodeScheduleRule);

BENCHMARK_MAIN();
