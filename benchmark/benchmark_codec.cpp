// ============================================================================
// TIMEUTIL CORE - CODEC BENCHMARK
// ============================================================================
// Measures per-call cost of the text codec and the zone projection:
//   - formatRfc3339 (AUTO and MILLIS precision)
//   - parseRfc3339 / parseDate (free-form)
//   - project() with a fixed offset and with a tzdata zone
// ============================================================================

#include <timeutil/core/codec/date_parser.hpp>
#include <timeutil/core/codec/rfc3339.hpp>
#include <timeutil/core/zone/zoned_projection.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace std;
using namespace std::chrono;

// ============================================================================
// MONOTONIC CLOCK (steady_clock)
// ============================================================================

static inline uint64_t now_ns() {
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

// Sink for benchmark results
static volatile uint64_t g_sink = 0;

struct BenchResult {
    string name;
    uint64_t iterations;
    double ns_per_op;
};

static BenchResult runBench(const string& name, uint64_t iterations, const function<uint64_t(uint64_t)>& body) {
    // Warmup
    for (uint64_t i = 0; i < iterations / 10; ++i) {
        g_sink += body(i);
    }

    uint64_t start = now_ns();
    for (uint64_t i = 0; i < iterations; ++i) {
        g_sink += body(i);
    }
    uint64_t elapsed = now_ns() - start;

    return BenchResult{name, iterations, static_cast<double>(elapsed) / iterations};
}

// ============================================================================
// MAIN
// ============================================================================

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::warn);

    uint64_t iterations = 200000;
    if (argc > 1) {
        iterations = strtoull(argv[1], nullptr, 10);
        if (iterations == 0) iterations = 200000;
    }

    // Spread of instants across several centuries with non-zero fractions
    vector<TimeUtil::Instant> instants;
    vector<string> rfcTexts;
    for (int64_t i = 0; i < 1024; ++i) {
        auto instant = TimeUtil::Instant::fromParts(-2000000000LL + i * 7919993LL, (i * 104729) % 1000000000);
        if (!instant) continue;
        instants.push_back(instant.value());
        rfcTexts.push_back(TimeUtil::formatRfc3339(instant.value(), static_cast<int32_t>((i % 48 - 24) * 1800) + 1));
    }
    const vector<string> freeForm = {"2019-08-01", "20190801", "2019-08-01 12:30", "2019-08-01T12:30:45.5+0530"};
    const size_t n = instants.size();

    vector<BenchResult> results;

    results.push_back(runBench("formatRfc3339 AUTO", iterations, [&](uint64_t i) {
        return TimeUtil::formatRfc3339(instants[i % n]).size();
    }));
    results.push_back(runBench("formatRfc3339 MILLIS +05:30", iterations, [&](uint64_t i) {
        return TimeUtil::formatRfc3339(instants[i % n], 19800, TimeUtil::SubsecondPrecision::MILLIS).size();
    }));
    results.push_back(runBench("parseRfc3339", iterations, [&](uint64_t i) {
        auto parsed = TimeUtil::parseRfc3339(rfcTexts[i % n]);
        return parsed ? static_cast<uint64_t>(parsed.value().nanos()) : 0;
    }));
    results.push_back(runBench("parseDate free-form", iterations, [&](uint64_t i) {
        auto parsed = TimeUtil::parseDate(freeForm[i % freeForm.size()]);
        return parsed ? static_cast<uint64_t>(parsed.value().seconds()) : 0;
    }));
    results.push_back(runBench("project +05:30", iterations, [&](uint64_t i) {
        auto p = TimeUtil::project(instants[i % n], "+05:30");
        return p ? static_cast<uint64_t>(p.value().hour) : 0;
    }));

    // tzdata lookups stat and read the zone file header each time; fewer iterations
    TimeUtil::SystemZoneDatabase tzdata;
    if (tzdata.contains("America/New_York")) {
        results.push_back(runBench("project America/New_York", iterations / 10, [&](uint64_t i) {
            auto p = TimeUtil::project(instants[i % n], "America/New_York", tzdata);
            return p ? static_cast<uint64_t>(p.value().hour) : 0;
        }));
    } else {
        cout << "tzdata not found under " << tzdata.zoneinfoDir() << ", skipping zone benchmark\n";
    }

    cout << "\n";
    cout << "╔══════════════════════════════════════════════════════════╗\n";
    cout << "║              TIMEUTIL CODEC BENCHMARK RESULTS            ║\n";
    cout << "╚══════════════════════════════════════════════════════════╝\n";
    cout << left << setw(32) << "Benchmark" << right << setw(12) << "Iterations" << setw(14) << "ns/op" << "\n";
    cout << string(58, '-') << "\n";
    for (const auto& r : results) {
        cout << left << setw(32) << r.name << right << setw(12) << r.iterations
             << setw(14) << fixed << setprecision(1) << r.ns_per_op << "\n";
    }
    cout << "\n(sink " << g_sink << ")\n";
    return 0;
}
