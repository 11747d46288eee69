// Table benchmark: measures KV table throughput on a scratch database.
//
// Creates a temporary store, then times N set() calls, N get() calls through
// a fresh table instance (every read misses the cache and scans the document
// file) and N get() calls repeated on the same instance (every read is a
// cache hit).
//
// Prints: total ops, elapsed time, ops/sec, and latency percentiles (p50,
// p90, p99, p999) for each phase.

#include "common/errors.hpp"
#include "database/database.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <numeric>
#include <string>
#include <vector>

namespace {

using clock = std::chrono::high_resolution_clock;
using ns    = std::chrono::nanoseconds;

// ── Stats helpers ────────────────────────────────────────────────────────────

struct BenchResult {
    std::size_t total_ops{};
    double elapsed_sec{};
    double ops_per_sec{};
    double p50_us{};
    double p90_us{};
    double p99_us{};
    double p999_us{};
    double avg_us{};
};

BenchResult compute_stats(std::vector<int64_t>& latencies_ns) {
    BenchResult r;
    r.total_ops = latencies_ns.size();

    if (latencies_ns.empty()) return r;

    std::sort(latencies_ns.begin(), latencies_ns.end());

    auto total_ns = std::accumulate(latencies_ns.begin(), latencies_ns.end(), int64_t{0});
    r.elapsed_sec = static_cast<double>(total_ns) / 1e9;
    r.ops_per_sec = static_cast<double>(r.total_ops) / r.elapsed_sec;
    r.avg_us      = static_cast<double>(total_ns) / static_cast<double>(r.total_ops) / 1000.0;

    auto percentile = [&](double p) -> double {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(latencies_ns.size() - 1));
        return static_cast<double>(latencies_ns[idx]) / 1000.0; // ns → µs
    };

    r.p50_us  = percentile(0.50);
    r.p90_us  = percentile(0.90);
    r.p99_us  = percentile(0.99);
    r.p999_us = percentile(0.999);

    return r;
}

void print_result(const char* label, const BenchResult& r) {
    fprintf(stdout,
        "\n── %s ──\n"
        "  Total ops:    %zu\n"
        "  Elapsed:      %.3f s\n"
        "  Throughput:   %.0f ops/sec\n"
        "  Avg latency:  %.1f µs\n"
        "  p50:          %.1f µs\n"
        "  p90:          %.1f µs\n"
        "  p99:          %.1f µs\n"
        "  p99.9:        %.1f µs\n",
        label, r.total_ops, r.elapsed_sec, r.ops_per_sec,
        r.avg_us, r.p50_us, r.p90_us, r.p99_us, r.p999_us);
}

std::string key_for(std::size_t i) {
    return "key" + std::to_string(i);
}

// Times fn(i) for i in [0, n).
template <typename Fn>
BenchResult time_ops(std::size_t n, Fn&& fn) {
    std::vector<int64_t> latencies;
    latencies.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        auto t0 = clock::now();
        fn(i);
        auto t1 = clock::now();
        latencies.push_back(std::chrono::duration_cast<ns>(t1 - t0).count());
    }
    return compute_stats(latencies);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Suppress store logs during benchmark.
    spdlog::set_level(spdlog::level::warn);

    std::size_t num_ops = 1'000;
    if (argc > 1) {
        num_ops = static_cast<std::size_t>(std::atol(argv[1]));
        if (num_ops == 0) num_ops = 1'000;
    }

    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "funtable_benchmark";
    std::error_code ec;
    fs::remove_all(dir, ec);

    fprintf(stdout,
        "funtable KV Table Benchmark\n"
        "===========================\n"
        "Ops per phase: %zu\n"
        "Store:         %s\n",
        num_ops, dir.string().c_str());

    BenchResult set_result;
    BenchResult cold_result;
    BenchResult warm_result;
    try {
        funtable::Database db{dir};
        db.create_kv_table("bench");

        auto writer = db.get_kv_table("bench");
        set_result = time_ops(num_ops, [&](std::size_t i) {
            writer->set(key_for(i), funtable::StoreValue::from_data(
                {{"index", i}, {"payload", "value" + std::to_string(i)}}));
        });

        // Fresh instance: empty cache.
        auto reader = db.get_kv_table("bench");
        cold_result = time_ops(num_ops, [&](std::size_t i) {
            (void)reader->get(key_for(i));
        });
        warm_result = time_ops(num_ops, [&](std::size_t i) {
            (void)reader->get(key_for(i));
        });
    } catch (const funtable::StoreError& e) {
        fprintf(stderr, "benchmark failed: %s\n", e.what());
        fs::remove_all(dir, ec);
        return 1;
    }

    print_result("set()", set_result);
    print_result("get() cache miss", cold_result);
    print_result("get() cache hit", warm_result);

    if (cold_result.avg_us > 0) {
        fprintf(stdout,
            "\n── Comparison ──\n"
            "  Cache hit / miss throughput ratio: %.2fx\n",
            warm_result.ops_per_sec / cold_result.ops_per_sec);
    }
    fprintf(stdout, "\n");

    fs::remove_all(dir, ec);
    return 0;
}
