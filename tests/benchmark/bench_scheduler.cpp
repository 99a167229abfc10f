/**
 * @file bench_scheduler.cpp
 * @brief Performance benchmarks for scheduling policies and ledger operations.
 *
 * Measures per-decision scheduling overhead across fleet sizes, ledger
 * append/mine/verify cost and SHA-256 throughput.
 *
 * Usage: ./bench_scheduler [--csv]
 */

#include "cluster/vm.hpp"
#include "cluster/vm_pool.hpp"
#include "core/config.hpp"
#include "core/types.hpp"
#include "ledger/hash.hpp"
#include "ledger/ledger.hpp"
#include "scheduler/policy.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

using namespace ledger_scheduler;
using BenchClock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = BenchClock::now();
        fn();
        auto end = BenchClock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

constexpr ResourceVector kCapacity{64, 128, 32, 100};

/// Fleet with a spread of existing load so policies have something to rank.
std::vector<VirtualMachine> make_loaded_fleet(size_t n) {
    std::vector<VirtualMachine> fleet;
    fleet.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        uint64_t share = i % 8;
        fleet.emplace_back(static_cast<VmId>(i), kCapacity,
                           ResourceVector{share * 4, share * 8, share * 2, share * 6});
    }
    return fleet;
}

Task make_task(size_t i) {
    return Task{
        .id = "bench_" + std::to_string(i),
        .demand = {2, 4, 1, 3},
        .deadline = std::chrono::system_clock::now() + std::chrono::minutes{10},
        .duration = std::nullopt
    };
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_scheduling() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;
    SchedulerConfig config;
    config.blockchain.block_size = 50;

    for (size_t n : {4, 32, 256}) {
        auto fleet = make_loaded_fleet(n);
        auto label = std::to_string(n) + " VMs";

        for (auto kind : {PolicyKind::RoundRobin, PolicyKind::UrgencyAware,
                          PolicyKind::LeastLoaded, PolicyKind::BlockchainInspired}) {
            PolicyInstance policy(make_policy(kind, config));
            size_t i = 0;
            R.push_back(run_bench(std::string{to_string(kind)} + "(" + std::to_string(n) + ")",
                "Scheduling", N,
                [&]{ auto r = policy.schedule(make_task(i++), fleet); (void)r; }, label));
        }
    }

    return R;
}

std::vector<BenchResult> bench_pool() {
    std::vector<BenchResult> R;
    constexpr size_t N = 500;
    SchedulerConfig config;

    // Capacity large enough that no submit is ever rejected.
    VmPool pool(make_fleet(16, {1u << 30, 1u << 30, 1u << 30, 1u << 30}));
    PolicyInstance policy(make_policy(PolicyKind::LeastLoaded, config));
    size_t i = 0;
    R.push_back(run_bench("schedule_and_commit(16)", "VM Pool", N,
        [&]{ auto r = pool.schedule_and_commit(policy, make_task(i++)); (void)r; }, "16 VMs"));

    return R;
}

std::vector<BenchResult> bench_ledger() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    std::string payload(256, 'x');
    R.push_back(run_bench("sha256_256B", "Ledger", N,
        [&]{ auto h = sha256_hex(payload); (void)h; }, "256 B"));

    for (size_t block_size : {1, 10, 100}) {
        TransactionLedger ledger(LedgerConfig{.block_size = block_size});
        size_t i = 0;
        R.push_back(run_bench("append(block=" + std::to_string(block_size) + ")", "Ledger", N,
            [&]{
                auto task = make_task(i++);
                ledger.append(0, task, {}, task.demand, 1.0, TransactionStatus::Assigned);
            }, std::to_string(block_size) + " tx/block"));
    }

    for (size_t blocks : {10, 100}) {
        TransactionLedger ledger(LedgerConfig{.block_size = 10});
        for (size_t i = 0; i < blocks * 10; ++i) {
            auto task = make_task(i);
            ledger.append(static_cast<VmId>(i % 4), task, {}, task.demand, 1.0,
                          TransactionStatus::Assigned);
        }
        auto label = std::to_string(blocks) + " blocks";
        R.push_back(run_bench("verify(" + std::to_string(blocks) + ")", "Ledger", 100,
            [&]{ auto ok = ledger.verify_integrity(); (void)ok; }, label));
        R.push_back(run_bench("summary(" + std::to_string(blocks) + ")", "Ledger", 100,
            [&]{ auto s = ledger.summary(); (void)s; }, label));
        R.push_back(run_bench("vm_stats(" + std::to_string(blocks) + ")", "Ledger", 100,
            [&]{ auto s = ledger.vm_stats(1); (void)s; }, label));
    }

    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  ledger_scheduler Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_scheduling());
    append(bench_pool());
    append(bench_ledger());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
