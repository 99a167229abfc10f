/**
 * @file main.cpp
 * @brief ledger_scheduler command-line demo.
 *
 * Wires the modules into one run:
 *   Config → Logger → SchedulingService → (VmPool + PolicyInstance) → Ledger → report
 *
 * Schedules a deterministic batch of tasks against a fresh fleet, commits
 * each winner, mines the ledger periodically and prints what was recorded.
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "ledger/ledger_export.hpp"
#include "service/scheduling_service.hpp"
#include "telemetry/json_sink.hpp"

#include <array>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

using namespace ledger_scheduler;

namespace {

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string policy;
    uint32_t vm_count = 0;
    uint32_t task_count = 8;
    uint32_t mine_every = 3;
    std::optional<std::string> log_dir;    ///< Empty string selects stdout
    bool export_json = false;
};

void print_usage() {
    std::cout << "Usage: ledger_scheduler [OPTIONS]\n"
              << "  --config <path>     Configuration file (default: config/default.toml)\n"
              << "  --policy <name>     roundrobin | urgency | leastloaded | blockchain\n"
              << "  --vms <n>           Number of VMs in the fleet\n"
              << "  --tasks <n>         Number of tasks to schedule (default: 8)\n"
              << "  --mine-every <k>    Force-mine the ledger every k tasks, 0 = never (default: 3)\n"
              << "  --log-dir <path>    Log output directory, \"\" logs to stdout\n"
              << "  --export            Print the full ledger export as JSON\n"
              << "  --help, -h          Show this help message\n";
}

uint32_t parse_count_arg(const char* text, const char* flag) {
    auto value = parse_count(text);
    if (!value) {
        std::cerr << "Invalid value for " << flag << ": " << value.error().message << std::endl;
        std::exit(2);
    }
    return *value;
}

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--policy" && i + 1 < argc) {
            args.policy = argv[++i];
        } else if (arg == "--vms" && i + 1 < argc) {
            args.vm_count = parse_count_arg(argv[++i], "--vms");
        } else if (arg == "--tasks" && i + 1 < argc) {
            args.task_count = parse_count_arg(argv[++i], "--tasks");
        } else if (arg == "--mine-every" && i + 1 < argc) {
            args.mine_every = parse_count_arg(argv[++i], "--mine-every");
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--export") {
            args.export_json = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage();
            std::exit(2);
        }
    }
    return args;
}

/// Demand table cycled through by the demo batch.
constexpr std::array<ResourceVector, 8> kDemoDemands{{
    {.cpu = 2, .mem = 4, .io = 1, .bw = 2},
    {.cpu = 3, .mem = 6, .io = 2, .bw = 3},
    {.cpu = 1, .mem = 2, .io = 1, .bw = 1},
    {.cpu = 4, .mem = 8, .io = 2, .bw = 4},
    {.cpu = 2, .mem = 3, .io = 1, .bw = 2},
    {.cpu = 5, .mem = 10, .io = 3, .bw = 5},
    {.cpu = 1, .mem = 1, .io = 1, .bw = 1},
    {.cpu = 3, .mem = 5, .io = 2, .bw = 3},
}};

void print_report(const LedgerReport& report) {
    const auto& s = report.summary;
    std::cout << "\n=== Ledger summary ===\n"
              << "Total blocks:           " << s.total_blocks << '\n'
              << "Total transactions:     " << s.total_transactions << '\n'
              << "Pending transactions:   " << s.pending_transactions << '\n'
              << "Successful assignments: " << s.successful_assignments << '\n'
              << "Failed assignments:     " << s.failed_assignments << '\n'
              << std::format("Success rate:           {:.2f}%\n", s.success_rate * 100.0)
              << "Chain integrity:        " << (s.chain_integrity ? "valid" : "INVALID") << '\n'
              << "Latest block hash:      " << s.latest_block_hash.substr(0, 16) << "...\n";

    for (const auto& vm : report.vm_stats) {
        std::cout << std::format(
            "\n--- VM {} ---\n  assigned {}, failed {}, success {:.2f}%\n"
            "  average score {:.4f}, cpu allocated {}, mem allocated {}\n",
            vm.vm_id, vm.total_assignments, vm.failed_assignments, vm.success_rate * 100.0,
            vm.average_score, vm.total_cpu_allocated, vm.total_mem_allocated);
    }

    std::cout << "\n--- Recent transactions ---\n";
    for (const auto& tx : report.recent_transactions) {
        std::cout << std::format("{} {}: task {} -> VM {} (score {:.4f}, {})\n",
                                 tx.status == TransactionStatus::Assigned ? "+" : "-",
                                 tx.transaction_id, tx.task_id, tx.vm_id, tx.score,
                                 to_string(tx.status));
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);

    // Load configuration
    Config config = default_config();
    if (std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 1;
        }
        config = *config_result;
    } else {
        std::cerr << "Config " << args.config_path << " not found, using defaults." << std::endl;
    }

    // Apply CLI overrides
    if (!args.policy.empty()) config.scheduler.policy = args.policy;
    if (args.vm_count != 0) config.cluster.vm_count = args.vm_count;
    if (args.log_dir) config.telemetry.log_dir = *args.log_dir;

    if (auto valid = validate_config(config); !valid) {
        std::cerr << "Invalid configuration: " << valid.error().message << std::endl;
        return 1;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "ledger_scheduler",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }

    const std::string policy = config.scheduler.policy;
    SchedulingService service({
        .config = config,
        .log_sink = std::move(log_sink),
        .metrics_sink = nullptr,
        .clock = system_clock()
    });

    auto instance = service.registry().get(policy);
    if (!instance) {
        std::cerr << instance.error().message << std::endl;
        return 1;
    }
    const bool keeps_ledger = (*instance)->has_ledger();

    std::cout << std::format("Scheduling {} tasks on {} VMs with policy '{}'\n",
                             args.task_count, config.cluster.vm_count, policy);

    // ── Scheduling run ───────────────────────
    for (uint32_t i = 0; i < args.task_count; ++i) {
        Task task{
            .id = std::format("task_{:03}", i + 1),
            .demand = kDemoDemands[i % kDemoDemands.size()],
            .deadline = std::chrono::system_clock::now() + std::chrono::hours{1},
            .duration = std::nullopt
        };

        auto outcome = service.submit(policy, task);
        if (!outcome) {
            std::cerr << outcome.error().message << std::endl;
            return 1;
        }

        if (outcome->assigned()) {
            auto vm = service.pool().find(*outcome->vm_id);
            std::cout << std::format("  {} -> VM {} (score {:.4f})", task.id, *outcome->vm_id,
                                     outcome->score);
            if (vm) {
                std::cout << std::format(", cpu {}/{} mem {}/{}", vm->usage().cpu,
                                         vm->capacity().cpu, vm->usage().mem, vm->capacity().mem);
            }
            std::cout << '\n';
        } else {
            std::cout << "  " << task.id << " -> no admissible VM\n";
        }

        if (keeps_ledger && args.mine_every != 0 && (i + 1) % args.mine_every == 0) {
            if (auto mined = service.force_mine(policy); !mined) {
                std::cerr << mined.error().message << std::endl;
                return 1;
            }
        }
    }

    std::cout << "\n=== Fleet ===\n";
    for (const auto& vm : service.pool().snapshot()) {
        std::cout << std::format("VM {}: {} tasks, load {:.3f}\n", vm.id(),
                                 vm.assigned_tasks().size(), vm.load_score());
    }

    if (!keeps_ledger) {
        return 0;
    }

    // ── Ledger report ────────────────────────
    if (auto mined = service.force_mine(policy); !mined) {
        std::cerr << mined.error().message << std::endl;
        return 1;
    }

    auto report = service.ledger_report(policy);
    if (!report) {
        std::cerr << report.error().message << std::endl;
        return 1;
    }
    print_report(*report);

    if (args.export_json) {
        std::cout << "\n" << to_json(report->export_data) << std::endl;
    }

    auto verdict = service.verify(policy);
    if (!verdict) {
        std::cerr << "Ledger verification failed: " << verdict.error().message << std::endl;
        return 1;
    }
    std::cout << "\nLedger integrity verified.\n";
    return 0;
}
