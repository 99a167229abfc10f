/**
 * @file config.hpp
 * @brief Scheduler configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/result.hpp"
#include "core/types.hpp"

namespace ledger_scheduler {

struct ClusterConfig {
    uint32_t vm_count = 3;
    ResourceVector capacity{.cpu = 8, .mem = 16, .io = 4, .bw = 10};
};

struct BlockchainPolicyConfig {
    double alpha = 0.7;                 ///< Weight of current resource usage
    double beta = 0.3;                  ///< Weight of historical resource usage
    double epsilon = 1e-6;              ///< Floor for weight and time-to-deadline
    uint32_t history_window = 10;       ///< Snapshots retained per VM
    uint32_t block_size = 5;            ///< Pending transactions that trigger mining
};

struct SchedulerConfig {
    std::string policy = "blockchain";  ///< "roundrobin", "urgency", "leastloaded", "blockchain"
    BlockchainPolicyConfig blockchain;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";   ///< Empty selects stdout
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    ClusterConfig cluster;
    SchedulerConfig scheduler;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file. The result is validated.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check value ranges; reports ErrorCode::ConfigInvalid.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Parse a command-line count override.
 *
 * Accepts a whole decimal string in [0, UINT32_MAX]; anything else,
 * including trailing characters, is ConfigInvalid.
 */
Result<uint32_t> parse_count(std::string_view text);

}  // namespace ledger_scheduler
