/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <limits>
#include <string>

namespace ledger_scheduler {

namespace {

uint64_t read_capacity(const toml::node_view<toml::node>& table,
                       std::string_view key, uint64_t fallback) {
    auto value = table[key].value_or(static_cast<int64_t>(fallback));
    return value < 0 ? 0 : static_cast<uint64_t>(value);
}

/// Non-negative integer that must fit in 32 bits.
Result<uint32_t> read_count(const toml::node_view<toml::node>& table,
                            std::string_view key, uint32_t fallback) {
    auto value = table[key].value_or(static_cast<int64_t>(fallback));
    if (value < 0 || value > static_cast<int64_t>(std::numeric_limits<uint32_t>::max())) {
        return Error{ErrorCode::ConfigInvalid,
                     std::string{key} + " out of range: " + std::to_string(value)};
    }
    return static_cast<uint32_t>(value);
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigInvalid, "Configuration file not found: " + path.string()};
    }

    Config config;

    try {
        auto tbl = toml::parse_file(path.string());

        // [cluster]
        if (auto cluster = tbl["cluster"]; cluster.is_table()) {
            auto vm_count = read_count(cluster, "vm_count", 3);
            if (!vm_count) return vm_count.error();
            config.cluster.vm_count = *vm_count;

            // [cluster.capacity]
            if (auto capacity = cluster["capacity"]; capacity.is_table()) {
                auto& cap = config.cluster.capacity;
                cap.cpu = read_capacity(capacity, "cpu", cap.cpu);
                cap.mem = read_capacity(capacity, "mem", cap.mem);
                cap.io = read_capacity(capacity, "io", cap.io);
                cap.bw = read_capacity(capacity, "bw", cap.bw);
            }
        }

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            config.scheduler.policy = scheduler["policy"].value_or(std::string{"blockchain"});

            // [scheduler.blockchain]
            if (auto chain = scheduler["blockchain"]; chain.is_table()) {
                auto& bc = config.scheduler.blockchain;
                bc.alpha = chain["alpha"].value_or(0.7);
                bc.beta = chain["beta"].value_or(0.3);
                bc.epsilon = chain["epsilon"].value_or(1e-6);

                auto history_window = read_count(chain, "history_window", 10);
                if (!history_window) return history_window.error();
                bc.history_window = *history_window;

                auto block_size = read_count(chain, "block_size", 5);
                if (!block_size) return block_size.error();
                bc.block_size = *block_size;
            }
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});

            auto max_file_size_mb = read_count(telemetry, "max_file_size_mb", 50);
            if (!max_file_size_mb) return max_file_size_mb.error();
            config.telemetry.max_file_size_mb = *max_file_size_mb;

            auto rotate_count = read_count(telemetry, "rotate_count", 5);
            if (!rotate_count) return rotate_count.error();
            config.telemetry.rotate_count = *rotate_count;
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigInvalid,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    if (config.cluster.capacity.any_zero()) {
        return Error{ErrorCode::ConfigInvalid, "cluster.capacity: every dimension must be > 0"};
    }

    const auto& bc = config.scheduler.blockchain;
    if (bc.block_size == 0) {
        return Error{ErrorCode::ConfigInvalid, "scheduler.blockchain.block_size must be > 0"};
    }
    if (bc.history_window == 0) {
        return Error{ErrorCode::ConfigInvalid, "scheduler.blockchain.history_window must be > 0"};
    }
    if (!(bc.epsilon > 0.0)) {
        return Error{ErrorCode::ConfigInvalid, "scheduler.blockchain.epsilon must be > 0"};
    }
    if (bc.alpha < 0.0 || bc.beta < 0.0) {
        return Error{ErrorCode::ConfigInvalid, "scheduler.blockchain alpha/beta must be >= 0"};
    }

    if (!parse_policy_kind(config.scheduler.policy)) {
        return Error{ErrorCode::ConfigInvalid,
                     "scheduler.policy: unknown policy '" + config.scheduler.policy + "'"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::ConfigInvalid,
                     "telemetry.log_level: unknown level '" + config.telemetry.log_level + "'"};
    }

    return Result<void>{};
}

Config default_config() {
    return Config{};
}

Result<uint32_t> parse_count(std::string_view text) {
    uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()
        || value > std::numeric_limits<uint32_t>::max()) {
        return Error{ErrorCode::ConfigInvalid, "not a count: '" + std::string{text} + "'"};
    }
    return static_cast<uint32_t>(value);
}

}  // namespace ledger_scheduler
