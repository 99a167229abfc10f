/**
 * @file block.cpp
 * @brief Canonical serialization, merkle tree and block hashing.
 */

#include "ledger/block.hpp"

#include "ledger/hash.hpp"
#include "core/logger.hpp"

#include <format>
#include <sstream>

namespace ledger_scheduler {

namespace {

constexpr std::string_view kEmptyBlockSeed = "empty_block";

void write_resources(std::ostringstream& oss, const ResourceVector& r) {
    oss << R"({"bw":)" << r.bw
        << R"(,"cpu":)" << r.cpu
        << R"(,"io":)" << r.io
        << R"(,"mem":)" << r.mem
        << "}";
}

}  // anonymous namespace

std::string canonical_form(const SchedulingTransaction& tx) {
    std::ostringstream oss;
    oss << R"({"score":)" << std::format("{}", tx.score)
        << R"(,"status":")" << to_string(tx.status) << "\""
        << R"(,"task_id":")" << json_escape(tx.task_id) << "\""
        << R"(,"task_requirements":)";
    write_resources(oss, tx.task_requirements);
    oss << R"(,"timestamp":)" << epoch_micros(tx.timestamp)
        << R"(,"transaction_id":")" << json_escape(tx.transaction_id) << "\""
        << R"(,"vm_id":)" << tx.vm_id
        << R"(,"vm_state_after":)";
    write_resources(oss, tx.vm_state_after);
    oss << R"(,"vm_state_before":)";
    write_resources(oss, tx.vm_state_before);
    oss << "}";
    return oss.str();
}

std::string hash_transaction(const SchedulingTransaction& tx) {
    return sha256_hex(canonical_form(tx));
}

std::string compute_merkle_root(std::span<const SchedulingTransaction> transactions) {
    if (transactions.empty()) {
        return sha256_hex(kEmptyBlockSeed);
    }

    std::vector<std::string> level;
    level.reserve(transactions.size());
    for (const auto& tx : transactions) {
        level.push_back(hash_transaction(tx));
    }

    while (level.size() > 1) {
        if (level.size() % 2 == 1) {
            level.push_back(level.back());
        }
        std::vector<std::string> next;
        next.reserve(level.size() / 2);
        for (size_t i = 0; i < level.size(); i += 2) {
            next.push_back(sha256_hex(level[i] + level[i + 1]));
        }
        level = std::move(next);
    }

    return level.front();
}

std::string compute_block_hash(const LedgerBlock& block) {
    std::ostringstream oss;
    oss << R"({"block_id":)" << block.block_id
        << R"(,"merkle_root":")" << block.merkle_root << "\""
        << R"(,"previous_hash":")" << block.previous_hash << "\""
        << R"(,"timestamp":)" << epoch_micros(block.timestamp)
        << R"(,"transaction_count":)" << block.transactions.size()
        << "}";
    return sha256_hex(oss.str());
}

}  // namespace ledger_scheduler
