/**
 * @file ledger_export.hpp
 * @brief JSON rendering of ledger exports for a presentation layer.
 *
 * Timestamps are rendered as fractional epoch seconds.
 */

#pragma once

#include "ledger/ledger.hpp"

#include <string>

namespace ledger_scheduler {

[[nodiscard]] std::string to_json(const SchedulingTransaction& tx);
[[nodiscard]] std::string to_json(const LedgerBlock& block);
[[nodiscard]] std::string to_json(const LedgerSummary& summary);
[[nodiscard]] std::string to_json(const VmLedgerStats& stats);

/// {"blocks":[...],"pending_transactions":[...],"summary":{...}}
[[nodiscard]] std::string to_json(const LedgerSnapshot& snapshot);

}  // namespace ledger_scheduler
