/**
 * @file hash.hpp
 * @brief SHA-256 digests rendered as lowercase hex.
 */

#pragma once

#include <string>
#include <string_view>

namespace ledger_scheduler {

/// Length of a hex-encoded SHA-256 digest.
inline constexpr size_t kDigestHexLength = 64;

/// previous_hash of the genesis block.
inline const std::string kGenesisPreviousHash(kDigestHexLength, '0');

/**
 * @brief SHA-256 of @p data as 64 lowercase hex characters.
 * @throws std::runtime_error if libcrypto fails to produce a digest.
 */
[[nodiscard]] std::string sha256_hex(std::string_view data);

/**
 * @brief True iff @p text is exactly 64 lowercase hex characters.
 */
[[nodiscard]] bool is_hex_digest(std::string_view text) noexcept;

}  // namespace ledger_scheduler
