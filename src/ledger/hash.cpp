/**
 * @file hash.cpp
 * @brief SHA-256 through the OpenSSL EVP interface.
 */

#include "ledger/hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace ledger_scheduler {

std::string sha256_hex(std::string_view data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(static_cast<size_t>(digest_len) * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out.push_back(kHex[digest[i] >> 4]);
        out.push_back(kHex[digest[i] & 0x0F]);
    }
    return out;
}

bool is_hex_digest(std::string_view text) noexcept {
    if (text.size() != kDigestHexLength) return false;
    for (char c : text) {
        bool digit = c >= '0' && c <= '9';
        bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) return false;
    }
    return true;
}

}  // namespace ledger_scheduler
