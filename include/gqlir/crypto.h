#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlir/crypto.h — Content digests for persisted operation ids
// ═══════════════════════════════════════════════════════════════════
//
//  An operation id is the SHA-256 of the UTF-8 bytes of the operation
//  source followed by its referenced fragment sources, rendered as 64
//  lowercase hex characters. Persisted-query servers compute the same
//  digest, so the output must never depend on platform or locale.
//
// ═══════════════════════════════════════════════════════════════════

#include <string>
#include <string_view>
#include <cstddef>

#include <openssl/sha.h>

namespace gqlir::crypto {

inline std::string toHex(const unsigned char* data, std::size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

inline std::string sha256(std::string_view input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash);
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

// ── Operation id for a persisted query ──
inline std::string operationId(std::string_view sourceWithFragments) {
    return sha256(sourceWithFragments);
}

} // namespace gqlir::crypto
