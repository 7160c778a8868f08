/*
 * shardfetch/src/fetch/key_digest.cpp
 *
 * Cache key digest (SHA-256 via OpenSSL EVP).
 *
 * Identifiers are arbitrary URLs; the file cache names its entries by the
 * lower-case hex SHA-256 of the identifier so any URL maps to a safe file name.
 *
 * Dependencies:
 * - OpenSSL::Crypto (linked by CMake in shardfetch_fetch target)
 */

#include <shardfetch/fetch/cache_gateway.hpp>

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace shardfetch::fetch {

namespace {

// Simple RAII wrapper for EVP_MD_CTX
struct EvpMdCtx {
    EVP_MD_CTX* ctx{nullptr};
    EvpMdCtx() : ctx(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() {
        if (ctx)
            EVP_MD_CTX_free(ctx);
    }
    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;
    explicit operator bool() const noexcept { return ctx != nullptr; }
};

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

} // namespace

std::string cacheKeyDigest(std::string_view identifier) {
    EvpMdCtx ctx;
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.ctx, identifier.data(), identifier.size()) != 1) {
        throw std::runtime_error("SHA-256 digest update failed");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md_buf{};
    unsigned md_len = 0;
    if (EVP_DigestFinal_ex(ctx.ctx, md_buf.data(), &md_len) != 1) {
        throw std::runtime_error("SHA-256 digest finalize failed");
    }
    return to_hex_lower(md_buf.data(), md_len);
}

} // namespace shardfetch::fetch
