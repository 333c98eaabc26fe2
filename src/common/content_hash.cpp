// ---------------------------------------------------------------------------
// content_hash.cpp
// ---------------------------------------------------------------------------

#include "common/content_hash.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

}  // namespace

std::string sha256_hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        throw std::runtime_error("content_hash: EVP_MD_CTX_new failed");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int  digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("content_hash: SHA-256 digest failed");
    }

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex += hex_chars[(digest[i] >> 4) & 0x0F];
        hex += hex_chars[digest[i] & 0x0F];
    }
    return hex;
}

std::string sha256_hex_prefix(std::string_view data, std::size_t prefix_len) {
    std::string full = sha256_hex(data);
    if (prefix_len < full.size()) {
        full.resize(prefix_len);
    }
    return full;
}
