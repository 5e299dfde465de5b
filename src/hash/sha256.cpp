#include "sha256.hpp"

#include <openssl/evp.h>

#include <memory>

namespace {
struct EVPContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
}  // namespace

std::optional<SHA256::result_type> SHA256::compute(const uint8_t* data,
                                                   std::size_t length) {
    std::unique_ptr<EVP_MD_CTX, EVPContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return std::nullopt;
    }
    result_type result{};
    unsigned int written = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, length) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), result.data(), &written) != 1 ||
        written != result.size()) {
        return std::nullopt;
    }
    return result;
}
