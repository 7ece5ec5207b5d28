#include "taskledger/Checksum.hpp"

#include <memory>
#include <openssl/evp.h>
#include "taskledger/Errors.hpp"

namespace taskledger {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

std::string sha256Hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) throw StorageError("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw StorageError("EVP_DigestInit_ex failed");
    }
    if (!data.empty() && EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        throw StorageError("EVP_DigestUpdate failed");
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &outLen) != 1) {
        throw StorageError("EVP_DigestFinal_ex failed");
    }

    static const char* kHex = "0123456789abcdef";
    std::string hex;
    hex.reserve(outLen * 2);
    for (unsigned int i = 0; i < outLen; ++i) {
        hex.push_back(kHex[out[i] >> 4]);
        hex.push_back(kHex[out[i] & 0x0F]);
    }
    return hex;
}

} // namespace taskledger
