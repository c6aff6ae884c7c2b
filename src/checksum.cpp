#include "checksum.hpp"

#include <cstdio>
#include <memory>

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/params.h>

namespace qrdrop::recv {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

struct EncodeCtxDeleter {
    void operator()(EVP_ENCODE_CTX* ctx) const { EVP_ENCODE_CTX_free(ctx); }
};

using MdCtxPtr     = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;
using EncodeCtxPtr = std::unique_ptr<EVP_ENCODE_CTX, EncodeCtxDeleter>;

} // namespace

// ---------------------------------------------------------------------------
// BLAKE2b
// ---------------------------------------------------------------------------

namespace {

// The full-length digest needs no parameter; shorter outputs are
// selected through the "size" digest parameter.
bool init_blake2b(EVP_MD_CTX* ctx, std::size_t out_len) {
    std::size_t size = out_len;
    OSSL_PARAM params[2] = {
        OSSL_PARAM_construct_size_t(OSSL_DIGEST_PARAM_SIZE, &size),
        OSSL_PARAM_construct_end()
    };
    const OSSL_PARAM* init_params =
        (out_len == Checksum::kBlake2bMaxLen) ? nullptr : params;
    return EVP_DigestInit_ex2(ctx, EVP_blake2b512(), init_params) == 1;
}

} // namespace

bool Checksum::short_digests_supported() {
    static const bool supported = [] {
        MdCtxPtr ctx(EVP_MD_CTX_new());
        return ctx && init_blake2b(ctx.get(), 1);
    }();
    return supported;
}

std::vector<uint8_t> Checksum::blake2b(const uint8_t* data, std::size_t len,
                                       std::size_t out_len) {
    if (out_len == 0 || out_len > kBlake2bMaxLen) return {};

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) return {};

    if (!init_blake2b(ctx.get(), out_len)) {
        // Every frame would hit this; say it once.
        static bool reported = false;
        if (!reported) {
            std::fprintf(stderr,
                         "[checksum] BLAKE2b init failed for %zu-byte output "
                         "(short digests need OpenSSL 3.2+)\n", out_len);
            reported = true;
        }
        return {};
    }
    if (EVP_DigestUpdate(ctx.get(), data, len) != 1) return {};

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int  written = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &written) != 1) return {};
    if (written != out_len) return {};

    return std::vector<uint8_t>(out, out + written);
}

// ---------------------------------------------------------------------------
// MD5 (whole-file checksum)
// ---------------------------------------------------------------------------

std::string Checksum::md5_hex(const std::vector<uint8_t>& data) {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) return {};

    if (EVP_DigestInit_ex2(ctx.get(), EVP_md5(), nullptr) != 1) {
        std::fprintf(stderr, "[checksum] MD5 unavailable\n");
        return {};
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) return {};

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int  written = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &written) != 1) return {};
    if (written != kMd5Len) return {};

    return to_hex(out, written);
}

// ---------------------------------------------------------------------------
// Encoding helpers
// ---------------------------------------------------------------------------

std::string Checksum::to_hex(const uint8_t* data, std::size_t len) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        out += kDigits[data[i] >> 4];
        out += kDigits[data[i] & 0x0F];
    }
    return out;
}

std::optional<std::vector<uint8_t>> Checksum::base64_decode(std::string_view text) {
    EncodeCtxPtr ctx(EVP_ENCODE_CTX_new());
    if (!ctx) return std::nullopt;

    std::vector<uint8_t> out(text.size() + 3);
    int total = 0;
    int n     = 0;

    EVP_DecodeInit(ctx.get());
    if (EVP_DecodeUpdate(ctx.get(), out.data(), &n,
                         reinterpret_cast<const unsigned char*>(text.data()),
                         static_cast<int>(text.size())) < 0) {
        return std::nullopt;
    }
    total += n;

    if (EVP_DecodeFinal(ctx.get(), out.data() + total, &n) != 1) {
        return std::nullopt;
    }
    total += n;

    out.resize(static_cast<std::size_t>(total));
    return out;
}

} // namespace qrdrop::recv
