/**
 * @file digest.cpp
 * @brief Cryptographic digests of canonical JSON (OpenSSL EVP)
 */

#include "jnorm/digest.hpp"

#include <memory>
#include <utility>

#include <openssl/evp.h>

namespace jnorm::digest {

namespace {

constexpr char kHexChars[] = "0123456789abcdef";

struct MdCtxDeleter
{
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

[[nodiscard]] std::string to_hex(const unsigned char* data, unsigned int len)
{
    std::string out;
    out.resize(static_cast<std::size_t>(len) * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out[i * 2] = kHexChars[data[i] >> 4U];
        out[i * 2 + 1] = kHexChars[data[i] & 0x0FU];
    }
    return out;
}

[[nodiscard]] Error digest_error(std::string_view algorithm, std::string_view step)
{
    return Error::make("DigestError",
                       std::string("OpenSSL ") + std::string(step) + " failed for "
                           + std::string(algorithm));
}

[[nodiscard]] Result<std::string> hash_fragment(const Result<canonical::Fragment>& canonical,
                                                std::string_view algorithm)
{
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    if (!canonical->has_value()) {
        return std::unexpected(
            Error::make("EncodingError", "Value has no canonical JSON form to digest"));
    }
    return hash(**canonical, algorithm);
}

}  // namespace

Result<std::string> hash(std::string_view input, std::string_view algorithm)
{
    const std::string name(algorithm);
    const EVP_MD* md = EVP_get_digestbyname(name.c_str());
    if (md == nullptr) {
        return std::unexpected(
            Error::make("UnsupportedAlgorithm", "Unknown digest algorithm: " + name));
    }

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return std::unexpected(digest_error(algorithm, "EVP_MD_CTX_new"));
    }
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        return std::unexpected(digest_error(algorithm, "EVP_DigestInit_ex"));
    }
    if (EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        return std::unexpected(digest_error(algorithm, "EVP_DigestUpdate"));
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        return std::unexpected(digest_error(algorithm, "EVP_DigestFinal_ex"));
    }
    return to_hex(out, out_len);
}

Result<std::string> digest(const Value& value,
                           std::string_view algorithm,
                           const canonical::Replacer& replacer,
                           const canonical::Options& options)
{
    return hash_fragment(canonical::canonicalize(value, replacer, options), algorithm);
}

void digest_async(Scheduler& scheduler,
                  Value value,
                  std::string algorithm,
                  canonical::Replacer replacer,
                  DigestCompletion done,
                  canonical::Options options)
{
    if (!done) {
        return;
    }
    canonical::canonicalize_async(
        scheduler,
        std::move(value),
        std::move(replacer),
        [algorithm = std::move(algorithm), done = std::move(done)](
            Result<canonical::Fragment> result) { done(hash_fragment(result, algorithm)); },
        options);
}

void digest_async(Scheduler& scheduler, Value value, std::string algorithm, DigestCompletion done)
{
    digest_async(scheduler, std::move(value), std::move(algorithm), {}, std::move(done));
}

Result<std::string> md5(const Value& value)
{
    return digest(value, "md5");
}

Result<std::string> sha256(const Value& value)
{
    return digest(value, "sha256");
}

Result<std::string> sha512(const Value& value)
{
    return digest(value, "sha512");
}

void md5_async(Scheduler& scheduler, Value value, DigestCompletion done)
{
    digest_async(scheduler, std::move(value), "md5", std::move(done));
}

void sha256_async(Scheduler& scheduler, Value value, DigestCompletion done)
{
    digest_async(scheduler, std::move(value), "sha256", std::move(done));
}

void sha512_async(Scheduler& scheduler, Value value, DigestCompletion done)
{
    digest_async(scheduler, std::move(value), "sha512", std::move(done));
}

}  // namespace jnorm::digest
