#pragma once

/**
 * @file digest.hpp
 * @brief Cryptographic digests of canonical JSON
 *
 * digest(v, alg) == hash(*canonicalize(v), alg): the canonical text is fed
 * to the named OpenSSL message digest and returned as lowercase hex.
 */

#include "jnorm/canonical_json.hpp"
#include "jnorm/common.hpp"
#include "jnorm/scheduler.hpp"
#include "jnorm/value.hpp"

#include <functional>
#include <string>
#include <string_view>

namespace jnorm::digest {

/// Algorithm used by hash() when none is given
constexpr std::string_view kDefaultAlgorithm = "md5";

using DigestCompletion = std::function<void(Result<std::string>)>;

/**
 * Hash raw input
 * @param input Bytes to hash
 * @param algorithm OpenSSL digest name ("md5", "sha256", "sha512", ...)
 * @return Lowercase hex digest, or UnsupportedAlgorithm/DigestError
 */
[[nodiscard]] Result<std::string> hash(std::string_view input,
                                       std::string_view algorithm = kDefaultAlgorithm);

/**
 * Hash the canonical form of a value
 * @return Lowercase hex digest; EncodingError if the value has no canonical form
 */
[[nodiscard]] Result<std::string> digest(const Value& value,
                                         std::string_view algorithm,
                                         const canonical::Replacer& replacer = {},
                                         const canonical::Options& options = {});

/**
 * Hash the canonical form of a value on a cooperative scheduler
 *
 * An empty @p done makes the call a no-op.
 */
void digest_async(Scheduler& scheduler,
                  Value value,
                  std::string algorithm,
                  canonical::Replacer replacer,
                  DigestCompletion done,
                  canonical::Options options = {});

void digest_async(Scheduler& scheduler, Value value, std::string algorithm, DigestCompletion done);

[[nodiscard]] Result<std::string> md5(const Value& value);
[[nodiscard]] Result<std::string> sha256(const Value& value);
[[nodiscard]] Result<std::string> sha512(const Value& value);

void md5_async(Scheduler& scheduler, Value value, DigestCompletion done);
void sha256_async(Scheduler& scheduler, Value value, DigestCompletion done);
void sha512_async(Scheduler& scheduler, Value value, DigestCompletion done);

}  // namespace jnorm::digest
