#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization of value trees
 *
 * Rules:
 * - Object members are emitted sorted by their rendered `"key":value` text
 * - Array elements keep their index order
 * - Undefined and function members are dropped from objects
 * - Undefined and function elements become null inside arrays
 * - Strings, numbers, booleans and null use standard JSON literal encoding
 *   (non-finite numbers encode as null)
 * - No whitespace
 *
 * The optional replacer follows the JSON.stringify replacer contract: it is
 * called once per node with (key, value) and its result replaces the node.
 * The root key is std::nullopt, array elements receive their decimal index.
 * Once a replacer result is not a container, descendants are serialized
 * without it.
 *
 * canonicalize() and canonicalize_async() run the same algorithm and produce
 * byte-identical output; the async form defers one step per node onto a
 * Scheduler.
 */

#include "jnorm/common.hpp"
#include "jnorm/scheduler.hpp"
#include "jnorm/value.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace jnorm::canonical {

/// Canonical text of a subtree, or std::nullopt when it has no JSON representation.
using Fragment = std::optional<std::string>;

/// Called once per visited node; anything it throws fails the call with ReplacerError.
using Replacer = std::function<Value(const std::optional<std::string>& key, const Value& value)>;

using Completion = std::function<void(Result<Fragment>)>;

/// Default limit on container nesting
constexpr std::size_t kDefaultMaxDepth = jnorm::kDefaultMaxDepth;

struct Options
{
    /// Maximum number of nested containers; deeper input fails with EncodingError.
    std::size_t max_depth = kDefaultMaxDepth;
};

/**
 * Serialize a value to canonical form
 * @param value Value tree (not modified)
 * @param replacer Optional per-node transform
 * @param options Serialization limits
 * @return Canonical text, std::nullopt for a value with no representation, or error
 */
[[nodiscard]] Result<Fragment> canonicalize(const Value& value,
                                            const Replacer& replacer = {},
                                            const Options& options = {});

/**
 * Alias for canonicalize()
 */
[[nodiscard]] inline Result<Fragment> stringify(const Value& value,
                                                const Replacer& replacer = {},
                                                const Options& options = {})
{
    return canonicalize(value, replacer, options);
}

/**
 * Serialize a value to canonical form on a cooperative scheduler
 *
 * The value is owned by the call until completion. @p done is invoked exactly
 * once from within scheduler.run(), never from inside this call. An empty
 * @p done makes the call a no-op.
 */
void canonicalize_async(Scheduler& scheduler,
                        Value value,
                        Replacer replacer,
                        Completion done,
                        Options options = {});

/**
 * Serialize a value on a cooperative scheduler without a replacer
 */
void canonicalize_async(Scheduler& scheduler, Value value, Completion done);

/**
 * Encode a non-container value as a JSON literal
 * @return Literal text, std::nullopt for undefined/function, or EncodingError
 */
[[nodiscard]] Result<Fragment> encode_literal(const Value& value);

}  // namespace jnorm::canonical
