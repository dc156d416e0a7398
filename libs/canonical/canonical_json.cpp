/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization of value trees
 *
 * One algorithm serves both entry points. It is written in continuation
 * style and parameterized by a suspension strategy: Immediate runs each
 * deferred step inline (synchronous form), Deferred posts it to a Scheduler
 * (asynchronous form). Containers fan out to all children, then fan in
 * through a Join that assembles the parent fragment exactly once.
 */

#include "jnorm/canonical_json.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace jnorm::canonical {

namespace {

using Node = std::shared_ptr<const Value>;
using Key = std::optional<std::string>;

[[nodiscard]] Error encoding_error(std::string message)
{
    return Error::make("EncodingError", std::move(message));
}

[[nodiscard]] const Node& null_node()
{
    static const Node kNull = std::make_shared<const Value>(nullptr);
    return kNull;
}

[[nodiscard]] const Node& undefined_node()
{
    static const Node kUndefined = std::make_shared<const Value>();
    return kUndefined;
}

/**
 * @brief Quote and escape a string, rejecting invalid UTF-8
 */
[[nodiscard]] Result<std::string> encode_string(const std::string& text)
{
    try {
        return nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(encoding_error(std::string("Cannot encode string: ") + ex.what()));
    }
}

// ============================================================================
// Fragment ordering
// ============================================================================

// Input has already passed the strict UTF-8 check of encode_string().
[[nodiscard]] std::uint32_t next_code_point(std::string_view text, std::size_t& pos) noexcept
{
    const auto lead = static_cast<unsigned char>(text[pos]);
    std::size_t length = 1;
    std::uint32_t cp = lead;
    if (lead >= 0xF0U) {
        length = 4;
        cp = lead & 0x07U;
    } else if (lead >= 0xE0U) {
        length = 3;
        cp = lead & 0x0FU;
    } else if (lead >= 0xC0U) {
        length = 2;
        cp = lead & 0x1FU;
    }
    length = std::min(length, text.size() - pos);
    for (std::size_t i = 1; i < length; ++i) {
        cp = (cp << 6U) | (static_cast<unsigned char>(text[pos + i]) & 0x3FU);
    }
    pos += length;
    return cp;
}

// Surrogate pairs (0xD800..) sort below U+E000..U+FFFF in UTF-16.
[[nodiscard]] constexpr std::uint32_t utf16_rank(std::uint32_t cp) noexcept
{
    return (cp >= 0xE000U && cp <= 0xFFFFU) ? cp + 0x110000U : cp;
}

/**
 * @brief Compare UTF-8 strings by their UTF-16 code unit sequences
 */
[[nodiscard]] bool utf16_less(std::string_view lhs, std::string_view rhs) noexcept
{
    std::size_t i = 0;
    std::size_t j = 0;
    while (i < lhs.size() && j < rhs.size()) {
        if (lhs[i] == rhs[j] && static_cast<unsigned char>(lhs[i]) < 0x80U) {
            ++i;
            ++j;
            continue;
        }
        const auto a = utf16_rank(next_code_point(lhs, i));
        const auto b = utf16_rank(next_code_point(rhs, j));
        if (a != b) {
            return a < b;
        }
    }
    return i == lhs.size() && j < rhs.size();
}

// ============================================================================
// Fan-in
// ============================================================================

[[nodiscard]] std::string assemble_array(std::vector<Fragment>& slots)
{
    std::string out = "[";
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += slots[i] ? *slots[i] : "null";
    }
    out += ']';
    return out;
}

[[nodiscard]] std::string assemble_object(std::vector<Fragment>& slots)
{
    std::vector<std::string> members;
    members.reserve(slots.size());
    for (auto& slot : slots) {
        if (slot) {
            members.push_back(std::move(*slot));
        }
    }
    std::ranges::sort(members, utf16_less);

    std::string out = "{";
    for (std::size_t i = 0; i < members.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += members[i];
    }
    out += '}';
    return out;
}

/**
 * @brief Per-container completion counter
 *
 * Children report into positional slots in any order. The parent fragment is
 * assembled once the last slot is filled. The first failure is forwarded and
 * every later report is discarded.
 *
 * Only touched from one thread; a multi-threaded driver needs a mutex here.
 */
class Join {
public:
    using Assemble = std::string (*)(std::vector<Fragment>&);

    Join(std::size_t count, Assemble assemble, Completion done)
        : m_slots(count)
        , m_assemble(assemble)
        , m_done(std::move(done))
    {}

    void report(std::size_t index, Result<Fragment> result)
    {
        if (m_settled) {
            return;
        }
        if (!result) {
            m_settled = true;
            m_done(std::unexpected(std::move(result.error())));
            return;
        }
        m_slots[index] = std::move(*result);
        if (++m_completed == m_slots.size()) {
            m_settled = true;
            m_done(Fragment{m_assemble(m_slots)});
        }
    }

private:
    std::vector<Fragment> m_slots;
    std::size_t m_completed = 0;
    bool m_settled = false;
    Assemble m_assemble;
    Completion m_done;
};

// ============================================================================
// Replacer gate
// ============================================================================

struct Gated
{
    Node value;
    Replacer replacer;  ///< Empty once the value is no longer a container
};

[[nodiscard]] Result<Gated> apply_replacer(const Key& key, Node node, const Replacer& replacer)
{
    if (!replacer) {
        if (node->is_function()) {
            node = undefined_node();
        }
        return Gated{.value = std::move(node), .replacer = {}};
    }

    Value replaced;
    try {
        replaced = replacer(key, *node);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ReplacerError",
            std::string("Replacer failed at key '") + key.value_or("") + "': " + ex.what()));
    } catch (...) {
        return std::unexpected(Error::make(
            "ReplacerError",
            std::string("Replacer failed at key '") + key.value_or("") + "': unknown exception"));
    }

    auto owned = std::make_shared<const Value>(std::move(replaced));
    const bool descend = owned->is_container();
    return Gated{.value = std::move(owned), .replacer = descend ? replacer : Replacer{}};
}

// ============================================================================
// Suspension strategies
// ============================================================================

struct Immediate
{
    void defer(std::function<void()> task) const { task(); }
};

struct Deferred
{
    Scheduler* scheduler;

    void defer(std::function<void()> task) const { scheduler->post(std::move(task)); }
};

// ============================================================================
// Serializer
// ============================================================================

template <typename Suspend>
class Serializer {
public:
    Serializer(Suspend suspend, Options options)
        : m_suspend(suspend)
        , m_options(options)
    {}

    void serialize(Node node, const Replacer& replacer, const Key& key, std::size_t depth,
                   Completion done) const
    {
        auto gated = apply_replacer(key, std::move(node), replacer);
        if (!gated) {
            m_suspend.defer([error = std::move(gated.error()), done = std::move(done)]() {
                done(std::unexpected(error));
            });
            return;
        }

        m_suspend.defer([self = *this, gated = std::move(*gated), depth, done = std::move(done)]() {
            if (!gated.value->is_container()) {
                done(encode_literal(*gated.value));
                return;
            }
            if (depth >= self.m_options.max_depth) {
                done(std::unexpected(encoding_error("Nesting exceeds max depth of "
                                                    + std::to_string(self.m_options.max_depth))));
                return;
            }
            if (gated.value->is_array()) {
                self.serialize_array(gated, depth, done);
            } else {
                self.serialize_object(gated, depth, done);
            }
        });
    }

private:
    void serialize_array(const Gated& gated, std::size_t depth, const Completion& done) const
    {
        const Array& elements = gated.value->as_array();
        if (elements.empty()) {
            done(Fragment{"[]"});
            return;
        }

        auto join = std::make_shared<Join>(elements.size(), &assemble_array, done);
        for (std::size_t i = 0; i < elements.size(); ++i) {
            // Undefined slots are serialized (and shown to the replacer) as null.
            Node child = elements[i].is_undefined() ? null_node() : Node(gated.value, &elements[i]);
            serialize(std::move(child),
                      gated.replacer,
                      std::to_string(i),
                      depth + 1,
                      [join, i](Result<Fragment> result) { join->report(i, std::move(result)); });
        }
    }

    void serialize_object(const Gated& gated, std::size_t depth, const Completion& done) const
    {
        const Object& members = gated.value->as_object();
        if (members.empty()) {
            done(Fragment{"{}"});
            return;
        }

        auto join = std::make_shared<Join>(members.size(), &assemble_object, done);
        std::size_t slot = 0;
        for (const auto& [key, member] : members) {
            const std::size_t index = slot++;
            // Undefined members are dropped without consulting the replacer.
            if (member.is_undefined()) {
                join->report(index, Fragment{});
                continue;
            }
            auto encoded_key = encode_string(key);
            if (!encoded_key) {
                join->report(index, std::unexpected(std::move(encoded_key.error())));
                continue;
            }
            serialize(Node(gated.value, &member),
                      gated.replacer,
                      key,
                      depth + 1,
                      [join, index, prefix = *encoded_key + ":"](Result<Fragment> result) {
                          if (result && result->has_value()) {
                              result = Fragment{prefix + **result};
                          }
                          join->report(index, std::move(result));
                      });
        }
    }

    Suspend m_suspend;
    Options m_options;
};

}  // namespace

Result<Fragment> encode_literal(const Value& value)
{
    return std::visit(
        [](const auto& v) -> Result<Fragment> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, Undefined> || std::is_same_v<T, Function>) {
                return Fragment{};
            } else if constexpr (std::is_same_v<T, Array> || std::is_same_v<T, Object>) {
                return std::unexpected(encoding_error("Literal encoder received a container"));
            } else if constexpr (std::is_same_v<T, std::string>) {
                auto encoded = encode_string(v);
                if (!encoded) {
                    return std::unexpected(std::move(encoded.error()));
                }
                return Fragment{std::move(*encoded)};
            } else {
                // null, booleans and numbers; non-finite doubles dump as null
                return Fragment{nlohmann::json(v).dump()};
            }
        },
        value.storage());
}

Result<Fragment> canonicalize(const Value& value, const Replacer& replacer, const Options& options)
{
    // Non-owning root: the caller's value outlives this call.
    Node root(Node{}, &value);

    std::optional<Result<Fragment>> outcome;
    Serializer<Immediate>(Immediate{}, options)
        .serialize(std::move(root), replacer, std::nullopt, 0, [&outcome](Result<Fragment> result) {
            outcome = std::move(result);
        });
    if (!outcome) {
        return std::unexpected(Error::make("InternalError", "Serialization did not complete"));
    }
    return std::move(*outcome);
}

void canonicalize_async(Scheduler& scheduler,
                        Value value,
                        Replacer replacer,
                        Completion done,
                        Options options)
{
    if (!done) {
        return;
    }
    auto root = std::make_shared<const Value>(std::move(value));
    Serializer<Deferred>(Deferred{.scheduler = &scheduler}, options)
        .serialize(std::move(root), replacer, std::nullopt, 0, std::move(done));
}

void canonicalize_async(Scheduler& scheduler, Value value, Completion done)
{
    canonicalize_async(scheduler, std::move(value), Replacer{}, std::move(done));
}

}  // namespace jnorm::canonical
