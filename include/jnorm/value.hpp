#pragma once

/**
 * @file value.hpp
 * @brief Dynamic value tree accepted by the canonicalizer
 *
 * A Value is one of: undefined, null, boolean, number (signed, unsigned or
 * floating point), string, function, array or object. Undefined and function
 * have no JSON representation; the canonicalizer drops or replaces them the
 * way JSON stringification does.
 */

#include "jnorm/common.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace jnorm {

/// Default limit on container nesting
constexpr std::size_t kDefaultMaxDepth = 1024;

class Value;

/**
 * @brief Marker for "no value"
 */
struct Undefined
{
    [[nodiscard]] bool operator==(const Undefined&) const = default;
};

/**
 * @brief Opaque callable placeholder
 *
 * Only carries a name for diagnostics. Functions are never serialized.
 */
struct Function
{
    std::string name;

    [[nodiscard]] bool operator==(const Function&) const = default;
};

using Array = std::vector<Value>;

/**
 * @brief Insertion-ordered mapping of unique keys to values
 */
class Object {
public:
    using Member = std::pair<std::string, Value>;
    using const_iterator = std::vector<Member>::const_iterator;

    Object();
    Object(std::initializer_list<Member> members);
    Object(const Object& other);
    Object(Object&& other) noexcept;
    Object& operator=(const Object& other);
    Object& operator=(Object&& other) noexcept;
    ~Object();

    /**
     * @brief Insert or replace a member
     *
     * An existing key keeps its position; a new key is appended.
     */
    void set(std::string key, Value value);

    /**
     * @brief Look up a member
     * @return Pointer to the value, or nullptr if absent
     */
    [[nodiscard]] const Value* find(std::string_view key) const;

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

    /// Key-set equality; insertion order is ignored.
    [[nodiscard]] bool operator==(const Object& other) const;

private:
    std::vector<Member> m_members;
};

class Value {
public:
    using Storage = std::variant<Undefined,
                                 std::nullptr_t,
                                 bool,
                                 std::int64_t,
                                 std::uint64_t,
                                 double,
                                 std::string,
                                 Function,
                                 Array,
                                 Object>;

    Value() = default;
    Value(Undefined) {}
    Value(std::nullptr_t) : m_storage(nullptr) {}
    Value(bool b) : m_storage(b) {}

    template <typename T>
        requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
    Value(T number)
    {
        if constexpr (std::is_signed_v<T>) {
            m_storage = static_cast<std::int64_t>(number);
        } else {
            m_storage = static_cast<std::uint64_t>(number);
        }
    }

    Value(double number) : m_storage(number) {}
    Value(const char* text) : m_storage(std::string(text)) {}
    Value(std::string text) : m_storage(std::move(text)) {}
    Value(std::string_view text) : m_storage(std::string(text)) {}
    Value(Function fn) : m_storage(std::move(fn)) {}
    Value(Array array) : m_storage(std::move(array)) {}
    Value(Object object) : m_storage(std::move(object)) {}

    [[nodiscard]] static Value array(std::initializer_list<Value> elements);
    [[nodiscard]] static Value object(std::initializer_list<Object::Member> members);
    [[nodiscard]] static Value function(std::string name = "anonymous");

    /**
     * @brief Convert a parsed JSON document into a value tree
     *
     * A container nested max_depth levels below the root fails with
     * EncodingError before any part of the tree is kept.
     */
    [[nodiscard]] static Result<Value> from_json(const nlohmann::json& j,
                                                 std::size_t max_depth = kDefaultMaxDepth);

    [[nodiscard]] bool is_undefined() const noexcept
    {
        return std::holds_alternative<Undefined>(m_storage);
    }
    [[nodiscard]] bool is_null() const noexcept
    {
        return std::holds_alternative<std::nullptr_t>(m_storage);
    }
    [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(m_storage); }
    [[nodiscard]] bool is_number() const noexcept
    {
        return std::holds_alternative<std::int64_t>(m_storage)
               || std::holds_alternative<std::uint64_t>(m_storage)
               || std::holds_alternative<double>(m_storage);
    }
    [[nodiscard]] bool is_string() const noexcept
    {
        return std::holds_alternative<std::string>(m_storage);
    }
    [[nodiscard]] bool is_function() const noexcept
    {
        return std::holds_alternative<Function>(m_storage);
    }
    [[nodiscard]] bool is_array() const noexcept { return std::holds_alternative<Array>(m_storage); }
    [[nodiscard]] bool is_object() const noexcept
    {
        return std::holds_alternative<Object>(m_storage);
    }
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

    [[nodiscard]] bool as_bool() const { return std::get<bool>(m_storage); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(m_storage); }
    [[nodiscard]] const Function& as_function() const { return std::get<Function>(m_storage); }
    [[nodiscard]] const Array& as_array() const { return std::get<Array>(m_storage); }
    [[nodiscard]] const Object& as_object() const { return std::get<Object>(m_storage); }

    [[nodiscard]] const Storage& storage() const noexcept { return m_storage; }

    [[nodiscard]] bool operator==(const Value& other) const { return m_storage == other.m_storage; }

private:
    Storage m_storage;
};

}  // namespace jnorm
