/**
 * @file value.cpp
 * @brief Value tree construction and conversion from nlohmann::json
 */

#include "jnorm/value.hpp"

#include <algorithm>
#include <ranges>
#include <string>

namespace jnorm {

Object::Object() = default;

Object::Object(std::initializer_list<Member> members)
{
    m_members.reserve(members.size());
    for (const auto& [key, value] : members) {
        set(key, value);
    }
}

Object::Object(const Object& other) = default;
Object::Object(Object&& other) noexcept = default;
Object& Object::operator=(const Object& other) = default;
Object& Object::operator=(Object&& other) noexcept = default;
Object::~Object() = default;

void Object::set(std::string key, Value value)
{
    auto it = std::ranges::find(m_members, key, &Member::first);
    if (it != m_members.end()) {
        it->second = std::move(value);
        return;
    }
    m_members.emplace_back(std::move(key), std::move(value));
}

const Value* Object::find(std::string_view key) const
{
    auto it = std::ranges::find_if(m_members,
                                   [key](const Member& member) { return member.first == key; });
    return it == m_members.end() ? nullptr : &it->second;
}

std::size_t Object::size() const noexcept
{
    return m_members.size();
}

bool Object::empty() const noexcept
{
    return m_members.empty();
}

Object::const_iterator Object::begin() const noexcept
{
    return m_members.begin();
}

Object::const_iterator Object::end() const noexcept
{
    return m_members.end();
}

bool Object::operator==(const Object& other) const
{
    if (m_members.size() != other.m_members.size()) {
        return false;
    }
    return std::ranges::all_of(m_members, [&other](const Member& member) {
        const Value* theirs = other.find(member.first);
        return theirs != nullptr && *theirs == member.second;
    });
}

Value Value::array(std::initializer_list<Value> elements)
{
    return Value(Array(elements));
}

Value Value::object(std::initializer_list<Object::Member> members)
{
    return Value(Object(members));
}

Value Value::function(std::string name)
{
    return Value(Function{.name = std::move(name)});
}

namespace {

Result<Value> convert(const nlohmann::json& j, std::size_t depth, std::size_t max_depth)
{
    if (j.is_structured() && depth >= max_depth) {
        return std::unexpected(Error::make(
            "EncodingError",
            "JSON input exceeds maximum nesting depth of " + std::to_string(max_depth)));
    }

    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return Value(nullptr);
        case nlohmann::json::value_t::boolean:
            return Value(j.get<bool>());
        case nlohmann::json::value_t::number_integer:
            return Value(j.get<std::int64_t>());
        case nlohmann::json::value_t::number_unsigned:
            return Value(j.get<std::uint64_t>());
        case nlohmann::json::value_t::number_float:
            return Value(j.get<double>());
        case nlohmann::json::value_t::string:
            return Value(j.get_ref<const std::string&>());
        case nlohmann::json::value_t::array: {
            Array elements;
            elements.reserve(j.size());
            for (const auto& elem : j) {
                auto converted = convert(elem, depth + 1, max_depth);
                if (!converted) {
                    return std::unexpected(std::move(converted.error()));
                }
                elements.push_back(std::move(*converted));
            }
            return Value(std::move(elements));
        }
        case nlohmann::json::value_t::object: {
            Object members;
            for (const auto& [key, val] : j.items()) {
                auto converted = convert(val, depth + 1, max_depth);
                if (!converted) {
                    return std::unexpected(std::move(converted.error()));
                }
                members.set(key, std::move(*converted));
            }
            return Value(std::move(members));
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    return Value();
}

}  // namespace

Result<Value> Value::from_json(const nlohmann::json& j, std::size_t max_depth)
{
    return convert(j, 0, max_depth);
}

}  // namespace jnorm
