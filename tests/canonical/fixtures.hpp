#pragma once

/**
 * @file fixtures.hpp
 * @brief Shared value fixtures for canonicalization tests
 */

#include "jnorm/value.hpp"

#include <string>
#include <utility>
#include <vector>

namespace jnorm::testing {

/// Values whose canonical form equals plain JSON stringification, paired with that text.
inline std::vector<std::pair<Value, std::string>> basic_values()
{
    return {
        {Value::object({}), "{}"},
        {Value::array({}), "[]"},
        {Value::object({{"foo", "bar"}}), R"({"foo":"bar"})"},
        {Value::object({{"bar", "baz"}, {"foo", "bar"}}), R"({"bar":"baz","foo":"bar"})"},
        {Value::array({1, 2, 3}), "[1,2,3]"},
        {Value::array({Value::object({{"a", 1}}), Value::object({{"b", 2}})}), R"([{"a":1},{"b":2}])"},
        {Value::array({"a", "b", nullptr, "c"}), R"(["a","b",null,"c"])"},
        {Value::array({"a", "b", Value(), "c"}), R"(["a","b",null,"c"])"},
        {Value::object({{"a", 1}, {"b", 2}, {"c", Value()}, {"d", nullptr}}), R"({"a":1,"b":2,"d":null})"},
        {Value::object({{"a", 1},
                        {"b", 2},
                        {"c", Value()},
                        {"d", nullptr},
                        {"e", Value::object({{"a", 1}, {"b", 2}, {"c", Value()}, {"d", nullptr}})}}),
         R"({"a":1,"b":2,"d":null,"e":{"a":1,"b":2,"d":null}})"},
    };
}

inline Value zy_pair()
{
    return Value::object({{"z", 2}, {"y", 1}});
}

inline Value yz_pair()
{
    return Value::object({{"y", 1}, {"z", 2}});
}

inline Value ya_tree()
{
    auto leaf = [] { return Value::object({{"a", 1}}); };
    auto level = [&leaf] { return Value::object({{"z", leaf()}, {"y", leaf()}}); };
    auto upper = [&level] { return Value::object({{"z", level()}, {"y", level()}}); };
    return Value::object({{"z", upper()}, {"y", upper()}});
}

/// Values where insertion order differs from canonical order, paired with the canonical text.
inline std::vector<std::pair<Value, std::string>> ordered_values()
{
    auto triple = [] { return Value::array({zy_pair(), zy_pair(), yz_pair()}); };
    return {
        {Value::object({{"foo", "bar"}, {"bar", "baz"}}), R"({"bar":"baz","foo":"bar"})"},
        {Value::object({{"foo", "bar"}, {"b", 1}, {"a", Value::object({{"z", 0}, {"y", 9}})}}),
         R"({"a":{"y":9,"z":0},"b":1,"foo":"bar"})"},
        {triple(), R"([{"y":1,"z":2},{"y":1,"z":2},{"y":1,"z":2}])"},
        {Value::array({triple(), triple(), triple()}),
         R"([[{"y":1,"z":2},{"y":1,"z":2},{"y":1,"z":2}],[{"y":1,"z":2},{"y":1,"z":2},{"y":1,"z":2}],[{"y":1,"z":2},{"y":1,"z":2},{"y":1,"z":2}]])"},
        {ya_tree(),
         R"({"y":{"y":{"y":{"a":1},"z":{"a":1}},"z":{"y":{"a":1},"z":{"a":1}}},"z":{"y":{"y":{"a":1},"z":{"a":1}},"z":{"y":{"a":1},"z":{"a":1}}}})"},
    };
}

}  // namespace jnorm::testing
