/**
 * @file test_digest.cpp
 * @brief Digest determinism tests
 */

#include "jnorm/digest.hpp"

#include "jnorm/canonical_json.hpp"
#include "jnorm/scheduler.hpp"

#include <optional>
#include <string>

#include <gtest/gtest.h>

using namespace jnorm::digest;
using jnorm::Scheduler;
using jnorm::Value;

namespace {

Value bar_baz_foo_bar()
{
    return Value::object({{"foo", "bar"}, {"bar", "baz"}});
}

Value nested_with_undefined()
{
    return Value::object({{"e", Value::object({{"d", nullptr}, {"c", Value()}, {"b", 2}, {"a", 1}})},
                          {"d", nullptr},
                          {"c", Value()},
                          {"b", 2},
                          {"a", 1}});
}

}  // namespace

TEST(Hash, DefaultsToMd5)
{
    auto h = hash("foo");
    ASSERT_TRUE(h);
    EXPECT_EQ(*h, "acbd18db4cc2f85cedef654fccc4a4d8");
}

TEST(Hash, KnownVectors)
{
    EXPECT_EQ(*hash("", "sha256"), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(*hash("abc", "sha256"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(*hash("abc", "md5"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(*hash("abc", "sha512"),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST(Hash, UnsupportedAlgorithm)
{
    auto h = hash("foo", "not-a-digest");
    ASSERT_FALSE(h);
    EXPECT_EQ(h.error().code, "UnsupportedAlgorithm");
}

TEST(Digest, MatchesHashOfCanonicalText)
{
    EXPECT_EQ(*md5(bar_baz_foo_bar()), "60dc2cb9520db75fb07f53e562521e1a");
    EXPECT_EQ(*sha256(bar_baz_foo_bar()),
              "ad378c8d2a976d71cf5eed1717ff09426e378da99d7257547841a5a04343362d");
    EXPECT_EQ(*sha512(bar_baz_foo_bar()),
              "c25b86ec82be6a81101bc2a98b30abfda4d09ac30d6b38f55957e5e8021123bf"
              "dfda0093175eb1d7a53d7c1e310b2b584f6035890501e344355c283d278a7f97");

    EXPECT_EQ(*md5(nested_with_undefined()), "8247b217a980188bf4d16b7636cf66e0");
    EXPECT_EQ(*sha256(Value::array({"a", "b", Value(), "c"})),
              "80d60bf30f2a7fff4b8f570ea9ef9adc7537e7cf7e5e6ec034ed02f53b1064ff");
}

TEST(Digest, OrderInvariance)
{
    Value lhs = Value::object({{"foo", "bar"}, {"hello", "world"}});
    Value rhs = Value::object({{"hello", "world"}, {"foo", "bar"}});
    for (const char* algorithm : {"md5", "sha256", "sha512"}) {
        auto a = digest(lhs, algorithm);
        auto b = digest(rhs, algorithm);
        ASSERT_TRUE(a);
        ASSERT_TRUE(b);
        EXPECT_EQ(*a, *b) << algorithm;
    }
}

TEST(Digest, EqualsHashOfCanonicalize)
{
    Value value = nested_with_undefined();
    auto canonical = jnorm::canonical::canonicalize(value);
    ASSERT_TRUE(canonical);
    ASSERT_TRUE(canonical->has_value());
    EXPECT_EQ(*digest(value, "sha256"), *hash(**canonical, "sha256"));
}

TEST(Digest, AppliesReplacer)
{
    auto redact = [](const std::optional<std::string>& key, const Value& value) {
        return key == "password" ? Value() : value;
    };
    Value with_secret = Value::object({{"user", "u"}, {"password", "p"}});
    Value without_secret = Value::object({{"user", "u"}});
    EXPECT_EQ(*digest(with_secret, "sha256", redact), *digest(without_secret, "sha256"));
}

TEST(Digest, LowercaseHex)
{
    auto h = sha512(Value::array({1, 2, 3}));
    ASSERT_TRUE(h);
    EXPECT_EQ(h->size(), 128U);
    EXPECT_EQ(h->find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(Digest, NoCanonicalFormIsEncodingError)
{
    auto h = md5(Value());
    ASSERT_FALSE(h);
    EXPECT_EQ(h.error().code, "EncodingError");

    auto f = sha256(Value::function("f"));
    ASSERT_FALSE(f);
    EXPECT_EQ(f.error().code, "EncodingError");
}

TEST(Digest, PropagatesCanonicalizationError)
{
    auto h = md5(Value::object({{"bad", std::string("\xFF", 1)}}));
    ASSERT_FALSE(h);
    EXPECT_EQ(h.error().code, "EncodingError");
}

TEST(DigestAsync, MatchesSynchronousForm)
{
    Scheduler scheduler(Scheduler::Order::kShuffled, 5);
    std::optional<std::string> md5_hex;
    std::optional<std::string> sha256_hex;
    std::optional<std::string> sha512_hex;

    md5_async(scheduler, bar_baz_foo_bar(), [&md5_hex](jnorm::Result<std::string> r) {
        ASSERT_TRUE(r);
        md5_hex = *r;
    });
    sha256_async(scheduler, bar_baz_foo_bar(), [&sha256_hex](jnorm::Result<std::string> r) {
        ASSERT_TRUE(r);
        sha256_hex = *r;
    });
    sha512_async(scheduler, bar_baz_foo_bar(), [&sha512_hex](jnorm::Result<std::string> r) {
        ASSERT_TRUE(r);
        sha512_hex = *r;
    });
    EXPECT_FALSE(md5_hex.has_value());
    scheduler.run();

    EXPECT_EQ(md5_hex, *md5(bar_baz_foo_bar()));
    EXPECT_EQ(sha256_hex, *sha256(bar_baz_foo_bar()));
    EXPECT_EQ(sha512_hex, *sha512(bar_baz_foo_bar()));
}

TEST(DigestAsync, NamedAlgorithmWithReplacer)
{
    auto redact = [](const std::optional<std::string>& key, const Value& value) {
        return key == "password" ? Value("***") : value;
    };
    Value data = Value::object({{"user", "u"}, {"password", "p"}});

    Scheduler scheduler;
    std::optional<jnorm::Result<std::string>> result;
    digest_async(scheduler, data, "sha256", redact, [&result](jnorm::Result<std::string> r) {
        result = std::move(r);
    });
    scheduler.run();

    ASSERT_TRUE(result.has_value());
    ASSERT_TRUE(*result);
    EXPECT_EQ(**result, *digest(data, "sha256", redact));
}

TEST(DigestAsync, UnsupportedAlgorithmDelivered)
{
    Scheduler scheduler;
    std::optional<jnorm::Error> error;
    digest_async(scheduler, Value(1), "nope", [&error](jnorm::Result<std::string> r) {
        if (!r) {
            error = r.error();
        }
    });
    scheduler.run();
    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, "UnsupportedAlgorithm");
}

TEST(DigestAsync, MissingCompletionIsNoOp)
{
    Scheduler scheduler;
    md5_async(scheduler, Value::object({}), DigestCompletion{});
    digest_async(scheduler, Value::object({}), "sha256", DigestCompletion{});
    EXPECT_TRUE(scheduler.empty());
}
