/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> and the error taxonomy.
 */

#include "core/result.hpp"

#include <gtest/gtest.h>

using namespace exo_watch;

TEST(ResultTest, SuccessValue) {
    Result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(*r, 42);
}

TEST(ResultTest, ErrorValue) {
    Result<int> r = Error{ErrorKind::Transport, "something went wrong"};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().message, "something went wrong");
    EXPECT_TRUE(r.error().is(ErrorKind::Transport));
}

TEST(ResultTest, BoolConversion) {
    Result<int> success = 1;
    Result<int> failure = Error{ErrorKind::Io, "fail"};
    EXPECT_TRUE(static_cast<bool>(success));
    EXPECT_FALSE(static_cast<bool>(failure));
}

TEST(ResultTest, ValueOr) {
    Result<int> success = 42;
    Result<int> failure = Error{ErrorKind::Io, "fail"};
    EXPECT_EQ(success.value_or(0), 42);
    EXPECT_EQ(failure.value_or(0), 0);
}

TEST(ResultTest, Map) {
    Result<int> r = 21;
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_TRUE(doubled.has_value());
    EXPECT_EQ(*doubled, 42);
}

TEST(ResultTest, MapOnErrorKeepsKind) {
    Result<int> r = Error{ErrorKind::ProbeTimeout, "fail"};
    auto doubled = r.map([](int v) { return v * 2; });
    ASSERT_FALSE(doubled.has_value());
    EXPECT_EQ(doubled.error().message, "fail");
    EXPECT_EQ(doubled.error().kind, ErrorKind::ProbeTimeout);
}

TEST(ResultTest, AndThenChains) {
    Result<int> r = 5;
    auto chained = r.and_then([](int v) -> Result<std::string> {
        if (v < 0) return Error{ErrorKind::MalformedMessage, "negative"};
        return std::to_string(v);
    });
    ASSERT_TRUE(chained.has_value());
    EXPECT_EQ(*chained, "5");
}

TEST(ResultTest, VoidResult) {
    Result<void> ok;
    Result<void> bad = Error{ErrorKind::Config, "missing"};
    EXPECT_TRUE(ok.has_value());
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().kind, ErrorKind::Config);
}

TEST(ResultTest, MakeError) {
    auto r = make_error<int>(ErrorKind::Serialization, "bad utf-8");
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().what(), "bad utf-8");
}

TEST(ResultTest, ValueOnErrorThrows) {
    Result<int> r = Error{ErrorKind::Io, "fail"};
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ErrorKindTest, Names) {
    EXPECT_EQ(to_string(ErrorKind::MalformedMessage), "malformed_message");
    EXPECT_EQ(to_string(ErrorKind::Transport), "transport");
    EXPECT_EQ(to_string(ErrorKind::ProbeTimeout), "probe_timeout");
    EXPECT_EQ(to_string(ErrorKind::Serialization), "serialization");
    EXPECT_EQ(to_string(ErrorKind::Config), "config");
    EXPECT_EQ(to_string(ErrorKind::Io), "io");
}
