#include <gtest/gtest.h>

#include <string>

#include "arena/core/result.hpp"
#include "arena/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(arena::Version::major, 0);
    EXPECT_EQ(arena::Version::minor, 3);
    EXPECT_EQ(arena::Version::patch, 0);
}

TEST(VersionTest, VersionString) {
    EXPECT_STREQ(arena::Version::string, "0.3.0");
}

TEST(ResultTest, OkValue) {
    auto result = arena::Result<int>::ok(42);
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorValue) {
    auto result = arena::Result<int>::err(arena::Error("something failed"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "something failed");
    EXPECT_EQ(result.error().code, -1);
}

TEST(ResultTest, ValueOr) {
    auto ok = arena::Result<int>::ok(10);
    auto err = arena::Result<int>::err(arena::Error(404, "not found"));
    EXPECT_EQ(ok.valueOr(0), 10);
    EXPECT_EQ(err.valueOr(0), 0);
}

TEST(ResultTest, SameTypeForValueAndError) {
    // Index-based construction keeps ok/err distinct even when T == E.
    auto ok = arena::Result<std::string, std::string>::ok("value");
    auto err = arena::Result<std::string, std::string>::err("problem");
    EXPECT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.hasError());
    EXPECT_EQ(err.error(), "problem");
}

TEST(ResultTest, MoveOutValue) {
    auto result = arena::Result<std::string>::ok("payload");
    std::string taken = std::move(result).value();
    EXPECT_EQ(taken, "payload");
}

TEST(ResultVoidTest, Ok) {
    auto result = arena::Result<void>::ok();
    EXPECT_TRUE(result.hasValue());
    EXPECT_FALSE(result.hasError());
}

TEST(ResultVoidTest, Error) {
    auto result = arena::Result<void>::err(arena::Error("void error"));
    EXPECT_FALSE(result.hasValue());
    EXPECT_TRUE(result.hasError());
    EXPECT_EQ(result.error().message, "void error");
}
