//
// Created by gregorian-rayne on 2/14/26.
//

#include "xcdb/result.hpp"
#include "xcdb/error.hpp"

#include <gtest/gtest.h>
#include <string>

namespace xcdb
{
    TEST(ResultTest, SuccessConstruction) {
        auto result = Result<int, Error>::success(42);

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_EQ(result.value(), 42);
    }

    TEST(ResultTest, FailureConstruction) {
        auto result = Result<int, Error>::failure(Error::not_found("Build log not found", "a.log"));

        EXPECT_FALSE(result.is_ok());
        EXPECT_TRUE(result.is_err());
        EXPECT_FALSE(static_cast<bool>(result));
        EXPECT_EQ(result.error().code(), ErrorCode::NotFound);
    }

    TEST(ResultTest, ValueThrowsOnError) {
        auto result = Result<int, Error>::failure(Error::invalid_argument("bad arg"));

        EXPECT_THROW(static_cast<void>(result.value()), std::logic_error);
    }

    TEST(ResultTest, ErrorThrowsOnSuccess) {
        auto result = Result<int, Error>::success(10);

        EXPECT_THROW(static_cast<void>(result.error()), std::logic_error);
    }

    TEST(ResultTest, ValueOr) {
        const auto success = Result<int, Error>::success(42);
        const auto failure = Result<int, Error>::failure(Error::internal_error("oops"));

        EXPECT_EQ(success.value_or(0), 42);
        EXPECT_EQ(failure.value_or(0), 0);
    }

    TEST(ResultTest, MapOnSuccess) {
        const auto result = Result<int, Error>::success(10);
        auto mapped = result.map([](const int x) { return std::to_string(x); });

        ASSERT_TRUE(mapped.is_ok());
        EXPECT_EQ(mapped.value(), "10");
    }

    TEST(ResultTest, MapOnFailure) {
        const auto result = Result<int, Error>::failure(Error::parse_error("invalid"));
        auto mapped = result.map([](const int x) { return x * 2; });

        ASSERT_TRUE(mapped.is_err());
        EXPECT_EQ(mapped.error().code(), ErrorCode::ParseError);
    }

    TEST(ResultTest, AndThenChains) {
        auto parse = [](std::string s) -> Result<int, Error> {
            if (s.empty()) {
                return Result<int, Error>::failure(Error::parse_error("empty"));
            }
            return Result<int, Error>::success(static_cast<int>(s.size()));
        };

        auto ok = Result<std::string, Error>::success("abc").and_then(parse);
        ASSERT_TRUE(ok.is_ok());
        EXPECT_EQ(ok.value(), 3);

        auto failed = Result<std::string, Error>::success("").and_then(parse);
        EXPECT_TRUE(failed.is_err());

        auto passthrough = Result<std::string, Error>::failure(Error::io_error("read", "x")).and_then(parse);
        ASSERT_TRUE(passthrough.is_err());
        EXPECT_EQ(passthrough.error().code(), ErrorCode::IoError);
    }

    TEST(ResultTest, MoveValueOut) {
        auto result = Result<std::string, Error>::success("payload");
        const std::string moved = std::move(result).value();

        EXPECT_EQ(moved, "payload");
    }

    TEST(ResultVoidTest, Success) {
        const auto result = Result<void, Error>::success();

        EXPECT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
    }

    TEST(ResultVoidTest, Failure) {
        const auto result = Result<void, Error>::failure(Error::config_error("bad"));

        EXPECT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::ConfigError);
    }
}
