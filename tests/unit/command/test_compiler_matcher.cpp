//
// Created by gregorian-rayne on 2/14/26.
//

#include "xcdb/command/compiler_matcher.hpp"

#include <gtest/gtest.h>

namespace xcdb::command
{
    TEST(CompilerMatcherTest, SupportedDrivers) {
        for (const auto name : SUPPORTED_COMPILERS) {
            EXPECT_TRUE(is_supported_compiler(name)) << name;
        }
        EXPECT_TRUE(is_supported_compiler("/usr/bin/clang"));
        EXPECT_TRUE(is_supported_compiler(
            "/Applications/Xcode.app/Contents/Developer/Toolchains/XcodeDefault.xctoolchain/usr/bin/clang++"
        ));
    }

    TEST(CompilerMatcherTest, UnsupportedDrivers) {
        EXPECT_FALSE(is_supported_compiler("clang-15"));
        EXPECT_FALSE(is_supported_compiler("swiftc"));
        EXPECT_FALSE(is_supported_compiler("/usr/bin/ld"));
        EXPECT_FALSE(is_supported_compiler(""));
    }

    TEST(CompilerMatcherTest, RecognizesInvocation) {
        EXPECT_TRUE(is_compiler_invocation("clang -c /project/a.cpp -o /project/a.o"));
        EXPECT_TRUE(is_compiler_invocation(
            "    /usr/bin/clang -x objective-c -arch x86_64 -c /p/a.m -o /b/a.o"
        ));
        EXPECT_TRUE(is_compiler_invocation(R"(clang "-DNAME=a b" -c a.c -o a.o)"));
    }

    TEST(CompilerMatcherTest, RequiresCompileThenOutput) {
        EXPECT_FALSE(is_compiler_invocation("clang a.c -o a.o"));
        EXPECT_FALSE(is_compiler_invocation("clang -c a.c"));
        EXPECT_FALSE(is_compiler_invocation("clang -o a.o -c a.c"));
        EXPECT_FALSE(is_compiler_invocation("-c a.c clang -o a.o"));
    }

    TEST(CompilerMatcherTest, FlagsMustBeStandalone) {
        EXPECT_FALSE(is_compiler_invocation("clang -cfoo a.c -oa.o"));
    }

    TEST(CompilerMatcherTest, RejectsNoise) {
        EXPECT_FALSE(is_compiler_invocation("export LANG=en_US.US-ASCII"));
        EXPECT_FALSE(is_compiler_invocation("cd /project"));
        EXPECT_FALSE(is_compiler_invocation("/usr/bin/ld -c x -o y"));
        EXPECT_FALSE(is_compiler_invocation(""));
    }

    TEST(CompilerMatcherTest, UntokenizableLineIsNotAMatch) {
        EXPECT_FALSE(is_compiler_invocation(R"(clang -c "a.c -o a.o)"));
    }

    TEST(CompilerMatcherTest, ReturnsTokens) {
        const auto tokens = match_compiler_invocation("cc -c a.c -o a.o");

        ASSERT_TRUE(tokens.has_value());
        EXPECT_EQ(tokens->size(), 5u);
        EXPECT_EQ(tokens->front(), "cc");
    }

    TEST(CompilerMatcherTest, CompileShape) {
        EXPECT_TRUE(has_compile_shape({"env", "clang", "-c", "a.c", "-o", "a.o"}));
        EXPECT_FALSE(has_compile_shape({}));
    }
}
