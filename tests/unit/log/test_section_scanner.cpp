//
// Created by gregorian-rayne on 2/14/26.
//

#include "xcdb/log/section_scanner.hpp"

#include <gtest/gtest.h>

namespace xcdb::log
{
    class SectionScannerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            options_.file_exists = [](const std::string&) { return false; };
        }

        Result<std::vector<CompileRecord>, Error> scan(std::vector<std::string> lines) {
            VectorLineSource source(std::move(lines));
            SectionScanner scanner(source, table_, options_);

            std::vector<CompileRecord> records;
            auto result = scanner.scan_all([&records](CompileRecord record) {
                records.push_back(std::move(record));
            });
            stats_ = scanner.stats();

            if (result.is_err()) {
                return Result<std::vector<CompileRecord>, Error>::failure(result.error());
            }
            EXPECT_EQ(result.value(), records.size());
            return Result<std::vector<CompileRecord>, Error>::success(std::move(records));
        }

        pch::PchTable table_;
        ScanOptions options_;
        ScanStats stats_;
    };

    TEST(DirectoryStatementTest, ParsesCd) {
        EXPECT_EQ(parse_directory_statement("    cd /project"), "/project");
        EXPECT_EQ(parse_directory_statement(R"(    cd "/Users/dev/My Project")"), "/Users/dev/My Project");
        EXPECT_EQ(parse_directory_statement(R"(cd /Users/dev/My\ App)"), "/Users/dev/My App");
    }

    TEST(DirectoryStatementTest, NonCdLinesGiveEmptyDirectory) {
        EXPECT_EQ(parse_directory_statement("    export LANG=en_US.US-ASCII"), "");
        EXPECT_EQ(parse_directory_statement("cd"), "");
        EXPECT_EQ(parse_directory_statement(R"(cd "/unterminated)"), "");
        EXPECT_EQ(parse_directory_statement(""), "");
    }

    TEST_F(SectionScannerTest, SingleCompileSection) {
        auto result = scan({
            "CompileC /project/a.o /project/a.cpp normal x86_64 c++ com.apple.compilers.llvm.clang.1_0.compiler",
            "    cd /project",
            "    clang -c /project/a.cpp -o /project/a.o",
        });

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        ASSERT_EQ(result.value().size(), 1u);
        const auto& record = result.value()[0];
        EXPECT_EQ(record.directory, "/project");
        EXPECT_EQ(record.command, "clang -c /project/a.cpp -o /project/a.o");
        EXPECT_EQ(record.file, "/project/a.cpp");
        EXPECT_EQ(stats_.compile_sections, 1u);
        EXPECT_EQ(stats_.records_emitted, 1u);
    }

    TEST_F(SectionScannerTest, NoiseBetweenDirectoryAndInvocation) {
        auto result = scan({
            "Build settings from command line:",
            "CompileC /b/a.o /p/a.m normal x86_64 objective-c com.apple.compilers.llvm.clang.1_0.compiler",
            "    cd /p",
            "    export LANG=en_US.US-ASCII",
            "    export PATH=\"/usr/bin:/bin\"",
            "    /usr/bin/clang -x objective-c -arch x86_64 -c /p/a.m -o /b/a.o",
            "",
            "** BUILD SUCCEEDED **",
        });

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].command, "/usr/bin/clang -x objective-c -arch x86_64 -c /p/a.m -o /b/a.o");
    }

    TEST_F(SectionScannerTest, RecordsFollowLogOrder) {
        auto result = scan({
            "CompileC /b/one.o /p/one.c normal x86_64 c",
            "    cd /p",
            "    clang -c /p/one.c -o /b/one.o",
            "CompileC /b/two.o /p/two.c normal x86_64 c",
            "    cd /p",
            "    clang -c /p/two.c -o /b/two.o",
            "CompileC /b/three.o /q/three.c normal x86_64 c",
            "    cd /q",
            "    clang -c /q/three.c -o /b/three.o",
        });

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 3u);
        EXPECT_EQ(result.value()[0].file, "/p/one.c");
        EXPECT_EQ(result.value()[1].file, "/p/two.c");
        EXPECT_EQ(result.value()[2].file, "/q/three.c");
        EXPECT_EQ(result.value()[2].directory, "/q");
    }

    TEST_F(SectionScannerTest, PrecompiledHeaderResolvedForLaterCompile) {
        auto result = scan({
            "ProcessPCH /tmp/x.h.pch x.h normal x86_64 objective-c com.apple.compilers.llvm.clang.1_0.compiler",
            "    cd /project",
            "    clang -x objective-c-header -c /project/x.h -o /tmp/x.h.pch",
            "CompileC /b/a.o /project/a.m normal x86_64 objective-c com.apple.compilers.llvm.clang.1_0.compiler",
            "    cd /project",
            "    clang -include /tmp/x.h.pch -c /project/a.m -o /b/a.o",
        });

        ASSERT_TRUE(result.is_ok()) << result.error().to_string();
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].command, "clang -include /project/x.h -c /project/a.m -o /b/a.o");
        EXPECT_EQ(stats_.precompile_sections, 1u);
        EXPECT_EQ(stats_.pch_registered, 1u);
        EXPECT_EQ(table_.size(), 1u);
    }

    TEST_F(SectionScannerTest, PrecompiledHeaderAfterCompileIsUnresolved) {
        auto result = scan({
            "CompileC /b/a.o /project/a.m normal x86_64 objective-c com.apple.compilers.llvm.clang.1_0.compiler",
            "    cd /project",
            "    clang -include /tmp/x.h.pch -c /project/a.m -o /b/a.o",
            "ProcessPCH /tmp/x.h.pch x.h normal x86_64 objective-c com.apple.compilers.llvm.clang.1_0.compiler",
            "    cd /project",
            "    clang -x objective-c-header -c /project/x.h -o /tmp/x.h.pch",
        });

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::UnresolvedHeader);
        EXPECT_EQ(stats_.records_emitted, 0u);
        EXPECT_EQ(table_.size(), 0u);
    }

    TEST_F(SectionScannerTest, CxxPrecompiledHeader) {
        auto result = scan({
            "ProcessPCH++ /cache/Prefix.pch.pth Prefix.pch normal x86_64 objective-c++",
            "    cd /project",
            "    clang++ -x objective-c++-header -c /project/Prefix.pch -o /cache/Prefix.pch.pth",
            "CompileC /b/a.o /project/a.mm normal x86_64 objective-c++",
            "    cd /project",
            "    clang++ -include /cache/Prefix.pch -c /project/a.mm -o /b/a.o",
        });

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].command, "clang++ -include /project/Prefix.pch -c /project/a.mm -o /b/a.o");
    }

    TEST_F(SectionScannerTest, ExcludedDirectoryEmitsNothing) {
        options_.filters.directory_excluded = [](const std::string& dir) { return dir == "/excluded"; };

        auto result = scan({
            "CompileC /b/a.o /excluded/a.c normal x86_64 c",
            "    cd /excluded",
            "    clang -c /excluded/a.c -o /b/a.o",
            "CompileC /b/b.o /project/b.c normal x86_64 c",
            "    cd /project",
            "    clang -c /project/b.c -o /b/b.o",
        });

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].file, "/project/b.c");
        EXPECT_EQ(stats_.directories_excluded, 1u);
    }

    TEST_F(SectionScannerTest, ExcludedDirectorySkipsInvalidInvocation) {
        options_.filters.directory_excluded = [](const std::string& dir) { return dir == "/excluded"; };

        auto result = scan({
            "CompileC /b/a.o /excluded/a.c normal x86_64 c",
            "    cd /excluded",
            "    clang -include /tmp/nowhere.pch -c /excluded/a.c -o /b/a.o",
        });

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
    }

    TEST_F(SectionScannerTest, ExcludedFileEmitsNothing) {
        options_.filters.file_excluded = [](const std::string& file) {
            return file.find("/Pods/") != std::string::npos;
        };
        std::vector<std::string> excluded;
        options_.listener.on_file_excluded = [&excluded](const CompileRecord& record) {
            excluded.push_back(record.file);
        };

        auto result = scan({
            "CompileC /b/a.o /p/Pods/a.m normal x86_64 objective-c",
            "    cd /p",
            "    clang -c /p/Pods/a.m -o /b/a.o",
            "CompileC /b/b.o /p/b.m normal x86_64 objective-c",
            "    cd /p",
            "    clang -c /p/b.m -o /b/b.o",
        });

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].file, "/p/b.m");
        EXPECT_EQ(stats_.files_excluded, 1u);
        ASSERT_EQ(excluded.size(), 1u);
        EXPECT_EQ(excluded[0], "/p/Pods/a.m");
    }

    TEST_F(SectionScannerTest, DirectoryLineWithoutCd) {
        auto result = scan({
            "CompileC /b/a.o a.c normal x86_64 c",
            "    export LANG=en_US.US-ASCII",
            "    clang -c a.c -o /b/a.o",
        });

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].directory, "");
    }

    TEST_F(SectionScannerTest, SectionWithoutInvocationIsAbandoned) {
        auto result = scan({
            "CompileC /b/a.o /p/a.c normal x86_64 c",
            "    cd /p",
            "    export LANG=en_US.US-ASCII",
        });

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
        EXPECT_EQ(stats_.sections_abandoned, 1u);
    }

    TEST_F(SectionScannerTest, MarkerOnLastLineIsAbandoned) {
        auto result = scan({"CompileC /b/a.o /p/a.c normal x86_64 c"});

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
        EXPECT_EQ(stats_.sections_abandoned, 1u);
        EXPECT_EQ(stats_.compile_sections, 0u);
    }

    TEST_F(SectionScannerTest, MarkerInsideUnfinishedSectionIsNoise) {
        auto result = scan({
            "CompileC /b/a.o /p/a.c normal x86_64 c",
            "    cd /p",
            "CompileC /b/b.o /q/b.c normal x86_64 c",
            "    cd /q",
            "    clang -c /q/b.c -o /b/b.o",
        });

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(result.value().size(), 1u);
        EXPECT_EQ(result.value()[0].directory, "/p");
        EXPECT_EQ(result.value()[0].file, "/q/b.c");
        EXPECT_EQ(stats_.compile_sections, 1u);
    }

    TEST_F(SectionScannerTest, IndentedMarkerIsNotASection) {
        auto result = scan({
            "    CompileC /b/a.o /p/a.c normal x86_64 c",
            "    cd /p",
            "    clang -c /p/a.c -o /b/a.o",
        });

        ASSERT_TRUE(result.is_ok());
        EXPECT_TRUE(result.value().empty());
        EXPECT_EQ(stats_.compile_sections, 0u);
    }

    TEST_F(SectionScannerTest, UnresolvedHeaderStopsScan) {
        auto result = scan({
            "CompileC /b/a.o /p/a.c normal x86_64 c",
            "    cd /p",
            "    clang -c /p/a.c -o /b/a.o",
            "CompileC /b/b.o /p/b.c normal x86_64 c",
            "    cd /p",
            "    clang -include /tmp/missing.pch -c /p/b.c -o /b/b.o",
            "CompileC /b/c.o /p/c.c normal x86_64 c",
            "    cd /p",
            "    clang -c /p/c.c -o /b/c.o",
        });

        ASSERT_TRUE(result.is_err());
        EXPECT_EQ(result.error().code(), ErrorCode::UnresolvedHeader);
        EXPECT_EQ(stats_.records_emitted, 1u);
    }

    TEST_F(SectionScannerTest, NextAfterErrorReturnsEnd) {
        VectorLineSource source({
            "CompileC /b/b.o /p/b.c normal x86_64 c",
            "    cd /p",
            "    clang -include /tmp/missing.pch -c /p/b.c -o /b/b.o",
            "CompileC /b/c.o /p/c.c normal x86_64 c",
            "    cd /p",
            "    clang -c /p/c.c -o /b/c.o",
        });
        SectionScanner scanner(source, table_, options_);

        EXPECT_TRUE(scanner.next().is_err());
        auto after = scanner.next();
        ASSERT_TRUE(after.is_ok());
        EXPECT_FALSE(after.value().has_value());
    }

    TEST_F(SectionScannerTest, NextIsLazy) {
        VectorLineSource source({
            "CompileC /b/a.o /p/a.c normal x86_64 c",
            "    cd /p",
            "    clang -c /p/a.c -o /b/a.o",
            "CompileC /b/b.o /p/b.c normal x86_64 c",
            "    cd /p",
            "    clang -c /p/b.c -o /b/b.o",
        });
        SectionScanner scanner(source, table_, options_);

        auto first = scanner.next();
        ASSERT_TRUE(first.is_ok());
        ASSERT_TRUE(first.value().has_value());
        EXPECT_EQ(first.value()->file, "/p/a.c");
        EXPECT_EQ(scanner.stats().compile_sections, 1u);

        auto second = scanner.next();
        ASSERT_TRUE(second.is_ok());
        EXPECT_EQ(second.value()->file, "/p/b.c");

        auto end = scanner.next();
        ASSERT_TRUE(end.is_ok());
        EXPECT_FALSE(end.value().has_value());
    }

    TEST_F(SectionScannerTest, ListenerSeesSections) {
        std::vector<SectionKind> kinds;
        std::vector<std::string> directories;
        options_.listener.on_section = [&](const SectionKind kind, const std::string& dir) {
            kinds.push_back(kind);
            directories.push_back(dir);
        };
        bool pch_seen = false;
        options_.listener.on_precompiled_header = [&pch_seen](const std::string&, const bool registered) {
            pch_seen = registered;
        };

        auto result = scan({
            "ProcessPCH /tmp/x.h.pch x.h normal x86_64 c",
            "    cd /pch",
            "    clang -c /pch/x.h -o /tmp/x.h.pch",
            "CompileC /b/a.o /p/a.c normal x86_64 c",
            "    cd /p",
            "    clang -c /p/a.c -o /b/a.o",
        });

        ASSERT_TRUE(result.is_ok());
        ASSERT_EQ(kinds.size(), 2u);
        EXPECT_EQ(kinds[0], SectionKind::Precompile);
        EXPECT_EQ(kinds[1], SectionKind::Compile);
        EXPECT_EQ(directories[0], "/pch");
        EXPECT_TRUE(pch_seen);
    }
}
