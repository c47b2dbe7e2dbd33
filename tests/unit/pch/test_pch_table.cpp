//
// Created by gregorian-rayne on 2/14/26.
//

#include "xcdb/pch/pch_table.hpp"

#include <gtest/gtest.h>

namespace xcdb::pch
{
    class PchTableTest : public ::testing::Test {
    protected:
        PchTable table_;
    };

    TEST_F(PchTableTest, StartsEmpty) {
        EXPECT_TRUE(table_.empty());
        EXPECT_EQ(table_.size(), 0u);
        EXPECT_FALSE(table_.resolve("/tmp/Prefix.pch"));
    }

    TEST_F(PchTableTest, RegisterAndFind) {
        table_.register_header("/tmp/Prefix.pch.pch", "/project/Prefix.pch");

        EXPECT_TRUE(table_.contains("/tmp/Prefix.pch.pch"));
        EXPECT_EQ(table_.find("/tmp/Prefix.pch.pch"), "/project/Prefix.pch");
        EXPECT_FALSE(table_.find("/tmp/Prefix.pch"));
    }

    TEST_F(PchTableTest, ResolveAppendsSuffix) {
        table_.register_header("/tmp/Prefix.pch.pch", "/project/Prefix.pch");

        EXPECT_EQ(table_.resolve("/tmp/Prefix.pch"), "/project/Prefix.pch");
    }

    TEST_F(PchTableTest, PthWinsOverPch) {
        table_.register_header("/tmp/Prefix.pch.pch", "/project/from_pch.h");
        table_.register_header("/tmp/Prefix.pch.pth", "/project/from_pth.h");

        EXPECT_EQ(table_.resolve("/tmp/Prefix.pch"), "/project/from_pth.h");
    }

    TEST_F(PchTableTest, ResolveFallsBackToExactPath) {
        table_.register_header("/tmp/x.h.pch", "/project/x.h");

        EXPECT_EQ(table_.resolve("/tmp/x.h.pch"), "/project/x.h");
        EXPECT_EQ(table_.resolve("/tmp/x.h"), "/project/x.h");
    }

    TEST_F(PchTableTest, LaterRegistrationReplaces) {
        table_.register_header("/tmp/a.pch.pch", "/project/old.h");
        table_.register_header("/tmp/a.pch.pch", "/project/new.h");

        EXPECT_EQ(table_.size(), 1u);
        EXPECT_EQ(table_.find("/tmp/a.pch.pch"), "/project/new.h");
    }
}
