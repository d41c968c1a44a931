/**
 * @file AliasBuilderTest.cpp
 * @brief Unit tests for disk alias derivation
 */

#include <gtest/gtest.h>

#include "core/AliasBuilder.hpp"

TEST(AliasBuilderTest, ToSnakeCase_SplitsWordsAndUppercaseRuns) {
    EXPECT_EQ(core::to_snake_case("Samsung SSD 970 EVO Plus"), "samsung_ssd_970_evo_plus");
    EXPECT_EQ(core::to_snake_case("CamelCaseTest"), "camel_case_test");
    EXPECT_EQ(core::to_snake_case("WDC WD10EZEX-00WN4A0"), "wdc_wd10_ezex_00_wn4_a0");
    EXPECT_EQ(core::to_snake_case("SAMSUNG HD103UJ"), "samsung_hd103_uj");
}

TEST(AliasBuilderTest, ToSnakeCase_HandlesEmptyAndWhitespace) {
    EXPECT_EQ(core::to_snake_case(""), "");
    EXPECT_EQ(core::to_snake_case("   "), "");
    EXPECT_EQ(core::to_snake_case("--a--b--"), "a_b");
}

TEST(AliasBuilderTest, ToSafeId_CollapsesNonAlphanumericRuns) {
    EXPECT_EQ(core::to_safe_id("WD-WCC6Y5ABCDEF"), "wd_wcc6y5abcdef");
    EXPECT_EQ(core::to_safe_id("Serial-With_Special!Chars@123"), "serial_with_special_chars_123");
    EXPECT_EQ(core::to_safe_id("  S13PJ90S113060  "), "s13pj90s113060");
    EXPECT_EQ(core::to_safe_id(""), "");
    EXPECT_EQ(core::to_safe_id("---"), "");
}

TEST(AliasBuilderTest, BuildDiskAlias_CombinesModelAndSerial) {
    EXPECT_EQ(core::build_disk_alias("WDC WD10EFRX-68FYTN0", "WD-WCC4J5HL2R45"),
              "wdc_wd10_efrx_68_fytn0_wd_wcc4j5hl2r45");
    EXPECT_EQ(core::build_disk_alias("Test Model", "SHORT"), "test_model_short");
}

// Test: disks sharing a model still get distinct aliases
TEST(AliasBuilderTest, BuildDiskAlias_DistinctSerialsGiveDistinctAliases) {
    const auto first = core::build_disk_alias("SAMSUNG HD103UJ", "S13PJ90S113060");
    const auto second = core::build_disk_alias("SAMSUNG HD103UJ", "S13PJ90S113054");

    EXPECT_EQ(first, "samsung_hd103_uj_s13pj90s113060");
    EXPECT_EQ(second, "samsung_hd103_uj_s13pj90s113054");
    EXPECT_NE(first, second);
}

TEST(AliasBuilderTest, BuildDiskAlias_IsDeterministic) {
    EXPECT_EQ(core::build_disk_alias("SAMSUNG HD103UJ", "S13PJ90S113060"),
              core::build_disk_alias("SAMSUNG HD103UJ", "S13PJ90S113060"));
}

TEST(AliasBuilderTest, BuildDiskAlias_MissingPartsBecomeUnknown) {
    EXPECT_EQ(core::build_disk_alias("", "S13PJ90S113060"), "unknown_s13pj90s113060");
    EXPECT_EQ(core::build_disk_alias("Test Model", ""), "test_model_unknown");
    EXPECT_EQ(core::build_disk_alias("Test Model", "***"), "test_model_unknown");
    EXPECT_EQ(core::build_disk_alias("", ""), "unknown_unknown");
}
