#include <gtest/gtest.h>
#include "boardgen/ic.hpp"

using namespace boardgen;

TEST(IcPinCountTest, InferredFromValueText) {
    EXPECT_EQ(infer_pin_count("TL072"), 8);
    EXPECT_EQ(infer_pin_count("tl074cn"), 14);
    EXPECT_EQ(infer_pin_count("CD4049UBE"), 14);
    EXPECT_EQ(infer_pin_count("PT2399"), 16);
    EXPECT_EQ(infer_pin_count("MN3207"), 16);
    EXPECT_EQ(infer_pin_count(""), 8);
}

TEST(IcResolveTest, DatabaseHitThroughAlias) {
    IcSpec ic = resolve_ic("tl072cp");
    EXPECT_EQ(ic.part_number, "TL072");
    EXPECT_EQ(ic.pin_count, 8);
    EXPECT_EQ(ic.supply_pin, 8);
    EXPECT_EQ(ic.ground_pin, 4);
    EXPECT_TRUE(ic.from_database);

    EXPECT_EQ(resolve_ic("4558").part_number, "RC4558");
}

TEST(IcResolveTest, SingleAndQuadPackages) {
    EXPECT_EQ(resolve_ic("LM741").supply_pin, 7);
    IcSpec quad = resolve_ic("LM324N");
    EXPECT_EQ(quad.pin_count, 14);
    EXPECT_EQ(quad.supply_pin, 4);
    EXPECT_EQ(quad.ground_pin, 11);
    IcSpec pt = resolve_ic("PT2399");
    EXPECT_EQ(pt.pin_count, 16);
    EXPECT_EQ(pt.supply_pin, 1);
}

TEST(IcResolveTest, UnknownPartsUsePackageDefaults) {
    IcSpec a = resolve_ic("cd4049");
    EXPECT_FALSE(a.from_database);
    EXPECT_EQ(a.part_number, "CD4049");
    EXPECT_EQ(a.pin_count, 14);
    EXPECT_EQ(a.supply_pin, 4);
    EXPECT_EQ(a.ground_pin, 11);
    EXPECT_EQ(a.description, "IC: CD4049 (unrecognised)");

    IcSpec b = resolve_ic("MN3207");
    EXPECT_EQ(b.pin_count, 16);
    EXPECT_EQ(b.supply_pin, 16);
    EXPECT_EQ(b.ground_pin, 8);

    IcSpec c = resolve_ic("NE555");
    EXPECT_EQ(c.pin_count, 8);
    EXPECT_EQ(c.supply_pin, 8);
    EXPECT_EQ(c.ground_pin, 4);
}

TEST(IcResolveTest, KnownIcs) {
    const auto all = known_ics();
    EXPECT_EQ(all.size(), 12u);
    for (const auto& p : all) EXPECT_TRUE(resolve_ic(p).from_database) << p;
}
