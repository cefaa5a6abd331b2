#include <gtest/gtest.h>
#include "boardgen/diode.hpp"

#include <algorithm>

using namespace boardgen;

TEST(DiodeResolveTest, DatabaseHit) {
    DiodeSpec d = resolve_diode("1n4148");
    EXPECT_EQ(d.part_number, "1N4148");
    EXPECT_EQ(d.type, DiodeType::Signal);
    EXPECT_DOUBLE_EQ(d.voltage.value_or(0), 75.0);
    EXPECT_EQ(d.body_color, "#E8B87A");
    EXPECT_EQ(d.cathode_mark_color, "#111111");
    EXPECT_TRUE(d.from_database);
}

TEST(DiodeResolveTest, AliasesMapToCanonicalPart) {
    EXPECT_EQ(resolve_diode(" 1N4148W ").part_number, "1N4148");
    EXPECT_EQ(resolve_diode("IN4148").part_number, "1N4148");
    EXPECT_EQ(resolve_diode("1n914b").part_number, "1N914");
    EXPECT_EQ(resolve_diode("IN4007").part_number, "1N4007");
}

TEST(DiodeResolveTest, RectifierAndZener) {
    DiodeSpec r = resolve_diode("1N4007");
    EXPECT_EQ(r.type, DiodeType::Rectifier);
    EXPECT_DOUBLE_EQ(r.voltage.value_or(0), 1000.0);
    EXPECT_EQ(r.body_color, "#1A1A1A");
    EXPECT_EQ(r.cathode_mark_color, "#C0C0C0");

    DiodeSpec z = resolve_diode("1N4733");
    EXPECT_EQ(z.type, DiodeType::Zener);
    EXPECT_DOUBLE_EQ(z.voltage.value_or(0), 5.1);
}

TEST(DiodeResolveTest, UnknownPartFallsBackToGenericSignalDiode) {
    DiodeSpec d = resolve_diode("xyz123");
    EXPECT_EQ(d.part_number, "XYZ123");
    EXPECT_EQ(d.type, DiodeType::Signal);
    EXPECT_FALSE(d.voltage.has_value());
    EXPECT_EQ(d.body_color, resolve_diode("1N4148").body_color);
    EXPECT_EQ(d.cathode_mark_color, "#111111");
    EXPECT_FALSE(d.from_database);
}

TEST(DiodeResolveTest, KnownDiodes) {
    const auto all = known_diodes();
    EXPECT_EQ(all.size(), 22u);
    EXPECT_NE(std::find(all.begin(), all.end(), "BAT46"), all.end());
    for (const auto& p : all) EXPECT_TRUE(resolve_diode(p).from_database) << p;
}

TEST(LedResolveTest, ColourAndSize) {
    LedSpec l = resolve_led("Green", "3mm");
    EXPECT_EQ(l.color, LedColor::Green);
    EXPECT_EQ(l.size, "3mm");
    EXPECT_EQ(l.part_number, "LED-GREEN-3mm");
    EXPECT_EQ(l.label, "3mm green LED");
    EXPECT_EQ(l.glow_color, "#44FF44");
    EXPECT_EQ(l.cathode_mark_color, "#111111");
    EXPECT_TRUE(l.from_database);
}

TEST(LedResolveTest, UnknownColourAndSizeDefault) {
    LedSpec l = resolve_led("purple", "10mm");
    EXPECT_EQ(l.color, LedColor::Red);
    EXPECT_EQ(l.size, "5mm");
    EXPECT_EQ(l.part_number, "LED-RED-5mm");
    EXPECT_FALSE(l.from_database);
}

TEST(LedResolveTest, FromBomText) {
    LedSpec a = resolve_led_text("Blue LED 3 mm");
    EXPECT_EQ(a.color, LedColor::Blue);
    EXPECT_EQ(a.size, "3mm");

    // first colour word wins
    LedSpec b = resolve_led_text("yellow/green bicolour");
    EXPECT_EQ(b.color, LedColor::Yellow);
    EXPECT_EQ(b.size, "5mm");

    EXPECT_FALSE(resolve_led_text("LED").from_database);
}

TEST(LedResolveTest, GlowAndCathodeColours) {
    EXPECT_EQ(led_glow_color("White"), "#FFFFFF");
    EXPECT_EQ(led_glow_color("infrared"), "#FF4444");
    EXPECT_EQ(cathode_mark_color("#1a1a1a"), "#C0C0C0");
    EXPECT_EQ(cathode_mark_color("#E8B87A"), "#111111");
    EXPECT_EQ(cathode_mark_color("#123456"), "#111111");
    for (const char* colour : {"red", "green", "yellow", "blue", "white"})
        EXPECT_EQ(resolve_led(colour).cathode_mark_color, "#111111") << colour;
}
