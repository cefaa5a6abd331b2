#include <gtest/gtest.h>
#include "boardgen/resistor.hpp"

#include <cmath>
#include <string>
#include <vector>

using namespace boardgen;

using Bands = std::vector<std::string>;

TEST(ResistorDecodeTest, FourBandE12Value) {
    ResistorSpec r = decode_resistor({"yellow", "violet", "orange", "gold"});
    EXPECT_DOUBLE_EQ(r.ohms, 47000.0);
    EXPECT_DOUBLE_EQ(r.tolerance_percent, 5.0);
    ASSERT_TRUE(r.e_series.has_value());
    EXPECT_EQ(*r.e_series, "E12");
    EXPECT_FALSE(r.nearest_e96.has_value());
    EXPECT_EQ(r.display, "47 k\xCE\xA9");
}

TEST(ResistorDecodeTest, FiveBandPrecisionValue) {
    ResistorSpec r = decode_resistor({"brown", "black", "green", "red", "brown"});
    EXPECT_DOUBLE_EQ(r.ohms, 10500.0);
    EXPECT_DOUBLE_EQ(r.tolerance_percent, 1.0);
    ASSERT_TRUE(r.e_series.has_value());
    EXPECT_EQ(*r.e_series, "E48");
}

TEST(ResistorDecodeTest, BandsAreTrimmedAndCaseFolded) {
    ResistorSpec r = decode_resistor({" Brown", "BLACK ", "Red", "Gold"});
    EXPECT_DOUBLE_EQ(r.ohms, 1000.0);
    EXPECT_EQ(r.bands, (Bands{"brown", "black", "red", "gold"}));
    EXPECT_EQ(r.display, "1 k\xCE\xA9");
}

TEST(ResistorDecodeTest, AliasColours) {
    ResistorSpec r = decode_resistor({"grey", "red", "black", "purple"});
    EXPECT_DOUBLE_EQ(r.ohms, 82.0);
    EXPECT_DOUBLE_EQ(r.tolerance_percent, 0.1);
}

TEST(ResistorDecodeTest, GoldAndSilverMultipliers) {
    EXPECT_DOUBLE_EQ(decode_resistor({"yellow", "violet", "gold", "gold"}).ohms, 4.7);
    EXPECT_DOUBLE_EQ(decode_resistor({"yellow", "violet", "silver", "gold"}).ohms, 0.47);
}

TEST(ResistorDecodeTest, OffSeriesValueGetsNearestHint) {
    // 1.23k is not in E12..E96
    ResistorSpec r = decode_resistor({"brown", "red", "orange", "brown", "brown"});
    EXPECT_DOUBLE_EQ(r.ohms, 1230.0);
    EXPECT_FALSE(r.e_series.has_value());
    ASSERT_TRUE(r.nearest_e96.has_value());
    EXPECT_NEAR(*r.nearest_e96, 1240.0, 1e-6);
}

TEST(ResistorDecodeTest, WrongBandCountIsRejected) {
    try {
        decode_resistor({"red", "red", "red"});
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidBandCount);
    }
    try {
        decode_resistor({"red", "red", "red", "red", "red", "red"});
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidBandCount);
    }
}

TEST(ResistorDecodeTest, UnknownColourCarriesTheColour) {
    try {
        decode_resistor({"red", "pink", "red", "gold"});
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedColor);
        EXPECT_EQ(e.input(), "pink");
    }
}

TEST(ResistorDecodeTest, GoldIsNotADigit) {
    EXPECT_THROW(decode_resistor({"gold", "red", "red", "gold"}), DecodeError);
}

TEST(ResistorDecodeTest, OrangeIsNotATolerance) {
    try {
        decode_resistor({"red", "red", "red", "orange"});
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedColor);
    }
}

TEST(ResistorEncodeTest, FourBandSequence) {
    EncodedResistor e = encode_resistor(4700, 5.0);
    ASSERT_TRUE(e.bands4.has_value());
    EXPECT_EQ(*e.bands4, (Bands{"yellow", "violet", "red", "gold"}));
    EXPECT_EQ(e.bands5, (Bands{"yellow", "violet", "black", "brown", "gold"}));
    EXPECT_EQ(e.tolerance_color, "gold");
}

TEST(ResistorEncodeTest, DefaultToleranceIsOnePercent) {
    EncodedResistor e = encode_resistor(10000);
    EXPECT_DOUBLE_EQ(e.tolerance_percent, 1.0);
    EXPECT_EQ(e.bands5.back(), "brown");
}

TEST(ResistorEncodeTest, ThreeDigitValueHasNoFourBandForm) {
    EncodedResistor e = encode_resistor(1230, 1.0);
    EXPECT_EQ(e.bands5, (Bands{"brown", "red", "orange", "brown", "brown"}));
    EXPECT_FALSE(e.bands4.has_value());
}

TEST(ResistorEncodeTest, FractionalOhmsUseGoldOrSilver) {
    EncodedResistor e = encode_resistor(4.7, 5.0);
    EXPECT_EQ(e.bands5, (Bands{"yellow", "violet", "black", "silver", "gold"}));
    ASSERT_TRUE(e.bands4.has_value());
    EXPECT_EQ(*e.bands4, (Bands{"yellow", "violet", "gold", "gold"}));
}

TEST(ResistorEncodeTest, UnsupportedTolerance) {
    try {
        encode_resistor(1000, 3.0);
        FAIL() << "expected EncodeError";
    } catch (const EncodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::UnsupportedTolerance);
    }
}

TEST(ResistorEncodeTest, NonPositiveIsNotRepresentable) {
    try {
        encode_resistor(0, 1.0);
        FAIL() << "expected EncodeError";
    } catch (const EncodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ValueNotRepresentable);
    }
    EXPECT_THROW(encode_resistor(-10, 1.0), EncodeError);
}

TEST(ResistorEncodeTest, TooManyDigitsIsNotRepresentable) {
    try {
        encode_resistor(1234.5, 1.0);
        FAIL() << "expected EncodeError";
    } catch (const EncodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::ValueNotRepresentable);
    }
}

TEST(ResistorEncodeTest, DecodingEncoderOutputRecoversValue) {
    const double values[] = {1, 4.7, 10, 47, 100, 220, 330, 1000, 1500, 4700, 10000,
                             22000, 47000, 100000, 1e6, 2.2e6, 10e6, 499, 1020, 97600};
    for (double ohms : values) {
        for (double tol : resistor_tolerances()) {
            EncodedResistor e = encode_resistor(ohms, tol);
            ResistorSpec back = decode_resistor(e.bands5);
            EXPECT_LE(std::fabs(back.ohms - ohms) / ohms, 0.01) << ohms;
            EXPECT_DOUBLE_EQ(back.tolerance_percent, tol) << ohms;
        }
    }
}

TEST(ResistorFormatTest, DisplayText) {
    EXPECT_EQ(format_ohms(470), "470 \xCE\xA9");
    EXPECT_EQ(format_ohms(4700), "4.70 k\xCE\xA9");
    EXPECT_EQ(format_ohms(2.2e6), "2.20 M\xCE\xA9");
    EXPECT_EQ(format_ohms(1e9), "1 G\xCE\xA9");
    EXPECT_EQ(format_ohms(0.47), "0.470 \xCE\xA9");
}

TEST(ResistorSeriesTest, CoarsestSeriesWins) {
    EXPECT_EQ(find_e_series(2200).series.value_or(""), "E12");
    EXPECT_EQ(find_e_series(5100).series.value_or(""), "E24");
    EXPECT_EQ(find_e_series(1.21).series.value_or(""), "E48");
    EXPECT_EQ(find_e_series(10200).series.value_or(""), "E96");
    EXPECT_FALSE(find_e_series(0).series.has_value());
}

TEST(ResistanceTextTest, AcceptedForms) {
    EXPECT_DOUBLE_EQ(parse_resistance("470"), 470.0);
    EXPECT_DOUBLE_EQ(parse_resistance("10k"), 10000.0);
    EXPECT_DOUBLE_EQ(parse_resistance("4.7k"), 4700.0);
    EXPECT_DOUBLE_EQ(parse_resistance("4k7"), 4700.0);
    EXPECT_DOUBLE_EQ(parse_resistance("1M"), 1e6);
    EXPECT_DOUBLE_EQ(parse_resistance("2M2"), 2.2e6);
    EXPECT_DOUBLE_EQ(parse_resistance("330R"), 330.0);
    EXPECT_DOUBLE_EQ(parse_resistance("4R7"), 4.7);
    EXPECT_DOUBLE_EQ(parse_resistance("10k\xCE\xA9"), 10000.0);
    EXPECT_DOUBLE_EQ(parse_resistance("10 kohm"), 10000.0);
    EXPECT_DOUBLE_EQ(parse_resistance(" 100 ohms "), 100.0);
}

TEST(ResistanceTextTest, RejectsGarbage) {
    for (const char* s : {"", "abc", "10x", "k10", "0", "1.2.3k"}) {
        try {
            parse_resistance(s);
            FAIL() << "expected DecodeError for '" << s << "'";
        } catch (const DecodeError& e) {
            EXPECT_EQ(e.code(), ErrorCode::UnrecognizedMarking);
        }
    }
}
