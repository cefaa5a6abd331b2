#pragma once

#include "boardgen/error.hpp"
#include <optional>
#include <string>
#include <vector>

namespace boardgen {

// Decoded resistor. `bands` are the normalized input colours (lower case, trimmed).
struct ResistorSpec {
    double ohms = 0.0;
    double tolerance_percent = 0.0;
    std::vector<std::string> bands;
    std::string display;                   // "47 kΩ"
    std::optional<std::string> e_series;   // "E12", "E24", "E48", "E96"
    std::optional<double> nearest_e96;     // hint when no series matched
};

struct EncodedResistor {
    double ohms = 0.0;
    double tolerance_percent = 1.0;
    std::string tolerance_color;
    std::vector<std::string> bands5;
    std::optional<std::vector<std::string>> bands4;  // absent when 3 sig. digits are needed
};

struct ESeriesMatch {
    std::optional<std::string> series;
    std::optional<double> nearest_e96;
};

// 4 or 5 colour bands, left to right.
// Throws DecodeError (InvalidBandCount, UnsupportedColor).
ResistorSpec decode_resistor(const std::vector<std::string>& bands);

// Throws EncodeError (UnsupportedTolerance, ValueNotRepresentable).
EncodedResistor encode_resistor(double ohms, double tolerance_percent = 1.0);

// Series membership test, coarsest first (E12, E24, E48, E96).
ESeriesMatch find_e_series(double ohms);

std::string format_ohms(double ohms);

// BOM value text ("10k", "4k7", "330R", "2.2MΩ") to ohms.
// Throws DecodeError (UnrecognizedMarking).
double parse_resistance(const std::string& text);

// Supported tolerance percents, ascending.
const std::vector<double>& resistor_tolerances();

} // namespace boardgen
