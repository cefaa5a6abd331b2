#pragma once

#include "boardgen/error.hpp"
#include <optional>
#include <string>

namespace boardgen {

enum class CapType { FilmBox, Ceramic, Electrolytic, Tantalum, Unknown };

inline const char* to_cstr(CapType t) {
    switch (t) {
        case CapType::FilmBox:      return "film_box";
        case CapType::Ceramic:      return "ceramic";
        case CapType::Electrolytic: return "electrolytic";
        case CapType::Tantalum:     return "tantalum";
        case CapType::Unknown:      return "unknown";
    }
    return "unknown";
}

inline bool is_polarized(CapType t) { return t == CapType::Electrolytic || t == CapType::Tantalum; }

struct CapUnits {
    double pf = 0.0;
    double nf = 0.0;
    double uf = 0.0;

    static CapUnits from_pf(double pf) { return CapUnits{pf, pf / 1e3, pf / 1e6}; }
    static CapUnits from_nf(double nf) { return from_pf(nf * 1e3); }
    static CapUnits from_uf(double uf) { return from_pf(uf * 1e6); }
};

struct CapacitorSpec {
    CapUnits capacitance;
    CapType type = CapType::Unknown;
    bool polarized = false;
    std::optional<double> tolerance_percent;
    std::optional<char> tolerance_letter;
    std::optional<int> voltage_max;
    std::string source;      // marking as given (trimmed)
    std::string display;     // "47 nF"
    double confidence = 1.0;
};

// Input to the encoder. Exactly one field must be set.
struct CapMagnitude {
    std::optional<double> pf;
    std::optional<double> nf;
    std::optional<double> uf;

    static CapMagnitude picofarads(double v) { CapMagnitude m; m.pf = v; return m; }
    static CapMagnitude nanofarads(double v) { CapMagnitude m; m.nf = v; return m; }
    static CapMagnitude microfarads(double v) { CapMagnitude m; m.uf = v; return m; }
};

struct EncodedCapacitor {
    CapUnits capacitance;
    std::string eia_code;         // "473"
    std::string alpha_code;       // "47n"
    std::string full_film_code;   // "473K100"
    std::string full_alpha_code;  // "47nK100"
    char tolerance_letter = 'K';
    std::optional<int> voltage;
};

// Grammars tried in order: electrolytic, R-decimal, alphanumeric, EIA.
// Throws DecodeError (UnrecognizedMarking).
CapacitorSpec decode_capacitor(const std::string& marking);

// Same as decode_capacitor, with the type heuristic overridden by `hint`.
CapacitorSpec decode_capacitor_with_type(const std::string& marking, CapType hint);

// Throws EncodeError (AmbiguousUnit, UnsupportedTolerance, ValueNotRepresentable).
EncodedCapacitor encode_capacitor(const CapMagnitude& magnitude, double tolerance_percent = 10.0,
                                  std::optional<int> voltage = std::nullopt);

// Best-effort classification from magnitude and voltage rating.
CapType guess_cap_type(double pf, std::optional<int> voltage);

std::string format_capacitance(const CapUnits& c);

// Lead spacing on a breadboard, in holes (3, 4 or 5).
int capacitor_span_holes(const CapacitorSpec& spec);
int capacitor_span_holes(const std::string& value_text);

} // namespace boardgen
