#include "boardgen/resistor.hpp"
#include "../common/text.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <regex>

namespace boardgen {

namespace {

const std::map<std::string, int>& digit_colors() {
    static const std::map<std::string, int> m = {
        {"black", 0}, {"brown", 1}, {"red", 2}, {"orange", 3}, {"yellow", 4},
        {"green", 5}, {"blue", 6}, {"violet", 7}, {"purple", 7},
        {"gray", 8}, {"grey", 8}, {"white", 9},
    };
    return m;
}

// Multiplier colour -> power of ten.
const std::map<std::string, int>& multiplier_colors() {
    static const std::map<std::string, int> m = {
        {"black", 0}, {"brown", 1}, {"red", 2}, {"orange", 3}, {"yellow", 4},
        {"green", 5}, {"blue", 6}, {"violet", 7}, {"purple", 7},
        {"gray", 8}, {"grey", 8}, {"white", 9}, {"gold", -1}, {"silver", -2},
    };
    return m;
}

const std::map<std::string, double>& tolerance_colors() {
    static const std::map<std::string, double> m = {
        {"brown", 1.0}, {"red", 2.0}, {"green", 0.5}, {"blue", 0.25},
        {"violet", 0.1}, {"purple", 0.1}, {"gray", 0.05}, {"grey", 0.05},
        {"gold", 5.0}, {"silver", 10.0},
    };
    return m;
}

const char* const kDigitColor[10] = {
    "black", "brown", "red", "orange", "yellow", "green", "blue", "violet", "gray", "white",
};

const char* multiplier_color(int exp) {
    if (exp == -1) return "gold";
    if (exp == -2) return "silver";
    return kDigitColor[exp];
}

struct ToleranceColor { double percent; const char* color; };

const std::vector<ToleranceColor>& tolerance_table() {
    static const std::vector<ToleranceColor> t = {
        {0.05, "gray"}, {0.1, "violet"}, {0.25, "blue"}, {0.5, "green"},
        {1.0, "brown"}, {2.0, "red"}, {5.0, "gold"}, {10.0, "silver"},
    };
    return t;
}

const std::vector<double> kE12 = {1.0, 1.2, 1.5, 1.8, 2.2, 2.7, 3.3, 3.9, 4.7, 5.6, 6.8, 8.2};

const std::vector<double> kE24 = {
    1.0, 1.1, 1.2, 1.3, 1.5, 1.6, 1.8, 2.0, 2.2, 2.4, 2.7, 3.0,
    3.3, 3.6, 3.9, 4.3, 4.7, 5.1, 5.6, 6.2, 6.8, 7.5, 8.2, 9.1,
};

const std::vector<double> kE48 = {
    1.00, 1.05, 1.10, 1.15, 1.21, 1.27, 1.33, 1.40, 1.47, 1.54,
    1.62, 1.69, 1.78, 1.87, 1.96, 2.05, 2.15, 2.26, 2.37, 2.49,
    2.61, 2.74, 2.87, 3.01, 3.16, 3.32, 3.48, 3.65, 3.83, 4.02,
    4.22, 4.42, 4.64, 4.87, 5.11, 5.36, 5.62, 5.90, 6.19, 6.49,
    6.81, 7.15, 7.50, 7.87, 8.25, 8.66, 9.09, 9.53,
};

const std::vector<double> kE96 = {
    1.00, 1.02, 1.05, 1.07, 1.10, 1.13, 1.15, 1.18, 1.21, 1.24,
    1.27, 1.30, 1.33, 1.37, 1.40, 1.43, 1.47, 1.50, 1.54, 1.58,
    1.62, 1.65, 1.69, 1.74, 1.78, 1.82, 1.87, 1.91, 1.96, 2.00,
    2.05, 2.10, 2.15, 2.21, 2.26, 2.32, 2.37, 2.43, 2.49, 2.55,
    2.61, 2.67, 2.74, 2.80, 2.87, 2.94, 3.01, 3.09, 3.16, 3.24,
    3.32, 3.40, 3.48, 3.57, 3.65, 3.74, 3.83, 3.92, 4.02, 4.12,
    4.22, 4.32, 4.42, 4.53, 4.64, 4.75, 4.87, 4.99, 5.11, 5.23,
    5.36, 5.49, 5.62, 5.76, 5.90, 6.04, 6.19, 6.34, 6.49, 6.65,
    6.81, 6.98, 7.15, 7.32, 7.50, 7.68, 7.87, 8.06, 8.25, 8.45,
    8.66, 8.87, 9.09, 9.31, 9.53, 9.76,
};

// digits * 10^exp without accumulating pow() error for the common cases.
double scale(int digits, int exp) {
    if (exp == -1) return digits / 10.0;
    if (exp == -2) return digits / 100.0;
    double m = 1.0;
    for (int i = 0; i < exp; ++i) m *= 10.0;
    return digits * m;
}

int lookup_digit(const std::string& color) {
    auto it = digit_colors().find(color);
    if (it == digit_colors().end())
        throw DecodeError(ErrorCode::UnsupportedColor, color, "not a digit colour");
    return it->second;
}

int lookup_multiplier(const std::string& color) {
    auto it = multiplier_colors().find(color);
    if (it == multiplier_colors().end())
        throw DecodeError(ErrorCode::UnsupportedColor, color, "not a multiplier colour");
    return it->second;
}

double lookup_tolerance(const std::string& color) {
    auto it = tolerance_colors().find(color);
    if (it == tolerance_colors().end())
        throw DecodeError(ErrorCode::UnsupportedColor, color, "not a tolerance colour");
    return it->second;
}

// Search for `ndigits` significant digits. Integer multipliers need a 0.1%
// reconstruction, gold/silver are retried at 1%.
std::optional<std::vector<std::string>> encode_bands(double ohms, int ndigits, const std::string& tol_color) {
    const double lo = ndigits == 3 ? 99.5 : 9.5;
    const double hi = ndigits == 3 ? 999.5 : 99.5;
    const int sig_lo = ndigits == 3 ? 100 : 10;
    const int sig_hi = ndigits == 3 ? 999 : 99;

    auto attempt = [&](int exp, double rel_tol) -> std::optional<std::vector<std::string>> {
        const double candidate = ohms / scale(1, exp);
        if (candidate < lo || candidate > hi) return std::nullopt;
        const int sig = (int)std::lround(candidate);
        if (sig < sig_lo || sig > sig_hi) return std::nullopt;
        if (std::fabs((scale(sig, exp) - ohms) / std::max(ohms, 1e-12)) >= rel_tol) return std::nullopt;
        std::vector<std::string> bands;
        if (ndigits == 3) bands.push_back(kDigitColor[sig / 100]);
        bands.push_back(kDigitColor[(sig / 10) % 10]);
        bands.push_back(kDigitColor[sig % 10]);
        bands.push_back(multiplier_color(exp));
        bands.push_back(tol_color);
        return bands;
    };

    for (int exp = 9; exp >= -2; --exp)
        if (auto b = attempt(exp, 0.001)) return b;
    for (int exp : {-1, -2})
        if (auto b = attempt(exp, 0.01)) return b;
    return std::nullopt;
}

} // namespace

const std::vector<double>& resistor_tolerances() {
    static const std::vector<double> v = [] {
        std::vector<double> out;
        for (const auto& t : tolerance_table()) out.push_back(t.percent);
        return out;
    }();
    return v;
}

std::string format_ohms(double ohms) {
    static const char* kOhm = "\xCE\xA9";
    struct Unit { double scale; const char* prefix; };
    static const Unit units[] = {{1e9, "G"}, {1e6, "M"}, {1e3, "k"}, {1.0, ""}};
    for (const auto& u : units) {
        if (ohms >= u.scale) {
            const double scaled = ohms / u.scale;
            std::string num = std::floor(scaled) == scaled ? text::number(scaled) : text::precision(scaled, 3);
            return num + " " + u.prefix + kOhm;
        }
    }
    if (ohms > 0) return text::precision(ohms, 3) + " " + kOhm;
    return std::string("0 ") + kOhm;
}

ESeriesMatch find_e_series(double ohms) {
    ESeriesMatch m;
    if (!(ohms > 0) || !std::isfinite(ohms)) return m;

    double decade = std::pow(10.0, std::floor(std::log10(ohms)));
    double sig = ohms / decade;
    if (sig >= 10.0) { sig /= 10.0; decade *= 10.0; }
    if (sig < 1.0) { sig *= 10.0; decade /= 10.0; }
    const double sig_rounded = std::round(sig * 100.0) / 100.0;

    const std::pair<const char*, const std::vector<double>*> series[] = {
        {"E12", &kE12}, {"E24", &kE24}, {"E48", &kE48}, {"E96", &kE96},
    };
    for (const auto& s : series) {
        for (double v : *s.second) {
            if (std::fabs(v - sig_rounded) < 0.005) { m.series = s.first; return m; }
        }
    }

    double best_diff = std::numeric_limits<double>::infinity();
    for (double v : kE96) {
        const double candidate = v * decade;
        const double diff = std::fabs(candidate - ohms);
        if (diff < best_diff) { best_diff = diff; m.nearest_e96 = candidate; }
    }
    return m;
}

ResistorSpec decode_resistor(const std::vector<std::string>& bands) {
    ResistorSpec spec;
    for (const auto& b : bands) spec.bands.push_back(text::tolower_str(text::trim(b)));
    const auto& nb = spec.bands;

    if (nb.size() != 4 && nb.size() != 5) {
        throw DecodeError(ErrorCode::InvalidBandCount, text::join(nb, ","),
                          build_error_message("expected 4 or 5 colour bands, got ", nb.size()));
    }

    const size_t ndigits = nb.size() - 2;
    int digits = 0;
    for (size_t i = 0; i < ndigits; ++i) digits = digits * 10 + lookup_digit(nb[i]);
    const int exp = lookup_multiplier(nb[ndigits]);
    spec.tolerance_percent = lookup_tolerance(nb[ndigits + 1]);

    spec.ohms = scale(digits, exp);
    spec.display = format_ohms(spec.ohms);
    ESeriesMatch m = find_e_series(spec.ohms);
    spec.e_series = m.series;
    spec.nearest_e96 = m.nearest_e96;
    return spec;
}

EncodedResistor encode_resistor(double ohms, double tolerance_percent) {
    const char* tol_color = nullptr;
    for (const auto& t : tolerance_table()) {
        if (std::fabs(t.percent - tolerance_percent) < 1e-9) { tol_color = t.color; break; }
    }
    if (!tol_color) {
        throw EncodeError(ErrorCode::UnsupportedTolerance, text::number(tolerance_percent),
                          "valid: 0.05, 0.1, 0.25, 0.5, 1, 2, 5, 10");
    }
    if (!(ohms > 0) || !std::isfinite(ohms)) {
        throw EncodeError(ErrorCode::ValueNotRepresentable, text::number(ohms), "resistance must be positive");
    }

    EncodedResistor enc;
    enc.ohms = ohms;
    enc.tolerance_percent = tolerance_percent;
    enc.tolerance_color = tol_color;

    auto b5 = encode_bands(ohms, 3, tol_color);
    if (!b5) {
        throw EncodeError(ErrorCode::ValueNotRepresentable, text::number(ohms), "no 5-band representation");
    }
    enc.bands5 = *b5;
    enc.bands4 = encode_bands(ohms, 2, tol_color);
    return enc;
}

double parse_resistance(const std::string& input) {
    std::string s = text::tolower_str(text::strip_spaces(input));
    text::erase_all(s, "\xCE\xA9");  // Ω
    text::erase_all(s, "\xCF\x89");  // ω
    text::erase_all(s, "ohms");
    text::erase_all(s, "ohm");

    auto prefix_scale = [](char p) {
        switch (p) {
            case 'k': return 1e3;
            case 'm': return 1e6;
            case 'g': return 1e9;
            default:  return 1.0;
        }
    };

    static const std::regex plain(R"(^(\d+(?:\.\d+)?)([rkmg]?)$)");
    static const std::regex infix(R"(^(\d+)([rkmg])(\d+)$)");
    std::smatch m;
    if (std::regex_match(s, m, plain)) {
        const char p = m[2].length() ? m[2].str()[0] : 'r';
        const double v = std::stod(m[1].str()) * prefix_scale(p);
        if (v > 0) return v;
    } else if (std::regex_match(s, m, infix)) {
        const double v = std::stod(m[1].str() + "." + m[3].str()) * prefix_scale(m[2].str()[0]);
        if (v > 0) return v;
    }
    throw DecodeError(ErrorCode::UnrecognizedMarking, input, "not a resistance value");
}

} // namespace boardgen
