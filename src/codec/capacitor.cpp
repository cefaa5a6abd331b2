#include "boardgen/capacitor.hpp"
#include "../common/text.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <map>
#include <regex>

namespace boardgen {

namespace {

const std::map<char, double>& tolerance_codes() {
    static const std::map<char, double> m = {
        {'B', 0.1}, {'C', 0.25}, {'D', 0.5}, {'F', 1.0}, {'G', 2.0},
        {'J', 5.0}, {'K', 10.0}, {'M', 20.0},
        {'Z', -20.0},  // +80/-20
    };
    return m;
}

struct ToleranceLetter { double percent; char letter; };

const ToleranceLetter kEncodeLetters[] = {
    {1.0, 'F'}, {2.0, 'G'}, {5.0, 'J'}, {10.0, 'K'}, {20.0, 'M'},
};

const char* kMicro = "\xC2\xB5";  // µ

// Micro sign and Greek mu both become 'u' so the grammars stay single-byte.
std::string fold_micro(std::string s) {
    for (const char* mu : {"\xC2\xB5", "\xCE\xBC"}) {
        for (size_t p = s.find(mu); p != std::string::npos; p = s.find(mu, p)) s.replace(p, 2, "u");
    }
    return s;
}

double unit_to_pf(char unit) {
    switch ((char)std::tolower((unsigned char)unit)) {
        case 'p': return 1.0;
        case 'n': return 1e3;
        case 'u': return 1e6;
        default:  return 0.0;
    }
}

// Shared tail of the non-electrolytic grammars.
CapacitorSpec make_spec(const std::string& source, double pf, const std::ssub_match& tol,
                        const std::ssub_match& volt) {
    CapacitorSpec spec;
    spec.source = source;
    spec.capacitance = CapUnits::from_pf(pf);
    if (tol.matched) {
        const char letter = (char)std::toupper((unsigned char)tol.str()[0]);
        auto it = tolerance_codes().find(letter);
        if (it != tolerance_codes().end()) {
            spec.tolerance_percent = it->second;
            spec.tolerance_letter = letter;
        }
    }
    if (volt.matched) spec.voltage_max = std::stoi(volt.str());
    spec.type = guess_cap_type(pf, spec.voltage_max);
    spec.polarized = is_polarized(spec.type);
    spec.display = format_capacitance(spec.capacitance);
    spec.confidence = 1.0;
    return spec;
}

std::optional<CapacitorSpec> try_electrolytic(const std::string& source, const std::string& s) {
    static const std::regex re(R"(^(\d+\.?\d*)\s*(uf?)\s*[/,]?\s*(\d{1,4})\s*v$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;
    CapacitorSpec spec;
    spec.source = source;
    spec.capacitance = CapUnits::from_pf(std::stod(m[1].str()) * 1e6);
    spec.type = CapType::Electrolytic;
    spec.polarized = true;
    spec.tolerance_percent = 20.0;
    spec.tolerance_letter = 'M';
    spec.voltage_max = std::stoi(m[3].str());
    spec.display = format_capacitance(spec.capacitance);
    spec.confidence = 0.95;
    return spec;
}

// 4n7, 2u2, 1n5K100: the unit letter stands in for the decimal point.
std::optional<CapacitorSpec> try_r_decimal(const std::string& source, const std::string& s) {
    static const std::regex re(R"(^(\d+)([pnu])(\d+)\s*([a-mz])?\s*(\d{2,4})?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;
    const double value = std::stod(m[1].str() + "." + m[3].str());
    return make_spec(source, value * unit_to_pf(m[2].str()[0]), m[4], m[5]);
}

std::optional<CapacitorSpec> try_alpha(const std::string& source, const std::string& s) {
    static const std::regex re(R"(^(\d+\.?\d*)\s*([pnu]f?)\s*([a-mz])?\s*(\d{2,4})?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;
    return make_spec(source, std::stod(m[1].str()) * unit_to_pf(m[2].str()[0]), m[3], m[4]);
}

std::optional<CapacitorSpec> try_eia(const std::string& source, const std::string& s) {
    static const std::regex re(R"(^(\d{2})(\d)([a-mz])?(\d{2,4})?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;
    const int sig = std::stoi(m[1].str());
    const int mult = m[2].str()[0] - '0';
    double pf;
    if (mult == 8) pf = sig * 0.01;
    else if (mult == 9) pf = sig * 0.1;
    else pf = sig * std::pow(10.0, mult);
    return make_spec(source, pf, m[3], m[4]);
}

std::string format_value(double v) {
    if (v == 0) return "0";
    const bool integral = std::floor(v) == v;
    if (v >= 1000) {
        if (integral) return text::number(v);
        char buf[32]; std::snprintf(buf, sizeof(buf), "%.1f", v); return buf;
    }
    if (v >= 1) return integral ? text::number(v) : text::precision(v, 3);
    return text::precision(v, 4);
}

std::string encode_eia(double pf) {
    if (pf < 10) {
        const long sig = std::lround(pf);
        if (sig >= 10) return std::to_string(sig) + "0";
        if (sig > 0) return "0" + std::to_string(sig) + "0";
        throw EncodeError(ErrorCode::ValueNotRepresentable, text::number(pf), "no EIA code below 0.5 pF");
    }
    // Multiplier digits 8 and 9 mean x0.01 and x0.1, so 7 is the largest power.
    double divisor = 1.0;
    for (int mult = 0; mult < 8; ++mult, divisor *= 10.0) {
        const double sig = pf / divisor;
        if (sig >= 9.95 && sig <= 99.5) {
            const long sig_int = std::lround(sig);
            if (sig_int <= 99 && std::fabs(sig_int * divisor - pf) / pf < 0.001)
                return std::to_string(sig_int) + std::to_string(mult);
        }
    }
    throw EncodeError(ErrorCode::ValueNotRepresentable, text::number(pf),
                      "no two-digit EIA code up to multiplier 7 matches this value");
}

// 47 -> "47n", 4.7 -> "4n7", 0.47 -> "0u47".
std::string alpha_format(double value, char unit) {
    if (std::floor(value) == value) return text::number(value) + unit;
    long int_part = (long)std::floor(value);
    std::string frac = text::precision(value - (double)int_part, 3);
    if (frac.rfind("0.", 0) != 0) {
        // fraction rounded up to 1
        return std::to_string(int_part + 1) + unit;
    }
    frac = frac.substr(2);
    while (!frac.empty() && frac.back() == '0') frac.pop_back();
    return std::to_string(int_part) + unit + frac;
}

std::string encode_alpha(double pf) {
    const double uf = pf / 1e6;
    const double nf = pf / 1e3;
    if (uf >= 0.1) return alpha_format(uf, 'u');
    if (nf >= 0.1) return alpha_format(nf, 'n');
    return alpha_format(pf, 'p');
}

} // namespace

CapType guess_cap_type(double pf, std::optional<int> voltage) {
    if (pf / 1e6 >= 1.0) return CapType::Electrolytic;
    if (pf < 1000) return CapType::Ceramic;
    if (voltage && *voltage >= 50) return CapType::FilmBox;
    if (pf >= 1000 && pf <= 1e6) return CapType::FilmBox;
    return CapType::Unknown;
}

std::string format_capacitance(const CapUnits& c) {
    if (c.uf >= 1.0) return format_value(c.uf) + " " + kMicro + "F";
    if (c.nf >= 1.0) return format_value(c.nf) + " nF";
    return format_value(c.pf) + " pF";
}

CapacitorSpec decode_capacitor(const std::string& marking) {
    const std::string cleaned = text::trim(marking);
    if (cleaned.empty()) throw DecodeError(ErrorCode::UnrecognizedMarking, marking, "empty marking");

    const std::string s = fold_micro(cleaned);
    if (auto r = try_electrolytic(cleaned, s)) return *r;
    if (auto r = try_r_decimal(cleaned, s)) return *r;
    if (auto r = try_alpha(cleaned, s)) return *r;
    if (auto r = try_eia(cleaned, s)) return *r;

    throw DecodeError(ErrorCode::UnrecognizedMarking, cleaned, "no capacitor code pattern matched");
}

CapacitorSpec decode_capacitor_with_type(const std::string& marking, CapType hint) {
    CapacitorSpec spec = decode_capacitor(marking);
    spec.type = hint;
    spec.polarized = is_polarized(hint);
    return spec;
}

EncodedCapacitor encode_capacitor(const CapMagnitude& magnitude, double tolerance_percent,
                                  std::optional<int> voltage) {
    const int provided = (magnitude.pf ? 1 : 0) + (magnitude.nf ? 1 : 0) + (magnitude.uf ? 1 : 0);
    if (provided != 1) {
        throw EncodeError(ErrorCode::AmbiguousUnit, "",
                          build_error_message("exactly one of pF, nF or uF is required, got ", provided));
    }

    double pf;
    if (magnitude.pf) pf = *magnitude.pf;
    else if (magnitude.nf) pf = *magnitude.nf * 1e3;
    else pf = *magnitude.uf * 1e6;

    if (!(pf > 0) || !std::isfinite(pf)) {
        throw EncodeError(ErrorCode::ValueNotRepresentable, text::number(pf), "capacitance must be positive");
    }

    char letter = 0;
    for (const auto& t : kEncodeLetters) {
        if (std::fabs(t.percent - tolerance_percent) < 1e-9) { letter = t.letter; break; }
    }
    if (!letter) {
        throw EncodeError(ErrorCode::UnsupportedTolerance, text::number(tolerance_percent),
                          "no letter code; valid: 1, 2, 5, 10, 20");
    }

    // The marking grammars read two to four voltage digits.
    if (voltage && (*voltage < 10 || *voltage > 9999)) {
        throw EncodeError(ErrorCode::ValueNotRepresentable, std::to_string(*voltage),
                          "voltage must be 10 to 9999 V to appear in a marking");
    }

    EncodedCapacitor enc;
    enc.capacitance = CapUnits::from_pf(pf);
    enc.eia_code = encode_eia(pf);
    enc.alpha_code = encode_alpha(pf);
    enc.tolerance_letter = letter;
    enc.voltage = voltage;

    const std::string volt = voltage ? std::to_string(*voltage) : "";
    enc.full_film_code = enc.eia_code + letter + volt;
    enc.full_alpha_code = enc.alpha_code + letter + volt;
    return enc;
}

int capacitor_span_holes(const CapacitorSpec& spec) {
    if (spec.capacitance.uf >= 1.0) return 5;
    if (spec.capacitance.nf >= 1.0) return 4;
    return 3;
}

// Text-only estimate for values no grammar accepted.
int capacitor_span_holes(const std::string& value_text) {
    const std::string v = fold_micro(text::tolower_str(text::strip_spaces(value_text)));
    if (text::contains(v, "uf")) {
        double num = 0.0;
        if (std::sscanf(v.c_str(), "%lf", &num) == 1 && num >= 1) return 5;
        return 4;
    }
    static const std::regex film(R"(\d{3}[a-z]\d{2,3})");
    if (text::contains(v, "n") || std::regex_search(v, film)) return 4;
    return 3;
}

} // namespace boardgen
