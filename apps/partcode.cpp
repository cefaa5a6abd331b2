#include "boardgen/capacitor.hpp"
#include "boardgen/diode.hpp"
#include "boardgen/ic.hpp"
#include "boardgen/resistor.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace boardgen;

static void usage() {
    std::cerr << "Usage: partcode <command> <args...>\n"
              << "  resistor-decode <band> <band> <band> <band> [<band>]\n"
              << "  resistor-encode <ohms|10k|4k7> [tolerance%]\n"
              << "  cap-decode <marking> [film|ceramic|electrolytic|tantalum]\n"
              << "  cap-encode <value> <pf|nf|uf> [tolerance%] [voltage]\n"
              << "  diode <part>\n"
              << "  led <colour> [3mm|5mm]\n"
              << "  ic <part>\n";
}

static std::string join(const std::vector<std::string>& v) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) { if (i) out += " "; out += v[i]; }
    return out;
}

static double number_arg(const std::string& s) {
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end == s.c_str() || *end != '\0') throw std::invalid_argument("not a number: " + s);
    return v;
}

static int int_arg(const std::string& s, const char* what) {
    const double v = number_arg(s);
    if (!(v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max()))
        throw std::invalid_argument(std::string(what) + " out of range: " + s);
    return static_cast<int>(v);
}

static int run(const std::vector<std::string>& args) {
    const std::string& cmd = args[0];
    if (cmd == "resistor-decode" && args.size() >= 2) {
        ResistorSpec r = decode_resistor(std::vector<std::string>(args.begin() + 1, args.end()));
        std::cout << r.display << " +/-" << r.tolerance_percent << "%";
        if (r.e_series) std::cout << " (" << *r.e_series << ")";
        else if (r.nearest_e96) std::cout << " (nearest E96: " << format_ohms(*r.nearest_e96) << ")";
        std::cout << "\n";
    } else if (cmd == "resistor-encode" && args.size() >= 2) {
        const double tol = args.size() >= 3 ? number_arg(args[2]) : 1.0;
        EncodedResistor e = encode_resistor(parse_resistance(args[1]), tol);
        std::cout << "5-band: " << join(e.bands5) << "\n";
        if (e.bands4) std::cout << "4-band: " << join(*e.bands4) << "\n";
    } else if (cmd == "cap-decode" && args.size() >= 2) {
        CapacitorSpec c;
        if (args.size() >= 3) {
            const std::string& h = args[2];
            CapType hint = h == "film" ? CapType::FilmBox : h == "ceramic" ? CapType::Ceramic
                         : h == "electrolytic" ? CapType::Electrolytic : h == "tantalum" ? CapType::Tantalum
                         : CapType::Unknown;
            c = decode_capacitor_with_type(args[1], hint);
        } else {
            c = decode_capacitor(args[1]);
        }
        std::cout << c.display << " [" << to_cstr(c.type) << (c.polarized ? ", polarized" : "") << "]";
        if (c.tolerance_percent) std::cout << " +/-" << *c.tolerance_percent << "%";
        if (c.voltage_max) std::cout << " " << *c.voltage_max << "V";
        std::cout << " confidence " << c.confidence << "\n";
    } else if (cmd == "cap-encode" && args.size() >= 3) {
        const double v = number_arg(args[1]);
        const std::string& unit = args[2];
        CapMagnitude m = unit == "pf" ? CapMagnitude::picofarads(v)
                       : unit == "nf" ? CapMagnitude::nanofarads(v)
                       : unit == "uf" ? CapMagnitude::microfarads(v) : CapMagnitude{};
        const double tol = args.size() >= 4 ? number_arg(args[3]) : 10.0;
        std::optional<int> volt;
        if (args.size() >= 5) volt = int_arg(args[4], "voltage");
        EncodedCapacitor e = encode_capacitor(m, tol, volt);
        std::cout << "EIA: " << e.eia_code << "  alpha: " << e.alpha_code
                  << "  film: " << e.full_film_code << "  full alpha: " << e.full_alpha_code << "\n";
    } else if (cmd == "diode" && args.size() >= 2) {
        DiodeSpec d = resolve_diode(args[1]);
        std::cout << d.part_number << " [" << to_cstr(d.type) << "] body " << d.body_color
                  << " band " << d.cathode_mark_color;
        if (d.voltage) std::cout << " " << *d.voltage << "V";
        std::cout << (d.from_database ? "" : " (generic)") << "\n";
    } else if (cmd == "led" && args.size() >= 2) {
        LedSpec l = resolve_led(args[1], args.size() >= 3 ? args[2] : "5mm");
        std::cout << l.part_number << ": " << l.label << " body " << l.body_color << " glow " << l.glow_color
                  << (l.from_database ? "" : " (defaulted)") << "\n";
    } else if (cmd == "ic" && args.size() >= 2) {
        IcSpec ic = resolve_ic(args[1]);
        std::cout << ic.part_number << ": DIP-" << ic.pin_count << " V+ pin " << ic.supply_pin
                  << ", V- pin " << ic.ground_pin << " - " << ic.description << "\n";
    } else {
        usage();
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        return run(args);
    } catch (const BoardgenError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}
