#include "boardgen/diode.hpp"
#include "../common/text.hpp"

#include <map>

namespace boardgen {

namespace {

struct DiodeEntry {
    const char* part;
    DiodeType type;
    double voltage;
    const char* body;
    const char* cathode;
    const char* description;
};

const char* kAmberGlass = "#E8B87A";
const char* kBlackBand = "#111111";

const std::vector<DiodeEntry>& diode_table() {
    static const std::vector<DiodeEntry> t = {
        // signal, glass body
        {"1N4148", DiodeType::Signal, 75, "#E8B87A", "#111111", "Fast switching signal diode, common in clipping stages"},
        {"1N914",  DiodeType::Signal, 75, "#E8B87A", "#111111", "Equivalent to 1N4148"},
        {"BAT41",  DiodeType::Signal, 100, "#2A2A2A", "#C0C0C0", "Schottky small-signal diode, low forward voltage (0.34V)"},
        {"BAT46",  DiodeType::Signal, 100, "#2A2A2A", "#C0C0C0", "Schottky small-signal diode, low Vf, fast switching"},
        // germanium
        {"1N34A",  DiodeType::Signal, 60, "#B8A878", "#111111", "Germanium diode, asymmetric clipping in vintage fuzz"},
        {"OA91",   DiodeType::Signal, 60, "#C87C3C", "#111111", "Germanium diode, low Vf (~0.2V)"},
        {"OA85",   DiodeType::Signal, 25, "#C87C3C", "#111111", "Germanium diode, similar to OA91"},
        {"D9E",    DiodeType::Signal, 30, "#C87C3C", "#111111", "Soviet germanium diode"},
        // rectifiers, black plastic
        {"1N4001", DiodeType::Rectifier, 50, "#1A1A1A", "#C0C0C0", "General-purpose rectifier, 50V 1A"},
        {"1N4002", DiodeType::Rectifier, 100, "#1A1A1A", "#C0C0C0", "General-purpose rectifier, 100V 1A"},
        {"1N4004", DiodeType::Rectifier, 400, "#1A1A1A", "#C0C0C0", "General-purpose rectifier, 400V 1A"},
        {"1N4007", DiodeType::Rectifier, 1000, "#1A1A1A", "#C0C0C0", "General-purpose rectifier, 1000V 1A, reverse polarity protection"},
        {"1N5817", DiodeType::Rectifier, 20, "#1A1A1A", "#C0C0C0", "Schottky rectifier, 20V 1A"},
        {"1N5818", DiodeType::Rectifier, 30, "#1A1A1A", "#C0C0C0", "Schottky rectifier, 30V 1A"},
        {"1N5819", DiodeType::Rectifier, 40, "#1A1A1A", "#C0C0C0", "Schottky rectifier, 40V 1A, supply protection"},
        {"SS14",   DiodeType::Rectifier, 40, "#1A1A1A", "#C0C0C0", "SMD Schottky rectifier (SMA), 40V 1A"},
        // zeners, glass
        {"1N4728", DiodeType::Zener, 3.3, "#D0B870", "#111111", "Zener 3.3V"},
        {"1N4733", DiodeType::Zener, 5.1, "#D0B870", "#111111", "Zener 5.1V"},
        {"1N4735", DiodeType::Zener, 6.2, "#D0B870", "#111111", "Zener 6.2V"},
        {"1N4740", DiodeType::Zener, 10, "#D0B870", "#111111", "Zener 10V"},
        {"1N4744", DiodeType::Zener, 15, "#D0B870", "#111111", "Zener 15V"},
        {"1N751",  DiodeType::Zener, 5.1, "#D0B870", "#111111", "Zener 5.1V"},
    };
    return t;
}

const std::map<std::string, std::string>& diode_aliases() {
    static const std::map<std::string, std::string> m = {
        {"1N4148W", "1N4148"}, {"1N4148-1", "1N4148"}, {"IN4148", "1N4148"},
        {"1N914B", "1N914"}, {"IN4001", "1N4001"}, {"IN4007", "1N4007"},
        {"1N5817-1", "1N5817"},
    };
    return m;
}

struct LedColors { LedColor color; const char* name; const char* body; const char* glow; };

const LedColors kLedColors[] = {
    {LedColor::Red,    "red",    "#DD1111", "#FF4444"},
    {LedColor::Green,  "green",  "#11BB11", "#44FF44"},
    {LedColor::Yellow, "yellow", "#DDBB00", "#FFEE22"},
    {LedColor::Blue,   "blue",   "#1133DD", "#4466FF"},
    {LedColor::White,  "white",  "#DDDDDD", "#FFFFFF"},
};

const LedColors* find_led_color(const std::string& name) {
    for (const auto& c : kLedColors)
        if (name == c.name) return &c;
    return nullptr;
}

} // namespace

DiodeSpec resolve_diode(const std::string& part_number) {
    const std::string cleaned = text::toupper_str(text::trim(part_number));
    auto alias = diode_aliases().find(cleaned);
    const std::string canonical = alias != diode_aliases().end() ? alias->second : cleaned;

    DiodeSpec spec;
    for (const auto& e : diode_table()) {
        if (canonical == e.part) {
            spec.part_number = canonical;
            spec.type = e.type;
            spec.voltage = e.voltage;
            spec.body_color = e.body;
            spec.cathode_mark_color = e.cathode;
            spec.description = e.description;
            spec.from_database = true;
            return spec;
        }
    }

    // generic signal diode
    spec.part_number = cleaned;
    spec.type = DiodeType::Signal;
    spec.body_color = kAmberGlass;
    spec.cathode_mark_color = kBlackBand;
    spec.description = "Generic signal diode";
    spec.from_database = false;
    return spec;
}

LedSpec resolve_led(const std::string& color, const std::string& size) {
    const std::string name = text::tolower_str(text::trim(color));
    const std::string sz = text::tolower_str(text::strip_spaces(size));
    const LedColors* c = find_led_color(name);

    LedSpec spec;
    spec.from_database = c != nullptr;
    if (!c) c = &kLedColors[0];
    spec.color = c->color;
    spec.size = (sz == "3mm" || sz == "5mm") ? sz : "5mm";
    spec.body_color = c->body;
    spec.glow_color = c->glow;
    spec.cathode_mark_color = cathode_mark_color(spec.body_color);
    spec.part_number = std::string("LED-") + text::toupper_str(c->name) + "-" + spec.size;
    spec.label = spec.size + " " + c->name + " LED";
    return spec;
}

LedSpec resolve_led_text(const std::string& value_text) {
    const std::string v = text::tolower_str(value_text);
    std::string color;
    size_t best = std::string::npos;
    for (const auto& c : kLedColors) {
        const size_t pos = v.find(c.name);
        if (pos != std::string::npos && pos < best) { best = pos; color = c.name; }
    }
    const std::string size = text::contains(text::strip_spaces(v), "3mm") ? "3mm" : "5mm";
    return resolve_led(color, size);
}

std::string led_glow_color(const std::string& color) {
    const LedColors* c = find_led_color(text::tolower_str(text::trim(color)));
    return c ? c->glow : kLedColors[0].glow;
}

std::string cathode_mark_color(const std::string& body_color) {
    const std::string body = text::toupper_str(text::trim(body_color));
    for (const auto& e : diode_table())
        if (body == e.body) return e.cathode;
    return kBlackBand;
}

std::vector<std::string> known_diodes() {
    std::vector<std::string> out;
    for (const auto& e : diode_table()) out.push_back(e.part);
    return out;
}

} // namespace boardgen
