#pragma once

#include <optional>
#include <string>
#include <vector>

namespace boardgen {

enum class DiodeType { Signal, Rectifier, Zener, Led };

inline const char* to_cstr(DiodeType t) {
    switch (t) {
        case DiodeType::Signal:    return "signal";
        case DiodeType::Rectifier: return "rectifier";
        case DiodeType::Zener:     return "zener";
        case DiodeType::Led:       return "led";
    }
    return "signal";
}

struct DiodeSpec {
    std::string part_number;            // canonical, upper case
    DiodeType type = DiodeType::Signal;
    std::optional<double> voltage;      // reverse / breakdown rating
    std::string body_color;             // hex
    std::string cathode_mark_color;     // hex
    std::string description;
    bool from_database = false;         // false for the generic fallback
};

enum class LedColor { Red, Green, Yellow, Blue, White };

inline const char* to_cstr(LedColor c) {
    switch (c) {
        case LedColor::Red:    return "red";
        case LedColor::Green:  return "green";
        case LedColor::Yellow: return "yellow";
        case LedColor::Blue:   return "blue";
        case LedColor::White:  return "white";
    }
    return "red";
}

struct LedSpec {
    std::string part_number;  // "LED-RED-5mm"
    LedColor color = LedColor::Red;
    std::string size = "5mm";
    std::string body_color;
    std::string glow_color;
    std::string cathode_mark_color;
    std::string label;        // "5mm red LED"
    bool from_database = false;
};

// Unknown part numbers resolve to a generic signal diode (from_database == false).
DiodeSpec resolve_diode(const std::string& part_number);

// Unknown colours resolve to red, unknown sizes to 5mm.
LedSpec resolve_led(const std::string& color, const std::string& size = "5mm");

// Picks colour and size words out of BOM text such as "LED green 3mm".
LedSpec resolve_led_text(const std::string& value_text);

std::string led_glow_color(const std::string& color);

// Band colour of the diode-table part with this body colour; black when no part
// matches, which covers every LED body.
std::string cathode_mark_color(const std::string& body_color);

std::vector<std::string> known_diodes();

} // namespace boardgen
