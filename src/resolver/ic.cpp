#include "boardgen/ic.hpp"
#include "../common/text.hpp"

#include <map>

namespace boardgen {

namespace {

struct IcEntry {
    const char* part;
    int pins;
    int supply;
    int ground;
    const char* description;
};

const std::vector<IcEntry>& ic_table() {
    static const std::vector<IcEntry> t = {
        // dual op-amps
        {"TL072",  8, 8, 4, "Dual JFET-input op-amp"},
        {"TL062",  8, 8, 4, "Low-power dual JFET-input op-amp"},
        {"NE5532", 8, 8, 4, "Dual low-noise audio op-amp"},
        {"RC4558", 8, 8, 4, "Dual general-purpose op-amp"},
        {"LM358",  8, 8, 4, "Dual single-supply op-amp"},
        // single op-amps
        {"TL071",  8, 7, 4, "Single JFET-input op-amp"},
        {"LM741",  8, 7, 4, "General-purpose single op-amp"},
        // bucket brigade
        {"MN3005", 8, 3, 6, "4096-stage BBD delay line"},
        {"MN3101", 8, 3, 4, "BBD clock driver"},
        // quad op-amps
        {"TL074", 14, 4, 11, "Quad JFET-input op-amp"},
        {"LM324", 14, 4, 11, "Quad single-supply op-amp"},
        // delay
        {"PT2399", 16, 1, 8, "Echo audio processor"},
    };
    return t;
}

const std::map<std::string, std::string>& ic_aliases() {
    static const std::map<std::string, std::string> m = {
        {"TL072CP", "TL072"}, {"TL072IP", "TL072"}, {"TL072CN", "TL072"},
        {"TL071CP", "TL071"}, {"TL074CN", "TL074"},
        {"NE5532P", "NE5532"}, {"NE5532N", "NE5532"}, {"SA5532", "NE5532"},
        {"JRC4558", "RC4558"}, {"4558", "RC4558"},
        {"LM358N", "LM358"}, {"LM741CN", "LM741"}, {"LM324N", "LM324"},
    };
    return m;
}

} // namespace

int infer_pin_count(const std::string& value_text) {
    const std::string v = text::toupper_str(value_text);
    for (const char* s : {"TL074", "LM324", "TL064", "LM348", "CD40", "NE5514"})
        if (text::contains(v, s)) return 14;
    for (const char* s : {"PT2399", "MN3005", "MN3101", "MN3009", "MN3207"})
        if (text::contains(v, s)) return 16;
    return 8;
}

IcSpec resolve_ic(const std::string& part_number) {
    const std::string cleaned = text::toupper_str(text::trim(part_number));
    auto alias = ic_aliases().find(cleaned);
    const std::string canonical = alias != ic_aliases().end() ? alias->second : cleaned;

    IcSpec spec;
    for (const auto& e : ic_table()) {
        if (canonical == e.part) {
            spec.part_number = canonical;
            spec.pin_count = e.pins;
            spec.supply_pin = e.supply;
            spec.ground_pin = e.ground;
            spec.description = e.description;
            spec.from_database = true;
            return spec;
        }
    }

    spec.part_number = cleaned;
    spec.pin_count = infer_pin_count(cleaned);
    switch (spec.pin_count) {
        case 14: spec.supply_pin = 4;  spec.ground_pin = 11; break;
        case 16: spec.supply_pin = 16; spec.ground_pin = 8;  break;
        default: spec.supply_pin = 8;  spec.ground_pin = 4;  break;
    }
    spec.description = "IC: " + cleaned + " (unrecognised)";
    spec.from_database = false;
    return spec;
}

std::vector<std::string> known_ics() {
    std::vector<std::string> out;
    for (const auto& e : ic_table()) out.push_back(e.part);
    return out;
}

} // namespace boardgen
