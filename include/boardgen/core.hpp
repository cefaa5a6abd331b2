#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace boardgen {

enum class ComponentKind { Resistor, Capacitor, Diode, Led, Transistor, IC, Other };

inline const char* to_cstr(ComponentKind k) {
    switch (k) {
        case ComponentKind::Resistor:   return "resistor";
        case ComponentKind::Capacitor:  return "capacitor";
        case ComponentKind::Diode:      return "diode";
        case ComponentKind::Led:        return "led";
        case ComponentKind::Transistor: return "transistor";
        case ComponentKind::IC:         return "ic";
        case ComponentKind::Other:      return "other";
    }
    return "other";
}

enum class Surface { Breadboard, Stripboard };

inline const char* to_cstr(Surface s) { return s == Surface::Breadboard ? "breadboard" : "stripboard"; }

enum class BreadboardSize { Full830, Half400 };

inline const char* to_cstr(BreadboardSize s) { return s == BreadboardSize::Full830 ? "830" : "400"; }

enum class Orientation { Horizontal, Vertical, Straddle };

inline const char* to_cstr(Orientation o) {
    switch (o) {
        case Orientation::Horizontal: return "horizontal";
        case Orientation::Vertical:   return "vertical";
        case Orientation::Straddle:   return "straddle";
    }
    return "horizontal";
}

// One BOM line as delivered by the extraction step. Read-only here.
struct ComponentRecord {
    ComponentKind kind = ComponentKind::Other;
    std::string type_tag;            // raw tag, e.g. "op-amp"
    std::string value;               // free text, e.g. "10k", "473K100", "TL072"
    int quantity = 1;
    std::vector<std::string> refs;   // e.g. R1,R2
};

struct Bom {
    std::vector<ComponentRecord> components;
};

// Placement and surface parameters. Defaults reproduce the stock layout.
struct BoardRules {
    BreadboardSize breadboard_size = BreadboardSize::Full830;
    int max_col = 55;          // column ceiling for breadboard packing
    int start_col = 5;
    int resistor_cap = 6;      // per-record instance caps
    int capacitor_cap = 5;
    int ic_cap = 4;
    int transistor_cap = 4;
    int diode_cap = 4;
    int strip_rows = 25;
    int strip_cols = 24;
    double strip_pitch = 24.0; // projection pitch for the stripboard
};

// ---- addresses ------------------------------------------------------------

enum class RailSign { Positive, Negative };

struct BreadboardAddress {
    bool rail = false;
    char row = 'a';                     // a..j when !rail
    RailSign sign = RailSign::Positive; // when rail
    int col = 1;                        // 1-based

    static BreadboardAddress strip(char row, int col) { BreadboardAddress a; a.row = row; a.col = col; return a; }
    static BreadboardAddress rail_hole(RailSign s, int col) { BreadboardAddress a; a.rail = true; a.sign = s; a.col = col; return a; }
};

inline bool operator==(const BreadboardAddress& a, const BreadboardAddress& b) {
    if (a.rail != b.rail || a.col != b.col) return false;
    return a.rail ? a.sign == b.sign : a.row == b.row;
}
inline bool operator!=(const BreadboardAddress& a, const BreadboardAddress& b) { return !(a == b); }

struct StripboardAddress {
    int row = 1;  // 1-based
    int col = 0;  // 0-based, 0 = A
};

inline bool operator==(const StripboardAddress& a, const StripboardAddress& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const StripboardAddress& a, const StripboardAddress& b) { return !(a == b); }
inline bool operator<(const StripboardAddress& a, const StripboardAddress& b) {
    return a.row != b.row ? a.row < b.row : a.col < b.col;
}

struct Point {
    double x = 0, y = 0;
};

// ---- layout output ---------------------------------------------------------

template <typename Address>
struct Lead {
    std::string name;  // "1", "2", "E", "B", "C", "pin4", "A", "K"
    Address at;
};

template <typename Address>
struct PlacementOf {
    ComponentKind kind = ComponentKind::Other;
    std::string value;
    std::string label;
    Orientation orientation = Orientation::Horizontal;
    int pin_count = 0;  // ICs only
    std::vector<Lead<Address>> leads;
};

using BreadboardPlacement = PlacementOf<BreadboardAddress>;
using StripboardPlacement = PlacementOf<StripboardAddress>;

enum class JumperRole { Supply, Ground };

inline const char* to_cstr(JumperRole r) { return r == JumperRole::Supply ? "supply" : "ground"; }

// Wire from a rail to a strip hole. Derived heuristically; not a verified connection.
struct Jumper {
    JumperRole role = JumperRole::Supply;
    BreadboardAddress rail_end;
    BreadboardAddress strip_end;
    std::string target;  // label of the component pin it feeds, e.g. "IC1 pin8"
};

enum class CutReason { RailIsolation, TransistorBase };

inline const char* to_cstr(CutReason r) { return r == CutReason::RailIsolation ? "rail" : "transistor-base"; }

struct TrackCut {
    StripboardAddress at;
    CutReason reason = CutReason::RailIsolation;
    std::string owner;  // transistor label for base cuts
};

struct BreadboardLayout {
    BreadboardSize size = BreadboardSize::Full830;
    std::vector<BreadboardPlacement> placements;
    std::vector<Jumper> jumpers;
};

struct StripboardLayout {
    int rows = 25;
    int cols = 24;
    double pitch = 24.0;
    std::vector<StripboardPlacement> placements;
    std::vector<TrackCut> cuts;
};

struct RunConfig {
    std::string bom_file;
    std::string rules_file;
    Surface surface = Surface::Breadboard;
    std::string out_dir = "out";
    std::string name = "layout";
    std::map<std::string, std::string> overrides;
};

} // namespace boardgen
