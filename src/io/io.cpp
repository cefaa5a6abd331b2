#include "boardgen/io.hpp"
#include "boardgen/bom.hpp"
#include "boardgen/error.hpp"
#include "boardgen/topology.hpp"
#include "../common/text.hpp"

#include <fstream>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <stdexcept>

namespace boardgen {

using text::trim;
using text::split;
using text::tolower_str;

namespace {

int to_int(const std::string& file, int line_no, const std::string& line, const std::string& v) {
    size_t used = 0;
    int n = 0;
    try {
        n = std::stoi(v, &used);
    } catch (const std::logic_error&) {
        throw BomParseError(file, line_no, line, "expected an integer, got '" + v + "'");
    }
    if (used != v.size()) throw BomParseError(file, line_no, line, "expected an integer, got '" + v + "'");
    return n;
}

double to_double(const std::string& file, int line_no, const std::string& line, const std::string& v) {
    size_t used = 0;
    double d = 0.0;
    try {
        d = std::stod(v, &used);
    } catch (const std::logic_error&) {
        throw BomParseError(file, line_no, line, "expected a number, got '" + v + "'");
    }
    if (used != v.size()) throw BomParseError(file, line_no, line, "expected a number, got '" + v + "'");
    return d;
}

// Unknown keys are ignored.
void set_rule(BoardRules& br, const std::string& key, const std::string& v,
              const std::string& file, int line_no, const std::string& line) {
    const std::string k = tolower_str(key);
    auto i = [&]() { return to_int(file, line_no, line, v); };
    if (k == "board_size") {
        if (v == "830") br.breadboard_size = BreadboardSize::Full830;
        else if (v == "400") br.breadboard_size = BreadboardSize::Half400;
        else throw BomParseError(file, line_no, line, "board_size must be 830 or 400");
    }
    else if (k == "max_col") br.max_col = i();
    else if (k == "start_col") br.start_col = i();
    else if (k == "resistor_cap") br.resistor_cap = i();
    else if (k == "capacitor_cap") br.capacitor_cap = i();
    else if (k == "ic_cap") br.ic_cap = i();
    else if (k == "transistor_cap") br.transistor_cap = i();
    else if (k == "diode_cap") br.diode_cap = i();
    else if (k == "strip_rows") br.strip_rows = i();
    else if (k == "strip_cols") br.strip_cols = i();
    else if (k == "strip_pitch") br.strip_pitch = to_double(file, line_no, line, v);
}

std::string json_escape(const std::string& s) {
    std::string out;
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:
                if ((unsigned char)c < 0x20) continue;
                out += c;
        }
    }
    return out;
}

void ensure_parent_dir(const std::string& file) {
    std::error_code ec; std::filesystem::create_directories(std::filesystem::path(file).parent_path(), ec);
}

std::ofstream open_out(const std::string& path) {
    ensure_parent_dir(path);
    std::ofstream o(path);
    if (!o) throw std::runtime_error("cannot write " + path);
    return o;
}

template <typename Address, typename Render>
void write_placements(std::ostream& o, const std::vector<PlacementOf<Address>>& placements, Render render) {
    o << "  \"placements\": [\n";
    for (size_t i = 0; i < placements.size(); ++i) {
        const auto& p = placements[i];
        o << "    {\"kind\":\"" << to_cstr(p.kind) << "\",\"value\":\"" << json_escape(p.value)
          << "\",\"label\":\"" << json_escape(p.label) << "\",\"orientation\":\"" << to_cstr(p.orientation) << "\"";
        if (p.pin_count) o << ",\"pin_count\":" << p.pin_count;
        o << ",\"leads\":[";
        for (size_t j = 0; j < p.leads.size(); ++j) {
            if (j) o << ",";
            o << "{\"name\":\"" << p.leads[j].name << "\",";
            render(o, p.leads[j].at);
            o << "}";
        }
        o << "]}";
        if (i + 1 != placements.size()) o << ",";
        o << "\n";
    }
    o << "  ]";
}

template <typename Placement>
size_t count_kind(const std::vector<Placement>& v, ComponentKind k) {
    size_t n = 0; for (const auto& p : v) if (p.kind == k) ++n; return n;
}

} // namespace

BoardRules parse_board_rules(const std::string& path) {
    BoardRules br;
    std::ifstream f(path);
    if (!f) return br; // defaults
    std::string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        auto pos = s.find('=');
        if (pos == std::string::npos) continue;
        set_rule(br, trim(s.substr(0, pos)), trim(s.substr(pos + 1)), path, line_no, s);
    }
    return br;
}

Bom parse_bom_text(const std::string& content, const std::string& source_name) {
    Bom bom;
    std::istringstream in(content);
    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        std::string s = trim(line);
        if (s.empty() || s[0] == '#') continue;
        auto fields = split(s, '|');
        for (auto& x : fields) x = trim(x);
        if (fields.size() < 2 || fields.size() > 4)
            throw BomParseError(source_name, line_no, s, "expected 'type | value | quantity | refs'");
        if (fields[0].empty()) throw BomParseError(source_name, line_no, s, "missing component type");

        ComponentRecord rec;
        rec.type_tag = fields[0];
        rec.kind = parse_component_kind(fields[0]);
        rec.value = fields[1];
        if (fields.size() >= 3 && !fields[2].empty()) rec.quantity = to_int(source_name, line_no, s, fields[2]);
        if (fields.size() == 4) {
            for (auto& r : split(fields[3], ',')) {
                std::string ref = trim(r);
                if (!ref.empty()) rec.refs.push_back(ref);
            }
        }
        try {
            validate_record(rec);
        } catch (const DecodeError& e) {
            throw BomParseError(source_name, line_no, s, e.message());
        }
        bom.components.push_back(rec);
    }
    return bom;
}

Bom parse_bom(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw BomParseError(path, 0, "", "cannot open BOM file");
    std::stringstream ss;
    ss << f.rdbuf();
    return parse_bom_text(ss.str(), path);
}

RunConfig parse_run_config(const std::string& path) {
    RunConfig rc;
    std::ifstream f(path);
    std::string line;
    int line_no = 0;
    while (std::getline(f, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string k = trim(line.substr(0, pos));
        std::string v = trim(line.substr(pos + 1));
        std::string kl = tolower_str(k);
        if (kl == "bom") rc.bom_file = v;
        else if (kl == "rules") rc.rules_file = v;
        else if (kl == "out_dir") rc.out_dir = v;
        else if (kl == "name") rc.name = v;
        else if (kl == "surface") {
            std::string vl = tolower_str(v);
            if (vl == "breadboard") rc.surface = Surface::Breadboard;
            else if (vl == "stripboard") rc.surface = Surface::Stripboard;
            else throw BomParseError(path, line_no, line, "surface must be breadboard or stripboard");
        } else {
            rc.overrides[k] = v;
        }
    }
    return rc;
}

void apply_overrides(BoardRules& br, const RunConfig& rc) {
    for (const auto& kv : rc.overrides) {
        const std::string line = kv.first + "=" + kv.second;
        set_rule(br, kv.first, kv.second, "<overrides>", 0, line);
    }
}

void write_layout_json(const std::string& path, const BreadboardLayout& layout) {
    std::ofstream o = open_out(path);
    const BreadboardGeometry g = breadboard_geometry(layout.size);
    o << std::fixed << std::setprecision(6);
    o << "{\n";
    o << "  \"surface\": \"breadboard\",\n";
    o << "  \"size\": \"" << to_cstr(layout.size) << "\",\n";
    o << "  \"columns\": " << g.columns << ",\n";
    o << "  \"width\": " << g.total_width << ",\n";
    o << "  \"height\": " << g.total_height << ",\n";
    auto hole = [&](std::ostream& os, const BreadboardAddress& a) {
        const Point pt = project(a, g);
        os << "\"at\":\"" << to_string(a) << "\",\"x\":" << pt.x << ",\"y\":" << pt.y;
    };
    write_placements(o, layout.placements, hole);
    o << ",\n  \"jumpers\": [\n";
    for (size_t i = 0; i < layout.jumpers.size(); ++i) {
        const auto& j = layout.jumpers[i];
        o << "    {\"role\":\"" << to_cstr(j.role) << "\",\"rail\":\"" << to_string(j.rail_end)
          << "\",\"strip\":\"" << to_string(j.strip_end) << "\",\"target\":\"" << json_escape(j.target) << "\"}";
        if (i + 1 != layout.jumpers.size()) o << ",";
        o << "\n";
    }
    o << "  ]\n";
    o << "}\n";
}

void write_layout_json(const std::string& path, const StripboardLayout& layout) {
    std::ofstream o = open_out(path);
    const StripboardTopology board(layout.rows, layout.cols);
    o << std::fixed << std::setprecision(6);
    o << "{\n";
    o << "  \"surface\": \"stripboard\",\n";
    o << "  \"rows\": " << layout.rows << ",\n";
    o << "  \"cols\": " << layout.cols << ",\n";
    o << "  \"pitch\": " << layout.pitch << ",\n";
    auto hole = [&](std::ostream& os, const StripboardAddress& a) {
        const Point pt = board.project(a, layout.pitch, layout.pitch, layout.pitch);
        os << "\"at\":\"" << label(a) << "\",\"x\":" << pt.x << ",\"y\":" << pt.y;
    };
    write_placements(o, layout.placements, hole);
    o << ",\n  \"cuts\": [\n";
    for (size_t i = 0; i < layout.cuts.size(); ++i) {
        const auto& c = layout.cuts[i];
        o << "    {\"at\":\"" << label(c.at) << "\",\"reason\":\"" << to_cstr(c.reason)
          << "\",\"owner\":\"" << json_escape(c.owner) << "\"}";
        if (i + 1 != layout.cuts.size()) o << ",";
        o << "\n";
    }
    o << "  ]\n";
    o << "}\n";
}

void write_layout_txt(const std::string& path, const BreadboardLayout& layout) {
    std::ofstream o = open_out(path);
    const auto& pl = layout.placements;
    o << "Breadboard " << to_cstr(layout.size) << ": " << pl.size() << " placements, "
      << layout.jumpers.size() << " jumpers\n";
    o << "ICs: " << count_kind(pl, ComponentKind::IC) << ", Resistors: " << count_kind(pl, ComponentKind::Resistor)
      << ", Capacitors: " << count_kind(pl, ComponentKind::Capacitor)
      << ", Transistors: " << count_kind(pl, ComponentKind::Transistor)
      << ", Diodes/LEDs: " << count_kind(pl, ComponentKind::Diode) + count_kind(pl, ComponentKind::Led) << "\n";
    for (const auto& j : layout.jumpers)
        o << to_cstr(j.role) << ": " << to_string(j.rail_end) << " -> " << to_string(j.strip_end) << " (" << j.target << ")\n";
}

void write_layout_txt(const std::string& path, const StripboardLayout& layout) {
    std::ofstream o = open_out(path);
    const auto& pl = layout.placements;
    o << "Stripboard " << layout.rows << "x" << layout.cols << ": " << pl.size() << " placements, "
      << layout.cuts.size() << " track cuts\n";
    o << "ICs: " << count_kind(pl, ComponentKind::IC) << ", Transistors: " << count_kind(pl, ComponentKind::Transistor)
      << ", Passives: " << pl.size() - count_kind(pl, ComponentKind::IC) - count_kind(pl, ComponentKind::Transistor) << "\n";
    o << "Cuts:";
    for (const auto& c : layout.cuts) o << " " << label(c.at);
    o << "\n";
}

} // namespace boardgen
