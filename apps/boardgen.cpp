#include "boardgen/io.hpp"
#include "boardgen/bom.hpp"
#include "boardgen/placer.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

using namespace boardgen;

static void usage() {
    std::cerr << "Usage: boardgen -config <config_file> [-bom <bom_file>] [-surface breadboard|stripboard]\n";
}

// Instances a record asks for on the breadboard after per-kind caps.
static int requested(const ComponentRecord& rec, const BoardRules& br) {
    int cap = 0;
    switch (rec.kind) {
        case ComponentKind::Resistor:   cap = br.resistor_cap; break;
        case ComponentKind::Capacitor:  cap = br.capacitor_cap; break;
        case ComponentKind::IC:         cap = br.ic_cap; break;
        case ComponentKind::Transistor: cap = br.transistor_cap; break;
        case ComponentKind::Diode:
        case ComponentKind::Led:        cap = br.diode_cap; break;
        case ComponentKind::Other:      return 0;
    }
    return std::max(0, std::min(rec.quantity, cap));
}

template <typename Layout>
static void report_dropped(const Bom& bom, const Layout& layout, bool capped, const BoardRules& br) {
    for (ComponentKind k : {ComponentKind::IC, ComponentKind::Resistor, ComponentKind::Capacitor,
                            ComponentKind::Transistor, ComponentKind::Diode, ComponentKind::Led, ComponentKind::Other}) {
        int want = 0;
        for (const auto& rec : bom.components)
            if (rec.kind == k) want += capped ? requested(rec, br) : rec.quantity;
        int got = 0;
        for (const auto& p : layout.placements)
            if (p.kind == k) ++got;
        if (got < want)
            std::cerr << "Warning: " << (want - got) << " " << to_cstr(k) << " instance(s) did not fit and were dropped.\n";
    }
}

int main(int argc, char** argv) {
    if (argc < 3) { usage(); return 1; }

    std::string cfg_path, bom_override, surface_override;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-config" || a == "--config") && i + 1 < argc) cfg_path = argv[++i];
        else if ((a == "-bom" || a == "--bom") && i + 1 < argc) bom_override = argv[++i];
        else if ((a == "-surface" || a == "--surface") && i + 1 < argc) surface_override = argv[++i];
    }
    if (cfg_path.empty()) { usage(); return 1; }

    RunConfig rc;
    BoardRules br;
    try {
        rc = parse_run_config(cfg_path);
        if (!bom_override.empty()) rc.bom_file = bom_override;
        if (surface_override == "breadboard") rc.surface = Surface::Breadboard;
        else if (surface_override == "stripboard") rc.surface = Surface::Stripboard;
        else if (!surface_override.empty()) {
            std::cerr << "Config error: unknown surface '" << surface_override << "'.\n";
            return 2;
        }
        br = parse_board_rules(rc.rules_file);
        apply_overrides(br, rc);
    } catch (const BomParseError& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 2;
    }

    if (rc.bom_file.empty()) {
        std::cerr << "Config error: no BOM given. Set bom=... or pass -bom.\n";
        return 2;
    }

    Bom bom;
    try {
        bom = parse_bom(rc.bom_file);
    } catch (const BomParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }
    if (bom.components.empty()) std::cerr << "Warning: BOM " << rc.bom_file << " has no components.\n";

    EnrichedBom enriched = enrich_bom(bom);
    for (const auto& c : enriched) {
        if (!c.note.empty())
            std::cerr << "Warning: " << instance_label(c.record, 0) << " '" << c.record.value << "': " << c.note << "\n";
    }

    const std::string base = (rc.out_dir.empty() ? std::string("out") : rc.out_dir) + "/" + rc.name;
    const std::string json_out = base + ".layout.json";
    const std::string txt_out = base + ".layout.txt";
    try {
        if (rc.surface == Surface::Breadboard) {
            BreadboardLayout layout = make_breadboard_placer()->place(enriched, br);
            report_dropped(bom, layout, true, br);
            if (layout.jumpers.empty())
                std::cerr << "Warning: no supply/ground jumpers derived (no IC or transistor placed).\n";
            write_layout_json(json_out, layout);
            write_layout_txt(txt_out, layout);
        } else {
            StripboardLayout layout = make_stripboard_placer()->place(enriched, br);
            report_dropped(bom, layout, false, br);
            write_layout_json(json_out, layout);
            write_layout_txt(txt_out, layout);
        }
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 4;
    }
    std::cout << "Wrote " << json_out << " and " << txt_out << "\n";
    return 0;
}
