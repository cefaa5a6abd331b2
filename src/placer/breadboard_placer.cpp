#include "boardgen/placer.hpp"
#include "boardgen/topology.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace boardgen {

namespace {

using Hole = std::pair<char, int>;

BreadboardPlacement make_placement(const ResolvedComponent& rc, int q, Orientation o) {
    BreadboardPlacement p;
    p.kind = rc.record.kind;
    p.value = rc.record.value;
    p.label = instance_label(rc.record, q);
    p.orientation = o;
    return p;
}

void add_lead(BreadboardPlacement& p, const std::string& name, char row, int col) {
    p.leads.push_back(Lead<BreadboardAddress>{name, BreadboardAddress::strip(row, col)});
}

int instances(const ComponentRecord& rec, int cap) { return std::max(0, std::min(rec.quantity, cap)); }

struct BreadboardPlacer : IBreadboardPlacer {
    BreadboardLayout place(const EnrichedBom& bom, const BoardRules& rules) const override {
        BreadboardLayout layout;
        layout.size = rules.breadboard_size;
        const int cols = breadboard_columns(rules.breadboard_size);
        const int start = std::max(1, rules.start_col);
        // Last usable start column for a part whose far lead sits `span` holes right.
        auto ceiling = [&](int span) { return std::min(rules.max_col, cols - span); };

        auto each = [&](auto pred, auto&& fn) {
            for (const auto& rc : bom)
                if (pred(rc.record.kind)) fn(rc);
        };
        auto is = [](ComponentKind k) { return [k](ComponentKind x) { return x == k; }; };

        // ICs straddle the centre gap on rows e/f
        int ic_col = start;
        each(is(ComponentKind::IC), [&](const ResolvedComponent& rc) {
            const int pins = infer_pin_count(rc.record.value);
            const int half = pins / 2;
            for (int q = 0; q < instances(rc.record, rules.ic_cap); ++q) {
                if (ic_col > ceiling(half - 1)) break;
                BreadboardPlacement p = make_placement(rc, q, Orientation::Straddle);
                p.pin_count = pins;
                for (int k = 1; k <= pins; ++k) {
                    if (k <= half) add_lead(p, "pin" + std::to_string(k), 'e', ic_col + k - 1);
                    else add_lead(p, "pin" + std::to_string(k), 'f', ic_col + pins - k);
                }
                layout.placements.push_back(std::move(p));
                ic_col += half + 3;
            }
        });

        // Resistors on row a, wrapping once to row b
        int r_col = start;
        char r_row = 'a';
        each(is(ComponentKind::Resistor), [&](const ResolvedComponent& rc) {
            for (int q = 0; q < instances(rc.record, rules.resistor_cap); ++q) {
                if (r_col > ceiling(5)) {
                    if (r_row != 'a') break;
                    r_row = 'b';
                    r_col = start;
                    if (r_col > ceiling(5)) break;
                }
                BreadboardPlacement p = make_placement(rc, q, Orientation::Horizontal);
                add_lead(p, "1", r_row, r_col);
                add_lead(p, "2", r_row, r_col + 5);
                layout.placements.push_back(std::move(p));
                r_col += 8;
            }
        });

        // Capacitors on row c, span by body size
        int c_col = start;
        each(is(ComponentKind::Capacitor), [&](const ResolvedComponent& rc) {
            const auto* cap = std::get_if<CapacitorSpec>(&rc.spec);
            const int span = cap ? capacitor_span_holes(*cap) : capacitor_span_holes(rc.record.value);
            for (int q = 0; q < instances(rc.record, rules.capacitor_cap); ++q) {
                if (c_col > ceiling(span)) break;
                BreadboardPlacement p = make_placement(rc, q, Orientation::Horizontal);
                add_lead(p, "1", 'c', c_col);
                add_lead(p, "2", 'c', c_col + span);
                layout.placements.push_back(std::move(p));
                c_col += span + 4;
            }
        });

        // Transistors on row d, E/B/C in consecutive holes
        int t_col = std::max(1, start - 1);
        bool any_transistor = false;
        each(is(ComponentKind::Transistor), [&](const ResolvedComponent& rc) {
            if (rc.record.quantity >= 1) any_transistor = true;
            for (int q = 0; q < instances(rc.record, rules.transistor_cap); ++q) {
                if (t_col + 2 > ceiling(0)) break;
                BreadboardPlacement p = make_placement(rc, q, Orientation::Horizontal);
                add_lead(p, "E", 'd', t_col);
                add_lead(p, "B", 'd', t_col + 1);
                add_lead(p, "C", 'd', t_col + 2);
                layout.placements.push_back(std::move(p));
                t_col += 5;
            }
        });

        // Diodes and LEDs share row d after the transistors
        int d_col = any_transistor ? t_col + 2 : start;
        each([](ComponentKind k) { return k == ComponentKind::Diode || k == ComponentKind::Led; },
             [&](const ResolvedComponent& rc) {
            for (int q = 0; q < instances(rc.record, rules.diode_cap); ++q) {
                if (d_col > ceiling(4)) break;
                BreadboardPlacement p = make_placement(rc, q, Orientation::Horizontal);
                add_lead(p, "A", 'd', d_col);
                add_lead(p, "K", 'd', d_col + 4);
                layout.placements.push_back(std::move(p));
                d_col += 7;
            }
        });

        layout.jumpers = derive_jumpers(layout.placements, rules.breadboard_size);
        return layout;
    }
};

const Lead<BreadboardAddress>* find_lead(const BreadboardPlacement& p, const std::string& name) {
    for (const auto& l : p.leads)
        if (l.name == name) return &l;
    return nullptr;
}

} // namespace

std::vector<Jumper> derive_jumpers(const std::vector<BreadboardPlacement>& placements, BreadboardSize size) {
    std::set<Hole> occupied;
    for (const auto& p : placements)
        for (const auto& l : p.leads)
            if (!l.at.rail) occupied.insert({l.at.row, l.at.col});

    std::vector<Jumper> out;
    // Outermost free hole of the pin's column group; none free means no jumper.
    auto add = [&](JumperRole role, const BreadboardPlacement& p, const Lead<BreadboardAddress>* lead) {
        if (!lead || lead->at.rail || !is_valid(lead->at, size)) return;
        const int col = lead->at.col;
        const std::string order = row_group(lead->at.row) == 0 ? "abcde" : "jihgf";
        for (char r : order) {
            if (occupied.count({r, col})) continue;
            Jumper j;
            j.role = role;
            j.rail_end = BreadboardAddress::rail_hole(role == JumperRole::Supply ? RailSign::Positive : RailSign::Negative, col);
            j.strip_end = BreadboardAddress::strip(r, col);
            j.target = p.label + " " + lead->name;
            occupied.insert({r, col});
            out.push_back(j);
            return;
        }
    };

    for (const auto& p : placements) {
        if (p.kind != ComponentKind::IC) continue;
        IcSpec ic = resolve_ic(p.value);
        if (ic.pin_count != p.pin_count) {
            // database package disagrees with the inferred one: use package defaults
            ic.supply_pin = p.pin_count == 14 ? 4 : p.pin_count == 16 ? 16 : 8;
            ic.ground_pin = p.pin_count == 14 ? 11 : p.pin_count == 16 ? 8 : 4;
        }
        add(JumperRole::Supply, p, find_lead(p, "pin" + std::to_string(ic.supply_pin)));
        add(JumperRole::Ground, p, find_lead(p, "pin" + std::to_string(ic.ground_pin)));
        return out;
    }
    for (const auto& p : placements) {
        if (p.kind != ComponentKind::Transistor) continue;
        add(JumperRole::Supply, p, find_lead(p, "C"));
        add(JumperRole::Ground, p, find_lead(p, "E"));
        return out;
    }
    return out;
}

std::unique_ptr<IBreadboardPlacer> make_breadboard_placer() { return std::make_unique<BreadboardPlacer>(); }

} // namespace boardgen
