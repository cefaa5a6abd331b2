#include "boardgen/placer.hpp"
#include "boardgen/topology.hpp"

#include <algorithm>

namespace boardgen {

namespace {

// Rows 1 (+V) and 2 (GND) are rails; components start below them.
constexpr int kTransistorTopRow = 4;
constexpr int kTransistorStartCol = 2;
constexpr int kTransistorStep = 4;
constexpr int kIcTopRow = 4;
constexpr int kIcBottomRow = 8;
constexpr int kPassiveStartRow = 9;
constexpr int kPassiveStartCol = 1;
constexpr int kPassiveMaxCol = 21;
constexpr int kPassiveColStep = 3;
constexpr int kPassiveRowStep = 4;
constexpr int kPassiveSpan = 2;

StripboardPlacement make_placement(const ResolvedComponent& rc, int q, Orientation o) {
    StripboardPlacement p;
    p.kind = rc.record.kind;
    p.value = rc.record.value;
    p.label = instance_label(rc.record, q);
    p.orientation = o;
    return p;
}

void add_lead(StripboardPlacement& p, const std::string& name, int row, int col) {
    p.leads.push_back(Lead<StripboardAddress>{name, StripboardAddress{row, col}});
}

struct StripboardPlacer : IStripboardPlacer {
    StripboardLayout place(const EnrichedBom& bom, const BoardRules& rules) const override {
        StripboardTopology board(rules.strip_rows, rules.strip_cols);
        StripboardLayout layout;
        layout.rows = board.rows();
        layout.cols = board.cols();
        layout.pitch = rules.strip_pitch;

        // fn returns false once the part no longer fits, which ends that record
        auto each = [&](ComponentKind kind, auto&& fn) {
            for (const auto& rc : bom) {
                if (rc.record.kind != kind) continue;
                for (int q = 0; q < rc.record.quantity; ++q)
                    if (!fn(rc, q)) break;
            }
        };

        // Transistors: E/B/C down one column
        int t_col = kTransistorStartCol;
        each(ComponentKind::Transistor, [&](const ResolvedComponent& rc, int q) {
            if (t_col >= board.cols()) return false;
            StripboardPlacement p = make_placement(rc, q, Orientation::Vertical);
            add_lead(p, "E", kTransistorTopRow, t_col);
            add_lead(p, "B", kTransistorTopRow + 1, t_col);
            add_lead(p, "C", kTransistorTopRow + 2, t_col);
            layout.placements.push_back(std::move(p));
            t_col += kTransistorStep;
            return true;
        });

        // ICs: top pins on one row, bottom pins on another, one pin per column
        int ic_col = t_col + 1;
        each(ComponentKind::IC, [&](const ResolvedComponent& rc, int q) {
            const int pins = infer_pin_count(rc.record.value);
            const int half = pins / 2;
            if (ic_col + half - 1 >= board.cols()) return false;
            StripboardPlacement p = make_placement(rc, q, Orientation::Straddle);
            p.pin_count = pins;
            for (int k = 1; k <= pins; ++k) {
                if (k <= half) add_lead(p, "pin" + std::to_string(k), kIcTopRow, ic_col + k - 1);
                else add_lead(p, "pin" + std::to_string(k), kIcBottomRow, ic_col + pins - k);
            }
            layout.placements.push_back(std::move(p));
            ic_col += half + 2;
            return true;
        });

        // Passives: two leads in one column, kPassiveSpan rows apart
        int p_row = kPassiveStartRow;
        int p_col = kPassiveStartCol;
        const int last_col = std::min(kPassiveMaxCol, board.cols() - 1);
        auto place_passive = [&](const ResolvedComponent& rc, int q) {
            if (p_col > last_col) {
                p_col = kPassiveStartCol;
                p_row += kPassiveRowStep;
            }
            if (p_row + kPassiveSpan > board.rows()) return false;
            const bool polar = rc.record.kind == ComponentKind::Diode || rc.record.kind == ComponentKind::Led;
            StripboardPlacement p = make_placement(rc, q, Orientation::Vertical);
            add_lead(p, polar ? "A" : "1", p_row, p_col);
            add_lead(p, polar ? "K" : "2", p_row + kPassiveSpan, p_col);
            layout.placements.push_back(std::move(p));
            p_col += kPassiveColStep;
            return true;
        };
        for (ComponentKind k : {ComponentKind::Resistor, ComponentKind::Diode, ComponentKind::Led,
                                ComponentKind::Capacitor, ComponentKind::Other})
            each(k, place_passive);

        // Track cuts: rail isolation, then both sides of every transistor base
        auto cut = [&](int row, int col, CutReason reason, const std::string& owner) {
            const StripboardAddress at{row, col};
            if (!board.is_valid(at) || board.is_cut(at)) return;
            board.add_cut(at);
            layout.cuts.push_back(TrackCut{at, reason, owner});
        };
        cut(2, 0, CutReason::RailIsolation, "");
        cut(3, 0, CutReason::RailIsolation, "");
        for (const auto& p : layout.placements) {
            if (p.kind != ComponentKind::Transistor) continue;
            const StripboardAddress base = p.leads[1].at;
            cut(base.row, base.col - 1, CutReason::TransistorBase, p.label);
            cut(base.row, base.col + 1, CutReason::TransistorBase, p.label);
        }
        return layout;
    }
};

} // namespace

std::unique_ptr<IStripboardPlacer> make_stripboard_placer() { return std::make_unique<StripboardPlacer>(); }

} // namespace boardgen
