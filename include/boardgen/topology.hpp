#pragma once

#include "boardgen/core.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace boardgen {

// ---- breadboard -------------------------------------------------------------

// Canvas geometry of a breadboard, one unit = 1/24 of a 2.54mm pitch.
struct BreadboardGeometry {
    int columns = 63;
    double hole_spacing = 24.0;
    double center_gap = 48.0;
    double strip_x0 = 92.0;      // column 1 centre
    double strip_y0 = 188.0;     // row a centre
    double rail_pos_y = 116.0;
    double rail_neg_y = 140.0;
    double total_width = 1600.0;
    double total_height = 616.0;
};

BreadboardGeometry breadboard_geometry(BreadboardSize size);

int breadboard_columns(BreadboardSize size);

// Row a..e -> 0, f..j -> 1, anything else -> -1.
int row_group(char row);

std::optional<BreadboardAddress> parse_breadboard_address(const std::string& text);
std::string to_string(const BreadboardAddress& a);

bool is_valid(const BreadboardAddress& a, BreadboardSize size);

// Electrical identity on the continuous-strip surface. False if either address is invalid.
bool same_node(const BreadboardAddress& a, const BreadboardAddress& b, BreadboardSize size);

// Every address in the node of `a`, including `a`. Empty if `a` is invalid.
std::vector<BreadboardAddress> connected_addresses(const BreadboardAddress& a, BreadboardSize size);

Point project(const BreadboardAddress& a, const BreadboardGeometry& g);

// ---- stripboard -------------------------------------------------------------

std::string column_label(int col);                  // 0 -> "A"
std::string label(const StripboardAddress& a);      // {11, 3} -> "D11"
std::optional<StripboardAddress> parse_stripboard_label(const std::string& text);

// Copper strips run along rows; a cut severs its row at that column.
class StripboardTopology {
public:
    StripboardTopology(int rows = 25, int cols = 24);

    int rows() const { return rows_; }
    int cols() const { return cols_; }

    bool is_valid(const StripboardAddress& a) const;

    // Ignores cuts that fall outside the board.
    void add_cut(const StripboardAddress& a);
    bool is_cut(const StripboardAddress& a) const;
    const std::set<StripboardAddress>& cuts() const { return cuts_; }

    bool same_node(const StripboardAddress& a, const StripboardAddress& b) const;
    std::vector<StripboardAddress> connected_addresses(const StripboardAddress& a) const;

    Point project(const StripboardAddress& a, double pitch = 24.0, double x0 = 24.0, double y0 = 24.0) const;

private:
    int rows_;
    int cols_;
    std::set<StripboardAddress> cuts_;
};

} // namespace boardgen
