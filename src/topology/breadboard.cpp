#include "boardgen/topology.hpp"
#include "../common/text.hpp"

#include <regex>

namespace boardgen {

BreadboardGeometry breadboard_geometry(BreadboardSize size) {
    BreadboardGeometry g;
    if (size == BreadboardSize::Half400) {
        g.columns = 30;
        g.total_width = 800.0;
    }
    return g;
}

int breadboard_columns(BreadboardSize size) { return breadboard_geometry(size).columns; }

int row_group(char row) {
    if (row >= 'a' && row <= 'e') return 0;
    if (row >= 'f' && row <= 'j') return 1;
    return -1;
}

std::optional<BreadboardAddress> parse_breadboard_address(const std::string& input) {
    const std::string s = text::tolower_str(text::strip_spaces(input));
    static const std::regex strip_re(R"(^([a-j])(\d{1,3})$)");
    static const std::regex rail_re(R"(^([+-])(\d{1,3})$)");
    static const std::regex word_re(R"(^(positive|negative|ground)-?(\d{1,3})$)");

    std::smatch m;
    if (std::regex_match(s, m, strip_re))
        return BreadboardAddress::strip(m[1].str()[0], std::stoi(m[2].str()));
    if (std::regex_match(s, m, rail_re)) {
        const RailSign sign = m[1].str() == "+" ? RailSign::Positive : RailSign::Negative;
        return BreadboardAddress::rail_hole(sign, std::stoi(m[2].str()));
    }
    if (std::regex_match(s, m, word_re)) {
        const RailSign sign = m[1].str() == "positive" ? RailSign::Positive : RailSign::Negative;
        return BreadboardAddress::rail_hole(sign, std::stoi(m[2].str()));
    }
    return std::nullopt;
}

std::string to_string(const BreadboardAddress& a) {
    if (a.rail) return (a.sign == RailSign::Positive ? "+" : "-") + std::to_string(a.col);
    return std::string(1, a.row) + std::to_string(a.col);
}

bool is_valid(const BreadboardAddress& a, BreadboardSize size) {
    if (a.col < 1 || a.col > breadboard_columns(size)) return false;
    return a.rail || row_group(a.row) >= 0;
}

bool same_node(const BreadboardAddress& a, const BreadboardAddress& b, BreadboardSize size) {
    if (!is_valid(a, size) || !is_valid(b, size)) return false;
    if (a.rail != b.rail) return false;
    // each rail is one node along the whole board
    if (a.rail) return a.sign == b.sign;
    return a.col == b.col && row_group(a.row) == row_group(b.row);
}

std::vector<BreadboardAddress> connected_addresses(const BreadboardAddress& a, BreadboardSize size) {
    std::vector<BreadboardAddress> out;
    if (!is_valid(a, size)) return out;
    if (a.rail) {
        for (int c = 1; c <= breadboard_columns(size); ++c) out.push_back(BreadboardAddress::rail_hole(a.sign, c));
        return out;
    }
    const char first = row_group(a.row) == 0 ? 'a' : 'f';
    for (char r = first; r < first + 5; ++r) out.push_back(BreadboardAddress::strip(r, a.col));
    return out;
}

Point project(const BreadboardAddress& a, const BreadboardGeometry& g) {
    Point p;
    p.x = g.strip_x0 + (a.col - 1) * g.hole_spacing;
    if (a.rail) {
        p.y = a.sign == RailSign::Positive ? g.rail_pos_y : g.rail_neg_y;
    } else {
        p.y = g.strip_y0 + (a.row - 'a') * g.hole_spacing;
        if (row_group(a.row) == 1) p.y += g.center_gap;
    }
    return p;
}

} // namespace boardgen
