#include "boardgen/topology.hpp"
#include "../common/text.hpp"

#include <algorithm>
#include <regex>

namespace boardgen {

std::string column_label(int col) {
    std::string out;
    for (int n = col + 1; n > 0; n = (n - 1) / 26) out.insert(out.begin(), (char)('A' + (n - 1) % 26));
    return out;
}

std::string label(const StripboardAddress& a) { return column_label(a.col) + std::to_string(a.row); }

std::optional<StripboardAddress> parse_stripboard_label(const std::string& input) {
    const std::string s = text::toupper_str(text::strip_spaces(input));
    static const std::regex re(R"(^([A-Z]{1,2})(\d{1,3})$)");
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;
    int col = 0;
    for (char c : m[1].str()) col = col * 26 + (c - 'A' + 1);
    StripboardAddress a;
    a.col = col - 1;
    a.row = std::stoi(m[2].str());
    return a;
}

StripboardTopology::StripboardTopology(int rows, int cols) : rows_(rows), cols_(cols) {}

bool StripboardTopology::is_valid(const StripboardAddress& a) const {
    return a.row >= 1 && a.row <= rows_ && a.col >= 0 && a.col < cols_;
}

void StripboardTopology::add_cut(const StripboardAddress& a) {
    if (is_valid(a)) cuts_.insert(a);
}

bool StripboardTopology::is_cut(const StripboardAddress& a) const { return cuts_.count(a) > 0; }

bool StripboardTopology::same_node(const StripboardAddress& a, const StripboardAddress& b) const {
    if (!is_valid(a) || !is_valid(b)) return false;
    if (a == b) return true;
    if (a.row != b.row) return false;
    // a cut anywhere in the closed span severs it, including under either lead
    const int lo = std::min(a.col, b.col);
    const int hi = std::max(a.col, b.col);
    for (int c = lo; c <= hi; ++c)
        if (is_cut(StripboardAddress{a.row, c})) return false;
    return true;
}

std::vector<StripboardAddress> StripboardTopology::connected_addresses(const StripboardAddress& a) const {
    std::vector<StripboardAddress> out;
    if (!is_valid(a)) return out;
    if (is_cut(a)) { out.push_back(a); return out; }
    int lo = a.col, hi = a.col;
    while (lo > 0 && !is_cut(StripboardAddress{a.row, lo - 1})) --lo;
    while (hi < cols_ - 1 && !is_cut(StripboardAddress{a.row, hi + 1})) ++hi;
    for (int c = lo; c <= hi; ++c) out.push_back(StripboardAddress{a.row, c});
    return out;
}

Point StripboardTopology::project(const StripboardAddress& a, double pitch, double x0, double y0) const {
    Point p;
    p.x = x0 + a.col * pitch;
    p.y = y0 + (a.row - 1) * pitch;
    return p;
}

} // namespace boardgen
