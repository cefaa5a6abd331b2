#pragma once

#include <cctype>
#include <cmath>
#include <cstdio>
#include <sstream>
#include <string>
#include <vector>

namespace boardgen {
namespace text {

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

inline std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> out; std::string cur; std::istringstream iss(s);
    while (std::getline(iss, cur, sep)) out.push_back(cur);
    return out;
}

inline std::string join(const std::vector<std::string>& v, const char* sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) { if (i) out += sep; out += v[i]; }
    return out;
}

inline std::string tolower_str(std::string s) { for (auto& c : s) c = (char)std::tolower((unsigned char)c); return s; }
inline std::string toupper_str(std::string s) { for (auto& c : s) c = (char)std::toupper((unsigned char)c); return s; }

inline std::string strip_spaces(const std::string& s) {
    std::string out; out.reserve(s.size());
    for (char c : s) if (!std::isspace((unsigned char)c)) out.push_back(c);
    return out;
}

inline void erase_all(std::string& s, const std::string& what) {
    if (what.empty()) return;
    for (size_t p = s.find(what); p != std::string::npos; p = s.find(what, p)) s.erase(p, what.size());
}

inline bool contains(const std::string& s, const std::string& what) { return s.find(what) != std::string::npos; }

// Shortest form without trailing zeros: 47 -> "47", 4.7 -> "4.7".
inline std::string number(double v) {
    if (std::floor(v) == v && std::fabs(v) < 1e15) {
        char buf[32]; std::snprintf(buf, sizeof(buf), "%.0f", v); return buf;
    }
    char buf[32]; std::snprintf(buf, sizeof(buf), "%.6g", v);
    return buf;
}

// `sig` significant digits, trailing decimal point removed (4.7 -> "4.70").
inline std::string precision(double v, int sig) {
    char buf[48]; std::snprintf(buf, sizeof(buf), "%#.*g", sig, v);
    std::string s = buf;
    if (!s.empty() && s.back() == '.') s.pop_back();
    return s;
}

} // namespace text
} // namespace boardgen
