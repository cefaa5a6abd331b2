#pragma once

#include "boardgen/core.hpp"
#include <string>

namespace boardgen {

// Parsing simple key=value config for board rules
BoardRules parse_board_rules(const std::string& path);

// BOM text file: "type | value | quantity | R1,R2" per line.
// Throws BomParseError on malformed lines.
Bom parse_bom(const std::string& path);
Bom parse_bom_text(const std::string& text, const std::string& source_name = "<text>");

// Parse unified run config (-config)
RunConfig parse_run_config(const std::string& path);

// Apply overrides from RunConfig to BoardRules
void apply_overrides(BoardRules& rules, const RunConfig& rc);

// Serialize layouts to JSON
void write_layout_json(const std::string& path, const BreadboardLayout& layout);
void write_layout_json(const std::string& path, const StripboardLayout& layout);

// Write brief text summary
void write_layout_txt(const std::string& path, const BreadboardLayout& layout);
void write_layout_txt(const std::string& path, const StripboardLayout& layout);

} // namespace boardgen
