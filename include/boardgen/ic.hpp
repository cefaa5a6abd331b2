#pragma once

#include <string>
#include <vector>

namespace boardgen {

struct IcSpec {
    std::string part_number;
    int pin_count = 8;
    int supply_pin = 8;   // V+
    int ground_pin = 4;   // V- / GND
    std::string description;
    bool from_database = false;
};

// DIP size from the value text; 8 unless a known 14/16-pin substring matches.
int infer_pin_count(const std::string& value_text);

// Database lookup with alias handling; unknown parts get an inferred package.
IcSpec resolve_ic(const std::string& part_number);

std::vector<std::string> known_ics();

} // namespace boardgen
