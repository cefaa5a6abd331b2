#pragma once

#include "boardgen/core.hpp"
#include "boardgen/capacitor.hpp"
#include "boardgen/diode.hpp"
#include "boardgen/ic.hpp"
#include "boardgen/resistor.hpp"
#include <string>
#include <variant>
#include <vector>

namespace boardgen {

using CanonicalSpec = std::variant<std::monostate, ResistorSpec, CapacitorSpec, DiodeSpec, LedSpec, IcSpec>;

// A record plus whatever its codec or resolver made of the value text.
struct ResolvedComponent {
    ComponentRecord record;
    CanonicalSpec spec;
    std::string note;  // why spec is empty, if it is
};

using EnrichedBom = std::vector<ResolvedComponent>;

ComponentKind parse_component_kind(const std::string& type_tag);

// Throws DecodeError (InvalidQuantity).
void validate_record(const ComponentRecord& rec);

// Never throws for value text; decode failures are kept in `note`.
ResolvedComponent resolve_component(const ComponentRecord& rec);
EnrichedBom enrich_bom(const Bom& bom);

// Reference designator for instance `index` of a record.
std::string instance_label(const ComponentRecord& rec, int index);

} // namespace boardgen
