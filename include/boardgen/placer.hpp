#pragma once

#include "boardgen/bom.hpp"
#include "boardgen/core.hpp"
#include <memory>

namespace boardgen {

template <typename Layout>
struct IPlacer {
    virtual ~IPlacer() = default;
    virtual Layout place(const EnrichedBom& bom, const BoardRules& rules) const = 0;
};

using IBreadboardPlacer = IPlacer<BreadboardLayout>;
using IStripboardPlacer = IPlacer<StripboardLayout>;

// Greedy left-to-right packing by component kind, plus supply/ground jumpers.
std::unique_ptr<IBreadboardPlacer> make_breadboard_placer();

// Vertical two-row placement with a fixed set of track cuts.
std::unique_ptr<IStripboardPlacer> make_stripboard_placer();

// Supply/ground wires for a finished breadboard placement list.
std::vector<Jumper> derive_jumpers(const std::vector<BreadboardPlacement>& placements, BreadboardSize size);

} // namespace boardgen
