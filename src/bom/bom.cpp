#include "boardgen/bom.hpp"
#include "../common/text.hpp"

namespace boardgen {

ComponentKind parse_component_kind(const std::string& type_tag) {
    const std::string t = text::tolower_str(text::trim(type_tag));
    if (t == "resistor") return ComponentKind::Resistor;
    if (t == "capacitor") return ComponentKind::Capacitor;
    if (t == "diode") return ComponentKind::Diode;
    if (t == "led") return ComponentKind::Led;
    if (t == "transistor") return ComponentKind::Transistor;
    if (t == "ic" || t == "op-amp") return ComponentKind::IC;
    return ComponentKind::Other;
}

void validate_record(const ComponentRecord& rec) {
    if (rec.quantity < 1) {
        throw DecodeError(ErrorCode::InvalidQuantity, rec.value,
                          build_error_message("quantity must be at least 1, got ", rec.quantity));
    }
}

ResolvedComponent resolve_component(const ComponentRecord& rec) {
    ResolvedComponent rc;
    rc.record = rec;
    try {
        switch (rec.kind) {
            case ComponentKind::Resistor: {
                // canonical bands via the encoder so decoding always round-trips
                const double ohms = parse_resistance(rec.value);
                rc.spec = decode_resistor(encode_resistor(ohms).bands5);
                break;
            }
            case ComponentKind::Capacitor:
                rc.spec = decode_capacitor(rec.value);
                break;
            case ComponentKind::Diode:
                rc.spec = resolve_diode(rec.value);
                break;
            case ComponentKind::Led:
                rc.spec = resolve_led_text(rec.value);
                break;
            case ComponentKind::IC:
                rc.spec = resolve_ic(rec.value);
                break;
            case ComponentKind::Transistor:
            case ComponentKind::Other:
                break;
        }
    } catch (const BoardgenError& e) {
        rc.spec = std::monostate{};
        rc.note = e.what();
    }
    return rc;
}

EnrichedBom enrich_bom(const Bom& bom) {
    EnrichedBom out;
    out.reserve(bom.components.size());
    for (const auto& rec : bom.components) out.push_back(resolve_component(rec));
    return out;
}

std::string instance_label(const ComponentRecord& rec, int index) {
    if (index >= 0 && index < (int)rec.refs.size()) return rec.refs[index];
    if (!rec.refs.empty()) return rec.refs[0];
    return rec.value;
}

} // namespace boardgen
