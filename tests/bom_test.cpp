#include <gtest/gtest.h>
#include "boardgen/bom.hpp"

using namespace boardgen;

namespace {

ComponentRecord record(const std::string& tag, const std::string& value, int qty = 1,
                       std::vector<std::string> refs = {}) {
    ComponentRecord r;
    r.type_tag = tag;
    r.kind = parse_component_kind(tag);
    r.value = value;
    r.quantity = qty;
    r.refs = std::move(refs);
    return r;
}

} // namespace

TEST(BomKindTest, TypeTags) {
    EXPECT_EQ(parse_component_kind("resistor"), ComponentKind::Resistor);
    EXPECT_EQ(parse_component_kind(" Capacitor "), ComponentKind::Capacitor);
    EXPECT_EQ(parse_component_kind("LED"), ComponentKind::Led);
    EXPECT_EQ(parse_component_kind("diode"), ComponentKind::Diode);
    EXPECT_EQ(parse_component_kind("transistor"), ComponentKind::Transistor);
    EXPECT_EQ(parse_component_kind("ic"), ComponentKind::IC);
    EXPECT_EQ(parse_component_kind("Op-Amp"), ComponentKind::IC);
    EXPECT_EQ(parse_component_kind("jack"), ComponentKind::Other);
    EXPECT_EQ(parse_component_kind(""), ComponentKind::Other);
}

TEST(BomValidateTest, QuantityMustBePositive) {
    EXPECT_NO_THROW(validate_record(record("resistor", "10k", 1)));
    try {
        validate_record(record("resistor", "10k", 0));
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidQuantity);
    }
    EXPECT_THROW(validate_record(record("resistor", "10k", -2)), DecodeError);
}

TEST(BomResolveTest, ResistorRoundTripsThroughTheEncoder) {
    ResolvedComponent rc = resolve_component(record("resistor", "4k7"));
    const auto* r = std::get_if<ResistorSpec>(&rc.spec);
    ASSERT_NE(r, nullptr);
    EXPECT_DOUBLE_EQ(r->ohms, 4700.0);
    EXPECT_DOUBLE_EQ(r->tolerance_percent, 1.0);
    EXPECT_EQ(r->bands.size(), 5u);
    EXPECT_TRUE(rc.note.empty());
}

TEST(BomResolveTest, EachKindGetsItsSpec) {
    EXPECT_TRUE(std::holds_alternative<CapacitorSpec>(resolve_component(record("capacitor", "473K100")).spec));
    EXPECT_TRUE(std::holds_alternative<DiodeSpec>(resolve_component(record("diode", "1N4148")).spec));
    EXPECT_TRUE(std::holds_alternative<LedSpec>(resolve_component(record("led", "red 3mm")).spec));
    EXPECT_TRUE(std::holds_alternative<IcSpec>(resolve_component(record("op-amp", "TL072")).spec));

    ResolvedComponent q = resolve_component(record("transistor", "2N3904"));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(q.spec));
    EXPECT_TRUE(q.note.empty());
}

TEST(BomResolveTest, UndecodableValueIsKeptAsANote) {
    ResolvedComponent r = resolve_component(record("resistor", "banana"));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(r.spec));
    EXPECT_NE(r.note.find("UnrecognizedMarking"), std::string::npos);

    ResolvedComponent c = resolve_component(record("capacitor", "big blue can"));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(c.spec));
    EXPECT_FALSE(c.note.empty());
}

TEST(BomResolveTest, EnrichKeepsRecordOrder) {
    Bom bom;
    bom.components = {record("ic", "TL072"), record("resistor", "10k", 2), record("jack", "DC")};
    EnrichedBom e = enrich_bom(bom);
    ASSERT_EQ(e.size(), 3u);
    EXPECT_EQ(e[0].record.kind, ComponentKind::IC);
    EXPECT_EQ(e[1].record.quantity, 2);
    EXPECT_EQ(e[2].record.kind, ComponentKind::Other);
}

TEST(BomLabelTest, InstanceLabels) {
    ComponentRecord r = record("resistor", "10k", 3, {"R1", "R2"});
    EXPECT_EQ(instance_label(r, 0), "R1");
    EXPECT_EQ(instance_label(r, 1), "R2");
    EXPECT_EQ(instance_label(r, 2), "R1");
    EXPECT_EQ(instance_label(record("resistor", "10k", 2), 1), "10k");
}
