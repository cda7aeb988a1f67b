#include "mdhealth/schema.hh"
#include "mdhealth/stats.hh"

#include <algorithm>

#include <gtest/gtest.h>

using nlohmann::json;

namespace {

	const mdhealth::field_spec& field_named(const mdhealth::schema& sch, const std::string& name) {
		auto& fs=sch.fields();
		auto it=std::find_if(fs.begin(), fs.end(), [&name](auto& f) { return f.name==name; });
		if(it==fs.end())
			throw std::runtime_error{"no field "+name};
		return *it;
	}
	const mdhealth::subfield_spec& subfield_named(const mdhealth::field_spec& f, const std::string& name) {
		auto it=std::find_if(f.subfields.begin(), f.subfields.end(), [&name](auto& s) { return s.name==name; });
		if(it==f.subfields.end())
			throw std::runtime_error{"no subfield "+name};
		return *it;
	}
	std::vector<std::string> observe(const mdhealth::subfield_spec& sub, const json& occ) {
		std::vector<std::string_view> out;
		sub.extract(sub, occ, out);
		return {out.begin(), out.end()};
	}

}

TEST(Schema, FieldTaxonomy) {
	auto& sch=mdhealth::schema::instance();
	EXPECT_EQ(sch.fields().size(), 20u);
	EXPECT_EQ(sch.num_fields(mdhealth::field_status::mandatory), 6u);
	EXPECT_EQ(sch.num_fields(mdhealth::field_status::recommended), 6u);
	EXPECT_EQ(sch.num_fields(mdhealth::field_status::optional), 8u);

	EXPECT_EQ(field_named(sch, "identifier").source, "doi");
	EXPECT_EQ(field_named(sch, "resourceType").source, "types");
	EXPECT_EQ(field_named(sch, "rights").source, "rightsList");
	EXPECT_TRUE(field_named(sch, "fundingReferences").repeatable);
	EXPECT_FALSE(field_named(sch, "resourceType").repeatable);
}

TEST(Schema, ResourceTypesComeFromRoutingSubfield) {
	auto& sch=mdhealth::schema::instance();
	EXPECT_EQ(sch.resource_types().size(), 28u);
	EXPECT_TRUE(sch.is_resource_type("Dataset"));
	EXPECT_TRUE(sch.is_resource_type("Unknown"));
	EXPECT_FALSE(sch.is_resource_type("dataset"));
	ASSERT_NE(sch.routing_field(), SIZE_MAX);
	EXPECT_EQ(sch.fields()[sch.routing_field()].name, "resourceType");
	EXPECT_EQ(sch.routing_key(), "resourceTypeGeneral");
}

TEST(Schema, ClassifyFallsBackToOther) {
	auto& sch=mdhealth::schema::instance();
	auto& ctype=subfield_named(field_named(sch, "contributors"), "contributorType");
	ASSERT_NE(ctype.classify("Editor"), nullptr);
	EXPECT_EQ(*ctype.classify("Editor"), "Editor");
	ASSERT_NE(ctype.classify("Wizard"), nullptr);
	EXPECT_EQ(*ctype.classify("Wizard"), "Other");

	auto& ntype=subfield_named(field_named(sch, "creators"), "nameType");
	EXPECT_FALSE(ntype.has_other);
	EXPECT_EQ(ntype.classify("Wizard"), nullptr);
}

TEST(Schema, Presence) {
	EXPECT_FALSE(mdhealth::is_present(json{}));
	EXPECT_FALSE(mdhealth::is_present(json("")));
	EXPECT_FALSE(mdhealth::is_present(json(0)));
	EXPECT_FALSE(mdhealth::is_present(json(false)));
	EXPECT_FALSE(mdhealth::is_present(json::array()));
	EXPECT_FALSE(mdhealth::is_present(json::object()));
	EXPECT_TRUE(mdhealth::is_present(json("x")));
	EXPECT_TRUE(mdhealth::is_present(json(2021)));
	EXPECT_TRUE(mdhealth::is_present(json::array({json::object()})));
}

TEST(Schema, IdentifierExtractors) {
	auto& creators=field_named(mdhealth::schema::instance(), "creators");
	auto occ=json::parse(R"({
		"name": "Doe, Jane",
		"nameIdentifiers": [
			{"nameIdentifier": "https://orcid.org/0000-0001", "nameIdentifierScheme": "ORCID"},
			{"nameIdentifier": "x"},
			{}
		],
		"affiliation": [
			{"name": "A", "affiliationIdentifier": "https://ror.org/1", "affiliationIdentifierScheme": "ROR"},
			{"name": "B", "affiliationIdentifierScheme": "GRID"}
		]
	})");

	EXPECT_EQ(observe(subfield_named(creators, "nameIdentifier"), occ).size(), 2u);
	EXPECT_EQ(observe(subfield_named(creators, "nameIdentifierScheme"), occ), std::vector<std::string>{"ORCID"});
	EXPECT_EQ(observe(subfield_named(creators, "affiliation"), occ).size(), 2u);
	EXPECT_EQ(observe(subfield_named(creators, "affiliationIdentifier"), occ).size(), 1u);
	// a scheme without an identifier is not observed
	EXPECT_EQ(observe(subfield_named(creators, "affiliationIdentifierScheme"), occ), std::vector<std::string>{"ROR"});
	EXPECT_EQ(observe(subfield_named(creators, "nameType"), occ).size(), 0u);

	auto blank=json::parse(R"({
		"nameIdentifiers": [
			{"nameIdentifier": "", "nameIdentifierScheme": "ORCID", "schemeUri": "https://orcid.org"}
		]
	})");
	EXPECT_EQ(observe(subfield_named(creators, "nameIdentifier"), blank).size(), 0u);
	EXPECT_EQ(observe(subfield_named(creators, "nameIdentifierScheme"), blank).size(), 0u);
}

TEST(Schema, EmptyTreeHasAllValues) {
	auto& sch=mdhealth::schema::instance();
	auto tree=mdhealth::create_empty_tree(sch);
	EXPECT_EQ(tree.record_count, 0u);
	EXPECT_EQ(tree.fields.size(), sch.fields().size());
	auto& sub=tree.fields.at("contributors").subfields.at("contributorType");
	ASSERT_TRUE(sub.values.has_value());
	EXPECT_EQ(sub.values->size(), 21u);
	EXPECT_EQ(sub.values->at("Other"), 0u);
	EXPECT_FALSE(tree.fields.at("fundingReferences").subfields.at("awardTitle").values.has_value());
	EXPECT_EQ(tree.fields.at("titles").status, mdhealth::field_status::mandatory);

	auto ent=mdhealth::create_empty_entity_stats(sch);
	EXPECT_EQ(ent.by_resource_type.size(), 28u);
	EXPECT_EQ(ent.by_resource_type.at("Text"), tree);
}
