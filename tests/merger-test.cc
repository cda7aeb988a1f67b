#include "mdhealth/merger.hh"
#include "mdhealth/record.hh"
#include "mdhealth/updater.hh"

#include <gtest/gtest.h>

using nlohmann::json;

namespace {

	std::vector<json> sample_items() {
		std::vector<json> items;
		const char* types[]={"Dataset", "Text", "Software", "Dataset", "Spaceship", "Text"};
		for(int i=0; i<6; ++i) {
			json attrs{{"doi", "10.1/"+std::to_string(i)}, {"types", {{"resourceTypeGeneral", types[i]}}}};
			if(i%2==0)
				attrs["titles"]=json::array({{{"title", "T"}}});
			if(i%3==0)
				attrs["creators"]=json::array({{{"nameType", "Personal"}}, {{"nameType", "Organizational"}}});
			if(i==4)
				attrs["relatedIdentifiers"]=json::array({{{"relationType", "Cites"}, {"relatedIdentifierType", "DOI"}}});
			items.push_back(json{{"id", attrs["doi"]}, {"attributes", attrs}});
		}
		return items;
	}

	mdhealth::entity_stats build(const std::vector<json>& items, std::size_t first, std::size_t last) {
		auto& sch=mdhealth::schema::instance();
		mdhealth::record_updater upd{sch};
		mdhealth::entity_stats stats{mdhealth::create_empty_tree(sch), {}};
		for(auto i=first; i<last; ++i) {
			mdhealth::record rec{items[i], sch};
			upd.update(stats, rec);
		}
		return stats;
	}

}

TEST(TreeMerger, MergeEqualsDirectProcessing) {
	auto items=sample_items();
	auto direct=build(items, 0, items.size());
	auto a=build(items, 0, 2);
	auto b=build(items, 2, 5);
	auto c=build(items, 5, 6);

	auto left=mdhealth::merge_entity_trees(mdhealth::merge_entity_trees(a, b), c);
	auto right=mdhealth::merge_entity_trees(a, mdhealth::merge_entity_trees(b, c));
	auto swapped=mdhealth::merge_entity_trees(c, mdhealth::merge_entity_trees(b, a));
	EXPECT_EQ(left.summary.record_count, 6u);
	EXPECT_EQ(left, direct);
	EXPECT_EQ(right, direct);
	EXPECT_EQ(swapped, direct);
	EXPECT_EQ(left.by_resource_type.at("Dataset").record_count, 2u);
	EXPECT_EQ(left.by_resource_type.at("Text").record_count, 2u);

	mdhealth::finalize(left);
	mdhealth::finalize(direct);
	EXPECT_EQ(left, direct);
}

TEST(TreeMerger, EmptyMergeIsIdentity) {
	auto& sch=mdhealth::schema::instance();
	auto items=sample_items();
	auto t=build(items, 0, items.size()).summary;
	EXPECT_EQ(mdhealth::merge_trees(t, mdhealth::create_empty_tree(sch)), t);
	EXPECT_EQ(mdhealth::merge_trees(mdhealth::create_empty_tree(sch), t), t);
}

TEST(TreeMerger, DenominatorsUseMergedTotal) {
	auto items=sample_items();
	auto a=build(items, 0, 1);
	auto b=build(items, 1, 4);
	auto m=mdhealth::merge_entity_trees(a, b);
	for(auto* tree: {&m.summary, &m.by_resource_type.at("Dataset")}) {
		for(auto& [name, fs]: tree->fields) {
			EXPECT_EQ(fs.count+fs.missing, tree->record_count) << name;
			EXPECT_DOUBLE_EQ(fs.completeness, mdhealth::ratio(fs.count, tree->record_count)) << name;
			for(auto& [subname, ss]: fs.subfields)
				EXPECT_EQ(ss.count+ss.missing, tree->record_count) << name << '.' << subname;
		}
	}
	// Dataset appears on both sides, Software only on b
	EXPECT_EQ(m.by_resource_type.at("Dataset").record_count, 2u);
	EXPECT_EQ(m.by_resource_type.at("Software").record_count, 1u);
	EXPECT_DOUBLE_EQ(m.summary.fields.at("titles").completeness, 0.5);
}

TEST(TreeMerger, UnionOfFieldsAndValues) {
	mdhealth::stats_tree a{};
	a.record_count=2;
	a.fields["x"].count=1;
	a.fields["x"].status=mdhealth::field_status::mandatory;
	a.fields["x"].subfields["s"].values.emplace();
	(*a.fields["x"].subfields["s"].values)["p"]=1;

	mdhealth::stats_tree b{};
	b.record_count=2;
	b.fields["x"].count=2;
	b.fields["x"].status=mdhealth::field_status::mandatory;
	b.fields["x"].subfields["s"].values.emplace();
	(*b.fields["x"].subfields["s"].values)["q"]=3;
	b.fields["y"].count=1;
	b.fields["y"].status=mdhealth::field_status::recommended;

	auto m=mdhealth::merge_trees(a, b);
	EXPECT_EQ(m.record_count, 4u);
	EXPECT_EQ(m.fields.at("x").count, 3u);
	EXPECT_EQ(m.fields.at("x").missing, 1u);
	EXPECT_EQ(m.fields.at("y").status, mdhealth::field_status::recommended);
	EXPECT_EQ(m.fields.at("y").missing, 3u);
	auto& vals=*m.fields.at("x").subfields.at("s").values;
	EXPECT_EQ(vals.at("p"), 1u);
	EXPECT_EQ(vals.at("q"), 3u);
	EXPECT_DOUBLE_EQ(m.categories.mandatory, 0.75);
	EXPECT_DOUBLE_EQ(m.categories.recommended, 0.25);
}

TEST(TreeMerger, FinalizePrunesAndRounds) {
	auto items=sample_items();
	auto stats=build(items, 0, 3);
	auto& sch=mdhealth::schema::instance();
	stats.by_resource_type.emplace("Image", mdhealth::create_empty_tree(sch));
	mdhealth::finalize(stats);

	EXPECT_EQ(stats.by_resource_type.count("Image"), 0u);
	EXPECT_EQ(stats.by_resource_type.count("Dataset"), 1u);
	auto& ntype=stats.summary.fields.at("creators").subfields.at("nameType");
	EXPECT_EQ(ntype.values->size(), 2u);
	auto& rtg=stats.summary.fields.at("resourceType").subfields.at("resourceTypeGeneral");
	EXPECT_EQ(rtg.values->size(), 3u);
	EXPECT_EQ(rtg.values->count("Image"), 0u);
	// 2 of 3 records carry titles
	EXPECT_DOUBLE_EQ(stats.summary.fields.at("titles").completeness, 0.6667);
}
