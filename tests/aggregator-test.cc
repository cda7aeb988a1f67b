#include "mdhealth/aggregator.hh"
#include "mdhealth/jsonl-input.hh"

#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

#include "test-helper.hh"

using nlohmann::json;
using mdhealth_test::make_item;

namespace {

	mdhealth::registry_listing sample_registry() {
		auto providers=json::parse(R"([
			{"id": "p", "type": "providers", "attributes": {"symbol": "P", "name": "Provider P"}},
			{"id": "q", "type": "providers", "attributes": {"symbol": "Q", "name": "Provider Q"}}
		])");
		auto clients=json::parse(R"([
			{"id": "p.x", "type": "clients", "attributes": {"symbol": "P.X"},
				"relationships": {"provider": {"data": {"id": "p", "type": "providers"}}}},
			{"id": "p.y", "type": "clients", "attributes": {"symbol": "P.Y"},
				"relationships": {"provider": {"data": {"id": "p", "type": "providers"}}}}
		])");
		return mdhealth::make_registry(providers, clients);
	}

	json titled(bool with_title, const char* rtype="Dataset") {
		json attrs{{"types", {{"resourceTypeGeneral", rtype}}}};
		if(with_title)
			attrs["titles"]=json::array({{{"title", "A title"}}});
		return attrs;
	}

}

TEST(Aggregator, EndToEnd) {
	mdhealth_test::temp_dir dir{"aggr"};
	mdhealth_test::write_jsonl_gz(dir.path()/"a.jsonl.gz", {
		make_item("10.1/1", "findable", "p.x", "p", titled(true)),
		make_item("10.1/2", "findable", "p.x", "p", titled(true, "Text")),
		make_item("10.1/3", "findable", "p.x", "p", titled(false)),
	});
	std::filesystem::create_directories(dir.path()/"sub");
	mdhealth_test::write_jsonl_gz(dir.path()/"sub"/"b.jsonl.gz", {
		make_item("10.1/4", "findable", "p.x", "p", titled(true)),
		make_item("10.1/5", "findable", "p.x", "p", titled(false)),
		make_item("10.1/6", "draft", "p.x", "p", titled(true)),
	});

	auto& sch=mdhealth::schema::instance();
	auto files=mdhealth::discover_files(dir.path());
	ASSERT_EQ(files.size(), 2u);

	mdhealth::aggregator aggr{sch, sample_registry()};
	aggr.run(files, 2);
	EXPECT_EQ(aggr.records(), 5u);
	EXPECT_EQ(aggr.files_failed(), 0u);
	aggr.finalize();

	auto& clients=aggr.clients();
	ASSERT_EQ(clients.count("p.x"), 1u);
	EXPECT_EQ(clients.count("p.y"), 0u);
	auto& x=clients.at("p.x");
	EXPECT_EQ(x.type, "clients");
	EXPECT_EQ(x.relationships.at("provider"), "p");
	EXPECT_EQ(x.stats.summary.record_count, 5u);
	EXPECT_EQ(x.stats.summary.fields.at("titles").count, 3u);
	EXPECT_DOUBLE_EQ(x.stats.summary.fields.at("titles").completeness, 0.6);
	EXPECT_EQ(x.stats.by_resource_type.size(), 2u);
	EXPECT_EQ(x.stats.by_resource_type.at("Dataset").record_count, 4u);
	EXPECT_EQ(x.stats.by_resource_type.at("Text").record_count, 1u);

	auto& providers=aggr.providers();
	EXPECT_EQ(providers.count("q"), 0u);
	auto& p=providers.at("p");
	EXPECT_EQ(p.stats.summary.record_count, 5u);
	EXPECT_EQ(p.relationships.at("clients"), json::array({"p.x", "p.y"}));
	EXPECT_EQ(p.attributes.at("symbol"), "P");

	auto& all_p=providers.at("aggregate");
	EXPECT_EQ(all_p.attributes.at("symbol"), "AGGREGATE");
	EXPECT_EQ(all_p.relationships.at("clients"), json::array({"aggregate.all"}));
	EXPECT_EQ(all_p.stats.summary.record_count, 5u);
	auto& all_c=clients.at("aggregate.all");
	EXPECT_EQ(all_c.attributes.at("name"), "All DataCite Repositories (All Clients Aggregated)");
	EXPECT_EQ(all_c.stats, x.stats);
}

TEST(Aggregator, FailedFileContributesNothing) {
	mdhealth_test::temp_dir dir{"aggr-bad"};
	mdhealth_test::write_jsonl_gz(dir.path()/"a.jsonl.gz", {
		make_item("10.1/1", "findable", "p.x", "p", titled(true)),
	});
	{
		std::ofstream fs{dir.path()/"b.jsonl.gz"};
		fs<<"this is not gzip data\n";
	}

	mdhealth::aggregator aggr{mdhealth::schema::instance(), sample_registry()};
	aggr.run(mdhealth::discover_files(dir.path()), 1);
	EXPECT_EQ(aggr.files_failed(), 1u);
	aggr.finalize();
	EXPECT_EQ(aggr.clients().at("p.x").stats.summary.record_count, 1u);
}

TEST(Aggregator, ProcessStreamSkipsUnusableRecords) {
	std::ostringstream oss;
	oss<<make_item("10.1/1", "findable", "p.x", "p").dump()<<'\n';
	oss<<make_item("10.1/2", "registered", "p.x", "p").dump()<<'\n';
	oss<<make_item("10.1/3", "findable", "", "").dump()<<'\n';
	oss<<"\n";
	oss<<"{broken\n";
	oss<<"[1, 2, 3]\n";
	oss<<make_item("10.1/4", "findable", "z.z", "").dump()<<'\n';
	std::istringstream iss{oss.str()};

	auto res=mdhealth::process_stream(iss, mdhealth::schema::instance(), "test");
	EXPECT_EQ(res.records, 2u);
	EXPECT_EQ(res.skipped, 2u);
	EXPECT_EQ(res.bad_lines, 1u);
	EXPECT_EQ(res.bad_records, 1u);
	EXPECT_EQ(res.clients.size(), 2u);
	EXPECT_EQ(res.providers.size(), 1u);
	EXPECT_EQ(res.clients.at("z.z").summary.record_count, 1u);
	// partials only hold resource types that were seen
	EXPECT_TRUE(res.clients.at("p.x").by_resource_type.empty());
}

TEST(Aggregator, UnknownIdsAreDropped) {
	auto& sch=mdhealth::schema::instance();
	mdhealth::aggregator aggr{sch, sample_registry()};
	mdhealth::file_partials partials{};
	partials.clients.emplace("nobody", mdhealth::entity_stats{mdhealth::create_empty_tree(sch), {}});
	partials.clients.at("nobody").summary.record_count=3;
	aggr.reduce(std::move(partials));
	aggr.finalize();
	EXPECT_TRUE(aggr.clients().empty());
	EXPECT_TRUE(aggr.providers().empty());
}
