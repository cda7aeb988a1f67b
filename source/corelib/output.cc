#include "mdhealth/output.hh"

#include "mdhealth/exception.hh"
#include "mdhealth/utility.hh"

#include <array>
#include <fstream>


void mdhealth::to_json(nlohmann::json& j, const subfield_stats& s) {
	j=nlohmann::json{
		{"count", s.count},
		{"instances", s.instances},
		{"missing", s.missing},
		{"completeness", s.completeness},
	};
	if(s.values)
		j["values"]=*s.values;
}

void mdhealth::to_json(nlohmann::json& j, const field_stats& s) {
	j=nlohmann::json{
		{"count", s.count},
		{"instances", s.instances},
		{"fieldStatus", to_string(s.status)},
		{"completeness", s.completeness},
		{"missing", s.missing},
	};
	if(!s.subfields.empty())
		j["subfields"]=s.subfields;
}

void mdhealth::to_json(nlohmann::json& j, const category_metrics& s) {
	j=nlohmann::json{
		{"mandatory", {{"completeness", s.mandatory}}},
		{"recommended", {{"completeness", s.recommended}}},
		{"optional", {{"completeness", s.optional}}},
	};
}

void mdhealth::to_json(nlohmann::json& j, const stats_tree& s) {
	j=nlohmann::json{
		{"count", s.record_count},
		{"fields", s.fields},
		{"categories", s.categories},
	};
}

void mdhealth::to_json(nlohmann::json& j, const entity_stats& s) {
	j=nlohmann::json{
		{"summary", s.summary},
		{"byResourceType", {{"resourceTypes", s.by_resource_type}}},
	};
}

nlohmann::json mdhealth::split_entities(const entity_map& ents, bool keep_stats) {
	auto res=nlohmann::json::array();
	for(auto& [id, ent]: ents) {
		if(keep_stats) {
			res.push_back({{"id", ent.id}, {"stats", ent.stats}});
		} else {
			res.push_back({
					{"id", ent.id},
					{"type", ent.type},
					{"attributes", ent.attributes},
					{"relationships", ent.relationships},
					});
		}
	}
	return res;
}

bool mdhealth::validate_entities(const nlohmann::json& data, bool keep_stats) {
	static const std::array<const char*, 4> attr_keys{"id", "type", "attributes", "relationships"};
	static const std::array<const char*, 2> stats_keys{"id", "stats"};
	auto check=[&data](const auto& keys) {
		for(auto& item: data) {
			if(!item.is_object())
				return false;
			for(auto k: keys) {
				if(!item.contains(k)) {
					print_error("item missing required key `", k, "'");
					return false;
				}
			}
		}
		return true;
	};
	if(!data.is_array())
		return false;
	return keep_stats?check(stats_keys):check(attr_keys);
}

void mdhealth::output_writer::write(const entity_map& providers, const entity_map& clients) {
	struct output_file {
		const char* name;
		nlohmann::json data;
		bool keep_stats;
		std::filesystem::path tmp;
		std::filesystem::path bak;
		bool installed;
	};
	std::array<output_file, 4> files{{
		{"providers_attributes.json", split_entities(providers, false), false, {}, {}, false},
		{"providers_stats.json", split_entities(providers, true), true, {}, {}, false},
		{"clients_attributes.json", split_entities(clients, false), false, {}, {}, false},
		{"clients_stats.json", split_entities(clients, true), true, {}, {}, false},
	}};
	for(auto& f: files) {
		if(!validate_entities(f.data, f.keep_stats))
			throw reported_error{str_glue{"validation failed for ", f.name}.str()};
	}

	std::error_code ec;
	std::filesystem::create_directories(_dir, ec);
	if(ec)
		throw reported_error{str_glue{"failed to create ", _dir, ": ", ec.message()}.str()};

	// restores the previous documents, so the set stays old or new as a whole
	auto rollback=[this,&files]() {
		std::error_code ec;
		for(auto& f: files) {
			if(!f.tmp.empty())
				std::filesystem::remove(f.tmp, ec);
			auto path=_dir/f.name;
			if(!f.bak.empty()) {
				std::filesystem::rename(f.bak, path, ec);
				if(ec)
					print_error("failed to restore ", path, " from ", f.bak, ": ", ec.message());
			} else if(f.installed) {
				std::filesystem::remove(path, ec);
			}
		}
	};
	bool committed{false};
	scope_exit(&, if(!committed) rollback());

	auto timestamp=iso_timestamp();
	for(auto& f: files) {
		f.tmp=_dir/(std::string{f.name}+".tmp");
		auto total=f.data.size();
		nlohmann::json doc{
			{"data", std::move(f.data)},
			{"meta", {{"total", total}, {"timestamp", timestamp}}},
		};
		std::ofstream fs{f.tmp};
		fs<<doc.dump(2)<<'\n';
		fs.close();
		if(!fs)
			throw reported_error{str_glue{"failed to write ", f.tmp}.str()};
	}
	for(auto& f: files) {
		auto path=_dir/f.name;
		if(std::filesystem::exists(path, ec)) {
			auto bak=_dir/(std::string{f.name}+".bak");
			std::filesystem::rename(path, bak, ec);
			if(ec)
				throw reported_error{str_glue{"failed to rename ", path, " to ", bak, ": ", ec.message()}.str()};
			f.bak=std::move(bak);
		}
		std::filesystem::rename(f.tmp, path, ec);
		if(ec)
			throw reported_error{str_glue{"failed to rename ", f.tmp, " to ", path, ": ", ec.message()}.str()};
		f.tmp.clear();
		f.installed=true;
	}
	committed=true;
	for(auto& f: files) {
		if(!f.bak.empty())
			std::filesystem::remove(f.bak, ec);
		print_info("Wrote ", _dir/f.name);
	}
}
