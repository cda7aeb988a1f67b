#include "mdhealth/aggregator.hh"

#include "mdhealth/jsonl-input.hh"
#include "mdhealth/merger.hh"
#include "mdhealth/record.hh"
#include "mdhealth/updater.hh"
#include "mdhealth/utility.hh"

#include <fstream>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>

namespace ba=boost::asio;


namespace {

	/*! partial trees start with the summary only, resource types are
	 * added by the updater when a record of that type shows up.
	 */
	mdhealth::entity_stats& partial_for(std::map<std::string, mdhealth::entity_stats, std::less<>>& map, std::string_view id, const mdhealth::schema& sch) {
		auto it=map.find(id);
		if(it==map.end())
			it=map.emplace(std::string{id}, mdhealth::entity_stats{mdhealth::create_empty_tree(sch), {}}).first;
		return it->second;
	}

	template<typename Partials>
	std::size_t merge_partials(mdhealth::entity_map& ents, Partials& partials) {
		std::size_t unknown{0};
		for(auto& [id, stats]: partials) {
			auto it=ents.find(id);
			if(it==ents.end()) {
				mdhealth::print("unknown id: ", id);
				++unknown;
				continue;
			}
			mdhealth::merge_into(it->second.stats, stats);
		}
		return unknown;
	}

	void prune(mdhealth::entity_map& ents) {
		for(auto it=ents.begin(); it!=ents.end();) {
			if(it->second.stats.summary.record_count==0)
				it=ents.erase(it);
			else
				++it;
		}
	}

	mdhealth::entity_stats merge_all(const mdhealth::entity_map& ents, const mdhealth::schema& sch) {
		mdhealth::entity_stats all{mdhealth::create_empty_tree(sch), {}};
		for(auto& [id, ent]: ents)
			mdhealth::merge_into(all, ent.stats);
		return all;
	}

}

mdhealth::file_partials mdhealth::process_stream(std::istream& str, const schema& sch, std::string_view name) {
	file_partials res{};
	record_updater updater{sch};
	jsonl_input input{str};
	while(input.read()) {
		try {
			record rec{input.value(), sch};
			if(!rec.findable()) {
				++res.skipped;
				continue;
			}
			auto cid=rec.client_id();
			auto pid=rec.provider_id();
			if(cid.empty() && pid.empty()) {
				print_warning(name, ':', input.line_no(), ": record ", rec.id(), " has no client or provider");
				++res.skipped;
				continue;
			}
			if(!cid.empty())
				updater.update(partial_for(res.clients, cid, sch), rec);
			if(!pid.empty())
				updater.update(partial_for(res.providers, pid, sch), rec);
			++res.records;
		} catch(const std::exception& e) {
			print_warning(name, ':', input.line_no(), ": ", e.what());
			++res.bad_records;
		}
	}
	if(!input.eof())
		report("failed to read ", name, " after line ", input.line_no());
	res.bad_lines=input.bad_lines();
	return res;
}

mdhealth::file_partials mdhealth::process_file(const std::filesystem::path& path, const schema& sch) {
	std::ifstream fs{path, std::ios::binary};
	if(!fs)
		report("failed to open ", path);
	boost::iostreams::filtering_istream filter{};
	if(is_gzip_file(path))
		filter.push(boost::iostreams::gzip_decompressor{});
	filter.push(fs);
	return process_stream(filter, sch, path.string());
}

mdhealth::aggregator::aggregator(const schema& sch, const registry_listing& reg):
	_schema{sch}, _providers{}, _clients{}, _files_failed{0},
	_records{0}, _skipped{0}, _bad_lines{0}, _bad_records{0}
{
	for(auto& [id, ent]: reg.providers) {
		entity e{id, "providers", ent.attributes,
			nlohmann::json{{"clients", ent.client_ids}},
			entity_stats{create_empty_tree(sch), {}}};
		_providers.emplace(id, std::move(e));
	}
	for(auto& [id, ent]: reg.clients) {
		nlohmann::json prov=nullptr;
		if(!ent.provider_id.empty())
			prov=ent.provider_id;
		entity e{id, "clients", ent.attributes,
			nlohmann::json{{"provider", std::move(prov)}},
			entity_stats{create_empty_tree(sch), {}}};
		_clients.emplace(id, std::move(e));
	}
}

void mdhealth::aggregator::reduce(file_partials&& partials) {
	auto n=merge_partials(_clients, partials.clients);
	n+=merge_partials(_providers, partials.providers);
	if(n>0)
		print_warning(n, " partial results for ids unknown to the registry dropped");
	_records+=partials.records;
	_skipped+=partials.skipped;
	_bad_lines+=partials.bad_lines;
	_bad_records+=partials.bad_records;
}

void mdhealth::aggregator::run(const std::vector<std::filesystem::path>& files, unsigned int jobs) {
	if(jobs<1)
		jobs=1;
	print_info("Processing ", files.size(), " files with ", jobs, " workers");

	ba::thread_pool pool{jobs};
	ba::strand<ba::thread_pool::executor_type> reducer{pool.get_executor()};
	std::size_t done{0};
	auto total=files.size();
	for(auto& path: files) {
		ba::post(pool, [this,&path,&reducer,&done,total]() {
			file_partials partials{};
			bool failed{false};
			try {
				partials=process_file(path, _schema);
			} catch(const std::exception& e) {
				print_error("failed to process ", path, ": ", e.what());
				failed=true;
			}
			ba::post(reducer, [this,&path,&done,total,failed,partials=std::move(partials)]() mutable {
				if(failed) {
					++_files_failed;
				} else {
					try {
						reduce(std::move(partials));
					} catch(const std::exception& e) {
						print_error("failed to merge results of ", path, ": ", e.what());
						++_files_failed;
					}
				}
				++done;
				print_info("Completed ", done, '/', total, " files (", path.filename(), ')');
			});
		});
	}
	pool.join();

	print_info(_records, " records processed, ", _skipped, " skipped, ",
			_bad_records, " bad records, ", _bad_lines, " bad lines, ",
			_files_failed, " files failed");
}

void mdhealth::aggregator::finalize() {
	print_info("Filtering active providers and clients");
	prune(_providers);
	prune(_clients);

	print_info("Creating aggregate entries");
	auto all_providers=merge_all(_providers, _schema);
	auto all_clients=merge_all(_clients, _schema);
	if(all_providers.summary.record_count>0) {
		entity e{std::string{aggregate_provider_id}, "providers",
			nlohmann::json{{"symbol", "AGGREGATE"},
				{"name", "All DataCite Organizations (All Providers Aggregated)"}},
			nlohmann::json{{"clients", nlohmann::json::array({std::string{aggregate_client_id}})}},
			std::move(all_providers)};
		_providers.insert_or_assign(std::string{aggregate_provider_id}, std::move(e));
	}
	if(all_clients.summary.record_count>0) {
		entity e{std::string{aggregate_client_id}, "clients",
			nlohmann::json{{"symbol", "AGGREGATE.ALL"},
				{"name", "All DataCite Repositories (All Clients Aggregated)"}},
			nlohmann::json{{"provider", nullptr}},
			std::move(all_clients)};
		_clients.insert_or_assign(std::string{aggregate_client_id}, std::move(e));
	}

	print_info("Cleaning resource types");
	for(auto& [id, ent]: _providers)
		mdhealth::finalize(ent.stats);
	for(auto& [id, ent]: _clients)
		mdhealth::finalize(ent.stats);
}
