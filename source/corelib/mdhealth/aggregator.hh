/* mdhealth/aggregator.hh
 *
 * Copyright (C) 2021 GOU Lingfeng
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

//@@@@@
#ifndef _MDHEALTH_INCLUDE_AGGREGATOR_HH_
#define _MDHEALTH_INCLUDE_AGGREGATOR_HH_

#include "mdhealth/config.hh"
#include "mdhealth/stats.hh"
#include "mdhealth/registry.hh"

#include <filesystem>
#include <istream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>


namespace mdhealth {

	constexpr std::string_view aggregate_provider_id{"aggregate"};
	constexpr std::string_view aggregate_client_id{"aggregate.all"};

	struct entity {
		std::string id;
		/*! "providers" or "clients" */
		std::string type;
		nlohmann::json attributes;
		nlohmann::json relationships;
		entity_stats stats;
	};
	using entity_map=std::map<std::string, entity, std::less<>>;

	/*! what one input file contributes, owned by the worker that read it */
	struct file_partials {
		std::map<std::string, entity_stats, std::less<>> clients{};
		std::map<std::string, entity_stats, std::less<>> providers{};
		std::size_t records{0};
		/*! not findable, or without client and provider */
		std::size_t skipped{0};
		std::size_t bad_lines{0};
		std::size_t bad_records{0};
	};

	/*! folds the findable records of one JSONL stream.
	 * records that cannot be used are logged and skipped; a stream
	 * that fails before its end throws.
	 */
	MDHEALTH_CORE_DECL file_partials process_stream(std::istream& str, const schema& sch, std::string_view name);
	/*! process_stream() on a file, gunzipped when it ends in .gz */
	MDHEALTH_CORE_DECL file_partials process_file(const std::filesystem::path& path, const schema& sch);

	class MDHEALTH_CORE_DECL aggregator {
		public:
			/*! one entity per provider and client known to the registry */
			aggregator(const schema& sch, const registry_listing& reg);
			~aggregator() { }
			aggregator(const aggregator&) =delete;
			aggregator& operator=(const aggregator&) =delete;

			/*! merges partial results, ids unknown to the registry are
			 * dropped.
			 */
			void reduce(file_partials&& partials);
			/*! processes files on `jobs' threads, reducing on a single
			 * strand as results arrive. a file that fails is logged and
			 * contributes nothing.
			 */
			void run(const std::vector<std::filesystem::path>& files, unsigned int jobs);
			/*! drops entities without records, adds the aggregate
			 * provider and client, prunes and rounds all stats.
			 */
			void finalize();

			const entity_map& providers() const noexcept { return _providers; }
			const entity_map& clients() const noexcept { return _clients; }
			std::size_t files_failed() const noexcept { return _files_failed; }
			std::size_t records() const noexcept { return _records; }

		private:
			const schema& _schema;
			entity_map _providers;
			entity_map _clients;
			std::size_t _files_failed;
			std::size_t _records;
			std::size_t _skipped;
			std::size_t _bad_lines;
			std::size_t _bad_records;
	};

}

#endif
