/* mdhealth/output.hh
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
#ifndef _MDHEALTH_INCLUDE_OUTPUT_HH_
#define _MDHEALTH_INCLUDE_OUTPUT_HH_

#include "mdhealth/config.hh"
#include "mdhealth/aggregator.hh"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>


namespace mdhealth {

	MDHEALTH_CORE_DECL void to_json(nlohmann::json& j, const subfield_stats& s);
	MDHEALTH_CORE_DECL void to_json(nlohmann::json& j, const field_stats& s);
	MDHEALTH_CORE_DECL void to_json(nlohmann::json& j, const category_metrics& s);
	MDHEALTH_CORE_DECL void to_json(nlohmann::json& j, const stats_tree& s);
	/*! {summary, byResourceType: {resourceTypes}} */
	MDHEALTH_CORE_DECL void to_json(nlohmann::json& j, const entity_stats& s);

	/*! attribute documents: {id, type, attributes, relationships};
	 * stats documents: {id, stats}.
	 */
	MDHEALTH_CORE_DECL nlohmann::json split_entities(const entity_map& ents, bool keep_stats);
	/*! every item is an object carrying the required keys */
	MDHEALTH_CORE_DECL bool validate_entities(const nlohmann::json& data, bool keep_stats);

	/*! writes providers_attributes.json, providers_stats.json,
	 * clients_attributes.json and clients_stats.json, each
	 * {data, meta: {total, timestamp}}.
	 * nothing is renamed into place unless all four were written,
	 * and a failed rename restores the documents already replaced.
	 */
	class MDHEALTH_CORE_DECL output_writer {
		public:
			explicit output_writer(const std::filesystem::path& dir): _dir{dir} { }
			~output_writer() { }
			output_writer(const output_writer&) =delete;
			output_writer& operator=(const output_writer&) =delete;

			/*! throws reported_error on failure */
			void write(const entity_map& providers, const entity_map& clients);

		private:
			std::filesystem::path _dir;
	};

}

#endif
