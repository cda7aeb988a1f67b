/* mdhealth/record.hh
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
#ifndef _MDHEALTH_INCLUDE_RECORD_HH_
#define _MDHEALTH_INCLUDE_RECORD_HH_

#include "mdhealth/config.hh"
#include "mdhealth/schema.hh"

#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>


namespace mdhealth {

	/*! normalized view of one JSON:API resource.
	 * refers into the parsed item, which must outlive the record.
	 */
	class MDHEALTH_CORE_DECL record {
		public:
			/*! throws if item is not an object.
			 * fields absent, empty, or of the wrong shape read as nullptr;
			 * a wrong shape is logged.
			 */
			record(const nlohmann::json& item, const schema& sch);
			~record() { }
			record(const record&) =delete;
			record& operator=(const record&) =delete;

			/*! value of schema field i, nullptr if not present */
			const nlohmann::json* field(std::size_t i) const noexcept {
				return _fields[i];
			}
			std::size_t num_fields() const noexcept { return _fields.size(); }
			std::size_t num_misshaped() const noexcept { return _misshaped; }

			std::string_view id() const noexcept { return _id; }
			std::string_view state() const noexcept { return _state; }
			bool findable() const noexcept { return _state=="findable"; }
			std::string_view client_id() const noexcept { return _client_id; }
			std::string_view provider_id() const noexcept { return _provider_id; }
			/*! empty if the record names no resource type */
			std::string_view resource_type() const noexcept { return _resource_type; }

		private:
			std::vector<const nlohmann::json*> _fields;
			std::size_t _misshaped;
			std::string_view _id;
			std::string_view _state;
			std::string_view _client_id;
			std::string_view _provider_id;
			std::string_view _resource_type;
	};

}

#endif
