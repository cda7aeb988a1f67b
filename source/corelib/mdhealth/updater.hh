/* mdhealth/updater.hh
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
#ifndef _MDHEALTH_INCLUDE_UPDATER_HH_
#define _MDHEALTH_INCLUDE_UPDATER_HH_

#include "mdhealth/config.hh"
#include "mdhealth/stats.hh"

#include <string_view>
#include <vector>


namespace mdhealth {

	class record;

	/*! folds records into statistics trees.
	 * keeps scratch buffers, so one instance per thread.
	 */
	class MDHEALTH_CORE_DECL record_updater {
		public:
			explicit record_updater(const schema& sch): _schema{sch}, _obs{} { }
			~record_updater() { }
			record_updater(const record_updater&) =delete;
			record_updater& operator=(const record_updater&) =delete;

			/*! one more record in tree, derived values refreshed */
			void update(stats_tree& tree, const record& rec);
			/*! updates summary, and the tree of the record's resource
			 * type if it is a known one (created on first use).
			 */
			void update(entity_stats& stats, const record& rec);

		private:
			const schema& _schema;
			std::vector<std::string_view> _obs;

			void update_subfields(field_stats& fs, const field_spec& spec, const nlohmann::json& value);
	};

}

#endif
