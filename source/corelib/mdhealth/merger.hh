/* mdhealth/merger.hh
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
#ifndef _MDHEALTH_INCLUDE_MERGER_HH_
#define _MDHEALTH_INCLUDE_MERGER_HH_

#include "mdhealth/config.hh"
#include "mdhealth/stats.hh"


namespace mdhealth {

	/*! adds the counts of b to a over the union of fields, subfields
	 * and values, then refreshes the derived values of a.
	 */
	MDHEALTH_CORE_DECL void merge_into(stats_tree& a, const stats_tree& b);
	/*! merges summary and each resource type, types missing on one
	 * side are merged with an empty tree.
	 */
	MDHEALTH_CORE_DECL void merge_into(entity_stats& a, const entity_stats& b);

	inline stats_tree merge_trees(const stats_tree& a, const stats_tree& b) {
		stats_tree r{a};
		merge_into(r, b);
		return r;
	}
	inline entity_stats merge_entity_trees(const entity_stats& a, const entity_stats& b) {
		entity_stats r{a};
		merge_into(r, b);
		return r;
	}

}

#endif
