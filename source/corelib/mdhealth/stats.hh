/* mdhealth/stats.hh
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
#ifndef _MDHEALTH_INCLUDE_STATS_HH_
#define _MDHEALTH_INCLUDE_STATS_HH_

#include "mdhealth/config.hh"
#include "mdhealth/schema.hh"

#include <cstdint>
#include <map>
#include <optional>
#include <string>


namespace mdhealth {

	/*! completeness is count/total, or 0 when total is 0 */
	inline double ratio(uint64_t count, uint64_t total) noexcept {
		if(total==0)
			return 0.0;
		return static_cast<double>(count)/static_cast<double>(total);
	}

	using value_counts=std::map<std::string, uint64_t, std::less<>>;

	struct subfield_stats {
		uint64_t count{0};
		uint64_t instances{0};
		uint64_t missing{0};
		double completeness{0.0};
		/*! only for enumerated subfields */
		std::optional<value_counts> values{};
	};

	struct field_stats {
		uint64_t count{0};
		uint64_t instances{0};
		uint64_t missing{0};
		double completeness{0.0};
		field_status status{field_status::optional};
		std::map<std::string, subfield_stats, std::less<>> subfields{};
	};

	struct category_metrics {
		double mandatory{0.0};
		double recommended{0.0};
		double optional{0.0};

		double& operator[](field_status st) noexcept {
			switch(st) {
				case field_status::mandatory: return mandatory;
				case field_status::recommended: return recommended;
				case field_status::optional: break;
			}
			return optional;
		}
		double operator[](field_status st) const noexcept {
			switch(st) {
				case field_status::mandatory: return mandatory;
				case field_status::recommended: return recommended;
				case field_status::optional: break;
			}
			return optional;
		}
	};

	struct stats_tree {
		uint64_t record_count{0};
		std::map<std::string, field_stats, std::less<>> fields{};
		category_metrics categories{};
	};

	struct entity_stats {
		stats_tree summary{};
		std::map<std::string, stats_tree, std::less<>> by_resource_type{};
	};

	MDHEALTH_CORE_DECL bool operator==(const subfield_stats& a, const subfield_stats& b) noexcept;
	MDHEALTH_CORE_DECL bool operator==(const field_stats& a, const field_stats& b) noexcept;
	MDHEALTH_CORE_DECL bool operator==(const category_metrics& a, const category_metrics& b) noexcept;
	MDHEALTH_CORE_DECL bool operator==(const stats_tree& a, const stats_tree& b) noexcept;
	MDHEALTH_CORE_DECL bool operator==(const entity_stats& a, const entity_stats& b) noexcept;

	/*! every field zeroed, value maps holding every permitted value at 0 */
	MDHEALTH_CORE_DECL stats_tree create_empty_tree(const schema& sch);
	/*! summary plus one empty tree per known resource type */
	MDHEALTH_CORE_DECL entity_stats create_empty_entity_stats(const schema& sch);

	/*! recomputes missing, completeness and categories from the counts.
	 * category completeness is the mean fill rate of the fields with
	 * that status: sum(count)/(record_count*num_fields).
	 */
	MDHEALTH_CORE_DECL void refresh_derived(stats_tree& tree);

	/*! drops resource types without records and zero value counters,
	 * rounds every completeness to `digits' decimals.
	 */
	MDHEALTH_CORE_DECL void finalize(entity_stats& stats, int digits=4);

}

#endif
