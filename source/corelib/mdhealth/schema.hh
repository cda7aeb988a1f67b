/* mdhealth/schema.hh
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
#ifndef _MDHEALTH_INCLUDE_SCHEMA_HH_
#define _MDHEALTH_INCLUDE_SCHEMA_HH_

#include "mdhealth/config.hh"

#include <string>
#include <string_view>
#include <vector>
#include <cstddef>

#include <nlohmann/json.hpp>


namespace mdhealth {

	enum class field_status {
		mandatory=0,
		recommended,
		optional,
	};
	constexpr std::size_t num_field_status{3};
	MDHEALTH_CORE_DECL const char* to_string(field_status st) noexcept;

	/*! what a present value must look like, checked before counting */
	enum class field_shape {
		any,
		list,
		object,
	};

	/*! false for null, false, 0, "", [] and {} */
	MDHEALTH_CORE_DECL bool is_present(const nlohmann::json& v) noexcept;
	/*! nullptr if obj is not an object or has no such key */
	MDHEALTH_CORE_DECL const nlohmann::json* member(const nlohmann::json& obj, std::string_view key) noexcept;

	struct subfield_spec;
	/*! appends one entry per observation of the subfield within one
	 * occurrence; the entry is the categorical value, or empty.
	 */
	using subfield_extractor=void (*)(const subfield_spec& spec, const nlohmann::json& occurrence, std::vector<std::string_view>& out);

	struct MDHEALTH_CORE_DECL subfield_spec {
		std::string name;
		/*! permitted values; empty for presence-only subfields */
		std::vector<std::string> values;
		bool has_other;
		subfield_extractor extract;

		/*! extractor looked up by name, plain key lookup otherwise */
		explicit subfield_spec(std::string n, std::vector<std::string> vals={});

		bool enumerated() const noexcept { return !values.empty(); }
		/*! the value counter to bump, or nullptr if the value is dropped */
		const std::string* classify(std::string_view v) const noexcept;

		static const std::string other;
	};

	struct field_spec {
		std::string name;
		/*! key in the record attributes */
		std::string source;
		field_status status;
		field_shape shape{field_shape::any};
		/*! each list element is an occurrence (otherwise the value is one) */
		bool repeatable{false};
		std::vector<subfield_spec> subfields{};

		bool has_subfields() const noexcept { return !subfields.empty(); }
	};

	class MDHEALTH_CORE_DECL schema {
		public:
			/*! routing_field/routing_key select the resource type of a
			 * record, resource types are the permitted values of that
			 * subfield. empty routing_field disables routing.
			 * a value outside resource_types() is routed nowhere, even
			 * though the summary counts it under "Other"; per-type
			 * record counts may then add up to less than the summary.
			 */
			schema(std::vector<field_spec>&& fields, std::string routing_field, std::string routing_key);
			~schema() { }
			schema(const schema&) =delete;
			schema& operator=(const schema&) =delete;

			/*! the DataCite metadata taxonomy */
			static const schema& instance();

			const std::vector<field_spec>& fields() const noexcept { return _fields; }
			const std::vector<std::string>& resource_types() const noexcept { return _resource_types; }
			bool is_resource_type(std::string_view v) const noexcept;
			std::size_t num_fields(field_status st) const noexcept {
				return _num_fields[static_cast<std::size_t>(st)];
			}
			/*! index in fields(), or SIZE_MAX */
			std::size_t routing_field() const noexcept { return _routing_idx; }
			const std::string& routing_key() const noexcept { return _routing_key; }

		private:
			std::vector<field_spec> _fields;
			std::vector<std::string> _resource_types;
			std::size_t _num_fields[num_field_status];
			std::size_t _routing_idx;
			std::string _routing_key;
	};

}

#endif
