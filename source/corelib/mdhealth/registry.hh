/* mdhealth/registry.hh
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
#ifndef _MDHEALTH_INCLUDE_REGISTRY_HH_
#define _MDHEALTH_INCLUDE_REGISTRY_HH_

#include "mdhealth/config.hh"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>


namespace mdhealth {

	struct registry_entry {
		std::string id;
		nlohmann::json attributes;
		/*! clients only */
		std::string provider_id;
		/*! providers only, in registry order */
		std::vector<std::string> client_ids;
	};

	struct registry_listing {
		std::map<std::string, registry_entry, std::less<>> providers;
		std::map<std::string, registry_entry, std::less<>> clients;
	};

	/*! builds the entity table from the provider and client arrays
	 * of the registry (JSON:API resources). entries without an id are
	 * ignored.
	 */
	MDHEALTH_CORE_DECL registry_listing make_registry(const nlohmann::json& providers, const nlohmann::json& clients);

	/*! lists the registry endpoints, page by page, through libcurl.
	 * with a cache directory, `<cache>/<endpoint>.json' is used when it
	 * exists and written after a fetch.
	 */
	class MDHEALTH_CORE_DECL registry_client {
		public:
			struct Args {
				std::string base_url{"https://api.datacite.org"};
				std::filesystem::path cache_dir{};
				unsigned int timeout{300};
				unsigned int page_size{1000};
			};

			explicit registry_client(Args&& args);
			~registry_client() { }
			registry_client(const registry_client&) =delete;
			registry_client& operator=(const registry_client&) =delete;

			nlohmann::json list_providers() { return list("providers"); }
			nlohmann::json list_clients() { return list("clients"); }
			registry_listing fetch() {
				auto providers=list_providers();
				auto clients=list_clients();
				return make_registry(providers, clients);
			}

		private:
			Args _args;

			nlohmann::json list(std::string_view endpoint);
			nlohmann::json download(std::string_view endpoint);
			std::string get(const std::string& url);
	};

}

#endif
