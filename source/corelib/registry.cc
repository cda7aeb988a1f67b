#include "mdhealth/registry.hh"

#include "mdhealth/utility.hh"

#include <fstream>

#include "curl-wrappers.hh"


namespace {

	class curl_easy_category: public std::error_category {
		public:
			constexpr curl_easy_category() noexcept =default;
			~curl_easy_category() override =default;

			const char* name() const noexcept override {
				return "curl_easy";
			}
			std::string message(int i) const override {
				auto m=::curl_easy_strerror(static_cast<CURLcode>(i));
				return m?m:"Unknown error";
			}

			std::error_condition default_error_condition(int i) const noexcept override {
				std::errc e;
				switch(i) {
					default:
						return std::error_condition{i, *this};
					case CURLE_OK:
						return std::error_condition{};
					case CURLE_UNSUPPORTED_PROTOCOL:
						e=std::errc::protocol_not_supported; break;
					case CURLE_OUT_OF_MEMORY:
						e=std::errc::not_enough_memory; break;
					case CURLE_AGAIN:
						e=std::errc::resource_unavailable_try_again; break;
					case CURLE_OPERATION_TIMEDOUT:
						e=std::errc::timed_out; break;
					case CURLE_NOT_BUILT_IN:
						e=std::errc::operation_not_supported; break;
					case CURLE_LOGIN_DENIED:
						e=std::errc::permission_denied; break;
				}
				return std::make_error_condition(e);
			}
	};
	template<typename> struct curl_category_instances {
		static const curl_easy_category easy;
	};
	template<typename T>
		const curl_easy_category curl_category_instances<T>::easy{};

	struct curl_global {
		curl_global() {
			auto r=curl_global_init(CURL_GLOBAL_DEFAULT);
			if(r!=0)
				throw std::system_error{make_error_code(r)};
		}
		~curl_global() {
			curl_global_cleanup();
		}
	};

	size_t writefn(char* ptr, size_t size, size_t nmemb, void* userdata) {
		static_cast<std::string*>(userdata)->append(ptr, size*nmemb);
		return size*nmemb;
	}

	inline std::string string_of(const nlohmann::json& v) {
		if(v.is_string())
			return v.get<std::string>();
		return {};
	}

	/*! relationships.provider.data.id */
	std::string provider_of(const nlohmann::json& client) {
		auto rels=client.find("relationships");
		if(rels==client.end() || !rels->is_object())
			return {};
		auto prov=rels->find("provider");
		if(prov==rels->end() || !prov->is_object())
			return {};
		auto data=prov->find("data");
		if(data==prov->end() || !data->is_object())
			return {};
		auto id=data->find("id");
		if(id==data->end())
			return {};
		return string_of(*id);
	}

}

const std::error_category& mdhealth::curl_errc::_the_cat{curl_category_instances<void>::easy};

mdhealth::registry_listing mdhealth::make_registry(const nlohmann::json& providers, const nlohmann::json& clients) {
	registry_listing res{};
	auto attributes_of=[](const nlohmann::json& item) ->nlohmann::json {
		auto attrs=item.find("attributes");
		if(attrs==item.end() || !attrs->is_object())
			return nlohmann::json::object();
		return *attrs;
	};
	auto id_of=[](const nlohmann::json& item) ->std::string {
		if(!item.is_object())
			return {};
		auto id=item.find("id");
		if(id==item.end())
			return {};
		return string_of(*id);
	};

	if(!providers.is_array() || !clients.is_array())
		report("registry listing is not an array");
	for(auto& item: providers) {
		auto id=id_of(item);
		if(id.empty())
			continue;
		registry_entry ent{id, attributes_of(item), {}, {}};
		res.providers.insert_or_assign(std::move(id), std::move(ent));
	}
	for(auto& item: clients) {
		auto id=id_of(item);
		if(id.empty())
			continue;
		registry_entry ent{id, attributes_of(item), provider_of(item), {}};
		if(!ent.provider_id.empty()) {
			if(auto it=res.providers.find(ent.provider_id); it!=res.providers.end())
				it->second.client_ids.push_back(id);
		}
		res.clients.insert_or_assign(std::move(id), std::move(ent));
	}
	return res;
}

mdhealth::registry_client::registry_client(Args&& args):
	_args{std::move(args)}
{
	while(!_args.base_url.empty() && _args.base_url.back()=='/')
		_args.base_url.pop_back();
	if(_args.page_size==0)
		_args.page_size=1000;
	if(!_args.cache_dir.empty())
		std::filesystem::create_directories(_args.cache_dir);
}

nlohmann::json mdhealth::registry_client::list(std::string_view endpoint) {
	std::filesystem::path cache_file{};
	if(!_args.cache_dir.empty()) {
		cache_file=_args.cache_dir/(std::string{endpoint}+".json");
		if(std::filesystem::exists(cache_file)) {
			print_info("Loading cached ", endpoint, " data");
			std::ifstream fs{cache_file};
			auto v=nlohmann::json::parse(fs, nullptr, false);
			if(!v.is_discarded() && v.is_array())
				return v;
			print_warning("ignoring unusable cache file ", cache_file);
		}
	}

	auto items=download(endpoint);

	if(!cache_file.empty()) {
		std::ofstream fs{cache_file};
		fs<<items;
		fs.close();
		if(!fs)
			print_warning("failed to write cache file ", cache_file);
	}
	return items;
}

nlohmann::json mdhealth::registry_client::download(std::string_view endpoint) {
	print_info("Fetching ", endpoint, " data from ", _args.base_url);
	auto items=nlohmann::json::array();
	uint64_t page{1}, total_pages{1};
	while(page<=total_pages) {
		str_glue url{_args.base_url, '/', endpoint, "?page%5Bsize%5D=", _args.page_size, "&page%5Bnumber%5D=", page};
		auto body=get(url.str());
		auto data=nlohmann::json::parse(body);
		if(auto d=data.find("data"); d!=data.end() && d->is_array()) {
			for(auto& item: *d)
				items.push_back(std::move(item));
		}
		uint64_t total{0};
		if(auto meta=data.find("meta"); meta!=data.end() && meta->is_object()) {
			total_pages=meta->value("totalPages", uint64_t{1});
			total=meta->value("total", uint64_t{0});
		} else {
			total_pages=1;
		}
		print_info("Fetched page ", page, " of ", total_pages, " for ", endpoint,
				" (", items.size(), '/', total, " items)");
		++page;
	}
	return items;
}

std::string mdhealth::registry_client::get(const std::string& url) {
	static curl_global global{};

	std::string buf{};
	curl_easy curl{};
	curl_slist hdrs{};
	hdrs.append("Accept: application/vnd.api+json");
	curl.setopt(CURLOPT_URL, url.c_str());
	curl.setopt(CURLOPT_HTTPHEADER, hdrs.lower());
	curl.setopt(CURLOPT_FOLLOWLOCATION, long{1});
	curl.setopt(CURLOPT_TIMEOUT, static_cast<long>(_args.timeout));
	curl.setopt(CURLOPT_WRITEFUNCTION, writefn);
	curl.setopt(CURLOPT_WRITEDATA, &buf);
	print("GET ", url);
	curl.perform();
	if(auto code=curl.response_code(); code!=200)
		report("API request failed: ", code, " (", url, ')');
	return buf;
}
