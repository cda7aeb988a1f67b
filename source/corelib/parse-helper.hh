#include "mdhealth/utility.hh"
#include "mdhealth/exception.hh"

#include <functional>

using config_callback=std::pair<const std::string, std::function<bool(std::string&&)>>;

/*! the callbacks return true once the option has a value; a value
 * already given on the command line is kept.
 */
inline config_callback string_cfg(const std::string& key, std::string& str) {
	return {key, [&str](std::string&& val) ->bool {
		if(!val.empty()) {
			str=std::move(val);
		}
		return !str.empty();
	}};
}
inline config_callback path_cfg(const std::string& key, std::filesystem::path& path) {
	return {key, [&path](std::string&& val) ->bool {
		if(!val.empty()) {
			path=std::move(val);
		}
		return !path.empty();
	}};
}
inline config_callback uint_cfg(const std::string& key, unsigned int& v) {
	return {key, [&v,key](std::string&& val) ->bool {
		if(!val.empty()) {
			v=mdhealth::parse_uint(val.data(), val.size(), key.c_str());
		}
		return v!=0;
	}};
}

static void load_configs(const std::filesystem::path& cfg_file, std::initializer_list<config_callback> cfgs) {
	if(cfg_file.empty())
		return;
	try {
		auto cfg=mdhealth::load_config(cfg_file);
		for(auto& [key, cb]: cfgs) {
			if(!cb({})) {
				auto it=cfg.find(key);
				if(it!=cfg.end())
					cb(std::move(it->second));
			}
		}
	} catch(const std::exception& e) {
		mdhealth::str_glue err{"in config file: ", e.what()};
		throw mdhealth::reported_error{err.str()};
	}
}
