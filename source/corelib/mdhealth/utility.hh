#ifndef _MDHEALTH_INCLUDE_UTILITY_H_
#define _MDHEALTH_INCLUDE_UTILITY_H_

#include "mdhealth/config.hh"

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <sstream>
#include <string_view>
#include <unordered_map>
#include <filesystem>

namespace mdhealth {

	namespace {

		inline void printToStream([[maybe_unused]] std::ostream& s) { }
		template<typename Arg, typename... Args> inline void printToStream(std::ostream& s, Arg&& a, Args&&... args) {
			return printToStream(s<<std::forward<Arg>(a), std::forward<Args>(args)...);
		}

		template<typename T> class scope_exit_helper {
			T _f;
			public:
			scope_exit_helper(const T& f): _f{f} { }
			~scope_exit_helper() {
				_f();
			}
		};
	}

	enum class log_level {
		debug=0,
		info,
		warning,
		error,
	};
	/*! accepts debug, info, warning (or warn), error; case-insensitive */
	MDHEALTH_CORE_DECL bool parse_log_level(std::string_view str, log_level& lvl);
	MDHEALTH_CORE_DECL void set_log_level(log_level lvl) noexcept;
	MDHEALTH_CORE_DECL bool log_enabled(log_level lvl) noexcept;

	const char* _get_thread_color();
	const char* _restore_color();
	MDHEALTH_CORE_DECL void _do_print(log_level lvl, const std::string& s);
	template<typename... Args> inline void print_level(log_level lvl, Args&&... args) {
#ifndef MDHEALTH_NO_PRINT
		if(!log_enabled(lvl))
			return;
		std::ostringstream oss;
		printToStream(oss, std::forward<Args>(args)...);
		_do_print(lvl, oss.str());
#endif
	}
	template<typename... Args> inline void print(Args&&... args) {
		print_level(log_level::debug, std::forward<Args>(args)...);
	}
	template<typename... Args> inline void print_info(Args&&... args) {
		print_level(log_level::info, std::forward<Args>(args)...);
	}
	template<typename... Args> inline void print_warning(Args&&... args) {
		print_level(log_level::warning, std::forward<Args>(args)...);
	}
	template<typename... Args> inline void print_error(Args&&... args) {
		print_level(log_level::error, std::forward<Args>(args)...);
	}

	inline void report(const std::string& msg) {
		throw std::runtime_error{msg};
	}
	inline void report(const char* msg) {
		throw std::runtime_error{msg};
	}
	template<typename... Args> inline void report(Args&&... args) {
		std::ostringstream oss;
		printToStream(oss, std::forward<Args>(args)...);
		throw std::runtime_error{oss.str()};
	}

#define MDHEALTH_PASTE__(A, B) A ## B
#define MDHEALTH_PASTE(A, B) MDHEALTH_PASTE__(A, B)
#define scope_exit(cap, proc) \
	auto MDHEALTH_PASTE(___scope_exit_temp_, __LINE__) = mdhealth::scope_exit_func([cap]() { proc; })

	template<typename T> scope_exit_helper<T> scope_exit_func(const T& f) {
		return scope_exit_helper<T>(f);
	}

	class str_glue {
		public:
			explicit str_glue(): _ss{} { }
			template<typename T, typename... Args>
				explicit str_glue(T&& v, Args&&... args): str_glue{} {
					printToStream(_ss, std::forward<T>(v), std::forward<Args>(args)...);
				}
			~str_glue() { }

			str_glue(const str_glue&) =delete;
			str_glue& operator=(const str_glue&) =delete;

			template<typename T, typename... Args>
			str_glue& operator()(T&& v, Args&&... args) {
				printToStream(_ss, std::forward<T>(v), std::forward<Args>(args)...);
				return *this;
			}
			std::string str() const { return _ss.str(); }

		private:
			std::ostringstream _ss;
	};

	/*! INI-like: `[section]` sets a prefix, `key=value` lines become
	 * `section.key`, `#` starts a comment line.
	 */
	MDHEALTH_CORE_DECL std::unordered_map<std::string, std::string> load_config(const std::filesystem::path& cfg_file);
	MDHEALTH_CORE_DECL std::unordered_map<std::string, std::string> load_config(std::istream& fs);

	/*! decimal, the whole string; `what' names it in the error */
	MDHEALTH_CORE_DECL unsigned int parse_uint(const char* s, std::size_t n, const char* what);
	MDHEALTH_CORE_DECL unsigned int nproc() noexcept;
	/*! local time, `YYYY-MM-DDTHH:MM:SS.ffffff` */
	MDHEALTH_CORE_DECL std::string iso_timestamp();

	struct cli_helper {
		MDHEALTH_CORE_DECL explicit cli_helper();
		MDHEALTH_CORE_DECL ~cli_helper();
		cli_helper(const cli_helper&) =delete;
		cli_helper& operator=(const cli_helper&) =delete;

		MDHEALTH_CORE_DECL void report_unknown_opt(int argc, char* argv[]);
		MDHEALTH_CORE_DECL void report_missing_arg(int argc, char* argv[]);
		MDHEALTH_CORE_DECL void report_unmatched_opt(int argc, char* argv[]);
	};
}

#endif
