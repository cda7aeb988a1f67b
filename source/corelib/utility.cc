#include "mdhealth/utility.hh"

#include "mdhealth/exception.hh"

#include <unordered_map>
#include <thread>
#include <mutex>
#include <atomic>
#include <fstream>
#include <chrono>
#include <ctime>
#include <clocale>
#include <cctype>
#include <cstdlib>
#include <charconv>

#include <getopt.h>
#include <unistd.h>

static std::unordered_map<std::thread::id, int> tid2color{};
static const char* colorstr[]={
	"[\e[31m",
	"[\e[32m",
	"[\e[33m",
	"[\e[34m",
	"[\e[35m",
	"[\e[36m",
};

const char* mdhealth::_get_thread_color() {
	auto id=std::this_thread::get_id();
	auto i=tid2color.find(id);
	if(i==tid2color.end()) {
		auto idx=tid2color.size();
		if(idx>=sizeof(colorstr)/sizeof(colorstr[0]))
			idx=sizeof(colorstr)/sizeof(colorstr[0])-1;
		tid2color[id]=idx;
		return colorstr[idx];
	} else {
		return colorstr[i->second];
	}
}
const char* mdhealth::_restore_color() {
	return "\e[0m]";
}

namespace std {
inline std::ostream& operator<<(std::ostream& fs, const std::chrono::microseconds& dur) {
	auto v=dur.count();
	fs<<v/1000000<<'.';
	v=v%1000000;
	fs.width(6);
	fs.fill('0');
	fs<<v;
	return fs;
}
}

static std::atomic<int> log_threshold{-1};
static std::chrono::microseconds dur0{};
static std::mutex _print_mtx;

static int default_threshold() {
	auto p=getenv("MDHEALTH_DEBUG");
	return static_cast<int>(p?mdhealth::log_level::debug:mdhealth::log_level::info);
}

bool mdhealth::parse_log_level(std::string_view str, log_level& lvl) {
	std::string s{str};
	for(auto& c: s)
		c=std::tolower(static_cast<unsigned char>(c));
	if(s=="debug")
		lvl=log_level::debug;
	else if(s=="info")
		lvl=log_level::info;
	else if(s=="warning" || s=="warn")
		lvl=log_level::warning;
	else if(s=="error")
		lvl=log_level::error;
	else
		return false;
	return true;
}
void mdhealth::set_log_level(log_level lvl) noexcept {
	log_threshold.store(static_cast<int>(lvl));
}
bool mdhealth::log_enabled(log_level lvl) noexcept {
	auto t=log_threshold.load();
	if(t<0) {
		int expected{-1};
		log_threshold.compare_exchange_strong(expected, default_threshold());
		t=log_threshold.load();
	}
	return static_cast<int>(lvl)>=t;
}

void mdhealth::_do_print(log_level lvl, const std::string& s) {
	static const char* tags[]={"debug", "info", "warning", "error"};
	auto dur=std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch());
	std::ostringstream oss;

	std::lock_guard<std::mutex> lck{_print_mtx};
	auto c0=_get_thread_color();
	auto c1=_restore_color();
	oss<<c0<<dur-(dur0==std::chrono::microseconds{}?dur:dur0)<<c1;
	dur0=dur;
	oss<<' '<<tags[static_cast<int>(lvl)]<<": ";
	std::cerr<<oss.str()<<s<<'\n';
}

std::unordered_map<std::string, std::string> mdhealth::load_config(std::istream& fs) {
	std::string line;
	std::string pfx{};
	std::unordered_map<std::string, std::string> cfg{};
	while(std::getline(fs, line)) {
		if(line.empty())
			continue;
		if(line[0]=='#')
			continue;
		if(line[0]=='[') {
			auto i=line.find(']');
			if(i==std::string::npos)
				report("Failed to parse: ", line);
			pfx=line.substr(1, i-1);
		} else {
			auto i=line.find('=');
			if(i==std::string::npos)
				report("Failed to parse: ", line);
			auto key=pfx;
			if(!pfx.empty()) key+='.';
			key+=line.substr(0, i);
			cfg[key]=line.substr(i+1);
		}
	}
	if(!fs.eof())
		report("Error while reading config file.");
	return cfg;
}
std::unordered_map<std::string, std::string> mdhealth::load_config(const std::filesystem::path& cfg_file) {
	std::ifstream fs{cfg_file};
	if(!fs)
		report("Failed to open: ", cfg_file);
	return load_config(fs);
}

unsigned int mdhealth::parse_uint(const char* s, std::size_t n, const char* what) {
	unsigned int v;
	auto [eptr, ec]=std::from_chars(s, s+n, v, 10);
	if(ec!=std::errc{} || eptr!=s+n)
		report("invalid ", what, ": ", std::string_view{s, n});
	return v;
}

unsigned int mdhealth::nproc() noexcept {
	auto n=sysconf(_SC_NPROCESSORS_ONLN);
	if(n<1)
		return 1;
	return n;
}

std::string mdhealth::iso_timestamp() {
	auto now=std::chrono::system_clock::now();
	auto tt=std::chrono::system_clock::to_time_t(now);
	auto us=std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count()%1000000;
	std::tm tm_buf;
	localtime_r(&tt, &tm_buf);
	char buf[64];
	auto r=strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
	std::ostringstream oss;
	oss.write(buf, r);
	oss<<'.';
	oss.width(6);
	oss.fill('0');
	oss<<us;
	return oss.str();
}

mdhealth::cli_helper::cli_helper() {
	std::setlocale(LC_ALL, "");
	/*! keep number formatting of the JSON output locale-independent */
	std::setlocale(LC_NUMERIC, "C");
}
mdhealth::cli_helper::~cli_helper() {
}

void mdhealth::cli_helper::report_unknown_opt(int argc, char* argv[]) {
	if(optopt!=0) {
		str_glue err{"unrecognized option `-", (char)optopt, '\''};
		throw reported_error{err.str()};
	}
	str_glue err{"unrecognized option `", argv[optind-1], '\''};
	throw reported_error{err.str()};
}

void mdhealth::cli_helper::report_missing_arg(int argc, char* argv[]) {
	str_glue err{"option `", argv[optind-1], "' requires an argument"};
	throw reported_error{err.str()};
}

void mdhealth::cli_helper::report_unmatched_opt(int argc, char* argv[]) {
	throw reported_error{"unknown option"};
}
