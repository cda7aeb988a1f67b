/* collect/main.cc
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

#include "mdhealth/aggregator.hh"
#include "mdhealth/exception.hh"
#include "mdhealth/jsonl-input.hh"
#include "mdhealth/output.hh"
#include "mdhealth/registry.hh"
#include "mdhealth/schema.hh"
#include "mdhealth/utility.hh"

#include <algorithm>
#include <cstring>
#include <iostream>

#include <getopt.h>

#include "config.hh"

#include "../corelib/parse-helper.hh"


constexpr static const char* opts=":i:o:c:l:j:";
constexpr static const struct option opts_long[]={
	{"input-dir", 1, nullptr, 'i'},
	{"output-dir", 1, nullptr, 'o'},
	{"cache-dir", 1, nullptr, 'c'},
	{"log-level", 1, nullptr, 'l'},
	{"jobs", 1, nullptr, 'j'},
	{"registry", 1, nullptr, 1000+'r'},
	{"timeout", 1, nullptr, 1000+'t'},
	{"config", 1, nullptr, 1000+'c'},
	{"help", 0, nullptr, 1000+'h'},
	{"version", 0, nullptr, 1000+'v'},
	{nullptr, 0, nullptr, 0}
};

static void usage(const char* argv0) {
	std::cout<<
		"usage: "<<argv0<<" [<options>...] -i <input-dir> -o <output-dir>\n"
		"       compute metadata completeness statistics\n\n"
		"   or: "<<argv0<<" --help|--version\n"
		"       display this help or version information, and exit\n\n"
		"Reads every *.jsonl.gz file under <input-dir> and writes completeness\n"
		"statistics per provider and per client to <output-dir>.\n\n"
		"Options:\n"
		"   -i, --input-dir  <dir>   Directory holding the record files.\n"
		"   -o, --output-dir <dir>   Directory for the output documents.\n"
		"   -c, --cache-dir  <dir>   Cache registry listings in this directory.\n"
		"   -l, --log-level  <level> debug, info, warning or error (default info).\n"
		"   -j, --jobs       <n>     Number of worker threads (default nproc-1).\n"
		"       --registry   <url>   Registry API (default https://api.datacite.org).\n"
		"       --timeout    <sec>   Time limit of each registry request (default 300).\n"
		"       --config     <cfg-file> Read options not given above from this file.\n\n"
		PACKAGE_NAME " " PACKAGE_VERSION "\n";
}
static void version() {
	std::cout<<
		"collect (" PACKAGE_NAME ") " PACKAGE_VERSION "\n"
		PACKAGE_COPYRIGHT "\n"
		"License GPLv3+: GNU GPL version 3 or later <http://gnu.org/licenses/gpl.html>.\n"
		"This is free software: you are free to change and redistribute it.\n"
		"There is NO WARRANTY, to the extent permitted by law.\n";
}

struct Args {
	std::filesystem::path input_dir{};
	std::filesystem::path output_dir{};
	std::filesystem::path cache_dir{};
	std::filesystem::path cfg_file{};
	std::string log_level{};
	std::string registry{};
	unsigned int jobs{0};
	unsigned int timeout{0};
};

static int collect(Args&& args) {
	auto& sch=mdhealth::schema::instance();

	mdhealth::registry_listing reg;
	try {
		mdhealth::registry_client client{{args.registry, args.cache_dir, args.timeout}};
		reg=client.fetch();
	} catch(const std::exception& e) {
		throw mdhealth::reported_error{mdhealth::str_glue{"failed to fetch registry: ", e.what()}.str()};
	}
	mdhealth::print_info(reg.providers.size(), " providers, ", reg.clients.size(), " clients");

	auto files=mdhealth::discover_files(args.input_dir);
	if(files.empty())
		throw mdhealth::reported_error{mdhealth::str_glue{"no .jsonl.gz files found in ", args.input_dir}.str()};
	mdhealth::print_info("Found ", files.size(), " files to process");

	mdhealth::aggregator aggr{sch, reg};
	aggr.run(files, args.jobs);
	aggr.finalize();

	mdhealth::print_info("Writing output to ", args.output_dir);
	mdhealth::output_writer writer{args.output_dir};
	writer.write(aggr.providers(), aggr.clients());
	mdhealth::print_info("Processing completed successfully");
	return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
	mdhealth::cli_helper cli_helper{};

	Args args{};
	try {
		int opt;
		while((opt=getopt_long(argc, argv, opts, &opts_long[0], nullptr))!=-1) {
			switch(opt) {
				case 'i':
					args.input_dir=optarg;
					break;
				case 'o':
					args.output_dir=optarg;
					break;
				case 'c':
					args.cache_dir=optarg;
					break;
				case 'l':
					args.log_level=optarg;
					break;
				case 'j':
					args.jobs=mdhealth::parse_uint(optarg, std::strlen(optarg), "number of jobs");
					if(args.jobs<1)
						throw mdhealth::reported_error{"number of jobs must be at least 1"};
					break;
				case 1000+'r':
					args.registry=optarg;
					break;
				case 1000+'t':
					args.timeout=mdhealth::parse_uint(optarg, std::strlen(optarg), "timeout");
					break;
				case 1000+'c':
					args.cfg_file=optarg;
					break;
				case 1000+'h':
					usage(argv[0]);
					return EXIT_SUCCESS;
				case 1000+'v':
					version();
					return EXIT_SUCCESS;
				case '?':
					cli_helper.report_unknown_opt(argc, argv);
					break;
				case ':':
					cli_helper.report_missing_arg(argc, argv);
					break;
				default:
					cli_helper.report_unmatched_opt(argc, argv);
			}
		}
		if(optind<argc)
			throw mdhealth::reported_error{"too many arguments"};

		load_configs(args.cfg_file, {
			path_cfg("input.dir", args.input_dir),
			path_cfg("output.dir", args.output_dir),
			string_cfg("registry.url", args.registry),
			path_cfg("registry.cache", args.cache_dir),
			uint_cfg("registry.timeout", args.timeout),
			uint_cfg("process.jobs", args.jobs),
			string_cfg("log.level", args.log_level),
		});

		if(args.input_dir.empty())
			throw mdhealth::reported_error{"argument <input-dir> missing"};
		if(args.output_dir.empty())
			throw mdhealth::reported_error{"argument <output-dir> missing"};
		if(args.registry.empty())
			args.registry="https://api.datacite.org";
		if(args.timeout==0)
			args.timeout=300;
		if(args.jobs==0)
			args.jobs=std::max(mdhealth::nproc(), 2u)-1;
		if(!args.log_level.empty()) {
			mdhealth::log_level lvl;
			if(!mdhealth::parse_log_level(args.log_level, lvl))
				throw mdhealth::reported_error{mdhealth::str_glue{"unknown log level: ", args.log_level}.str()};
			mdhealth::set_log_level(lvl);
		}
	} catch(const mdhealth::reported_error& e) {
		mdhealth::str_glue msg{"error: ", e.what(), '\n',
			"try `", argv[0], " --help", "' for more information.\n"};
		std::cerr<<msg.str();
		return EXIT_FAILURE;
	} catch(const std::runtime_error& e) {
		mdhealth::str_glue msg{"error: ", e.what(), '\n',
			"try `", argv[0], " --help", "' for more information.\n"};
		std::cerr<<msg.str();
		return EXIT_FAILURE;
	}

	try {
		return collect(std::move(args));
	} catch(const mdhealth::reported_error& e) {
		mdhealth::str_glue msg{"fatal: ", e.what(), '\n'};
		std::cerr<<msg.str();
		return EXIT_FAILURE;
	} catch(const std::runtime_error& e) {
		mdhealth::str_glue msg{"fatal: ", e.what(), '\n'};
		std::cerr<<msg.str();
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
