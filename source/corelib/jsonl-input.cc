#include "mdhealth/jsonl-input.hh"

#include "mdhealth/utility.hh"

#include <algorithm>


bool mdhealth::jsonl_input::read() {
	while(std::getline(_base, _buf)) {
		++_line_no;
		auto i=_buf.find_first_not_of(" \t\r");
		if(i==std::string::npos)
			continue;
		try {
			_value=nlohmann::json::parse(_buf);
			return true;
		} catch(const nlohmann::json::parse_error& e) {
			++_bad_lines;
			print_warning("line ", _line_no, ": ", e.what());
		}
	}
	_eof=_base.eof();
	return false;
}

std::vector<std::filesystem::path> mdhealth::discover_files(const std::filesystem::path& root) {
	constexpr std::string_view suffix{".jsonl.gz"};
	std::vector<std::filesystem::path> files;
	if(!std::filesystem::is_directory(root))
		report("not a directory: ", root);
	for(auto& ent: std::filesystem::recursive_directory_iterator{root}) {
		if(!ent.is_regular_file())
			continue;
		auto name=ent.path().filename().string();
		if(name.size()>suffix.size() && name.compare(name.size()-suffix.size(), suffix.size(), suffix)==0)
			files.push_back(ent.path());
	}
	std::sort(files.begin(), files.end());
	return files;
}
