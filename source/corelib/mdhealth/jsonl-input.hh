/* mdhealth/jsonl-input.hh
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
#ifndef _MDHEALTH_INCLUDE_JSONL_INPUT_HH_
#define _MDHEALTH_INCLUDE_JSONL_INPUT_HH_

#include "mdhealth/config.hh"

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>


namespace mdhealth {

	/*! one JSON value per line.
	 * blank lines are ignored, lines that do not parse are logged,
	 * counted and skipped.
	 */
	class MDHEALTH_CORE_DECL jsonl_input {
		public:
			explicit jsonl_input(std::istream& base):
				_base{base}, _buf{}, _value{}, _line_no{0}, _bad_lines{0}, _eof{false} { }
			~jsonl_input() { }
			jsonl_input(const jsonl_input&) =delete;
			jsonl_input& operator=(const jsonl_input&) =delete;

			/*! false when the stream is exhausted or failed */
			bool read();
			/*! true if read() stopped at end of stream, not on failure */
			bool eof() const noexcept { return _eof; }

			const nlohmann::json& value() const noexcept { return _value; }
			nlohmann::json& value() noexcept { return _value; }
			std::size_t line_no() const noexcept { return _line_no; }
			std::size_t bad_lines() const noexcept { return _bad_lines; }

		private:
			std::istream& _base;
			std::string _buf;
			nlohmann::json _value;
			std::size_t _line_no;
			std::size_t _bad_lines;
			bool _eof;
	};

	/*! files under root (recursively) named *.jsonl.gz, sorted */
	MDHEALTH_CORE_DECL std::vector<std::filesystem::path> discover_files(const std::filesystem::path& root);

	inline bool is_gzip_file(const std::filesystem::path& path) {
		return path.extension()==".gz";
	}

}

#endif
