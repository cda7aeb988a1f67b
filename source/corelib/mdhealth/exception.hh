/* mdhealth/exception.hh
 *
 * Copyright (C) 2019 GOU Lingfeng
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
#ifndef _MDHEALTH_INCLUDE_EXCEPTION_HH_
#define _MDHEALTH_INCLUDE_EXCEPTION_HH_

#include <exception>
#include <string>


namespace mdhealth {

	/*! fatal for the run, message meant for the user.
	 * thrown on: bad command line, registry unreachable without cache,
	 * no input files, output not writable.
	 */
	class reported_error: public std::exception {
		public:
			explicit reported_error(const char* what): _what{what} { }
			explicit reported_error(const std::string& what): _what{what} { }
			explicit reported_error(std::string&& what) noexcept:
				_what{std::move(what)} { }
			~reported_error() override { }

			reported_error(const reported_error&) =default;
			reported_error& operator=(const reported_error&) =default;
			reported_error(reported_error&&) noexcept =default;
			reported_error& operator=(reported_error&&) noexcept =default;

			const char* what() const noexcept override { return _what.c_str(); }

		private:
			std::string _what;
	};

}

#endif
