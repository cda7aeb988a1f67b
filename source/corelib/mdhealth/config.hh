/* mdhealth/config.hh
 *
 * Copyright (C) 2020 GOU Lingfeng
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
#ifndef _MDHEALTH_INCLUDE_CONFIG_HH_
#define _MDHEALTH_INCLUDE_CONFIG_HH_

#if !defined(_WIN32) && !defined(__CYGWIN__)
#define MDHEALTH_CORE_DECL
#elif defined(MDHEALTH_CORE_COMPILATION)
#define MDHEALTH_CORE_DECL __declspec(dllexport)
#else
#define MDHEALTH_CORE_DECL __declspec(dllimport)
#endif

#endif
