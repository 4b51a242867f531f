/**
 * @file  api.hpp
 * @brief Symbol visibility for the public library interface.
 *
 * Copyright (C) 2026 The libmidiinspo authors
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

#ifndef _MIDIINSPO_API_HPP_
#define _MIDIINSPO_API_HPP_

#ifndef MIDIINSPO_API
#if defined(_MSC_VER)
#ifdef MIDIINSPO_EXPORTS
#define MIDIINSPO_API __declspec(dllexport)
#else
#define MIDIINSPO_API __declspec(dllimport)
#endif
#elif defined(__GNUC__)
#define MIDIINSPO_API __attribute__((visibility("default")))
#else
#define MIDIINSPO_API
#endif
#endif

#endif // _MIDIINSPO_API_HPP_
