/**
 * @file  exceptions.cpp
 * @brief Errors raised while extracting features from a MIDI file.
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

#include <iostream>
#include <midiinspo/exceptions.hpp>

using namespace midiinspo;

MIDIINSPO_API std::ostream& midiinspo::operator<< (std::ostream& s,
	const ErrorKind& r)
{
#pragma GCC diagnostic push
#pragma GCC diagnostic error "-Wswitch-enum"
	s << "ErrorKind::";
	switch (r) {
		case ErrorKind::NotFound: s << "NotFound"; break;
		case ErrorKind::InvalidHeader: s << "InvalidHeader"; break;
		case ErrorKind::Truncated: s << "Truncated"; break;
		default: s << "???"; break;
	}
#pragma GCC diagnostic pop
	return s;
}

feature_error::feature_error(ErrorKind kind, const std::string& msg)
	:	camoto::error(msg),
		errorKind(kind)
{
}

ErrorKind feature_error::kind() const
{
	return this->errorKind;
}

not_found::not_found(const std::string& msg)
	:	feature_error(ErrorKind::NotFound, msg)
{
}

invalid_header::invalid_header(const std::string& msg)
	:	feature_error(ErrorKind::InvalidHeader, msg)
{
}

truncated::truncated(const std::string& msg)
	:	feature_error(ErrorKind::Truncated, msg)
{
}
