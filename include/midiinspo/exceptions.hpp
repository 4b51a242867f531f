/**
 * @file  exceptions.hpp
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

#ifndef _MIDIINSPO_EXCEPTIONS_HPP_
#define _MIDIINSPO_EXCEPTIONS_HPP_

#include <iosfwd>
#include <string>
#include <camoto/error.hpp>
#include <midiinspo/api.hpp>

namespace midiinspo {

/// Which kind of failure aborted a feature extraction.
enum class ErrorKind {
	NotFound,       ///< Input path does not exist
	InvalidHeader,  ///< Missing or short MThd header
	Truncated,      ///< A chunk runs past the end of the data
};

MIDIINSPO_API std::ostream& operator << (std::ostream& s, const ErrorKind& r);

/// Base class for all hard failures from extractFeatures().
/**
 * Catch this to handle every failure at once, or one of the derived classes
 * to handle a single kind.  kind() allows a switch on the failure type.
 */
class MIDIINSPO_API feature_error: public camoto::error
{
	public:
		/// Constructor.
		/**
		 * @param kind
		 *   Type of failure.
		 *
		 * @param msg
		 *   Error description for UI messages.
		 */
		feature_error(ErrorKind kind, const std::string& msg);

		/// Type of failure this exception represents.
		ErrorKind kind() const;

	private:
		ErrorKind errorKind;
};

/// Exception thrown when the input file does not exist.
class MIDIINSPO_API not_found: public feature_error
{
	public:
		/// Constructor.
		/**
		 * @param msg
		 *   Error description for UI messages.
		 */
		not_found(const std::string& msg);
};

/// Exception thrown when the data does not start with a usable MThd header.
class MIDIINSPO_API invalid_header: public feature_error
{
	public:
		/// Constructor.
		/**
		 * @param msg
		 *   Error description for UI messages.
		 */
		invalid_header(const std::string& msg);
};

/// Exception thrown when a chunk declares more data than is available.
class MIDIINSPO_API truncated: public feature_error
{
	public:
		/// Constructor.
		/**
		 * @param msg
		 *   Error description for UI messages.
		 */
		truncated(const std::string& msg);
};

} // namespace midiinspo

#endif // _MIDIINSPO_EXCEPTIONS_HPP_
