/**
 * @file  header.hpp
 * @brief Decoder for the MThd chunk at the start of a Standard MIDI File.
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

#ifndef _MIDIINSPO_HEADER_HPP_
#define _MIDIINSPO_HEADER_HPP_

#include <cstdint>
#include <midiinspo/cursor.hpp>

namespace midiinspo {

/// Minimum number of bytes in a file before the header can be decoded.
const unsigned int SMF_MIN_HEADER_LEN = 14;

/// Length of the fixed fields in the MThd payload.
const unsigned int SMF_HEADER_FIELDS_LEN = 6;

/// Fields from the MThd chunk.
struct MIDIINSPO_API Header
{
	uint16_t formatType;     ///< 0, 1 or 2
	uint16_t tracksDeclared; ///< Number of MTrk chunks the file claims to have
	uint16_t division;       ///< Raw timing division

	Header();

	/// True if the division counts ticks per quarter note (high bit clear).
	bool isPPQN() const;

	/// Ticks per quarter note.  Only meaningful when isPPQN() is true.
	unsigned int ticksPerQuarterNote() const;

	/// SMPTE frames per second (24, 25, 29 or 30).  Only valid if !isPPQN().
	unsigned int smpteFramesPerSecond() const;

	/// Ticks per SMPTE frame.  Only valid if !isPPQN().
	unsigned int smpteTicksPerFrame() const;
};

/// Decode the MThd chunk.
/**
 * On return the cursor is positioned at the start of the first chunk after
 * the header, including when the header carries extra bytes beyond the six
 * standard ones.  If the header claims to be shorter than six bytes the
 * fields are still decoded, but the rest of the data is consumed so that no
 * chunks follow.
 *
 * @param cursor
 *   Cursor positioned at the start of the file.
 *
 * @throw invalid_header
 *   Fewer than 14 bytes are available, or the signature is not "MThd".
 *
 * @throw truncated
 *   The header claims to be longer than the data that follows it.
 */
MIDIINSPO_API Header decodeHeader(ByteCursor& cursor);

} // namespace midiinspo

#endif // _MIDIINSPO_HEADER_HPP_
