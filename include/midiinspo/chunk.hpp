/**
 * @file  chunk.hpp
 * @brief Tagged, length-prefixed chunks making up a Standard MIDI File.
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

#ifndef _MIDIINSPO_CHUNK_HPP_
#define _MIDIINSPO_CHUNK_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include <midiinspo/cursor.hpp>

namespace midiinspo {

/// Tag of the header chunk at the start of every MIDI file.
const char* const SMF_TAG_HEADER = "MThd";

/// Tag of a track chunk.
const char* const SMF_TAG_TRACK = "MTrk";

/// Size of the tag and length fields in front of every chunk payload.
const unsigned int SMF_CHUNK_FRAME_LEN = 8;

/// One chunk read from the file.
struct MIDIINSPO_API Chunk
{
	std::string tag;              ///< Four-byte identifier, e.g. "MTrk"
	uint32_t length;              ///< Declared payload length
	std::vector<uint8_t> payload; ///< Exactly length bytes

	Chunk();

	/// Does this chunk have the given four-character tag?
	bool is(const char *name) const;
};

/// Read the next chunk.
/**
 * @param cursor
 *   Cursor positioned at the start of a chunk frame.  On return it is
 *   positioned at the start of the following chunk.
 *
 * @param chunk
 *   Populated with the chunk on success.  Left untouched at end of input.
 *
 * @return true if a chunk was read, false if fewer than eight bytes were
 *   left (normal end of the chunk sequence).
 *
 * @throw truncated
 *   The frame was present but the payload is shorter than declared.
 */
MIDIINSPO_API bool nextChunk(ByteCursor& cursor, Chunk *chunk);

} // namespace midiinspo

#endif // _MIDIINSPO_CHUNK_HPP_
