/**
 * @file  chunk.cpp
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

#include <string.h>
#include <camoto/util.hpp> // createString()
#include <midiinspo/chunk.hpp>
#include <midiinspo/exceptions.hpp>

using namespace camoto;
using namespace midiinspo;

Chunk::Chunk()
	:	length(0)
{
}

bool Chunk::is(const char *name) const
{
	return (this->tag.length() == 4) && (strncmp(this->tag.c_str(), name, 4) == 0);
}

bool midiinspo::nextChunk(ByteCursor& cursor, Chunk *chunk)
{
	if (cursor.remaining() < SMF_CHUNK_FRAME_LEN) return false;

	auto sig = cursor.readBytes(4);
	uint32_t len = cursor.readU32BE();

	if (len > cursor.remaining()) {
		throw truncated(createString("Chunk \"" << std::string(sig.begin(),
			sig.end()) << "\" claims " << len << " bytes but only "
			<< cursor.remaining() << " are left in the file"));
	}

	chunk->tag.assign(sig.begin(), sig.end());
	chunk->length = len;
	chunk->payload = cursor.readBytes(len);
	return true;
}
