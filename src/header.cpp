/**
 * @file  header.cpp
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

#include <string.h>
#include <camoto/util.hpp> // createString()
#include <midiinspo/chunk.hpp>
#include <midiinspo/header.hpp>
#include <midiinspo/exceptions.hpp>

using namespace camoto;
using namespace midiinspo;

Header::Header()
	:	formatType(0),
		tracksDeclared(0),
		division(0)
{
}

bool Header::isPPQN() const
{
	return (this->division & 0x8000) == 0;
}

unsigned int Header::ticksPerQuarterNote() const
{
	return this->division & 0x7FFF;
}

unsigned int Header::smpteFramesPerSecond() const
{
	// High byte is the negative frame rate in two's complement
	return 256 - ((this->division >> 8) & 0xFF);
}

unsigned int Header::smpteTicksPerFrame() const
{
	return this->division & 0xFF;
}

Header midiinspo::decodeHeader(ByteCursor& cursor)
{
	if (cursor.remaining() < SMF_MIN_HEADER_LEN) {
		throw invalid_header(createString("File too small to be a valid MIDI "
			"file (" << cursor.remaining() << " bytes, need at least "
			<< SMF_MIN_HEADER_LEN << ")"));
	}

	auto sig = cursor.readBytes(4);
	if (memcmp(sig.data(), SMF_TAG_HEADER, 4) != 0) {
		throw invalid_header("Missing MIDI header chunk (MThd)");
	}

	uint32_t len = cursor.readU32BE();

	Header header;
	header.formatType = cursor.readU16BE();
	header.tracksDeclared = cursor.readU16BE();
	header.division = cursor.readU16BE();

	// Skip over any vendor data after the standard fields, so the cursor lands
	// on the first track.
	if (len < SMF_HEADER_FIELDS_LEN) {
		// The fields overran the chunk, so there is no sensible place to look
		// for the first track.  Treat the rest of the file as header data.
		cursor.skip(cursor.remaining());
	} else if (len > SMF_HEADER_FIELDS_LEN) {
		uint32_t extra = len - SMF_HEADER_FIELDS_LEN;
		if (extra > cursor.remaining()) {
			throw truncated(createString("Header chunk claims " << len
				<< " bytes but the file ends after " << (SMF_HEADER_FIELDS_LEN
				+ cursor.remaining())));
		}
		cursor.skip(extra);
	}

	return header;
}
