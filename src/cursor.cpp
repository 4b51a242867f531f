/**
 * @file  cursor.cpp
 * @brief Bounds-checked sequential reader over MIDI data.
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

#include <camoto/iostream_helpers.hpp>
#include <camoto/util.hpp> // createString()
#include <midiinspo/cursor.hpp>
#include <midiinspo/exceptions.hpp>

using namespace camoto;
using namespace midiinspo;

ByteCursor::ByteCursor(stream::input& content)
	:	content(content),
		offset(0)
{
	stream::pos start = content.tellg();
	stream::len size = content.size();
	this->length = (start < size) ? size - start : 0;
}

ByteCursor::ByteCursor(stream::input& content, stream::len len)
	:	content(content),
		offset(0),
		length(len)
{
	stream::pos start = content.tellg();
	stream::len size = content.size();
	stream::len avail = (start < size) ? size - start : 0;
	if (this->length > avail) this->length = avail;
}

std::vector<uint8_t> ByteCursor::readBytes(stream::len n)
{
	this->require(n, "data block");
	std::vector<uint8_t> data(n);
	if (n) {
		try {
			this->content.read(data.data(), n);
		} catch (const stream::incomplete_read&) {
			throw truncated(createString("Unexpected end of data reading " << n
				<< " bytes at offset " << this->offset));
		}
	}
	this->offset += n;
	return data;
}

uint8_t ByteCursor::readU8()
{
	this->require(1, "byte");
	uint8_t v;
	this->content >> u8(v);
	this->offset += 1;
	return v;
}

uint8_t ByteCursor::peekU8()
{
	this->require(1, "byte");
	uint8_t v;
	this->content >> u8(v);
	this->content.seekg(-1, stream::cur);
	return v;
}

uint16_t ByteCursor::readU16BE()
{
	this->require(2, "16-bit value");
	uint16_t v;
	this->content >> u16be(v);
	this->offset += 2;
	return v;
}

uint32_t ByteCursor::readU32BE()
{
	this->require(4, "32-bit value");
	uint32_t v;
	this->content >> u32be(v);
	this->offset += 4;
	return v;
}

uint32_t ByteCursor::readVLQ()
{
	uint32_t r = 0;
	bool overflow = false;
	for (;;) {
		uint8_t n = this->readU8();
		// Another seven bits would push the top bits out
		if (r > (MIDI_VLQ_OVERFLOW >> 7)) overflow = true;
		r <<= 7;
		r |= (n & 0x7F); // ignore the MSB
		if (!(n & 0x80)) break; // last byte has the MSB unset
	}
	return overflow ? MIDI_VLQ_OVERFLOW : r;
}

void ByteCursor::skip(stream::len n)
{
	this->require(n, "skipped data");
	if (n) this->content.seekg(n, stream::cur);
	this->offset += n;
	return;
}

bool ByteCursor::atEnd() const
{
	return this->offset >= this->length;
}

stream::len ByteCursor::remaining() const
{
	return this->atEnd() ? 0 : this->length - this->offset;
}

stream::pos ByteCursor::tellg() const
{
	return this->offset;
}

void ByteCursor::require(stream::len n, const char *what) const
{
	if (n > this->remaining()) {
		throw truncated(createString("Unexpected end of data reading " << what
			<< " at offset " << this->offset << " (wanted " << n << " bytes, "
			<< this->remaining() << " left)"));
	}
	return;
}
