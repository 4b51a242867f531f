/**
 * @file  cursor.hpp
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

#ifndef _MIDIINSPO_CURSOR_HPP_
#define _MIDIINSPO_CURSOR_HPP_

#include <cstdint>
#include <vector>
#include <camoto/stream.hpp>
#include <midiinspo/api.hpp>

namespace midiinspo {

/// Value returned by ByteCursor::readVLQ() when the number does not fit.
const uint32_t MIDI_VLQ_OVERFLOW = 0xFFFFFFFF;

/// Forward-only reader over a fixed range of a stream.
/**
 * The cursor starts at the stream's current read position and will never
 * read past the end of the range it was given.  Every read checks the number
 * of bytes left first, so a short read never touches the underlying stream.
 *
 * The stream must not be seeked by anyone else while the cursor is in use.
 *
 * @code
 * stream::input_file file("song.mid");
 * ByteCursor cursor(file);
 * uint32_t sig = cursor.readU32BE();
 * @endcode
 */
class MIDIINSPO_API ByteCursor
{
	public:
		/// Read from the current position until the end of the stream.
		/**
		 * @param content
		 *   Stream to read.  The caller keeps ownership and must keep it valid
		 *   for the lifetime of the cursor.
		 */
		ByteCursor(camoto::stream::input& content);

		/// Read at most len bytes from the current position.
		/**
		 * @param content
		 *   Stream to read.
		 *
		 * @param len
		 *   Number of bytes in the range.  If the stream has fewer bytes left,
		 *   the range is shortened to match.
		 */
		ByteCursor(camoto::stream::input& content, camoto::stream::len len);

		/// Read exactly n bytes.
		/**
		 * @throw truncated
		 *   Fewer than n bytes are left.  Nothing is consumed in this case.
		 */
		std::vector<uint8_t> readBytes(camoto::stream::len n);

		/// Read a single byte.
		/**
		 * @throw truncated
		 *   The cursor is already at the end.
		 */
		uint8_t readU8();

		/// Return the next byte without consuming it.
		/**
		 * @throw truncated
		 *   The cursor is already at the end.
		 */
		uint8_t peekU8();

		/// Read a 16-bit big-endian integer.
		/**
		 * @throw truncated
		 *   Fewer than two bytes are left.
		 */
		uint16_t readU16BE();

		/// Read a 32-bit big-endian integer.
		/**
		 * @throw truncated
		 *   Fewer than four bytes are left.
		 */
		uint32_t readU32BE();

		/// Read a MIDI variable-length quantity.
		/**
		 * Bytes are consumed until one with the high bit clear is found.  Each
		 * byte contributes its low seven bits, most significant group first.
		 * Values too large for 32 bits are clamped to MIDI_VLQ_OVERFLOW, so a
		 * length read this way is always larger than any remaining data.
		 *
		 * @throw truncated
		 *   The data ran out before the final byte.  The bytes read up to that
		 *   point remain consumed.
		 */
		uint32_t readVLQ();

		/// Advance by n bytes without reading them.
		/**
		 * @throw truncated
		 *   Fewer than n bytes are left.  Nothing is consumed in this case.
		 */
		void skip(camoto::stream::len n);

		/// True once every byte in the range has been consumed.
		bool atEnd() const;

		/// Number of bytes left in the range.
		camoto::stream::len remaining() const;

		/// Offset of the next byte, relative to the start of the range.
		camoto::stream::pos tellg() const;

	private:
		camoto::stream::input& content; ///< Data being read
		camoto::stream::pos offset;     ///< Bytes consumed so far
		camoto::stream::len length;     ///< Total bytes in the range

		/// Throw truncated unless n more bytes are available.
		void require(camoto::stream::len n, const char *what) const;
};

} // namespace midiinspo

#endif // _MIDIINSPO_CURSOR_HPP_
