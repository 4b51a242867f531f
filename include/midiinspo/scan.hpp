/**
 * @file  scan.hpp
 * @brief Event scanner collecting statistics from one MIDI track.
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

#ifndef _MIDIINSPO_SCAN_HPP_
#define _MIDIINSPO_SCAN_HPP_

#include <cstdint>
#include <set>
#include <vector>
#include <midiinspo/cursor.hpp>

namespace midiinspo {

/// Flags controlling how track data is interpreted.
struct ScanFlags {
	enum Type {
		/// Treat every status other than channel and meta events as having no
		/// data bytes, and let any explicit status become the running status.
		Default = 0,

		/// Skip the payload of SysEx events (F0, F7), give the system common
		/// messages (F1-F3) their proper data length, and leave the running
		/// status alone when a system or meta event is encountered.
		SystemMessages = 1,
	};
};

/// Statistics gathered from a single MTrk chunk.
struct MIDIINSPO_API TrackStats
{
	uint32_t byteLength;            ///< Length of the track payload
	unsigned long noteOnCount;      ///< Note-on events with nonzero velocity
	std::set<uint8_t> statusBytesSeen; ///< Every distinct status byte used

	/// Number of complete events decoded.
	unsigned long eventsDecoded;

	/// false if scanning stopped early due to malformed or truncated data.
	bool complete;

	TrackStats();
};

/// Scan the events in a track payload.
/**
 * Malformed data never causes an exception.  When an event cannot be
 * decoded (the data runs out mid-event, or running status is used before any
 * status byte) scanning of this track stops and the counts gathered so far
 * are returned with TrackStats::complete set to false.
 *
 * @param payload
 *   Contents of an MTrk chunk, without the eight-byte chunk frame.
 *
 * @param flags
 *   One or more ScanFlags values.  Use ScanFlags::Default unless the MIDI
 *   data is known to carry SysEx or system common messages.
 */
MIDIINSPO_API TrackStats scanTrack(const std::vector<uint8_t>& payload,
	unsigned int flags);

/// Scan the events from the cursor position to the end of its range.
/**
 * @see scanTrack(const std::vector<uint8_t>&, unsigned int)
 */
MIDIINSPO_API TrackStats scanTrack(ByteCursor& cursor, unsigned int flags);

} // namespace midiinspo

#endif // _MIDIINSPO_SCAN_HPP_
