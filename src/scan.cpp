/**
 * @file  scan.cpp
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

#include <camoto/stream_string.hpp>
#include <midiinspo/scan.hpp>
#include <midiinspo/exceptions.hpp>

using namespace camoto;
using namespace midiinspo;

/// Status byte of a meta event.
const uint8_t MIDI_META_EVENT = 0xFF;

/// Walks the events in one track, tallying what it finds.
class TrackScanner
{
	public:
		/// Constructor
		/**
		 * @param flags
		 *   One or more ScanFlags values.
		 */
		TrackScanner(unsigned int flags);

		/// Read events until the data runs out or cannot be decoded.
		/**
		 * @param cursor
		 *   Track data.
		 *
		 * @return Statistics for the track.  Never throws on bad data.
		 */
		TrackStats scan(ByteCursor& cursor);

	protected:
		unsigned int flags;  ///< ScanFlags supplied in constructor
		uint8_t lastEvent;   ///< Last event (for MIDI running status), 0 if none

		/// Read the data bytes of a system or meta event.
		void skipSystem(ByteCursor& cursor, uint8_t event);
};

TrackScanner::TrackScanner(unsigned int flags)
	:	flags(flags),
		lastEvent(0)
{
}

TrackStats TrackScanner::scan(ByteCursor& cursor)
{
	TrackStats stats;
	stats.byteLength = static_cast<uint32_t>(cursor.remaining());
	this->lastEvent = 0;

	try {
		while (!cursor.atEnd()) {
			cursor.readVLQ(); // delay before this event, unused

			uint8_t event = cursor.peekU8();
			if (event & 0x80) {
				// If the high bit is set it's a normal event
				cursor.readU8();
				if (
					!(this->flags & ScanFlags::SystemMessages)
					|| ((event & 0xF0) != 0xF0)
				) {
					this->lastEvent = event;
				}
			} else {
				// The high bit is unset, so this is actually the first data
				// byte for a new event, of the same type as the last event.  It is
				// left for the data reads below.
				if (this->lastEvent == 0) {
					// Nothing to inherit, the track is corrupted
					stats.complete = false;
					break;
				}
				event = this->lastEvent;
			}
			stats.statusBytesSeen.insert(event);

			switch (event & 0xF0) {
				case 0x80: // Note off (two data bytes)
				case 0xA0: // Polyphonic key pressure (two data bytes)
				case 0xB0: // Controller (two data bytes)
				case 0xE0: // Pitchbend (two data bytes)
					cursor.skip(2);
					break;
				case 0x90: { // Note on (two data bytes)
					cursor.readU8(); // note
					uint8_t velocity = cursor.readU8();
					// Velocity 0 is a note off
					if (velocity != 0) stats.noteOnCount++;
					break;
				}
				case 0xC0: // Instrument change (one data byte)
				case 0xD0: // Channel pressure (one data byte)
					cursor.skip(1);
					break;
				case 0xF0:
					this->skipSystem(cursor, event);
					break;
			}
			stats.eventsDecoded++;
		}
	} catch (const truncated&) {
		// Ran out of data mid-event, keep what we have so far
		stats.complete = false;
	}

	return stats;
}

void TrackScanner::skipSystem(ByteCursor& cursor, uint8_t event)
{
	if (event == MIDI_META_EVENT) {
		cursor.readU8(); // meta type
		uint32_t len = cursor.readVLQ();
		cursor.skip(len);
		return;
	}

	// Without the flag, other system events are assumed to have no data.
	if (!(this->flags & ScanFlags::SystemMessages)) return;

	switch (event) {
		case 0xF0: // SysEx
		case 0xF7: { // SysEx continuation/escape
			uint32_t len = cursor.readVLQ();
			cursor.skip(len);
			break;
		}
		case 0xF1: // MTC quarter frame
		case 0xF3: // Song select
			cursor.skip(1);
			break;
		case 0xF2: // Song position pointer
			cursor.skip(2);
			break;
		default: // Tune request and realtime messages have no data
			break;
	}
	return;
}

TrackStats::TrackStats()
	:	byteLength(0),
		noteOnCount(0),
		eventsDecoded(0),
		complete(true)
{
}

TrackStats midiinspo::scanTrack(ByteCursor& cursor, unsigned int flags)
{
	TrackScanner scanner(flags);
	return scanner.scan(cursor);
}

TrackStats midiinspo::scanTrack(const std::vector<uint8_t>& payload,
	unsigned int flags)
{
	stream::string content;
	if (!payload.empty()) content.write(payload.data(), payload.size());
	content.seekg(0, stream::start);

	ByteCursor cursor(content);
	return scanTrack(cursor, flags);
}
