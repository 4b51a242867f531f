/**
 * @file  features.hpp
 * @brief Structural statistics extracted from a Standard MIDI File.
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

#ifndef _MIDIINSPO_FEATURES_HPP_
#define _MIDIINSPO_FEATURES_HPP_

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>
#include <camoto/stream.hpp>
#include <midiinspo/header.hpp>
#include <midiinspo/scan.hpp>

namespace midiinspo {

/// Summary of a whole MIDI file.
/**
 * This is plain value data.  It holds no references to the file it was
 * produced from.
 */
struct MIDIINSPO_API FeatureRecord
{
	uint16_t formatType;     ///< Header format type (0, 1 or 2)
	uint16_t tracksDeclared; ///< Track count claimed by the header
	uint16_t division;       ///< Raw timing division from the header

	/// Payload length of each MTrk chunk, in file order.
	std::vector<uint32_t> trackLengths;

	/// Note-on count of each MTrk chunk, in file order.
	std::vector<unsigned long> noteOnEvents;

	/// Every status byte used anywhere in the file, ascending, no duplicates.
	std::vector<uint8_t> distinctStatusBytes;

	camoto::stream::len fileSize; ///< Size of the whole file in bytes

	unsigned long tracksObserved; ///< Number of MTrk chunks found
	bool trackConsistency;        ///< true if tracksObserved == tracksDeclared

	/// Average number of note-on events per observed track, 0 if no tracks.
	double density;

	FeatureRecord();

	/// Header fields this record was built from.
	Header header() const;
};

/// Combine the header and per-track statistics into a FeatureRecord.
/**
 * @param header
 *   Decoded MThd fields.
 *
 * @param tracks
 *   Statistics for each MTrk chunk, in file order.
 *
 * @param fileSize
 *   Total size of the file in bytes.
 */
MIDIINSPO_API FeatureRecord aggregateFeatures(const Header& header,
	const std::vector<TrackStats>& tracks, camoto::stream::len fileSize);

/// Extract features from MIDI data already open as a stream.
/**
 * The whole stream is examined, starting from offset zero.
 *
 * @param content
 *   MIDI data.
 *
 * @param flags
 *   One or more ScanFlags values.
 *
 * @param trackStats
 *   If not NULL, the statistics for each track are also stored here.
 *
 * @throw invalid_header
 *   The data does not begin with a valid MThd chunk.
 *
 * @throw truncated
 *   A chunk claims more data than the file contains.
 */
MIDIINSPO_API FeatureRecord extractFeatures(camoto::stream::input& content,
	unsigned int flags = ScanFlags::Default,
	std::vector<TrackStats> *trackStats = NULL);

/// Extract features from a MIDI file on disk.
/**
 * @param filename
 *   Path of the file to open.
 *
 * @param flags
 *   One or more ScanFlags values.
 *
 * @param trackStats
 *   If not NULL, the statistics for each track are also stored here.
 *
 * @throw not_found
 *   The file does not exist or could not be opened.
 *
 * @throw invalid_header
 *   The file does not begin with a valid MThd chunk.
 *
 * @throw truncated
 *   A chunk claims more data than the file contains.
 */
MIDIINSPO_API FeatureRecord extractFeatures(const std::string& filename,
	unsigned int flags = ScanFlags::Default,
	std::vector<TrackStats> *trackStats = NULL);

/// Render the record as JSON.
/**
 * Keys are written in lexicographic order with two-space indentation and
 * one list element per line, so the output for a given record is always
 * identical.  No trailing newline is added.
 */
MIDIINSPO_API std::string toJSON(const FeatureRecord& features);

/// Write the JSON rendering of the record.
MIDIINSPO_API std::ostream& operator << (std::ostream& s,
	const FeatureRecord& features);

} // namespace midiinspo

#endif // _MIDIINSPO_FEATURES_HPP_
