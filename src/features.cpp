/**
 * @file  features.cpp
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

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <set>
#include <sstream>
#include <camoto/stream_file.hpp>
#include <midiinspo/chunk.hpp>
#include <midiinspo/features.hpp>
#include <midiinspo/exceptions.hpp>

using namespace camoto;
using namespace midiinspo;

FeatureRecord::FeatureRecord()
	:	formatType(0),
		tracksDeclared(0),
		division(0),
		fileSize(0),
		tracksObserved(0),
		trackConsistency(false),
		density(0)
{
}

Header FeatureRecord::header() const
{
	Header h;
	h.formatType = this->formatType;
	h.tracksDeclared = this->tracksDeclared;
	h.division = this->division;
	return h;
}

FeatureRecord midiinspo::aggregateFeatures(const Header& header,
	const std::vector<TrackStats>& tracks, stream::len fileSize)
{
	FeatureRecord features;
	features.formatType = header.formatType;
	features.tracksDeclared = header.tracksDeclared;
	features.division = header.division;
	features.fileSize = fileSize;

	std::set<uint8_t> statusBytes;
	unsigned long totalNoteOn = 0;
	for (const auto& t : tracks) {
		features.trackLengths.push_back(t.byteLength);
		features.noteOnEvents.push_back(t.noteOnCount);
		totalNoteOn += t.noteOnCount;
		statusBytes.insert(t.statusBytesSeen.begin(), t.statusBytesSeen.end());
	}
	features.distinctStatusBytes.assign(statusBytes.begin(), statusBytes.end());

	features.tracksObserved = tracks.size();
	features.trackConsistency =
		features.tracksObserved == features.tracksDeclared;
	if (features.tracksObserved) {
		features.density = static_cast<double>(totalNoteOn)
			/ features.tracksObserved;
	} else {
		features.density = 0;
	}

	return features;
}

FeatureRecord midiinspo::extractFeatures(stream::input& content,
	unsigned int flags, std::vector<TrackStats> *trackStats)
{
	stream::len fileSize = content.size();
	content.seekg(0, stream::start);

	ByteCursor cursor(content);
	Header header = decodeHeader(cursor);

	std::vector<TrackStats> tracks;
	Chunk chunk;
	while (nextChunk(cursor, &chunk)) {
		// Ignore non-track chunks (rare but valid extension chunks)
		if (!chunk.is(SMF_TAG_TRACK)) continue;

		tracks.push_back(scanTrack(chunk.payload, flags));
	}

	FeatureRecord features = aggregateFeatures(header, tracks, fileSize);
	if (trackStats) *trackStats = std::move(tracks);
	return features;
}

FeatureRecord midiinspo::extractFeatures(const std::string& filename,
	unsigned int flags, std::vector<TrackStats> *trackStats)
{
	std::unique_ptr<stream::input_file> content;
	try {
		content.reset(new stream::input_file(filename));
	} catch (const stream::open_error& e) {
		throw not_found("MIDI file not found: " + filename + " (" + e.what()
			+ ")");
	}
	return extractFeatures(*content, flags, trackStats);
}

/// Format the density so it always reads as a real number, e.g. "1.0".
/**
 * The shortest form that reads back as the same value is used, so 2/3 comes
 * out as 0.6666666666666666.
 */
static std::string formatDensity(double density)
{
	std::string s;
	for (int digits = 1; digits <= std::numeric_limits<double>::max_digits10;
		digits++
	) {
		std::ostringstream ss;
		ss << std::setprecision(digits) << density;
		s = ss.str();
		if (strtod(s.c_str(), NULL) == density) break;
	}
	if (std::isfinite(density) && (s.find_first_of(".eE") == std::string::npos)) {
		s += ".0";
	}
	return s;
}

/// Write a list of integers as a JSON array, one element per line.
template <class T>
static void writeList(std::ostream& s, const std::vector<T>& list)
{
	if (list.empty()) {
		s << "[]";
		return;
	}
	s << "[\n";
	for (auto i = list.begin(); i != list.end(); i++) {
		if (i != list.begin()) s << ",\n";
		// unary + promotes uint8_t so it prints as a number
		s << "    " << +*i;
	}
	s << "\n  ]";
	return;
}

std::string midiinspo::toJSON(const FeatureRecord& features)
{
	std::ostringstream s;
	// Keys must stay in lexicographic order
	s << "{\n";
	s << "  \"density\": " << formatDensity(features.density) << ",\n";
	s << "  \"distinct_status_bytes\": ";
	writeList(s, features.distinctStatusBytes);
	s << ",\n";
	s << "  \"division\": " << features.division << ",\n";
	s << "  \"file_size\": " << features.fileSize << ",\n";
	s << "  \"format_type\": " << features.formatType << ",\n";
	s << "  \"note_on_events\": ";
	writeList(s, features.noteOnEvents);
	s << ",\n";
	s << "  \"track_consistency\": "
		<< (features.trackConsistency ? "true" : "false") << ",\n";
	s << "  \"track_lengths\": ";
	writeList(s, features.trackLengths);
	s << ",\n";
	s << "  \"tracks_declared\": " << features.tracksDeclared << ",\n";
	s << "  \"tracks_observed\": " << features.tracksObserved << "\n";
	s << "}";
	return s.str();
}

MIDIINSPO_API std::ostream& midiinspo::operator<< (std::ostream& s,
	const FeatureRecord& features)
{
	return s << toJSON(features);
}
