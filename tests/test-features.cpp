/**
 * @file   test-features.cpp
 * @brief  Test code for whole-file feature extraction.
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

#include <boost/test/unit_test.hpp>

#include <sstream>
#include <camoto/stream_string.hpp>
#include <midiinspo/features.hpp>
#include <midiinspo/exceptions.hpp>
#include "tests.hpp"

using namespace camoto;
using namespace midiinspo;

/// Header for a format 1 file with one track at 480 ticks per quarter note.
#define SMF_HEADER_1TRACK \
	"MThd\x00\x00\x00\x06" "\x00\x01" "\x00\x01" "\x01\xE0"

/// One track holding a single note.
#define SMF_TRACK_ONE_NOTE \
	"MTrk\x00\x00\x00\x08" \
	"\x00\x90\x3C\x40" \
	"\x60\x80\x3C\x40"

struct test_features: public test_main
{
	stream::string base;
	FeatureRecord features;
	std::vector<TrackStats> tracks;

	void init(const std::string& data,
		unsigned int flags = ScanFlags::Default)
	{
		this->base << data;
		this->base.seekg(0, stream::start);
		this->features = extractFeatures(this->base, flags, &this->tracks);
	}
};

BOOST_FIXTURE_TEST_SUITE(features, test_features)

BOOST_AUTO_TEST_CASE(single_track)
{
	BOOST_TEST_MESSAGE("Extracting features from a one-note file");

	this->init(STRING_WITH_NULLS(SMF_HEADER_1TRACK SMF_TRACK_ONE_NOTE));

	BOOST_CHECK_EQUAL(this->features.formatType, 1);
	BOOST_CHECK_EQUAL(this->features.tracksDeclared, 1);
	BOOST_CHECK_EQUAL(this->features.division, 480);
	BOOST_CHECK_EQUAL(this->features.fileSize, 30);
	BOOST_CHECK_EQUAL(this->features.tracksObserved, 1);
	BOOST_CHECK(this->features.trackConsistency);
	BOOST_CHECK_EQUAL(this->features.density, 1.0);

	Header header = this->features.header();
	BOOST_CHECK_EQUAL(header.formatType, 1);
	BOOST_CHECK(header.isPPQN());
	BOOST_CHECK_EQUAL(header.ticksPerQuarterNote(), 480);

	BOOST_REQUIRE_EQUAL(this->features.trackLengths.size(), 1);
	BOOST_CHECK_EQUAL(this->features.trackLengths[0], 8);
	BOOST_REQUIRE_EQUAL(this->features.noteOnEvents.size(), 1);
	BOOST_CHECK_EQUAL(this->features.noteOnEvents[0], 1);

	BOOST_REQUIRE_EQUAL(this->features.distinctStatusBytes.size(), 2);
	BOOST_CHECK_EQUAL(this->features.distinctStatusBytes[0], 0x80);
	BOOST_CHECK_EQUAL(this->features.distinctStatusBytes[1], 0x90);

	BOOST_REQUIRE_EQUAL(this->tracks.size(), 1);
	BOOST_CHECK(this->tracks[0].complete);
}

BOOST_AUTO_TEST_CASE(no_tracks)
{
	BOOST_TEST_MESSAGE("File declaring a track but containing none");

	this->init(STRING_WITH_NULLS(SMF_HEADER_1TRACK));

	BOOST_CHECK_EQUAL(this->features.tracksObserved, 0);
	BOOST_CHECK(!this->features.trackConsistency);
	BOOST_CHECK_EQUAL(this->features.density, 0.0);
	BOOST_CHECK(this->features.trackLengths.empty());
	BOOST_CHECK(this->features.noteOnEvents.empty());
	BOOST_CHECK(this->features.distinctStatusBytes.empty());
}

BOOST_AUTO_TEST_CASE(no_tracks_declared)
{
	BOOST_TEST_MESSAGE("File declaring and containing no tracks");

	this->init(STRING_WITH_NULLS(
		"MThd\x00\x00\x00\x06" "\x00\x01" "\x00\x00" "\x00\x60"
	));

	BOOST_CHECK_EQUAL(this->features.tracksDeclared, 0);
	BOOST_CHECK_EQUAL(this->features.tracksObserved, 0);
	BOOST_CHECK(this->features.trackConsistency);
	BOOST_CHECK_EQUAL(this->features.density, 0.0);
}

BOOST_AUTO_TEST_CASE(short_header_length)
{
	BOOST_TEST_MESSAGE("Header length below six hides the following chunks");

	this->init(STRING_WITH_NULLS(
		"MThd\x00\x00\x00\x00" "\x00\x01" "\x00\x01" "\x01\xE0"
		SMF_TRACK_ONE_NOTE
	));

	BOOST_CHECK_EQUAL(this->features.tracksDeclared, 1);
	BOOST_CHECK_EQUAL(this->features.tracksObserved, 0);
	BOOST_CHECK(!this->features.trackConsistency);
	BOOST_CHECK(this->features.noteOnEvents.empty());
	BOOST_CHECK_EQUAL(this->features.fileSize, 30);
}

BOOST_AUTO_TEST_CASE(multiple_tracks)
{
	BOOST_TEST_MESSAGE("Density and status bytes across several tracks");

	this->init(STRING_WITH_NULLS(
		"MThd\x00\x00\x00\x06" "\x00\x01" "\x00\x02" "\x00\x60"
		"MTrk\x00\x00\x00\x0B"
		"\x00\xC1\x05"
		"\x00\x91\x3C\x40"
		"\x00\x3E\x40"
		"\x00"
		"MTrk\x00\x00\x00\x04"
		"\x00\x99\x24\x64"
	));
	// First track ends in a lone delay, so only its notes count

	BOOST_CHECK_EQUAL(this->features.tracksObserved, 2);
	BOOST_CHECK(this->features.trackConsistency);
	BOOST_REQUIRE_EQUAL(this->features.noteOnEvents.size(), 2);
	BOOST_CHECK_EQUAL(this->features.noteOnEvents[0], 2);
	BOOST_CHECK_EQUAL(this->features.noteOnEvents[1], 1);
	BOOST_CHECK_EQUAL(this->features.density, 1.5);

	BOOST_REQUIRE_EQUAL(this->features.trackLengths.size(), 2);
	BOOST_CHECK_EQUAL(this->features.trackLengths[0], 11);
	BOOST_CHECK_EQUAL(this->features.trackLengths[1], 4);

	BOOST_REQUIRE_EQUAL(this->features.distinctStatusBytes.size(), 3);
	BOOST_CHECK_EQUAL(this->features.distinctStatusBytes[0], 0x91);
	BOOST_CHECK_EQUAL(this->features.distinctStatusBytes[1], 0x99);
	BOOST_CHECK_EQUAL(this->features.distinctStatusBytes[2], 0xC1);

	BOOST_REQUIRE_EQUAL(this->tracks.size(), 2);
	BOOST_CHECK(!this->tracks[0].complete);
	BOOST_CHECK(this->tracks[1].complete);
}

BOOST_AUTO_TEST_CASE(other_chunks_ignored)
{
	BOOST_TEST_MESSAGE("Chunks other than MTrk are skipped");

	this->init(STRING_WITH_NULLS(
		SMF_HEADER_1TRACK
		"XFIH\x00\x00\x00\x03" "\x90\x3C\x40"
		SMF_TRACK_ONE_NOTE
	));

	BOOST_CHECK_EQUAL(this->features.tracksObserved, 1);
	BOOST_CHECK(this->features.trackConsistency);
	BOOST_REQUIRE_EQUAL(this->features.trackLengths.size(), 1);
	BOOST_CHECK_EQUAL(this->features.trackLengths[0], 8);
	BOOST_CHECK_EQUAL(this->features.fileSize, 41);
}

BOOST_AUTO_TEST_CASE(truncated_track)
{
	BOOST_TEST_MESSAGE("Track claiming more data than the file holds");

	BOOST_CHECK_THROW(
		this->init(STRING_WITH_NULLS(
			SMF_HEADER_1TRACK
			"MTrk\x00\x00\x00\x20" "\x00\x90\x3C\x40"
		)),
		truncated
	);
}

BOOST_AUTO_TEST_CASE(not_midi)
{
	BOOST_TEST_MESSAGE("Rejecting a file that is not MIDI");

	BOOST_CHECK_THROW(this->init("This is not a MIDI file"), invalid_header);
}

BOOST_AUTO_TEST_CASE(too_short)
{
	BOOST_TEST_MESSAGE("Rejecting data too short for a header");

	BOOST_CHECK_THROW(this->init(STRING_WITH_NULLS("MThd\x00\x00")),
		invalid_header);
}

BOOST_AUTO_TEST_CASE(empty)
{
	BOOST_TEST_MESSAGE("Rejecting an empty file");

	BOOST_CHECK_THROW(this->init(std::string()), invalid_header);
	BOOST_CHECK_EQUAL(this->base.data.size(), 0);
}

BOOST_AUTO_TEST_CASE(repeated_status_bytes)
{
	BOOST_TEST_MESSAGE("Status bytes repeated across tracks are listed once");

	this->init(STRING_WITH_NULLS(
		"MThd\x00\x00\x00\x06" "\x00\x01" "\x00\x02" "\x00\x60"
		"MTrk\x00\x00\x00\x0C"
		"\x00\x90\x3C\x40" "\x00\x80\x3C\x40" "\x00\x90\x3E\x40"
		"MTrk\x00\x00\x00\x08"
		"\x00\x80\x3C\x40" "\x00\x90\x3C\x40"
	));

	BOOST_REQUIRE_EQUAL(this->features.distinctStatusBytes.size(), 2);
	BOOST_CHECK_EQUAL(this->features.distinctStatusBytes[0], 0x80);
	BOOST_CHECK_EQUAL(this->features.distinctStatusBytes[1], 0x90);
	BOOST_CHECK_EQUAL(this->features.noteOnEvents[0], 2);
	BOOST_CHECK_EQUAL(this->features.noteOnEvents[1], 1);
}

BOOST_AUTO_TEST_CASE(missing_file)
{
	BOOST_TEST_MESSAGE("Opening a file that does not exist");

	try {
		extractFeatures("/nonexistent/midiinspo-test.mid");
		BOOST_FAIL("Missing file was opened");
	} catch (const feature_error& e) {
		BOOST_CHECK_EQUAL(e.kind(), ErrorKind::NotFound);
		BOOST_CHECK(std::string(e.what()).find("midiinspo-test.mid")
			!= std::string::npos);
	}
}

BOOST_AUTO_TEST_CASE(json)
{
	BOOST_TEST_MESSAGE("Rendering features as JSON");

	this->init(STRING_WITH_NULLS(SMF_HEADER_1TRACK SMF_TRACK_ONE_NOTE));

	BOOST_CHECK_MESSAGE(
		this->is_equal(
			"{\n"
			"  \"density\": 1.0,\n"
			"  \"distinct_status_bytes\": [\n"
			"    128,\n"
			"    144\n"
			"  ],\n"
			"  \"division\": 480,\n"
			"  \"file_size\": 30,\n"
			"  \"format_type\": 1,\n"
			"  \"note_on_events\": [\n"
			"    1\n"
			"  ],\n"
			"  \"track_consistency\": true,\n"
			"  \"track_lengths\": [\n"
			"    8\n"
			"  ],\n"
			"  \"tracks_declared\": 1,\n"
			"  \"tracks_observed\": 1\n"
			"}",
			toJSON(this->features)
		),
		"Error rendering feature JSON"
	);
}

BOOST_AUTO_TEST_CASE(json_empty)
{
	BOOST_TEST_MESSAGE("Rendering features of a file with no tracks");

	this->init(STRING_WITH_NULLS(SMF_HEADER_1TRACK));

	std::ostringstream ss;
	ss << this->features;

	BOOST_CHECK_MESSAGE(
		this->is_equal(
			"{\n"
			"  \"density\": 0.0,\n"
			"  \"distinct_status_bytes\": [],\n"
			"  \"division\": 480,\n"
			"  \"file_size\": 14,\n"
			"  \"format_type\": 1,\n"
			"  \"note_on_events\": [],\n"
			"  \"track_consistency\": false,\n"
			"  \"track_lengths\": [],\n"
			"  \"tracks_declared\": 1,\n"
			"  \"tracks_observed\": 0\n"
			"}",
			ss.str()
		),
		"Error rendering feature JSON for an empty file"
	);
}

BOOST_AUTO_TEST_CASE(json_fractional_density)
{
	BOOST_TEST_MESSAGE("Fractional density is written in full");

	Header header;
	std::vector<TrackStats> t(3);
	t[0].noteOnCount = 1;
	FeatureRecord f = aggregateFeatures(header, t, 0);
	BOOST_CHECK_MESSAGE(
		toJSON(f).find("\"density\": 0.3333333333333333,") != std::string::npos,
		toJSON(f));

	t[1].noteOnCount = 1;
	f = aggregateFeatures(header, t, 0);
	BOOST_CHECK_MESSAGE(
		toJSON(f).find("\"density\": 0.6666666666666666,") != std::string::npos,
		toJSON(f));

	t[2].noteOnCount = 2;
	f = aggregateFeatures(header, t, 0);
	BOOST_CHECK_MESSAGE(
		toJSON(f).find("\"density\": 1.3333333333333333,") != std::string::npos,
		toJSON(f));
}

BOOST_AUTO_TEST_SUITE_END()
