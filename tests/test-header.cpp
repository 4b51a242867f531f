/**
 * @file   test-header.cpp
 * @brief  Test code for chunk framing and MThd decoding.
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

#include <camoto/stream_string.hpp>
#include <midiinspo/chunk.hpp>
#include <midiinspo/header.hpp>
#include <midiinspo/exceptions.hpp>
#include "tests.hpp"

using namespace camoto;
using namespace midiinspo;

struct test_header: public test_main
{
	stream::string base;

	void init(const std::string& data)
	{
		this->base << data;
		this->base.seekg(0, stream::start);
	}
};

BOOST_FIXTURE_TEST_SUITE(header, test_header)

BOOST_AUTO_TEST_CASE(decode)
{
	BOOST_TEST_MESSAGE("Decoding a standard header");

	this->init(STRING_WITH_NULLS(
		"MThd\x00\x00\x00\x06" "\x00\x01" "\x00\x02" "\x01\xE0"
		"MTrk"
	));
	ByteCursor c(this->base);
	Header h = decodeHeader(c);
	BOOST_CHECK_EQUAL(h.formatType, 1);
	BOOST_CHECK_EQUAL(h.tracksDeclared, 2);
	BOOST_CHECK_EQUAL(h.division, 480);
	BOOST_CHECK(h.isPPQN());
	BOOST_CHECK_EQUAL(h.ticksPerQuarterNote(), 480);
	BOOST_CHECK_EQUAL(c.tellg(), 14);
}

BOOST_AUTO_TEST_CASE(smpte_division)
{
	BOOST_TEST_MESSAGE("Decoding an SMPTE timing division");

	// -25 fps, 40 ticks per frame
	this->init(STRING_WITH_NULLS(
		"MThd\x00\x00\x00\x06" "\x00\x00" "\x00\x01" "\xE7\x28"
	));
	ByteCursor c(this->base);
	Header h = decodeHeader(c);
	BOOST_CHECK(!h.isPPQN());
	BOOST_CHECK_EQUAL(h.smpteFramesPerSecond(), 25);
	BOOST_CHECK_EQUAL(h.smpteTicksPerFrame(), 40);
}

BOOST_AUTO_TEST_CASE(too_short)
{
	BOOST_TEST_MESSAGE("Rejecting data shorter than a header");

	this->init(STRING_WITH_NULLS("MThd\x00\x00\x00\x06\x00\x01"));
	ByteCursor c(this->base);
	try {
		decodeHeader(c);
		BOOST_FAIL("Short header was accepted");
	} catch (const feature_error& e) {
		BOOST_CHECK_EQUAL(e.kind(), ErrorKind::InvalidHeader);
	}
}

BOOST_AUTO_TEST_CASE(bad_signature)
{
	BOOST_TEST_MESSAGE("Rejecting data without an MThd signature");

	this->init(STRING_WITH_NULLS(
		"RIFF\x00\x00\x00\x06" "\x00\x01" "\x00\x01" "\x01\xE0"
	));
	ByteCursor c(this->base);
	BOOST_CHECK_THROW(decodeHeader(c), invalid_header);
}

BOOST_AUTO_TEST_CASE(extension_skipped)
{
	BOOST_TEST_MESSAGE("Skipping extra bytes in a long header");

	this->init(STRING_WITH_NULLS(
		"MThd\x00\x00\x00\x08" "\x00\x00" "\x00\x01" "\x00\x60" "\xAA\xBB"
		"MTrk\x00\x00\x00\x00"
	));
	ByteCursor c(this->base);
	Header h = decodeHeader(c);
	BOOST_CHECK_EQUAL(h.division, 0x60);
	BOOST_CHECK_EQUAL(c.tellg(), 16);

	Chunk chunk;
	BOOST_REQUIRE(nextChunk(c, &chunk));
	BOOST_CHECK(chunk.is(SMF_TAG_TRACK));
}

BOOST_AUTO_TEST_CASE(extension_truncated)
{
	BOOST_TEST_MESSAGE("Header claiming more data than the file holds");

	this->init(STRING_WITH_NULLS(
		"MThd\x00\x00\x00\x10" "\x00\x00" "\x00\x01" "\x00\x60" "\xAA"
	));
	ByteCursor c(this->base);
	BOOST_CHECK_THROW(decodeHeader(c), truncated);
}

BOOST_AUTO_TEST_CASE(short_length)
{
	BOOST_TEST_MESSAGE("Header claiming to be shorter than its fields");

	this->init(STRING_WITH_NULLS(
		"MThd\x00\x00\x00\x00" "\x00\x01" "\x00\x01" "\x01\xE0"
		"MTrk\x00\x00\x00\x04" "\x00\x90\x3C\x40"
	));
	ByteCursor c(this->base);
	Header h = decodeHeader(c);
	BOOST_CHECK_EQUAL(h.formatType, 1);
	BOOST_CHECK_EQUAL(h.tracksDeclared, 1);
	BOOST_CHECK_EQUAL(h.division, 480);

	// Nothing left to frame as a chunk
	BOOST_CHECK(c.atEnd());
	Chunk chunk;
	BOOST_CHECK(!nextChunk(c, &chunk));
}

BOOST_AUTO_TEST_CASE(chunk_framing)
{
	BOOST_TEST_MESSAGE("Reading consecutive chunks");

	this->init(STRING_WITH_NULLS(
		"MTrk\x00\x00\x00\x03" "\x00\xFF\x2F"
		"XFIH\x00\x00\x00\x00"
		"\x00\x00\x00" // trailing bytes too short for another chunk
	));
	ByteCursor c(this->base);
	Chunk chunk;

	BOOST_REQUIRE(nextChunk(c, &chunk));
	BOOST_CHECK_EQUAL(chunk.tag, "MTrk");
	BOOST_CHECK_EQUAL(chunk.length, 3);
	BOOST_CHECK(this->is_equal(STRING_WITH_NULLS("\x00\xFF\x2F"),
		std::string(chunk.payload.begin(), chunk.payload.end())));

	BOOST_REQUIRE(nextChunk(c, &chunk));
	BOOST_CHECK_EQUAL(chunk.tag, "XFIH");
	BOOST_CHECK(!chunk.is(SMF_TAG_TRACK));
	BOOST_CHECK(chunk.payload.empty());

	BOOST_CHECK(!nextChunk(c, &chunk));
}

BOOST_AUTO_TEST_CASE(chunk_truncated)
{
	BOOST_TEST_MESSAGE("Chunk claiming more data than the file holds");

	this->init(STRING_WITH_NULLS("MTrk\x00\x00\x00\x10" "\x00\x90\x3C"));
	ByteCursor c(this->base);
	Chunk chunk;
	try {
		nextChunk(c, &chunk);
		BOOST_FAIL("Truncated chunk was accepted");
	} catch (const feature_error& e) {
		BOOST_CHECK_EQUAL(e.kind(), ErrorKind::Truncated);
	}
}

BOOST_AUTO_TEST_SUITE_END()
