/**
 * @file  midiinspo.hpp
 * @brief Main header for libmidiinspo (includes all other headers.)
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

#ifndef _MIDIINSPO_HPP_
#define _MIDIINSPO_HPP_

/// Namespace for this library
namespace midiinspo {

/**

\mainpage libmidiinspo

libmidiinspo examines Standard MIDI Files and turns their structure into
suggestions for further composition.

\section structure Structure

The main entry point is extractFeatures(), which reads a MIDI file and
returns a FeatureRecord.  The record holds the header fields, the size and
note count of every track, and every distinct status byte used in the file.

Internally the file is read with a ByteCursor.  decodeHeader() handles the
MThd chunk, nextChunk() frames each following chunk and scanTrack() walks the
events in every MTrk chunk.  Damaged track data never stops the extraction,
the affected track simply reports what was decoded before the damage.

An InspirationGenerator turns a FeatureRecord into text, drawing its choices
from a caller-supplied RandomSource.  The InspirationApp class ties these
together for interactive front-ends, which only need to implement the
UserInterface class.

\section example Examples

The libmidiinspo distribution comes with a command-line interface in the form
of the midiinspo utility.  For a small "hello world" example:

@code
midiinspo::FeatureRecord f = midiinspo::extractFeatures("song.mid");
std::cout << f << std::endl;
@endcode

**/
}

#include <midiinspo/exceptions.hpp>
#include <midiinspo/cursor.hpp>
#include <midiinspo/chunk.hpp>
#include <midiinspo/header.hpp>
#include <midiinspo/scan.hpp>
#include <midiinspo/features.hpp>
#include <midiinspo/ideas.hpp>
#include <midiinspo/ui.hpp>

#endif // _MIDIINSPO_HPP_
