/**
 * @file  ideas.cpp
 * @brief Turn extracted MIDI features into creative suggestions.
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

#include <iomanip>
#include <set>
#include <sstream>
#include <midiinspo/ideas.hpp>

using namespace midiinspo;

/// MIDI channel (zero-based) reserved for percussion in General MIDI.
const unsigned int MIDI_PERC_CHANNEL = 9;

RandomSource::~RandomSource()
{
}

SeededRandomSource::SeededRandomSource(unsigned long seed)
	:	engine(seed)
{
}

unsigned int SeededRandomSource::pick(unsigned int count)
{
	std::uniform_int_distribution<unsigned int> dist(0, count - 1);
	return dist(this->engine);
}

InspirationGenerator::InspirationGenerator(const FeatureRecord& features,
	RandomSource& rng)
	:	features(features),
		rng(rng)
{
}

InspirationGenerator::~InspirationGenerator()
{
}

const std::vector<std::string>& InspirationGenerator::creativeDirections()
{
	static const std::vector<std::string> directions = {
		"Transform the harmonic rhythm by extending progressions over multiple bars.",
		"Use call-and-response motifs between melodic voices for dialogue.",
		"Swap a track's instrumentation with an unexpected timbre to spark a new vibe.",
	};
	return directions;
}

std::string InspirationGenerator::generateIdeas(bool showFeatures,
	bool showJSON)
{
	const auto& directions = InspirationGenerator::creativeDirections();
	unsigned int choice = this->rng.pick(directions.size());
	if (choice >= directions.size()) choice = directions.size() - 1;

	std::ostringstream s;
	s << "\xF0\x9F\x8E\xBC MIDI Snapshot\n" // U+1F3BC musical score
		<< this->describeStructure() << "\n"
		<< "\n"
		<< "\xE2\x9C\xA8 Creative Directions\n" // U+2728 sparkles
		<< directions[choice] << "\n"
		<< this->suggestedFocus() << "\n"
		<< this->grooveTip();

	if (showFeatures) {
		s << "\n\n\xF0\x9F\x93\x8A Feature Summary\n" // U+1F4CA bar chart
			<< toJSON(this->features);
	} else if (showJSON) {
		s << "\n\n\xF0\x9F\x93\x8A Feature JSON\n"
			<< toJSON(this->features);
	}
	return s.str();
}

std::string InspirationGenerator::describeStructure() const
{
	std::ostringstream s;
	s << "Format " << this->features.formatType << " with "
		<< this->features.tracksObserved << " track"
		<< (this->features.tracksObserved == 1 ? "" : "s")
		<< "; Timing division: " << this->features.division
		<< "; Average note density: " << std::fixed << std::setprecision(2)
		<< this->features.density;
	if (!this->features.trackConsistency) {
		s << "; Declared track count does not match observed data";
	}
	return s.str();
}

std::string InspirationGenerator::suggestedFocus() const
{
	if (this->features.density < IDEAS_SPARSE_DENSITY) {
		return "Consider adding rhythmic ostinatos to increase energy.";
	}
	if (this->features.density > IDEAS_BUSY_DENSITY) {
		return "Try introducing sparse breakdowns for contrast.";
	}
	return "Balance momentum with space by alternating busy and calm sections.";
}

std::string InspirationGenerator::grooveTip() const
{
	// Look for note-on events on the percussion channel
	std::set<unsigned int> percChannels;
	for (auto status : this->features.distinctStatusBytes) {
		if (((status & 0xF0) == 0x90) && ((status & 0x0F) == MIDI_PERC_CHANNEL)) {
			percChannels.insert(status & 0x0F);
		}
	}
	if (percChannels.empty()) {
		return "Experiment with layering tuned percussion or found sounds for "
			"unique grooves.";
	}

	std::ostringstream s;
	s << "Highlight the percussion on channel(s) ";
	for (auto i = percChannels.begin(); i != percChannels.end(); i++) {
		if (i != percChannels.begin()) s << ", ";
		s << *i;
	}
	s << " with subtle dynamics.";
	return s.str();
}
