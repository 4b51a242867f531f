/**
 * @file  ideas.hpp
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

#ifndef _MIDIINSPO_IDEAS_HPP_
#define _MIDIINSPO_IDEAS_HPP_

#include <random>
#include <string>
#include <vector>
#include <midiinspo/features.hpp>

namespace midiinspo {

/// Density below which the song is considered sparse.
const double IDEAS_SPARSE_DENSITY = 4;

/// Density above which the song is considered busy.
const double IDEAS_BUSY_DENSITY = 16;

/// Source of random choices, supplied by the caller.
class MIDIINSPO_API RandomSource
{
	public:
		virtual ~RandomSource();

		/// Pick an index.
		/**
		 * @param count
		 *   Number of options.  Must be at least 1.
		 *
		 * @return A value from 0 to count - 1 inclusive.
		 */
		virtual unsigned int pick(unsigned int count) = 0;
};

/// RandomSource backed by a Mersenne Twister.
class MIDIINSPO_API SeededRandomSource: virtual public RandomSource
{
	public:
		/// Constructor.
		/**
		 * @param seed
		 *   Seed value.  The same seed always produces the same choices.
		 */
		SeededRandomSource(unsigned long seed);

		virtual unsigned int pick(unsigned int count);

	private:
		std::mt19937 engine;
};

/// Convert a FeatureRecord into natural-language inspiration.
class MIDIINSPO_API InspirationGenerator
{
	public:
		/// Constructor.
		/**
		 * @param features
		 *   Features to describe.  A copy is kept.
		 *
		 * @param rng
		 *   Source used to choose between equivalent phrasings.  Must remain
		 *   valid for the lifetime of this object.
		 */
		InspirationGenerator(const FeatureRecord& features, RandomSource& rng);

		virtual ~InspirationGenerator();

		/// Produce the full suggestion text.
		/**
		 * @param showFeatures
		 *   Append a feature summary (the JSON rendering) to the output.
		 *
		 * @param showJSON
		 *   Append the raw feature JSON.  Ignored if showFeatures is set.
		 *
		 * @return Multi-line text, lines separated by '\n'.
		 */
		virtual std::string generateIdeas(bool showFeatures, bool showJSON);

		/// One-line description of the song layout.
		std::string describeStructure() const;

		/// Suggestion based on how busy the song is.
		std::string suggestedFocus() const;

		/// Suggestion based on the use of the percussion channel.
		std::string grooveTip() const;

		/// The phrasings generateIdeas() chooses between.
		static const std::vector<std::string>& creativeDirections();

	protected:
		FeatureRecord features; ///< Features being described
		RandomSource& rng;      ///< Caller-supplied random source
};

} // namespace midiinspo

#endif // _MIDIINSPO_IDEAS_HPP_
