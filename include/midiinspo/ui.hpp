/**
 * @file  ui.hpp
 * @brief Front-end independent application logic.
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

#ifndef _MIDIINSPO_UI_HPP_
#define _MIDIINSPO_UI_HPP_

#include <functional>
#include <memory>
#include <string>
#include <midiinspo/ideas.hpp>

namespace midiinspo {

/// Operations a front-end must provide to host an InspirationApp.
/**
 * Implement this for each toolkit (or for the console) and hand it to the
 * InspirationApp.  None of the functions may throw.
 */
class MIDIINSPO_API UserInterface
{
	public:
		virtual ~UserInterface();

		/// Ask the user to pick a MIDI file.
		/**
		 * @param title
		 *   Dialog title.
		 *
		 * @return Selected path, or an empty string if the user cancelled.
		 */
		virtual std::string askOpenFilename(const std::string& title) = 0;

		/// Show an informational message.
		virtual void showInfo(const std::string& title,
			const std::string& message) = 0;

		/// Show an error message.
		virtual void showError(const std::string& title,
			const std::string& message) = 0;

		/// Replace the contents of the main text display.
		virtual void setText(const std::string& text) = 0;
};

/// Creates the generator used to describe a set of features.
typedef std::function<std::unique_ptr<InspirationGenerator>(
	const FeatureRecord&)> GeneratorFactory;

/// Factory producing standard generators drawing from the given source.
/**
 * @param rng
 *   Random source shared by every generator created.  Must outlive the
 *   factory.
 */
MIDIINSPO_API GeneratorFactory defaultGeneratorFactory(RandomSource& rng);

/// Application state and actions, independent of any toolkit.
class MIDIINSPO_API InspirationApp
{
	public:
		/// Constructor.
		/**
		 * @param ui
		 *   Front-end to report to.  Must outlive this object.
		 *
		 * @param generatorFactory
		 *   Called to create a generator each time ideas are produced.
		 *
		 * @param scanFlags
		 *   ScanFlags to use when reading files.
		 */
		InspirationApp(UserInterface& ui, GeneratorFactory generatorFactory,
			unsigned int scanFlags = ScanFlags::Default);

		/// Let the user choose a file, keeping the old one if they cancel.
		void browse();

		/// Set the file to analyse.
		void selectFile(const std::string& filename);

		/// Currently selected file, empty if none.
		const std::string& selectedFile() const;

		/// Include the feature summary in the output.
		/**
		 * Turning this on turns off showJSON(), as the summary already
		 * contains the same data.
		 */
		void showFeatures(bool enable);
		bool showFeatures() const;

		/// Include the raw feature JSON in the output.
		void showJSON(bool enable);
		bool showJSON() const;

		/// Analyse the selected file and display the result.
		/**
		 * Problems are reported through the UserInterface rather than by
		 * exception.
		 */
		void generateIdeas();

	protected:
		UserInterface& ui;                 ///< Front-end
		GeneratorFactory generatorFactory; ///< Makes InspirationGenerators
		unsigned int scanFlags;            ///< ScanFlags for extraction
		std::string filename;              ///< Selected file
		bool bShowFeatures;                ///< Feature summary toggle
		bool bShowJSON;                    ///< JSON toggle
};

} // namespace midiinspo

#endif // _MIDIINSPO_UI_HPP_
