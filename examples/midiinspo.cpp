/**
 * @file  midiinspo.cpp
 * @brief Command-line interface to libmidiinspo.
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

#include <chrono>
#include <iostream>
#include <boost/program_options.hpp>
#include <camoto/stream.hpp>
#include <midiinspo.hpp>

namespace po = boost::program_options;
using namespace camoto;

#define PROGNAME "midiinspo"

/*** Return values ***/
// All is good
#define RET_OK                 0
// Major error (no file given, couldn't open file, not a MIDI file, etc.)
#define RET_SHOWSTOPPER        1
// Bad arguments (unknown option, invalid parameters)
#define RET_BADARGS            2
// Some files failed, but not in a common way (cut off read, etc.)
#define RET_UNCOMMON_FAILURE   5

/// Front-end that talks to the user through the terminal.
class ConsoleInterface: virtual public midiinspo::UserInterface
{
	public:
		ConsoleInterface()
			:	errorShown(false)
		{
		}

		virtual std::string askOpenFilename(const std::string& title)
		{
			std::cout << title << " (blank to cancel): " << std::flush;
			std::string filename;
			if (!std::getline(std::cin, filename)) filename.clear();
			return filename;
		}

		virtual void showInfo(const std::string& title,
			const std::string& message)
		{
			std::cout << title << ": " << message << std::endl;
		}

		virtual void showError(const std::string& title,
			const std::string& message)
		{
			std::cerr << PROGNAME ": " << title << ": " << message << std::endl;
			this->errorShown = true;
		}

		virtual void setText(const std::string& text)
		{
			std::cout << text << std::endl;
		}

		/// Has showError() been called?
		bool errorShown;
};

/// Print the header and per-track diagnostics gathered during extraction.
void listTracks(const midiinspo::FeatureRecord& features,
	const std::vector<midiinspo::TrackStats>& tracks)
{
	midiinspo::Header header = features.header();
	std::cout << "Format " << header.formatType << ", "
		<< header.tracksDeclared << " tracks declared, timing ";
	if (header.isPPQN()) {
		std::cout << header.ticksPerQuarterNote() << " ticks per quarter note";
	} else {
		std::cout << header.smpteFramesPerSecond() << " fps SMPTE, "
			<< header.smpteTicksPerFrame() << " ticks per frame";
	}
	std::cout << "\n";

	unsigned int j = 0;
	for (const auto& t : tracks) {
		std::cout << "Track " << j << ": " << t.byteLength << " bytes, "
			<< t.eventsDecoded << " events, " << t.noteOnCount << " note-on";
		if (!t.complete) std::cout << " [scan stopped early, data damaged]";
		std::cout << "\n";
		j++;
	}
	std::cout << tracks.size() << " tracks scanned." << std::endl;
	return;
}

int main(int iArgC, char *cArgV[])
{
#ifdef __GLIBCXX__
	// Set a better exception handler
	std::set_terminate(__gnu_cxx::__verbose_terminate_handler);
#endif

	// Disable stdin/printf/etc. sync for a speed boost
	std::ios_base::sync_with_stdio(false);

	// Declare the supported options.
	po::options_description poOptions("Options");
	poOptions.add_options()
		("show-features,f",
			"include a human-readable feature dump in the output")
		("show-json,j",
			"include the raw feature JSON in the output")
		("seed", po::value<unsigned long>(),
			"seed for choosing between suggestions [default=current time]")
		("system-messages,x",
			"skip SysEx payloads and system common message data instead of "
			"assuming they are empty")
		("interactive,i",
			"prompt for the MIDI file and report problems as dialog messages")
		("verbose,v",
			"list statistics for each track before the suggestions")
	;

	po::options_description poHidden("Hidden parameters");
	poHidden.add_options()
		("midi", po::value<std::string>(), "MIDI file to analyze")
		("help", "produce help message")
	;

	po::options_description poComplete("Parameters");
	poComplete.add(poOptions).add(poHidden);

	po::positional_options_description poPositional;
	poPositional.add("midi", 1);

	std::string strFilename;
	bool bShowFeatures = false;
	bool bShowJSON = false;
	bool bInteractive = false;
	bool bVerbose = false;
	unsigned int scanFlags = midiinspo::ScanFlags::Default;
	unsigned long seed = std::chrono::system_clock::now().time_since_epoch().count();
	try {
		po::parsed_options pa = po::command_line_parser(iArgC, cArgV)
			.options(poComplete)
			.positional(poPositional)
			.run();

		for (auto& i : pa.options) {
			if (i.string_key.compare("midi") == 0) {
				// If we've already got a filename, complain that a second one
				// was given (probably a typo.)
				if (!strFilename.empty()) {
					std::cerr << PROGNAME ": unexpected extra parameter (multiple "
						"filenames given?!)" << std::endl;
					return RET_BADARGS;
				}
				strFilename = i.value[0];
			} else if (i.string_key.compare("help") == 0) {
				std::cout <<
					"Copyright (C) 2026 The libmidiinspo authors\n"
					"This program comes with ABSOLUTELY NO WARRANTY.  This is free software,\n"
					"and you are welcome to change and redistribute it under certain conditions;\n"
					"see <http://www.gnu.org/licenses/> for details.\n"
					"\n"
					"Utility to generate musical inspiration from MIDI files.\n"
					"Build date " __DATE__ " " __TIME__ << "\n"
					"\n"
					"Usage: midiinspo [options] <file.mid>\n" << poOptions << "\n"
					"--show-json is ignored when --show-features is given, as the feature\n"
					"summary already contains the same data."
					<< std::endl;
				return RET_OK;
			} else if (i.string_key.compare("show-features") == 0) {
				bShowFeatures = true;
			} else if (i.string_key.compare("show-json") == 0) {
				bShowJSON = true;
			} else if (i.string_key.compare("seed") == 0) {
				if (i.value.size() == 0) {
					std::cerr << PROGNAME ": --seed requires a parameter." << std::endl;
					return RET_BADARGS;
				}
				seed = strtoul(i.value[0].c_str(), NULL, 0);
			} else if (i.string_key.compare("system-messages") == 0) {
				scanFlags |= midiinspo::ScanFlags::SystemMessages;
			} else if (i.string_key.compare("interactive") == 0) {
				bInteractive = true;
			} else if (i.string_key.compare("verbose") == 0) {
				bVerbose = true;
			}
		}

		midiinspo::SeededRandomSource rng(seed);

		if (bInteractive) {
			ConsoleInterface ui;
			midiinspo::InspirationApp app(ui,
				midiinspo::defaultGeneratorFactory(rng), scanFlags);
			if (strFilename.empty()) {
				app.browse();
			} else {
				app.selectFile(strFilename);
			}
			app.showFeatures(bShowFeatures);
			if (!bShowFeatures) app.showJSON(bShowJSON);
			app.generateIdeas();
			return ui.errorShown ? RET_SHOWSTOPPER : RET_OK;
		}

		if (strFilename.empty()) {
			std::cerr << PROGNAME ": no filename given.  Use --help for help, or "
				"--interactive to be prompted for one." << std::endl;
			return RET_SHOWSTOPPER;
		}

		midiinspo::FeatureRecord features;
		std::vector<midiinspo::TrackStats> tracks;
		try {
			features = midiinspo::extractFeatures(strFilename, scanFlags, &tracks);
		} catch (const midiinspo::feature_error& e) {
			std::cerr << PROGNAME ": Error extracting features: " << e.what()
				<< std::endl;
			return RET_SHOWSTOPPER;
		}

		if (bVerbose) listTracks(features, tracks);

		midiinspo::InspirationGenerator generator(features, rng);
		std::cout << generator.generateIdeas(bShowFeatures, bShowJSON)
			<< std::endl;

	} catch (const po::unknown_option& e) {
		std::cerr << PROGNAME ": " << e.what()
			<< ".  Use --help for help." << std::endl;
		return RET_BADARGS;
	} catch (const po::error& e) {
		std::cerr << PROGNAME ": " << e.what()
			<< ".  Use --help for help." << std::endl;
		return RET_BADARGS;
	} catch (const stream::error& e) {
		std::cerr << PROGNAME ": I/O error - " << e.what() << std::endl;
		return RET_UNCOMMON_FAILURE;
	} catch (const std::exception& e) {
		std::cerr << PROGNAME ": Unexpected error - " << e.what() << std::endl;
		return RET_UNCOMMON_FAILURE;
	}

	return RET_OK;
}
