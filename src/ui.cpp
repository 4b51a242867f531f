/**
 * @file  ui.cpp
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

#include <camoto/error.hpp>
#include <midiinspo/ui.hpp>

using namespace midiinspo;

UserInterface::~UserInterface()
{
}

GeneratorFactory midiinspo::defaultGeneratorFactory(RandomSource& rng)
{
	RandomSource *source = &rng;
	return [source](const FeatureRecord& features) {
		return std::unique_ptr<InspirationGenerator>(
			new InspirationGenerator(features, *source));
	};
}

InspirationApp::InspirationApp(UserInterface& ui,
	GeneratorFactory generatorFactory, unsigned int scanFlags)
	:	ui(ui),
		generatorFactory(generatorFactory),
		scanFlags(scanFlags),
		bShowFeatures(false),
		bShowJSON(false)
{
}

void InspirationApp::browse()
{
	std::string chosen = this->ui.askOpenFilename("Select MIDI file");
	if (!chosen.empty()) this->filename = chosen;
	return;
}

void InspirationApp::selectFile(const std::string& filename)
{
	this->filename = filename;
	return;
}

const std::string& InspirationApp::selectedFile() const
{
	return this->filename;
}

void InspirationApp::showFeatures(bool enable)
{
	this->bShowFeatures = enable;
	if (enable) this->bShowJSON = false;
	return;
}

bool InspirationApp::showFeatures() const
{
	return this->bShowFeatures;
}

void InspirationApp::showJSON(bool enable)
{
	this->bShowJSON = enable;
	return;
}

bool InspirationApp::showJSON() const
{
	return this->bShowJSON;
}

void InspirationApp::generateIdeas()
{
	if (this->filename.empty()) {
		this->ui.showInfo("No file selected", "Choose a MIDI file to analyze.");
		return;
	}

	FeatureRecord features;
	try {
		features = extractFeatures(this->filename, this->scanFlags);
	} catch (const camoto::error& e) {
		this->ui.showError("Feature extraction failed", e.what());
		return;
	}

	auto generator = this->generatorFactory(features);
	this->ui.setText(generator->generateIdeas(this->bShowFeatures,
		this->bShowJSON));
	return;
}
