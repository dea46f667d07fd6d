/*! \file */ 

// C++ includes
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <stdexcept>
#include <chrono>

// Tileindex code
#include "options_parser.h"
#include "tile.h"
#include "tile_index.h"
#include "jsonl_loader.h"
#include "query_writer.h"

// Namespaces
using namespace std;

// Global verbose switch
bool verbose = false;

/**
 *\brief The Main function is responsible for command line processing, loading records and answering queries.
 *
 * Records are loaded in parallel into a single TileIndex, then each --values
 * tile and the --range zooms are queried against it.
 */
int main(const int argc, const char* argv[]) {
	// ----	Read command-line options
	OptionsParser::Options options;
	try {
		options = OptionsParser::parse(argc, argv);
	} catch (OptionsParser::OptionException& e) {
		cerr << e.what() << endl;
		return 1;
	}

	if (options.showHelp) { OptionsParser::showHelp(); return 0; }

	verbose = options.verbose;
	const bool progress = !options.quiet;

	// Results go to standard output unless --output is given, so keep
	// progress out of their way.
	ostream& progressOut = options.outputFile.empty() ? cerr : cout;

	try {
		// ---- Load records
		TileIndex<string> index(options.threadNum);
		JsonlLoader loader(options.threadNum, index);
		for (const string& inputFile : options.inputFiles) {
			if (progress) progressOut << "Reading " << inputFile << endl;
			auto start = chrono::steady_clock::now();
			loader.read(inputFile);
			if (verbose) {
				auto ms = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
				progressOut << "Read " << inputFile << " in " << ms << "ms" << endl;
			}
		}
		if (progress) progressOut << "Indexed " << loader.records() << " records" << endl;

		// ---- Answer queries
		QueryWriter writer(options.outputMode == OptionsParser::OutputMode::JSON);
		writer.addEntryCount(index.size());

		for (const string& tileText : options.valueTiles) {
			Tile tile = parseTile(tileText);
			writer.addValues(tile, index.values(tile));
		}

		if (options.range) {
			auto start = chrono::steady_clock::now();
			uint64_t emitted = 0;
			for (const Tile& tile : index.tileRange(options.zmin, options.zmax)) {
				writer.addTile(tile);
				emitted++;
			}
			if (verbose) {
				auto ms = chrono::duration_cast<chrono::milliseconds>(chrono::steady_clock::now() - start).count();
				progressOut << "Enumerated " << emitted << " tiles for z" << options.zmin << "-z" << options.zmax << " in " << ms << "ms" << endl;
			}
		}

		// ---- Write results
		if (options.outputFile.empty()) {
			writer.write(cout);
		} else {
			ofstream outfile(options.outputFile);
			if (!outfile) { cerr << "Couldn't open output file " << options.outputFile << endl; return 1; }
			writer.write(outfile);
			if (progress) progressOut << "Wrote results to " << options.outputFile << endl;
		}
	} catch (const exception& e) {
		cerr << e.what() << endl;
		return 1;
	}

	return 0;
}
