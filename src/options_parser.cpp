#include "options_parser.h"

#include <stdexcept>
#include <thread>
#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <iostream>
#include "helpers.h"
#include "tile.h"

#ifndef TI_VERSION
#define TI_VERSION (version not set)
#endif
#define STR1(x)  #x
#define STR(x)  STR1(x)

using namespace std;
namespace po = boost::program_options;

po::options_description getParser(OptionsParser::Options& options, string& range) {
	po::options_description desc("tileindex " STR(TI_VERSION) "\nIndex values by tile and query them across zoom levels\n\nAvailable options");
	desc.add_options()
		("help",                                                                 "show help message")
		("input",  po::value< vector<string> >(&options.inputFiles),            "source .jsonl file of {\"tile\":\"z/x/y\",\"value\":...} records")
		("output", po::value< string >(&options.outputFile),                    "write results to this file rather than standard output")
		("values", po::value< vector<string> >(&options.valueTiles),            "list values at or beneath this tile, example: 12/2047/1362")
		("range",  po::value< string >(&range),                                 "list tiles covering the index between two zooms, example: 4,8")
		("json",   po::bool_switch(),                                           "write results as JSON (also implied by a .json --output)")
		("quiet",  po::bool_switch(&options.quiet),                             "quiet, suppress progress output")
		("verbose",po::bool_switch(&options.verbose),                           "verbose output");
	po::options_description performance("Performance options");
	performance.add_options()
		("threads",po::value<uint32_t>(&options.threadNum)->default_value(0),   "number of threads (automatically detected if 0)")
			;

	desc.add(performance);
	return desc;
}

void OptionsParser::showHelp() {
	Options options;
	string range;
	auto parser = getParser(options, range);
	std::cout << parser << std::endl;
}

OptionsParser::Options OptionsParser::parse(const int argc, const char* argv[]) {
	Options options;
	string range;

	po::options_description desc = getParser(options, range);
	po::positional_options_description p;
	p.add("input", -1);

	po::variables_map vm;
	try {
		po::store(po::command_line_parser(argc, argv).options(desc).positional(p).run(), vm);
	} catch (const po::unknown_option& ex) {
		throw OptionException{"Unknown option: " + ex.get_option_name()};
	} catch (const po::error& ex) {
		throw OptionException{ex.what()};
	}
	po::notify(vm);

	if (vm.count("help")) {
		options.showHelp = true;
		return options;
	}
	if (options.inputFiles.empty()) {
		throw OptionException{ "You must specify at least one input file. Run with --help to find out more." };
	}

	if (vm["json"].as<bool>() || ends_with(options.outputFile, ".json")) {
		options.outputMode = OutputMode::JSON;
	}

	for (const string& tile : options.valueTiles) {
		try {
			parseTile(tile);
		} catch (const std::invalid_argument& ex) {
			throw OptionException{ string("--values: ") + ex.what() };
		}
	}

	if (!range.empty()) {
		vector<string> zooms;
		boost::split(zooms, range, boost::is_any_of(","));
		if (zooms.size() != 2) {
			throw OptionException{ "--range must be two zooms, example: 4,8" };
		}
		try {
			options.zmin = boost::lexical_cast<int>(zooms[0]);
			options.zmax = boost::lexical_cast<int>(zooms[1]);
		} catch (const boost::bad_lexical_cast&) {
			throw OptionException{ "--range must be two zooms, example: 4,8" };
		}
		if (options.zmin < 0 || options.zmin > options.zmax) {
			throw OptionException{ "--range zooms must satisfy 0 <= zmin <= zmax, got " + range };
		}
		options.range = true;
	}

	if (options.threadNum == 0) {
		options.threadNum = max(thread::hardware_concurrency(), 1u);
	}

	// ---- Check inputs
	for (const string& inputFile : options.inputFiles) {
		if (!boost::filesystem::exists(inputFile)) {
			throw OptionException{ "Couldn't open input file: " + inputFile };
		}
	}

	return options;
}
