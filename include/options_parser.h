#ifndef OPTIONS_PARSER_H
#define OPTIONS_PARSER_H

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

namespace OptionsParser {
	struct OptionException : std::exception {
		OptionException(std::string message): message(message) {}

		/// Returns the explanatory string.
		const char* what() const noexcept override {
				return message.data();
		}

		private:
			std::string message;
	};

	enum class OutputMode: char { Text = 0, JSON = 1 };

	struct Options {
		std::vector<std::string> inputFiles;
		std::string outputFile;
		uint32_t threadNum = 0;

		// Tiles to aggregate values for, as z/x/y
		std::vector<std::string> valueTiles;

		// Zoom range to enumerate covering tiles for, if range is set
		bool range = false;
		int zmin = 0;
		int zmax = 0;

		bool showHelp = false;
		bool verbose = false;
		bool quiet = false;
		OutputMode outputMode = OutputMode::Text;
	};

	Options parse(const int argc, const char* argv[]);
	void showHelp();
};

#endif
