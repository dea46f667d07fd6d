#include "helpers.h"

#include <cstdio>
#include <stdexcept>
#include <sys/stat.h>

using namespace std;

uint64_t getFileSize(std::string filename) {
	struct stat statBuf;
	int rc = stat(filename.c_str(), &statBuf);

	if (rc == 0) return statBuf.st_size;

	throw std::runtime_error("unable to stat " + filename);
}

// Given a file, attempt to divide it into N chunks, with each chunk separated
// by a newline.
//
// Useful for dividing a JSON lines file into blocks suitable for parallel processing.
std::vector<OffsetAndLength> getNewlineChunks(const std::string &filename, uint64_t chunks) {
	std::vector<OffsetAndLength> rv;

	const uint64_t size = getFileSize(filename);
	const uint64_t chunkSize = std::max<uint64_t>(size / std::max<uint64_t>(chunks, 1), 1);
	FILE* fp = fopen(filename.c_str(), "r");
	if (fp == nullptr) throw std::runtime_error("unable to open " + filename);

	// Skip chunkSize bytes, scan for a newline, repeat.
	//
	// Per UTF-8's ascii transparency property, a newline is guaranteed not to form
	// part of any multi-byte character, so the byte '\n' reliably indicates a safe
	// place to start a new chunk.
	uint64_t offset = 0;
	uint64_t length = 0;
	char buffer[8192];
	while (offset < size) {
		// The last chunk will not be a full `chunkSize`.
		length = std::min(chunkSize, size - offset);

		if (fseek(fp, offset + length, SEEK_SET) != 0) {
			fclose(fp);
			throw std::runtime_error("unable to seek to " + to_string(offset) + " in " + filename);
		}

		bool foundNewline = false;
		while (!foundNewline) {
			size_t read = fread(buffer, 1, sizeof(buffer), fp);
			if (read == 0) break;
			for (size_t i = 0; i < read; i++) {
				if (buffer[i] == '\n') {
					length += i;
					foundNewline = true;
					break;
				}
			}

			if (!foundNewline) length += read;
		}

		rv.push_back({offset, length});
		offset += length;
	}

	fclose(fp);
	return rv;
}
