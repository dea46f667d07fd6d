/*! \file */ 
#ifndef _HELPERS_H
#define _HELPERS_H

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

// General helper routines

inline bool ends_with(std::string const & value, std::string const & ending) {
	if (ending.size() > value.size()) return false;
	return std::equal(ending.rbegin(), ending.rend(), value.rbegin());
}

struct OffsetAndLength {
	uint64_t offset;
	uint64_t length;
};

uint64_t getFileSize(std::string filename);

std::vector<OffsetAndLength> getNewlineChunks(const std::string &filename, uint64_t chunks);

#endif //_HELPERS_H
