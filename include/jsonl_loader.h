/*! \file */ 
#ifndef _JSONL_LOADER_H
#define _JSONL_LOADER_H

#include <atomic>
#include <string>
#include "tile_index.h"

#include "rapidjson/document.h"

/*
	Loads newline-delimited JSON records into a TileIndex. Each line is one of

		{"tile":"12/2047/1362","value":...}
		{"quadkey":"031313131313","value":...}

	and the value, whatever JSON it is, is stored as its compact JSON text.
	Files are split into newline-aligned chunks which are parsed in parallel.
*/
class JsonlLoader {

public:
	JsonlLoader(unsigned int threadNum, TileIndex<std::string> &index):
		threadNum(threadNum), index(index), recordCount(0)
	{}

	void read(const std::string &filename);

	// Records inserted so far, across all files read
	uint64_t records() const { return recordCount; }

private:
	unsigned int threadNum;
	TileIndex<std::string> &index;
	std::atomic<uint64_t> recordCount;

	template <bool Flag, typename T>
	void processRecord(rapidjson::GenericObject<Flag, T> record);
};

#endif //_JSONL_LOADER_H
