/*! \file */ 
#ifndef _QUERY_WRITER_H
#define _QUERY_WRITER_H

#include <ostream>
#include <string>
#include <vector>
#include "tile.h"

#include "rapidjson/document.h"

/*
	Collects the answers to tileindex queries and writes them out, either as
	plain text or as a single JSON document:

		{"entries":3,"values":{"12/2047/1362":[...]},"tiles":["4/7/5",...]}

	Values are stored as JSON text, so in JSON mode they're parsed back
	and embedded as-is rather than quoted.
*/
class QueryWriter {

public:
	QueryWriter(bool json);

	void addEntryCount(size_t entries);
	void addValues(const Tile &tile, const std::vector<std::string> &values);
	void addTile(const Tile &tile);

	void write(std::ostream &os);

private:
	bool json;
	rapidjson::Document document;
	std::vector<std::string> lines;
};

#endif //_QUERY_WRITER_H
