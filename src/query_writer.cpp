#include "query_writer.h"

#include <stdexcept>

#include "rapidjson/ostreamwrapper.h"
#include "rapidjson/writer.h"

using namespace rapidjson;

QueryWriter::QueryWriter(bool json): json(json) {
	document.SetObject();
}

void QueryWriter::addEntryCount(size_t entries) {
	if (json) {
		document.AddMember("entries", Value().SetUint64(entries), document.GetAllocator());
		return;
	}
	lines.push_back("# " + std::to_string(entries) + " entries");
}

void QueryWriter::addValues(const Tile &tile, const std::vector<std::string> &values) {
	const std::string name = tileToString(tile);
	if (!json) {
		lines.push_back("# values at " + name + " (" + std::to_string(values.size()) + ")");
		for (const auto &v : values) lines.push_back(v);
		return;
	}

	auto &alloc = document.GetAllocator();
	if (!document.HasMember("values"))
		document.AddMember("values", Value(kObjectType), alloc);

	Value arr(kArrayType);
	for (const auto &v : values) {
		Document parsed(&alloc);
		parsed.Parse(v.c_str(), v.size());
		if (parsed.HasParseError())
			throw std::runtime_error("stored value at " + name + " is not valid JSON: " + v);
		arr.PushBack(Value(parsed, alloc), alloc);
	}
	document["values"].AddMember(Value(name.c_str(), alloc), arr, alloc);
}

void QueryWriter::addTile(const Tile &tile) {
	if (!json) {
		lines.push_back(tileToString(tile));
		return;
	}

	auto &alloc = document.GetAllocator();
	if (!document.HasMember("tiles"))
		document.AddMember("tiles", Value(kArrayType), alloc);
	document["tiles"].PushBack(Value(tileToString(tile).c_str(), alloc), alloc);
}

void QueryWriter::write(std::ostream &os) {
	if (json) {
		OStreamWrapper osw(os);
		Writer<OStreamWrapper> writer(osw);
		document.Accept(writer);
		os << std::endl;
		return;
	}

	for (const auto &line : lines)
		os << line << std::endl;
}
