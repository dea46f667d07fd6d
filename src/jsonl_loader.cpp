#include "jsonl_loader.h"

#include <cctype>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>

#include "helpers.h"
#include "rapidjson/error/en.h"
#include "rapidjson/filereadstream.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/writer.h"

extern bool verbose;

void JsonlLoader::read(const std::string &filename) {
	std::vector<OffsetAndLength> chunks = getNewlineChunks(filename, threadNum * 4);

	// Exceptions can't cross the pool's threads, so keep the first one and
	// rethrow it once everything has finished.
	std::mutex errorMutex;
	std::exception_ptr error;

	boost::asio::thread_pool pool(threadNum);
	for (auto &chunk : chunks) {
		boost::asio::post(pool, [&]() {
			try {
				FILE* fp = fopen(filename.c_str(), "r");
				if (fp == nullptr) throw std::runtime_error("unable to open " + filename);
				std::unique_ptr<FILE, int(*)(FILE*)> file(fp, fclose);
				if (fseek(fp, chunk.offset, SEEK_SET) != 0) throw std::runtime_error("unable to seek to " + std::to_string(chunk.offset) + " in " + filename);
				char readBuffer[65536];
				rapidjson::FileReadStream is(fp, readBuffer, sizeof(readBuffer));

				// Skip leading whitespace.
				while (is.Tell() < chunk.length && isspace(is.Peek())) is.Take();

				while (is.Tell() < chunk.length) {
					const uint64_t position = chunk.offset + is.Tell();
					rapidjson::Document doc;
					doc.ParseStream<rapidjson::kParseStopWhenDoneFlag>(is);
					if (doc.HasParseError()) {
						throw std::runtime_error(filename + ": invalid JSON at byte " + std::to_string(position + doc.GetErrorOffset()) + ": " + rapidjson::GetParseError_En(doc.GetParseError()));
					}
					if (!doc.IsObject()) {
						throw std::runtime_error(filename + ": record at byte " + std::to_string(position) + " is not a JSON object");
					}
					try {
						processRecord(doc.GetObject());
					} catch (const std::exception &e) {
						throw std::runtime_error(filename + ": record at byte " + std::to_string(position) + ": " + e.what());
					}

					// Skip trailing whitespace.
					while (is.Tell() < chunk.length && isspace(is.Peek())) is.Take();
				}
			} catch (...) {
				std::lock_guard<std::mutex> lock(errorMutex);
				if (!error) error = std::current_exception();
			}
		});
	}
	pool.join();

	if (error) std::rethrow_exception(error);
}

template <bool Flag, typename T>
void JsonlLoader::processRecord(rapidjson::GenericObject<Flag, T> record) {
	if (!record.HasMember("value"))
		throw std::runtime_error("missing \"value\"");

	Tile tile;
	auto tileMember = record.FindMember("tile");
	auto quadKeyMember = record.FindMember("quadkey");
	if (tileMember != record.MemberEnd() && tileMember->value.IsString()) {
		tile = parseTile(tileMember->value.GetString());
	} else if (quadKeyMember != record.MemberEnd() && quadKeyMember->value.IsString()) {
		tile = tileFromQuadKey(quadKeyMember->value.GetString());
	} else {
		throw std::runtime_error("expected a \"tile\" or \"quadkey\" string");
	}

	rapidjson::StringBuffer buffer;
	rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
	record["value"].Accept(writer);

	index.insert(tile, std::string(buffer.GetString(), buffer.GetSize()));
	recordCount++;
	if (verbose && recordCount % 1000000 == 0)
		std::cerr << "Indexed " << recordCount << " records" << std::endl;
}
