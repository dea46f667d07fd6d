#include <iostream>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include "minunit.h"
#include "jsonl_loader.h"
#include "query_writer.h"

bool verbose = false;

std::vector<std::string> sorted(std::vector<std::string> values) {
	std::sort(values.begin(), values.end());
	return values;
}

MU_TEST(test_load_records) {
	for (unsigned threads : {1, 4}) {
		TileIndex<std::string> index(threads);
		JsonlLoader loader(threads, index);
		loader.read("test/tiles.jsonl");

		mu_check(loader.records() == 5);
		mu_check(index.size() == 5);

		// Values come back as compact JSON
		mu_check(sorted(index.values(tileFromQuadKey("120"))) == std::vector<std::string>({"\"A\"", "\"B\""}));
		mu_check(index.values(tileFromQuadKey("13")) == std::vector<std::string>({"[1,2,3]"}));
		mu_check(index.values(Tile(2, 0, 1)) == std::vector<std::string>({"{\"name\":\"C\",\"count\":3}"}));
		mu_check(index.values(Tile()).size() == 5);

		// Reading the same file again appends rather than replaces
		loader.read("test/tiles.jsonl");
		mu_check(loader.records() == 10);
		mu_check(index.values(tileFromQuadKey("1201")).size() == 2);
	}
}

MU_TEST(test_bad_records) {
	TileIndex<std::string> index;
	JsonlLoader loader(2, index);

	bool threw = false;
	try {
		loader.read("test/bad.jsonl");
	} catch (const std::runtime_error &e) {
		threw = std::string(e.what()).find("missing \"value\"") != std::string::npos;
	}
	mu_check(threw);
}

MU_TEST(test_query_writer) {
	{
		QueryWriter writer(false);
		writer.addEntryCount(3);
		writer.addValues(Tile(1, 1, 0), {"\"A\"", "2"});
		writer.addTile(Tile(1, 1, 0));
		std::ostringstream os;
		writer.write(os);
		mu_check(os.str() == "# 3 entries\n# values at 1/1/0 (2)\n\"A\"\n2\n1/1/0\n");
	}

	{
		QueryWriter writer(true);
		writer.addEntryCount(3);
		writer.addValues(Tile(1, 1, 0), {"\"A\"", "{\"b\":[1]}"});
		writer.addTile(Tile(1, 1, 0));
		writer.addTile(Tile(2, 3, 1));
		std::ostringstream os;
		writer.write(os);
		mu_check(os.str() == "{\"entries\":3,\"values\":{\"1/1/0\":[\"A\",{\"b\":[1]}]},\"tiles\":[\"1/1/0\",\"2/3/1\"]}\n");
	}

	{
		QueryWriter writer(true);
		bool threw = false;
		try { writer.addValues(Tile(), {"not json"}); } catch (const std::runtime_error &) { threw = true; }
		mu_check(threw);
	}
}

MU_TEST_SUITE(test_suite_jsonl_loader) {
	MU_RUN_TEST(test_load_records);
	MU_RUN_TEST(test_bad_records);
	MU_RUN_TEST(test_query_writer);
}

int main() {
	MU_RUN_SUITE(test_suite_jsonl_loader);
	MU_REPORT();
	return MU_EXIT_CODE;
}
