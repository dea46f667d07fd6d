#include <iostream>
#include <future>
#include <stdexcept>
#include "minunit.h"
#include "tile_range.h"

QuadKeyEntries makeEntries(std::vector<std::string> keys) {
	QuadKeyEntries entries;
	for (size_t i = 0; i < keys.size(); i++)
		entries.emplace_back(keys[i], i);
	sortQuadKeyEntries(entries, 1);
	return entries;
}

std::vector<std::string> enumerate(const QuadKeyEntries &entries, int zmin, int zmax) {
	TileIndexMutex mutex;
	TileRange range(TileIndexReadLock(mutex), entries, zmin, zmax);
	std::vector<std::string> rv;
	for (const Tile &tile : range)
		rv.push_back(tile.quadKey());
	if (range.isOpen())
		throw std::logic_error("drained range still holds its lock");
	return rv;
}

// Probe the mutex from another thread, as this one may hold it.
bool canWrite(TileIndexMutex &mutex) {
	return std::async(std::launch::async, [&]() {
		if (!mutex.try_lock()) return false;
		mutex.unlock();
		return true;
	}).get();
}

bool canRead(TileIndexMutex &mutex) {
	return std::async(std::launch::async, [&]() {
		if (!mutex.try_lock_shared()) return false;
		mutex.unlock_shared();
		return true;
	}).get();
}

MU_TEST(test_sort_and_search) {
	QuadKeyEntries entries = makeEntries({"13", "1201", "120", "0", "13", ""});
	mu_check(entries[0].quadKey == "");
	mu_check(entries[1].quadKey == "0");
	mu_check(entries[2].quadKey == "120");
	mu_check(entries[3].quadKey == "1201");
	mu_check(entries[4].quadKey == "13" && entries[4].value == 0);
	mu_check(entries[5].quadKey == "13" && entries[5].value == 4);

	mu_check(lowerBoundQuadKey(entries, "12") - entries.begin() == 2);
	mu_check(lowerBoundQuadKey(entries, "1201") - entries.begin() == 3);
	mu_check(lowerBoundQuadKey(entries, "2") == entries.end());

	mu_check(hasQuadKeyPrefix("1201", "120"));
	mu_check(hasQuadKeyPrefix("1201", ""));
	mu_check(!hasQuadKeyPrefix("12", "120"));
	mu_check(hasQuadKeyPrefix("130", "1201", 1));
	mu_check(!hasQuadKeyPrefix("130", "1201", 2));
}

MU_TEST(test_boundaries) {
	QuadKeyEntries entries = makeEntries({"120", "1201", "13"});

	// Emitted as each run of shared prefixes closes
	mu_check(enumerate(entries, 1, 2) == std::vector<std::string>({"12", "1", "13"}));
	mu_check(enumerate(entries, 0, 4) == std::vector<std::string>({"12", "120", "1201", "", "1", "13"}));
	mu_check(enumerate(entries, 3, 3) == std::vector<std::string>({"120"}));
	mu_check(enumerate(entries, 5, 8).empty());

	// Covering tiles are synthesized; "1" and "12" were never inserted
	QuadKeyEntries siblings = makeEntries({"0000", "0001", "0002", "0100"});
	mu_check(enumerate(siblings, 2, 3) == std::vector<std::string>({"00", "000", "01", "010"}));
	mu_check(enumerate(siblings, 1, 1) == std::vector<std::string>({"0"}));
}

MU_TEST(test_mixed_depths) {
	// A shallow key sorts ahead of the keys beneath it, and never
	// interrupts a run at a deeper zoom.
	QuadKeyEntries entries = makeEntries({"1", "10", "11", "2", "21"});
	mu_check(enumerate(entries, 1, 1) == std::vector<std::string>({"1", "2"}));
	mu_check(enumerate(entries, 2, 2) == std::vector<std::string>({"10", "11", "21"}));
}

MU_TEST(test_next_and_close) {
	QuadKeyEntries entries = makeEntries({"0", "1", "2", "3"});
	TileIndexMutex mutex;

	TileRange range(TileIndexReadLock(mutex), entries, 1, 1);
	Tile tile;
	mu_check(range.next(tile) && tile == Tile(1, 0, 0));
	mu_check(range.next(tile) && tile == Tile(1, 1, 0));

	// Others can read, but not write, while the range is open
	mu_check(!canWrite(mutex));
	mu_check(canRead(mutex));

	range.close();
	mu_check(!range.isOpen());
	mu_check(!range.next(tile));
	mu_check(canWrite(mutex));

	// Moving a range hands over its lock
	TileRange first(TileIndexReadLock(mutex), entries, 1, 1);
	TileRange second(std::move(first));
	mu_check(!first.isOpen());
	mu_check(second.isOpen());
	mu_check(!canWrite(mutex));
	{
		TileRange third(std::move(second));
	}
	mu_check(canWrite(mutex));
}

MU_TEST_SUITE(test_suite_tile_range) {
	MU_RUN_TEST(test_sort_and_search);
	MU_RUN_TEST(test_boundaries);
	MU_RUN_TEST(test_mixed_depths);
	MU_RUN_TEST(test_next_and_close);
}

int main() {
	MU_RUN_SUITE(test_suite_tile_range);
	MU_REPORT();
	return MU_EXIT_CODE;
}
