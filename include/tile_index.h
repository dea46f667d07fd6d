/*! \file */ 
#ifndef _TILE_INDEX_H
#define _TILE_INDEX_H

#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include "quadkey_entries.h"
#include "tile.h"
#include "tile_range.h"

// Stores values by tile. Querying a tile returns the values inserted at it
// and at every tile nested beneath it, so values added at a deep zoom are
// aggregated up to shallower ones.
//
// Inserts only append; the keyset is sorted lazily by the first read after
// an insert. All state sits behind one reader/writer lock, so an index can be
// shared between any number of inserting and querying threads.
template <class T>
class TileIndex {

public:
	TileIndex(unsigned int threadNum = 1): threadNum(threadNum), sorted(true) {}

	TileIndex(const TileIndex &) = delete;
	TileIndex &operator=(const TileIndex &) = delete;

	void insert(const Tile &tile, T value) {
		std::string quadKey = tile.quadKey();

		std::lock_guard<TileIndexMutex> lock(mutex);
		store.push_back(std::move(value));
		entries.emplace_back(std::move(quadKey), store.size() - 1);
		sorted = false;
	}

	// Values inserted at `tile` or any tile beneath it, in quadkey order.
	std::vector<T> values(const Tile &tile) const {
		const std::string quadKey = tile.quadKey();
		TileIndexReadLock lock = lockSorted();

		std::vector<T> rv;
		for (auto it = lowerBoundQuadKey(entries, quadKey); it != entries.end() && hasQuadKeyPrefix(it->quadKey, quadKey); ++it)
			rv.push_back(store[it->value]);
		return rv;
	}

	// Every distinct tile covering the index at each zoom in [zmin, zmax].
	// The result holds a read lock until drained or destroyed.
	TileRange tileRange(int zmin, int zmax) const {
		if (zmin < 0 || zmax < 0)
			throw std::invalid_argument("TileIndex: zoom range " + std::to_string(zmin) + "-" + std::to_string(zmax) + " includes a negative zoom");
		if (zmin > zmax)
			throw std::invalid_argument("TileIndex: zmin (" + std::to_string(zmin) + ") must not exceed zmax (" + std::to_string(zmax) + ")");

		return TileRange(lockSorted(), entries, zmin, zmax);
	}

	size_t size() const {
		TileIndexReadLock lock(mutex);
		return entries.size();
	}

	bool empty() const { return size() == 0; }

private:
	// Returns a read lock under which the entries are sorted. If they aren't,
	// swaps to a write lock to sort them, then checks again once the read
	// lock is back, as an insert may have got in between.
	TileIndexReadLock lockSorted() const {
		TileIndexReadLock lock(mutex);
		while (!sorted) {
			lock.unlock();
			{
				std::lock_guard<TileIndexMutex> writeLock(mutex);
				if (!sorted) {
					sortQuadKeyEntries(entries, threadNum);
					sorted = true;
				}
			}
			lock.lock();
		}
		return lock;
	}

	const unsigned int threadNum;

	mutable TileIndexMutex mutex;
	mutable QuadKeyEntries entries;
	mutable bool sorted;
	std::deque<T> store;
};

#endif //_TILE_INDEX_H
