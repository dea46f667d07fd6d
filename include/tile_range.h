/*! \file */ 
#ifndef _TILE_RANGE_H
#define _TILE_RANGE_H

#include <cstddef>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include "quadkey_entries.h"
#include "tile.h"

typedef std::shared_timed_mutex TileIndexMutex;
typedef std::shared_lock<TileIndexMutex> TileIndexReadLock;

// A lazy, single-use enumeration of the tiles covering a sorted set of
// quadkeys, for every zoom in [zmin, zmax].
//
// Walks adjacent pairs of entries once. At each zoom, a prefix of the current
// key that isn't also a prefix of the next key closes a run of entries, so
// its tile is emitted; the last entry closes every run it belongs to. Each
// distinct prefix is therefore emitted exactly once per zoom, though the
// tiles are covering tiles and need not have been inserted themselves.
//
// Holds a read lock on the owning index until it's drained, closed or
// destroyed. Inserting into the same index from the thread that owns an open
// TileRange will deadlock.
class TileRange {

public:
	class iterator {
	public:
		typedef std::input_iterator_tag iterator_category;
		typedef Tile value_type;
		typedef std::ptrdiff_t difference_type;
		typedef const Tile* pointer;
		typedef const Tile& reference;

		iterator(): range(nullptr) {}
		explicit iterator(TileRange *range): range(range) { advance(); }

		reference operator*() const { return current; }
		pointer operator->() const { return &current; }
		iterator &operator++() { advance(); return *this; }
		bool operator==(const iterator &other) const { return range == other.range; }
		bool operator!=(const iterator &other) const { return range != other.range; }

	private:
		void advance() {
			if (range && !range->next(current))
				range = nullptr;
		}

		TileRange *range;
		Tile current;
	};

	// `entries` must be sorted, and must stay so while `lock` is held.
	TileRange(TileIndexReadLock lock, const QuadKeyEntries &entries, int zmin, int zmax);
	TileRange(TileRange &&other) = default;
	TileRange &operator=(TileRange &&other) = default;
	TileRange(const TileRange &) = delete;
	TileRange &operator=(const TileRange &) = delete;

	// Fetch the next tile. Returns false, and releases the lock, once exhausted.
	bool next(Tile &tile);

	// Stop early and release the lock. Subsequent calls to next() return false.
	void close();

	bool isOpen() const { return lock.owns_lock(); }

	iterator begin() { return iterator(this); }
	iterator end() { return iterator(); }

private:
	TileIndexReadLock lock;
	const QuadKeyEntries *entries;
	int zmin, zmax;
	size_t entry;
	int zoom;
};

#endif //_TILE_RANGE_H
