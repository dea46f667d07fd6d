#include "tile_range.h"
#include <algorithm>

TileRange::TileRange(TileIndexReadLock lock, const QuadKeyEntries &entries, int zmin, int zmax):
	lock(std::move(lock)), entries(&entries), zmin(zmin), zmax(zmax), entry(0), zoom(zmin) {}

bool TileRange::next(Tile &tile) {
	if (!lock.owns_lock())
		return false;

	const QuadKeyEntries &keys = *entries;
	while (entry < keys.size()) {
		const std::string &quadKey = keys[entry].quadKey;
		const bool last = entry + 1 == keys.size();
		const int deepest = std::min<int>(zmax, quadKey.size());

		while (zoom <= deepest) {
			const size_t length = zoom++;
			if (last || !hasQuadKeyPrefix(keys[entry + 1].quadKey, quadKey, length)) {
				tile = tileFromQuadKey(quadKey.substr(0, length));
				return true;
			}
		}

		entry++;
		zoom = zmin;
	}

	close();
	return false;
}

void TileRange::close() {
	if (lock.owns_lock())
		lock.unlock();
}
