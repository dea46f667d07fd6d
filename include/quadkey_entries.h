/*! \file */ 
#ifndef _QUADKEY_ENTRIES_H
#define _QUADKEY_ENTRIES_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// One inserted value: the quadkey of the tile it was inserted under, and
// its position in the owning index's value store.
struct QuadKeyEntry {
	std::string quadKey;
	uint32_t value;

	QuadKeyEntry(): value(0) {}
	QuadKeyEntry(std::string quadKey, uint32_t value): quadKey(std::move(quadKey)), value(value) {}

	// Byte-order on the key only; entries with equal keys compare equal.
	bool operator<(const QuadKeyEntry &other) const {
		return quadKey < other.quadKey;
	}
};

typedef std::vector<QuadKeyEntry> QuadKeyEntries;

// Stable sort by key. Large sets are sorted using up to threadNum threads.
void sortQuadKeyEntries(QuadKeyEntries &entries, unsigned int threadNum);

// First entry whose key is >= quadKey, or entries.end().
QuadKeyEntries::const_iterator lowerBoundQuadKey(const QuadKeyEntries &entries, const std::string &quadKey);

// True if the first `length` bytes of `prefix` are a prefix of `key`.
inline bool hasQuadKeyPrefix(const std::string &key, const std::string &prefix, size_t length) {
	return length <= key.size() && key.compare(0, length, prefix, 0, length) == 0;
}

inline bool hasQuadKeyPrefix(const std::string &key, const std::string &prefix) {
	return hasQuadKeyPrefix(key, prefix, prefix.size());
}

#endif //_QUADKEY_ENTRIES_H
