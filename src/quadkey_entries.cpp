#include "quadkey_entries.h"
#include <algorithm>
#include <boost/sort/sort.hpp>

// Below this, spinning up sort threads costs more than it saves.
#define PARALLEL_SORT_THRESHOLD 100000

void sortQuadKeyEntries(QuadKeyEntries &entries, unsigned int threadNum) {
	// Both sorts are stable, so entries sharing a key keep their relative order.
	if (threadNum > 1 && entries.size() >= PARALLEL_SORT_THRESHOLD) {
		boost::sort::parallel_stable_sort(
			entries.begin(),
			entries.end(),
			[](const QuadKeyEntry &a, const QuadKeyEntry &b) { return a.quadKey < b.quadKey; },
			threadNum
		);
		return;
	}

	boost::sort::spinsort(
		entries.begin(),
		entries.end(),
		[](const QuadKeyEntry &a, const QuadKeyEntry &b) { return a.quadKey < b.quadKey; }
	);
}

QuadKeyEntries::const_iterator lowerBoundQuadKey(const QuadKeyEntries &entries, const std::string &quadKey) {
	return std::lower_bound(
		entries.begin(),
		entries.end(),
		quadKey,
		[](const QuadKeyEntry &e, const std::string &key) { return e.quadKey < key; }
	);
}
