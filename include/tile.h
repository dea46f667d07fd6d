/*! \file */ 
#ifndef _TILE_H
#define _TILE_H

// A tile in the slippy-map quadtree, and its quadkey encoding.
//
// A quadkey has one digit per zoom level; each digit picks one of the four
// children of the previous level, so a tile's quadkey is a string prefix of
// the quadkeys of every tile nested beneath it.

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>

// Deepest zoom whose coordinates fit in 32 bits with room to spare.
constexpr uint8_t MaxZoom = 30;

class Tile {

public:
	uint8_t zoom;
	uint32_t x, y;

	Tile();
	Tile(uint8_t zoom, uint32_t x, uint32_t y);

	std::string quadKey() const;

	// The tile one zoom level up which contains this one.
	Tile parent() const;

	// True if `other` is this tile or nested beneath it.
	bool contains(const Tile &other) const;

	bool operator==(const Tile &other) const {
		return zoom == other.zoom && x == other.x && y == other.y;
	}
	bool operator!=(const Tile &other) const { return !(*this == other); }
	bool operator<(const Tile &other) const {
		if (zoom != other.zoom) return zoom < other.zoom;
		if (x != other.x) return x < other.x;
		return y < other.y;
	}
};

namespace std {
	template<> struct hash<Tile> {
		size_t operator()(const Tile &t) const {
			return hash<uint32_t>()(t.x) ^ (hash<uint32_t>()(t.y) << 1) ^ (hash<uint8_t>()(t.zoom) << 2);
		}
	};
}

std::ostream &operator<<(std::ostream &os, const Tile &t);

// z/x/y, as used in tile URLs
std::string tileToString(const Tile &t);

// Reconstruct a tile from its quadkey. Throws std::invalid_argument for
// characters other than 0-3, std::out_of_range for keys deeper than MaxZoom.
Tile tileFromQuadKey(const std::string &quadKey);

// Parse "z/x/y". Throws std::invalid_argument if the text isn't of that form.
Tile parseTile(const std::string &text);

#endif //_TILE_H
