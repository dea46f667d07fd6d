#include "tile.h"
#include <stdexcept>
#include <sstream>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

using namespace std;

Tile::Tile(): zoom(0), x(0), y(0) {}

Tile::Tile(uint8_t zoom, uint32_t x, uint32_t y): zoom(zoom), x(x), y(y) {
	if (zoom > MaxZoom)
		throw std::out_of_range("Tile: zoom " + to_string(zoom) + " is deeper than z" + to_string(MaxZoom));

	const uint32_t extent = 1u << zoom;
	if (x >= extent || y >= extent)
		throw std::out_of_range("Tile: " + to_string(x) + "," + to_string(y) + " is outside z" + to_string(zoom));
}

std::string Tile::quadKey() const {
	std::string rv(zoom, '0');
	for (uint8_t z = zoom; z > 0; z--) {
		const uint32_t mask = 1u << (z - 1);
		char digit = '0';
		if (x & mask) digit += 1;
		if (y & mask) digit += 2;
		rv[zoom - z] = digit;
	}
	return rv;
}

Tile Tile::parent() const {
	if (zoom == 0)
		throw std::out_of_range("Tile: z0 has no parent");
	return Tile(zoom - 1, x >> 1, y >> 1);
}

bool Tile::contains(const Tile &other) const {
	if (other.zoom < zoom) return false;
	const uint8_t shift = other.zoom - zoom;
	return (other.x >> shift) == x && (other.y >> shift) == y;
}

std::ostream &operator<<(std::ostream &os, const Tile &t) {
	return os << static_cast<unsigned>(t.zoom) << "/" << t.x << "/" << t.y;
}

std::string tileToString(const Tile &t) {
	std::ostringstream ss;
	ss << t;
	return ss.str();
}

Tile tileFromQuadKey(const std::string &quadKey) {
	if (quadKey.size() > MaxZoom)
		throw std::out_of_range("quadkey " + quadKey + " is deeper than z" + to_string(MaxZoom));

	uint32_t x = 0, y = 0;
	for (char c : quadKey) {
		if (c < '0' || c > '3')
			throw std::invalid_argument("invalid quadkey digit '" + std::string(1, c) + "' in " + quadKey);
		const uint32_t digit = c - '0';
		x = (x << 1) | (digit & 1);
		y = (y << 1) | (digit >> 1);
	}
	return Tile(quadKey.size(), x, y);
}

Tile parseTile(const std::string &text) {
	std::vector<std::string> parts;
	boost::split(parts, text, boost::is_any_of("/"));
	if (parts.size() != 3)
		throw std::invalid_argument("expected z/x/y, got " + text);

	try {
		const unsigned zoom = boost::lexical_cast<unsigned>(parts[0]);
		if (zoom > MaxZoom)
			throw std::invalid_argument("zoom in " + text + " is deeper than z" + to_string(MaxZoom));
		return Tile(zoom, boost::lexical_cast<uint32_t>(parts[1]), boost::lexical_cast<uint32_t>(parts[2]));
	} catch (const boost::bad_lexical_cast &) {
		throw std::invalid_argument("expected z/x/y, got " + text);
	} catch (const std::out_of_range &e) {
		throw std::invalid_argument(text + ": " + e.what());
	}
}
