#include <cmath>
#include <iostream>
#include <sstream>

#include <common/bbox_utils.hpp>
#include <common/footprint_constants.h>
#include <common/footprint_errors.hpp>
#include <featureio/feature_source.hpp>
#include <featureio/reference_tiling.hpp>

using namespace std;
using namespace geos::io;

/* Tile ids are strings in the published tiling but may come as integers */
static bool tile_id_of(const AttributeMap &attributes, string &tile_id) {
	AttributeMap::const_iterator it = attributes.find(TILE_ID_PROPERTY);
	if (it == attributes.end()) {
		return false;
	}
	if (it->second.isString()) {
		tile_id = it->second.getString();
		return !tile_id.empty();
	}
	if (it->second.isNumber()) {
		double v = it->second.getNumber();
		stringstream ss;
		ss.precision(15);
		if (v == floor(v)) {
			ss << static_cast<long long>(v);
		} else {
			ss << v;
		}
		tile_id = ss.str();
		return true;
	}
	return false;
}

unique_ptr<ReferenceTiling> ReferenceTiling::load(const string &path) {
	unique_ptr<ReferenceTiling> tiling(new ReferenceTiling());
	tiling->m_path = path;

	GeoJSONFileFeatureSource source(path);
	Feature feature;
	long position = 0;
	while (source.next(feature)) {
		string tile_id;
		if (!tile_id_of(feature.attributes, tile_id)) {
			stringstream ss;
			ss << path << ": tile " << position << " has no " << TILE_ID_PROPERTY;
			throw SourceFormatError(ss.str());
		}
		ReferenceTile &tile = tiling->m_tiles[tile_id];
		if (!tile.tile_id.empty()) {
			throw SourceFormatError(path + ": duplicate tile id " + tile_id);
		}
		tile.tile_id = tile_id;
		tile.box = envelope_of(*feature.geometry);
		tile.geometry = std::move(feature.geometry);
		tile.attributes = feature.attributes;
		tiling->m_order.push_back(tile_id);
		position++;
	}
	#ifdef DEBUG
	cerr << "Loaded " << tiling->m_tiles.size() << " tiles from " << path << endl;
	#endif
	return tiling;
}

bool ReferenceTiling::has_tile(const string &tile_id) const {
	return m_tiles.find(tile_id) != m_tiles.end();
}

const ReferenceTile &ReferenceTiling::lookup(const string &tile_id) const {
	map<string, ReferenceTile>::const_iterator it = m_tiles.find(tile_id);
	if (it == m_tiles.end()) {
		throw UnknownTileError(tile_id, m_path);
	}
	return it->second;
}
