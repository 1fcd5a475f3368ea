#ifndef FOOTPRINTGIS_COMMON_FOOTPRINT_STRUCTS_H
#define FOOTPRINTGIS_COMMON_FOOTPRINT_STRUCTS_H

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <geos/geom/Geometry.h>
#include <geos/io/GeoJSON.h>

/* Axis-aligned box in WGS84 degrees.
 * Index 0 is the longitude (x), index 1 the latitude (y). */
struct BoundingBox {
	double low[2];
	double high[2];

	BoundingBox() {
		low[0] = low[1] = high[0] = high[1] = 0;
	}

	BoundingBox(double min_x, double min_y, double max_x, double max_y) {
		low[0] = min_x;
		low[1] = min_y;
		high[0] = max_x;
		high[1] = max_y;
	}

	double min_lat() const { return low[1]; }
	double min_lon() const { return low[0]; }
	double max_lat() const { return high[1]; }
	double max_lon() const { return high[0]; }


	bool operator==(const BoundingBox &other) const {
		return low[0] == other.low[0] && low[1] == other.low[1]
			&& high[0] == other.high[0] && high[1] == other.high[1];
	}
	bool operator!=(const BoundingBox &other) const {
		return !(*this == other);
	}
};

/* Attribute name -> value, ordered by name */
typedef std::map<std::string, geos::io::GeoJSONValue> AttributeMap;

/* A building footprint: exclusively owned geometry plus its attributes */
struct Feature {
	std::unique_ptr<geos::geom::Geometry> geometry;
	AttributeMap attributes;

	Feature() {}
	Feature(std::unique_ptr<geos::geom::Geometry> geom, const AttributeMap &attrs)
		: geometry(std::move(geom)), attributes(attrs) {}

	Feature(Feature &&) = default;
	Feature &operator=(Feature &&) = default;
	Feature(const Feature &) = delete;
	Feature &operator=(const Feature &) = delete;
};

/* One line of the boundaries file */
struct ChunkIndexEntry {
	std::string chunk_id;
	BoundingBox box;
	long feature_count;

	ChunkIndexEntry() : feature_count(0) {}
	ChunkIndexEntry(const std::string &id, const BoundingBox &b, long count)
		: chunk_id(id), box(b), feature_count(count) {}
};

#endif
