#ifndef FOOTPRINTGIS_COMMON_BBOX_UTILS_HPP
#define FOOTPRINTGIS_COMMON_BBOX_UTILS_HPP

#include <memory>
#include <string>

#include <geos/geom/Geometry.h>
#include <geos/geom/GeometryFactory.h>

#include <common/footprint_structs.h>

/* A (latitude, longitude) pair as typed by the user */
struct Corner {
	double lat;
	double lon;
};

/* Inclusive overlap test: boxes sharing only an edge or a corner intersect */
bool intersects(const BoundingBox &a, const BoundingBox &b);

BoundingBox box_union(const BoundingBox &a, const BoundingBox &b);

bool contains(const BoundingBox &outer, const BoundingBox &inner);
bool contains_point(const BoundingBox &box, double x, double y);

/* Canonical box from two opposite corners given in any order.
 * Throws InvalidBoxError on NaN or out-of-range coordinates. */
BoundingBox normalize(const Corner &a, const Corner &b);

/* Parses "lat,lon". Throws InvalidBoxError on malformed text. */
Corner parse_corner(const std::string &text);

/* Envelope of a non-empty geometry */
BoundingBox envelope_of(const geos::geom::Geometry &geom);

std::unique_ptr<geos::geom::Geometry> box_to_geometry(const BoundingBox &box,
	const geos::geom::GeometryFactory &gf);

/* Exact test of a geometry against a box (not only its envelope) */
bool geometry_intersects(const geos::geom::Geometry &geom, const BoundingBox &box);

std::string box_to_string(const BoundingBox &box);

#endif
