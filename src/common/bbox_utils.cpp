#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <vector>

#include <geos/geom/Envelope.h>

#include <common/bbox_utils.hpp>
#include <common/footprint_constants.h>
#include <common/footprint_errors.hpp>
#include <utilities/tokenizer.h>

using namespace std;
using namespace geos::geom;

bool intersects(const BoundingBox &a, const BoundingBox &b) {
	return !(a.low[0] > b.high[0] || a.high[0] < b.low[0]
		|| a.low[1] > b.high[1] || a.high[1] < b.low[1]);
}

BoundingBox box_union(const BoundingBox &a, const BoundingBox &b) {
	return BoundingBox(min(a.low[0], b.low[0]), min(a.low[1], b.low[1]),
		max(a.high[0], b.high[0]), max(a.high[1], b.high[1]));
}

bool contains(const BoundingBox &outer, const BoundingBox &inner) {
	return inner.low[0] >= outer.low[0] && inner.high[0] <= outer.high[0]
		&& inner.low[1] >= outer.low[1] && inner.high[1] <= outer.high[1];
}

bool contains_point(const BoundingBox &box, double x, double y) {
	return x >= box.low[0] && x <= box.high[0]
		&& y >= box.low[1] && y <= box.high[1];
}

static void check_corner(const Corner &c) {
	if (std::isnan(c.lat) || std::isnan(c.lon)
		|| std::isinf(c.lat) || std::isinf(c.lon)) {
		stringstream ss;
		ss << "Invalid corner (" << c.lat << ", " << c.lon << "): not a number";
		throw InvalidBoxError(ss.str());
	}
	if (c.lat < -MAX_LATITUDE || c.lat > MAX_LATITUDE) {
		stringstream ss;
		ss << "Invalid corner (" << c.lat << ", " << c.lon << "): latitude outside [-90, 90]";
		throw InvalidBoxError(ss.str());
	}
	if (c.lon < -MAX_LONGITUDE || c.lon > MAX_LONGITUDE) {
		stringstream ss;
		ss << "Invalid corner (" << c.lat << ", " << c.lon << "): longitude outside [-180, 180]";
		throw InvalidBoxError(ss.str());
	}
}

BoundingBox normalize(const Corner &a, const Corner &b) {
	check_corner(a);
	check_corner(b);
	return BoundingBox(min(a.lon, b.lon), min(a.lat, b.lat),
		max(a.lon, b.lon), max(a.lat, b.lat));
}

static double parse_coordinate(const string &text, const string &whole) {
	const char *begin = text.c_str();
	char *end = NULL;
	double value = strtod(begin, &end);
	while (end != NULL && (*end == ' ' || *end == '\t')) {
		end++;
	}
	if (text.empty() || end == begin || *end != '\0') {
		throw InvalidBoxError("Invalid corner '" + whole
			+ "': coordinates must be in the format lat,lon");
	}
	return value;
}

Corner parse_corner(const string &text) {
	vector<string> fields;
	tokenize(text, fields, COMMA, true, "");
	if (fields.size() != 2) {
		throw InvalidBoxError("Invalid corner '" + text
			+ "': coordinates must be in the format lat,lon");
	}
	Corner c;
	c.lat = parse_coordinate(fields[0], text);
	c.lon = parse_coordinate(fields[1], text);
	return c;
}

BoundingBox envelope_of(const Geometry &geom) {
	const Envelope *env = geom.getEnvelopeInternal();
	if (env->isNull()) {
		throw SourceFormatError("Empty geometry has no envelope");
	}
	return BoundingBox(env->getMinX(), env->getMinY(), env->getMaxX(), env->getMaxY());
}

unique_ptr<Geometry> box_to_geometry(const BoundingBox &box, const GeometryFactory &gf) {
	Envelope env(box.low[0], box.high[0], box.low[1], box.high[1]);
	return gf.toGeometry(&env);
}

bool geometry_intersects(const Geometry &geom, const BoundingBox &box) {
	if (geom.isEmpty() || !intersects(envelope_of(geom), box)) {
		return false;
	}
	unique_ptr<Geometry> window = box_to_geometry(box, *geom.getFactory());
	return geom.intersects(window.get());
}

string box_to_string(const BoundingBox &box) {
	stringstream ss;
	ss.precision(15);
	ss << "[lat " << box.min_lat() << " .. " << box.max_lat()
		<< ", lon " << box.min_lon() << " .. " << box.max_lon() << "]";
	return ss.str();
}
