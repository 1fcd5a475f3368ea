#include <cmath>
#include <limits>

#include <catch2/catch.hpp>

#include <geos/geom/GeometryFactory.h>
#include <geos/io/WKTReader.h>

#include <common/bbox_utils.hpp>
#include <common/footprint_errors.hpp>

using namespace geos::geom;

TEST_CASE("Box intersection is inclusive, symmetric and reflexive", "[bbox]") {
	BoundingBox a(0, 0, 1, 1);
	BoundingBox b(0.5, 0.5, 2, 2);
	BoundingBox edge(1, 0, 2, 1);
	BoundingBox corner(1, 1, 3, 3);
	BoundingBox apart(1.0000001, 0, 2, 1);

	REQUIRE(intersects(a, a));
	REQUIRE(intersects(a, b));
	REQUIRE(intersects(b, a));
	REQUIRE(intersects(a, edge));
	REQUIRE(intersects(edge, a));
	REQUIRE(intersects(a, corner));
	REQUIRE(!intersects(a, apart));
	REQUIRE(!intersects(apart, a));

	BoundingBox point(0.5, 0.5, 0.5, 0.5);
	REQUIRE(intersects(point, point));
	REQUIRE(intersects(a, point));
}

TEST_CASE("Box union and containment", "[bbox]") {
	BoundingBox a(0, 0, 1, 1);
	BoundingBox b(-1, 0.5, 0.5, 3);
	BoundingBox u = box_union(a, b);
	REQUIRE(u == BoundingBox(-1, 0, 1, 3));
	REQUIRE(contains(u, a));
	REQUIRE(contains(u, b));
	REQUIRE(!contains(a, u));
	REQUIRE(contains_point(a, 1, 1));
	REQUIRE(!contains_point(a, 1.5, 0));
}

TEST_CASE("Corners normalize in any order", "[bbox]") {
	Corner top_left = {47.7, -122.4};
	Corner bottom_right = {47.5, -122.2};
	BoundingBox expected(-122.4, 47.5, -122.2, 47.7);

	REQUIRE(normalize(top_left, bottom_right) == expected);
	REQUIRE(normalize(bottom_right, top_left) == expected);

	Corner bottom_left = {47.5, -122.4};
	Corner top_right = {47.7, -122.2};
	REQUIRE(normalize(bottom_left, top_right) == expected);

	BoundingBox box = normalize(top_left, bottom_right);
	REQUIRE(box.min_lat() == 47.5);
	REQUIRE(box.max_lat() == 47.7);
	REQUIRE(box.min_lon() == -122.4);
	REQUIRE(box.max_lon() == -122.2);
}

TEST_CASE("Invalid corners are rejected", "[bbox]") {
	Corner ok = {10, 10};
	Corner nan_lat = {std::numeric_limits<double>::quiet_NaN(), 10};
	Corner inf_lon = {10, std::numeric_limits<double>::infinity()};
	Corner lat_range = {90.5, 10};
	Corner lon_range = {10, -180.5};

	REQUIRE_THROWS_AS(normalize(ok, nan_lat), InvalidBoxError);
	REQUIRE_THROWS_AS(normalize(inf_lon, ok), InvalidBoxError);
	REQUIRE_THROWS_AS(normalize(ok, lat_range), InvalidBoxError);
	REQUIRE_THROWS_AS(normalize(lon_range, ok), InvalidBoxError);

	Corner north_pole = {90, 180};
	REQUIRE_NOTHROW(normalize(ok, north_pole));
}

TEST_CASE("Corner text parsing", "[bbox]") {
	Corner c = parse_corner("47.6062,-122.3321");
	REQUIRE(c.lat == Approx(47.6062));
	REQUIRE(c.lon == Approx(-122.3321));

	c = parse_corner(" -1.5, 2");
	REQUIRE(c.lat == -1.5);
	REQUIRE(c.lon == 2);

	REQUIRE_THROWS_AS(parse_corner(""), InvalidBoxError);
	REQUIRE_THROWS_AS(parse_corner("47.6"), InvalidBoxError);
	REQUIRE_THROWS_AS(parse_corner("47.6,"), InvalidBoxError);
	REQUIRE_THROWS_AS(parse_corner("north,east"), InvalidBoxError);
	REQUIRE_THROWS_AS(parse_corner("1,2,3"), InvalidBoxError);
}

TEST_CASE("Exact geometry test against a box", "[bbox]") {
	GeometryFactory::Ptr gf = GeometryFactory::create();
	geos::io::WKTReader reader(*gf);
	std::unique_ptr<Geometry> triangle = reader.read("POLYGON ((0 0, 1 0, 0 1, 0 0))");

	REQUIRE(envelope_of(*triangle) == BoundingBox(0, 0, 1, 1));

	// Inside the envelope but away from the hypotenuse
	REQUIRE(!geometry_intersects(*triangle, BoundingBox(0.8, 0.8, 0.9, 0.9)));
	REQUIRE(geometry_intersects(*triangle, BoundingBox(0.1, 0.1, 0.2, 0.2)));
	// Touching the vertex only
	REQUIRE(geometry_intersects(*triangle, BoundingBox(1, -1, 2, 0)));
	REQUIRE(!geometry_intersects(*triangle, BoundingBox(2, 2, 3, 3)));

	std::unique_ptr<Geometry> empty = reader.read("POLYGON EMPTY");
	REQUIRE_THROWS_AS(envelope_of(*empty), SourceFormatError);
	REQUIRE(!geometry_intersects(*empty, BoundingBox(0, 0, 1, 1)));
}
