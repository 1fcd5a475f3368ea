#include <catch2/catch.hpp>

#include <common/bbox_utils.hpp>
#include <common/footprint_errors.hpp>
#include <featureio/feature_source.hpp>

#include "test_helpers.hpp"

TEST_CASE("CSV building files", "[featureio]") {
	TempDir tmp;
	std::string path = tmp.file("tile_buildings.csv");
	write_text(path,
		"latitude,longitude,area_in_meters,confidence,id,geometry\n"
		"0.5,0.5,12.5,0.81,b1,\"POLYGON ((0 0, 1 0, 1 1, 0 1, 0 0))\"\n"
		"\n"
		"2.5,2.5,,n/a,b2,\"POLYGON ((2 2, 3 2, 3 3, 2 3, 2 2))\"\r\n");

	CsvFeatureSource source(path);
	REQUIRE(source.columns().size() == 6);

	Feature feature;
	REQUIRE(source.next(feature));
	REQUIRE(id_of(feature) == "b1");
	REQUIRE(feature.attributes.count("geometry") == 0);
	REQUIRE(feature.attributes.at("confidence").isNumber());
	REQUIRE(feature.attributes.at("confidence").getNumber() == Approx(0.81));
	REQUIRE(envelope_of(*feature.geometry) == BoundingBox(0, 0, 1, 1));

	SECTION("malformed attribute values become null, the record is kept") {
		REQUIRE(source.next(feature));
		REQUIRE(id_of(feature) == "b2");
		REQUIRE(feature.attributes.at("area_in_meters").isNull());
		REQUIRE(feature.attributes.at("confidence").isNull());
		REQUIRE(!source.next(feature));
	}

	SECTION("rewind restarts from the first record") {
		REQUIRE(source.next(feature));
		REQUIRE(!source.next(feature));
		source.rewind();
		REQUIRE(source.next(feature));
		REQUIRE(id_of(feature) == "b1");
	}
}

TEST_CASE("CSV with another geometry column", "[featureio]") {
	TempDir tmp;
	std::string path = tmp.file("shapes.csv");
	write_text(path, "WKT,id\n\"POINT (3 4)\",p1\n");

	REQUIRE_THROWS_AS(CsvFeatureSource(path), SourceFormatError);

	std::unique_ptr<FeatureSource> source = open_feature_source(path, "WKT");
	Feature feature;
	REQUIRE(source->next(feature));
	REQUIRE(id_of(feature) == "p1");
	REQUIRE(envelope_of(*feature.geometry) == BoundingBox(3, 4, 3, 4));
}

TEST_CASE("Malformed CSV records", "[featureio]") {
	TempDir tmp;
	Feature feature;

	std::string short_row = tmp.file("short.csv");
	write_text(short_row, "id,geometry\nb1,\"POINT (0 0)\"\nb2\n");
	CsvFeatureSource source(short_row);
	REQUIRE(source.next(feature));
	try {
		source.next(feature);
		FAIL("short row accepted");
	} catch (const SourceFormatError &e) {
		REQUIRE(std::string(e.what()).find("short.csv:3") != std::string::npos);
	}

	std::string bad_wkt = tmp.file("bad.csv");
	write_text(bad_wkt, "id,geometry\nb1,\"POLYGON ((0 0, 1 0\"\n");
	CsvFeatureSource bad(bad_wkt);
	REQUIRE_THROWS_AS(bad.next(feature), SourceFormatError);

	std::string empty_geom = tmp.file("empty.csv");
	write_text(empty_geom, "id,geometry\nb1,POLYGON EMPTY\n");
	CsvFeatureSource empty(empty_geom);
	REQUIRE_THROWS_AS(empty.next(feature), SourceFormatError);
}

TEST_CASE("Line-delimited GeoJSON", "[featureio]") {
	TempDir tmp;
	std::string path = tmp.file("buildings.geojsonl");
	write_text(path,
		"{\"type\":\"Feature\",\"geometry\":{\"type\":\"Point\",\"coordinates\":[1,2]},"
		"\"properties\":{\"id\":\"a\",\"height\":7}}\n"
		"\n"
		"\x1e{\"type\":\"Feature\",\"geometry\":{\"type\":\"Point\",\"coordinates\":[3,4]},"
		"\"properties\":{\"id\":\"b\"}}\n");

	std::unique_ptr<FeatureSource> source = open_feature_source(path);
	Feature feature;
	REQUIRE(source->next(feature));
	REQUIRE(id_of(feature) == "a");
	REQUIRE(feature.attributes.at("height").getNumber() == 7);
	REQUIRE(source->next(feature));
	REQUIRE(id_of(feature) == "b");
	REQUIRE(envelope_of(*feature.geometry) == BoundingBox(3, 4, 3, 4));
	REQUIRE(!source->next(feature));

	std::string broken = tmp.file("broken.ndjson");
	write_text(broken, "{\"type\":\"Feature\",\"geometry\":\n");
	std::unique_ptr<FeatureSource> bad = open_feature_source(broken);
	REQUIRE_THROWS_AS(bad->next(feature), SourceFormatError);
}

TEST_CASE("GeoJSON FeatureCollection", "[featureio]") {
	TempDir tmp;
	std::string path = tmp.file("buildings.geojson");
	write_text(path,
		"{\"type\":\"FeatureCollection\",\"features\":["
		"{\"type\":\"Feature\",\"geometry\":{\"type\":\"Polygon\",\"coordinates\":"
		"[[[0,0],[2,0],[2,1],[0,1],[0,0]]]},\"properties\":{\"id\":\"r\"}}]}");

	std::unique_ptr<FeatureSource> source = open_feature_source(path);
	Feature feature;
	REQUIRE(source->next(feature));
	REQUIRE(id_of(feature) == "r");
	REQUIRE(envelope_of(*feature.geometry) == BoundingBox(0, 0, 2, 1));
	REQUIRE(!source->next(feature));
	source->rewind();
	REQUIRE(source->next(feature));
}

TEST_CASE("GeoJSON FeatureCollection rewind after a partial read", "[featureio]") {
	TempDir tmp;
	std::string path = tmp.file("pair.geojson");
	write_text(path,
		"{\"type\":\"FeatureCollection\",\"features\":["
		"{\"type\":\"Feature\",\"geometry\":{\"type\":\"Point\",\"coordinates\":[1,2]},"
		"\"properties\":{\"id\":\"r1\"}},"
		"{\"type\":\"Feature\",\"geometry\":{\"type\":\"Point\",\"coordinates\":[3,4]},"
		"\"properties\":{\"id\":\"r2\"}}]}");

	GeoJSONFileFeatureSource source(path);
	Feature feature;
	REQUIRE(source.next(feature));
	REQUIRE(id_of(feature) == "r1");

	source.rewind();
	Feature first;
	REQUIRE(source.next(first));
	REQUIRE(id_of(first) == "r1");
	REQUIRE(envelope_of(*first.geometry) == BoundingBox(1, 2, 1, 2));
	Feature second;
	REQUIRE(source.next(second));
	REQUIRE(id_of(second) == "r2");
	REQUIRE(envelope_of(*second.geometry) == BoundingBox(3, 4, 3, 4));
	REQUIRE(!source.next(feature));

	// Features handed out earlier stay valid across a rewind
	source.rewind();
	REQUIRE(source.next(feature));
	REQUIRE(id_of(feature) == "r1");
	REQUIRE(id_of(second) == "r2");
	REQUIRE(second.geometry->getNumPoints() == 1);
}

TEST_CASE("CSV text values must be UTF-8", "[featureio]") {
	TempDir tmp;
	std::string path = tmp.file("names.csv");
	write_text(path, std::string("id,name,geometry\n")
		+ "u1,Caf\xc3\xa9,\"POINT (0 0)\"\n"
		+ "u2,Caf\xe9" + ",\"POINT (1 1)\"\n"
		+ "u3,\xc0\xaf" + ",\"POINT (2 2)\"\n");

	CsvFeatureSource source(path);
	Feature feature;
	REQUIRE(source.next(feature));
	REQUIRE(feature.attributes.at("name").getString() == "Caf\xc3\xa9");

	// Latin-1 and overlong sequences: the record is kept without the value
	REQUIRE(source.next(feature));
	REQUIRE(id_of(feature) == "u2");
	REQUIRE(feature.attributes.at("name").isNull());
	REQUIRE(source.next(feature));
	REQUIRE(id_of(feature) == "u3");
	REQUIRE(feature.attributes.at("name").isNull());
	REQUIRE(!source.next(feature));
}

TEST_CASE("Feature files are recognized by extension", "[featureio]") {
	REQUIRE(is_feature_file("a.csv"));
	REQUIRE(is_feature_file("chunk_QT_1_0_0.geojsonl"));
	REQUIRE(is_feature_file("A.GeoJSON"));
	REQUIRE(is_feature_file("x.ndjson"));
	REQUIRE(!is_feature_file("chunk_boundaries.tsv"));
	REQUIRE(!is_feature_file("README"));

	REQUIRE_THROWS_AS(open_feature_source("data.shp"), SourceFormatError);
	REQUIRE_THROWS_AS(open_feature_source("/nonexistent/x.csv"), SourceFormatError);
}
