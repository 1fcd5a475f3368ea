#include <sstream>

#include <catch2/catch.hpp>

#include <boost/filesystem.hpp>

#include <common/footprint_constants.h>
#include <common/footprint_errors.hpp>
#include <featureio/chunk_store.hpp>
#include <featureio/reference_tiling.hpp>
#include <partitionalgo/fg/fg_2d.hpp>
#include <partitionalgo/partitioner.hpp>

#include "test_helpers.hpp"

namespace fs = boost::filesystem;

static std::string tile_feature(const std::string &tile_id_json, double min_x, double min_y,
	double max_x, double max_y) {
	std::stringstream ss;
	ss << "{\"type\":\"Feature\",\"properties\":{\"tile_id\":" << tile_id_json
		<< ",\"size\":\"1MB\"},\"geometry\":{\"type\":\"Polygon\",\"coordinates\":[[["
		<< min_x << "," << min_y << "],[" << max_x << "," << min_y << "],["
		<< max_x << "," << max_y << "],[" << min_x << "," << max_y << "],["
		<< min_x << "," << min_y << "]]]}}";
	return ss.str();
}

static std::string write_tiling(const TempDir &tmp) {
	std::string path = tmp.file("tiles.geojson");
	write_text(path, "{\"type\":\"FeatureCollection\",\"features\":["
		+ tile_feature("\"120210\"", 0, 0, 2, 1) + ","
		+ tile_feature("42", 10, 10, 11, 11) + "]}");
	return path;
}

TEST_CASE("Reference tiling lookup", "[tile]") {
	TempDir tmp;
	std::unique_ptr<ReferenceTiling> tiling = ReferenceTiling::load(write_tiling(tmp));

	REQUIRE(tiling->size() == 2);
	REQUIRE(tiling->tile_ids()[0] == "120210");
	REQUIRE(tiling->has_tile("42"));

	const ReferenceTile &tile = tiling->lookup("120210");
	REQUIRE(tile.box == BoundingBox(0, 0, 2, 1));
	REQUIRE(tile.attributes.at("size").getString() == "1MB");

	try {
		tiling->lookup("999");
		FAIL("unknown tile accepted");
	} catch (const UnknownTileError &e) {
		REQUIRE(e.tile_id == "999");
	}

	std::string dup = tmp.file("dup.geojson");
	write_text(dup, "{\"type\":\"FeatureCollection\",\"features\":["
		+ tile_feature("\"a\"", 0, 0, 1, 1) + "," + tile_feature("\"a\"", 1, 1, 2, 2) + "]}");
	REQUIRE_THROWS_AS(ReferenceTiling::load(dup), SourceFormatError);
}

TEST_CASE("Tile grid resolution follows the aspect ratio", "[tile]") {
	TileBinGrid wide(BoundingBox(0, 0, 2, 1), 2);
	REQUIRE(wide.columns() == 2);
	REQUIRE(wide.rows() == 1);

	TileBinGrid tall(BoundingBox(0, 0, 1, 4), 4);
	REQUIRE(tall.columns() == 1);
	REQUIRE(tall.rows() == 4);

	TileBinGrid square(BoundingBox(0, 0, 1, 1), 1000);
	REQUIRE(square.columns() == 32);
	REQUIRE(square.rows() == 32);
	REQUIRE(square.size() == 1024);

	TileBinGrid degenerate(BoundingBox(0, 0, 0, 1), 9);
	REQUIRE(degenerate.columns() == 3);
	REQUIRE(degenerate.rows() == 3);

	TileBinGrid one(BoundingBox(0, 0, 1, 1), 1);
	REQUIRE(one.size() == 1);
}

TEST_CASE("Tile grid cells", "[tile]") {
	TileBinGrid grid(BoundingBox(0, 0, 1, 1), 4);
	REQUIRE(grid.columns() == 2);
	REQUIRE(grid.rows() == 2);

	REQUIRE(grid.cell_of(0.25, 0.25) == 0);
	REQUIRE(grid.cell_of(0.25, 0.75) == 1);
	REQUIRE(grid.cell_of(0.75, 0.25) == 2);
	REQUIRE(grid.cell_of(0.75, 0.75) == 3);
	REQUIRE(grid.cell_box(3) == BoundingBox(0.5, 0.5, 1, 1));
	REQUIRE(grid.cell_box(1) == BoundingBox(0, 0.5, 0.5, 1));

	SECTION("interior lines belong to the west and south cells") {
		REQUIRE(grid.cell_of(0.5, 0.5) == 0);
		REQUIRE(grid.cell_of(0.5, 0.75) == 1);
		REQUIRE(grid.cell_of(0.75, 0.5) == 2);
	}

	SECTION("outer edges and outside points clamp to edge cells") {
		REQUIRE(grid.cell_of(0, 0) == 0);
		REQUIRE(grid.cell_of(1, 1) == 3);
		REQUIRE(grid.cell_of(-3, 0.25) == 0);
		REQUIRE(grid.cell_of(7, 0.75) == 3);
		REQUIRE(grid.cell_of(0.75, -1) == 2);
	}
}

TEST_CASE("Tile-binned partitioning", "[tile]") {
	TempDir tmp;
	std::string tiles = write_tiling(tmp);

	std::vector<TestBuilding> buildings;
	TestBuilding west = {"west", square_wkt(0.5, 0.5, 0.1)};
	TestBuilding on_line = {"on_line", square_wkt(1, 0.5, 0.1)};
	TestBuilding east = {"east", square_wkt(1.5, 0.5, 0.1)};
	TestBuilding outside = {"outside", square_wkt(2.5, 0.5, 0.1)};
	buildings.push_back(west);
	buildings.push_back(on_line);
	buildings.push_back(east);
	buildings.push_back(outside);
	std::string input = tmp.file("120210_buildings.csv");
	write_buildings_csv(input, buildings);

	struct partition_op partop;
	init_params_partitioning(partop);
	partop.partition_method = PARTITION_TILE;
	partop.tiles_path = tiles;
	partop.tile_id = "120210";
	partop.num_chunks = 2;
	partop.input_path = input;
	partop.output_dir = tmp.file("120210_chunks");

	PartitionResult result = partition(partop);
	REQUIRE(result.feature_count == 4);
	REQUIRE(result.entries.size() == 2);
	REQUIRE(result.entries[0].chunk_id == "120210_0");
	REQUIRE(result.entries[0].feature_count == 2);
	REQUIRE(result.entries[1].chunk_id == "120210_1");
	REQUIRE(result.entries[1].feature_count == 2);

	std::vector<ChunkIndexEntry> first(1, result.entries[0]);
	std::multiset<std::string> west_ids = chunk_ids_of(partop.output_dir, first);
	REQUIRE(west_ids.count("west") == 1);
	REQUIRE(west_ids.count("on_line") == 1);

	// The box follows the members, not the nominal cell
	REQUIRE(result.entries[1].box == BoundingBox(1.5 - 0.1, 0.5 - 0.1, 2.5 + 0.1, 0.5 + 0.1));

	SECTION("unknown tile") {
		partop.tile_id = "000000";
		partop.output_dir = tmp.file("000000_chunks");
		REQUIRE_THROWS_AS(partition(partop), UnknownTileError);
		REQUIRE(!fs::exists(partop.output_dir));
	}

	SECTION("existing chunks without override") {
		REQUIRE_THROWS_AS(partition(partop), PartitionIOError);
		partop.override_existing = true;
		partop.num_chunks = 1;
		PartitionResult again = partition(partop);
		REQUIRE(again.entries.size() == 1);
		REQUIRE(again.entries[0].feature_count == 4);
		REQUIRE(!fs::exists(chunk_file_path(partop.output_dir, "120210_1")));
	}

	SECTION("integer tile ids") {
		partop.tile_id = "42";
		partop.output_dir = tmp.file("42_chunks");
		PartitionResult other = partition(partop);
		REQUIRE(other.feature_count == 4);
		REQUIRE(other.entries[0].chunk_id.compare(0, 3, "42_") == 0);
	}
}
