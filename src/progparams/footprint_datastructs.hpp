#ifndef FOOTPRINTGIS_PROGPARAMS_FOOTPRINT_DATASTRUCTS_HPP
#define FOOTPRINTGIS_PROGPARAMS_FOOTPRINT_DATASTRUCTS_HPP

#include <string>

#include <common/footprint_structs.h>

/* Partitioning operator */
struct partition_op {
	std::string partition_method; // qt | tile
	std::string input_path;
	std::string output_dir;
	std::string geometry_column; // WKT column of CSV inputs
	bool override_existing;

	/* Adaptive grid */
	long bucket_size; // maximum features per chunk
	double min_cell_size; // degrees; cells are not halved below this
	int max_level;
	std::string prefix_tile_id;

	/* Tile binning */
	std::string tiles_path;
	std::string tile_id;
	int num_chunks;

	std::size_t flush_bytes;
};

/* Extraction operator */
struct extract_op {
	std::string input_path; // feature file, folder of feature files, or chunk folder
	std::string output_path;
	std::string geometry_column;
	std::string top_left; // "lat,lon"
	std::string bottom_right;

	bool from_db; // use the chunk index
	bool extra_fields;
	bool overwrite;
	double simplify_tolerance; // 0 disables simplification
};

void init_params_partitioning(struct partition_op &partop);
void init_params_extraction(struct extract_op &exop);

#endif
