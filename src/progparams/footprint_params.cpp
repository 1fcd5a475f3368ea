/* Containing methods to extract parameters and store them in the operators */
#include <iostream>
#include <boost/program_options.hpp>

#include <common/footprint_constants.h>
#include <progparams/footprint_params.hpp>

using namespace std;

namespace po = boost::program_options;

void init_params_partitioning(struct partition_op &partop) {
	partop.partition_method = PARTITION_QT;
	partop.geometry_column = DEFAULT_GEOMETRY_COLUMN;
	partop.override_existing = false;
	partop.bucket_size = DEFAULT_BUCKET_SIZE;
	partop.min_cell_size = DEFAULT_MIN_CELL_SIZE;
	partop.max_level = DEFAULT_MAX_LEVEL;
	partop.prefix_tile_id = DEFAULT_QT_PREFIX;
	partop.tiles_path = DEFAULT_TILES_FILE;
	partop.num_chunks = DEFAULT_NUM_CHUNKS;
	partop.flush_bytes = DEFAULT_FLUSH_BYTES;
}

void init_params_extraction(struct extract_op &exop) {
	exop.output_path = DEFAULT_EXTRACT_OUTPUT;
	exop.geometry_column = DEFAULT_GEOMETRY_COLUMN;
	exop.from_db = false;
	exop.extra_fields = false;
	exop.overwrite = false;
	exop.simplify_tolerance = 0;
}

// Remove trailing slash in path
static void strip_slash(string &path) {
	while (path.size() > 1 && path.at(path.size() - 1) == '/') {
		path = path.substr(0, path.size() - 1);
	}
}

bool extract_params(int argc, char **argv, string &query_type,
	struct partition_op &partop, struct extract_op &exop) {
	init_params_partitioning(partop);
	init_params_extraction(exop);

	string input_path;
	string output_path;
	string geometry_column = DEFAULT_GEOMETRY_COLUMN;
	try {
		po::options_description desc("Options");
		desc.add_options()
			("help", "This help message")
			("querytype,q", po::value<string>(&query_type), "Query type [ partition | extract ]")
			("partitioner,u", po::value<string>(&partop.partition_method), "Partitioning method \
[ qt | tile ] (adaptive grid or tile binning)")
			("input,i", po::value<string>(&input_path), "Input feature file or folder. \
For extraction with --fromdb, the chunk folder")
			("output,o", po::value<string>(&output_path), "Chunk folder for partitioning, \
output collection for extraction (.geojson or .csv)")
			("geomcol", po::value<string>(&geometry_column), "Name of the WKT column of CSV inputs")
			("bucket,b", po::value<long>(&partop.bucket_size), "Maximum number of features per chunk (qt)")
			("mincell", po::value<double>(&partop.min_cell_size), "Minimum cell size in degrees (qt)")
			("maxlevel", po::value<int>(&partop.max_level), "Maximum subdivision depth (qt)")
			("prefix", po::value<string>(&partop.prefix_tile_id), "Chunk id prefix (qt)")
			("tiles", po::value<string>(&partop.tiles_path), "GeoJSON file of the reference tiling (tile)")
			("tileid", po::value<string>(&partop.tile_id), "Tile to partition (tile)")
			("numchunks,n", po::value<int>(&partop.num_chunks), "Desired number of chunks (tile)")
			("flushbytes", po::value<size_t>(&partop.flush_bytes), "Bytes buffered before chunk files are written")
			("overwrite,w", "Replace existing chunk folder or output file")
			("topleft", po::value<string>(&exop.top_left), "Query corner \"lat,lon\"")
			("bottomright", po::value<string>(&exop.bottom_right), "Opposite query corner \"lat,lon\"")
			("fromdb", "Extract through the chunk index of a partitioned folder")
			("extrafields,e", "Add the empty tag columns to the output")
			("simplify", po::value<double>(&exop.simplify_tolerance), "(Optional) Simplification tolerance in degrees")
			;
		po::variables_map vm;
		po::store(po::parse_command_line(argc, argv, desc), vm);
		po::notify(vm);
		if (vm.count("help") || !vm.count("querytype")) {
			cerr << desc << endl;
			return false;
		}

		bool overwrite = vm.count("overwrite") > 0;
		strip_slash(input_path);
		strip_slash(output_path);

		if (query_type == QUERYPROC_PARTITION) {
			if (partop.partition_method != PARTITION_QT
				&& partop.partition_method != PARTITION_TILE) {
				cerr << "Invalid partitioner. Run --help" << endl;
				return false;
			}
			partop.override_existing = overwrite;
			partop.geometry_column = geometry_column;
			partop.input_path = input_path;
			partop.output_dir = output_path;
			if (partop.partition_method == PARTITION_TILE) {
				if (partop.tile_id.empty()) {
					cerr << "Missing tile id. Run --help" << endl;
					return false;
				}
				if (partop.input_path.empty()) {
					partop.input_path = partop.tile_id + DEFAULT_TILE_INPUT_SUFFIX;
				}
				if (partop.output_dir.empty()) {
					partop.output_dir = partop.tile_id + DEFAULT_TILE_OUTPUT_SUFFIX;
				}
			}
			if (partop.input_path.empty() || partop.output_dir.empty()) {
				cerr << "Missing input or output path. Run --help" << endl;
				return false;
			}
		} else if (query_type == QUERYPROC_EXTRACT) {
			if (!vm.count("topleft") || !vm.count("bottomright")) {
				cerr << "Missing query corners. Run --help" << endl;
				return false;
			}
			if (input_path.empty()) {
				cerr << "Missing input path. Run --help" << endl;
				return false;
			}
			exop.input_path = input_path;
			if (!output_path.empty()) {
				exop.output_path = output_path;
			}
			exop.geometry_column = geometry_column;
			exop.overwrite = overwrite;
			exop.from_db = vm.count("fromdb") > 0;
			exop.extra_fields = vm.count("extrafields") > 0;
			if (exop.simplify_tolerance < 0) {
				cerr << "Simplification tolerance must not be negative" << endl;
				return false;
			}
		} else {
			cerr << "Invalid query type. Run --help" << endl;
			return false;
		}
	} catch (exception &e) {
		cerr << "error: " << e.what() << endl;
		return false;
	}

	#ifdef DEBUG
	cerr << "Query type: " << query_type << endl;
	#endif
	return true;
}
