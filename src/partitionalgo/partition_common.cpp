#include <iostream>
#include <memory>
#include <stdexcept>

#include <geos/geom/Point.h>

#include <common/footprint_constants.h>
#include <common/footprint_errors.hpp>
#include <partitionalgo/partition_common.hpp>

using namespace std;
using namespace geos::geom;

void feature_centroid(const Geometry &geom, double &x, double &y) {
	unique_ptr<Point> centroid(geom.getCentroid());
	if (!centroid || centroid->isEmpty()) {
		throw SourceFormatError("Feature geometry has no centroid");
	}
	x = centroid->getX();
	y = centroid->getY();
}

void check_partition_params(const struct partition_op &partop) {
	if (partop.output_dir.empty()) {
		throw invalid_argument("No output folder given for partitioning");
	}
	if (partop.flush_bytes == 0) {
		throw invalid_argument("Flush size must be positive");
	}
	if (partop.partition_method == PARTITION_QT) {
		if (partop.bucket_size < 1) {
			throw invalid_argument("Bucket size must be at least 1");
		}
		if (!(partop.min_cell_size > 0)) {
			throw invalid_argument("Minimum cell size must be positive");
		}
		if (partop.max_level < 0 || partop.max_level > 62) {
			throw invalid_argument("Maximum level must be within [0, 62]");
		}
	} else if (partop.partition_method == PARTITION_TILE) {
		if (partop.num_chunks < 1) {
			throw invalid_argument("Number of chunks must be at least 1");
		}
		if (partop.tile_id.empty()) {
			throw invalid_argument("No tile id given for tile partitioning");
		}
	} else {
		throw invalid_argument("Invalid partitioner: " + partop.partition_method);
	}
}

PartitionResult finish_partition(const string &output_dir, ChunkWriter &writer,
	long feature_count) {
	PartitionResult result;
	result.output_dir = output_dir;
	result.entries = writer.finish();
	result.index_path = index_file_path(output_dir);
	result.feature_count = feature_count;
	write_index(result.index_path, result.entries);

	#ifdef DEBUG
	cerr << "Partitioned " << feature_count << " features into "
		<< result.entries.size() << " chunks in " << output_dir << endl;
	#endif
	return result;
}
