#ifndef FOOTPRINTGIS_PARTITIONALGO_PARTITION_COMMON_HPP
#define FOOTPRINTGIS_PARTITIONALGO_PARTITION_COMMON_HPP

#include <string>
#include <vector>

#include <geos/geom/Geometry.h>

#include <common/footprint_structs.h>
#include <featureio/chunk_store.hpp>
#include <progparams/footprint_datastructs.hpp>

/* Outcome of one partitioning run */
struct PartitionResult {
	std::string output_dir;
	std::string index_path;
	std::vector<ChunkIndexEntry> entries;
	long feature_count;
};

/* Centroid used to file a feature under exactly one chunk.
 * Throws SourceFormatError if the geometry has none. */
void feature_centroid(const geos::geom::Geometry &geom, double &x, double &y);

/* Throws std::invalid_argument on unusable parameters */
void check_partition_params(const struct partition_op &partop);

/* Flushes the chunk files and writes the boundaries file */
PartitionResult finish_partition(const std::string &output_dir, ChunkWriter &writer,
	long feature_count);

#endif
