#ifndef FOOTPRINTGIS_PARTITIONALGO_PARTITIONER_HPP
#define FOOTPRINTGIS_PARTITIONALGO_PARTITIONER_HPP

#include <featureio/feature_source.hpp>
#include <partitionalgo/partition_common.hpp>
#include <progparams/footprint_datastructs.hpp>

/* Partitions source with the method named in partop (qt | tile).
 * The tile method loads the reference tiling from partop.tiles_path. */
PartitionResult partition(FeatureSource &source, const struct partition_op &partop);

/* Same, opening partop.input_path. For the tile method the tile id is
 * resolved before the input is opened. */
PartitionResult partition(const struct partition_op &partop);

#endif
