#include <memory>
#include <stdexcept>

#include <common/footprint_constants.h>
#include <featureio/reference_tiling.hpp>
#include <partitionalgo/fg/fg_2d.hpp>
#include <partitionalgo/partitioner.hpp>
#include <partitionalgo/qt/qt_2d.hpp>

using namespace std;

PartitionResult partition(FeatureSource &source, const struct partition_op &partop) {
	check_partition_params(partop);
	if (partop.partition_method == PARTITION_TILE) {
		unique_ptr<ReferenceTiling> tiling = ReferenceTiling::load(partop.tiles_path);
		return partition_tile_binned(*tiling, source, partop);
	}
	return partition_adaptive_grid(source, partop);
}

PartitionResult partition(const struct partition_op &partop) {
	check_partition_params(partop);
	if (partop.partition_method == PARTITION_TILE) {
		unique_ptr<ReferenceTiling> tiling = ReferenceTiling::load(partop.tiles_path);
		tiling->lookup(partop.tile_id);
		unique_ptr<FeatureSource> source = open_feature_source(partop.input_path,
			partop.geometry_column);
		return partition_tile_binned(*tiling, *source, partop);
	}
	unique_ptr<FeatureSource> source = open_feature_source(partop.input_path,
		partop.geometry_column);
	return partition_adaptive_grid(*source, partop);
}
