#ifndef FOOTPRINTGIS_PARTITIONALGO_FG_FG_2D_HPP
#define FOOTPRINTGIS_PARTITIONALGO_FG_FG_2D_HPP

#include <string>

#include <common/footprint_structs.h>
#include <featureio/feature_source.hpp>
#include <featureio/reference_tiling.hpp>
#include <partitionalgo/partition_common.hpp>
#include <progparams/footprint_datastructs.hpp>

/* Fixed grid over the bounding box of one tile */
class TileBinGrid {
	public:
		TileBinGrid(const BoundingBox &box, int num_chunks);

		/* Cell owning (x, y): index = column * rows + row. A point on an
		 * interior grid line belongs to the west/south cell; points outside
		 * the box go to the nearest edge cell. */
		int cell_of(double x, double y) const;

		BoundingBox cell_box(int index) const;

		int size() const { return num_splits[0] * num_splits[1]; }
		int columns() const { return num_splits[0]; }
		int rows() const { return num_splits[1]; }

	private:
		BoundingBox m_box;
		int num_splits[2];
		double region_width[2];
};

/* Bins the features of tile partop.tile_id into about partop.num_chunks
 * chunks. Throws UnknownTileError, PartitionIOError, SourceFormatError. */
PartitionResult partition_tile_binned(const ReferenceTiling &tiling, FeatureSource &source,
	const struct partition_op &partop);

#endif
