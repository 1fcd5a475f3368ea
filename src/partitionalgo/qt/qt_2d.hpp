#ifndef FOOTPRINTGIS_PARTITIONALGO_QT_QT_2D_HPP
#define FOOTPRINTGIS_PARTITIONALGO_QT_QT_2D_HPP

#include <featureio/feature_source.hpp>
#include <partitionalgo/partition_common.hpp>
#include <partitionalgo/qt/QuadtreeGrid.hpp>
#include <progparams/footprint_datastructs.hpp>

/* Adaptive grid partitioning of one source.
 *   1) first pass: centroids and extent
 *   2) quadtree subdivision until every leaf holds at most bucket_size
 *      centroids or reaches the size floor
 *   3) second pass: every feature is written to the chunk of the leaf
 *      owning its centroid
 * Throws PartitionIOError on a non-empty output folder without override,
 * SourceFormatError on malformed records or a source that changed
 * between the two passes. */
PartitionResult partition_adaptive_grid(FeatureSource &source,
	const struct partition_op &partop);

#endif
