#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#include <common/footprint_constants.h>
#include <partitionalgo/fg/fg_2d.hpp>

using namespace std;

TileBinGrid::TileBinGrid(const BoundingBox &box, int num_chunks) : m_box(box) {
	double span[2];
	for (int k = 0; k < 2; k++) {
		span[k] = box.high[k] - box.low[k];
	}
	double n = static_cast<double>(num_chunks);

	if (!(span[0] > 0) || !(span[1] > 0)) {
		num_splits[0] = num_splits[1] = static_cast<int>(max(ceil(sqrt(n)), 1.0));
	} else if (span[1] > span[0]) {
		// We prefer to split into more-square regions than long rectangles
		num_splits[1] = static_cast<int>(max(ceil(sqrt(n * span[1] / span[0])), 1.0));
		num_splits[0] = static_cast<int>(max(ceil(n / num_splits[1]), 1.0));
	} else {
		num_splits[0] = static_cast<int>(max(ceil(sqrt(n * span[0] / span[1])), 1.0));
		num_splits[1] = static_cast<int>(max(ceil(n / num_splits[0]), 1.0));
	}

	for (int k = 0; k < 2; k++) {
		region_width[k] = span[k] / num_splits[k];
	}

	#ifdef DEBUG
	cerr << "Number splits: " << TAB << num_splits[0] << TAB << num_splits[1] << endl;
	#endif
}

/* Position along one axis, closed on the low side of each interior line */
static int bin_of(double v, double low, double width, int n) {
	if (!(width > 0)) {
		return 0;
	}
	double pos = ceil((v - low) / width) - 1;
	if (!(pos > 0)) {
		return 0;
	}
	if (pos >= n - 1) {
		return n - 1;
	}
	return static_cast<int>(pos);
}

int TileBinGrid::cell_of(double x, double y) const {
	int column = bin_of(x, m_box.low[0], region_width[0], num_splits[0]);
	int row = bin_of(y, m_box.low[1], region_width[1], num_splits[1]);
	return column * num_splits[1] + row;
}

BoundingBox TileBinGrid::cell_box(int index) const {
	int i = index / num_splits[1];
	int j = index % num_splits[1];
	return BoundingBox(i * region_width[0] + m_box.low[0],
		j * region_width[1] + m_box.low[1],
		(i + 1) * region_width[0] + m_box.low[0],
		(j + 1) * region_width[1] + m_box.low[1]);
}

PartitionResult partition_tile_binned(const ReferenceTiling &tiling, FeatureSource &source,
	const struct partition_op &partop) {
	check_partition_params(partop);
	const ReferenceTile &tile = tiling.lookup(partop.tile_id);
	prepare_output_dir(partop.output_dir, partop.override_existing, source.path());

	TileBinGrid grid(tile.box, partop.num_chunks);
	vector<string> chunk_ids(grid.size());
	for (int i = 0; i < grid.size(); i++) {
		stringstream ss;
		ss << tile.tile_id << "_" << i;
		chunk_ids[i] = ss.str();
	}

	#ifdef DEBUG
	cerr << "Dividing " << source.path() << " of tile " << tile.tile_id << " into "
		<< grid.columns() << " x " << grid.rows() << " cells" << endl;
	#endif

	ChunkWriter writer(partop.output_dir, chunk_ids, partop.flush_bytes);
	Feature feature;
	long count = 0;
	while (source.next(feature)) {
		double x, y;
		feature_centroid(*feature.geometry, x, y);
		writer.add(grid.cell_of(x, y), feature);
		count++;
	}
	return finish_partition(partop.output_dir, writer, count);
}
