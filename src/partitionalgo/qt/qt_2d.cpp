#include <ctime>
#include <iostream>
#include <sstream>

#include <common/bbox_utils.hpp>
#include <common/footprint_errors.hpp>
#include <partitionalgo/qt/qt_2d.hpp>

using namespace std;

PartitionResult partition_adaptive_grid(FeatureSource &source,
	const struct partition_op &partop) {
	check_partition_params(partop);
	prepare_output_dir(partop.output_dir, partop.override_existing, source.path());

	#ifdef DEBUGTIME
	clock_t start_first_pass = clock();
	#endif

	/* First pass: only centroids are kept */
	vector<CentroidPoint> points;
	BoundingBox extent;
	Feature feature;
	while (source.next(feature)) {
		BoundingBox env = envelope_of(*feature.geometry);
		extent = points.empty() ? env : box_union(extent, env);
		CentroidPoint p;
		feature_centroid(*feature.geometry, p.x, p.y);
		points.push_back(p);
	}

	if (points.empty()) {
		ChunkWriter writer(partop.output_dir, vector<string>(), partop.flush_bytes);
		return finish_partition(partop.output_dir, writer, 0);
	}

	QuadtreeGrid grid(extent, partop.bucket_size, partop.min_cell_size, partop.max_level);
	grid.build(points);

	#ifdef DEBUG
	cerr << "Extent " << box_to_string(extent) << " with " << points.size()
		<< " objects, " << grid.cells().size() << " cells" << endl;
	#endif
	vector<CentroidPoint>().swap(points);

	/* Chunk slots of the non-empty leaves */
	vector<int> slot_of(grid.cells().size(), -1);
	vector<int> leaves = grid.leaves();
	vector<int> slot_leaf;
	vector<string> chunk_ids;
	for (vector<int>::iterator it = leaves.begin(); it != leaves.end(); ++it) {
		if (grid.cell(*it).size() > 0) {
			slot_of[*it] = static_cast<int>(chunk_ids.size());
			slot_leaf.push_back(*it);
			chunk_ids.push_back(grid.cell_id(*it, partop.prefix_tile_id));
		}
	}

	#ifdef DEBUGTIME
	cerr << "First pass and subdivision: "
		<< (clock() - start_first_pass) / static_cast<double>(CLOCKS_PER_SEC) << "s" << endl;
	clock_t start_second_pass = clock();
	#endif

	/* Second pass: route each feature to its leaf */
	ChunkWriter writer(partop.output_dir, chunk_ids, partop.flush_bytes);
	source.rewind();
	long count = 0;
	while (source.next(feature)) {
		double x, y;
		feature_centroid(*feature.geometry, x, y);
		int slot = slot_of[grid.locate(x, y)];
		if (slot < 0) {
			throw SourceFormatError("Source " + source.path() + " changed between partitioning passes");
		}
		writer.add(slot, feature);
		count++;
	}

	for (size_t i = 0; i < slot_leaf.size(); i++) {
		if (writer.count(i) != static_cast<long>(grid.cell(slot_leaf[i]).size())) {
			stringstream ss;
			ss << "Source " << source.path() << " changed between partitioning passes (chunk "
				<< chunk_ids[i] << ": " << grid.cell(slot_leaf[i]).size() << " then "
				<< writer.count(i) << " features)";
			throw SourceFormatError(ss.str());
		}
	}

	#ifdef DEBUGTIME
	cerr << "Second pass: "
		<< (clock() - start_second_pass) / static_cast<double>(CLOCKS_PER_SEC) << "s" << endl;
	#endif

	return finish_partition(partop.output_dir, writer, count);
}
