#ifndef FOOTPRINTGIS_PARTITIONALGO_QT_QUADTREEGRID_HPP
#define FOOTPRINTGIS_PARTITIONALGO_QT_QUADTREEGRID_HPP

#include <string>
#include <vector>

#include <common/footprint_structs.h>

/* Centroid of one feature, collected during the first pass */
struct CentroidPoint {
	double x;
	double y;
};

/* Quadrants in child order. A point on a mid-line belongs to the
 * west/south side, i.e. to the lower-indexed quadrant. */
enum Quadrant {
	QUADRANT_SW = 0,
	QUADRANT_SE = 1,
	QUADRANT_NW = 2,
	QUADRANT_NE = 3
};

/* A cell of the adaptive grid. Cells live in the arena of QuadtreeGrid
 * and refer to their children by index. */
class GridCell {
	public:
		double low[2];
		double high[2];
		double mid[2];
		int level;
		unsigned long long column; // cell coordinates at this level
		unsigned long long row;
		bool isLeaf;
		int children[4];
		std::size_t begin; // range of the centroid permutation owned by the cell
		std::size_t end;

		GridCell(double min_x, double min_y, double max_x, double max_y, int level,
			unsigned long long column, unsigned long long row);

		std::size_t size() const { return end - begin; }
		int quadrant(double x, double y) const;
};

/* Density-adaptive grid: cells holding more than bucket_size centroids
 * are split into four until they fit or reach the size floor. */
class QuadtreeGrid {
	public:
		QuadtreeGrid(const BoundingBox &extent, long bucket_size,
			double min_cell_size, int max_level);

		/* Subdivides the extent over the centroids */
		void build(const std::vector<CentroidPoint> &points);

		/* Arena index of the leaf owning (x, y) */
		int locate(double x, double y) const;

		/* Leaf indices in arena order */
		std::vector<int> leaves() const;

		/* True if the cell may not be halved any further */
		bool at_floor(const GridCell &cell) const;

		const std::vector<GridCell> &cells() const { return m_cells; }
		const GridCell &cell(int idx) const { return m_cells[idx]; }

		/* <prefix>_<level>_<column>_<row> */
		std::string cell_id(int idx, const std::string &prefix) const;

	private:
		void split(int idx, const std::vector<CentroidPoint> &points,
			std::vector<std::size_t> &order);

		BoundingBox m_extent;
		long m_bucket_size;
		double m_min_cell_size;
		int m_max_level;
		std::vector<GridCell> m_cells;
};

#endif
