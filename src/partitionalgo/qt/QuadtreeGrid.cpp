#include <iostream>
#include <sstream>

#include <partitionalgo/qt/QuadtreeGrid.hpp>

using namespace std;

GridCell::GridCell(double min_x, double min_y, double max_x, double max_y,
	int _level, unsigned long long _column, unsigned long long _row) {
	low[0] = min_x;
	low[1] = min_y;
	high[0] = max_x;
	high[1] = max_y;
	for (int i = 0; i < 2; i++) {
		mid[i] = (low[i] + high[i]) / 2;
	}
	level = _level;
	column = _column;
	row = _row;
	isLeaf = true;
	for (int i = 0; i < 4; i++) {
		children[i] = -1;
	}
	begin = end = 0;
}

int GridCell::quadrant(double x, double y) const {
	return (x > mid[0] ? 1 : 0) + (y > mid[1] ? 2 : 0);
}

QuadtreeGrid::QuadtreeGrid(const BoundingBox &extent, long bucket_size,
	double min_cell_size, int max_level)
	: m_extent(extent), m_bucket_size(bucket_size),
	m_min_cell_size(min_cell_size), m_max_level(max_level) {
}

bool QuadtreeGrid::at_floor(const GridCell &cell) const {
	if (cell.level >= m_max_level) {
		return true;
	}
	double half_width = (cell.high[0] - cell.low[0]) / 2;
	double half_height = (cell.high[1] - cell.low[1]) / 2;
	return half_width < m_min_cell_size && half_height < m_min_cell_size;
}

void QuadtreeGrid::build(const vector<CentroidPoint> &points) {
	m_cells.clear();
	m_cells.push_back(GridCell(m_extent.low[0], m_extent.low[1],
		m_extent.high[0], m_extent.high[1], 0, 0, 0));
	m_cells[0].end = points.size();

	vector<size_t> order(points.size());
	for (size_t i = 0; i < order.size(); i++) {
		order[i] = i;
	}

	/* Pending cells; indices into the arena */
	vector<int> worklist;
	worklist.push_back(0);
	while (!worklist.empty()) {
		int idx = worklist.back();
		worklist.pop_back();

		if (static_cast<long>(m_cells[idx].size()) <= m_bucket_size) {
			continue;
		}
		if (at_floor(m_cells[idx])) {
			#ifdef DEBUG
			cerr << "Cell at size floor kept with " << m_cells[idx].size()
				<< " objects, level " << m_cells[idx].level << endl;
			#endif
			continue;
		}
		split(idx, points, order);
		for (int i = 0; i < 4; i++) {
			worklist.push_back(m_cells[idx].children[i]);
		}
	}
}

void QuadtreeGrid::split(int idx, const vector<CentroidPoint> &points,
	vector<size_t> &order) {
	/* Copy: the arena grows below */
	GridCell parent = m_cells[idx];

	/* Stable bucketing of the parent's range by quadrant */
	size_t counts[4] = {0, 0, 0, 0};
	for (size_t i = parent.begin; i < parent.end; i++) {
		const CentroidPoint &p = points[order[i]];
		counts[parent.quadrant(p.x, p.y)]++;
	}
	size_t offsets[4];
	offsets[0] = parent.begin;
	for (int q = 1; q < 4; q++) {
		offsets[q] = offsets[q - 1] + counts[q - 1];
	}

	vector<size_t> scratch(order.begin() + parent.begin, order.begin() + parent.end);
	size_t cursor[4] = {offsets[0], offsets[1], offsets[2], offsets[3]};
	for (size_t i = 0; i < scratch.size(); i++) {
		const CentroidPoint &p = points[scratch[i]];
		order[cursor[parent.quadrant(p.x, p.y)]++] = scratch[i];
	}

	for (int q = 0; q < 4; q++) {
		int qx = q & 1;
		int qy = q >> 1;
		GridCell child(qx ? parent.mid[0] : parent.low[0],
			qy ? parent.mid[1] : parent.low[1],
			qx ? parent.high[0] : parent.mid[0],
			qy ? parent.high[1] : parent.mid[1],
			parent.level + 1, parent.column * 2 + qx, parent.row * 2 + qy);
		child.begin = offsets[q];
		child.end = offsets[q] + counts[q];
		m_cells[idx].children[q] = static_cast<int>(m_cells.size());
		m_cells.push_back(child);
	}
	m_cells[idx].isLeaf = false;

	#ifdef DEBUG
	cerr << "Split level " << parent.level << " cell of " << parent.size() << " objects into "
		<< counts[0] << "/" << counts[1] << "/" << counts[2] << "/" << counts[3] << endl;
	#endif
}

int QuadtreeGrid::locate(double x, double y) const {
	int idx = 0;
	while (!m_cells[idx].isLeaf) {
		idx = m_cells[idx].children[m_cells[idx].quadrant(x, y)];
	}
	return idx;
}

vector<int> QuadtreeGrid::leaves() const {
	vector<int> result;
	for (size_t i = 0; i < m_cells.size(); i++) {
		if (m_cells[i].isLeaf) {
			result.push_back(static_cast<int>(i));
		}
	}
	return result;
}

string QuadtreeGrid::cell_id(int idx, const string &prefix) const {
	const GridCell &c = m_cells[idx];
	stringstream ss;
	ss << prefix << "_" << c.level << "_" << c.column << "_" << c.row;
	return ss.str();
}
