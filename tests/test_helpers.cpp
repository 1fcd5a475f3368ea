#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <boost/filesystem.hpp>

#include <featureio/chunk_store.hpp>

#include "test_helpers.hpp"

using namespace std;

namespace fs = boost::filesystem;

TempDir::TempDir() {
	fs::path p = fs::temp_directory_path() / fs::unique_path("footprintgis-%%%%-%%%%-%%%%");
	fs::create_directories(p);
	m_path = p.string();
}

TempDir::~TempDir() {
	boost::system::error_code ec;
	fs::remove_all(m_path, ec);
}

string TempDir::file(const string &name) const {
	return (fs::path(m_path) / name).string();
}

void write_text(const string &path, const string &text) {
	ofstream ofs(path.c_str(), ofstream::trunc);
	ofs << text;
	if (!ofs) {
		throw runtime_error("cannot write fixture " + path);
	}
}

string read_text(const string &path) {
	ifstream fin(path.c_str());
	stringstream buffer;
	buffer << fin.rdbuf();
	return buffer.str();
}

string rect_wkt(double min_x, double min_y, double max_x, double max_y) {
	stringstream ss;
	ss.precision(17);
	ss << "POLYGON ((" << min_x << " " << min_y << ", " << max_x << " " << min_y << ", "
		<< max_x << " " << max_y << ", " << min_x << " " << max_y << ", "
		<< min_x << " " << min_y << "))";
	return ss.str();
}

string square_wkt(double x, double y, double half) {
	return rect_wkt(x - half, y - half, x + half, y + half);
}

vector<TestBuilding> lattice_buildings(int n, double origin_x, double origin_y, double size) {
	vector<TestBuilding> buildings;
	double step = size / n;
	for (int i = 0; i < n; i++) {
		for (int j = 0; j < n; j++) {
			TestBuilding b;
			stringstream ss;
			ss << "b" << i << "_" << j;
			b.id = ss.str();
			b.wkt = square_wkt(origin_x + (i + 0.5) * step, origin_y + (j + 0.5) * step, step / 10);
			buildings.push_back(b);
		}
	}
	return buildings;
}

void write_buildings_csv(const string &path, const vector<TestBuilding> &buildings) {
	ofstream ofs(path.c_str(), ofstream::trunc);
	ofs << "id,confidence,geometry" << endl;
	for (size_t i = 0; i < buildings.size(); i++) {
		ofs << buildings[i].id << ",0.9,\"" << buildings[i].wkt << "\"" << endl;
	}
}

string id_of(const Feature &feature) {
	AttributeMap::const_iterator it = feature.attributes.find("id");
	if (it == feature.attributes.end() || !it->second.isString()) {
		return "";
	}
	return it->second.getString();
}

multiset<string> ids_of(const vector<Feature> &features) {
	multiset<string> ids;
	for (size_t i = 0; i < features.size(); i++) {
		ids.insert(id_of(features[i]));
	}
	return ids;
}

multiset<string> chunk_ids_of(const string &dir, const vector<ChunkIndexEntry> &entries) {
	multiset<string> ids;
	for (size_t i = 0; i < entries.size(); i++) {
		unique_ptr<FeatureSource> chunk = open_chunk(dir, entries[i].chunk_id);
		Feature feature;
		while (chunk->next(feature)) {
			ids.insert(id_of(feature));
		}
	}
	return ids;
}

MemoryFeatureSource::MemoryFeatureSource(const vector<TestBuilding> &buildings,
	bool shrink_on_rewind)
	: m_buildings(buildings), m_shrink_on_rewind(shrink_on_rewind), m_pos(0),
	m_path("memory"), m_gf(geos::geom::GeometryFactory::create()), m_reader(*m_gf) {
}

bool MemoryFeatureSource::next(Feature &feature) {
	if (m_pos >= m_buildings.size()) {
		return false;
	}
	feature.geometry = m_reader.read(m_buildings[m_pos].wkt);
	feature.attributes.clear();
	feature.attributes["id"] = geos::io::GeoJSONValue(m_buildings[m_pos].id);
	m_pos++;
	return true;
}

void MemoryFeatureSource::rewind() {
	m_pos = 0;
	if (m_shrink_on_rewind && !m_buildings.empty()) {
		m_buildings.pop_back();
		m_shrink_on_rewind = false;
	}
}
