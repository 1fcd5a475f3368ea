#include <algorithm>
#include <iostream>
#include <sstream>

#include <boost/filesystem.hpp>

#include <geos/geom/prep/PreparedGeometryFactory.h>
#include <geos/simplify/TopologyPreservingSimplifier.h>
#include <geos/util/GEOSException.h>

#include <common/bbox_utils.hpp>
#include <common/footprint_constants.h>
#include <common/footprint_errors.hpp>
#include <extraction/extraction_engine.hpp>
#include <featureio/chunk_store.hpp>

#ifdef DEBUGTIME
#include <ctime>
#endif

using namespace std;
using namespace geos::geom;

namespace fs = boost::filesystem;

const vector<string> &extra_field_names() {
	static const vector<string> names = {"building", "man_made", "aeroway",
		"military", "tower", "bms", "power", "leisure", "religion", "sport", "barrier"};
	return names;
}

BoxFilter::BoxFilter(const BoundingBox &query) : m_query(query) {
	m_gf = GeometryFactory::create();
	m_window = box_to_geometry(m_query, *m_gf);
	m_prepared = prep::PreparedGeometryFactory::prepare(m_window.get());
}

bool BoxFilter::matches(const Geometry &geom) const {
	if (geom.isEmpty()) {
		return false;
	}
	// Envelope reject first
	if (!intersects(envelope_of(geom), m_query)) {
		return false;
	}
	return m_prepared->intersects(&geom);
}

vector<string> list_feature_files(const string &input_path) {
	vector<string> files;
	fs::path p(input_path);
	boost::system::error_code ec;
	if (!fs::exists(p, ec)) {
		throw SourceFormatError("Input not found: " + input_path);
	}
	if (!fs::is_directory(p, ec)) {
		files.push_back(input_path);
		return files;
	}
	for (fs::directory_iterator it(p, ec), end; !ec && it != end; it.increment(ec)) {
		if (fs::is_regular_file(it->status()) && is_feature_file(it->path().string())) {
			files.push_back(it->path().string());
		}
	}
	if (ec) {
		throw SourceFormatError("Cannot list " + input_path + ": " + ec.message());
	}
	sort(files.begin(), files.end());
	return files;
}

/* Fills the requested columns without touching existing values */
static void add_extra_fields(Feature &feature) {
	const vector<string> &names = extra_field_names();
	for (vector<string>::const_iterator it = names.begin(); it != names.end(); it++) {
		if (feature.attributes.find(*it) == feature.attributes.end()) {
			feature.attributes.insert(make_pair(*it, geos::io::GeoJSONValue(string(""))));
		}
	}
}

/* Exact-tests every feature of source and moves the matches into result */
static void scan_source(FeatureSource &source, const BoxFilter &filter,
	const struct extract_op &exop, ExtractionResult &result) {
	Feature feature;
	long tested = 0;
	long matched = 0;
	while (source.next(feature)) {
		tested++;
		bool hit;
		try {
			hit = filter.matches(*feature.geometry);
		} catch (const geos::util::GEOSException &e) {
			stringstream ss;
			ss << source.path() << ": record " << tested << ": " << e.what();
			throw SourceFormatError(ss.str());
		}
		if (!hit) {
			continue;
		}
		if (exop.simplify_tolerance > 0) {
			feature.geometry = geos::simplify::TopologyPreservingSimplifier::simplify(
				feature.geometry.get(), exop.simplify_tolerance);
		}
		if (exop.extra_fields) {
			add_extra_fields(feature);
		}
		result.features.push_back(std::move(feature));
		feature = Feature();
		matched++;
	}
	result.summary.files_scanned++;
	result.summary.features_tested += tested;
	result.summary.matches += matched;

	#ifdef DEBUG
	cerr << source.path() << ": " << matched << " of " << tested << " features match" << endl;
	#endif
}

ExtractionResult extract_direct(const string &input_path, const BoundingBox &query,
	const struct extract_op &exop) {
	ExtractionResult result;
	BoxFilter filter(query);
	vector<string> files = list_feature_files(input_path);

	#ifdef DEBUG
	cerr << "Scanning " << files.size() << " files for " << box_to_string(query) << endl;
	#endif

	for (vector<string>::iterator it = files.begin(); it != files.end(); it++) {
		unique_ptr<FeatureSource> source = open_feature_source(*it, exop.geometry_column);
		scan_source(*source, filter, exop, result);
	}
	result.summary.empty_result = result.features.empty();
	return result;
}

ExtractionResult extract_indexed(const ChunkIndex &index, const string &chunk_dir,
	const BoundingBox &query, const struct extract_op &exop) {
	ExtractionResult result;
	BoxFilter filter(query);
	vector<string> chunk_ids = index.candidates(query);
	result.summary.candidate_chunks = chunk_ids.size();

	#ifdef DEBUG
	cerr << chunk_ids.size() << " of " << index.size() << " chunks intersect "
		<< box_to_string(query) << endl;
	#endif

	for (vector<string>::iterator it = chunk_ids.begin(); it != chunk_ids.end(); it++) {
		unique_ptr<FeatureSource> source = open_chunk(chunk_dir, *it);
		scan_source(*source, filter, exop, result);
	}
	result.summary.empty_result = result.features.empty();
	return result;
}

ExtractionResult extract(const struct extract_op &exop) {
	BoundingBox query = normalize(parse_corner(exop.top_left),
		parse_corner(exop.bottom_right));

	#ifdef DEBUGTIME
	clock_t start = clock();
	#endif

	ExtractionResult result;
	if (exop.from_db) {
		unique_ptr<ChunkIndex> index = ChunkIndex::load(exop.input_path);
		result = extract_indexed(*index, exop.input_path, query, exop);
	} else {
		result = extract_direct(exop.input_path, query, exop);
	}

	#ifdef DEBUGTIME
	cerr << "Extraction time: " << (double) (clock() - start) / CLOCKS_PER_SEC << endl;
	#endif
	return result;
}
