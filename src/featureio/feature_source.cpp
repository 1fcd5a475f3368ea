#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>

#include <boost/filesystem.hpp>

#include <geos/util/GEOSException.h>

#include <common/footprint_errors.hpp>
#include <featureio/feature_source.hpp>
#include <utilities/tokenizer.h>

using namespace std;
using namespace geos::geom;
using namespace geos::io;

namespace fs = boost::filesystem;

/* Attribute columns of the published building CSV files that hold numbers */
static const char *NUMERIC_CSV_COLUMNS[] = {
	"latitude", "longitude", "area_in_meters", "confidence"
};

static string where_of(const string &path, long line) {
	stringstream ss;
	ss << path << ":" << line;
	return ss.str();
}

static bool parse_number(const string &raw, double &value) {
	const char *begin = raw.c_str();
	char *end = NULL;
	value = strtod(begin, &end);
	return end != begin && *end == '\0';
}

/* Well-formed UTF-8: no stray continuation bytes, overlong forms,
 * surrogates or code points past U+10FFFF */
static bool valid_utf8(const string &text) {
	size_t i = 0;
	size_t n = text.size();
	while (i < n) {
		unsigned char c = static_cast<unsigned char>(text[i]);
		size_t len;
		unsigned int cp;
		if (c < 0x80) {
			i++;
			continue;
		} else if (c >= 0xC2 && c <= 0xDF) {
			len = 2;
			cp = c & 0x1F;
		} else if (c >= 0xE0 && c <= 0xEF) {
			len = 3;
			cp = c & 0x0F;
		} else if (c >= 0xF0 && c <= 0xF4) {
			len = 4;
			cp = c & 0x07;
		} else {
			return false;
		}
		if (i + len > n) {
			return false;
		}
		for (size_t k = 1; k < len; k++) {
			unsigned char cc = static_cast<unsigned char>(text[i + k]);
			if ((cc & 0xC0) != 0x80) {
				return false;
			}
			cp = (cp << 6) | (cc & 0x3F);
		}
		if ((len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000)
			|| (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
			return false;
		}
		i += len;
	}
	return true;
}

void feature_from_geojson(const GeoJSONFeature &in, Feature &out, const string &where) {
	const Geometry *geom = in.getGeometry();
	if (geom == NULL || geom->isEmpty()) {
		throw SourceFormatError(where + ": feature has no geometry");
	}
	out.geometry = geom->clone();
	out.attributes = in.getProperties();
}

/////////////////////////////////////////////
// CSV with WKT geometry
/////////////////////////////////////////////

CsvFeatureSource::CsvFeatureSource(const string &path, const string &geometry_column)
	: m_path(path), m_geometry_column(geometry_column), m_geom_idx(-1), m_line(0),
	m_gf(GeometryFactory::create()), m_reader(*m_gf)
{
	for (size_t i = 0; i < sizeof(NUMERIC_CSV_COLUMNS) / sizeof(NUMERIC_CSV_COLUMNS[0]); i++) {
		m_numeric_columns.insert(NUMERIC_CSV_COLUMNS[i]);
	}
	m_fin.open(path.c_str());
	if (!m_fin) {
		throw SourceFormatError("Cannot open feature file " + path);
	}
	read_header();
}

void CsvFeatureSource::read_header() {
	string input_line;
	m_line = 0;
	if (!getline(m_fin, input_line)) {
		throw SourceFormatError(m_path + ": missing CSV header");
	}
	m_line++;
	if (!input_line.empty() && input_line[input_line.size() - 1] == '\r') {
		input_line.erase(input_line.size() - 1);
	}
	tokenize(input_line, m_columns, COMMA, true, "\"");
	m_geom_idx = -1;
	for (size_t i = 0; i < m_columns.size(); i++) {
		if (m_columns[i] == m_geometry_column) {
			m_geom_idx = static_cast<int>(i);
		}
	}
	if (m_geom_idx < 0) {
		throw SourceFormatError(m_path + ": no '" + m_geometry_column + "' column in CSV header");
	}
}

GeoJSONValue CsvFeatureSource::to_value(const string &column, const string &raw) const {
	if (raw.empty()) {
		return GeoJSONValue();
	}
	double value;
	if (parse_number(raw, value)) {
		return GeoJSONValue(value);
	}
	if (m_numeric_columns.count(column)) {
		/* Malformed numeric attribute: keep the record, drop the value */
		#ifdef DEBUG
		cerr << "WARNING: " << m_path << ":" << m_line << " column " << column
			<< " is not numeric [" << raw << "]" << endl;
		#endif
		return GeoJSONValue();
	}
	if (!valid_utf8(raw)) {
		/* Not representable as a JSON string */
		#ifdef DEBUG
		cerr << "WARNING: " << m_path << ":" << m_line << " column " << column
			<< " is not valid UTF-8" << endl;
		#endif
		return GeoJSONValue();
	}
	return GeoJSONValue(raw);
}

bool CsvFeatureSource::next(Feature &feature) {
	string input_line;
	vector<string> fields;

	while (getline(m_fin, input_line)) {
		m_line++;
		if (!input_line.empty() && input_line[input_line.size() - 1] == '\r') {
			input_line.erase(input_line.size() - 1);
		}
		if (input_line.empty()) {
			continue;
		}
		tokenize(input_line, fields, COMMA, true, "\"");
		if (fields.size() != m_columns.size()) {
			stringstream ss;
			ss << where_of(m_path, m_line) << ": expected " << m_columns.size()
				<< " fields, found " << fields.size();
			throw SourceFormatError(ss.str());
		}

		unique_ptr<Geometry> geom;
		try {
			geom = m_reader.read(fields[m_geom_idx]);
		} catch (geos::util::GEOSException &e) {
			throw SourceFormatError(where_of(m_path, m_line) + ": bad WKT geometry: " + e.what());
		}
		if (!geom || geom->isEmpty()) {
			throw SourceFormatError(where_of(m_path, m_line) + ": empty geometry");
		}

		feature.geometry = std::move(geom);
		feature.attributes.clear();
		for (size_t i = 0; i < fields.size(); i++) {
			if (static_cast<int>(i) == m_geom_idx) {
				continue;
			}
			feature.attributes[m_columns[i]] = to_value(m_columns[i], fields[i]);
		}
		return true;
	}
	if (m_fin.bad()) {
		throw SourceFormatError("Read error on " + m_path);
	}
	return false;
}

void CsvFeatureSource::rewind() {
	m_fin.clear();
	m_fin.seekg(0, ios::beg);
	read_header();
}

/////////////////////////////////////////////
// Line-delimited GeoJSON
/////////////////////////////////////////////

GeoJSONSeqFeatureSource::GeoJSONSeqFeatureSource(const string &path)
	: m_path(path), m_line(0), m_gf(GeometryFactory::create()), m_reader(*m_gf)
{
	m_fin.open(path.c_str());
	if (!m_fin) {
		throw SourceFormatError("Cannot open feature file " + path);
	}
}

bool GeoJSONSeqFeatureSource::next(Feature &feature) {
	string input_line;
	while (getline(m_fin, input_line)) {
		m_line++;
		/* RFC 8142 record separator */
		if (!input_line.empty() && input_line[0] == '\x1e') {
			input_line.erase(0, 1);
		}
		if (input_line.find_first_not_of(" \t\r") == string::npos) {
			continue;
		}

		vector<GeoJSONFeature> parsed;
		try {
			parsed = m_reader.readFeatures(input_line).getFeatures();
		} catch (std::exception &e) {
			throw SourceFormatError(where_of(m_path, m_line) + ": bad GeoJSON feature: " + e.what());
		}
		if (parsed.size() != 1) {
			throw SourceFormatError(where_of(m_path, m_line) + ": expected one feature per line");
		}
		feature_from_geojson(parsed[0], feature, where_of(m_path, m_line));
		return true;
	}
	if (m_fin.bad()) {
		throw SourceFormatError("Read error on " + m_path);
	}
	return false;
}

void GeoJSONSeqFeatureSource::rewind() {
	m_fin.clear();
	m_fin.seekg(0, ios::beg);
	m_line = 0;
}

/////////////////////////////////////////////
// GeoJSON FeatureCollection
/////////////////////////////////////////////

GeoJSONFileFeatureSource::GeoJSONFileFeatureSource(const string &path)
	: m_path(path), m_pos(0), m_gf(GeometryFactory::create())
{
	load();
}

void GeoJSONFileFeatureSource::load() {
	ifstream fin(m_path.c_str());
	if (!fin) {
		throw SourceFormatError("Cannot open feature file " + m_path);
	}
	stringstream buffer;
	buffer << fin.rdbuf();
	fin.close();

	vector<GeoJSONFeature> parsed;
	GeoJSONReader reader(*m_gf);
	try {
		parsed = reader.readFeatures(buffer.str()).getFeatures();
	} catch (std::exception &e) {
		throw SourceFormatError(m_path + ": bad GeoJSON document: " + e.what());
	}
	buffer.str(string());

	/* Convert from the back so each parsed feature is released as soon as
	 * its geometry has been taken over */
	m_features.clear();
	m_features.resize(parsed.size());
	while (!parsed.empty()) {
		size_t i = parsed.size() - 1;
		stringstream where;
		where << m_path << ": feature " << i;
		feature_from_geojson(parsed[i], m_features[i], where.str());
		parsed.pop_back();
	}
	m_pos = 0;
}

bool GeoJSONFileFeatureSource::next(Feature &feature) {
	if (m_pos >= m_features.size()) {
		return false;
	}
	feature.geometry = std::move(m_features[m_pos].geometry);
	feature.attributes.swap(m_features[m_pos].attributes);
	m_features[m_pos].attributes.clear();
	m_pos++;
	return true;
}

void GeoJSONFileFeatureSource::rewind() {
	/* Features already handed out were moved away; read the document again */
	if (m_pos > 0) {
		load();
	}
}

/////////////////////////////////////////////
// Dispatch
/////////////////////////////////////////////

static string lower_extension(const string &path) {
	string ext = fs::path(path).extension().string();
	transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
	return ext;
}

static bool is_seq_extension(const string &ext) {
	return ext == ".geojsonl" || ext == ".geojsons" || ext == ".geojsonseq"
		|| ext == ".jsonl" || ext == ".ndjson";
}

bool is_feature_file(const string &path) {
	string ext = lower_extension(path);
	return ext == ".csv" || ext == ".geojson" || ext == ".json" || is_seq_extension(ext);
}

unique_ptr<FeatureSource> open_feature_source(const string &path, const string &geometry_column) {
	string ext = lower_extension(path);
	if (ext == ".csv") {
		return unique_ptr<FeatureSource>(new CsvFeatureSource(path, geometry_column));
	}
	if (is_seq_extension(ext)) {
		return unique_ptr<FeatureSource>(new GeoJSONSeqFeatureSource(path));
	}
	if (ext == ".geojson" || ext == ".json") {
		return unique_ptr<FeatureSource>(new GeoJSONFileFeatureSource(path));
	}
	throw SourceFormatError("Unsupported feature file type: " + path);
}
