#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <set>
#include <sstream>

#include <boost/filesystem.hpp>

#include <geos/io/GeoJSON.h>
#include <geos/io/GeoJSONWriter.h>
#include <geos/io/WKTWriter.h>

#include <common/footprint_constants.h>
#include <common/footprint_errors.hpp>
#include <featureio/collection_writer.hpp>

using namespace std;
using namespace geos::io;

namespace fs = boost::filesystem;

vector<string> collection_schema(const vector<Feature> &features) {
	set<string> names;
	for (vector<Feature>::const_iterator it = features.begin(); it != features.end(); ++it) {
		for (AttributeMap::const_iterator at = it->attributes.begin();
			at != it->attributes.end(); ++at) {
			names.insert(at->first);
		}
	}
	return vector<string>(names.begin(), names.end());
}

static AttributeMap with_schema(const AttributeMap &attributes, const vector<string> &schema) {
	AttributeMap out(attributes);
	for (vector<string>::const_iterator it = schema.begin(); it != schema.end(); ++it) {
		if (out.find(*it) == out.end()) {
			out[*it] = GeoJSONValue();
		}
	}
	return out;
}

static string csv_quote(const string &text) {
	if (text.find_first_of(",\"\n\r") == string::npos) {
		return text;
	}
	string out = "\"";
	for (string::const_iterator it = text.begin(); it != text.end(); ++it) {
		if (*it == '"') {
			out.push_back('"');
		}
		out.push_back(*it);
	}
	out.push_back('"');
	return out;
}

static void json_string(ostream &os, const string &text) {
	os << '"';
	for (string::const_iterator it = text.begin(); it != text.end(); ++it) {
		switch (*it) {
			case '"': os << "\\\""; break;
			case '\\': os << "\\\\"; break;
			case '\n': os << "\\n"; break;
			case '\r': os << "\\r"; break;
			case '\t': os << "\\t"; break;
			default:
				if (static_cast<unsigned char>(*it) < 0x20) {
					os << "\\u" << hex << setw(4) << setfill('0')
						<< static_cast<int>(static_cast<unsigned char>(*it))
						<< dec << setfill(' ');
				} else {
					os << *it;
				}
		}
	}
	os << '"';
}

/* Text of an attribute value for a CSV cell; nested values are written as JSON */
static void value_text(ostream &os, const GeoJSONValue &value, bool nested) {
	if (value.isNull()) {
		if (nested) os << "null";
	} else if (value.isNumber()) {
		os << value.getNumber();
	} else if (value.isBoolean()) {
		os << (value.getBoolean() ? "true" : "false");
	} else if (value.isString()) {
		if (nested) json_string(os, value.getString());
		else os << value.getString();
	} else if (value.isArray()) {
		const vector<GeoJSONValue> &arr = value.getArray();
		os << "[";
		for (size_t i = 0; i < arr.size(); i++) {
			if (i > 0) os << ",";
			value_text(os, arr[i], true);
		}
		os << "]";
	} else if (value.isObject()) {
		const map<string, GeoJSONValue> &obj = value.getObject();
		os << "{";
		for (map<string, GeoJSONValue>::const_iterator it = obj.begin(); it != obj.end(); ++it) {
			if (it != obj.begin()) os << ",";
			json_string(os, it->first);
			os << ":";
			value_text(os, it->second, true);
		}
		os << "}";
	}
}

static void write_geojson(ofstream &ofs, const vector<Feature> &features,
	const vector<string> &schema) {
	GeoJSONWriter writer;
	ofs << "{\"type\":\"FeatureCollection\",\"features\":[";
	for (size_t i = 0; i < features.size(); i++) {
		GeoJSONFeature out(features[i].geometry->clone(),
			with_schema(features[i].attributes, schema));
		if (i > 0) {
			ofs << ",";
		}
		ofs << "\n" << writer.write(out);
	}
	ofs << "\n]}\n";
}

static void write_csv(ofstream &ofs, const vector<Feature> &features,
	const vector<string> &schema) {
	WKTWriter wkt_writer;
	wkt_writer.setTrim(true);
	ofs.precision(15);

	for (size_t k = 0; k < schema.size(); k++) {
		ofs << csv_quote(schema[k]) << COMMA;
	}
	ofs << DEFAULT_GEOMETRY_COLUMN << endl;

	stringstream cell;
	cell.precision(15);
	for (vector<Feature>::const_iterator it = features.begin(); it != features.end(); ++it) {
		for (size_t k = 0; k < schema.size(); k++) {
			AttributeMap::const_iterator at = it->attributes.find(schema[k]);
			if (at != it->attributes.end()) {
				cell.str("");
				cell.clear();
				value_text(cell, at->second, false);
				ofs << csv_quote(cell.str());
			}
			ofs << COMMA;
		}
		ofs << csv_quote(wkt_writer.write(it->geometry.get())) << endl;
	}
}

void write_collection(const string &path, const vector<Feature> &features,
	const vector<string> &schema, bool overwrite) {
	boost::system::error_code ec;
	if (!overwrite && fs::exists(path, ec)) {
		throw OutputIOError("The file " + path + " already exists; use overwrite to replace it");
	}
	ofstream ofs(path.c_str(), ofstream::trunc);
	if (!ofs) {
		throw OutputIOError("Cannot open output file " + path);
	}

	string ext = fs::path(path).extension().string();
	transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
	try {
		if (ext == ".geojson" || ext == ".json") {
			write_geojson(ofs, features, schema);
		} else {
			write_csv(ofs, features, schema);
		}
	} catch (std::exception &e) {
		throw OutputIOError("Cannot serialize features to " + path + ": " + e.what());
	}

	ofs.close();
	if (ofs.fail()) {
		throw OutputIOError("Error while saving file " + path);
	}
}
