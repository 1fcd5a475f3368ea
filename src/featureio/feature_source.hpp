#ifndef FOOTPRINTGIS_FEATUREIO_FEATURE_SOURCE_HPP
#define FOOTPRINTGIS_FEATUREIO_FEATURE_SOURCE_HPP

#include <fstream>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <geos/geom/GeometryFactory.h>
#include <geos/io/GeoJSONReader.h>
#include <geos/io/WKTReader.h>

#include <common/footprint_constants.h>
#include <common/footprint_structs.h>

/* Lazy, restartable stream of features read from one file.
 * Malformed records raise SourceFormatError. */
class FeatureSource {
	public:
		virtual ~FeatureSource() {}

		/* Reads the next record; false once the source is exhausted */
		virtual bool next(Feature &feature) = 0;

		/* Restart from the first record */
		virtual void rewind() = 0;

		virtual const std::string &path() const = 0;
};

/* Comma separated rows with a header; one column holds WKT geometry
 * (the layout of the published tile CSV files) */
class CsvFeatureSource : public FeatureSource {
	public:
		CsvFeatureSource(const std::string &path,
			const std::string &geometry_column = DEFAULT_GEOMETRY_COLUMN);

		virtual bool next(Feature &feature);
		virtual void rewind();
		virtual const std::string &path() const { return m_path; }

		const std::vector<std::string> &columns() const { return m_columns; }

	private:
		void read_header();
		geos::io::GeoJSONValue to_value(const std::string &column, const std::string &raw) const;

		std::string m_path;
		std::string m_geometry_column;
		std::ifstream m_fin;
		std::vector<std::string> m_columns;
		std::set<std::string> m_numeric_columns;
		int m_geom_idx;
		long m_line;
		geos::geom::GeometryFactory::Ptr m_gf;
		geos::io::WKTReader m_reader;
};

/* One GeoJSON Feature per line (chunk files, line-delimited downloads) */
class GeoJSONSeqFeatureSource : public FeatureSource {
	public:
		explicit GeoJSONSeqFeatureSource(const std::string &path);

		virtual bool next(Feature &feature);
		virtual void rewind();
		virtual const std::string &path() const { return m_path; }

	private:
		std::string m_path;
		std::ifstream m_fin;
		long m_line;
		geos::geom::GeometryFactory::Ptr m_gf;
		geos::io::GeoJSONReader m_reader;
};

/* A single GeoJSON FeatureCollection document. The whole collection is
 * held in memory; next() hands each feature out by move and rewind()
 * parses the file again. */
class GeoJSONFileFeatureSource : public FeatureSource {
	public:
		explicit GeoJSONFileFeatureSource(const std::string &path);

		virtual bool next(Feature &feature);
		virtual void rewind();
		virtual const std::string &path() const { return m_path; }

	private:
		void load();

		std::string m_path;
		std::vector<Feature> m_features;
		std::size_t m_pos;
		geos::geom::GeometryFactory::Ptr m_gf;
};

/* Picks the reader by file extension */
std::unique_ptr<FeatureSource> open_feature_source(const std::string &path,
	const std::string &geometry_column = DEFAULT_GEOMETRY_COLUMN);

/* True if open_feature_source understands the file's extension */
bool is_feature_file(const std::string &path);

/* Converts a parsed GeoJSON feature; throws SourceFormatError on an empty geometry */
void feature_from_geojson(const geos::io::GeoJSONFeature &in, Feature &out,
	const std::string &where);

#endif
