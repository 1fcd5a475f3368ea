#ifndef FOOTPRINTGIS_EXTRACTION_EXTRACTION_ENGINE_HPP
#define FOOTPRINTGIS_EXTRACTION_EXTRACTION_ENGINE_HPP

#include <memory>
#include <string>
#include <vector>

#include <geos/geom/Geometry.h>
#include <geos/geom/GeometryFactory.h>
#include <geos/geom/prep/PreparedGeometry.h>

#include <common/footprint_structs.h>
#include <featureio/feature_source.hpp>
#include <indices/chunk_index.hpp>
#include <progparams/footprint_datastructs.hpp>

/* Columns added with empty values when extra fields are requested */
const std::vector<std::string> &extra_field_names();

/* Counters of one extraction. empty_result is the "no feature intersects
 * the query" warning; it is not an error. */
struct ExtractionSummary {
	std::size_t candidate_chunks;
	std::size_t files_scanned;
	long features_tested;
	long matches;
	bool empty_result;

	ExtractionSummary() : candidate_chunks(0), files_scanned(0),
		features_tested(0), matches(0), empty_result(true) {}
};

struct ExtractionResult {
	std::vector<Feature> features;
	ExtractionSummary summary;
};

/* Exact test of geometries against a query box */
class BoxFilter {
	public:
		explicit BoxFilter(const BoundingBox &query);

		/* True iff geom intersects the box polygon (boundary inclusive) */
		bool matches(const geos::geom::Geometry &geom) const;

		const BoundingBox &query() const { return m_query; }

	private:
		BoundingBox m_query;
		geos::geom::GeometryFactory::Ptr m_gf;
		std::unique_ptr<geos::geom::Geometry> m_window;
		std::unique_ptr<geos::geom::prep::PreparedGeometry> m_prepared;
};

/* Feature files under input_path: the file itself, or the recognized
 * files of a folder in name order */
std::vector<std::string> list_feature_files(const std::string &input_path);

/* Scans every feature file of input_path */
ExtractionResult extract_direct(const std::string &input_path, const BoundingBox &query,
	const struct extract_op &exop);

/* Scans only the chunks of chunk_dir whose box intersects the query */
ExtractionResult extract_indexed(const ChunkIndex &index, const std::string &chunk_dir,
	const BoundingBox &query, const struct extract_op &exop);

/* Normalizes the corners of exop and runs the mode it selects */
ExtractionResult extract(const struct extract_op &exop);

#endif
