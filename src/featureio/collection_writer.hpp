#ifndef FOOTPRINTGIS_FEATUREIO_COLLECTION_WRITER_HPP
#define FOOTPRINTGIS_FEATUREIO_COLLECTION_WRITER_HPP

#include <string>
#include <vector>

#include <common/footprint_structs.h>

/* Attribute names over all features, in name order */
std::vector<std::string> collection_schema(const std::vector<Feature> &features);

/* Writes features as one collection: a GeoJSON FeatureCollection for
 * .geojson/.json paths, CSV with a WKT geometry column otherwise.
 * Every schema column is present in every record (missing values are null).
 * Throws OutputIOError if path exists and overwrite is false. */
void write_collection(const std::string &path, const std::vector<Feature> &features,
	const std::vector<std::string> &schema, bool overwrite);

#endif
