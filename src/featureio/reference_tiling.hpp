#ifndef FOOTPRINTGIS_FEATUREIO_REFERENCE_TILING_HPP
#define FOOTPRINTGIS_FEATUREIO_REFERENCE_TILING_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <geos/geom/Geometry.h>

#include <common/footprint_structs.h>

/* One tile of a published dataset: its polygon, the polygon's envelope
 * and the remaining tile properties (url, size, ...) */
struct ReferenceTile {
	std::string tile_id;
	BoundingBox box;
	std::unique_ptr<geos::geom::Geometry> geometry;
	AttributeMap attributes;
};

/* Fixed tiling of the published building dataset, loaded once from a
 * GeoJSON FeatureCollection whose features carry a tile_id property. */
class ReferenceTiling {
	public:
		/* Throws SourceFormatError on an unreadable file or a tile without id */
		static std::unique_ptr<ReferenceTiling> load(const std::string &path);

		/* Throws UnknownTileError if tile_id is absent */
		const ReferenceTile &lookup(const std::string &tile_id) const;

		bool has_tile(const std::string &tile_id) const;
		std::size_t size() const { return m_tiles.size(); }
		const std::string &path() const { return m_path; }

		/* Ids in file order */
		const std::vector<std::string> &tile_ids() const { return m_order; }

	private:
		ReferenceTiling() {}

		std::string m_path;
		std::map<std::string, ReferenceTile> m_tiles;
		std::vector<std::string> m_order;
};

#endif
