#ifndef FOOTPRINTGIS_INDICES_CHUNK_INDEX_HPP
#define FOOTPRINTGIS_INDICES_CHUNK_INDEX_HPP

#include <memory>
#include <string>
#include <vector>

#include <spatialindex/SpatialIndex.h>

#include <common/footprint_structs.h>

/* In-memory R-tree over the boxes of one chunk set.
 * Built once from the boundaries file and never modified. */
class ChunkIndex {
	public:
		explicit ChunkIndex(const std::vector<ChunkIndexEntry> &entries);

		/* Reads <dir>/chunk_boundaries.tsv. Throws SourceFormatError. */
		static std::unique_ptr<ChunkIndex> load(const std::string &dir);

		/* Ids of every chunk whose box intersects query (boundary
		 * inclusive), in boundaries-file order */
		std::vector<std::string> candidates(const BoundingBox &query) const;

		const std::vector<ChunkIndexEntry> &entries() const { return m_entries; }
		std::size_t size() const { return m_entries.size(); }

	private:
		ChunkIndex(const ChunkIndex &) = delete;
		ChunkIndex &operator=(const ChunkIndex &) = delete;

		std::vector<ChunkIndexEntry> m_entries;
		std::unique_ptr<SpatialIndex::IStorageManager> m_storage;
		std::unique_ptr<SpatialIndex::ISpatialIndex> m_spidx; // destroyed before m_storage
};

#endif
