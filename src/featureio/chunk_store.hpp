#ifndef FOOTPRINTGIS_FEATUREIO_CHUNK_STORE_HPP
#define FOOTPRINTGIS_FEATUREIO_CHUNK_STORE_HPP

#include <memory>
#include <string>
#include <vector>

#include <geos/io/GeoJSONWriter.h>

#include <common/footprint_structs.h>
#include <featureio/feature_source.hpp>

/* Layout of a chunk directory:
 *   <dir>/chunk_<chunk id>.geojsonl   one GeoJSON feature per line
 *   <dir>/chunk_boundaries.tsv        chunk id, min lon, min lat, max lon, max lat, count
 */
std::string chunk_file_path(const std::string &dir, const std::string &chunk_id);
std::string index_file_path(const std::string &dir);

/* Makes dir ready for a fresh chunk set. A non-empty dir is an error
 * (PartitionIOError) unless override_existing is set, in which case the
 * files of a previous chunk set are removed. Any other entry in dir, or
 * input_path lying inside dir, is a PartitionIOError and nothing is
 * removed. */
void prepare_output_dir(const std::string &dir, bool override_existing,
	const std::string &input_path = "");

void write_index(const std::string &path, const std::vector<ChunkIndexEntry> &entries);

/* Throws SourceFormatError on a missing or malformed boundaries file */
std::vector<ChunkIndexEntry> read_index(const std::string &path);

/* Lazy reader over the features of one chunk */
std::unique_ptr<FeatureSource> open_chunk(const std::string &dir, const std::string &chunk_id);

/* Appends features to the chunk files of one partitioning run.
 * Serialized features are buffered and appended to their files once the
 * buffer exceeds flush_bytes, so memory stays bounded whatever the number
 * of chunks. */
class ChunkWriter {
	public:
		ChunkWriter(const std::string &dir, const std::vector<std::string> &chunk_ids,
			std::size_t flush_bytes);

		/* Files the feature under chunk slot; the feature is consumed */
		void add(std::size_t slot, Feature &feature);

		long count(std::size_t slot) const { return m_chunks[slot].count; }
		std::size_t size() const { return m_chunks.size(); }

		/* Flushes every buffer and returns the entries of the non-empty
		 * chunks in slot order */
		std::vector<ChunkIndexEntry> finish();

	private:
		struct ChunkState {
			std::string id;
			std::string buffer;
			long count;
			BoundingBox box;
		};

		void flush();
		void append(ChunkState &chunk);

		std::string m_dir;
		std::vector<ChunkState> m_chunks;
		std::size_t m_flush_bytes;
		std::size_t m_buffered;
		geos::io::GeoJSONWriter m_writer;
};

#endif
