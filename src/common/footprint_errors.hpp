#ifndef FOOTPRINTGIS_COMMON_FOOTPRINT_ERRORS_HPP
#define FOOTPRINTGIS_COMMON_FOOTPRINT_ERRORS_HPP

#include <stdexcept>
#include <string>

/* Base of every error raised by partitioning and extraction.
 * Messages carry the offending path, identifier or coordinate. */
class FootprintError : public std::runtime_error {
	public:
		explicit FootprintError(const std::string &msg) : std::runtime_error(msg) {}
};

/* Malformed query box or corner coordinates */
class InvalidBoxError : public FootprintError {
	public:
		explicit InvalidBoxError(const std::string &msg) : FootprintError(msg) {}
};

/* Unreadable or malformed input record, index or chunk file */
class SourceFormatError : public FootprintError {
	public:
		explicit SourceFormatError(const std::string &msg) : FootprintError(msg) {}
};

/* Chunk output directory collision or write failure */
class PartitionIOError : public FootprintError {
	public:
		explicit PartitionIOError(const std::string &msg) : FootprintError(msg) {}
};

/* Tile id absent from the reference tiling */
class UnknownTileError : public FootprintError {
	public:
		UnknownTileError(const std::string &tile_id, const std::string &tiling_path)
			: FootprintError("Tile " + tile_id + " not found in " + tiling_path),
			tile_id(tile_id) {}
		const std::string tile_id;
};

/* Output collection collision or write failure */
class OutputIOError : public FootprintError {
	public:
		explicit OutputIOError(const std::string &msg) : FootprintError(msg) {}
};

#endif
