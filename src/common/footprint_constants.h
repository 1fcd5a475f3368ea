#ifndef FOOTPRINTGIS_COMMON_FOOTPRINT_CONSTANTS_H
#define FOOTPRINTGIS_COMMON_FOOTPRINT_CONSTANTS_H

#include <cstddef>
#include <string>

const std::string TAB = "\t";
const std::string COMMA = ",";

/* Coordinate limits of the geographic CRS */
const double MAX_LATITUDE = 90.0;
const double MAX_LONGITUDE = 180.0;

/* Chunk directory layout */
const std::string CHUNK_FILE_PREFIX = "chunk_";
const std::string CHUNK_FILE_EXTENSION = ".geojsonl";
const std::string CHUNK_INDEX_FILE_NAME = "chunk_boundaries.tsv";

/* Partitioning methods */
const std::string PARTITION_QT = "qt";
const std::string PARTITION_TILE = "tile";

/* Query types for the controller */
const std::string QUERYPROC_PARTITION = "partition";
const std::string QUERYPROC_EXTRACT = "extract";

/* Defaults */
const long DEFAULT_BUCKET_SIZE = 1000;
const double DEFAULT_MIN_CELL_SIZE = 1e-5;
const int DEFAULT_MAX_LEVEL = 30;
const int DEFAULT_NUM_CHUNKS = 1000;
const std::string DEFAULT_QT_PREFIX = "QT";
const std::string DEFAULT_TILES_FILE = "tiles.geojson";
const std::string DEFAULT_TILE_INPUT_SUFFIX = "_buildings.csv";
const std::string DEFAULT_TILE_OUTPUT_SUFFIX = "_chunks";
const std::string DEFAULT_GEOMETRY_COLUMN = "geometry";
const std::string DEFAULT_EXTRACT_OUTPUT = "cropped_buildings.geojson";
const std::string TILE_ID_PROPERTY = "tile_id";

/* Bytes of serialized features buffered before chunk files are appended */
const std::size_t DEFAULT_FLUSH_BYTES = 64 * 1024 * 1024;

/* R-tree parameters for the chunk index */
#define FillFactor 0.9
#define IndexCapacity 10
#define LeafCapacity 50

/* Exit codes of footprintproc */
const int EXIT_USAGE = 1;
const int EXIT_INVALID_BOX = 2;
const int EXIT_SOURCE_FORMAT = 3;
const int EXIT_PARTITION_IO = 4;
const int EXIT_UNKNOWN_TILE = 5;
const int EXIT_OUTPUT_IO = 6;
const int EXIT_FAILURE_OTHER = 7;

#endif
