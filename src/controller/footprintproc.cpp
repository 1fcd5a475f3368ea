/* Entry point: partitions building footprints into chunks or extracts
 * the footprints intersecting a query box */
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>

#include <common/bbox_utils.hpp>
#include <common/footprint_constants.h>
#include <common/footprint_errors.hpp>
#include <extraction/extraction_engine.hpp>
#include <featureio/collection_writer.hpp>
#include <partitionalgo/partitioner.hpp>
#include <progparams/footprint_params.hpp>

#ifdef DEBUGTIME
#include <ctime>
#endif

using namespace std;

static int run_partition(const struct partition_op &partop) {
	PartitionResult result = partition(partop);
	cerr << "Partitioned " << result.feature_count << " features into "
		<< result.entries.size() << " chunks" << endl;
	cerr << "Chunk index written to " << result.index_path << endl;
	return 0;
}

static int run_extract(const struct extract_op &exop) {
	// Refuse before scanning anything
	boost::system::error_code ec;
	if (!exop.overwrite && boost::filesystem::exists(exop.output_path, ec)) {
		throw OutputIOError("Output " + exop.output_path
			+ " already exists, use --overwrite to replace it");
	}

	ExtractionResult result = extract(exop);
	if (exop.from_db) {
		cerr << "Found " << result.summary.candidate_chunks
			<< " potentially intersecting files" << endl;
	}
	if (result.summary.empty_result) {
		cerr << "No buildings found in the given bounding box" << endl;
	} else {
		cerr << "Found " << result.summary.matches << " buildings in "
			<< result.summary.files_scanned << " files" << endl;
	}

	vector<string> schema = collection_schema(result.features);
	write_collection(exop.output_path, result.features, schema, exop.overwrite);
	cerr << "Output written to " << exop.output_path << endl;
	return 0;
}

int main(int argc, char **argv) {
	cout.precision(15);

	string query_type;
	struct partition_op partop;
	struct extract_op exop;

	if (!extract_params(argc, argv, query_type, partop, exop)) {
		return EXIT_USAGE;
	}

	#ifdef DEBUGTIME
	clock_t start = clock();
	#endif

	int status = 0;
	try {
		if (query_type == QUERYPROC_PARTITION) {
			status = run_partition(partop);
		} else {
			status = run_extract(exop);
		}
	} catch (const InvalidBoxError &e) {
		cerr << "Invalid bounding box: " << e.what() << endl;
		return EXIT_INVALID_BOX;
	} catch (const SourceFormatError &e) {
		cerr << "Malformed input: " << e.what() << endl;
		return EXIT_SOURCE_FORMAT;
	} catch (const PartitionIOError &e) {
		cerr << "Cannot write chunks: " << e.what() << endl;
		return EXIT_PARTITION_IO;
	} catch (const UnknownTileError &e) {
		cerr << e.what() << endl;
		return EXIT_UNKNOWN_TILE;
	} catch (const OutputIOError &e) {
		cerr << "Cannot write output: " << e.what() << endl;
		return EXIT_OUTPUT_IO;
	} catch (const invalid_argument &e) {
		cerr << "error: " << e.what() << endl;
		return EXIT_USAGE;
	} catch (const exception &e) {
		cerr << "error: " << e.what() << endl;
		return EXIT_FAILURE_OTHER;
	}

	#ifdef DEBUGTIME
	cerr << "Total time: " << (double) (clock() - start) / CLOCKS_PER_SEC << endl;
	#endif
	return status;
}
