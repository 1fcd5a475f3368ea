#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

#include <boost/filesystem.hpp>

#include <geos/io/GeoJSON.h>

#include <common/bbox_utils.hpp>
#include <common/footprint_constants.h>
#include <common/footprint_errors.hpp>
#include <featureio/chunk_store.hpp>
#include <utilities/tokenizer.h>

using namespace std;
using namespace geos::io;

namespace fs = boost::filesystem;

string chunk_file_path(const string &dir, const string &chunk_id) {
	return (fs::path(dir) / (CHUNK_FILE_PREFIX + chunk_id + CHUNK_FILE_EXTENSION)).string();
}

string index_file_path(const string &dir) {
	return (fs::path(dir) / CHUNK_INDEX_FILE_NAME).string();
}

static bool is_chunk_set_file(const fs::path &p) {
	string name = p.filename().string();
	if (name == CHUNK_INDEX_FILE_NAME) {
		return true;
	}
	return name.size() > CHUNK_FILE_PREFIX.size() + CHUNK_FILE_EXTENSION.size()
		&& name.compare(0, CHUNK_FILE_PREFIX.size(), CHUNK_FILE_PREFIX) == 0
		&& name.compare(name.size() - CHUNK_FILE_EXTENSION.size(),
			CHUNK_FILE_EXTENSION.size(), CHUNK_FILE_EXTENSION) == 0;
}

/* True if path names something at or below dir */
static bool is_within(const fs::path &path, const fs::path &dir) {
	if (!fs::exists(path)) {
		return false;
	}
	fs::path target = fs::canonical(dir);
	for (fs::path p = fs::canonical(path); !p.empty(); p = p.parent_path()) {
		if (p == target) {
			return true;
		}
		if (p == p.root_path()) {
			break;
		}
	}
	return false;
}

void prepare_output_dir(const string &dir, bool override_existing, const string &input_path) {
	try {
		fs::path p(dir);
		if (fs::exists(p)) {
			if (!fs::is_directory(p)) {
				throw PartitionIOError("Output path " + dir + " exists and is not a directory");
			}
			if (!input_path.empty() && is_within(input_path, p)) {
				throw PartitionIOError("Input " + input_path + " lies inside output folder " + dir);
			}
			if (!fs::is_empty(p)) {
				if (!override_existing) {
					throw PartitionIOError("Output folder " + dir
						+ " already exists and is not empty; use override to rebuild it");
				}
				/* Only a previous chunk set is replaced; anything else stays */
				vector<fs::path> stale;
				for (fs::directory_iterator it(p), end; it != end; ++it) {
					if (!fs::is_regular_file(it->status()) || !is_chunk_set_file(it->path())) {
						throw PartitionIOError("Output folder " + dir + " holds "
							+ it->path().filename().string() + ", which is not part of a chunk set");
					}
					stale.push_back(it->path());
				}
				#ifdef DEBUG
				cerr << "Removing previous chunk set of " << stale.size() << " files in " << dir << endl;
				#endif
				for (size_t i = 0; i < stale.size(); i++) {
					fs::remove(stale[i]);
				}
			}
		}
		fs::create_directories(p);
	} catch (fs::filesystem_error &e) {
		throw PartitionIOError("Cannot prepare output folder " + dir + ": " + e.what());
	}
}

void write_index(const string &path, const vector<ChunkIndexEntry> &entries) {
	ofstream ofs(path.c_str(), ofstream::trunc);
	if (!ofs) {
		throw PartitionIOError("Cannot write chunk index " + path);
	}
	ofs.precision(numeric_limits<double>::max_digits10);
	for (vector<ChunkIndexEntry>::const_iterator it = entries.begin();
		it != entries.end(); ++it) {
		ofs << it->chunk_id
			<< TAB << it->box.low[0] << TAB << it->box.low[1]
			<< TAB << it->box.high[0] << TAB << it->box.high[1]
			<< TAB << it->feature_count << endl;
	}
	ofs.close();
	if (ofs.fail()) {
		throw PartitionIOError("Error writing chunk index " + path);
	}
}

static bool parse_field(const string &field, double &value) {
	const char *begin = field.c_str();
	char *end = NULL;
	value = strtod(begin, &end);
	return end != begin && *end == '\0';
}

vector<ChunkIndexEntry> read_index(const string &path) {
	ifstream infile(path.c_str());
	if (!infile) {
		throw SourceFormatError("Chunk index " + path + " not found");
	}

	vector<ChunkIndexEntry> entries;
	vector<string> fields;
	string input_line;
	long line = 0;
	while (getline(infile, input_line)) {
		line++;
		if (input_line.empty()) {
			continue;
		}
		tokenize(input_line, fields, TAB, true, "");
		double coords[4];
		bool ok = fields.size() == 5 || fields.size() == 6;
		for (int i = 0; ok && i < 4; i++) {
			ok = parse_field(fields[i + 1], coords[i]);
		}
		ChunkIndexEntry entry;
		if (ok && fields.size() == 6) {
			char *end = NULL;
			entry.feature_count = strtol(fields[5].c_str(), &end, 10);
			ok = end != fields[5].c_str() && *end == '\0';
		}
		if (!ok || fields[0].empty() || coords[0] > coords[2] || coords[1] > coords[3]) {
			stringstream ss;
			ss << path << ":" << line << ": malformed chunk index entry [" << input_line << "]";
			throw SourceFormatError(ss.str());
		}
		entry.chunk_id = fields[0];
		entry.box = BoundingBox(coords[0], coords[1], coords[2], coords[3]);
		entries.push_back(entry);
	}
	return entries;
}

unique_ptr<FeatureSource> open_chunk(const string &dir, const string &chunk_id) {
	string path = chunk_file_path(dir, chunk_id);
	if (!fs::exists(path)) {
		throw SourceFormatError("Chunk file " + path + " listed in the index is missing");
	}
	return unique_ptr<FeatureSource>(new GeoJSONSeqFeatureSource(path));
}

/////////////////////////////////////////////
// ChunkWriter
/////////////////////////////////////////////

ChunkWriter::ChunkWriter(const string &dir, const vector<string> &chunk_ids,
	size_t flush_bytes) : m_dir(dir), m_flush_bytes(flush_bytes), m_buffered(0)
{
	m_chunks.resize(chunk_ids.size());
	for (size_t i = 0; i < chunk_ids.size(); i++) {
		m_chunks[i].id = chunk_ids[i];
		m_chunks[i].count = 0;
	}
}

void ChunkWriter::add(size_t slot, Feature &feature) {
	ChunkState &chunk = m_chunks[slot];
	BoundingBox env = envelope_of(*feature.geometry);

	GeoJSONFeature out(std::move(feature.geometry), feature.attributes);
	string line;
	try {
		line = m_writer.write(out);
	} catch (std::exception &e) {
		throw PartitionIOError("Cannot serialize feature for chunk " + chunk.id + ": " + e.what());
	}
	chunk.box = chunk.count == 0 ? env : box_union(chunk.box, env);
	chunk.count++;
	chunk.buffer.append(line);
	chunk.buffer.push_back('\n');
	m_buffered += line.size() + 1;

	if (m_buffered >= m_flush_bytes) {
		flush();
	}
}

void ChunkWriter::append(ChunkState &chunk) {
	if (chunk.buffer.empty()) {
		return;
	}
	string path = chunk_file_path(m_dir, chunk.id);
	ofstream ofs(path.c_str(), ofstream::app);
	ofs << chunk.buffer;
	ofs.close();
	if (ofs.fail()) {
		throw PartitionIOError("Error writing chunk file " + path);
	}
	m_buffered -= chunk.buffer.size();
	string().swap(chunk.buffer);
}

void ChunkWriter::flush() {
	#ifdef DEBUG
	cerr << "Flushing " << m_buffered << " buffered bytes to " << m_dir << endl;
	#endif
	for (vector<ChunkState>::iterator it = m_chunks.begin(); it != m_chunks.end(); ++it) {
		append(*it);
	}
}

vector<ChunkIndexEntry> ChunkWriter::finish() {
	flush();
	vector<ChunkIndexEntry> entries;
	for (vector<ChunkState>::iterator it = m_chunks.begin(); it != m_chunks.end(); ++it) {
		if (it->count > 0) {
			entries.push_back(ChunkIndexEntry(it->id, it->box, it->count));
		}
	}
	return entries;
}
