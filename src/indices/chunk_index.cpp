#include <algorithm>
#include <iostream>

#include <common/footprint_constants.h>
#include <common/footprint_errors.hpp>
#include <featureio/chunk_store.hpp>
#include <indices/chunk_index.hpp>

using namespace std;
using namespace SpatialIndex;

/* Class used for R-tree traversal */
class ChunkVisitor : public IVisitor
{
	public:
		vector<id_type> matches; // positions of the matching entries

		void visitNode(const INode &n) {}

		void visitData(const IData &d)
		{
			matches.push_back(d.getIdentifier());
		}

		void visitData(std::vector<const IData *> &v) {}
};

/* Data stream over the index entries; the R-tree id is the entry position */
class ChunkEntryStream : public IDataStream
{
	public:
		explicit ChunkEntryStream(const vector<ChunkIndexEntry> &entries)
			: m_entries(entries), m_pos(0) {}

		virtual IData *getNext()
		{
			if (m_pos >= m_entries.size()) return 0;

			const BoundingBox &box = m_entries[m_pos].box;
			Region r(box.low, box.high, 2);
			RTree::Data *ret = new RTree::Data(0, 0, r, static_cast<id_type>(m_pos));
			m_pos++;
			return ret;
		}

		virtual bool hasNext()
		{
			return m_pos < m_entries.size();
		}

		virtual uint32_t size()
		{
			return static_cast<uint32_t>(m_entries.size());
		}

		virtual void rewind()
		{
			m_pos = 0;
		}

	private:
		const vector<ChunkIndexEntry> &m_entries;
		size_t m_pos;
};

ChunkIndex::ChunkIndex(const vector<ChunkIndexEntry> &entries) : m_entries(entries) {
	if (m_entries.empty()) {
		return;
	}
	try {
		id_type indexIdentifier;
		ChunkEntryStream stream(m_entries);
		m_storage.reset(StorageManager::createNewMemoryStorageManager());
		m_spidx.reset(RTree::createAndBulkLoadNewRTree(RTree::BLM_STR, stream, *m_storage,
			FillFactor,
			IndexCapacity,
			LeafCapacity,
			2,
			RTree::RV_RSTAR, indexIdentifier));
	} catch (Tools::Exception &e) {
		throw SourceFormatError("Index building on chunk boundaries failed: " + e.what());
	}
	if (!m_spidx->isIndexValid()) {
		throw SourceFormatError("Index building on chunk boundaries produced an invalid R-tree");
	}
	#ifdef DEBUG
	cerr << "Chunk index built over " << m_entries.size() << " chunks" << endl;
	#endif
}

unique_ptr<ChunkIndex> ChunkIndex::load(const string &dir) {
	return unique_ptr<ChunkIndex>(new ChunkIndex(read_index(index_file_path(dir))));
}

vector<string> ChunkIndex::candidates(const BoundingBox &query) const {
	vector<string> result;
	if (!m_spidx) {
		return result;
	}

	ChunkVisitor vis;
	Region r(query.low, query.high, 2);
	try {
		m_spidx->intersectsWithQuery(r, vis);
	} catch (Tools::Exception &e) {
		throw SourceFormatError("Chunk index query failed: " + e.what());
	}

	sort(vis.matches.begin(), vis.matches.end());
	for (vector<id_type>::iterator it = vis.matches.begin(); it != vis.matches.end(); ++it) {
		result.push_back(m_entries[static_cast<size_t>(*it)].chunk_id);
	}
	return result;
}
