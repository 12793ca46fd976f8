#include <algorithm>
#include <iomanip>
#include <numeric>
#include <boost/filesystem.hpp>
#include <glog/logging.h>
#include "corpus_batcher.hpp"

namespace bfs = boost::filesystem;

CorpusBatcher::CorpusBatcher(const std::vector<std::string> &corpusFiles,
		const std::vector<VOCAB_PTR> &vocabs, const BATCHER_OPTION &option,
		std::mt19937 &rg) : m_Option(option), m_RG(rg), m_Vocabs(vocabs) {
	CHECK_EQ(corpusFiles.size(), m_Vocabs.size())
			<< "Use as many corpora as vocabs";
	// Fails early on a bad batch_type or batch_size
	BatchAccumulator checkAccum(m_Option.nBatchSize, m_Option.strBatchType);
	for (uint64_t i = 0; i < corpusFiles.size(); ++i) {
		CHECK(m_Vocabs[i] != nullptr) << "Null vocab for " << corpusFiles[i];
		__LoadSide(corpusFiles[i], *m_Vocabs[i]);
		CHECK_EQ(m_Sides.front().size(), m_Sides.back().size())
				<< "Non parallel corpus in dataset: " << corpusFiles[i];
	}
}

uint64_t CorpusBatcher::Size() const {
	return m_Sides.empty() ? 0 : m_Sides.front().size();
}

uint64_t CorpusBatcher::SideCount() const {
	return m_Sides.size();
}

const std::vector<ID_SEQ>& CorpusBatcher::Side(uint64_t nSide) const {
	CHECK_LT(nSide, m_Sides.size());
	return m_Sides[nSide];
}

const Vocabulary& CorpusBatcher::Vocab(uint64_t nSide) const {
	CHECK_LT(nSide, m_Vocabs.size());
	return *m_Vocabs[nSide];
}

const BATCHER_OPTION& CorpusBatcher::Option() const {
	return m_Option;
}

void CorpusBatcher::ResetCursor() {
	CHECK(!m_Sides.empty()) << "Empty dataset";
	CHECK_GT(Size(), 0) << "Empty dataset";
	m_Order.resize(Size());
	std::iota(m_Order.begin(), m_Order.end(), 0);
	std::shuffle(m_Order.begin(), m_Order.end(), m_RG);
	VLOG(1) << "Shuffled dataset (" << m_Order.size() << " examples)";

	uint64_t nShardSize = m_Option.nShardSize ? m_Option.nShardSize : Size();
	m_nShardCnt = (Size() + nShardSize - 1) / nShardSize;
	VLOG(1) << "Split dataset in " << m_nShardCnt << " shards";
	m_nShardBeg = 0;
	m_nShardIdx = 0;
	m_ShardBatches.clear();
	m_BatchOrder.clear();
	m_nBatchCursor = 0;
	m_bInPass = true;
}

bool CorpusBatcher::GetBatch(CORPUS_BATCH &batch) {
	if (!m_bInPass) {
		ResetCursor();
	}
	while (m_nBatchCursor >= m_BatchOrder.size()) {
		if (!__NextShard()) {
			m_bInPass = false;
			return false;
		}
	}
	__MakeBatch(m_ShardBatches[m_BatchOrder[m_nBatchCursor++]], batch);
	return true;
}

std::vector<POS_ARY> CorpusBatcher::_PackShard(const POS_ARY &shard) const {
	uint64_t nSideCnt = m_Sides.size();
	POS_ARY shardPos;
	LEN_ARY shardLen;
	for (auto nPos : shard) {
		if (m_Option.nMaxLength) {
			uint64_t nMaxLen = 0;
			for (const auto &side : m_Sides) {
				nMaxLen = std::max<uint64_t>(nMaxLen, side[nPos].size());
			}
			if (nMaxLen > m_Option.nMaxLength) {
				continue;
			}
		}
		shardPos.push_back(nPos);
		shardLen.push_back(m_Sides[0][nPos].size());
	}
	LOG(INFO) << "Built shard " << m_nShardIdx << "/" << m_nShardCnt
			<< " (" << shardPos.size() << " examples)";

	POS_ARY sortIdx(shardPos.size());
	std::iota(sortIdx.begin(), sortIdx.end(), 0);
	std::stable_sort(sortIdx.begin(), sortIdx.end(),
		[&](uint64_t a, uint64_t b) { return shardLen[a] < shardLen[b]; });
	VLOG(1) << "Sorted examples by length";

	std::vector<POS_ARY> batches;
	BatchAccumulator accum(m_Option.nBatchSize, m_Option.strBatchType);
	accum.Reset(nSideCnt);
	LEN_ARY lens(nSideCnt);
	for (auto i : sortIdx) {
		uint64_t nPos = shardPos[i];
		for (uint64_t n = 0; n < nSideCnt; ++n) {
			lens[n] = m_Sides[n][nPos].size() + 2;
		}
		if (accum.Add(nPos, lens)) {
			continue;
		}
		if (!accum.Empty()) {
			batches.push_back(accum.Positions());
			accum.Reset(nSideCnt);
		}
		if (!accum.Add(nPos, lens)) {
			// Longer than the whole capacity: goes out as a batch of its own
			accum.ForceAdd(nPos, lens);
		}
	}
	if (!accum.Empty()) {
		batches.push_back(accum.Positions());
	}
	LOG(INFO) << "Built " << batches.size() << " batches in shard";
	return batches;
}

void CorpusBatcher::__LoadSide(const std::string &strFilename,
		const Vocabulary &vocab) {
	CHECK(bfs::is_regular_file(strFilename))
			<< "Cannot read file " << strFilename;
	std::vector<ID_SEQ> lineIds;
	uint64_t nTokCnt = 0;
	uint64_t nUnkCnt = 0;
	for (const auto &strLine : LoadFileLines(strFilename)) {
		lineIds.emplace_back(vocab.Encode(strLine));
		nTokCnt += lineIds.back().size();
		nUnkCnt += std::count(lineIds.back().begin(), lineIds.back().end(),
				Vocabulary::UNK_ID);
	}
	double dUnkRate = nTokCnt ? 100.0 * nUnkCnt / nTokCnt : 0.0;
	LOG(INFO) << "Read Corpus (" << lineIds.size() << " lines ~ " << nTokCnt
			<< " tokens ~ " << nUnkCnt << " OOVs [" << std::fixed
			<< std::setprecision(2) << dUnkRate << "%]) from " << strFilename;
	m_Sides.emplace_back(std::move(lineIds));
}

bool CorpusBatcher::__NextShard() {
	if (m_nShardBeg >= m_Order.size()) {
		return false;
	}
	uint64_t nShardSize = m_Option.nShardSize ? m_Option.nShardSize : Size();
	uint64_t nShardEnd = std::min<uint64_t>(m_nShardBeg + nShardSize,
			m_Order.size());
	POS_ARY shard(m_Order.begin() + m_nShardBeg, m_Order.begin() + nShardEnd);
	m_nShardBeg = nShardEnd;
	++m_nShardIdx;

	m_ShardBatches = _PackShard(shard);
	m_BatchOrder.resize(m_ShardBatches.size());
	std::iota(m_BatchOrder.begin(), m_BatchOrder.end(), 0);
	std::shuffle(m_BatchOrder.begin(), m_BatchOrder.end(), m_RG);
	VLOG(1) << "Shuffled " << m_BatchOrder.size() << " batches";
	m_nBatchCursor = 0;
	return true;
}

void CorpusBatcher::__MakeBatch(const POS_ARY &positions,
		CORPUS_BATCH &batch) const {
	batch.positions = positions;
	batch.sides.resize(m_Sides.size());
	for (uint64_t n = 0; n < m_Sides.size(); ++n) {
		auto &seqs = batch.sides[n];
		seqs.clear();
		seqs.reserve(positions.size());
		for (auto nPos : positions) {
			const auto &ids = m_Sides[n][nPos];
			ID_SEQ wrapped;
			wrapped.reserve(ids.size() + 2);
			wrapped.push_back(Vocabulary::BOS_ID);
			wrapped.insert(wrapped.end(), ids.begin(), ids.end());
			wrapped.push_back(Vocabulary::EOS_ID);
			seqs.emplace_back(std::move(wrapped));
		}
	}
}
