#ifndef __CORPUS_BATCHER_HPP
#define __CORPUS_BATCHER_HPP

#include <random>
#include <string>
#include <vector>
#include "types.hpp"
#include "utils.hpp"
#include "vocabulary.hpp"
#include "batch_accumulator.hpp"

struct BATCHER_OPTION {
	// Examples per shard, 0 for a single shard over the whole corpus
	uint64_t nShardSize = 500000;
	// Sentences or padded tokens per batch, depending on strBatchType
	uint64_t nBatchSize = 4096;
	std::string strBatchType = "tokens";
	// Examples longer than this on any side are skipped, 0 to keep all
	uint64_t nMaxLength = 100;
};

// Loads N aligned corpora and produces length-sorted, capacity-bounded
// batches. Every ResetCursor() starts a new pass with a fresh shuffle:
//
//   batcher.ResetCursor();
//   for (CORPUS_BATCH batch; batcher.GetBatch(batch); ) { ... }
class CorpusBatcher {
public:
	CorpusBatcher(const std::vector<std::string> &corpusFiles,
			const std::vector<VOCAB_PTR> &vocabs,
			const BATCHER_OPTION &option, std::mt19937 &rg = GetRG());

	// Number of examples per side
	uint64_t Size() const;

	uint64_t SideCount() const;

	const std::vector<ID_SEQ>& Side(uint64_t nSide) const;

	const Vocabulary& Vocab(uint64_t nSide) const;

	const BATCHER_OPTION& Option() const;

	void ResetCursor();

	// Returns false when the current pass is exhausted
	bool GetBatch(CORPUS_BATCH &batch);

protected:
	// Filters, sorts and packs the positions of one shard
	std::vector<POS_ARY> _PackShard(const POS_ARY &shard) const;

private:
	void __LoadSide(const std::string &strFilename, const Vocabulary &vocab);

	bool __NextShard();

	void __MakeBatch(const POS_ARY &positions, CORPUS_BATCH &batch) const;

private:
	BATCHER_OPTION m_Option;
	std::mt19937 &m_RG;
	std::vector<VOCAB_PTR> m_Vocabs;
	std::vector<std::vector<ID_SEQ>> m_Sides;

	// State of the pass in progress
	POS_ARY m_Order;
	uint64_t m_nShardBeg = 0;
	uint64_t m_nShardCnt = 0;
	uint64_t m_nShardIdx = 0;
	std::vector<POS_ARY> m_ShardBatches;
	POS_ARY m_BatchOrder;
	uint64_t m_nBatchCursor = 0;
	bool m_bInPass = false;
};

#endif // #ifndef __CORPUS_BATCHER_HPP
