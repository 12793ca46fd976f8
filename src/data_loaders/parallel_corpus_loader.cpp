#include <map>
#include <memory>
#include <glog/logging.h>
#include "../argman.hpp"
#include "../creator.hpp"
#include "../corpus_batcher.hpp"
#include "batch_loader.hpp"

// Feeds dynamically packed batches of a parallel corpus.
//   data:    one [B, L_n] padded id tensor per side
//   targets: {[B] original example positions}
class ParallelCorpusLoader : public BatchLoader {
public:
	void Initialize(const nlohmann::json &jConf) override {
		ArgMan argMan;
		Arg<std::vector<std::string>> argCorpora("corpora", argMan);
		Arg<std::vector<std::string>> argVocabs("vocabs", argMan);
		Arg<uint64_t> argShardSize("shard_size", 500000, argMan);
		Arg<uint64_t> argBatchSize("batch_size", 4096, argMan);
		Arg<std::string> argBatchType("batch_type", "tokens", argMan);
		Arg<uint64_t> argMaxLength("max_length", 100, argMan);
		ParseArgsFromJson(jConf, argMan);

		CHECK(!argCorpora().empty()) << "No corpora given";
		CHECK_EQ(argCorpora().size(), argVocabs().size())
				<< "Use as many corpora as vocabs";
		// Tied sides share one vocab instance
		std::map<std::string, VOCAB_PTR> loadedVocabs;
		std::vector<VOCAB_PTR> vocabs;
		for (const auto &strVocab : argVocabs()) {
			auto iVocab = loadedVocabs.find(strVocab);
			if (iVocab == loadedVocabs.end()) {
				iVocab = loadedVocabs.emplace(strVocab,
						Vocabulary::LoadFromFile(strVocab)).first;
			}
			vocabs.push_back(iVocab->second);
		}

		BATCHER_OPTION option;
		option.nShardSize = argShardSize();
		option.nBatchSize = argBatchSize();
		option.strBatchType = argBatchType();
		option.nMaxLength = argMaxLength();
		m_pBatcher.reset(new CorpusBatcher(argCorpora(), vocabs, option));
	}

	uint64_t Size() const override {
		CHECK(m_pBatcher != nullptr);
		return m_pBatcher->Size();
	}

	void ResetCursor() override {
		CHECK(m_pBatcher != nullptr);
		m_pBatcher->ResetCursor();
	}

protected:
	bool _LoadBatch(TENSOR_ARY &data, TENSOR_ARY &targets) override {
		CHECK(m_pBatcher != nullptr);
		if (!m_pBatcher->GetBatch(m_Batch)) {
			return false;
		}
		data.clear();
		for (const auto &seqs : m_Batch.sides) {
			data.emplace_back(PadIdSequences(seqs, Vocabulary::PAD_ID));
		}
		std::vector<int64_t> positions(m_Batch.positions.begin(),
				m_Batch.positions.end());
		targets.clear();
		targets.emplace_back(torch::tensor(positions));
		return true;
	}

private:
	std::unique_ptr<CorpusBatcher> m_pBatcher;
	CORPUS_BATCH m_Batch;
};

REGISTER_CREATOR(BatchLoader, ParallelCorpusLoader, "ParallelCorpus");
