#include <gtest/gtest.h>
#include "creator.hpp"
#include "data_loaders/batch_loader.hpp"
#include "test_utils.hpp"

namespace {

class ParallelCorpusLoaderTest : public ::testing::Test {
protected:
	void SetUp() override {
		m_jConf["name"] = "ParallelCorpus";
		m_jConf["corpora"] = {
			m_TmpDir.WriteLines("train.src", {"a b", "b"}),
			m_TmpDir.WriteLines("train.tgt", {"x y", "y"})
		};
		m_jConf["vocabs"] = {
			m_TmpDir.WriteLines("vocab.src",
					{"<pad>", "<unk>", "<bos>", "<eos>", "a", "b"}),
			m_TmpDir.WriteLines("vocab.tgt",
					{"<pad>", "<unk>", "<bos>", "<eos>", "x", "y"})
		};
		m_jConf["shard_size"] = 0u;
		m_jConf["batch_size"] = 10u;
		m_jConf["batch_type"] = "sentences";
		m_jConf["max_length"] = 0u;
	}

	TempDir m_TmpDir;
	nlohmann::json m_jConf;
};

}

TEST(PadIdSequencesTest, PadsToLongestRow) {
	auto tPadded = PadIdSequences({{2, 5, 3}, {2, 4, 5, 3}, {2, 3}}, 0);
	ASSERT_EQ(tPadded.dim(), 2);
	EXPECT_EQ(tPadded.size(0), 3);
	EXPECT_EQ(tPadded.size(1), 4);
	EXPECT_EQ(tPadded.scalar_type(), torch::kLong);
	auto tExpected = torch::tensor(std::vector<int64_t>{
			2, 5, 3, 0, 2, 4, 5, 3, 2, 3, 0, 0}).reshape({3, 4});
	EXPECT_TRUE(torch::equal(tPadded, tExpected));
}

TEST_F(ParallelCorpusLoaderTest, YieldsPaddedSides) {
	auto pLoader = Creator<BatchLoader>::Create(m_jConf);
	EXPECT_EQ(pLoader->Size(), 2u);
	pLoader->ResetCursor();

	TENSOR_ARY data, targets;
	ASSERT_TRUE(pLoader->GetBatch(data, targets, torch::kCPU));
	ASSERT_EQ(data.size(), 2u);
	ASSERT_EQ(targets.size(), 1u);
	auto tExpected = torch::tensor(std::vector<int64_t>{
			2, 5, 3, 0, 2, 4, 5, 3}).reshape({2, 4});
	EXPECT_TRUE(torch::equal(data[0], tExpected));
	EXPECT_TRUE(torch::equal(data[1], tExpected));
	EXPECT_TRUE(torch::equal(targets[0],
			torch::tensor(std::vector<int64_t>{1, 0})));
	EXPECT_FALSE(pLoader->GetBatch(data, targets, torch::kCPU));
}

TEST_F(ParallelCorpusLoaderTest, TokenBudgetSplitsBatches) {
	m_jConf["batch_type"] = "tokens";
	m_jConf["batch_size"] = 4u;
	auto pLoader = Creator<BatchLoader>::Create(m_jConf);
	pLoader->ResetCursor();

	TENSOR_ARY data, targets;
	uint64_t nBatches = 0;
	while (pLoader->GetBatch(data, targets, torch::kCPU)) {
		++nBatches;
		EXPECT_EQ(data[0].size(0), 1);
		EXPECT_EQ(targets[0].numel(), 1);
	}
	EXPECT_EQ(nBatches, 2u);
}

TEST_F(ParallelCorpusLoaderTest, TiedVocabulary) {
	std::string strVocab = m_TmpDir.WriteLines("vocab.joint",
			{"<pad>", "<unk>", "<bos>", "<eos>", "a", "b", "x", "y"});
	m_jConf["vocabs"] = {strVocab, strVocab};
	auto pLoader = Creator<BatchLoader>::Create(m_jConf);
	pLoader->ResetCursor();

	TENSOR_ARY data, targets;
	ASSERT_TRUE(pLoader->GetBatch(data, targets, torch::kCPU));
	auto tTgt = torch::tensor(std::vector<int64_t>{
			2, 7, 3, 0, 2, 6, 7, 3}).reshape({2, 4});
	EXPECT_TRUE(torch::equal(data[1], tTgt));
}

TEST_F(ParallelCorpusLoaderTest, DefaultsApply) {
	m_jConf.erase("shard_size");
	m_jConf.erase("batch_size");
	m_jConf.erase("batch_type");
	m_jConf.erase("max_length");
	auto pLoader = Creator<BatchLoader>::Create(m_jConf);
	pLoader->ResetCursor();
	TENSOR_ARY data, targets;
	ASSERT_TRUE(pLoader->GetBatch(data, targets, torch::kCPU));
	EXPECT_EQ(data[0].size(0), 2);
}

TEST_F(ParallelCorpusLoaderTest, UnknownLoaderNameDies) {
	m_jConf["name"] = "NoSuchLoader";
	EXPECT_DEATH(Creator<BatchLoader>::Create(m_jConf),
			"Invalid name: NoSuchLoader");
}

TEST_F(ParallelCorpusLoaderTest, MismatchedVocabListDies) {
	m_jConf["vocabs"].erase(1);
	EXPECT_DEATH(Creator<BatchLoader>::Create(m_jConf),
			"as many corpora as vocabs");
}
