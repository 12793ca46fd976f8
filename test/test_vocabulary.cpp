#include <gtest/gtest.h>
#include "vocabulary.hpp"
#include "test_utils.hpp"

namespace {

std::vector<std::string> MakeTokens() {
	return {"<pad>", "<unk>", "<bos>", "<eos>", "a", "b"};
}

}

TEST(VocabularyTest, ReservedIds) {
	Vocabulary vocab(MakeTokens());
	EXPECT_EQ(vocab.Size(), 6u);
	EXPECT_EQ(vocab.IdOf("<pad>"), Vocabulary::PAD_ID);
	EXPECT_EQ(vocab.IdOf("<unk>"), Vocabulary::UNK_ID);
	EXPECT_EQ(vocab.IdOf("<bos>"), Vocabulary::BOS_ID);
	EXPECT_EQ(vocab.IdOf("<eos>"), Vocabulary::EOS_ID);
	EXPECT_EQ(vocab.TokenOf(4), "a");
	EXPECT_EQ(vocab.TokenOf(5), "b");
}

TEST(VocabularyTest, UnknownTokenMapsToUnk) {
	Vocabulary vocab(MakeTokens());
	EXPECT_EQ(vocab.IdOf("zzz"), Vocabulary::UNK_ID);
	EXPECT_EQ(vocab.IdOf(""), Vocabulary::UNK_ID);
	EXPECT_FALSE(vocab.ContainsToken("zzz"));
	EXPECT_TRUE(vocab.ContainsToken("b"));
}

TEST(VocabularyTest, ContainsId) {
	Vocabulary vocab(MakeTokens());
	EXPECT_TRUE(vocab.ContainsId(0));
	EXPECT_TRUE(vocab.ContainsId(5));
	EXPECT_FALSE(vocab.ContainsId(6));
	EXPECT_FALSE(vocab.ContainsId(-1));
}

TEST(VocabularyTest, EncodeSplitsOnWhitespace) {
	Vocabulary vocab(MakeTokens());
	EXPECT_EQ(vocab.Encode("a  b\ta c"), ID_SEQ({4, 5, 4, 1}));
	EXPECT_TRUE(vocab.Encode("   ").empty());
	EXPECT_EQ(vocab.Decode({4, 5, 4}), "a b a");
}

TEST(VocabularyTest, DuplicateKeepsFirstId) {
	auto tokens = MakeTokens();
	tokens.push_back("a");
	Vocabulary vocab(tokens);
	EXPECT_EQ(vocab.Size(), 7u);
	EXPECT_EQ(vocab.IdOf("a"), 4);
}

TEST(VocabularyTest, LoadFromFile) {
	TempDir tmpDir;
	auto strFn = tmpDir.WriteLines("vocab.txt", MakeTokens());
	auto pVocab = Vocabulary::LoadFromFile(strFn);
	ASSERT_NE(pVocab, nullptr);
	EXPECT_EQ(pVocab->Size(), 6u);
	EXPECT_EQ(pVocab->IdOf("b"), 5);
}

TEST(VocabularyDeathTest, TooFewEntries) {
	std::vector<std::string> tokens = {"<pad>", "<unk>", "<bos>"};
	EXPECT_DEATH(Vocabulary vocab(tokens), "Vocab must start");
}

TEST(VocabularyDeathTest, MisplacedMarker) {
	std::vector<std::string> swapped = {"<pad>", "<bos>", "<unk>", "<eos>"};
	EXPECT_DEATH(Vocabulary vocab(swapped), "must exist in vocab with id=1");
	std::vector<std::string> shifted = {"a", "<pad>", "<unk>", "<bos>", "<eos>"};
	EXPECT_DEATH(Vocabulary vocab(shifted), "must exist in vocab with id=0");
}

TEST(VocabularyDeathTest, TokenOfOutOfRange) {
	Vocabulary vocab(MakeTokens());
	EXPECT_DEATH(vocab.TokenOf(6), "Invalid id=6");
}

TEST(VocabularyDeathTest, MissingFile) {
	EXPECT_DEATH(Vocabulary::LoadFromFile("/nonexistent/vocab.txt"),
			"Cannot read file");
}
