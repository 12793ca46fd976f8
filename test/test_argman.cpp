#include <gtest/gtest.h>
#include "argman.hpp"

TEST(ArgManTest, ParsesRegisteredArgs) {
	ArgMan argMan;
	Arg<uint64_t> argShardSize("shard_size", 500000, argMan);
	Arg<std::string> argBatchType("batch_type", "tokens", argMan);
	Arg<std::vector<std::string>> argCorpora("corpora", argMan);
	Arg<bool> argFlag("flag", false, argMan);
	auto jConf = nlohmann::json::parse(R"({
		"shard_size": 0,
		"corpora": ["a.src", "a.tgt"],
		"flag": true,
		"unrelated": 1.5
	})");
	ParseArgsFromJson(jConf, argMan);
	EXPECT_EQ(argShardSize(), 0u);
	EXPECT_EQ(argBatchType(), "tokens");
	EXPECT_EQ(argCorpora(), std::vector<std::string>({"a.src", "a.tgt"}));
	EXPECT_TRUE(argFlag());
}

TEST(ArgManDeathTest, WrongTypeDies) {
	ArgMan argMan;
	Arg<uint64_t> argBatchSize("batch_size", 4096, argMan);
	auto jConf = nlohmann::json::parse(R"({"batch_size": "big"})");
	EXPECT_DEATH(ParseArgsFromJson(jConf, argMan), "Expected unsigned");
}

TEST(ArgManDeathTest, DuplicateRegistrationDies) {
	ArgMan argMan;
	Arg<uint64_t> argFirst("max_length", 100, argMan);
	EXPECT_DEATH(Arg<uint64_t>("max_length", 0, argMan),
			"Duplicated argument: max_length");
}
