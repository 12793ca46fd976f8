#ifndef __VOCABULARY_HPP
#define __VOCABULARY_HPP

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

// Immutable token <-> id table of one corpus side. The first four entries
// must be <pad>, <unk>, <bos> and <eos>, in that order.
class Vocabulary {
public:
	static constexpr int64_t PAD_ID = 0;
	static constexpr int64_t UNK_ID = 1;
	static constexpr int64_t BOS_ID = 2;
	static constexpr int64_t EOS_ID = 3;
	static const char *const PAD_STR;
	static const char *const UNK_STR;
	static const char *const BOS_STR;
	static const char *const EOS_STR;

	explicit Vocabulary(std::vector<std::string> tokens);

	static std::shared_ptr<const Vocabulary> LoadFromFile(
			const std::string &strFilename);

	uint64_t Size() const;

	// Unknown tokens map to UNK_ID
	int64_t IdOf(const std::string &strToken) const;

	const std::string& TokenOf(int64_t nId) const;

	bool ContainsId(int64_t nId) const;

	bool ContainsToken(const std::string &strToken) const;

	ID_SEQ Encode(const std::string &strLine) const;

	std::string Decode(const ID_SEQ &ids) const;

private:
	std::vector<std::string> m_Tokens;
	std::unordered_map<std::string, int64_t> m_TokenIds;
};

using VOCAB_PTR = std::shared_ptr<const Vocabulary>;

#endif // #ifndef __VOCABULARY_HPP
