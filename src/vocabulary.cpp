#include <glog/logging.h>
#include "utils.hpp"
#include "vocabulary.hpp"

constexpr int64_t Vocabulary::PAD_ID;
constexpr int64_t Vocabulary::UNK_ID;
constexpr int64_t Vocabulary::BOS_ID;
constexpr int64_t Vocabulary::EOS_ID;
const char *const Vocabulary::PAD_STR = "<pad>";
const char *const Vocabulary::UNK_STR = "<unk>";
const char *const Vocabulary::BOS_STR = "<bos>";
const char *const Vocabulary::EOS_STR = "<eos>";

Vocabulary::Vocabulary(std::vector<std::string> tokens)
		: m_Tokens(std::move(tokens)) {
	const char *reserved[] = {PAD_STR, UNK_STR, BOS_STR, EOS_STR};
	CHECK_GE(m_Tokens.size(), 4u) << "Vocab must start with "
			<< PAD_STR << " " << UNK_STR << " " << BOS_STR << " " << EOS_STR;
	for (int64_t i = 0; i < 4; ++i) {
		CHECK_EQ(m_Tokens[i], reserved[i]) << reserved[i]
				<< " must exist in vocab with id=" << i;
	}
	m_TokenIds.reserve(m_Tokens.size());
	for (uint64_t i = 0; i < m_Tokens.size(); ++i) {
		if (!m_TokenIds.emplace(m_Tokens[i], (int64_t)i).second) {
			LOG(WARNING) << "Duplicated vocab entry \"" << m_Tokens[i]
					<< "\" at id=" << i << ", keeping id="
					<< m_TokenIds[m_Tokens[i]];
		}
	}
}

std::shared_ptr<const Vocabulary> Vocabulary::LoadFromFile(
		const std::string &strFilename) {
	std::shared_ptr<const Vocabulary> pVocab(
			new Vocabulary(LoadFileLines(strFilename)));
	VLOG(1) << "Read Vocab (" << pVocab->Size() << " entries) from "
			<< strFilename;
	return pVocab;
}

uint64_t Vocabulary::Size() const {
	return m_Tokens.size();
}

int64_t Vocabulary::IdOf(const std::string &strToken) const {
	auto iTok = m_TokenIds.find(strToken);
	if (iTok == m_TokenIds.end()) {
		return UNK_ID;
	}
	return iTok->second;
}

const std::string& Vocabulary::TokenOf(int64_t nId) const {
	CHECK(ContainsId(nId)) << "Invalid id=" << nId << " for vocab size "
			<< m_Tokens.size();
	return m_Tokens[nId];
}

bool Vocabulary::ContainsId(int64_t nId) const {
	return nId >= 0 && (uint64_t)nId < m_Tokens.size();
}

bool Vocabulary::ContainsToken(const std::string &strToken) const {
	return m_TokenIds.count(strToken) != 0;
}

ID_SEQ Vocabulary::Encode(const std::string &strLine) const {
	ID_SEQ ids;
	for (const auto &strTok : SplitTokens(strLine)) {
		ids.push_back(IdOf(strTok));
	}
	return ids;
}

std::string Vocabulary::Decode(const ID_SEQ &ids) const {
	std::string strLine;
	for (uint64_t i = 0; i < ids.size(); ++i) {
		if (i > 0) {
			strLine.push_back(' ');
		}
		strLine += TokenOf(ids[i]);
	}
	return strLine;
}
