#include <algorithm>
#include <glog/logging.h>
#include "creator.hpp"
#include "batch_accumulator.hpp"

BatchAccumulator::BatchAccumulator(uint64_t nCapacity,
		const std::string &strPolicy) : m_nCapacity(nCapacity) {
	CHECK(Creator<BasicPolicy>::Exists(strPolicy))
			<< "Bad batch_type option: " << strPolicy;
	CHECK_GT(m_nCapacity, 0) << "Batch capacity must be positive";
	m_pPolicy = Creator<BasicPolicy>::Create(strPolicy);
}

void BatchAccumulator::Reset(uint64_t nSideCnt) {
	m_Positions.clear();
	m_MaxLens.assign(nSideCnt, 0);
}

bool BatchAccumulator::Add(uint64_t nPos, const LEN_ARY &lens) {
	CHECK_EQ(lens.size(), m_MaxLens.size()) << "Side count mismatch";
	if (!m_pPolicy->Fits(m_nCapacity, m_Positions.size(), m_MaxLens, lens)) {
		return false;
	}
	__Append(nPos, lens);
	return true;
}

void BatchAccumulator::ForceAdd(uint64_t nPos, const LEN_ARY &lens) {
	CHECK_EQ(lens.size(), m_MaxLens.size()) << "Side count mismatch";
	__Append(nPos, lens);
}

uint64_t BatchAccumulator::Size() const {
	return m_Positions.size();
}

bool BatchAccumulator::Empty() const {
	return m_Positions.empty();
}

uint64_t BatchAccumulator::Capacity() const {
	return m_nCapacity;
}

const POS_ARY& BatchAccumulator::Positions() const {
	return m_Positions;
}

const LEN_ARY& BatchAccumulator::MaxLengths() const {
	return m_MaxLens;
}

void BatchAccumulator::__Append(uint64_t nPos, const LEN_ARY &lens) {
	m_Positions.push_back(nPos);
	for (uint64_t i = 0; i < lens.size(); ++i) {
		m_MaxLens[i] = std::max(m_MaxLens[i], lens[i]);
	}
}
