#ifndef __BATCH_ACCUMULATOR_HPP
#define __BATCH_ACCUMULATOR_HPP

#include <memory>
#include <string>
#include "types.hpp"
#include "capacity_policies/basic_policy.hpp"

// In-progress batch of example positions with per-side running maximum
// lengths. Reset() clears it for reuse without releasing storage.
class BatchAccumulator {
public:
	BatchAccumulator(uint64_t nCapacity, const std::string &strPolicy);

	void Reset(uint64_t nSideCnt);

	// Appends nPos if it fits under the capacity policy. The accumulator is
	// left unchanged when the example is rejected.
	bool Add(uint64_t nPos, const LEN_ARY &lens);

	// Appends nPos regardless of capacity
	void ForceAdd(uint64_t nPos, const LEN_ARY &lens);

	uint64_t Size() const;

	bool Empty() const;

	uint64_t Capacity() const;

	const POS_ARY& Positions() const;

	const LEN_ARY& MaxLengths() const;

private:
	void __Append(uint64_t nPos, const LEN_ARY &lens);

private:
	uint64_t m_nCapacity = 0;
	std::unique_ptr<BasicPolicy> m_pPolicy;
	POS_ARY m_Positions;
	LEN_ARY m_MaxLens;
};

#endif // #ifndef __BATCH_ACCUMULATOR_HPP
