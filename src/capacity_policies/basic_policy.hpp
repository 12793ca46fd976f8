#ifndef __BASIC_POLICY_HPP
#define __BASIC_POLICY_HPP

#include "../types.hpp"

// Decides whether one more example fits into an in-progress batch.
class BasicPolicy {
public:
	virtual ~BasicPolicy() = default;

	// maxLens: per-side maximum length of the accepted examples so far
	// lens: per-side lengths of the candidate example
	virtual bool Fits(uint64_t nCapacity, uint64_t nCurSize,
			const LEN_ARY &maxLens, const LEN_ARY &lens) const = 0;
};

#endif // #ifndef __BASIC_POLICY_HPP
