#include <algorithm>
#include "../creator.hpp"
#include "basic_policy.hpp"

// Charges a batch as (longest example so far) x (number of examples) on
// every side; any single side over capacity rejects the candidate.
class TokenPolicy : public BasicPolicy {
public:
	bool Fits(uint64_t nCapacity, uint64_t nCurSize,
			const LEN_ARY &maxLens, const LEN_ARY &lens) const override {
		for (uint64_t i = 0; i < lens.size(); ++i) {
			if (std::max(maxLens[i], lens[i]) * (nCurSize + 1) > nCapacity) {
				return false;
			}
		}
		return true;
	}
};

REGISTER_CREATOR(BasicPolicy, TokenPolicy, "tokens");
