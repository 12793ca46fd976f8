#include "../creator.hpp"
#include "basic_policy.hpp"

class SentencePolicy : public BasicPolicy {
public:
	bool Fits(uint64_t nCapacity, uint64_t nCurSize,
			const LEN_ARY&, const LEN_ARY&) const override {
		return nCurSize < nCapacity;
	}
};

REGISTER_CREATOR(BasicPolicy, SentencePolicy, "sentences");
