#ifndef __TYPES_HPP
#define __TYPES_HPP

#include <cstdint>
#include <vector>
#include <torch/torch.h>

using TENSOR_ARY = std::vector<torch::Tensor>;
using ID_SEQ = std::vector<int64_t>;
using POS_ARY = std::vector<uint64_t>;
using LEN_ARY = std::vector<uint64_t>;

struct CORPUS_BATCH {
	// Original example positions, in batch order
	POS_ARY positions;
	// sides[n][i] is [bos] + ids + [eos] of positions[i] on side n
	std::vector<std::vector<ID_SEQ>> sides;
};

#endif // #ifndef __TYPES_HPP
