#ifndef __BATCH_LOADER_HPP
#define __BATCH_LOADER_HPP

#include <string>
#include <vector>
#include <torch/torch.h>
#include <nlohmann/json.hpp>
#include "../types.hpp"

class BatchLoader {
public:
	BatchLoader() = default;
	virtual ~BatchLoader() = default;

	virtual void Initialize(const nlohmann::json &jConf) = 0;
	// Number of examples available to a pass
	virtual uint64_t Size() const = 0;
	virtual void ResetCursor() = 0;
	virtual bool GetBatch(TENSOR_ARY &data, TENSOR_ARY &targets,
			torch::Device device);

protected:
	virtual bool _LoadBatch(TENSOR_ARY &data, TENSOR_ARY &targets) = 0;
};

// [B, L] int64 tensor, rows right-padded with nPadId up to the longest row
torch::Tensor PadIdSequences(const std::vector<ID_SEQ> &seqs, int64_t nPadId);

#endif //__BATCH_LOADER_HPP
