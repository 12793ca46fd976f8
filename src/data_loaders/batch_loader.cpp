#include <algorithm>
#include <glog/logging.h>
#include "batch_loader.hpp"

bool BatchLoader::GetBatch(TENSOR_ARY &data, TENSOR_ARY &targets,
		torch::Device device) {
	if (!_LoadBatch(data, targets)) {
		return false;
	}
	for (auto &d : data) {
		if (d.device() != device) {
			d = d.to(device);
		}
	}
	for (auto &t : targets) {
		if (t.device() != device) {
			t = t.to(device);
		}
	}
	return true;
}

torch::Tensor PadIdSequences(const std::vector<ID_SEQ> &seqs, int64_t nPadId) {
	CHECK(!seqs.empty());
	uint64_t nMaxLen = 0;
	for (const auto &seq : seqs) {
		nMaxLen = std::max<uint64_t>(nMaxLen, seq.size());
	}
	std::vector<int64_t> dataBuf(seqs.size() * nMaxLen, nPadId);
	for (uint64_t i = 0; i < seqs.size(); ++i) {
		std::copy(seqs[i].begin(), seqs[i].end(),
				dataBuf.begin() + i * nMaxLen);
	}
	return torch::tensor(dataBuf).reshape({(int64_t)seqs.size(),
			(int64_t)nMaxLen});
}
