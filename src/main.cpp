#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

#include <boost/filesystem.hpp>
#include <glog/logging.h>

#include "utils.hpp"
#include "argman.hpp"
#include "creator.hpp"
#include "vocabulary.hpp"
#include "data_loaders/batch_loader.hpp"

namespace bfs = boost::filesystem;

struct PASS_STATS {
	uint64_t nBatches = 0;
	uint64_t nExamples = 0;
	uint64_t nMaxBatch = 0;
	// Real ids (markers included) and padded cells, summed over all sides
	uint64_t nTokens = 0;
	uint64_t nCells = 0;

	void Update(const TENSOR_ARY &data) {
		CHECK(!data.empty());
		uint64_t nBatchSize = data[0].size(0);
		++nBatches;
		nExamples += nBatchSize;
		nMaxBatch = std::max(nMaxBatch, nBatchSize);
		for (const auto &tSide : data) {
			nCells += tSide.numel();
			nTokens += tSide.ne(Vocabulary::PAD_ID).sum().item<int64_t>();
		}
	}

	std::string Format() const {
		std::ostringstream oss;
		oss << "batches=" << nBatches << ", examples=" << nExamples
			<< ", max_batch=" << nMaxBatch << ", tokens=" << nTokens
			<< ", padded=" << nCells << ", efficiency=" << std::fixed
			<< std::setprecision(4) << (nCells ? (double)nTokens / nCells : 0.);
		return oss.str();
	}
};

int main(int nArgCnt, const char *ppArgs[]) {
	FLAGS_alsologtostderr = 1;
	google::InitGoogleLogging(ppArgs[0]);

	// Arguments Definitions
	// -------------------------------------------------------------------------
	Arg<std::string> argConfName("name");
	Arg<std::string> argDevice("device", "CPU");
	Arg<uint64_t> argDeviceID("device_id", 0);
	Arg<int32_t> argRandomSeed("random_seed", -1);
	Arg<uint64_t> argMaxEpoch("max_epoch", 1);
	Arg<std::string> argLogPath("log_path");
	Arg<uint64_t> argLogIters("log_iters", 0);
	Arg<nlohmann::json> argTrainData("train_data");

	// Configure Parsing and Arguments Checking
	// -------------------------------------------------------------------------
	CHECK_GT(nArgCnt, 1) << "Usage: " << ppArgs[0]
			<< " <config.json> [json_overrides]";
	auto jConf = LoadJsonFile(ppArgs[1]);
	ParseArgsFromJson(jConf);
	if (argConfName().empty()) {
		bfs::path confFile(ppArgs[1]);
		argConfName.Set(confFile.stem().string());
	}
	if (nArgCnt > 2) {
		auto jConfExt = nlohmann::json::parse(ppArgs[2]);
		ParseArgsFromJson(jConfExt);
		for (auto jItem : jConfExt.items()) {
			jConf[jItem.key()] = jItem.value();
		}
	}
	CHECK(argTrainData().is_object()) << "train_data must be an object";

	// Log Subsystem Initialization
	// -------------------------------------------------------------------------
	if (!argLogPath().empty()) {
		bfs::path logPath(argLogPath());
		CHECK(bfs::is_directory(logPath)) << argLogPath();
		std::string strLeafName = argConfName() + ".log.";
		std::string strLogBaseName = (logPath / strLeafName).string();
		for (int i = 0; i < google::NUM_SEVERITIES; ++i) {
			google::SetLogDestination(i, strLogBaseName.c_str());
			google::SetLogSymlink(i, "");
		}
	}
	LOG(INFO) << "Config File:\n" << jConf.dump(4);

	// Random Seed
	// -------------------------------------------------------------------------
	if (argRandomSeed() < 0) {
		std::random_device rd;
		argRandomSeed.Set(rd() & 0x7FFFFFFF);
	}
	LOG(INFO) << "random_seed=" << argRandomSeed();
	GetRG().seed(argRandomSeed());

	// Device Initialization
	// -------------------------------------------------------------------------
	torch::Device device = torch::kCPU;
	if (argDevice() != "CPU") {
		if (argDevice() == "GPU" || argDevice() == "CUDA") {
			CHECK(torch::cuda::is_available());
			device = torch::Device(torch::kCUDA, argDeviceID());
		} else {
			LOG(FATAL) << "Unrecognized device: " << argDevice();
		}
	}

	// Data Loader Preparation
	// -------------------------------------------------------------------------
	auto tic = std::chrono::steady_clock::now();
	auto pTrainLdr = Creator<BatchLoader>::Create(argTrainData());
	std::chrono::duration<double> loadTime =
			std::chrono::steady_clock::now() - tic;
	LOG(INFO) << "Loaded " << pTrainLdr->Size() << " examples ("
			<< std::fixed << std::setprecision(2) << loadTime.count()
			<< " seconds)";

	// Main Loop
	// -------------------------------------------------------------------------
	for (uint64_t nEpoch = 1; nEpoch <= argMaxEpoch(); ++nEpoch) {
		TENSOR_ARY data, targets;
		PASS_STATS stats;
		pTrainLdr->ResetCursor();
		for (uint64_t nIter = 1; pTrainLdr->GetBatch(
				data, targets, device); ++nIter) {
			stats.Update(data);
			if (argLogIters() > 0 && nIter % argLogIters() == 0) {
				LOG(INFO) << "iter=" << nIter << ", batch=" << data[0].size(0)
						<< ", lengths=" << data[0].size(1);
			}
		}
		LOG(INFO) << "epoch " << nEpoch << ": " << stats.Format();
	}
	return 0;
}
