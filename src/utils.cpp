#include <fstream>
#include <sstream>
#include <glog/logging.h>
#include "utils.hpp"

std::mt19937& GetRG(uint32_t nSeed) {
	static std::mt19937 rg(nSeed);
	return rg;
}

bool LoadFileContent(const std::string &strFn, std::string &strFileBuf) {
	std::ifstream inFile(strFn, std::ios::binary);
	if (!inFile.is_open()) {
		return false;
	}
	inFile.seekg(0, std::ios::end);
	strFileBuf.resize((uint64_t)inFile.tellg());
	inFile.seekg(0, std::ios::beg);
	inFile.read(const_cast<char*>(strFileBuf.data()), strFileBuf.size());
	CHECK(inFile.good()) << strFn;
	return true;
}

std::vector<std::string> LoadFileLines(const std::string &strFn) {
	std::string strFileContent;
	CHECK(LoadFileContent(strFn, strFileContent))
			<< "Cannot read file " << strFn;
	std::vector<std::string> lines;
	std::istringstream iss(strFileContent);
	for (std::string strLine; std::getline(iss, strLine); ) {
		if (!strLine.empty() && strLine.back() == '\r') {
			strLine.pop_back();
		}
		lines.emplace_back(std::move(strLine));
	}
	return lines;
}

std::vector<std::string> SplitTokens(const std::string &strLine) {
	std::vector<std::string> tokens;
	std::istringstream iss(strLine);
	for (std::string strTok; iss >> strTok; ) {
		tokens.emplace_back(std::move(strTok));
	}
	return tokens;
}

nlohmann::json LoadJsonFile(const std::string &strFilename) {
	std::string strConfContent;
	CHECK(LoadFileContent(strFilename, strConfContent)) << strFilename;
	return nlohmann::json::parse(strConfContent);
}
