#ifndef _UTILS_HPP
#define _UTILS_HPP

#include <random>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

std::mt19937& GetRG(uint32_t nSeed = 0);

bool LoadFileContent(const std::string &strFn, std::string &strFileBuf);

std::vector<std::string> LoadFileLines(const std::string &strFn);

std::vector<std::string> SplitTokens(const std::string &strLine);

nlohmann::json LoadJsonFile(const std::string &strFilename);

#endif // _UTILS_HPP
