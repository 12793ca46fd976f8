#include <glog/logging.h>
#include "argman.hpp"

ArgMan g_MainArgs;

void ArgMan::Register(std::string strName, ArgMan::BASE_PARSER parser) {
	auto &regMap = GetRegMap();
	CHECK_EQ(regMap.count(strName), 0) << "Duplicated argument: " << strName;
	regMap[std::move(strName)] = std::move(parser);
}

std::map<std::string, ArgMan::BASE_PARSER>& ArgMan::GetRegMap() {
	return m_RegMap;
}

void ParseArgsFromJson(const nlohmann::json &jCfg, ArgMan &argman) {
	CHECK(jCfg.is_object()) << "Config must be a json object";
	auto &regMap = argman.GetRegMap();
	for (auto &jArg : jCfg.items()) {
		auto iParser = regMap.find(jArg.key());
		if (iParser != regMap.end()) {
			iParser->second(jArg.value());
		} else {
			VLOG(1) << "Ignored unknown argument: " << jArg.key();
		}
	}
}

template<>
void Parser(const nlohmann::json &jValue, uint64_t &val) {
	CHECK(jValue.is_number_unsigned() || (jValue.is_number_integer()
			&& jValue.get<int64_t>() >= 0)) << "Expected unsigned: " << jValue;
	val = jValue.get<uint64_t>();
}

template<>
void Parser(const nlohmann::json &jValue, int32_t &val) {
	CHECK(jValue.is_number_integer()) << "Expected integer: " << jValue;
	val = jValue.get<int32_t>();
}

template<>
void Parser(const nlohmann::json &jValue, bool &val) {
	CHECK(jValue.is_boolean()) << "Expected boolean: " << jValue;
	val = jValue.get<bool>();
}

template<>
void Parser(const nlohmann::json &jValue, std::string &val) {
	CHECK(jValue.is_string()) << "Expected string: " << jValue;
	val = jValue.get<std::string>();
}

template<>
void Parser(const nlohmann::json &jValue, std::vector<std::string> &val) {
	CHECK(jValue.is_array()) << "Expected string array: " << jValue;
	val.clear();
	for (const auto &jItem : jValue) {
		CHECK(jItem.is_string()) << "Expected string: " << jItem;
		val.emplace_back(jItem.get<std::string>());
	}
}
