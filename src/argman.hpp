#ifndef __ARGMAN_HPP
#define __ARGMAN_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

class ArgMan {
public:
	using BASE_PARSER = std::function<void(const nlohmann::json &jValue)>;
	void Register(std::string strName, BASE_PARSER parser);
	std::map<std::string, BASE_PARSER>& GetRegMap();
private:
	std::map<std::string, BASE_PARSER> m_RegMap;
};

extern ArgMan g_MainArgs;

// Type mismatches surface as nlohmann::json::type_error
template<typename _Ty>
void Parser(const nlohmann::json &jValue, _Ty &val) {
	val = jValue.get<_Ty>();
}

template<>
void Parser(const nlohmann::json &jValue, uint64_t &val);

template<>
void Parser(const nlohmann::json &jValue, int32_t &val);

template<>
void Parser(const nlohmann::json &jValue, bool &val);

template<>
void Parser(const nlohmann::json &jValue, std::string &val);

template<>
void Parser(const nlohmann::json &jValue, std::vector<std::string> &val);

template<typename _Ty>
class Arg {
public:
	using PARSER = std::function<void(const nlohmann::json &jValue, _Ty &val)>;
	Arg(std::string strName, const _Ty &defVal, ArgMan &argman = g_MainArgs)
			: m_Parser(Parser<_Ty>) {
		m_Var = defVal;
		argman.Register(std::move(strName), std::bind(m_Parser,
				std::placeholders::_1, std::ref(m_Var)));
	}
	Arg(std::string strName, ArgMan &argman = g_MainArgs)
			: m_Var(), m_Parser(Parser<_Ty>) {
		argman.Register(std::move(strName), std::bind(m_Parser,
				std::placeholders::_1, std::ref(m_Var)));
	}
	Arg(const Arg&) = delete;
	Arg& operator = (const Arg&) = delete;
	void Set(const _Ty &val) {
		m_Var = val;
	}
	_Ty& operator()() {
		return m_Var;
	}
	const _Ty& operator()() const {
		return m_Var;
	}
private:
	_Ty m_Var;
	PARSER m_Parser;
};

void ParseArgsFromJson(const nlohmann::json &jCfg, ArgMan &argman = g_MainArgs);

#endif // __ARGMAN_HPP
