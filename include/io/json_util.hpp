#pragma once
#include <string>

#include <nlohmann/json.hpp>

namespace fuelroute::io {

// 读整个文件；打不开抛 std::runtime_error（带路径）
std::string ReadAllText(const std::string& path);

// 文件不存在返回空串
std::string ReadAllTextIfExists(const std::string& path);

// 解析失败抛 std::runtime_error，hint 用于定位是哪个文件
nlohmann::json ParseJson(const std::string& text, const std::string& hint);

// obj[key] 存在时必须是数字，否则抛 std::runtime_error；不存在返回 fallback
double GetNumber(const nlohmann::json& obj, const char* key, double fallback, const std::string& hint);

// obj[key] 存在时必须是字符串
std::string GetString(const nlohmann::json& obj, const char* key, const std::string& fallback,
                      const std::string& hint);

// obj[key] 存在时必须是 object；不存在返回空 object
nlohmann::json GetObject(const nlohmann::json& obj, const char* key, const std::string& hint);

} // namespace fuelroute::io
