#include "io/json_util.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace fuelroute::io {

std::string ReadAllText(const std::string& path) {
  std::ifstream ifs(path, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

std::string ReadAllTextIfExists(const std::string& path) {
  if (!fs::exists(path)) return {};
  return ReadAllText(path);
}

nlohmann::json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return nlohmann::json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

double GetNumber(const nlohmann::json& obj, const char* key, double fallback, const std::string& hint) {
  if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) return fallback;
  const auto& v = obj.at(key);
  if (!v.is_number()) {
    throw std::runtime_error(hint + ": \"" + key + "\" must be a number");
  }
  return v.get<double>();
}

std::string GetString(const nlohmann::json& obj, const char* key, const std::string& fallback,
                      const std::string& hint) {
  if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) return fallback;
  const auto& v = obj.at(key);
  if (!v.is_string()) {
    throw std::runtime_error(hint + ": \"" + key + "\" must be a string");
  }
  return v.get<std::string>();
}

nlohmann::json GetObject(const nlohmann::json& obj, const char* key, const std::string& hint) {
  if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) return nlohmann::json::object();
  const auto& v = obj.at(key);
  if (!v.is_object()) {
    throw std::runtime_error(hint + ": \"" + key + "\" must be an object");
  }
  return v;
}

} // namespace fuelroute::io
