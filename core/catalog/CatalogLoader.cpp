#include "core/catalog/CatalogLoader.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

/**
 * @file CatalogLoader.cpp
 * @brief 读取并校验输入 JSON 文件。
 */

namespace {

using json = nlohmann::json;

/**
 * @brief 打开并解析 JSON 文件。
 * @throws CatalogError 文件无法打开或解析失败。
 */
json readJsonFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw CatalogError("failed to open '" + path.string() + "'");
  }
  try {
    json parsed;
    in >> parsed;
    return parsed;
  } catch (const json::exception& ex) {
    throw CatalogError("failed to parse '" + path.string() + "': " + ex.what());
  }
}

/**
 * @brief 将对象键解析为番剧ID。
 * @details 只接受纯十进制数字，拒绝符号、空白与溢出。
 */
bool parseShowId(const std::string& key, ShowId& out) {
  if (key.empty()) {
    return false;
  }
  for (char c : key) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long value = std::strtoull(key.c_str(), &end, 10);
  if (errno == ERANGE || end != key.c_str() + key.size()) {
    return false;
  }
  out = static_cast<ShowId>(value);
  return true;
}

} // namespace

namespace catalog {

ShowCatalog loadCatalog(const std::filesystem::path& path) {
  const json root = readJsonFile(path);
  if (!root.is_object()) {
    throw CatalogError("'" + path.string() + "' must contain a JSON object keyed by show id");
  }

  ShowCatalog shows;
  shows.reserve(root.size());
  for (auto it = root.begin(); it != root.end(); ++it) {
    ShowId id = 0;
    if (!parseShowId(it.key(), id)) {
      throw CatalogError("'" + path.string() + "': key '" + it.key() + "' is not a valid show id");
    }
    try {
      shows.emplace(id, it.value().get<Show>());
    } catch (const CatalogError& ex) {
      throw CatalogError("'" + path.string() + "': entry '" + it.key() + "': " + ex.what());
    } catch (const json::exception& ex) {
      throw CatalogError("'" + path.string() + "': entry '" + it.key() + "': " + ex.what());
    }
  }
  return shows;
}

CandidateList loadCandidateList(const std::filesystem::path& path) {
  const json root = readJsonFile(path);
  if (!root.is_array()) {
    throw CatalogError("'" + path.string() + "' must contain a JSON array of show ids");
  }

  CandidateList ids;
  ids.reserve(root.size());
  for (std::size_t index = 0; index < root.size(); ++index) {
    const auto& item = root[index];
    if (!item.is_number_unsigned()) {
      throw CatalogError("'" + path.string() + "': element " + std::to_string(index) +
                         " is not an unsigned integer");
    }
    ids.push_back(item.get<ShowId>());
  }
  return ids;
}

} // namespace catalog
