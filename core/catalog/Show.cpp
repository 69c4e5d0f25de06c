#include "core/catalog/Show.h"

#include <nlohmann/json.hpp>

#include "core/catalog/CatalogError.h"

/**
 * @file Show.cpp
 * @brief Show 的 JSON 反序列化。
 */

namespace {

using json = nlohmann::json;

/**
 * @brief 在主键名与别名之间查找字段。
 * @return 找到的节点指针；两者都不存在时返回 nullptr。
 * @throws CatalogError 主键名与别名同时出现时抛出。
 */
const json* findWithAlias(const json& j, const std::string& key, const std::string& alias) {
  auto keyIt = j.find(key);
  auto aliasIt = j.find(alias);
  if (keyIt != j.end() && aliasIt != j.end()) {
    throw CatalogError("duplicate field '" + key + "' (also given as '" + alias + "')");
  }
  if (keyIt != j.end()) {
    return &*keyIt;
  }
  if (aliasIt != j.end()) {
    return &*aliasIt;
  }
  return nullptr;
}

/// 读取可选字段，不存在时返回 nullptr。
const json* findOptional(const json& j, const std::string& key) {
  auto it = j.find(key);
  return it != j.end() ? &*it : nullptr;
}

/// 读取可选的字符串数组，缺省为空列表。
std::vector<std::string> readThemeList(const json* node, const std::string& field) {
  if (node == nullptr || node->is_null()) {
    return {};
  }
  if (!node->is_array()) {
    throw CatalogError("field '" + field + "' must be an array of strings");
  }
  std::vector<std::string> themes;
  themes.reserve(node->size());
  for (const auto& item : *node) {
    if (!item.is_string()) {
      throw CatalogError("field '" + field + "' must be an array of strings");
    }
    themes.push_back(item.get<std::string>());
  }
  return themes;
}

} // namespace

void from_json(const json& j, Show& show) {
  if (!j.is_object()) {
    throw CatalogError(std::string("show must be an object, got ") + j.type_name());
  }

  const json* id = findWithAlias(j, "id", "mal_id");
  if (id == nullptr) {
    throw CatalogError("missing field 'id'");
  }
  if (!id->is_number_unsigned()) {
    throw CatalogError("field 'id' must be an unsigned integer");
  }
  show.id = id->get<ShowId>();

  const json* title = findOptional(j, "title");
  if (title == nullptr) {
    throw CatalogError("missing field 'title'");
  }
  if (!title->is_string()) {
    throw CatalogError("field 'title' must be a string");
  }
  show.title = title->get<std::string>();

  const json* url = findOptional(j, "url");
  if (url == nullptr || url->is_null()) {
    show.url.reset();
  } else if (url->is_string()) {
    show.url = url->get<std::string>();
  } else {
    throw CatalogError("field 'url' must be a string or null");
  }

  show.opening_themes = readThemeList(findOptional(j, "opening_themes"), "opening_themes");
  show.ending_themes = readThemeList(findOptional(j, "ending_themes"), "ending_themes");
  show.other_soundtrack =
      readThemeList(findWithAlias(j, "other_soundtrack", "soundtrack"), "other_soundtrack");
}
