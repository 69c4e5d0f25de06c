#pragma once

#include <filesystem>

#include "core/catalog/CatalogError.h"
#include "core/catalog/Show.h"

/**
 * @file CatalogLoader.h
 * @brief 从 JSON 文件加载番剧目录与候选ID列表。
 */

namespace catalog {

/**
 * @brief 加载番剧目录。
 * @param path JSON 文件路径，顶层为对象，键为十进制番剧ID，值为 Show 对象。
 * @return 以ID为键的目录（可能为空，是否允许为空由调用方决定）。
 * @throws CatalogError 文件无法打开、JSON 非法、键不是无符号整数或条目结构不符时抛出。
 */
ShowCatalog loadCatalog(const std::filesystem::path& path);

/**
 * @brief 加载候选ID列表。
 * @param path JSON 文件路径，顶层为无符号整数数组。
 * @return 保持文件顺序的ID列表，重复项原样保留。
 * @throws CatalogError 文件无法打开、JSON 非法或元素不是无符号整数时抛出。
 */
CandidateList loadCandidateList(const std::filesystem::path& path);

} // namespace catalog
