#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

/**
 * @file Show.h
 * @brief 番剧条目及其主题曲列表的数据定义。
 */

/// 番剧在目录中的唯一标识。
using ShowId = std::uint64_t;

/**
 * @brief 目录中的一部番剧，包含三类主题曲。
 * @details 三个主题曲列表均保持原始顺序，允许重复。
 *          三个列表都为空的番剧永远不会被抽中。
 */
struct Show {
  ShowId id{0};                              ///< 番剧ID（JSON 中可写作 mal_id）
  std::string title;                         ///< 番剧标题
  std::optional<std::string> url;            ///< 参考链接，可为空
  std::vector<std::string> opening_themes;   ///< 片头曲（OP）
  std::vector<std::string> ending_themes;    ///< 片尾曲（ED）
  std::vector<std::string> other_soundtrack; ///< 其它原声（JSON 中可写作 soundtrack）
};

/// 以番剧ID为键的完整目录，加载后只读。
using ShowCatalog = std::unordered_map<ShowId, Show>;

/// 允许参与抽取的番剧ID子集，可包含重复项或目录中不存在的ID。
using CandidateList = std::vector<ShowId>;

/**
 * @brief 从 JSON 对象解析 Show。
 * @details 未知字段会被忽略；三个主题曲列表缺省为空。
 * @throws CatalogError 字段类型不符或缺少必填字段时抛出。
 */
void from_json(const nlohmann::json& j, Show& show);
