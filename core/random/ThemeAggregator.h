#pragma once

#include <string>
#include <vector>

#include "core/catalog/Show.h"

/**
 * @file ThemeAggregator.h
 * @brief 主题曲汇总与分类。
 */

/// 主题曲类别。
enum class ThemeCategory {
  Opening, ///< 片头曲
  Ending,  ///< 片尾曲
  Other    ///< 其它原声
};

/**
 * @brief 将番剧的三类主题曲按 OP、ED、其它 的顺序拼接为一个列表。
 * @details 空列表不参与拼接；顺序与重复项均保留。
 */
std::vector<std::string> aggregateThemes(const Show& show);

/**
 * @brief 判断主题曲属于哪一类。
 * @details 依次在片头曲、片尾曲列表中查找，先命中者优先；都不包含时归为 Other。
 *          同一字符串同时出现在 OP 与 ED 中时总是返回 Opening。
 */
ThemeCategory classifyTheme(const std::string& theme, const Show& show);

/// 输出用的类别简称：OP、ED、ST。
const char* themeCategoryLabel(ThemeCategory category);
