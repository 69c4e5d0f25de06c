#pragma once

#include <cstddef>
#include <optional>

/**
 * @file Terminal.h
 * @brief 查询标准输出所连接终端的尺寸。
 */

namespace terminal {

/// 无法获取终端宽度时表格使用的默认宽度。
constexpr std::size_t kFallbackWidth = 60;

/**
 * @brief 获取标准输出终端的列数。
 * @return 标准输出不是终端或查询失败时返回 std::nullopt。
 */
std::optional<std::size_t> outputWidth();

} // namespace terminal
