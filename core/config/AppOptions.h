#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

/**
 * @file AppOptions.h
 * @brief 一次运行所需的全部配置项。
 */

/**
 * @brief 结果输出格式。
 */
enum class OutputMode {
  Table,    ///< 带边框的三列表格，循环结束后统一渲染。
  Readable, ///< 每条结果一行的可读文本。
  Csv       ///< CSV，带表头，逐行刷新。
};

/**
 * @brief 日志行前缀的时间戳精度。
 */
enum class TimestampMode {
  None, ///< 不输出时间戳。
  Sec,  ///< 精确到秒。
  Ms,   ///< 精确到毫秒。
  Ns    ///< 精确到纳秒。
};

/**
 * @brief 日志相关配置，显式传入运行入口，不依赖全局状态。
 */
struct LogOptions {
  int verbosity{0};                          ///< -v 出现次数；0 时只输出警告与错误。
  bool quiet{false};                         ///< 关闭全部日志输出。
  TimestampMode timestamp{TimestampMode::None}; ///< 时间戳精度。
};

/**
 * @brief 存储一次运行的所有配置项。
 */
struct AppOptions {
  std::filesystem::path dictionaryPath; ///< 番剧目录 JSON 文件路径。
  std::filesystem::path listPath;       ///< 候选ID列表 JSON 文件路径。
  std::size_t resultCount{1};           ///< 请求的结果数量（正整数）。
  bool hardFail{false};                 ///< 任何失败都以退出码 1 结束。

  OutputMode outputMode{OutputMode::Readable}; ///< 输出格式。
  /**
   * @brief 表格总宽度。
   * @details 仅在 Table 模式下有效；未指定时取终端宽度，无法获取时回退为 60。
   */
  std::optional<std::size_t> tableWidth;
  std::optional<std::uint32_t> seed; ///< 随机种子；未指定时使用 std::random_device。

  LogOptions logging; ///< 日志配置。
};

std::string outputModeToString(OutputMode mode);

/**
 * @brief 将字符串（none/sec/ms/ns）转换为 TimestampMode。
 * @return 无法识别时返回 std::nullopt。
 */
std::optional<TimestampMode> timestampModeFromString(const std::string& str);
