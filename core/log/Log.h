#pragma once

#include <algorithm>
#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <spdlog/spdlog.h>

#include "core/config/AppOptions.h"

/**
 * @file Log.h
 * @brief 日志初始化工具。
 */

/// 日志器名称。
inline constexpr const char* kLoggerName = "random-show-themes";

/**
 * @brief 将 -v 次数映射为日志级别。
 *
 * 不加 -v 时输出警告与错误，-v 增加到 info，-vv 为 debug，-vvv 及以上为 trace。
 */
inline spdlog::level::level_enum levelForVerbosity(int verbosity) {
  static constexpr spdlog::level::level_enum kLevels[] = {
      spdlog::level::warn, spdlog::level::info, spdlog::level::debug, spdlog::level::trace};
  const int index = std::clamp(verbosity, 0, 3);
  return kLevels[index];
}

/**
 * @brief 根据时间戳精度生成输出格式。
 */
inline std::string patternForTimestamp(TimestampMode mode) {
  switch (mode) {
    case TimestampMode::Sec: return "[%Y-%m-%dT%H:%M:%S] [%^%l%$] %v";
    case TimestampMode::Ms: return "[%Y-%m-%dT%H:%M:%S.%e] [%^%l%$] %v";
    case TimestampMode::Ns: return "[%Y-%m-%dT%H:%M:%S.%F] [%^%l%$] %v";
    case TimestampMode::None: break;
  }
  return "[%^%l%$] %v";
}

/**
 * @brief 按日志配置创建日志器。
 *
 * 日志只写到 stderr，stdout 保留给结果输出。日志器不注册到 spdlog 全局表，
 * 由调用方显式传递给需要它的组件。--quiet 时级别为 off。
 */
inline std::shared_ptr<spdlog::logger> createLogger(const LogOptions& options) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_pattern(patternForTimestamp(options.timestamp));

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
  logger->set_level(options.quiet ? spdlog::level::off : levelForVerbosity(options.verbosity));
  logger->flush_on(spdlog::level::warn);
  return logger;
}

/**
 * @brief 创建一个丢弃所有消息的日志器，供测试和未指定日志器的组件使用。
 */
inline std::shared_ptr<spdlog::logger> createNullLogger() {
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, spdlog::sinks_init_list{});
  logger->set_level(spdlog::level::off);
  return logger;
}
