#include "core/config/AppOptions.h"

/**
 * @file AppOptions.cpp
 * @brief 配置枚举与字符串之间的转换。
 */

std::string outputModeToString(OutputMode mode) {
  switch (mode) {
    case OutputMode::Table: return "table";
    case OutputMode::Readable: return "readable";
    case OutputMode::Csv: return "csv";
  }
  return "readable"; // Default
}

std::optional<TimestampMode> timestampModeFromString(const std::string& str) {
  if (str == "none") return TimestampMode::None;
  if (str == "sec") return TimestampMode::Sec;
  if (str == "ms") return TimestampMode::Ms;
  if (str == "ns") return TimestampMode::Ns;
  return std::nullopt;
}
