#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

#include "core/config/AppOptions.h"
#include "core/output/TableRenderer.h"
#include "core/random/ThemeAggregator.h"

/**
 * @file ResultSink.h
 * @brief 抽取结果的三种输出格式（表格、可读文本、CSV）。
 * @details 每种格式都提供 open / emit / close 三个操作，由 ResultSink 变体统一分发，
 *          抽样循环无需知道具体格式。
 */

/**
 * @brief 输出失败（通常是流写入失败）时抛出的错误类型。
 */
class SinkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief 表格输出：收集所有行，close 时一次性渲染。
 */
class TableSink {
public:
  TableSink(std::ostream& out, std::size_t maxWidth);

  void open();
  void emit(const std::string& song, const std::string& showTitle, ThemeCategory category);
  void close();

  const TableRenderer& table() const { return table_; }

private:
  std::ostream& out_;
  TableRenderer table_;
};

/**
 * @brief 可读文本输出：每条结果一行 "<主题曲> [<类别>] from <番剧标题>"。
 */
class ReadableSink {
public:
  explicit ReadableSink(std::ostream& out);

  void open() {}
  void emit(const std::string& song, const std::string& showTitle, ThemeCategory category);
  void close() {}

private:
  std::ostream& out_;
};

/**
 * @brief CSV 输出：表头 Song,Show,Type，之后每条结果一行并立即刷新。
 */
class CsvSink {
public:
  explicit CsvSink(std::ostream& out);

  void open();
  void emit(const std::string& song, const std::string& showTitle, ThemeCategory category);
  void close() {}

private:
  void writeRecord(const std::string& a, const std::string& b, const std::string& c);

  std::ostream& out_;
};

/// 三种输出格式的标签联合。
using ResultSink = std::variant<TableSink, ReadableSink, CsvSink>;

/**
 * @brief 按输出模式构造对应的 ResultSink。
 * @param mode 输出格式。
 * @param tableWidth 表格宽度；为空时取终端宽度，仍不可得时使用 terminal::kFallbackWidth。
 * @param out 结果写入的流，生命周期须覆盖 sink。
 */
ResultSink makeSink(OutputMode mode, std::optional<std::size_t> tableWidth, std::ostream& out);

/**
 * @brief 写入表头（若该格式有表头）。
 * @throws SinkError 写入失败。
 */
void openSink(ResultSink& sink);

/**
 * @brief 追加一行结果。
 * @throws SinkError 写入失败。
 */
void emitToSink(ResultSink& sink, const std::string& song, const std::string& showTitle,
                ThemeCategory category);

/**
 * @brief 结束输出：表格在此渲染，其它格式无操作。
 * @throws SinkError 写入失败。
 */
void closeSink(ResultSink& sink);

/**
 * @brief 按 RFC 4180 规则转义 CSV 字段。
 * @details 仅当字段包含逗号、双引号、CR 或 LF 时加引号，内部双引号加倍。
 */
std::string csvEscape(const std::string& field);
