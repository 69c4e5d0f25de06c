#include "core/output/ResultSink.h"

#include <utility>

#include "core/output/Terminal.h"

/**
 * @file ResultSink.cpp
 * @brief 三种输出格式的实现与分发。
 */

namespace {

/// 写入后检查流状态，失败即抛出 SinkError。
void ensureWritable(std::ostream& out, const char* what) {
  if (!out) {
    throw SinkError(std::string("failed to write ") + what);
  }
}

} // namespace

TableSink::TableSink(std::ostream& out, std::size_t maxWidth) : out_(out), table_(maxWidth) {}

void TableSink::open() {
  table_.addRow({"Song", "Show", "Type"});
}

void TableSink::emit(const std::string& song, const std::string& showTitle, ThemeCategory category) {
  table_.addRow({song, showTitle, themeCategoryLabel(category)});
}

void TableSink::close() {
  out_ << table_.render();
  out_.flush();
  ensureWritable(out_, "table");
}

ReadableSink::ReadableSink(std::ostream& out) : out_(out) {}

void ReadableSink::emit(const std::string& song, const std::string& showTitle, ThemeCategory category) {
  out_ << song << " [" << themeCategoryLabel(category) << "] from " << showTitle << '\n';
  out_.flush();
  ensureWritable(out_, "result line");
}

CsvSink::CsvSink(std::ostream& out) : out_(out) {}

void CsvSink::open() {
  writeRecord("Song", "Show", "Type");
}

void CsvSink::emit(const std::string& song, const std::string& showTitle, ThemeCategory category) {
  writeRecord(song, showTitle, themeCategoryLabel(category));
}

void CsvSink::writeRecord(const std::string& a, const std::string& b, const std::string& c) {
  out_ << csvEscape(a) << ',' << csvEscape(b) << ',' << csvEscape(c) << '\n';
  out_.flush();
  ensureWritable(out_, "csv record");
}

std::string csvEscape(const std::string& field) {
  if (field.find_first_of(",\"\r\n") == std::string::npos) {
    return field;
  }
  std::string out;
  out.reserve(field.size() + 2);
  out.push_back('"');
  for (char ch : field) {
    if (ch == '"') out.push_back('"');
    out.push_back(ch);
  }
  out.push_back('"');
  return out;
}

ResultSink makeSink(OutputMode mode, std::optional<std::size_t> tableWidth, std::ostream& out) {
  switch (mode) {
    case OutputMode::Table: {
      const std::size_t width = tableWidth ? *tableWidth : terminal::outputWidth().value_or(terminal::kFallbackWidth);
      return ResultSink(std::in_place_type<TableSink>, out, width);
    }
    case OutputMode::Csv:
      return ResultSink(std::in_place_type<CsvSink>, out);
    case OutputMode::Readable:
      break;
  }
  return ResultSink(std::in_place_type<ReadableSink>, out);
}

void openSink(ResultSink& sink) {
  std::visit([](auto& s) { s.open(); }, sink);
}

void emitToSink(ResultSink& sink, const std::string& song, const std::string& showTitle,
                ThemeCategory category) {
  std::visit([&](auto& s) { s.emit(song, showTitle, category); }, sink);
}

void closeSink(ResultSink& sink) {
  std::visit([](auto& s) { s.close(); }, sink);
}
