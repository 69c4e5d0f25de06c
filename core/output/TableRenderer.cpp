#include "core/output/TableRenderer.h"

#include <algorithm>
#include <numeric>
#include <sstream>
#include <utility>

/**
 * @file TableRenderer.cpp
 * @brief 圆角表格实现。
 */

namespace {

constexpr const char* kHorizontal = "─";
constexpr const char* kVertical = "│";

/// 一条水平边线的三种端点与交叉字符。
struct BorderGlyphs {
  const char* left;
  const char* cross;
  const char* right;
};

constexpr BorderGlyphs kTopBorder{"╭", "┬", "╮"};
constexpr BorderGlyphs kRowSeparator{"├", "┼", "┤"};
constexpr BorderGlyphs kBottomBorder{"╰", "┴", "╯"};

/// 前 count 个码点占用的字节数。
std::size_t utf8PrefixBytes(const std::string& text, std::size_t count) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const auto byte = static_cast<unsigned char>(text[i]);
    if ((byte & 0xC0) != 0x80) {
      if (seen == count) {
        return i;
      }
      ++seen;
    }
  }
  return text.size();
}

std::vector<std::string> splitOn(const std::string& text, char delimiter) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream stream(text);
  while (std::getline(stream, current, delimiter)) {
    parts.push_back(current);
  }
  if (parts.empty() || (!text.empty() && text.back() == delimiter)) {
    parts.emplace_back();
  }
  return parts;
}

/// 对单个段落（不含换行符）进行贪心折行。
void wrapParagraph(const std::string& paragraph, std::size_t width, std::vector<std::string>& lines) {
  std::string current;
  std::size_t currentLen = 0;
  for (std::string word : splitOn(paragraph, ' ')) {
    std::size_t wordLen = utf8Length(word);
    while (wordLen > width) {
      if (currentLen > 0) {
        lines.push_back(current);
        current.clear();
        currentLen = 0;
      }
      const std::size_t bytes = utf8PrefixBytes(word, width);
      lines.push_back(word.substr(0, bytes));
      word.erase(0, bytes);
      wordLen -= width;
    }
    if (wordLen == 0) {
      continue;
    }
    if (currentLen == 0) {
      current = std::move(word);
      currentLen = wordLen;
    } else if (currentLen + 1 + wordLen <= width) {
      current += ' ';
      current += word;
      currentLen += 1 + wordLen;
    } else {
      lines.push_back(current);
      current = std::move(word);
      currentLen = wordLen;
    }
  }
  if (currentLen > 0) {
    lines.push_back(current);
  }
}

std::string repeat(const char* glyph, std::size_t count) {
  std::string out;
  for (std::size_t i = 0; i < count; ++i) {
    out += glyph;
  }
  return out;
}

void appendBorder(std::string& out, const BorderGlyphs& glyphs, const std::vector<std::size_t>& widths) {
  out += glyphs.left;
  for (std::size_t col = 0; col < widths.size(); ++col) {
    if (col > 0) {
      out += glyphs.cross;
    }
    out += repeat(kHorizontal, widths[col] + 2);
  }
  out += glyphs.right;
  out += '\n';
}

} // namespace

std::size_t utf8Length(const std::string& text) {
  return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
    return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
  }));
}

std::vector<std::string> wrapCell(const std::string& text, std::size_t width) {
  std::vector<std::string> lines;
  width = std::max<std::size_t>(width, 1);
  for (const auto& paragraph : splitOn(text, '\n')) {
    const std::size_t before = lines.size();
    wrapParagraph(paragraph, width, lines);
    if (lines.size() == before) {
      lines.emplace_back(); // 空段落保留为空行
    }
  }
  return lines;
}

TableRenderer::TableRenderer(std::size_t maxWidth) : maxWidth_(maxWidth) {}

void TableRenderer::addRow(std::vector<std::string> cells) {
  columns_ = std::max(columns_, cells.size());
  rows_.push_back(std::move(cells));
}

std::vector<std::size_t> TableRenderer::columnWidths() const {
  std::vector<std::size_t> widths(columns_, 1);
  for (const auto& row : rows_) {
    for (std::size_t col = 0; col < row.size(); ++col) {
      for (const auto& line : splitOn(row[col], '\n')) {
        widths[col] = std::max(widths[col], utf8Length(line));
      }
    }
  }

  // 每列占用 width + 2 个填充空格 + 1 条竖线，再加最左侧竖线。
  auto totalWidth = [&widths]() {
    return std::accumulate(widths.begin(), widths.end(), std::size_t{1},
                           [](std::size_t sum, std::size_t w) { return sum + w + 3; });
  };
  while (totalWidth() > maxWidth_) {
    auto widest = std::max_element(widths.begin(), widths.end());
    if (widest == widths.end() || *widest <= kMinColumnWidth) {
      break;
    }
    --*widest;
  }
  return widths;
}

std::string TableRenderer::render() const {
  if (rows_.empty()) {
    return {};
  }
  const auto widths = columnWidths();

  std::string out;
  appendBorder(out, kTopBorder, widths);
  for (std::size_t rowIndex = 0; rowIndex < rows_.size(); ++rowIndex) {
    if (rowIndex > 0) {
      appendBorder(out, kRowSeparator, widths);
    }
    const auto& row = rows_[rowIndex];

    std::vector<std::vector<std::string>> wrapped(columns_);
    std::size_t height = 1;
    for (std::size_t col = 0; col < columns_; ++col) {
      wrapped[col] = wrapCell(col < row.size() ? row[col] : std::string(), widths[col]);
      height = std::max(height, wrapped[col].size());
    }

    for (std::size_t line = 0; line < height; ++line) {
      out += kVertical;
      for (std::size_t col = 0; col < columns_; ++col) {
        const std::string text = line < wrapped[col].size() ? wrapped[col][line] : std::string();
        out += ' ';
        out += text;
        out.append(widths[col] - utf8Length(text), ' ');
        out += ' ';
        out += kVertical;
      }
      out += '\n';
    }
  }
  appendBorder(out, kBottomBorder, widths);
  return out;
}
