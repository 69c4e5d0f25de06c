#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @file TableRenderer.h
 * @brief 圆角边框文本表格的排版与渲染。
 */

/**
 * @brief 纯文本表格。
 * @details 使用圆角制表符绘制边框，每行之间都有分隔线。总宽度超出上限时，
 *          从最宽的列开始收窄，单元格按空格折行，超长单词强制断开。
 *          宽度按 Unicode 码点计算。
 */
class TableRenderer {
public:
  /// 列宽不会被收窄到低于此值。
  static constexpr std::size_t kMinColumnWidth = 4;

  /**
   * @param maxWidth 表格（含边框）的最大总宽度。
   */
  explicit TableRenderer(std::size_t maxWidth);

  /** @brief 追加一行；列数不足的行以空单元格补齐。 */
  void addRow(std::vector<std::string> cells);

  /** @brief 当前行数（含表头行）。 */
  std::size_t rowCount() const { return rows_.size(); }

  /**
   * @brief 渲染整个表格。
   * @return 以换行结尾的多行文本；没有任何行时返回空字符串。
   */
  std::string render() const;

  /**
   * @brief 计算各列最终宽度。
   * @details 先取每列最长行的宽度，再在超出 maxWidth 时逐列收窄。
   */
  std::vector<std::size_t> columnWidths() const;

private:
  std::size_t maxWidth_;
  std::size_t columns_{0};
  std::vector<std::vector<std::string>> rows_;
};

/// UTF-8 字符串的码点数。
std::size_t utf8Length(const std::string& text);

/**
 * @brief 将单元格文本按给定宽度折行。
 * @details 先按换行符分段，再按空格贪心折行；长于 width 的单词被强制截断。
 */
std::vector<std::string> wrapCell(const std::string& text, std::size_t width);
