#pragma once

#include <stdexcept>

/**
 * @file CatalogError.h
 * @brief 输入文件（番剧目录与候选列表）读取错误。
 */

/**
 * @brief 输入文件缺失、无法解析或结构不符时抛出的错误类型。
 */
class CatalogError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};
