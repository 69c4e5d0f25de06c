// UTF-8
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>

#include <spdlog/logger.h>

#include "core/config/AppOptions.h"

/**
 * 运行服务：完成一次完整的抽取流程。
 * 职责：加载输入、检查配置错误、按需降低结果数量、驱动抽样器并决定退出码。
 * 注意：所有失败都在此处转换为日志与退出码，核心模块只报告结果。
 */
class ThemePickerService {
public:
  /**
   * @param out 结果输出流（通常为 std::cout），生命周期须覆盖 service。
   * @param logger 日志器，由 createLogger 按命令行配置创建。
   */
  ThemePickerService(std::ostream& out, std::shared_ptr<spdlog::logger> logger);

  /**
   * 执行一次运行并返回进程退出码。
   * - 输入无法加载、目录为空、候选列表为空：总是返回 1。
   * - 请求数量超过不同候选值数量：hardFail 时返回 1，否则降低数量继续。
   * - 抽样失败（候选耗尽、写入失败）：hardFail 时返回 1，否则保留已输出内容并返回 0。
   */
  int run(const AppOptions& options) const;

private:
  std::ostream& out_;
  std::shared_ptr<spdlog::logger> logger_;
};

/**
 * 请求数量超过可用的不同候选值时的降级策略。
 * @return 实际使用的数量；hardFail 且需要降级时返回 std::nullopt（调用方应中止）。
 */
std::optional<std::size_t> degradeResultCount(std::size_t requested, std::size_t available, bool hardFail,
                                              spdlog::logger& logger);
