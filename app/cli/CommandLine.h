// UTF-8
#pragma once

#include <stdexcept>
#include <string>

#include "core/config/AppOptions.h"

/**
 * 命令行解析：把 argv 转换为 AppOptions，并完成所有参数校验。
 * 仅负责解析与校验，不做任何文件读取或输出。
 */

/**
 * @brief 命令行参数非法时抛出的错误类型，消息可直接展示给用户。
 */
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief 命令行解析结果。
 */
struct CommandLine {
  /// 解析后应执行的动作。
  enum class Action {
    Run,         ///< 正常运行。
    ShowHelp,    ///< 打印帮助后退出。
    ShowVersion  ///< 打印版本后退出。
  };

  Action action{Action::Run};
  AppOptions options;
};

/**
 * 解析命令行参数。
 * - <number> 可作为位置参数或通过 -n 给出，必须是正整数。
 * - -d/--dictionary 与 -l/--list 为必填项。
 * - --table / --readable / --csv 互斥，默认 readable；--table-width 只能与 --table 同用。
 * - -v 可重复以提高日志级别。
 * @throws UsageError 参数缺失、取值非法或互相冲突时抛出。
 */
CommandLine parseCommandLine(int argc, char* argv[]);

/// 帮助信息。
std::string usageText(const std::string& program);

/// 版本信息，例如 "random-show-themes 0.1.0"。
std::string versionText();

/**
 * @brief 校验并解析正整数（不含 0）。
 * @throws UsageError 不是正整数时抛出，消息中包含参数名。
 */
std::size_t parsePositiveInt(const std::string& value, const std::string& argName);
