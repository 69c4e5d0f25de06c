#include <iostream>

#include "app/cli/CommandLine.h"
#include "app/services/ThemePickerService.h"
#include "core/log/Log.h"

/**
 * @file main.cpp
 * @brief 命令行入口：解析参数、创建日志器并执行一次抽取。
 */

int main(int argc, char *argv[]) {
  CommandLine commandLine;
  try {
    commandLine = parseCommandLine(argc, argv);
  } catch (const UsageError& ex) {
    std::cerr << "error: " << ex.what() << "\n\nFor more information try --help\n";
    return 1;
  }

  switch (commandLine.action) {
    case CommandLine::Action::ShowHelp:
      std::cout << usageText(argv[0]);
      return 0;
    case CommandLine::Action::ShowVersion:
      std::cout << versionText() << '\n';
      return 0;
    case CommandLine::Action::Run:
      break;
  }

  ThemePickerService service(std::cout, createLogger(commandLine.options.logging));
  return service.run(commandLine.options);
}
