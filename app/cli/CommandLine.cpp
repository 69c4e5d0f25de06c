// UTF-8
#include "app/cli/CommandLine.h"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <optional>
#include <sstream>
#include <vector>

#include <getopt.h>

#ifndef RANDOM_SHOW_THEMES_VERSION
#define RANDOM_SHOW_THEMES_VERSION "0.0.0"
#endif

namespace {

constexpr const char* kProgramName = "random-show-themes";

// 只有长选项的参数使用 256 以上的值，避免与短选项字符冲突。
enum LongOnlyOption : int {
  kOptHardFail = 256,
  kOptTableWidth,
  kOptReadable,
  kOptCsv,
  kOptTimestamp,
};

const option kLongOptions[] = {
    {"dictionary", required_argument, nullptr, 'd'},
    {"list", required_argument, nullptr, 'l'},
    {"number", required_argument, nullptr, 'n'},
    {"hard-fail", no_argument, nullptr, kOptHardFail},
    {"quiet", no_argument, nullptr, 'q'},
    {"timestamp", required_argument, nullptr, kOptTimestamp},
    {"table", no_argument, nullptr, 't'},
    {"table-width", required_argument, nullptr, kOptTableWidth},
    {"readable", no_argument, nullptr, kOptReadable},
    {"csv", no_argument, nullptr, kOptCsv},
    {"seed", required_argument, nullptr, 's'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, 0},
};

// 前导 ':' 让 getopt_long 在缺少参数值时返回 ':' 而不是 '?'。
constexpr const char* kShortOptions = ":d:l:n:qtvs:hV";

std::string displayFlag(OutputMode mode) {
  return "--" + outputModeToString(mode);
}

/// 把 getopt 报告的出错选项还原成用户输入的形式。
std::string offendingOption(char* argv[]) {
  if (optopt > 0 && optopt < kOptHardFail) {
    return std::string("-") + static_cast<char>(optopt);
  }
  return argv[optind - 1];
}

std::uint32_t parseSeed(const std::string& value) {
  const bool digitsOnly = !value.empty() && value.find_first_not_of("0123456789") == std::string::npos;
  errno = 0;
  char* end = nullptr;
  const unsigned long long parsed = digitsOnly ? std::strtoull(value.c_str(), &end, 10) : 0;
  if (!digitsOnly || errno == ERANGE || parsed > std::numeric_limits<std::uint32_t>::max()) {
    throw UsageError("invalid value '" + value + "' for '--seed <seed>': must be an integer between 0 and " +
                     std::to_string(std::numeric_limits<std::uint32_t>::max()));
  }
  return static_cast<std::uint32_t>(parsed);
}

} // namespace

std::size_t parsePositiveInt(const std::string& value, const std::string& argName) {
  const std::string message =
      "invalid value '" + value + "' for '" + argName + "': must be a positive, non-zero integer";
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw UsageError(message);
  }
  errno = 0;
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
  if (errno == ERANGE || parsed == 0 || parsed > std::numeric_limits<std::size_t>::max()) {
    throw UsageError(message);
  }
  return static_cast<std::size_t>(parsed);
}

CommandLine parseCommandLine(int argc, char* argv[]) {
  CommandLine result;
  AppOptions& options = result.options;

  std::optional<std::string> dictionary;
  std::optional<std::string> list;
  std::optional<std::size_t> number;
  std::optional<OutputMode> display;

  auto selectDisplay = [&display](OutputMode mode) {
    if (display && *display != mode) {
      throw UsageError("the argument '" + displayFlag(mode) + "' cannot be used with '" +
                       displayFlag(*display) + "'");
    }
    display = mode;
  };

  // getopt_long 使用全局状态；置 0 强制重新初始化，便于同一进程内多次解析。
  optind = 0;
  opterr = 0;
  int opt = 0;
  int optionIndex = 0;
  while ((opt = getopt_long(argc, argv, kShortOptions, kLongOptions, &optionIndex)) != -1) {
    switch (opt) {
      case 'd':
        dictionary = optarg;
        break;
      case 'l':
        list = optarg;
        break;
      case 'n':
        if (number) {
          throw UsageError("the argument '<number>' was provided more than once");
        }
        number = parsePositiveInt(optarg, "<number>");
        break;
      case kOptHardFail:
        options.hardFail = true;
        break;
      case 'v':
        ++options.logging.verbosity;
        break;
      case 'q':
        options.logging.quiet = true;
        break;
      case kOptTimestamp: {
        auto mode = timestampModeFromString(optarg);
        if (!mode) {
          throw UsageError(std::string("invalid value '") + optarg +
                           "' for '--timestamp <timestamp>' [possible values: none, sec, ms, ns]");
        }
        options.logging.timestamp = *mode;
        break;
      }
      case 't':
        selectDisplay(OutputMode::Table);
        break;
      case kOptReadable:
        selectDisplay(OutputMode::Readable);
        break;
      case kOptCsv:
        selectDisplay(OutputMode::Csv);
        break;
      case kOptTableWidth:
        options.tableWidth = parsePositiveInt(optarg, "--table-width <table width>");
        break;
      case 's':
        options.seed = parseSeed(optarg);
        break;
      case 'h':
        result.action = CommandLine::Action::ShowHelp;
        return result;
      case 'V':
        result.action = CommandLine::Action::ShowVersion;
        return result;
      case ':':
        throw UsageError("the argument '" + offendingOption(argv) + "' requires a value");
      case '?':
      default:
        throw UsageError("unexpected argument '" + offendingOption(argv) + "'");
    }
  }

  for (int index = optind; index < argc; ++index) {
    if (number) {
      throw UsageError(std::string("unexpected argument '") + argv[index] + "'");
    }
    number = parsePositiveInt(argv[index], "<number>");
  }

  std::vector<std::string> missing;
  if (!dictionary) missing.emplace_back("-d <dictionary>");
  if (!list) missing.emplace_back("-l <list>");
  if (!number) missing.emplace_back("<number>");
  if (!missing.empty()) {
    std::string message = "the following required arguments were not provided:";
    for (const auto& name : missing) {
      message += "\n  " + name;
    }
    throw UsageError(message);
  }

  options.outputMode = display.value_or(OutputMode::Readable);
  if (options.tableWidth && options.outputMode != OutputMode::Table) {
    throw UsageError("the argument '--table-width <table width>' requires '--table'");
  }

  options.dictionaryPath = *dictionary;
  options.listPath = *list;
  options.resultCount = *number;
  return result;
}

std::string usageText(const std::string& program) {
  std::ostringstream out;
  out << kProgramName << ' ' << RANDOM_SHOW_THEMES_VERSION << "\n"
      << "Pick random theme songs from a list of shows\n\n"
      << "USAGE:\n"
      << "    " << program << " [OPTIONS] -d <dictionary> -l <list> <number>\n\n"
      << "ARGS:\n"
      << "    <number>    The number of results to output\n"
      << "                Note: The program is not guaranteed to output the number of results\n"
      << "                specified if it is not possible with the provided inputs.\n\n"
      << "OPTIONS:\n"
      << "    -d, --dictionary <file>      The list of all known shows\n"
      << "    -l, --list <file>            The subset of shows to choose from the dictionary\n"
      << "    -n, --number <number>        Same as the <number> argument\n"
      << "        --hard-fail              Exit with exit code 1 on any error\n"
      << "                                 Note: this will not necessarily prevent some output\n"
      << "                                 from reaching stdout before exiting.\n"
      << "    -s, --seed <seed>            Seed the random generator for a reproducible run\n"
      << "    -v                           Increase message verbosity (repeatable)\n"
      << "    -q, --quiet                  Silence all log output\n"
      << "        --timestamp <timestamp>  Prepend log lines with a timestamp\n"
      << "                                 [possible values: none, sec, ms, ns]\n"
      << "    -t, --table                  Sets output to a formatted table\n"
      << "        --table-width <width>    The table width (requires --table)\n"
      << "        --readable               Sets output to human readable text (default)\n"
      << "        --csv                    Sets output to csv\n"
      << "    -h, --help                   Print help information\n"
      << "    -V, --version                Print version information\n";
  return out.str();
}

std::string versionText() {
  return std::string(kProgramName) + " " + RANDOM_SHOW_THEMES_VERSION;
}
