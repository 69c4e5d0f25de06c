#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "app/services/ThemePickerService.h"
#include "tests/TestHelpers.h"

using testing_helpers::splitLines;

namespace {

constexpr const char* kTwoShows = R"({
  "1": {"id": 1, "title": "X", "opening_themes": ["OP1"]},
  "2": {"id": 2, "title": "Y", "ending_themes": ["ED1"]}
})";

class ThemePickerServiceTest : public testing_helpers::TempDirTest {
protected:
  void SetUp() override {
    TempDirTest::SetUp();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_);
    sink->set_pattern("%l: %v");
    logger_ = std::make_shared<spdlog::logger>("test", sink);
    logger_->set_level(spdlog::level::trace);
  }

  AppOptions makeOptions(const std::string& dictionary, const std::string& list, std::size_t count) {
    AppOptions options;
    options.dictionaryPath = writeFile("dictionary.json", dictionary);
    options.listPath = writeFile("list.json", list);
    options.resultCount = count;
    options.seed = 2024;
    return options;
  }

  int run(const AppOptions& options) {
    ThemePickerService service(out_, logger_);
    return service.run(options);
  }

  bool logged(const std::string& text) const {
    return log_.str().find(text) != std::string::npos;
  }

  std::ostringstream out_;
  std::ostringstream log_;
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

TEST_F(ThemePickerServiceTest, PicksOneThemeFromEachShow) {
  const auto options = makeOptions(kTwoShows, "[1, 2]", 2);
  EXPECT_EQ(run(options), 0);

  const auto lines = splitLines(out_.str());
  const std::set<std::string> picked(lines.begin(), lines.end());
  EXPECT_EQ(lines.size(), 2u);
  EXPECT_EQ(picked, (std::set<std::string>{"OP1 [OP] from X", "ED1 [ED] from Y"}));
}

TEST_F(ThemePickerServiceTest, LowersCountWhenListIsTooShort) {
  const auto options = makeOptions(kTwoShows, "[1, 2]", 5);
  EXPECT_EQ(run(options), 0);
  EXPECT_EQ(splitLines(out_.str()).size(), 2u);
  EXPECT_TRUE(logged("warning: 5 results were requested, however the list only contained 2 distinct entries"));
  EXPECT_TRUE(logged("requesting 2 results instead"));
  EXPECT_FALSE(logged("not enough results"));
}

TEST_F(ThemePickerServiceTest, DuplicateCandidatesCountOnce) {
  const auto options = makeOptions(kTwoShows, "[1, 1, 2, 2]", 4);
  EXPECT_EQ(run(options), 0);
  EXPECT_EQ(splitLines(out_.str()).size(), 2u);
  EXPECT_TRUE(logged("requesting 2 results instead"));
}

TEST_F(ThemePickerServiceTest, HardFailAbortsBeforeSamplingWhenCountTooLarge) {
  auto options = makeOptions(kTwoShows, "[1, 2]", 3);
  options.hardFail = true;
  EXPECT_EQ(run(options), 1);
  EXPECT_TRUE(out_.str().empty());
  EXPECT_FALSE(logged("requesting"));
}

TEST_F(ThemePickerServiceTest, EmptyInputsAreAlwaysFatal) {
  auto emptyDictionary = makeOptions("{}", "[1]", 1);
  EXPECT_EQ(run(emptyDictionary), 1);
  EXPECT_TRUE(logged("dictionary cannot be empty"));

  auto emptyList = makeOptions(kTwoShows, "[]", 1);
  EXPECT_EQ(run(emptyList), 1);
  EXPECT_TRUE(logged("list cannot be empty"));
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(ThemePickerServiceTest, UnreadableInputIsFatal) {
  auto options = makeOptions(kTwoShows, "[1, 2]", 1);
  options.listPath = dir_ / "does-not-exist.json";
  EXPECT_EQ(run(options), 1);
  EXPECT_TRUE(logged("failed to open"));

  auto malformed = makeOptions("{\"1\": {\"id\": \"one\", \"title\": \"X\"}}", "[1]", 1);
  EXPECT_EQ(run(malformed), 1);
}

TEST_F(ThemePickerServiceTest, ExhaustionIsSoftUnlessHardFail) {
  const char* silent = R"({"1": {"id": 1, "title": "Silent"}})";
  auto options = makeOptions(silent, "[1, 1, 1]", 1);
  EXPECT_EQ(run(options), 0);
  EXPECT_TRUE(out_.str().empty());
  EXPECT_TRUE(logged("not enough results were found"));

  options.hardFail = true;
  EXPECT_EQ(run(options), 1);
}

TEST_F(ThemePickerServiceTest, KeepsPartialOutputOnSoftFailure) {
  const char* shows = R"({
    "1": {"id": 1, "title": "A", "other_soundtrack": ["a"]},
    "2": {"id": 2, "title": "B"}
  })";
  const auto options = makeOptions(shows, "[1, 2, 3]", 3);
  EXPECT_EQ(run(options), 0);
  EXPECT_EQ(splitLines(out_.str()), (std::vector<std::string>{"a [ST] from A"}));
  EXPECT_TRUE(logged("1 candidate id(s) were not found in the dictionary"));
  EXPECT_TRUE(logged("1 show(s) had no themes to choose from"));
}

TEST_F(ThemePickerServiceTest, WritesCsv) {
  auto options = makeOptions(kTwoShows, "[2]", 1);
  options.outputMode = OutputMode::Csv;
  EXPECT_EQ(run(options), 0);
  EXPECT_EQ(out_.str(), "Song,Show,Type\nED1,Y,ED\n");
}

TEST_F(ThemePickerServiceTest, WritesTableAfterSampling) {
  auto options = makeOptions(kTwoShows, "[1]", 1);
  options.outputMode = OutputMode::Table;
  options.tableWidth = 80;
  EXPECT_EQ(run(options), 0);
  EXPECT_EQ(out_.str(),
            "╭──────┬──────┬──────╮\n"
            "│ Song │ Show │ Type │\n"
            "├──────┼──────┼──────┤\n"
            "│ OP1  │ X    │ OP   │\n"
            "╰──────┴──────┴──────╯\n");
}

TEST_F(ThemePickerServiceTest, HardFailSkipsTableRendering) {
  const char* shows = R"({"1": {"id": 1, "title": "A", "opening_themes": ["a"]}, "2": {"id": 2, "title": "B"}})";
  auto options = makeOptions(shows, "[1, 2]", 2);
  options.outputMode = OutputMode::Table;
  options.tableWidth = 80;
  options.hardFail = true;
  EXPECT_EQ(run(options), 1);
  EXPECT_TRUE(out_.str().empty());
}

TEST_F(ThemePickerServiceTest, SinkFailures) {
  auto options = makeOptions(kTwoShows, "[1, 2]", 2);
  out_.setstate(std::ios::badbit);
  EXPECT_EQ(run(options), 0);
  EXPECT_TRUE(logged("failed to write result line"));

  options.hardFail = true;
  EXPECT_EQ(run(options), 1);

  options.hardFail = false;
  options.outputMode = OutputMode::Csv;
  EXPECT_EQ(run(options), 1);
}

TEST_F(ThemePickerServiceTest, ReadableFlushFailureFailsUnderHardFail) {
  auto options = makeOptions(kTwoShows, "[1, 2]", 2);
  testing_helpers::FullDeviceBuffer buffer;
  std::ostream full(&buffer);

  ThemePickerService soft(full, logger_);
  EXPECT_EQ(soft.run(options), 0);
  EXPECT_TRUE(logged("failed to write result line"));

  full.clear();
  options.hardFail = true;
  ThemePickerService strict(full, logger_);
  EXPECT_EQ(strict.run(options), 1);
}

TEST_F(ThemePickerServiceTest, SameSeedReproducesOutput) {
  std::string shows = "{";
  std::string list = "[";
  for (int id = 1; id <= 20; ++id) {
    const std::string key = std::to_string(id);
    shows += (id > 1 ? "," : "") + std::string("\"") + key + "\": {\"id\": " + key + ", \"title\": \"S" + key +
             "\", \"opening_themes\": [\"o" + key + "\"], \"ending_themes\": [\"e" + key + "\"]}";
    list += (id > 1 ? "," : "") + key;
  }
  shows += "}";
  list += "]";

  const auto options = makeOptions(shows, list, 5);
  EXPECT_EQ(run(options), 0);
  const std::string first = out_.str();
  out_.str("");
  EXPECT_EQ(run(options), 0);
  EXPECT_EQ(out_.str(), first);
  EXPECT_EQ(splitLines(first).size(), 5u);
}

TEST(DegradeResultCountTest, KeepsOrLowersOrAborts) {
  auto logger = std::make_shared<spdlog::logger>("degrade", spdlog::sinks_init_list{});
  EXPECT_EQ(degradeResultCount(2, 5, false, *logger), std::optional<std::size_t>(2));
  EXPECT_EQ(degradeResultCount(5, 5, true, *logger), std::optional<std::size_t>(5));
  EXPECT_EQ(degradeResultCount(9, 5, false, *logger), std::optional<std::size_t>(5));
  EXPECT_FALSE(degradeResultCount(9, 5, true, *logger).has_value());
}
