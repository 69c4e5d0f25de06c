#include "core/random/ThemeSampler.h"

#include <numeric>
#include <optional>
#include <unordered_set>
#include <utility>

#include "core/log/Log.h"

ThemeSampler::ThemeSampler(std::mt19937& rng, std::shared_ptr<spdlog::logger> logger)
    : rng_(rng), logger_(logger ? std::move(logger) : createNullLogger()) {}

SampleOutcome ThemeSampler::sample(std::size_t targetCount, const CandidateList& candidates,
                                   const ShowCatalog& catalog, ResultSink& sink) {
  SampleOutcome outcome;
  const std::size_t distinct = countDistinct(candidates);

  std::unordered_set<ShowId> visited;
  visited.reserve(distinct);

  // 尚未被抽中过的候选位置；每次抽取都会移除一个位置，保证循环有界。
  std::vector<std::size_t> pool(candidates.size());
  std::iota(pool.begin(), pool.end(), std::size_t{0});

  // 抽取下一个带主题曲的番剧，候选耗尽时返回 std::nullopt。
  auto drawNext = [&]() -> std::optional<ThemeDraw> {
    while (visited.size() < distinct && !pool.empty()) {
      std::uniform_int_distribution<std::size_t> pickSlot(0, pool.size() - 1);
      const std::size_t slot = pickSlot(rng_);
      const ShowId id = candidates[pool[slot]];
      pool[slot] = pool.back();
      pool.pop_back();

      if (!visited.insert(id).second) {
        logger_->trace("candidate {} already visited, drawing again", id);
        continue;
      }

      auto showIt = catalog.find(id);
      if (showIt == catalog.end()) {
        logger_->debug("show {} is not in the dictionary, skipping", id);
        outcome.missing_from_catalog.push_back(id);
        continue;
      }

      const Show& show = showIt->second;
      auto themes = aggregateThemes(show);
      if (themes.empty()) {
        logger_->debug("show {} ({}) has no themes, trying a different show", id, show.title);
        outcome.skipped_without_themes.push_back(id);
        continue;
      }

      std::uniform_int_distribution<std::size_t> pickTheme(0, themes.size() - 1);
      ThemeDraw draw;
      draw.theme = std::move(themes[pickTheme(rng_)]);
      draw.category = classifyTheme(draw.theme, show);
      draw.show = &show;
      return draw;
    }
    return std::nullopt;
  };

  for (std::size_t iteration = 0; iteration < targetCount; ++iteration) {
    auto draw = drawNext();
    if (!draw) {
      // 所有候选都已访问，无法再凑出更多结果。
      logger_->error("not enough results were found");
      outcome.exhausted = true;
      ++outcome.failures;
      break;
    }

    try {
      emitToSink(sink, draw->theme, draw->show->title, draw->category);
      ++outcome.successes;
      logger_->trace("picked '{}' [{}] from show {}", draw->theme, themeCategoryLabel(draw->category),
                     draw->show->id);
    } catch (const SinkError& ex) {
      logger_->error("{}", ex.what());
      ++outcome.failures;
    }
  }

  return outcome;
}

std::size_t countDistinct(const CandidateList& candidates) {
  return std::unordered_set<ShowId>(candidates.begin(), candidates.end()).size();
}
