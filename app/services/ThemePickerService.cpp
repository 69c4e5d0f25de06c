// UTF-8
#include "app/services/ThemePickerService.h"

#include <random>
#include <utility>

#include "core/catalog/CatalogLoader.h"
#include "core/log/Log.h"
#include "core/output/ResultSink.h"
#include "core/random/ThemeSampler.h"

ThemePickerService::ThemePickerService(std::ostream& out, std::shared_ptr<spdlog::logger> logger)
    : out_(out), logger_(logger ? std::move(logger) : createNullLogger()) {}

int ThemePickerService::run(const AppOptions& options) const {
  ShowCatalog shows;
  CandidateList candidates;
  try {
    shows = catalog::loadCatalog(options.dictionaryPath);
    candidates = catalog::loadCandidateList(options.listPath);
  } catch (const CatalogError& ex) {
    logger_->error("{}", ex.what());
    return 1;
  }
  logger_->debug("loaded {} shows and {} candidates", shows.size(), candidates.size());

  // 配置错误：无论是否 hard-fail 都直接中止。
  if (shows.empty()) {
    logger_->error("dictionary cannot be empty");
    return 1;
  }
  if (candidates.empty()) {
    logger_->error("list cannot be empty");
    return 1;
  }

  const auto target = degradeResultCount(options.resultCount, countDistinct(candidates), options.hardFail, *logger_);
  if (!target) {
    return 1;
  }

  const std::uint32_t seed = options.seed ? *options.seed : std::random_device{}();
  logger_->debug("random seed {}", seed);
  std::mt19937 rng(seed);

  ResultSink sink = makeSink(options.outputMode, options.tableWidth, out_);
  try {
    openSink(sink);
  } catch (const SinkError& ex) {
    logger_->error("{}", ex.what());
    return 1;
  }

  ThemeSampler sampler(rng, logger_);
  const SampleOutcome outcome = sampler.sample(*target, candidates, shows, sink);

  if (!outcome.missing_from_catalog.empty()) {
    logger_->info("{} candidate id(s) were not found in the dictionary", outcome.missing_from_catalog.size());
  }
  if (!outcome.skipped_without_themes.empty()) {
    logger_->info("{} show(s) had no themes to choose from", outcome.skipped_without_themes.size());
  }
  logger_->debug("{} of {} results picked, {} failure(s)", outcome.successes, *target, outcome.failures);

  if (!outcome.ok() && options.hardFail) {
    return 1;
  }

  try {
    closeSink(sink);
  } catch (const SinkError& ex) {
    logger_->error("{}", ex.what());
    return options.hardFail ? 1 : 0;
  }
  return 0;
}

std::optional<std::size_t> degradeResultCount(std::size_t requested, std::size_t available, bool hardFail,
                                              spdlog::logger& logger) {
  if (requested <= available) {
    return requested;
  }
  logger.warn("{} results were requested, however the list only contained {} distinct entries", requested,
              available);
  if (hardFail) {
    return std::nullopt;
  }
  logger.info("requesting {} results instead", available);
  return available;
}
