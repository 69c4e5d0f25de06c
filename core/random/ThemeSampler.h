#pragma once

#include <cstddef>
#include <memory>
#include <random>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "core/catalog/Show.h"
#include "core/output/ResultSink.h"
#include "core/random/ThemeAggregator.h"

/**
 * @file ThemeSampler.h
 * @brief 从候选番剧中无放回地随机抽取主题曲。
 */

/// 单次成功抽取的结果，交给 ResultSink 后即丢弃。
struct ThemeDraw {
  std::string theme;
  ThemeCategory category{ThemeCategory::Other};
  const Show* show{nullptr};
};

/// 一次抽样的完整汇总。
struct SampleOutcome {
  std::size_t successes{0};                   ///< 成功写入 sink 的结果数。
  std::size_t failures{0};                    ///< 失败的轮次数（耗尽或写入失败）。
  bool exhausted{false};                      ///< 是否因候选耗尽而提前结束。
  std::vector<ShowId> missing_from_catalog;   ///< 被抽中但目录中不存在的ID。
  std::vector<ShowId> skipped_without_themes; ///< 被抽中但没有任何主题曲的番剧。

  bool ok() const { return failures == 0; }
};

/**
 * @brief 主题曲抽样器。
 *
 * 每轮从候选列表中均匀抽取一个尚未访问过的ID；目录中不存在或没有主题曲的番剧
 * 只会被标记为已访问，然后重新抽取，不消耗结果名额。所有不同的候选值都访问过后
 * 记一次失败并停止整个抽样。写入 sink 失败只记为该轮失败，循环继续。
 *
 * 每个被抽中的候选位置都会从抽取池中移除，因此一次 sample 调用的抽取次数
 * 不超过候选列表长度。
 */
class ThemeSampler {
public:
  /**
   * @param rng 整个抽样过程共用的随机数生成器，生命周期须覆盖 sampler。
   * @param logger 日志器；为空时不输出日志。
   */
  explicit ThemeSampler(std::mt19937& rng, std::shared_ptr<spdlog::logger> logger = nullptr);

  /**
   * @brief 执行抽样，并把每个结果写入 sink。
   * @pre candidates 与 catalog 均非空（由调用方检查）。
   * @param targetCount 请求的结果数量。
   * @param candidates 候选ID列表。
   * @param catalog 番剧目录。
   * @param sink 已 open 的结果输出；sampler 不负责 close。
   */
  SampleOutcome sample(std::size_t targetCount, const CandidateList& candidates,
                       const ShowCatalog& catalog, ResultSink& sink);

private:
  std::mt19937& rng_;
  std::shared_ptr<spdlog::logger> logger_;
};

/// 候选列表中不同ID的数量。
std::size_t countDistinct(const CandidateList& candidates);
