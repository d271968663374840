#pragma once

#include <cstdint>
#include <string>

#include "core/types.h"

namespace theta_core {

/// 单 bar 决策记录：外部遥测/图表协作方唯一的输出契约。
struct DecisionRecord {
  std::int64_t ts_ms{0};
  std::int64_t index{0};
  double depth{0.0};
  double depth_slope{0.0};
  Terminal terminal{Terminal::kSlow};
  std::string island_id;  ///< 仅 terminal=FAST 时非空。
  bool burst_event{false};
  double dc_pre{0.0};
  double er{0.0};
  double delta{0.0};
  double channel{0.0};
};

/**
 * @brief 状态岛签名
 *
 * 格式：`<depth>_<dc>_<delta>_<force>_<er>_<theta>_<channel>`，
 * 例如 `High_Comp_Large_Strong_Low_High_Top`。
 */
std::string BuildIslandId(const IndicatorSet& indicators, int theta,
                          double delta_large_threshold);

/// 由指标快照生成决策记录；`theta` 为本 bar 点火认证结果（无点火时为 0）。
DecisionRecord BuildDecisionRecord(const IndicatorSet& indicators, int theta,
                                   double delta_large_threshold);

std::string DecisionCsvHeader();
std::string ToCsvLine(const DecisionRecord& record);

}  // namespace theta_core
