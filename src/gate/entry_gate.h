#pragma once

#include <optional>

#include "core/doctrine.h"
#include "core/types.h"

namespace theta_core {

/**
 * @brief STB 点火门（无状态）
 *
 * 固定合取条件：
 * - 双向共同要求：channel_range ≥ 下限，|body_z| ≥ 下限；
 * - ratio > 空头阈值 且 channel > 上沿 ⇒ SHORT；
 * - ratio < 多头阈值 且 channel < 下沿 ⇒ LONG。
 *
 * 输出仅为候选，是否入场由认证与执行策略决定。
 */
class EntryGate {
 public:
  explicit EntryGate(const LockedDoctrine& doctrine) : doctrine_(doctrine) {}

  std::optional<IgnitionEvent> Evaluate(const IndicatorSet& indicators) const;

 private:
  const LockedDoctrine& doctrine_;
};

}  // namespace theta_core
