#pragma once

#include <optional>

#include "core/doctrine.h"
#include "core/types.h"

namespace theta_core {

/**
 * @brief 执行策略（OPA）
 *
 * 纯函数：(θ, 方向, 资格层级, zone 状态, 执行摩擦, 行情陈旧) -> PolicyDecision。
 * 判定顺序：
 * 1. 硬否决：zone 在候选方向塌缩 -> ZONE_COLLAPSED；摩擦越限 -> EXECUTION_FRICTION；
 * 2. 行情陈旧 -> STALE_FEED（等价 θ=0）；
 * 3. θ=0 -> STATE_NOT_CERTIFIED；保守层级且 θ<3 -> TIER_RESTRICTED；
 * 4. 按 θ 查表给出倍率、重试与 trailing 许可。
 *
 * 结果不跨 bar 缓存，每个候选现算。
 */
class ExecutionPolicy {
 public:
  ExecutionPolicy(const LockedDoctrine& doctrine, int max_latency_ms)
      : doctrine_(doctrine), max_latency_ms_(max_latency_ms) {}

  PolicyDecision Decide(int theta,
                        Direction direction,
                        EligibilityTier tier,
                        const std::optional<PersistenceRecord>& zone,
                        const ExecutionFriction& friction,
                        bool stale) const;

  /// 摩擦是否越限（滑点/点差锁定，延迟上限来自配置）。
  bool FrictionBreached(const ExecutionFriction& friction) const;

 private:
  const LockedDoctrine& doctrine_;
  int max_latency_ms_{500};
};

}  // namespace theta_core
