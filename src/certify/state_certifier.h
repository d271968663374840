#pragma once

#include <cstdint>
#include <optional>

#include "core/types.h"
#include "zone/zone_ledger.h"

namespace theta_core {

/// θ≥3 统一以 3 表示。
inline constexpr int kThetaLockIn = 3;

/**
 * @brief 状态认证器
 *
 * 由 zone 持久性记录与点火事件推导 θ：
 * - θ=0：无记录 / 新 zone / 最近结果为亏损 / 连胜属于反方向；
 * - θ=1：同向至少 1 次成功；
 * - θ=2：同向连胜 2 次且最近一次成功满足快速回测佐证；
 * - θ≥3：同向连胜 ≥ 3 次。
 *
 * 每个点火事件只能消费一次：bar_index 不大于已消费值的事件被拒绝。
 */
class StateCertifier {
 public:
  /**
   * @brief 认证点火事件
   * @return θ；重复或过期的点火事件返回空
   */
  std::optional<int> Certify(const IgnitionEvent& ignition,
                             const ZoneLedger& ledger);

  /// 纯函数：仅依据记录与方向计算 θ。
  static int ThetaFor(const std::optional<PersistenceRecord>& record,
                      Direction direction);

  std::optional<std::int64_t> last_consumed_index() const {
    return last_consumed_index_;
  }

 private:
  std::optional<std::int64_t> last_consumed_index_;
};

}  // namespace theta_core
