#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "core/doctrine.h"
#include "core/types.h"

namespace theta_core {

/// 价格 -> zone_id（按锁定带宽向下取整）。
std::int64_t ZoneIdForPrice(double price, const LockedDoctrine& doctrine);

/// 账本事件类型：结果写回 / 重试记账 / 会话重置。
enum class LedgerEventType {
  kOutcome,
  kRetry,
  kReset,
};

/// 账本事件：账本状态完全由事件序列重放得到。
struct LedgerEvent {
  LedgerEventType type{LedgerEventType::kOutcome};
  std::int64_t ts_ms{0};       ///< 触发 bar 的时间戳，重启时据此恢复会话日。
  std::int64_t bar_index{0};
  std::int64_t zone_id{0};
  Direction direction{Direction::kLong};
  Outcome outcome{Outcome::kLoss};
  bool corroborated{false};
};

inline const char* ToString(LedgerEventType type) {
  switch (type) {
    case LedgerEventType::kOutcome:
      return "OUTCOME";
    case LedgerEventType::kRetry:
      return "RETRY";
    case LedgerEventType::kReset:
      return "RESET";
  }
  return "UNKNOWN";
}

/**
 * @brief Zone 持久性账本（事件溯源）
 *
 * 约束：
 * 1. PersistenceRecord 只在此处修改，外部只能拿到副本；
 * 2. 同 zone 同方向连续亏损达到锁定阈值即塌缩，直到 Reset 前拒绝该方向入场；
 *    另一方向的亏损计数互不影响；
 * 3. 每个品种单写者，不做内部加锁。
 */
class ZoneLedger {
 public:
  explicit ZoneLedger(const LockedDoctrine& doctrine) : doctrine_(doctrine) {}

  /**
   * @brief 写回一笔交易结果
   *
   * @param corroborated 该笔成功是否满足快速回测佐证（亏损时忽略）
   * @return true 表示本次写回使该 zone 方向进入塌缩
   */
  bool RecordOutcome(std::int64_t zone_id,
                     Direction direction,
                     Outcome outcome,
                     bool corroborated,
                     std::int64_t bar_index,
                     std::int64_t ts_ms = 0);

  /// θ=2 重试入场记账（消耗 zone 的重试预算）。
  void RecordRetry(std::int64_t zone_id, Direction direction,
                   std::int64_t bar_index, std::int64_t ts_ms = 0);

  /// 查询 zone 记录；未出现过的 zone 返回空。
  std::optional<PersistenceRecord> Query(std::int64_t zone_id) const;

  /// 清空全部记录（仅限会话/交易日边界）。
  void Reset(std::int64_t bar_index, std::int64_t ts_ms = 0);

  /**
   * @brief 应用单条事件
   *
   * 在线写回与日志重放共用同一路径，保证重启后状态一致。
   * @return true 表示该事件使 zone 的某一方向进入塌缩
   */
  bool Apply(const LedgerEvent& event);

  const std::vector<LedgerEvent>& events() const { return events_; }
  std::size_t zone_count() const { return records_.size(); }

 private:
  const LockedDoctrine& doctrine_;
  std::unordered_map<std::int64_t, PersistenceRecord> records_;
  std::vector<LedgerEvent> events_;  ///< 追加写，包含 Reset 之前的历史。
};

}  // namespace theta_core
