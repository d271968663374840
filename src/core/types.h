#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace theta_core {

/// 交易方向：多/空（与 STB 点火方向一一对应）。
enum class Direction {
  kLong,
  kShort,
};

/// 原始 K 线：由外部行情源产出，进入核心后不可变。
struct Bar {
  std::int64_t ts_ms{0};
  std::int64_t index{0};
  double open{0.0};
  double high{0.0};
  double low{0.0};
  double close{0.0};
  double delta{0.0};  // 成交量派生 delta（主动买 - 主动卖）
};

/// 终端时间分类：极值出现得快/慢。
enum class Terminal {
  kFast,
  kSlow,
};

/// 单根 K 线的指标快照（只读，创建后不再修改）。
struct IndicatorSet {
  std::int64_t ts_ms{0};
  std::int64_t bar_index{0};
  double close{0.0};
  double ratio{1.0};          // (close-low)/(high-close)，方向比。
  double channel{50.0};       // 窗口内收盘位置百分比 [0, 100]。
  double channel_range{0.0};  // 窗口 high-low 跨度。
  double body_z{0.0};         // 实体 z-score（相对窗口历史实体）。
  double er{0.5};             // 效率比 [0, 1]。
  double force_ratio{1.0};    // 买方力 / 卖方力。
  double delta{0.0};
  double depth{0.5};          // (high_W - close) / range_W。
  double depth_slope{0.0};
  double dc_pre{1.0};         // 当前振幅 / 前序平均振幅。
  double terminal_time_r{1.0};
  Terminal terminal{Terminal::kSlow};
  bool burst_event{false};
};

/// STB 点火事件：仅表示“可进入认证”，不代表入场。
struct IgnitionEvent {
  std::int64_t bar_index{0};
  Direction direction{Direction::kLong};
  std::int64_t zone_id{0};
  IndicatorSet indicators;
};

/// 交易结果（写回 Zone Ledger）。
enum class Outcome {
  kWin,
  kLoss,
};

/// 单方向亏损状态：连续亏损与塌缩按 zone + 方向独立累计。
struct DirectionalLoss {
  int loss_streak{0};     // 该方向连续亏损数（该方向成功时清零）。
  bool collapsed{false};  // 塌缩后拒绝该方向入场，直到会话重置。
};

/// Zone 持久性记录：仅由 ZoneLedger 持有和修改。
struct PersistenceRecord {
  std::int64_t zone_id{0};
  std::int64_t creation_index{0};
  Direction last_direction{Direction::kLong};
  int consecutive_same_direction_count{0};
  int success_streak{0};  // 同方向连续成功数（遇亏损或换向清零）。
  std::optional<Outcome> last_outcome;
  bool last_success_corroborated{false};  // 最近一次成功是否满足快速回测条件。
  DirectionalLoss long_side;
  DirectionalLoss short_side;
  int retry_attempts{0};
  int wins{0};
  int losses{0};
};

/// 运行资格层级：标准 / 保守（保守模式仅允许 θ≥3）。
enum class EligibilityTier {
  kStandard,
  kConservative,
};

/// 执行摩擦估计：由外部执行协作方按候选给出。
struct ExecutionFriction {
  double slippage{0.0};
  double spread{0.0};
  int latency_ms{0};
};

/// 拒绝/放行原因码：任何拒绝都必须带原因，禁止静默跳过。
enum class ReasonCode {
  kNone,
  kAllowed,
  kStateNotCertified,
  kTierRestricted,
  kZoneCollapsed,
  kExecutionFriction,
  kStaleFeed,
  kPositionOpen,
};

/// 执行策略输出：每个候选现算，不跨 bar 缓存。
struct PolicyDecision {
  bool allow{false};
  double size_multiplier{0.0};
  bool retry_allowed{false};
  bool trailing_allowed{false};
  ReasonCode reason{ReasonCode::kNone};
};

/// 持仓生命周期阶段。
enum class PositionPhase {
  kOpen,
  kTrailing,
  kClosed,
};

/// 离场类型。
enum class ExitReason {
  kTakeProfit,
  kTrailingStop,
  kStopLoss,
  kGapAtOpen,
  kFlattened,
};

/// 持仓：由 RiskController 持有，离场即销毁。
struct Position {
  std::int64_t id{0};
  Direction direction{Direction::kLong};
  double entry_price{0.0};
  std::int64_t entry_index{0};
  std::int64_t zone_id{0};
  int theta_at_entry{0};
  double size_multiplier{0.0};
  bool shadow{false};              // 影子仓位：只观测，不下单。
  bool extension_allowed{false};   // θ≥3 允许越过固定止盈。
  PositionPhase phase{PositionPhase::kOpen};
  bool defense_active{false};
  int bars_held{0};
  double mfe{0.0};
  double stop_loss{0.0};           // 当前止损价位（随 defense 单向收紧）。
  double stop_loss_distance{0.0};
  std::optional<double> trail_stop;
  double take_profit{0.0};
  int impulse_count{0};            // 刷新 MFE 的 bar 数。
  int underwater_run{0};           // 当前连续水下 bar 数。
  int max_underwater_run{0};       // 最长连续水下 bar 数（恢复时间）。
};

/// 离场事件：交给外部执行/告警协作方，并驱动 Zone Ledger 写回。
struct ExitEvent {
  std::int64_t position_id{0};
  std::int64_t bar_index{0};
  std::int64_t zone_id{0};
  Direction direction{Direction::kLong};
  ExitReason reason{ExitReason::kStopLoss};
  double entry_price{0.0};
  double exit_price{0.0};
  double pnl{0.0};
  double mfe{0.0};
  bool shadow{false};
  bool corroborated{false};  // 是否满足快速回测条件（供 θ=2 判定）。
};

/// 核心故障码：特征/看门狗/校验层以返回值上报，不抛异常。
enum class CoreFault {
  kNone,
  kInsufficientWindow,  ///< 窗口不足，跳过本 bar 认证。
  kStaleFeed,           ///< 行情陈旧，冻结新入场。
  kCorruptBar,          ///< 坏 bar，流水线停机待人工确认。
  kPipelineHalted,      ///< 停机期间到达的 bar，直接丢弃。
};

/// 方向符号：多=+1，空=-1。
inline double DirectionSign(Direction direction) {
  return direction == Direction::kLong ? 1.0 : -1.0;
}

inline const DirectionalLoss& LossSide(const PersistenceRecord& record,
                                       Direction direction) {
  return direction == Direction::kLong ? record.long_side : record.short_side;
}

inline DirectionalLoss& LossSide(PersistenceRecord& record, Direction direction) {
  return direction == Direction::kLong ? record.long_side : record.short_side;
}

/// zone 是否对该方向塌缩。
inline bool IsCollapsed(const PersistenceRecord& record, Direction direction) {
  return LossSide(record, direction).collapsed;
}

inline const char* ToString(Direction direction) {
  switch (direction) {
    case Direction::kLong:
      return "LONG";
    case Direction::kShort:
      return "SHORT";
  }
  return "UNKNOWN";
}

inline const char* ToString(Terminal terminal) {
  switch (terminal) {
    case Terminal::kFast:
      return "FAST";
    case Terminal::kSlow:
      return "SLOW";
  }
  return "UNKNOWN";
}

inline const char* ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::kWin:
      return "WIN";
    case Outcome::kLoss:
      return "LOSS";
  }
  return "UNKNOWN";
}

inline const char* ToString(EligibilityTier tier) {
  switch (tier) {
    case EligibilityTier::kStandard:
      return "STANDARD";
    case EligibilityTier::kConservative:
      return "CONSERVATIVE";
  }
  return "UNKNOWN";
}

/// ReasonCode 文本化（日志与决策记录共用）。
inline const char* ToString(ReasonCode reason) {
  switch (reason) {
    case ReasonCode::kNone:
      return "NONE";
    case ReasonCode::kAllowed:
      return "ALLOWED";
    case ReasonCode::kStateNotCertified:
      return "STATE_NOT_CERTIFIED";
    case ReasonCode::kTierRestricted:
      return "TIER_RESTRICTED";
    case ReasonCode::kZoneCollapsed:
      return "ZONE_COLLAPSED";
    case ReasonCode::kExecutionFriction:
      return "EXECUTION_FRICTION";
    case ReasonCode::kStaleFeed:
      return "STALE_FEED";
    case ReasonCode::kPositionOpen:
      return "POSITION_OPEN";
  }
  return "UNKNOWN";
}

inline const char* ToString(CoreFault fault) {
  switch (fault) {
    case CoreFault::kNone:
      return "OK";
    case CoreFault::kInsufficientWindow:
      return "INSUFFICIENT_WINDOW";
    case CoreFault::kStaleFeed:
      return "STALE_FEED";
    case CoreFault::kCorruptBar:
      return "CORRUPT_BAR";
    case CoreFault::kPipelineHalted:
      return "PIPELINE_HALTED";
  }
  return "UNKNOWN";
}

inline const char* ToString(PositionPhase phase) {
  switch (phase) {
    case PositionPhase::kOpen:
      return "OPEN";
    case PositionPhase::kTrailing:
      return "TRAILING";
    case PositionPhase::kClosed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

inline const char* ToString(ExitReason reason) {
  switch (reason) {
    case ExitReason::kTakeProfit:
      return "TAKE_PROFIT";
    case ExitReason::kTrailingStop:
      return "TRAILING_STOP";
    case ExitReason::kStopLoss:
      return "STOP_LOSS";
    case ExitReason::kGapAtOpen:
      return "GAP_AT_OPEN";
    case ExitReason::kFlattened:
      return "FLATTENED";
  }
  return "UNKNOWN";
}

}  // namespace theta_core
