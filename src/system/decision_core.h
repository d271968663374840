#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "certify/state_certifier.h"
#include "core/config.h"
#include "core/doctrine.h"
#include "core/types.h"
#include "feature/feature_extractor.h"
#include "gate/entry_gate.h"
#include "market/bar_validator.h"
#include "market/bar_window.h"
#include "monitor/feed_watchdog.h"
#include "policy/execution_policy.h"
#include "policy/mode_controller.h"
#include "record/decision_record.h"
#include "risk/risk_controller.h"
#include "storage/ledger_journal.h"
#include "zone/zone_ledger.h"

namespace theta_core {

/// 点火候选的处理结果。
struct EntryDecision {
  IgnitionEvent ignition;
  int theta{0};                 ///< 生效 θ（行情陈旧时强制为 0）。
  PolicyDecision policy;        ///< 执行策略结论（持仓占用时为 POSITION_OPEN）。
  bool opened{false};           ///< 是否建立持仓（含影子仓）。
  bool shadow{false};           ///< 建立的是否为影子仓。
  std::int64_t position_id{0};
};

/// 单 bar 处理的分层产物，便于审计回放。
struct BarDecision {
  std::int64_t ts_ms{0};
  std::int64_t bar_index{0};
  CoreFault status{CoreFault::kNone};
  std::string fault_detail;
  std::optional<DecisionRecord> record;   ///< 窗口不足或坏 bar 时为空。
  std::optional<EntryDecision> entry;
  std::vector<ExitEvent> exits;
  bool session_reset{false};
  OperationMode mode{OperationMode::kNormal};
};

/**
 * @brief 单品种决策流水线
 *
 * 每根 bar：校验 -> 会话边界 -> 看门狗 -> 风控推进与结果写回 ->
 * 特征 -> 点火 -> 认证 -> 执行策略 -> 开仓（或影子探测）-> 决策记录。
 *
 * 约束：
 * 1. 单线程顺序处理，一根 bar 处理完才接受下一根；
 * 2. 坏 bar 使流水线停机，直到 `AcknowledgeHalt()`，该 bar 被丢弃；
 * 3. 每个品种最多一个持仓（实盘或影子）；
 * 4. 跨会话重置的持仓离场照常上报，但不写回新会话的账本。
 *
 * 非职责：不下单、不聚合跨品种资金。
 */
class DecisionCore {
 public:
  /**
   * @param journal 账本追加日志（可为空），生命周期由外部管理
   */
  DecisionCore(const LockedDoctrine& doctrine,
               const AppConfig& config,
               const LedgerJournal* journal = nullptr);

  /// 处理一根 bar；`friction` 为外部执行协作方对本 bar 候选的摩擦估计。
  BarDecision OnBar(const Bar& bar, const ExecutionFriction& friction = {});

  /// 人工确认坏 bar 停机，恢复处理。
  void AcknowledgeHalt();

  /// 取消：按给定价格平掉当前持仓，丢弃风控状态，不写回账本。
  std::optional<ExitEvent> Flatten(double price);

  /// 会话/交易日边界：清空账本并恢复 NORMAL 模式。
  void ResetSession();

  /// 外部计时器报告行情超时。
  void OnWatchdogTimeout();

  /**
   * @brief 启动时从账本日志重建会话状态（不重复写日志）
   *
   * 除账本外同时恢复：会话内塌缩次数与运行模式（RESET 之后的塌缩才计入），
   * 以及最后一条事件所在的 UTC 日（用于跨日自动重置判定）。
   */
  void RestoreLedger(const std::vector<LedgerEvent>& events);

  bool halted() const { return halted_; }
  std::int64_t last_bar_index() const { return last_bar_index_; }
  bool stale() const { return watchdog_.stale(); }
  OperationMode mode() const { return mode_.mode(); }
  const ZoneLedger& ledger() const { return ledger_; }
  const std::optional<Position>& position() const { return risk_.position(); }
  ModeController& mode_controller() { return mode_; }

 private:
  /// 结果写回账本；影子仓与实盘仓同样写回。
  void WriteBack(const ExitEvent& exit, std::int64_t ts_ms);
  void Journal(const LedgerEvent& event);
  EntryDecision HandleIgnition(const IgnitionEvent& ignition,
                               const ExecutionFriction& friction,
                               double entry_price);
  static bool ShadowEligible(ReasonCode reason);

  AppConfig config_;
  const LedgerJournal* journal_{nullptr};

  BarValidator validator_;
  BarWindow window_;
  FeatureExtractor features_;
  EntryGate gate_;
  ZoneLedger ledger_;
  StateCertifier certifier_;
  ExecutionPolicy policy_;
  ModeController mode_;
  RiskController risk_;
  FeedWatchdog watchdog_;

  bool halted_{false};
  std::optional<std::int64_t> session_day_;   ///< 当前会话 UTC 日序号。
  std::int64_t last_bar_index_{0};
  std::int64_t last_bar_ts_ms_{0};
  std::uint64_t session_seq_{0};       ///< 每次会话重置递增。
  std::uint64_t position_session_{0};  ///< 当前持仓开仓时的会话序号。
};

}  // namespace theta_core
