#include "system/decision_core.h"

#include <sstream>

#include "core/log.h"

namespace theta_core {

namespace {

constexpr std::int64_t kMsPerDay = 86400000;

std::int64_t UtcDay(std::int64_t ts_ms) {
  std::int64_t day = ts_ms / kMsPerDay;
  if (ts_ms % kMsPerDay < 0) {
    --day;
  }
  return day;
}

PolicyDecision PositionOccupied() {
  PolicyDecision decision;
  decision.allow = false;
  decision.reason = ReasonCode::kPositionOpen;
  return decision;
}

}  // namespace

DecisionCore::DecisionCore(const LockedDoctrine& doctrine,
                           const AppConfig& config,
                           const LedgerJournal* journal)
    : config_(config),
      journal_(journal),
      window_(static_cast<std::size_t>(doctrine.window_bars)),
      features_(doctrine),
      gate_(doctrine),
      ledger_(doctrine),
      policy_(doctrine, config.friction.max_latency_ms),
      mode_(config.mode_switch.fast_collapse_threshold),
      risk_(doctrine),
      watchdog_(config.feed) {}

BarDecision DecisionCore::OnBar(const Bar& bar,
                                const ExecutionFriction& friction) {
  BarDecision out;
  out.ts_ms = bar.ts_ms;
  out.bar_index = bar.index;

  if (halted_) {
    out.status = CoreFault::kPipelineHalted;
    out.fault_detail = "流水线停机中，等待人工确认";
    out.mode = mode_.mode();
    return out;
  }

  std::string reject_reason;
  if (!validator_.Check(bar, &reject_reason)) {
    halted_ = true;
    out.status = CoreFault::kCorruptBar;
    out.fault_detail = reject_reason;
    out.mode = mode_.mode();
    LogError("PIPELINE_HALT: " + reject_reason);
    return out;
  }
  validator_.Accept(bar);
  last_bar_index_ = bar.index;
  last_bar_ts_ms_ = bar.ts_ms;

  const std::int64_t day = UtcDay(bar.ts_ms);
  if (config_.session.auto_reset_on_day_change && session_day_.has_value() &&
      *session_day_ != day) {
    ResetSession();
    // 跨日间隔不是行情中断。
    watchdog_.Reset();
    out.session_reset = true;
  }
  session_day_ = day;

  if (const auto alert = watchdog_.OnBar(bar); alert.has_value()) {
    if (*alert == "FEED_STALE") {
      LogWarn("FEED_STALE: bar=" + std::to_string(bar.index) + "，冻结新入场");
    } else {
      LogInfo(*alert + ": bar=" + std::to_string(bar.index));
    }
  }
  window_.Push(bar);

  // 先推进既有持仓：开仓 bar 之后的每根 bar 才参与离场判定。
  if (auto exit = risk_.OnBar(bar); exit.has_value()) {
    if (position_session_ == session_seq_) {
      WriteBack(*exit, bar.ts_ms);
    } else {
      LogWarn("EXIT_CROSS_SESSION: position=" + std::to_string(exit->position_id) +
              ", zone=" + std::to_string(exit->zone_id) + "，结果不写回新会话账本");
    }
    out.exits.push_back(*exit);
  }

  IndicatorSet indicators;
  CoreFault fault = CoreFault::kNone;
  if (!features_.Extract(window_, &indicators, &fault)) {
    out.status = fault;
    out.mode = mode_.mode();
    return out;
  }

  int record_theta = 0;
  if (const auto ignition = gate_.Evaluate(indicators); ignition.has_value()) {
    EntryDecision entry = HandleIgnition(*ignition, friction, bar.close);
    record_theta = entry.theta;
    out.entry = entry;
  }

  if (watchdog_.stale()) {
    out.status = CoreFault::kStaleFeed;
  }
  out.record = BuildDecisionRecord(indicators, record_theta,
                                   config_.record.delta_large_threshold);
  out.mode = mode_.mode();
  return out;
}

EntryDecision DecisionCore::HandleIgnition(const IgnitionEvent& ignition,
                                           const ExecutionFriction& friction,
                                           double entry_price) {
  EntryDecision entry;
  entry.ignition = ignition;

  const auto certified = certifier_.Certify(ignition, ledger_);
  if (!certified.has_value()) {
    // 时间戳/序号已单调校验，此处只可能是重复投递。
    entry.policy.reason = ReasonCode::kStateNotCertified;
    LogWarn("IGNITION_REPLAYED: bar=" + std::to_string(ignition.bar_index));
    return entry;
  }
  const bool stale = watchdog_.stale();
  entry.theta = stale ? 0 : *certified;

  const auto zone = ledger_.Query(ignition.zone_id);
  // 塌缩否决优先于持仓占用。
  const bool collapsed =
      zone.has_value() && IsCollapsed(*zone, ignition.direction);
  if (risk_.has_position() && !collapsed) {
    entry.policy = PositionOccupied();
  } else {
    entry.policy = policy_.Decide(entry.theta, ignition.direction, mode_.tier(),
                                  zone, friction, stale);
  }

  std::ostringstream oss;
  oss << "bar=" << ignition.bar_index << ", zone=" << ignition.zone_id
      << ", dir=" << ToString(ignition.direction) << ", theta=" << entry.theta;

  if (entry.policy.allow) {
    const OpenRequest request{
        .direction = ignition.direction,
        .entry_price = entry_price,
        .entry_index = ignition.bar_index,
        .zone_id = ignition.zone_id,
        .theta = entry.theta,
        .size_multiplier = entry.policy.size_multiplier,
        .shadow = false,
        .extension_allowed =
            entry.theta >= kThetaLockIn && entry.policy.trailing_allowed,
    };
    std::string error;
    if (!risk_.Open(request, &error)) {
      LogError("ENTRY_FAILED: " + oss.str() + ", error=" + error);
      return entry;
    }
    entry.opened = true;
    entry.position_id = risk_.position()->id;
    position_session_ = session_seq_;
    if (entry.theta == 2 && entry.policy.retry_allowed) {
      ledger_.RecordRetry(ignition.zone_id, ignition.direction, ignition.bar_index,
                          ignition.indicators.ts_ms);
      Journal(ledger_.events().back());
    }
    LogInfo("ENTRY: " + oss.str() + ", size=" +
            std::to_string(entry.policy.size_multiplier));
    return entry;
  }

  LogInfo(std::string("ENTRY_DENIED: ") + oss.str() +
          ", reason=" + ToString(entry.policy.reason));
  if (config_.shadow_probe_enabled && ShadowEligible(entry.policy.reason)) {
    const OpenRequest request{
        .direction = ignition.direction,
        .entry_price = entry_price,
        .entry_index = ignition.bar_index,
        .zone_id = ignition.zone_id,
        .theta = entry.theta,
        .size_multiplier = 0.0,
        .shadow = true,
        .extension_allowed = false,
    };
    std::string error;
    if (!risk_.Open(request, &error)) {
      LogError("SHADOW_FAILED: " + oss.str() + ", error=" + error);
      return entry;
    }
    entry.opened = true;
    entry.shadow = true;
    entry.position_id = risk_.position()->id;
    position_session_ = session_seq_;
  }
  return entry;
}

bool DecisionCore::ShadowEligible(ReasonCode reason) {
  switch (reason) {
    case ReasonCode::kStateNotCertified:
    case ReasonCode::kTierRestricted:
    case ReasonCode::kStaleFeed:
    case ReasonCode::kExecutionFriction:
      return true;
    case ReasonCode::kNone:
    case ReasonCode::kAllowed:
    case ReasonCode::kZoneCollapsed:
    case ReasonCode::kPositionOpen:
      return false;
  }
  return false;
}

void DecisionCore::WriteBack(const ExitEvent& exit, std::int64_t ts_ms) {
  const Outcome outcome = exit.pnl > 0.0 ? Outcome::kWin : Outcome::kLoss;
  const bool collapsed =
      ledger_.RecordOutcome(exit.zone_id, exit.direction, outcome,
                            exit.corroborated, exit.bar_index, ts_ms);
  Journal(ledger_.events().back());

  std::ostringstream oss;
  oss << (exit.shadow ? "SHADOW_EXIT" : "EXIT") << ": position=" << exit.position_id
      << ", zone=" << exit.zone_id << ", reason=" << ToString(exit.reason)
      << ", entry=" << exit.entry_price << ", exit=" << exit.exit_price
      << ", pnl=" << exit.pnl << ", outcome=" << ToString(outcome);
  LogInfo(oss.str());

  if (collapsed) {
    LogWarn("ZONE_COLLAPSE: zone=" + std::to_string(exit.zone_id) +
            ", dir=" + ToString(exit.direction));
    if (mode_.RecordCollapse()) {
      LogWarn("MODE_SWITCH: CONSERVATIVE, collapses=" +
              std::to_string(mode_.collapse_count()));
    }
  }
}

void DecisionCore::Journal(const LedgerEvent& event) {
  if (journal_ == nullptr) {
    return;
  }
  std::string error;
  if (!journal_->Append(event, &error)) {
    LogError("LEDGER_JOURNAL_FAILED: " + error);
  }
}

void DecisionCore::AcknowledgeHalt() {
  if (!halted_) {
    return;
  }
  halted_ = false;
  LogInfo("PIPELINE_RESUMED: last_bar=" + std::to_string(last_bar_index_));
}

std::optional<ExitEvent> DecisionCore::Flatten(double price) {
  auto exit = risk_.Flatten(last_bar_index_, price);
  if (exit.has_value()) {
    LogInfo("FLATTEN: position=" + std::to_string(exit->position_id) +
            ", price=" + std::to_string(price));
  }
  return exit;
}

void DecisionCore::ResetSession() {
  ledger_.Reset(last_bar_index_, last_bar_ts_ms_);
  Journal(ledger_.events().back());
  mode_.ResetSession();
  ++session_seq_;
  LogInfo("SESSION_RESET: bar=" + std::to_string(last_bar_index_));
}

void DecisionCore::OnWatchdogTimeout() {
  if (watchdog_.OnExternalTimeout().has_value()) {
    LogWarn("FEED_STALE: 外部计时器超时，冻结新入场");
  }
}

void DecisionCore::RestoreLedger(const std::vector<LedgerEvent>& events) {
  for (const LedgerEvent& event : events) {
    const bool collapsed = ledger_.Apply(event);
    if (event.type == LedgerEventType::kReset) {
      mode_.ResetSession();
    } else if (collapsed) {
      mode_.RecordCollapse();
    }
  }
  if (!events.empty() && events.back().ts_ms > 0) {
    session_day_ = UtcDay(events.back().ts_ms);
  }
  LogInfo("LEDGER_RESTORED: events=" + std::to_string(events.size()) +
          ", zones=" + std::to_string(ledger_.zone_count()) +
          ", collapses=" + std::to_string(mode_.collapse_count()) +
          ", mode=" + ToString(mode_.mode()));
}

}  // namespace theta_core
