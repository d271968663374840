#include <algorithm>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "certify/state_certifier.h"
#include "core/config.h"
#include "core/doctrine.h"
#include "feature/feature_extractor.h"
#include "gate/entry_gate.h"
#include "market/bar_validator.h"
#include "market/bar_window.h"
#include "market/csv_bar_feed.h"
#include "monitor/feed_watchdog.h"
#include "policy/execution_policy.h"
#include "policy/mode_controller.h"
#include "record/decision_record.h"
#include "risk/risk_controller.h"
#include "storage/ledger_journal.h"
#include "system/decision_core.h"
#include "system/instrument_host.h"
#include "zone/zone_ledger.h"

namespace {

// 该测试文件覆盖决策核心关键链路：
// - 配置/doctrine/行情校验；
// - 特征、点火、认证、执行策略、风控状态机；
// - 单品种流水线与多品种宿主。
bool NearlyEqual(double lhs, double rhs, double eps = 1e-6) {
  return std::fabs(lhs - rhs) < eps;
}

constexpr std::int64_t kDayStartMs = 1700006400000;  // UTC 零点。
constexpr std::int64_t kBarMs = 60000;

/**
 * 脚本化行情：每个周期 20 根 bar（12 根平静 + 1 根冲高 + 6 根平静 + 1 根点火），
 * 点火为 LONG，收盘 1030（zone 10）；之后接 4 根盈利 bar（止盈 1050，快速回测成立）
 * 或 1 根亏损 bar（止损 1000）。
 */
class BarScript {
 public:
  theta_core::Bar Make(double open, double high, double low, double close,
                       double delta = 0.0) {
    theta_core::Bar bar;
    bar.ts_ms = ts_ms_;
    bar.index = index_;
    bar.open = open;
    bar.high = high;
    bar.low = low;
    bar.close = close;
    bar.delta = delta;
    ts_ms_ += kBarMs;
    ++index_;
    return bar;
  }

  void SkipTime(std::int64_t ms) { ts_ms_ += ms; }
  void JumpToNextDay() { ts_ms_ = (ts_ms_ / 86400000 + 1) * 86400000 + 1000; }

  theta_core::Bar Calm(int step) {
    const double body = (step % 2 == 0) ? 1.0 : 2.0;
    return Make(1050.0, 1050.0 + 2.0 * body, 1050.0, 1050.0 + body);
  }

  std::vector<theta_core::Bar> Setup() {
    std::vector<theta_core::Bar> bars;
    for (int i = 0; i < 12; ++i) {
      bars.push_back(Calm(i));
    }
    bars.push_back(Make(1050.0, 1080.0, 1049.5, 1065.0));
    for (int i = 0; i < 6; ++i) {
      bars.push_back(Calm(i));
    }
    return bars;
  }

  theta_core::Bar Ignition() { return Make(1050.0, 1050.0, 1029.0, 1030.0); }

  std::vector<theta_core::Bar> Win() {
    return {Make(1030.0, 1034.0, 1029.5, 1033.0),
            Make(1033.0, 1038.0, 1032.5, 1037.0),
            Make(1037.0, 1042.0, 1036.8, 1041.0),
            Make(1041.0, 1051.0, 1040.8, 1050.0)};
  }

  std::vector<theta_core::Bar> Loss() {
    return {Make(1030.0, 1031.0, 999.0, 1015.0)};
  }

 private:
  std::int64_t ts_ms_{kDayStartMs};
  std::int64_t index_{0};
};

theta_core::AppConfig TestConfig() {
  theta_core::AppConfig config;
  config.session.auto_reset_on_day_change = false;
  return config;
}

// 依次喂入 bar，返回最后一根的决策结果。
theta_core::BarDecision Feed(theta_core::DecisionCore* core,
                             const std::vector<theta_core::Bar>& bars,
                             std::vector<theta_core::BarDecision>* out_all = nullptr) {
  theta_core::BarDecision last;
  for (const auto& bar : bars) {
    last = core->OnBar(bar);
    if (out_all != nullptr) {
      out_all->push_back(last);
    }
  }
  return last;
}

theta_core::LedgerEvent LongLoss(std::int64_t zone_id, std::int64_t ts_ms) {
  theta_core::LedgerEvent event;
  event.type = theta_core::LedgerEventType::kOutcome;
  event.ts_ms = ts_ms;
  event.zone_id = zone_id;
  event.direction = theta_core::Direction::kLong;
  event.outcome = theta_core::Outcome::kLoss;
  return event;
}

theta_core::OpenRequest LongAt(double price, bool extension = false) {
  theta_core::OpenRequest request;
  request.direction = theta_core::Direction::kLong;
  request.entry_price = price;
  request.entry_index = 0;
  request.zone_id = 1;
  request.theta = extension ? 3 : 1;
  request.size_multiplier = 1.0;
  request.extension_allowed = extension;
  return request;
}

theta_core::Bar RawBar(std::int64_t index, double open, double high, double low,
                       double close) {
  theta_core::Bar bar;
  bar.ts_ms = kDayStartMs + index * kBarMs;
  bar.index = index;
  bar.open = open;
  bar.high = high;
  bar.low = low;
  bar.close = close;
  return bar;
}

}  // namespace

int main() {
  const theta_core::LockedDoctrine& doctrine = theta_core::ReferenceDoctrine();

  {
    // 配置解析：字段覆盖 + 锁定参数禁止覆盖。
    const auto path =
        std::filesystem::temp_directory_path() / "theta_core_test_config.yaml";
    {
      std::ofstream out(path);
      out << "mode: replay\n"
          << "symbols: [\"NQ\", ES]  # 多品种\n"
          << "bars_path: data/{symbol}.csv\n"
          << "shadow_probe_enabled: false\n"
          << "feed:\n"
          << "  stale_bound_ms: 120000\n"
          << "  resume_bars: 3\n"
          << "friction:\n"
          << "  max_latency_ms: 250\n"
          << "session:\n"
          << "  auto_reset_on_day_change: false\n"
          << "mode_switch:\n"
          << "  fast_collapse_threshold: 7\n"
          << "record:\n"
          << "  delta_large_threshold: 0.75\n"
          << "doctrine:\n"
          << "  version: \"v7.4-locked\"\n";
    }
    theta_core::AppConfig config;
    std::string error;
    if (!theta_core::LoadAppConfigFromYaml(path.string(), &config, &error)) {
      std::cerr << "预期配置解析成功: " << error << "\n";
      return 1;
    }
    if (config.symbols.size() != 2 || config.symbols[0] != "NQ" ||
        config.symbols[1] != "ES" || config.bars_path != "data/{symbol}.csv" ||
        config.shadow_probe_enabled || config.feed.stale_bound_ms != 120000 ||
        config.feed.resume_bars != 3 || config.friction.max_latency_ms != 250 ||
        config.session.auto_reset_on_day_change ||
        config.mode_switch.fast_collapse_threshold != 7 ||
        !NearlyEqual(config.record.delta_large_threshold, 0.75) ||
        config.doctrine.version != "v7.4-locked") {
      std::cerr << "配置字段解析结果不符合预期\n";
      return 1;
    }

    {
      std::ofstream out(path);
      out << "doctrine:\n"
          << "  mfe_threshold: 5\n";
    }
    theta_core::AppConfig rejected;
    if (theta_core::LoadAppConfigFromYaml(path.string(), &rejected, &error)) {
      std::cerr << "预期配置覆盖锁定参数时解析失败\n";
      return 1;
    }

    {
      std::ofstream out(path);
      out << "feed:\n"
          << "  resume_bars: abc\n";
    }
    if (theta_core::LoadAppConfigFromYaml(path.string(), &rejected, &error) ||
        error.find("feed.resume_bars") == std::string::npos) {
      std::cerr << "预期非法 resume_bars 报错并带字段名\n";
      return 1;
    }
    std::filesystem::remove(path);
  }

  {
    // doctrine 指纹：确定性 + 版本/指纹校验。
    std::string first;
    std::string second;
    std::string error;
    if (!theta_core::DoctrineFingerprint(doctrine, &first, &error) ||
        !theta_core::DoctrineFingerprint(doctrine, &second, &error)) {
      std::cerr << "doctrine 指纹计算失败: " << error << "\n";
      return 1;
    }
    if (first != second || first.size() != 64) {
      std::cerr << "预期 doctrine 指纹稳定且为 64 位十六进制\n";
      return 1;
    }
    if (!theta_core::VerifyDoctrine(doctrine, "v7.4-locked", first, &error)) {
      std::cerr << "预期 doctrine 校验通过: " << error << "\n";
      return 1;
    }
    if (theta_core::VerifyDoctrine(doctrine, "v7.3", "", &error)) {
      std::cerr << "预期版本不一致时校验失败\n";
      return 1;
    }
    if (theta_core::VerifyDoctrine(doctrine, "v7.4-locked", std::string(64, '0'),
                                   &error)) {
      std::cerr << "预期指纹不一致时校验失败\n";
      return 1;
    }
    if (theta_core::CanonicalText(doctrine).find("mfe_threshold=7;") ==
        std::string::npos) {
      std::cerr << "预期规范化文本包含 mfe_threshold=7\n";
      return 1;
    }
  }

  {
    // 坏 bar 检测。
    theta_core::BarValidator validator;
    std::string error;
    const auto good = RawBar(1, 100.0, 101.0, 99.0, 100.5);
    if (!validator.Check(good, &error)) {
      std::cerr << "预期正常 bar 通过校验: " << error << "\n";
      return 1;
    }
    validator.Accept(good);

    auto nan_bar = RawBar(2, 100.0, 101.0, 99.0, 100.5);
    nan_bar.close = std::numeric_limits<double>::quiet_NaN();
    auto inverted = RawBar(2, 100.0, 99.0, 101.0, 100.0);
    auto open_outside = RawBar(2, 102.0, 101.0, 99.0, 100.0);
    auto stale_index = RawBar(1, 100.0, 101.0, 99.0, 100.5);
    stale_index.ts_ms += 5 * kBarMs;
    auto stale_ts = RawBar(3, 100.0, 101.0, 99.0, 100.5);
    stale_ts.ts_ms = good.ts_ms;
    for (const auto& bad : {nan_bar, inverted, open_outside, stale_index, stale_ts}) {
      if (validator.Check(bad, &error)) {
        std::cerr << "预期坏 bar 被拒绝: index=" << bad.index << "\n";
        return 1;
      }
    }
  }

  {
    // CSV 行解析：非法数值记为 NaN，交由校验层处理。
    theta_core::Bar bar;
    std::string error;
    if (!theta_core::ParseBarCsvLine("1700006400000,7,100,101,99,100.5,-3.5",
                                     &bar, &error) ||
        bar.index != 7 || !NearlyEqual(bar.delta, -3.5)) {
      std::cerr << "预期 CSV 行解析成功\n";
      return 1;
    }
    if (!theta_core::ParseBarCsvLine("1700006400000,8,100,abc,99,100.5,0",
                                     &bar, &error) ||
        !std::isnan(bar.high)) {
      std::cerr << "预期非法数值解析为 NaN\n";
      return 1;
    }
    if (theta_core::ParseBarCsvLine("1700006400000,8,100", &bar, &error)) {
      std::cerr << "预期字段不足时报错\n";
      return 1;
    }

    const auto path =
        std::filesystem::temp_directory_path() / "theta_core_test_bars.csv";
    {
      std::ofstream out(path);
      out << "ts_ms,index,open,high,low,close,delta\n"
          << "1700006400000,0,100,101,99,100.5,1\r\n"
          << "1700006460000,1,100.5,102,100,101,2\n";
    }
    std::vector<theta_core::Bar> bars;
    if (!theta_core::LoadBarsFromCsv(path.string(), &bars, &error) ||
        bars.size() != 2 || bars[1].index != 1) {
      std::cerr << "预期 CSV 文件加载 2 根 bar: " << error << "\n";
      return 1;
    }
    std::filesystem::remove(path);
  }

  {
    // 特征提取：窗口不足 + 平盘默认值 + 点火 bar 数值。
    theta_core::FeatureExtractor extractor(doctrine);
    theta_core::BarWindow window(20);
    for (int i = 0; i < 19; ++i) {
      window.Push(RawBar(i, 100.0, 100.0, 100.0, 100.0));
    }
    theta_core::IndicatorSet indicators;
    theta_core::CoreFault fault = theta_core::CoreFault::kNone;
    if (extractor.Extract(window, &indicators, &fault) ||
        fault != theta_core::CoreFault::kInsufficientWindow) {
      std::cerr << "预期 19 根 bar 时返回 InsufficientWindow\n";
      return 1;
    }
    window.Push(RawBar(19, 100.0, 100.0, 100.0, 100.0));
    if (!extractor.Extract(window, &indicators, &fault)) {
      std::cerr << "预期 20 根 bar 时特征提取成功\n";
      return 1;
    }
    if (!NearlyEqual(indicators.ratio, 1.0) || !NearlyEqual(indicators.channel, 50.0) ||
        !NearlyEqual(indicators.er, 1.0) || !NearlyEqual(indicators.force_ratio, 10.0) ||
        !NearlyEqual(indicators.depth, 0.5) || !NearlyEqual(indicators.dc_pre, 1.0) ||
        !NearlyEqual(indicators.body_z, 0.0) || indicators.burst_event ||
        indicators.terminal != theta_core::Terminal::kFast) {
      std::cerr << "平盘窗口特征默认值不符合预期\n";
      return 1;
    }

    BarScript script;
    theta_core::BarWindow cycle(20);
    for (const auto& bar : script.Setup()) {
      cycle.Push(bar);
    }
    cycle.Push(script.Ignition());
    if (!extractor.Extract(cycle, &indicators, &fault)) {
      std::cerr << "预期点火窗口特征提取成功\n";
      return 1;
    }
    if (!NearlyEqual(indicators.ratio, 0.05) ||
        !NearlyEqual(indicators.channel, 100.0 / 51.0) ||
        !NearlyEqual(indicators.channel_range, 51.0) || indicators.body_z < 1.0 ||
        !indicators.burst_event) {
      std::cerr << "点火 bar 特征不符合预期: ratio=" << indicators.ratio
                << ", channel=" << indicators.channel
                << ", body_z=" << indicators.body_z << "\n";
      return 1;
    }

    theta_core::EntryGate gate(doctrine);
    const auto ignition = gate.Evaluate(indicators);
    if (!ignition.has_value() || ignition->direction != theta_core::Direction::kLong ||
        ignition->zone_id != 10) {
      std::cerr << "预期点火窗口产生 LONG 点火，zone=10\n";
      return 1;
    }
  }

  {
    // 点火门：固定合取条件。
    theta_core::EntryGate gate(doctrine);
    theta_core::IndicatorSet base;
    base.close = 250.0;
    base.channel_range = 40.0;
    base.body_z = -1.5;

    auto short_case = base;
    short_case.ratio = 2.0;
    short_case.channel = 90.0;
    const auto short_ignition = gate.Evaluate(short_case);
    if (!short_ignition.has_value() ||
        short_ignition->direction != theta_core::Direction::kShort ||
        short_ignition->zone_id != 2) {
      std::cerr << "预期 ratio>1.5 且 channel>80 时产生 SHORT 点火\n";
      return 1;
    }

    auto narrow = short_case;
    narrow.channel_range = 29.0;
    auto weak_body = short_case;
    weak_body.body_z = 0.5;
    auto middle = short_case;
    middle.channel = 60.0;
    for (const auto& rejected : {narrow, weak_body, middle}) {
      if (gate.Evaluate(rejected).has_value()) {
        std::cerr << "预期不满足合取条件时无点火\n";
        return 1;
      }
    }
  }

  {
    // Zone 账本：同向计数、按方向连续亏损塌缩、会话重置。
    theta_core::ZoneLedger ledger(doctrine);
    if (theta_core::ZoneIdForPrice(1099.99, doctrine) != 10 ||
        theta_core::ZoneIdForPrice(-0.5, doctrine) != -1) {
      std::cerr << "zone 量化不符合预期\n";
      return 1;
    }
    if (ledger.Query(10).has_value()) {
      std::cerr << "预期未出现的 zone 查询为空\n";
      return 1;
    }
    ledger.RecordOutcome(10, theta_core::Direction::kShort, theta_core::Outcome::kWin, true, 5);
    ledger.RecordOutcome(10, theta_core::Direction::kShort, theta_core::Outcome::kWin, false, 9);
    auto record = ledger.Query(10);
    if (!record.has_value() || record->consecutive_same_direction_count != 2 ||
        record->success_streak != 2 || record->last_success_corroborated ||
        record->creation_index != 5) {
      std::cerr << "预期同向两次成功后计数为 2\n";
      return 1;
    }
    ledger.RecordOutcome(10, theta_core::Direction::kLong, theta_core::Outcome::kWin, true, 12);
    record = ledger.Query(10);
    if (record->consecutive_same_direction_count != 1 || record->success_streak != 1) {
      std::cerr << "预期换向后计数重置为 1\n";
      return 1;
    }

    const auto long_dir = theta_core::Direction::kLong;
    const auto short_dir = theta_core::Direction::kShort;
    const bool long_loss =
        ledger.RecordOutcome(10, long_dir, theta_core::Outcome::kLoss, false, 15);
    const bool short_loss =
        ledger.RecordOutcome(10, short_dir, theta_core::Outcome::kLoss, false, 18);
    record = ledger.Query(10);
    if (long_loss || short_loss || theta_core::IsCollapsed(*record, long_dir) ||
        theta_core::IsCollapsed(*record, short_dir) || record->losses != 2) {
      std::cerr << "预期一多一空两次亏损不触发塌缩\n";
      return 1;
    }
    const bool second_long_loss =
        ledger.RecordOutcome(10, long_dir, theta_core::Outcome::kLoss, false, 19);
    record = ledger.Query(10);
    if (!second_long_loss || !theta_core::IsCollapsed(*record, long_dir) ||
        theta_core::IsCollapsed(*record, short_dir) ||
        record->long_side.loss_streak != 2 || record->short_side.loss_streak != 1) {
      std::cerr << "预期同向第二次连续亏损仅使该方向塌缩\n";
      return 1;
    }
    ledger.RecordOutcome(10, short_dir, theta_core::Outcome::kWin, true, 20);
    record = ledger.Query(10);
    if (!theta_core::IsCollapsed(*record, long_dir) ||
        record->short_side.loss_streak != 0 || record->long_side.loss_streak != 2) {
      std::cerr << "预期空头成功只清空头亏损计数，多头塌缩在重置前保持\n";
      return 1;
    }
    ledger.Reset(21);
    if (ledger.Query(10).has_value() || ledger.events().size() != 8) {
      std::cerr << "预期重置清空记录但保留事件历史\n";
      return 1;
    }
  }

  {
    // 状态认证：θ 推导 + 点火事件只消费一次。
    theta_core::ZoneLedger ledger(doctrine);
    theta_core::StateCertifier certifier;
    theta_core::IgnitionEvent ignition;
    ignition.zone_id = 3;
    ignition.direction = theta_core::Direction::kShort;
    ignition.bar_index = 10;
    if (certifier.Certify(ignition, ledger) != std::optional<int>(0)) {
      std::cerr << "预期新 zone θ=0\n";
      return 1;
    }
    if (certifier.Certify(ignition, ledger).has_value() ||
        certifier.last_consumed_index() != std::optional<std::int64_t>(10)) {
      std::cerr << "预期同一点火事件第二次认证被拒绝\n";
      return 1;
    }

    const auto short_dir = theta_core::Direction::kShort;
    ledger.RecordOutcome(3, short_dir, theta_core::Outcome::kWin, false, 11);
    if (theta_core::StateCertifier::ThetaFor(ledger.Query(3), short_dir) != 1 ||
        theta_core::StateCertifier::ThetaFor(ledger.Query(3),
                                             theta_core::Direction::kLong) != 0) {
      std::cerr << "预期首次成功 θ=1，反方向 θ=0\n";
      return 1;
    }
    ledger.RecordOutcome(3, short_dir, theta_core::Outcome::kWin, false, 12);
    if (theta_core::StateCertifier::ThetaFor(ledger.Query(3), short_dir) != 1) {
      std::cerr << "预期连胜 2 次但无快速回测佐证时 θ 保持 1\n";
      return 1;
    }
    theta_core::ZoneLedger corroborated(doctrine);
    corroborated.RecordOutcome(4, short_dir, theta_core::Outcome::kWin, true, 1);
    corroborated.RecordOutcome(4, short_dir, theta_core::Outcome::kWin, true, 2);
    if (theta_core::StateCertifier::ThetaFor(corroborated.Query(4), short_dir) != 2) {
      std::cerr << "预期连胜 2 次且快速回测成立时 θ=2\n";
      return 1;
    }
    corroborated.RecordOutcome(4, short_dir, theta_core::Outcome::kWin, false, 3);
    if (theta_core::StateCertifier::ThetaFor(corroborated.Query(4), short_dir) !=
        theta_core::kThetaLockIn) {
      std::cerr << "预期连胜 3 次 θ≥3\n";
      return 1;
    }
    corroborated.RecordOutcome(4, short_dir, theta_core::Outcome::kLoss, false, 4);
    if (theta_core::StateCertifier::ThetaFor(corroborated.Query(4), short_dir) != 0) {
      std::cerr << "预期任意亏损后 θ 回到 0\n";
      return 1;
    }
  }

  {
    // 执行策略：硬否决优先 + θ 表。
    theta_core::ExecutionPolicy policy(doctrine, 500);
    const theta_core::ExecutionFriction calm{};
    const auto standard = theta_core::EligibilityTier::kStandard;
    const auto long_dir = theta_core::Direction::kLong;

    const auto uncertified =
        policy.Decide(0, long_dir, standard, std::nullopt, calm, false);
    if (uncertified.allow ||
        uncertified.reason != theta_core::ReasonCode::kStateNotCertified) {
      std::cerr << "预期 θ=0 拒绝\n";
      return 1;
    }
    const auto birth = policy.Decide(1, long_dir, standard, std::nullopt, calm, false);
    if (!birth.allow || !NearlyEqual(birth.size_multiplier, 1.0) ||
        birth.retry_allowed || birth.trailing_allowed) {
      std::cerr << "预期 θ=1：1x，无重试，无 trailing\n";
      return 1;
    }

    theta_core::PersistenceRecord zone;
    zone.zone_id = 8;
    const auto transition = policy.Decide(2, long_dir, standard, zone, calm, false);
    zone.retry_attempts = 1;
    const auto exhausted = policy.Decide(2, long_dir, standard, zone, calm, false);
    if (!transition.allow || !transition.retry_allowed ||
        !NearlyEqual(transition.size_multiplier, 2.0) || exhausted.retry_allowed ||
        !NearlyEqual(exhausted.size_multiplier, 1.0)) {
      std::cerr << "预期 θ=2 重试预算内 2x，用尽后 1x\n";
      return 1;
    }
    const auto lock_in = policy.Decide(5, long_dir, standard, zone, calm, false);
    if (!lock_in.allow || !NearlyEqual(lock_in.size_multiplier, 4.0) ||
        !lock_in.retry_allowed || !lock_in.trailing_allowed) {
      std::cerr << "预期 θ≥3：4x，允许重试与 trailing\n";
      return 1;
    }

    zone.long_side.collapsed = true;
    const theta_core::ExecutionFriction slippy{.slippage = 3.5, .spread = 0.0, .latency_ms = 0};
    if (policy.Decide(3, long_dir, standard, zone, slippy, true).reason !=
        theta_core::ReasonCode::kZoneCollapsed) {
      std::cerr << "预期塌缩否决优先\n";
      return 1;
    }
    if (!policy.Decide(3, theta_core::Direction::kShort, standard, zone, calm, false)
             .allow) {
      std::cerr << "预期多头塌缩不影响空头入场\n";
      return 1;
    }
    zone.long_side.collapsed = false;
    const theta_core::ExecutionFriction wide{.slippage = 0.0, .spread = 2.5, .latency_ms = 0};
    const theta_core::ExecutionFriction slow{.slippage = 0.0, .spread = 0.0, .latency_ms = 900};
    for (const auto& friction : {slippy, wide, slow}) {
      if (policy.Decide(3, long_dir, standard, zone, friction, false).reason !=
          theta_core::ReasonCode::kExecutionFriction) {
        std::cerr << "预期摩擦越限否决\n";
        return 1;
      }
    }
    if (policy.Decide(3, long_dir, standard, zone, calm, true).reason !=
        theta_core::ReasonCode::kStaleFeed) {
      std::cerr << "预期行情陈旧否决\n";
      return 1;
    }
    const auto conservative = theta_core::EligibilityTier::kConservative;
    if (policy.Decide(2, long_dir, conservative, zone, calm, false).reason !=
            theta_core::ReasonCode::kTierRestricted ||
        !policy.Decide(3, long_dir, conservative, zone, calm, false).allow) {
      std::cerr << "预期保守层级仅允许 θ≥3\n";
      return 1;
    }
  }

  {
    // 模式切换：会话内塌缩次数超过阈值切 CONSERVATIVE。
    theta_core::ModeController mode(5);
    for (int i = 0; i < 5; ++i) {
      if (mode.RecordCollapse()) {
        std::cerr << "预期塌缩次数未超过阈值时不切换\n";
        return 1;
      }
    }
    if (!mode.RecordCollapse() ||
        mode.tier() != theta_core::EligibilityTier::kConservative) {
      std::cerr << "预期第 6 次塌缩切到 CONSERVATIVE\n";
      return 1;
    }
    mode.ResetSession();
    if (mode.mode() != theta_core::OperationMode::kNormal || mode.collapse_count() != 0) {
      std::cerr << "预期会话重置恢复 NORMAL\n";
      return 1;
    }
  }

  {
    // 场景：入场 100，bar5 MFE=9 -> trail 107.5；bar6 MFE=12 -> trail 110.5。
    theta_core::RiskController risk(doctrine);
    std::string error;
    if (!risk.Open(LongAt(100.0), &error)) {
      std::cerr << "开仓失败: " << error << "\n";
      return 1;
    }
    if (risk.Open(LongAt(100.0), &error)) {
      std::cerr << "预期已有持仓时拒绝重复开仓\n";
      return 1;
    }
    const std::vector<theta_core::Bar> path = {
        RawBar(1, 100.0, 102.0, 99.5, 101.0), RawBar(2, 101.0, 102.0, 100.0, 101.0),
        RawBar(3, 101.0, 102.0, 100.0, 101.0), RawBar(4, 101.0, 102.0, 100.0, 101.0),
        RawBar(5, 101.0, 109.0, 100.5, 108.0)};
    for (const auto& bar : path) {
      if (risk.OnBar(bar).has_value()) {
        std::cerr << "预期 bar" << bar.index << " 不离场\n";
        return 1;
      }
    }
    const auto& position = risk.position();
    if (position->phase != theta_core::PositionPhase::kTrailing ||
        !NearlyEqual(*position->trail_stop, 107.5) || position->defense_active) {
      std::cerr << "预期 bar5 后 trail=107.5\n";
      return 1;
    }
    if (risk.OnBar(RawBar(6, 108.0, 112.0, 107.8, 111.5)).has_value() ||
        !NearlyEqual(*risk.position()->trail_stop, 110.5)) {
      std::cerr << "预期 bar6 后 trail 收紧到 110.5\n";
      return 1;
    }
    if (risk.OnBar(RawBar(7, 111.5, 112.0, 111.0, 111.2)).has_value() ||
        !NearlyEqual(*risk.position()->trail_stop, 110.5)) {
      std::cerr << "预期 MFE 未刷新时 trail 保持 110.5\n";
      return 1;
    }
    const auto exit = risk.OnBar(RawBar(8, 111.2, 111.5, 109.0, 109.5));
    if (!exit.has_value() || exit->reason != theta_core::ExitReason::kTrailingStop ||
        !NearlyEqual(exit->exit_price, 110.5) || !NearlyEqual(exit->pnl, 10.5) ||
        risk.has_position()) {
      std::cerr << "预期按 trail 110.5 离场\n";
      return 1;
    }
  }

  {
    // 场景：持仓 5 根 bar MFE 维持 1.0，bar4 触发防御，止损 30 -> 12，不可逆。
    theta_core::RiskController risk(doctrine);
    std::string error;
    risk.Open(LongAt(100.0), &error);
    for (int i = 1; i <= 5; ++i) {
      if (risk.OnBar(RawBar(i, 100.0, 101.0, 99.0, 100.0)).has_value()) {
        std::cerr << "预期防御场景不离场\n";
        return 1;
      }
      const auto& position = *risk.position();
      if (i < 4 && (position.defense_active || !NearlyEqual(position.stop_loss, 70.0))) {
        std::cerr << "预期 bar" << i << " 防御未触发\n";
        return 1;
      }
      if (i >= 4 && (!position.defense_active || !NearlyEqual(position.stop_loss, 88.0) ||
                     !NearlyEqual(position.stop_loss_distance, 12.0))) {
        std::cerr << "预期 bar" << i << " 防御止损为 12\n";
        return 1;
      }
    }
    // MFE 之后再超过阈值也不回退。
    risk.OnBar(RawBar(6, 100.0, 105.0, 99.0, 104.0));
    if (!risk.position()->defense_active || !NearlyEqual(risk.position()->stop_loss, 88.0)) {
      std::cerr << "预期防御不可逆\n";
      return 1;
    }
    const auto exit = risk.OnBar(RawBar(7, 104.0, 104.5, 87.0, 90.0));
    if (!exit.has_value() || exit->reason != theta_core::ExitReason::kStopLoss ||
        !NearlyEqual(exit->exit_price, 88.0)) {
      std::cerr << "预期按防御止损 88 离场\n";
      return 1;
    }
  }

  {
    // 跳空：开盘越过止损按开盘价成交；越过止盈同样按开盘价。
    theta_core::RiskController risk(doctrine);
    std::string error;
    risk.Open(LongAt(100.0), &error);
    auto exit = risk.OnBar(RawBar(1, 60.0, 65.0, 55.0, 62.0));
    if (!exit.has_value() || exit->reason != theta_core::ExitReason::kGapAtOpen ||
        !NearlyEqual(exit->exit_price, 60.0) || !NearlyEqual(exit->pnl, -40.0)) {
      std::cerr << "预期跳空止损按开盘价 60 成交\n";
      return 1;
    }
    risk.Open(LongAt(100.0), &error);
    exit = risk.OnBar(RawBar(2, 125.0, 126.0, 124.0, 125.5));
    if (!exit.has_value() || exit->reason != theta_core::ExitReason::kGapAtOpen ||
        !NearlyEqual(exit->exit_price, 125.0)) {
      std::cerr << "预期跳空越过止盈按开盘价 125 成交\n";
      return 1;
    }

    // 同一根 bar 同时触及止损与止盈：止损优先。
    risk.Open(LongAt(100.0), &error);
    exit = risk.OnBar(RawBar(3, 100.0, 121.0, 69.0, 100.0));
    if (!exit.has_value() || exit->reason != theta_core::ExitReason::kStopLoss ||
        !NearlyEqual(exit->exit_price, 70.0)) {
      std::cerr << "预期同 bar 双触发时止损优先\n";
      return 1;
    }

    // 普通止盈。
    risk.Open(LongAt(100.0), &error);
    exit = risk.OnBar(RawBar(4, 100.0, 121.0, 99.0, 118.0));
    if (!exit.has_value() || exit->reason != theta_core::ExitReason::kTakeProfit ||
        !NearlyEqual(exit->exit_price, 120.0)) {
      std::cerr << "预期按止盈 120 离场\n";
      return 1;
    }

    // θ≥3 扩展：越过固定止盈不离场，由 trail 接管。
    risk.Open(LongAt(100.0, /*extension=*/true), &error);
    exit = risk.OnBar(RawBar(5, 100.0, 125.0, 99.0, 124.0));
    if (exit.has_value() || !NearlyEqual(*risk.position()->trail_stop, 123.5)) {
      std::cerr << "预期扩展仓位越过止盈继续持有，trail=123.5\n";
      return 1;
    }
    exit = risk.Flatten(6, 124.0);
    if (!exit.has_value() || exit->reason != theta_core::ExitReason::kFlattened ||
        risk.has_position()) {
      std::cerr << "预期 Flatten 清空持仓\n";
      return 1;
    }

    // 空头方向对称：止损在入场上方。
    theta_core::OpenRequest short_request = LongAt(100.0);
    short_request.direction = theta_core::Direction::kShort;
    risk.Open(short_request, &error);
    if (!NearlyEqual(risk.position()->stop_loss, 130.0) ||
        !NearlyEqual(risk.position()->take_profit, 80.0)) {
      std::cerr << "预期空头止损 130 止盈 80\n";
      return 1;
    }
    exit = risk.OnBar(RawBar(7, 100.0, 131.0, 99.0, 120.0));
    if (!exit.has_value() || !NearlyEqual(exit->exit_price, 130.0) ||
        !NearlyEqual(exit->pnl, -30.0)) {
      std::cerr << "预期空头按 130 止损\n";
      return 1;
    }
  }

  {
    // 性质：连续行情下，MFE≥7 之后不再实现亏损；trail 单调；防御单向。
    std::mt19937 rng(20240611);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    theta_core::RiskController risk(doctrine);
    double price = 1000.0;
    std::int64_t index = 0;
    int armed_exits = 0;
    for (int trial = 0; trial < 3000; ++trial) {
      theta_core::OpenRequest request = LongAt(price, /*extension=*/unit(rng) < 0.3);
      request.direction = unit(rng) < 0.5 ? theta_core::Direction::kLong
                                          : theta_core::Direction::kShort;
      std::string error;
      if (!risk.Open(request, &error)) {
        std::cerr << "随机性质测试开仓失败: " << error << "\n";
        return 1;
      }
      const double sign = theta_core::DirectionSign(request.direction);
      std::optional<double> last_trail;
      bool defense_seen = false;
      for (int step = 0; step < 300 && risk.has_position(); ++step) {
        const double open = price;
        const double close = open + (unit(rng) - 0.5) * 8.0;
        const double high = std::max(open, close) + unit(rng) * 5.0;
        const double low = std::min(open, close) - unit(rng) * 5.0;
        ++index;
        const double mfe_before = risk.position()->mfe;
        const auto exit = risk.OnBar(RawBar(index, open, high, low, close));
        price = close;
        if (exit.has_value()) {
          if (exit->mfe >= doctrine.mfe_threshold) {
            ++armed_exits;
            if (exit->pnl <= 0.0) {
              std::cerr << "MFE≥7 之后实现亏损: pnl=" << exit->pnl << "\n";
              return 1;
            }
          }
          if (mfe_before >= doctrine.mfe_threshold && exit->pnl <= 0.0) {
            std::cerr << "MFE≥7 之后实现亏损（bar 前）\n";
            return 1;
          }
          break;
        }
        const auto& position = *risk.position();
        if (position.trail_stop.has_value()) {
          if (last_trail.has_value() && sign * (*position.trail_stop - *last_trail) < 0.0) {
            std::cerr << "trail 向不利方向移动\n";
            return 1;
          }
          last_trail = position.trail_stop;
        }
        if (defense_seen && (!position.defense_active ||
                             !NearlyEqual(position.stop_loss_distance, 12.0))) {
          std::cerr << "防御状态被回退\n";
          return 1;
        }
        defense_seen = position.defense_active;
      }
      if (risk.has_position()) {
        risk.Flatten(index, price);
      }
    }
    if (armed_exits == 0) {
      std::cerr << "随机性质测试未覆盖 trailing 离场\n";
      return 1;
    }
  }

  {
    // 流水线：θ 0 -> 1 -> 2 -> 3，影子探测积累首个成功。
    theta_core::DecisionCore core(doctrine, TestConfig());
    BarScript script;
    std::vector<theta_core::BarDecision> all;

    auto setup = Feed(&core, script.Setup(), &all);
    if (setup.status != theta_core::CoreFault::kInsufficientWindow) {
      std::cerr << "预期前 19 根 bar 窗口不足\n";
      return 1;
    }
    struct Expect {
      int theta;
      theta_core::ReasonCode reason;
      double size;
      bool shadow;
      bool trailing;
    };
    const std::vector<Expect> expects = {
        {0, theta_core::ReasonCode::kStateNotCertified, 0.0, true, false},
        {1, theta_core::ReasonCode::kAllowed, 1.0, false, false},
        {2, theta_core::ReasonCode::kAllowed, 2.0, false, false},
        {3, theta_core::ReasonCode::kAllowed, 4.0, false, true},
    };
    for (std::size_t cycle = 0; cycle < expects.size(); ++cycle) {
      if (cycle > 0) {
        Feed(&core, script.Setup(), &all);
      }
      const auto decision = core.OnBar(script.Ignition());
      all.push_back(decision);
      const Expect& expect = expects[cycle];
      if (!decision.entry.has_value() || !decision.record.has_value() ||
          decision.entry->theta != expect.theta ||
          decision.entry->policy.reason != expect.reason ||
          !NearlyEqual(decision.entry->policy.size_multiplier, expect.size) ||
          decision.entry->shadow != expect.shadow || !decision.entry->opened ||
          decision.entry->policy.trailing_allowed != expect.trailing) {
        std::cerr << "周期 " << cycle << " 入场结果不符合预期\n";
        return 1;
      }
      if (cycle == 3) {
        if (!core.position().has_value() || !core.position()->extension_allowed) {
          std::cerr << "预期 θ≥3 持仓允许越过止盈\n";
          return 1;
        }
        break;
      }
      const auto last = Feed(&core, script.Win(), &all);
      if (last.exits.size() != 1 ||
          last.exits[0].reason != theta_core::ExitReason::kTakeProfit ||
          !last.exits[0].corroborated || last.exits[0].shadow != expect.shadow) {
        std::cerr << "周期 " << cycle << " 预期止盈且快速回测成立\n";
        return 1;
      }
    }
    const auto record = core.ledger().Query(10);
    if (!record.has_value() || record->success_streak != 3 ||
        record->retry_attempts != 1 || record->wins != 3) {
      std::cerr << "预期 zone 10 连胜 3 且记录 1 次重试\n";
      return 1;
    }
    // 任意 bar 上 θ=0 必然拒绝。
    for (const auto& decision : all) {
      if (decision.entry.has_value() && decision.entry->theta == 0 &&
          decision.entry->policy.allow) {
        std::cerr << "θ=0 却被放行\n";
        return 1;
      }
    }
  }

  {
    // 流水线：同 zone 连续两次亏损后，第三个候选无论 θ 都被拒绝。
    theta_core::DecisionCore core(doctrine, TestConfig());
    BarScript script;
    for (int cycle = 0; cycle < 2; ++cycle) {
      Feed(&core, script.Setup());
      const auto decision = core.OnBar(script.Ignition());
      if (!decision.entry.has_value() || !decision.entry->shadow) {
        std::cerr << "预期亏损周期 " << cycle << " 建立影子仓\n";
        return 1;
      }
      const auto last = Feed(&core, script.Loss());
      if (last.exits.size() != 1 || last.exits[0].pnl >= 0.0) {
        std::cerr << "预期亏损周期 " << cycle << " 止损离场\n";
        return 1;
      }
    }
    Feed(&core, script.Setup());
    const auto third = core.OnBar(script.Ignition());
    if (!third.entry.has_value() ||
        third.entry->policy.reason != theta_core::ReasonCode::kZoneCollapsed ||
        third.entry->opened || core.position().has_value()) {
      std::cerr << "预期第三个候选因 zone 塌缩被拒绝且不探测\n";
      return 1;
    }
    if (core.mode_controller().collapse_count() != 1) {
      std::cerr << "预期模式控制器记录 1 次塌缩\n";
      return 1;
    }
    core.ResetSession();
    if (core.ledger().Query(10).has_value()) {
      std::cerr << "预期会话重置后塌缩解除\n";
      return 1;
    }
  }

  {
    // 流水线：持仓占用时后续点火报告 POSITION_OPEN。
    theta_core::DecisionCore core(doctrine, TestConfig());
    BarScript script;
    Feed(&core, script.Setup());
    core.OnBar(script.Ignition());
    // 持仓未离场（价格停在入场附近）时再次出现点火形态。
    Feed(&core, {script.Make(1030.0, 1031.0, 1029.5, 1030.5)});
    const auto again = core.OnBar(script.Make(1030.5, 1030.5, 1010.0, 1011.0));
    if (!again.entry.has_value() ||
        again.entry->policy.reason != theta_core::ReasonCode::kPositionOpen ||
        again.entry->opened) {
      std::cerr << "预期持仓占用时报告 POSITION_OPEN\n";
      return 1;
    }
  }

  {
    // 持仓占用且候选方向已塌缩：报告 ZONE_COLLAPSED 而非 POSITION_OPEN。
    theta_core::DecisionCore core(doctrine, TestConfig());
    BarScript script;
    Feed(&core, script.Setup());
    const auto first = core.OnBar(script.Ignition());
    if (!first.entry.has_value() || !first.entry->shadow || !core.position().has_value()) {
      std::cerr << "预期首个候选建立影子仓\n";
      return 1;
    }
    core.RestoreLedger({LongLoss(10, kDayStartMs), LongLoss(10, kDayStartMs)});
    Feed(&core, {script.Make(1030.0, 1031.0, 1029.5, 1030.5)});
    const auto again = core.OnBar(script.Make(1030.5, 1030.5, 1010.0, 1011.0));
    if (!again.entry.has_value() ||
        again.entry->policy.reason != theta_core::ReasonCode::kZoneCollapsed ||
        again.entry->opened || !core.position().has_value() ||
        core.position()->id != first.entry->position_id) {
      std::cerr << "预期塌缩否决优先于持仓占用\n";
      return 1;
    }
  }

  {
    // 摩擦越限：点火被拒绝并转影子探测。
    theta_core::DecisionCore core(doctrine, TestConfig());
    BarScript script;
    Feed(&core, script.Setup());
    const auto decision = core.OnBar(
        script.Ignition(), theta_core::ExecutionFriction{.slippage = 5.0, .spread = 0.0, .latency_ms = 0});
    if (!decision.entry.has_value() ||
        decision.entry->policy.reason != theta_core::ReasonCode::kExecutionFriction ||
        !decision.entry->shadow) {
      std::cerr << "预期滑点越限返回 EXECUTION_FRICTION\n";
      return 1;
    }
  }

  {
    // 行情陈旧：间隔超限冻结入场，正常 bar 到达后恢复；外部超时同理。
    theta_core::DecisionCore core(doctrine, TestConfig());
    BarScript script;
    Feed(&core, script.Setup());
    script.SkipTime(600000);
    const auto decision = core.OnBar(script.Ignition());
    if (decision.status != theta_core::CoreFault::kStaleFeed || !core.stale() ||
        !decision.entry.has_value() || decision.entry->theta != 0 ||
        decision.entry->policy.reason != theta_core::ReasonCode::kStaleFeed ||
        !decision.record.has_value()) {
      std::cerr << "预期陈旧行情冻结入场并返回 STALE_FEED\n";
      return 1;
    }
    Feed(&core, {script.Win()[0]});
    if (core.stale()) {
      std::cerr << "预期正常 bar 到达后恢复\n";
      return 1;
    }
    core.OnWatchdogTimeout();
    if (!core.stale()) {
      std::cerr << "预期外部超时进入陈旧状态\n";
      return 1;
    }
  }

  {
    // 坏 bar：停机 -> 丢弃后续 bar -> 人工确认后恢复。
    theta_core::DecisionCore core(doctrine, TestConfig());
    BarScript script;
    Feed(&core, {script.Calm(0), script.Calm(1)});
    const auto corrupt = core.OnBar(script.Make(1050.0, 1040.0, 1060.0, 1050.0));
    if (corrupt.status != theta_core::CoreFault::kCorruptBar || !core.halted()) {
      std::cerr << "预期坏 bar 使流水线停机\n";
      return 1;
    }
    const auto dropped = core.OnBar(script.Calm(2));
    if (dropped.status != theta_core::CoreFault::kPipelineHalted) {
      std::cerr << "预期停机期间 bar 被丢弃\n";
      return 1;
    }
    core.AcknowledgeHalt();
    const auto resumed = core.OnBar(script.Calm(3));
    if (core.halted() || resumed.status != theta_core::CoreFault::kInsufficientWindow) {
      std::cerr << "预期确认后恢复处理\n";
      return 1;
    }
  }

  {
    // 取消：平仓不写回账本；跨日自动重置账本。
    theta_core::AppConfig config = TestConfig();
    config.session.auto_reset_on_day_change = true;
    theta_core::DecisionCore core(doctrine, config);
    BarScript script;
    Feed(&core, script.Setup());
    core.OnBar(script.Ignition());
    const auto flattened = core.Flatten(1031.0);
    if (!flattened.has_value() ||
        flattened->reason != theta_core::ExitReason::kFlattened ||
        core.ledger().Query(10).has_value() || core.position().has_value()) {
      std::cerr << "预期 Flatten 不写回账本\n";
      return 1;
    }

    Feed(&core, script.Setup());
    core.OnBar(script.Ignition());
    Feed(&core, script.Win());
    if (!core.ledger().Query(10).has_value()) {
      std::cerr << "预期盈利写回账本\n";
      return 1;
    }
    script.JumpToNextDay();
    const auto next_day = core.OnBar(script.Calm(0));
    if (!next_day.session_reset || core.ledger().Query(10).has_value() ||
        core.stale()) {
      std::cerr << "预期跨日自动重置账本\n";
      return 1;
    }
  }

  {
    // 跨日持仓：离场照常上报，但结果不写入新会话账本。
    theta_core::AppConfig config = TestConfig();
    config.session.auto_reset_on_day_change = true;
    theta_core::DecisionCore core(doctrine, config);
    BarScript script;
    Feed(&core, script.Setup());
    const auto opened = core.OnBar(script.Ignition());
    if (!opened.entry.has_value() || !opened.entry->opened) {
      std::cerr << "预期跨日前建立持仓\n";
      return 1;
    }
    script.JumpToNextDay();
    std::vector<theta_core::BarDecision> all;
    Feed(&core, script.Win(), &all);
    if (!all.front().session_reset) {
      std::cerr << "预期次日首根 bar 触发会话重置\n";
      return 1;
    }
    std::size_t exits = 0;
    for (const auto& decision : all) {
      exits += decision.exits.size();
    }
    if (exits != 1 || all.back().exits.size() != 1 ||
        all.back().exits[0].reason != theta_core::ExitReason::kTakeProfit) {
      std::cerr << "预期跨日持仓照常止盈并上报\n";
      return 1;
    }
    if (core.ledger().Query(10).has_value() || core.ledger().events().size() != 1 ||
        core.ledger().events()[0].type != theta_core::LedgerEventType::kReset) {
      std::cerr << "预期上一会话的结果不写回新会话账本\n";
      return 1;
    }
  }

  {
    // 重启恢复：塌缩次数与运行模式随账本一起重建，RESET 之前的塌缩不计。
    std::vector<theta_core::LedgerEvent> events;
    for (std::int64_t zone = 1; zone <= 6; ++zone) {
      events.push_back(LongLoss(zone, kDayStartMs + zone * kBarMs));
      events.push_back(LongLoss(zone, kDayStartMs + zone * kBarMs));
    }
    theta_core::DecisionCore restored(doctrine, TestConfig());
    restored.RestoreLedger(events);
    if (restored.mode() != theta_core::OperationMode::kConservative ||
        restored.mode_controller().collapse_count() != 6) {
      std::cerr << "预期重放 6 次塌缩后恢复为 CONSERVATIVE\n";
      return 1;
    }

    theta_core::LedgerEvent reset;
    reset.type = theta_core::LedgerEventType::kReset;
    reset.ts_ms = kDayStartMs + 7 * kBarMs;
    events.insert(events.begin() + 6, reset);
    theta_core::DecisionCore after_reset(doctrine, TestConfig());
    after_reset.RestoreLedger(events);
    if (after_reset.mode() != theta_core::OperationMode::kNormal ||
        after_reset.mode_controller().collapse_count() != 3 ||
        after_reset.ledger().Query(1).has_value() ||
        !after_reset.ledger().Query(6).has_value()) {
      std::cerr << "预期只计入 RESET 之后的 3 次塌缩\n";
      return 1;
    }
  }

  {
    // 重启恢复：会话日取自最后一条事件，重启后首根跨日 bar 仍触发重置。
    theta_core::AppConfig config = TestConfig();
    config.session.auto_reset_on_day_change = true;
    const std::vector<theta_core::LedgerEvent> events = {
        LongLoss(10, kDayStartMs + 5 * kBarMs)};

    theta_core::DecisionCore same_day(doctrine, config);
    same_day.RestoreLedger(events);
    BarScript today;
    const auto first_today = same_day.OnBar(today.Calm(0));
    if (first_today.session_reset || !same_day.ledger().Query(10).has_value()) {
      std::cerr << "预期同日重启不重置账本\n";
      return 1;
    }

    theta_core::DecisionCore next_day(doctrine, config);
    next_day.RestoreLedger(events);
    BarScript tomorrow;
    tomorrow.JumpToNextDay();
    const auto first_tomorrow = next_day.OnBar(tomorrow.Calm(0));
    if (!first_tomorrow.session_reset || next_day.ledger().Query(10).has_value()) {
      std::cerr << "预期跨日重启后首根 bar 重置账本\n";
      return 1;
    }
  }

  {
    // 决策记录：island_id 分箱与 CSV 格式。
    theta_core::IndicatorSet indicators;
    indicators.ts_ms = 1700006400000;
    indicators.bar_index = 42;
    indicators.depth = 0.6;
    indicators.dc_pre = 0.5;
    indicators.delta = -1.0;
    indicators.force_ratio = 1.5;
    indicators.er = 0.7;
    indicators.channel = 85.0;
    indicators.terminal = theta_core::Terminal::kFast;
    indicators.burst_event = true;
    if (theta_core::BuildIslandId(indicators, 3, 0.5) !=
        "High_Comp_Large_Strong_High_High_Top") {
      std::cerr << "island_id 不符合预期: "
                << theta_core::BuildIslandId(indicators, 3, 0.5) << "\n";
      return 1;
    }
    auto low = indicators;
    low.depth = 0.3;
    low.dc_pre = 1.0;
    low.delta = 0.2;
    low.force_ratio = 1.0;
    low.er = 0.2;
    low.channel = 50.0;
    if (theta_core::BuildIslandId(low, 1, 0.5) != "Low_Loose_Small_Weak_Low_Low_Mid") {
      std::cerr << "低位 island_id 不符合预期\n";
      return 1;
    }
    low.channel = 10.0;
    if (theta_core::BuildIslandId(low, 0, 0.5) != "Low_Loose_Small_Weak_Low_Low_Bot") {
      std::cerr << "预期 channel<20 记为 Bot\n";
      return 1;
    }

    const auto fast = theta_core::BuildDecisionRecord(indicators, 3, 0.5);
    const std::string line = theta_core::ToCsvLine(fast);
    if (line.rfind("1700006400000,42,", 0) != 0 ||
        line.find(",FAST,High_Comp_Large_Strong_High_High_Top,1,") == std::string::npos ||
        std::count(line.begin(), line.end(), ',') != 10) {
      std::cerr << "决策记录 CSV 行不符合预期: " << line << "\n";
      return 1;
    }
    auto slow = indicators;
    slow.terminal = theta_core::Terminal::kSlow;
    const auto slow_record = theta_core::BuildDecisionRecord(slow, 3, 0.5);
    if (!slow_record.island_id.empty() ||
        theta_core::ToCsvLine(slow_record).find(",SLOW,,") == std::string::npos) {
      std::cerr << "预期 SLOW 时 island_id 为空\n";
      return 1;
    }
    if (theta_core::DecisionCsvHeader() !=
        "ts,idx,depth,depth_slope,terminal,island_id,burst_event,dc_pre,er,delta,channel") {
      std::cerr << "决策记录表头不符合预期\n";
      return 1;
    }
  }

  {
    // 账本日志：写入 -> 重启加载 -> 重放后状态一致。
    const auto path =
        std::filesystem::temp_directory_path() / "theta_core_test_journal" / "ledger.wal";
    std::filesystem::remove_all(path.parent_path());
    theta_core::LedgerJournal journal(path.string());
    std::string error;
    if (!journal.Initialize(&error)) {
      std::cerr << "账本日志初始化失败: " << error << "\n";
      return 1;
    }
    {
      theta_core::DecisionCore core(doctrine, TestConfig(), &journal);
      BarScript script;
      Feed(&core, script.Setup());
      core.OnBar(script.Ignition());
      Feed(&core, script.Win());
    }
    std::vector<theta_core::LedgerEvent> events;
    if (!journal.LoadEvents(&events, &error) || events.size() != 1 ||
        events[0].type != theta_core::LedgerEventType::kOutcome ||
        events[0].outcome != theta_core::Outcome::kWin || events[0].zone_id != 10 ||
        !events[0].corroborated || events[0].ts_ms <= kDayStartMs) {
      std::cerr << "预期日志包含 1 条 OUTCOME WIN 事件: " << error << "\n";
      return 1;
    }
    theta_core::DecisionCore restored(doctrine, TestConfig(), &journal);
    restored.RestoreLedger(events);
    const auto record = restored.ledger().Query(10);
    if (!record.has_value() || record->success_streak != 1) {
      std::cerr << "预期重放后 zone 10 连胜 1\n";
      return 1;
    }
    restored.ResetSession();
    if (!journal.LoadEvents(&events, &error) || events.size() != 2 ||
        events[1].type != theta_core::LedgerEventType::kReset) {
      std::cerr << "预期会话重置写入 RESET 事件\n";
      return 1;
    }
    {
      std::ofstream out(path, std::ios::app);
      out << "BOGUS\t1\t2\n";
    }
    if (journal.LoadEvents(&events, &error)) {
      std::cerr << "预期损坏的日志行报错\n";
      return 1;
    }
    std::filesystem::remove_all(path.parent_path());
  }

  {
    // 看门狗：resume_bars 控制恢复节奏。
    theta_core::FeedConfig feed;
    feed.stale_bound_ms = 1000;
    feed.resume_bars = 2;
    theta_core::FeedWatchdog watchdog(feed);
    watchdog.OnBar(RawBar(0, 1, 1, 1, 1));
    auto gap = RawBar(1, 1, 1, 1, 1);
    gap.ts_ms += 10000;
    if (watchdog.OnBar(gap) != std::optional<std::string>("FEED_STALE")) {
      std::cerr << "预期间隔超限告警 FEED_STALE\n";
      return 1;
    }
    auto next = gap;
    next.ts_ms += 500;
    if (watchdog.OnBar(next).has_value() || !watchdog.stale()) {
      std::cerr << "预期 1 根正常 bar 不足以恢复\n";
      return 1;
    }
    next.ts_ms += 500;
    if (watchdog.OnBar(next) != std::optional<std::string>("FEED_RESUMED") ||
        watchdog.stale()) {
      std::cerr << "预期 2 根正常 bar 后恢复\n";
      return 1;
    }
  }

  {
    // 多品种宿主：每品种独立线程，聚合只读摘要；控制操作与 bar 同队列有序执行。
    theta_core::AppConfig config = TestConfig();
    config.feed.resume_bars = 2;
    theta_core::InstrumentHost host(doctrine, config);
    std::string error;
    if (!host.AddInstrument("NQ", nullptr, {}, &error) ||
        !host.AddInstrument("ES", nullptr, {}, &error)) {
      std::cerr << "品种注册失败: " << error << "\n";
      return 1;
    }
    if (host.AddInstrument("NQ", nullptr, {}, &error)) {
      std::cerr << "预期重复注册失败\n";
      return 1;
    }
    BarScript script;
    std::vector<theta_core::Bar> bars = script.Setup();
    bars.push_back(script.Ignition());
    for (const auto& bar : script.Win()) {
      bars.push_back(bar);
    }
    for (const auto& bar : script.Setup()) {
      bars.push_back(bar);
    }
    bars.push_back(script.Ignition());

    host.Start();
    for (const auto& bar : bars) {
      host.Submit("NQ", bar);
      host.Submit("ES", bar);
    }
    if (host.Submit("CL", bars.front())) {
      std::cerr << "预期未注册品种投递失败\n";
      return 1;
    }
    const theta_core::Bar extra = script.Make(1030.5, 1031.0, 1030.0, 1030.5);
    if (!host.Flatten("NQ", 1031.0) || !host.ReportWatchdogTimeout("ES") ||
        !host.Submit("ES", extra) || !host.ResetSession("ES") ||
        host.Flatten("CL", 1.0) || host.ResetSession("CL")) {
      std::cerr << "预期控制操作仅对已注册品种投递成功\n";
      return 1;
    }
    host.Stop();

    std::vector<theta_core::BarSummary> summaries;
    host.PollSummaries(&summaries);
    if (summaries.size() != bars.size() * 2 + 3) {
      std::cerr << "预期摘要数量为 " << bars.size() * 2 + 3 << "，实际 "
                << summaries.size() << "\n";
      return 1;
    }
    if (host.OpenLiveCount() != 1) {
      std::cerr << "预期 NQ 平仓后仅 ES 持有实盘仓\n";
      return 1;
    }
    int records = 0;
    int nq_flattened = 0;
    int es_flattened = 0;
    bool es_stale = false;
    bool es_reset = false;
    for (const auto& summary : summaries) {
      if (summary.record.has_value()) {
        ++records;
      }
      for (const auto& exit : summary.exits) {
        if (exit.reason == theta_core::ExitReason::kFlattened) {
          ++(summary.symbol == "NQ" ? nq_flattened : es_flattened);
        }
      }
      if (summary.symbol == "ES" && summary.bar_index == extra.index &&
          !summary.session_reset) {
        es_stale = summary.status == theta_core::CoreFault::kStaleFeed;
      }
      if (summary.symbol == "ES" && summary.session_reset) {
        es_reset = summary.live_position_open;
      }
    }
    if (nq_flattened != 1 || es_flattened != 0) {
      std::cerr << "预期仅 NQ 产生一次 FLATTENED 离场\n";
      return 1;
    }
    if (!es_stale || !es_reset) {
      std::cerr << "预期 ES 超时后 bar 为 STALE_FEED，会话重置保留持仓\n";
      return 1;
    }
    if (records != static_cast<int>((bars.size() - 19) * 2 + 1)) {
      std::cerr << "预期窗口满后每根 bar 都有决策记录\n";
      return 1;
    }
  }

  std::cout << "theta_core 测试全部通过\n";
  return 0;
}
