#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "core/config.h"
#include "core/doctrine.h"
#include "core/log.h"
#include "market/csv_bar_feed.h"
#include "record/decision_record.h"
#include "storage/ledger_journal.h"
#include "system/instrument_host.h"

namespace {

struct RuntimeOptions {
  std::string config_path{"config/default.yaml"};
  std::string bars_override;
  std::string decisions_override;
  std::string journal_override;
  bool auto_acknowledge_halt{false};
  bool print_fingerprint{false};
};

// 回放统计：仅由主线程基于摘要累计。
struct ReplayStats {
  int bars{0};
  int ignitions{0};
  int live_entries{0};
  int shadow_entries{0};
  int live_wins{0};
  int live_losses{0};
  int corrupt_bars{0};
  int insufficient_window{0};
  std::map<std::string, int> denials;
};

RuntimeOptions ParseOptions(int argc, char** argv) {
  RuntimeOptions options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg.rfind("--config=", 0) == 0) {
      options.config_path = arg.substr(std::string("--config=").size());
      continue;
    }
    if (arg.rfind("--bars=", 0) == 0) {
      options.bars_override = arg.substr(std::string("--bars=").size());
      continue;
    }
    if (arg.rfind("--decisions=", 0) == 0) {
      options.decisions_override = arg.substr(std::string("--decisions=").size());
      continue;
    }
    if (arg.rfind("--journal=", 0) == 0) {
      options.journal_override = arg.substr(std::string("--journal=").size());
      continue;
    }
    if (arg == "--auto_ack" || arg == "--auto-ack") {
      options.auto_acknowledge_halt = true;
      continue;
    }
    if (arg == "--print_fingerprint" || arg == "--print-fingerprint") {
      options.print_fingerprint = true;
      continue;
    }
    theta_core::LogWarn("未知参数，已忽略: " + arg);
  }
  return options;
}

// 路径模板：`{symbol}` 替换为品种名；无占位符且多品种时在扩展名前追加后缀。
std::string ExpandSymbolPath(const std::string& pattern,
                             const std::string& symbol,
                             bool multi_symbol) {
  const std::string placeholder = "{symbol}";
  const std::size_t pos = pattern.find(placeholder);
  if (pos != std::string::npos) {
    std::string out = pattern;
    out.replace(pos, placeholder.size(), symbol);
    return out;
  }
  if (!multi_symbol) {
    return pattern;
  }
  const std::filesystem::path path(pattern);
  std::filesystem::path expanded = path.parent_path() /
      (path.stem().string() + "_" + symbol + path.extension().string());
  return expanded.string();
}

void Accumulate(const theta_core::BarSummary& summary, ReplayStats* stats) {
  ++stats->bars;
  if (summary.status == theta_core::CoreFault::kCorruptBar) {
    ++stats->corrupt_bars;
  }
  if (summary.status == theta_core::CoreFault::kInsufficientWindow) {
    ++stats->insufficient_window;
  }
  if (summary.has_ignition) {
    ++stats->ignitions;
    if (summary.reason == theta_core::ReasonCode::kAllowed && summary.entry_opened) {
      ++stats->live_entries;
    } else {
      ++stats->denials[theta_core::ToString(summary.reason)];
      if (summary.entry_opened) {
        ++stats->shadow_entries;
      }
    }
  }
  for (const auto& exit : summary.exits) {
    if (exit.shadow) {
      continue;
    }
    if (exit.pnl > 0.0) {
      ++stats->live_wins;
    } else {
      ++stats->live_losses;
    }
  }
}

std::string FormatStats(const std::string& symbol, const ReplayStats& stats) {
  std::ostringstream oss;
  oss << "回放完成: symbol=" << symbol << ", bars=" << stats.bars
      << ", ignitions=" << stats.ignitions
      << ", live_entries=" << stats.live_entries
      << ", shadow_entries=" << stats.shadow_entries
      << ", live_wins=" << stats.live_wins
      << ", live_losses=" << stats.live_losses
      << ", corrupt_bars=" << stats.corrupt_bars
      << ", insufficient_window=" << stats.insufficient_window
      << ", denials={";
  bool first = true;
  for (const auto& [reason, count] : stats.denials) {
    oss << (first ? "" : ",") << reason << ":" << count;
    first = false;
  }
  oss << "}";
  return oss.str();
}

}  // namespace

int main(int argc, char** argv) {
  theta_core::LogInfo("启动 theta_core 回放...");
  const RuntimeOptions options = ParseOptions(argc, argv);

  theta_core::AppConfig config;
  std::string config_error;
  if (!theta_core::LoadAppConfigFromYaml(options.config_path, &config,
                                         &config_error)) {
    theta_core::LogError("配置加载失败: " + config_error);
    return 1;
  }
  if (!options.bars_override.empty()) {
    config.bars_path = options.bars_override;
  }
  if (!options.decisions_override.empty()) {
    config.decision_log_path = options.decisions_override;
  }
  if (!options.journal_override.empty()) {
    config.ledger_journal_path = options.journal_override;
  }

  const theta_core::LockedDoctrine& doctrine = theta_core::ReferenceDoctrine();
  std::string fingerprint;
  std::string doctrine_error;
  if (!theta_core::DoctrineFingerprint(doctrine, &fingerprint, &doctrine_error)) {
    theta_core::LogError("doctrine 指纹计算失败: " + doctrine_error);
    return 1;
  }
  if (options.print_fingerprint) {
    theta_core::LogInfo("doctrine " + std::string(doctrine.version) +
                        " fingerprint=" + fingerprint);
    return 0;
  }
  if (!theta_core::VerifyDoctrine(doctrine, config.doctrine.version,
                                  config.doctrine.fingerprint, &doctrine_error)) {
    theta_core::LogError("doctrine 校验失败，拒绝启动: " + doctrine_error);
    return 1;
  }

  theta_core::LogInfo(
      "配置加载成功: mode=" + config.mode +
      ", symbols=" + std::to_string(config.symbols.size()) +
      ", bars_path=" + config.bars_path +
      ", decision_log_path=" + config.decision_log_path +
      ", ledger_journal_path=" + config.ledger_journal_path +
      ", feed.stale_bound_ms=" + std::to_string(config.feed.stale_bound_ms) +
      ", feed.resume_bars=" + std::to_string(config.feed.resume_bars) +
      ", friction.max_latency_ms=" + std::to_string(config.friction.max_latency_ms) +
      ", mode_switch.fast_collapse_threshold=" +
      std::to_string(config.mode_switch.fast_collapse_threshold) +
      ", doctrine=" + doctrine.version + "/" + fingerprint);

  const bool multi_symbol = config.symbols.size() > 1;
  std::vector<std::unique_ptr<theta_core::LedgerJournal>> journals;
  theta_core::InstrumentHost host(doctrine, config);
  for (const std::string& symbol : config.symbols) {
    auto journal = std::make_unique<theta_core::LedgerJournal>(
        ExpandSymbolPath(config.ledger_journal_path, symbol, multi_symbol));
    std::string error;
    if (!journal->Initialize(&error)) {
      theta_core::LogError("账本日志初始化失败: " + error);
      return 1;
    }
    std::vector<theta_core::LedgerEvent> events;
    if (!journal->LoadEvents(&events, &error)) {
      theta_core::LogError("账本日志加载失败: " + error);
      return 1;
    }
    theta_core::LogInfo("账本日志已加载: symbol=" + symbol + ", path=" +
                        journal->file_path() + ", events=" +
                        std::to_string(events.size()));
    if (!host.AddInstrument(symbol, journal.get(), events, &error)) {
      theta_core::LogError("品种注册失败: " + error);
      return 1;
    }
    journals.push_back(std::move(journal));
  }

  std::map<std::string, std::vector<theta_core::Bar>> bars_by_symbol;
  for (const std::string& symbol : config.symbols) {
    const std::string path = ExpandSymbolPath(config.bars_path, symbol, false);
    std::string error;
    if (!theta_core::LoadBarsFromCsv(path, &bars_by_symbol[symbol], &error)) {
      theta_core::LogError("行情加载失败: " + error);
      return 1;
    }
    theta_core::LogInfo("行情加载完成: symbol=" + symbol + ", bars=" +
                        std::to_string(bars_by_symbol[symbol].size()));
  }

  host.Start();
  theta_core::LogInfo("品种线程已启动: instruments=" +
                      std::to_string(host.instrument_count()));
  for (const auto& [symbol, bars] : bars_by_symbol) {
    for (const theta_core::Bar& bar : bars) {
      host.Submit(symbol, bar);
      if (options.auto_acknowledge_halt) {
        host.AcknowledgeHalt(symbol);
      }
    }
  }
  host.Stop();

  std::vector<theta_core::BarSummary> summaries;
  host.PollSummaries(&summaries);

  std::map<std::string, ReplayStats> stats_by_symbol;
  std::map<std::string, std::unique_ptr<std::ofstream>> outputs;
  for (const std::string& symbol : config.symbols) {
    const std::filesystem::path path(
        ExpandSymbolPath(config.decision_log_path, symbol, multi_symbol));
    std::error_code ec;
    if (!path.parent_path().empty()) {
      std::filesystem::create_directories(path.parent_path(), ec);
      if (ec) {
        theta_core::LogError("创建决策记录目录失败: " + ec.message());
        return 1;
      }
    }
    auto out = std::make_unique<std::ofstream>(path);
    if (!out->is_open()) {
      theta_core::LogError("无法写入决策记录: " + path.string());
      return 1;
    }
    *out << theta_core::DecisionCsvHeader() << '\n';
    outputs[symbol] = std::move(out);
  }

  for (const theta_core::BarSummary& summary : summaries) {
    Accumulate(summary, &stats_by_symbol[summary.symbol]);
    if (summary.record.has_value()) {
      *outputs[summary.symbol] << theta_core::ToCsvLine(*summary.record) << '\n';
    }
  }
  for (auto& [symbol, out] : outputs) {
    out->flush();
    if (!out->good()) {
      theta_core::LogError("决策记录写入失败: symbol=" + symbol);
      return 1;
    }
  }

  for (const auto& [symbol, stats] : stats_by_symbol) {
    theta_core::LogInfo(FormatStats(symbol, stats));
  }
  theta_core::LogInfo("回放结束时实盘持仓品种数: " +
                      std::to_string(host.OpenLiveCount()));
  return 0;
}
