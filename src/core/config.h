#pragma once

#include <string>
#include <vector>

#include "core/types.h"

namespace theta_core {

/// 行情看门狗参数：超过间隔视为陈旧，冻结新入场。
struct FeedConfig {
  std::int64_t stale_bound_ms{300000};
  int resume_bars{1};  // 恢复所需的连续正常间隔 bar 数。
};

/// 执行摩擦上限中的可配置部分（滑点/点差上限锁定在 doctrine 中）。
struct FrictionConfig {
  int max_latency_ms{500};
};

/// 会话边界参数。
struct SessionConfig {
  bool auto_reset_on_day_change{true};
};

/// 运行模式切换参数（NORMAL -> CONSERVATIVE）。
struct ModeSwitchConfig {
  int fast_collapse_threshold{5};
};

/// 决策记录分箱参数（仅影响 island_id 文本，不影响决策）。
struct RecordConfig {
  double delta_large_threshold{0.5};  // |delta| 超过该值记为 Large。
};

/// 期望的 doctrine 声明：与编译期 doctrine 不一致时拒绝启动。
struct DoctrineConfig {
  std::string version{"v7.4-locked"};
  std::string fingerprint;
};

/// 应用主配置：路径、看门狗、摩擦、会话和 doctrine 校验。
struct AppConfig {
  std::string mode{"replay"};
  std::vector<std::string> symbols{"NQ"};
  std::string bars_path{"data/bars.csv"};
  std::string decision_log_path{"data/decisions.csv"};
  std::string ledger_journal_path{"data/zone_ledger.wal"};
  bool shadow_probe_enabled{true};
  FeedConfig feed{};
  FrictionConfig friction{};
  SessionConfig session{};
  ModeSwitchConfig mode_switch{};
  RecordConfig record{};
  DoctrineConfig doctrine{};
};

/**
 * @brief 轻量 YAML 配置加载器
 *
 * 仅解析当前项目运行所需字段；锁定参数不在此处开放。
 * 解析失败返回 `false` 并写入 `out_error`。
 */
bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error);

}  // namespace theta_core
