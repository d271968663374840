#pragma once

#include <string>

namespace theta_core {

/**
 * @brief 锁定参数集（Locked Doctrine）
 *
 * 约束：
 * 1. 唯一实例由 `ReferenceDoctrine()` 提供，全部组件以 const 引用注入；
 * 2. 不提供任何 setter，运行时不可修改；
 * 3. 任何数值变更必须走离线晋升流程（实验 -> 验证 -> 核心），并同步更新
 *    `version` 与配置文件中的 fingerprint。
 */
struct LockedDoctrine {
  const char* version;

  // 风险控制（能量守恒 + G3 防御）
  double mfe_threshold;      // MFE 越过该值进入 TRAILING。
  double trail_offset;       // trail = MFE - offset。
  int lws_bars;              // Loss Warning State 判定所需持仓 bar 数。
  double lws_mfe_threshold;  // LWS 判定的 MFE 上限。
  double defense_sl;         // 防御止损距离。
  double default_sl;         // 默认止损距离。
  double take_profit;        // 固定止盈距离。

  // 特征窗口
  int window_bars;           // 特征提取最小窗口（含当前 bar）。
  int short_lookback;        // er / force / dc_pre / burst 共用回看长度。
  int depth_slope_bars;      // depth_slope 的差分跨度。
  int terminal_horizon;      // terminal_time_r 回看跨度。
  double terminal_fast_ratio;
  double burst_range_multiple;

  // STB 点火阈值
  double stb_ratio_short;    // ratio > 该值视为空头点火候选。
  double stb_ratio_long;     // ratio < 该值视为多头点火候选。
  double stb_channel_short;  // channel > 该值。
  double stb_channel_long;   // channel < 该值。
  double stb_body_z_floor;   // |body_z| 下限。
  double stb_min_channel_range;

  // Zone 与认证
  double zone_band_width;    // 价格量化带宽（锁定，不可运行时重算）。
  int collapse_loss_streak;  // 同 zone 同方向连续亏损达到该值即塌缩。
  int retest_min_impulses;   // θ=2 佐证：impulse_count 必须大于该值。
  int retest_max_recovery_bars;  // θ=2 佐证：恢复时间必须小于该值。
  int max_retry_attempts;    // θ=2 每个 zone 的重试预算。

  // 执行摩擦上限
  double max_slippage;
  double max_spread;

  // 仓位倍率
  double size_birth;
  double size_transition_retry;
  double size_lock_in;
  bool lock_in_trailing_enabled;
};

/// 参考参数集（唯一可用实例）。
const LockedDoctrine& ReferenceDoctrine();

/// Doctrine 规范化文本：字段顺序固定，用于指纹计算与审计日志。
std::string CanonicalText(const LockedDoctrine& doctrine);

/**
 * @brief 计算 doctrine 指纹（SHA-256 小写十六进制）
 *
 * @return true 计算成功；false 时 `out_error` 给出 OpenSSL 失败原因
 */
bool DoctrineFingerprint(const LockedDoctrine& doctrine,
                         std::string* out_hex,
                         std::string* out_error);

/**
 * @brief 校验配置声明的 doctrine 与编译期 doctrine 一致
 *
 * `expected_fingerprint` 为空时仅校验版本号。
 */
bool VerifyDoctrine(const LockedDoctrine& doctrine,
                    const std::string& expected_version,
                    const std::string& expected_fingerprint,
                    std::string* out_error);

}  // namespace theta_core
