#pragma once

#include "core/doctrine.h"
#include "core/types.h"
#include "market/bar_window.h"

namespace theta_core {

/**
 * @brief 单 bar 指标提取器
 *
 * 输入：尾随窗口（当前 bar 在末尾）；输出：只读 IndicatorSet。
 * 纯函数，不持有跨 bar 状态，同一窗口重复计算结果一致。
 */
class FeatureExtractor {
 public:
  explicit FeatureExtractor(const LockedDoctrine& doctrine)
      : doctrine_(doctrine) {}

  /**
   * @brief 计算当前 bar 指标
   *
   * @return false 表示窗口不足，`out_fault` 置为 kInsufficientWindow，
   *         调用方必须跳过本 bar 的认证，不得以默认值替代。
   */
  bool Extract(const BarWindow& window,
               IndicatorSet* out_indicators,
               CoreFault* out_fault) const;

  /// 最少所需 bar 数（含当前 bar）。
  std::size_t MinBars() const;

 private:
  /// 窗口内第 `end` 根 bar（含）之前的 depth。
  double DepthAt(const BarWindow& window, std::size_t end) const;
  /// [begin, end) 区间内 bar 振幅均值。
  static double MeanRange(const BarWindow& window, std::size_t begin,
                          std::size_t end);

  const LockedDoctrine& doctrine_;
};

}  // namespace theta_core
