#pragma once

#include "core/types.h"

namespace theta_core {

/// 运行模式：NORMAL（θ≥1 全层级）/ CONSERVATIVE（仅 θ≥3）。
enum class OperationMode {
  kNormal,
  kConservative,
};

inline const char* ToString(OperationMode mode) {
  switch (mode) {
    case OperationMode::kNormal:
      return "NORMAL";
    case OperationMode::kConservative:
      return "CONSERVATIVE";
  }
  return "UNKNOWN";
}

/**
 * @brief 运行模式控制器
 *
 * 会话内 zone 塌缩次数超过阈值时自动切到 CONSERVATIVE，
 * 直到会话重置。
 */
class ModeController {
 public:
  explicit ModeController(int fast_collapse_threshold)
      : fast_collapse_threshold_(fast_collapse_threshold) {}

  /// 记录一次 zone 塌缩。
  /// @return true 表示本次记录触发了模式切换
  bool RecordCollapse();

  void ResetSession();

  OperationMode mode() const { return mode_; }
  EligibilityTier tier() const {
    return mode_ == OperationMode::kConservative ? EligibilityTier::kConservative
                                                 : EligibilityTier::kStandard;
  }
  int collapse_count() const { return collapse_count_; }

 private:
  int fast_collapse_threshold_{5};
  int collapse_count_{0};
  OperationMode mode_{OperationMode::kNormal};
};

}  // namespace theta_core
