#pragma once

#include <optional>
#include <string>

#include "core/config.h"
#include "core/types.h"

namespace theta_core {

/**
 * @brief 行情陈旧看门狗
 *
 * 1. 相邻 bar 时间戳间隔超过上限，或外部计时器报告超时，即进入陈旧状态；
 * 2. 陈旧期间冻结新入场（等价 θ=0），不补造 bar；
 * 3. 连续收到 `resume_bars` 根正常间隔 bar 后恢复。
 */
class FeedWatchdog {
 public:
  explicit FeedWatchdog(FeedConfig config) : config_(config) {}

  /**
   * @brief 输入一根已校验 bar
   * @return 状态切换告警码（FEED_STALE / FEED_RESUMED），否则 `std::nullopt`
   */
  std::optional<std::string> OnBar(const Bar& bar);

  /// 外部计时器报告长时间无 bar。
  std::optional<std::string> OnExternalTimeout();

  void Reset();
  bool stale() const { return stale_; }

 private:
  FeedConfig config_;
  std::optional<std::int64_t> last_ts_ms_;
  bool stale_{false};
  int normal_bars_since_stale_{0};
};

}  // namespace theta_core
