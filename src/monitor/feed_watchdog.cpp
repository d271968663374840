#include "monitor/feed_watchdog.h"

namespace theta_core {

std::optional<std::string> FeedWatchdog::OnBar(const Bar& bar) {
  const bool gap = last_ts_ms_.has_value() &&
                   bar.ts_ms - *last_ts_ms_ > config_.stale_bound_ms;
  last_ts_ms_ = bar.ts_ms;

  if (gap) {
    normal_bars_since_stale_ = 0;
    if (!stale_) {
      stale_ = true;
      return std::string("FEED_STALE");
    }
    return std::nullopt;
  }

  if (!stale_) {
    return std::nullopt;
  }
  ++normal_bars_since_stale_;
  if (normal_bars_since_stale_ >= config_.resume_bars) {
    stale_ = false;
    normal_bars_since_stale_ = 0;
    return std::string("FEED_RESUMED");
  }
  return std::nullopt;
}

std::optional<std::string> FeedWatchdog::OnExternalTimeout() {
  normal_bars_since_stale_ = 0;
  if (stale_) {
    return std::nullopt;
  }
  stale_ = true;
  return std::string("FEED_STALE");
}

void FeedWatchdog::Reset() {
  last_ts_ms_.reset();
  stale_ = false;
  normal_bars_since_stale_ = 0;
}

}  // namespace theta_core
