#include "feature/feature_extractor.h"

#include <algorithm>
#include <cmath>

namespace theta_core {

namespace {

constexpr double kMinSide = 0.01;          // ratio 分子分母下限。
constexpr double kFlatChannelRange = 1.0;  // 低于该跨度 channel 取中值。
constexpr double kFlatDepthRange = 0.01;
constexpr double kFlatMeanRange = 0.1;
constexpr double kFlatPathLength = 0.01;
constexpr double kWeakSellerSum = 0.1;
constexpr double kSaturatedForce = 10.0;

}  // namespace

std::size_t FeatureExtractor::MinBars() const {
  const int need = std::max({doctrine_.window_bars,
                             doctrine_.short_lookback + 1,
                             doctrine_.terminal_horizon + 1,
                             doctrine_.depth_slope_bars});
  return static_cast<std::size_t>(need);
}

double FeatureExtractor::MeanRange(const BarWindow& window, std::size_t begin,
                                   std::size_t end) {
  if (end <= begin) {
    return 0.0;
  }
  double sum = 0.0;
  for (std::size_t i = begin; i < end; ++i) {
    sum += window.at(i).high - window.at(i).low;
  }
  return sum / static_cast<double>(end - begin);
}

double FeatureExtractor::DepthAt(const BarWindow& window,
                                 std::size_t end) const {
  double high = window.at(0).high;
  double low = window.at(0).low;
  for (std::size_t i = 1; i <= end; ++i) {
    high = std::max(high, window.at(i).high);
    low = std::min(low, window.at(i).low);
  }
  const double range = high - low;
  if (range < kFlatDepthRange) {
    return 0.5;
  }
  return (high - window.at(end).close) / range;
}

bool FeatureExtractor::Extract(const BarWindow& window,
                               IndicatorSet* out_indicators,
                               CoreFault* out_fault) const {
  if (out_indicators == nullptr) {
    return false;
  }
  if (window.size() < MinBars()) {
    if (out_fault != nullptr) {
      *out_fault = CoreFault::kInsufficientWindow;
    }
    return false;
  }

  const std::size_t n = window.size();
  const std::size_t t = n - 1;
  const Bar& bar = window.back();

  IndicatorSet out;
  out.ts_ms = bar.ts_ms;
  out.bar_index = bar.index;
  out.close = bar.close;
  out.delta = bar.delta;

  out.ratio = std::max(bar.close - bar.low, kMinSide) /
              std::max(bar.high - bar.close, kMinSide);

  // channel：当前收盘在窗口高低区间中的位置。
  double high_w = bar.high;
  double low_w = bar.low;
  for (const Bar& b : window.bars()) {
    high_w = std::max(high_w, b.high);
    low_w = std::min(low_w, b.low);
  }
  out.channel_range = high_w - low_w;
  out.channel = out.channel_range < kFlatChannelRange
                    ? 50.0
                    : (bar.close - low_w) / out.channel_range * 100.0;

  // body_z：相对前序 bar 实体的总体标准差。
  double body_sum = 0.0;
  for (std::size_t i = 0; i < t; ++i) {
    body_sum += std::fabs(window.at(i).close - window.at(i).open);
  }
  const double body_mean = body_sum / static_cast<double>(t);
  double body_var = 0.0;
  for (std::size_t i = 0; i < t; ++i) {
    const double d = std::fabs(window.at(i).close - window.at(i).open) - body_mean;
    body_var += d * d;
  }
  const double body_std = std::sqrt(body_var / static_cast<double>(t));
  out.body_z = body_std > 0.0
                   ? (std::fabs(bar.close - bar.open) - body_mean) / body_std
                   : 0.0;

  const std::size_t lookback = static_cast<std::size_t>(doctrine_.short_lookback);

  // er：最近 lookback 个收盘的净位移 / 路径长度。
  const std::size_t er_begin = n - lookback;
  double path = 0.0;
  for (std::size_t i = er_begin + 1; i <= t; ++i) {
    path += std::fabs(window.at(i).close - window.at(i - 1).close);
  }
  if (path < kFlatPathLength) {
    out.er = 1.0;
  } else {
    out.er = std::min(1.0, std::fabs(bar.close - window.at(er_begin).close) / path);
  }

  // force_ratio：买方力 Σ(c-l) / 卖方力 Σ(h-c)。
  double buyer = 0.0;
  double seller = 0.0;
  for (std::size_t i = n - lookback; i <= t; ++i) {
    buyer += window.at(i).close - window.at(i).low;
    seller += window.at(i).high - window.at(i).close;
  }
  out.force_ratio = seller < kWeakSellerSum ? kSaturatedForce : buyer / seller;

  out.depth = DepthAt(window, t);
  const std::size_t slope_span = static_cast<std::size_t>(doctrine_.depth_slope_bars);
  out.depth_slope = (out.depth - DepthAt(window, t - (slope_span - 1))) /
                    static_cast<double>(slope_span);

  const double bar_range = bar.high - bar.low;
  const double prior_mean_range = MeanRange(window, t - lookback, t);
  out.dc_pre = prior_mean_range < kFlatMeanRange ? 1.0 : bar_range / prior_mean_range;
  out.burst_event = bar_range > doctrine_.burst_range_multiple * prior_mean_range;

  // terminal：锚点之后第一个最大偏离 bar 的相对位置。
  const std::size_t horizon = static_cast<std::size_t>(doctrine_.terminal_horizon);
  const double anchor = window.at(t - horizon).close;
  double best_excursion = -1.0;
  std::size_t best_offset = 0;
  for (std::size_t k = 0; k < horizon; ++k) {
    const Bar& b = window.at(t - horizon + 1 + k);
    const double excursion =
        std::max(std::fabs(b.high - anchor), std::fabs(b.low - anchor));
    if (excursion > best_excursion) {
      best_excursion = excursion;
      best_offset = k;
    }
  }
  out.terminal_time_r = static_cast<double>(best_offset) / static_cast<double>(horizon);
  out.terminal = out.terminal_time_r < doctrine_.terminal_fast_ratio
                     ? Terminal::kFast
                     : Terminal::kSlow;

  *out_indicators = out;
  if (out_fault != nullptr) {
    *out_fault = CoreFault::kNone;
  }
  return true;
}

}  // namespace theta_core
