#include "record/decision_record.h"

#include <cmath>
#include <iomanip>
#include <sstream>

#include "certify/state_certifier.h"

namespace theta_core {

namespace {

constexpr double kHighDepth = 0.5;
constexpr double kCompressedDcPre = 0.8;
constexpr double kStrongForceHigh = 1.3;
constexpr double kStrongForceLow = 0.7;
constexpr double kHighEr = 0.6;
constexpr double kChannelTop = 80.0;
constexpr double kChannelBottom = 20.0;

}  // namespace

std::string BuildIslandId(const IndicatorSet& indicators, int theta,
                          double delta_large_threshold) {
  const char* channel_bin = "Mid";
  if (indicators.channel > kChannelTop) {
    channel_bin = "Top";
  } else if (indicators.channel < kChannelBottom) {
    channel_bin = "Bot";
  }
  const bool strong_force = indicators.force_ratio > kStrongForceHigh ||
                            indicators.force_ratio < kStrongForceLow;

  std::string out;
  out += indicators.depth > kHighDepth ? "High" : "Low";
  out += '_';
  out += indicators.dc_pre < kCompressedDcPre ? "Comp" : "Loose";
  out += '_';
  out += std::fabs(indicators.delta) > delta_large_threshold ? "Large" : "Small";
  out += '_';
  out += strong_force ? "Strong" : "Weak";
  out += '_';
  out += indicators.er > kHighEr ? "High" : "Low";
  out += '_';
  out += theta >= kThetaLockIn ? "High" : "Low";
  out += '_';
  out += channel_bin;
  return out;
}

DecisionRecord BuildDecisionRecord(const IndicatorSet& indicators, int theta,
                                   double delta_large_threshold) {
  DecisionRecord record;
  record.ts_ms = indicators.ts_ms;
  record.index = indicators.bar_index;
  record.depth = indicators.depth;
  record.depth_slope = indicators.depth_slope;
  record.terminal = indicators.terminal;
  if (indicators.terminal == Terminal::kFast) {
    record.island_id = BuildIslandId(indicators, theta, delta_large_threshold);
  }
  record.burst_event = indicators.burst_event;
  record.dc_pre = indicators.dc_pre;
  record.er = indicators.er;
  record.delta = indicators.delta;
  record.channel = indicators.channel;
  return record;
}

std::string DecisionCsvHeader() {
  return "ts,idx,depth,depth_slope,terminal,island_id,burst_event,dc_pre,er,"
         "delta,channel";
}

std::string ToCsvLine(const DecisionRecord& record) {
  std::ostringstream oss;
  oss << record.ts_ms << ',' << record.index << ',' << std::fixed
      << std::setprecision(4) << record.depth << ',' << record.depth_slope
      << ',' << ToString(record.terminal) << ',' << record.island_id << ','
      << (record.burst_event ? 1 : 0) << ',' << record.dc_pre << ','
      << record.er << ',' << record.delta << ',' << record.channel;
  return oss.str();
}

}  // namespace theta_core
