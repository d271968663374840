#include "gate/entry_gate.h"

#include <cmath>

#include "zone/zone_ledger.h"

namespace theta_core {

std::optional<IgnitionEvent> EntryGate::Evaluate(
    const IndicatorSet& indicators) const {
  if (indicators.channel_range < doctrine_.stb_min_channel_range) {
    return std::nullopt;
  }
  if (std::fabs(indicators.body_z) < doctrine_.stb_body_z_floor) {
    return std::nullopt;
  }

  std::optional<Direction> direction;
  if (indicators.ratio > doctrine_.stb_ratio_short &&
      indicators.channel > doctrine_.stb_channel_short) {
    direction = Direction::kShort;
  } else if (indicators.ratio < doctrine_.stb_ratio_long &&
             indicators.channel < doctrine_.stb_channel_long) {
    direction = Direction::kLong;
  }
  if (!direction.has_value()) {
    return std::nullopt;
  }

  return IgnitionEvent{.bar_index = indicators.bar_index,
                       .direction = *direction,
                       .zone_id = ZoneIdForPrice(indicators.close, doctrine_),
                       .indicators = indicators};
}

}  // namespace theta_core
