#include "zone/zone_ledger.h"

#include <cmath>

namespace theta_core {

std::int64_t ZoneIdForPrice(double price, const LockedDoctrine& doctrine) {
  return static_cast<std::int64_t>(std::floor(price / doctrine.zone_band_width));
}

bool ZoneLedger::RecordOutcome(std::int64_t zone_id,
                               Direction direction,
                               Outcome outcome,
                               bool corroborated,
                               std::int64_t bar_index,
                               std::int64_t ts_ms) {
  return Apply(LedgerEvent{.type = LedgerEventType::kOutcome,
                           .ts_ms = ts_ms,
                           .bar_index = bar_index,
                           .zone_id = zone_id,
                           .direction = direction,
                           .outcome = outcome,
                           .corroborated = corroborated});
}

void ZoneLedger::RecordRetry(std::int64_t zone_id, Direction direction,
                             std::int64_t bar_index, std::int64_t ts_ms) {
  Apply(LedgerEvent{.type = LedgerEventType::kRetry,
                    .ts_ms = ts_ms,
                    .bar_index = bar_index,
                    .zone_id = zone_id,
                    .direction = direction,
                    .outcome = Outcome::kLoss,
                    .corroborated = false});
}

void ZoneLedger::Reset(std::int64_t bar_index, std::int64_t ts_ms) {
  Apply(LedgerEvent{.type = LedgerEventType::kReset,
                    .ts_ms = ts_ms,
                    .bar_index = bar_index,
                    .zone_id = 0,
                    .direction = Direction::kLong,
                    .outcome = Outcome::kLoss,
                    .corroborated = false});
}

std::optional<PersistenceRecord> ZoneLedger::Query(std::int64_t zone_id) const {
  const auto it = records_.find(zone_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ZoneLedger::Apply(const LedgerEvent& event) {
  events_.push_back(event);

  if (event.type == LedgerEventType::kReset) {
    records_.clear();
    return false;
  }

  auto [it, inserted] = records_.try_emplace(event.zone_id);
  PersistenceRecord& record = it->second;
  if (inserted) {
    record.zone_id = event.zone_id;
    record.creation_index = event.bar_index;
    record.last_direction = event.direction;
  }

  if (event.type == LedgerEventType::kRetry) {
    ++record.retry_attempts;
    return false;
  }

  const bool same_direction = record.consecutive_same_direction_count > 0 &&
                              record.last_direction == event.direction;
  record.consecutive_same_direction_count =
      same_direction ? record.consecutive_same_direction_count + 1 : 1;

  bool collapsed_now = false;
  DirectionalLoss& side = LossSide(record, event.direction);
  if (event.outcome == Outcome::kWin) {
    const bool extends_streak = same_direction &&
                                record.last_outcome.has_value() &&
                                *record.last_outcome == Outcome::kWin;
    record.success_streak = extends_streak ? record.success_streak + 1 : 1;
    side.loss_streak = 0;
    record.last_success_corroborated = event.corroborated;
    ++record.wins;
  } else {
    record.success_streak = 0;
    ++side.loss_streak;
    record.last_success_corroborated = false;
    ++record.losses;
    if (!side.collapsed && side.loss_streak >= doctrine_.collapse_loss_streak) {
      side.collapsed = true;
      collapsed_now = true;
    }
  }
  record.last_direction = event.direction;
  record.last_outcome = event.outcome;
  return collapsed_now;
}

}  // namespace theta_core
