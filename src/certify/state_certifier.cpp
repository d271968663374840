#include "certify/state_certifier.h"

namespace theta_core {

int StateCertifier::ThetaFor(const std::optional<PersistenceRecord>& record,
                             Direction direction) {
  if (!record.has_value() || !record->last_outcome.has_value()) {
    return 0;
  }
  if (*record->last_outcome == Outcome::kLoss) {
    return 0;
  }
  if (record->last_direction != direction) {
    return 0;
  }
  if (record->success_streak >= kThetaLockIn) {
    return kThetaLockIn;
  }
  if (record->success_streak == 2 && record->last_success_corroborated) {
    return 2;
  }
  return record->success_streak >= 1 ? 1 : 0;
}

std::optional<int> StateCertifier::Certify(const IgnitionEvent& ignition,
                                           const ZoneLedger& ledger) {
  if (last_consumed_index_.has_value() &&
      ignition.bar_index <= *last_consumed_index_) {
    return std::nullopt;
  }
  last_consumed_index_ = ignition.bar_index;
  return ThetaFor(ledger.Query(ignition.zone_id), ignition.direction);
}

}  // namespace theta_core
