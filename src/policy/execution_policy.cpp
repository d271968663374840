#include "policy/execution_policy.h"

#include "certify/state_certifier.h"

namespace theta_core {

namespace {

PolicyDecision Deny(ReasonCode reason) {
  return PolicyDecision{.allow = false,
                        .size_multiplier = 0.0,
                        .retry_allowed = false,
                        .trailing_allowed = false,
                        .reason = reason};
}

}  // namespace

bool ExecutionPolicy::FrictionBreached(const ExecutionFriction& friction) const {
  return friction.slippage > doctrine_.max_slippage ||
         friction.spread > doctrine_.max_spread ||
         friction.latency_ms > max_latency_ms_;
}

PolicyDecision ExecutionPolicy::Decide(
    int theta,
    Direction direction,
    EligibilityTier tier,
    const std::optional<PersistenceRecord>& zone,
    const ExecutionFriction& friction,
    bool stale) const {
  if (zone.has_value() && IsCollapsed(*zone, direction)) {
    return Deny(ReasonCode::kZoneCollapsed);
  }
  if (FrictionBreached(friction)) {
    return Deny(ReasonCode::kExecutionFriction);
  }
  if (stale) {
    return Deny(ReasonCode::kStaleFeed);
  }
  if (theta <= 0) {
    return Deny(ReasonCode::kStateNotCertified);
  }
  if (tier == EligibilityTier::kConservative && theta < kThetaLockIn) {
    return Deny(ReasonCode::kTierRestricted);
  }

  PolicyDecision decision;
  decision.allow = true;
  decision.reason = ReasonCode::kAllowed;
  if (theta >= kThetaLockIn) {
    decision.size_multiplier = doctrine_.size_lock_in;
    decision.retry_allowed = true;
    decision.trailing_allowed = doctrine_.lock_in_trailing_enabled;
  } else if (theta == 2) {
    // 重试预算按 zone 计，用尽后退回出生倍率。
    const int used = zone.has_value() ? zone->retry_attempts : 0;
    decision.retry_allowed = used < doctrine_.max_retry_attempts;
    decision.size_multiplier = decision.retry_allowed
                                   ? doctrine_.size_transition_retry
                                   : doctrine_.size_birth;
    decision.trailing_allowed = false;
  } else {
    decision.size_multiplier = doctrine_.size_birth;
    decision.retry_allowed = false;
    decision.trailing_allowed = false;
  }
  return decision;
}

}  // namespace theta_core
