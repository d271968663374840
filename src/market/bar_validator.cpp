#include "market/bar_validator.h"

#include <cmath>

namespace theta_core {

namespace {

bool Reject(const std::string& reason, const Bar& bar, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = reason + " (index=" + std::to_string(bar.index) +
                 ", ts=" + std::to_string(bar.ts_ms) + ")";
  }
  return false;
}

}  // namespace

bool BarValidator::Check(const Bar& bar, std::string* out_error) const {
  const double fields[] = {bar.open, bar.high, bar.low, bar.close, bar.delta};
  for (const double value : fields) {
    if (!std::isfinite(value)) {
      return Reject("bar 含 NaN/Inf", bar, out_error);
    }
  }
  if (bar.high < bar.low) {
    return Reject("bar high < low", bar, out_error);
  }
  if (bar.open < bar.low || bar.open > bar.high) {
    return Reject("bar open 超出 [low, high]", bar, out_error);
  }
  if (bar.close < bar.low || bar.close > bar.high) {
    return Reject("bar close 超出 [low, high]", bar, out_error);
  }
  if (last_.has_value()) {
    if (bar.ts_ms <= last_->ts_ms) {
      return Reject("bar 时间戳未递增", bar, out_error);
    }
    if (bar.index <= last_->index) {
      return Reject("bar 序号未递增", bar, out_error);
    }
  }
  return true;
}

void BarValidator::Accept(const Bar& bar) {
  last_ = bar;
}

}  // namespace theta_core
