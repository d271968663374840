#include "policy/mode_controller.h"

namespace theta_core {

bool ModeController::RecordCollapse() {
  ++collapse_count_;
  if (mode_ == OperationMode::kNormal &&
      collapse_count_ > fast_collapse_threshold_) {
    mode_ = OperationMode::kConservative;
    return true;
  }
  return false;
}

void ModeController::ResetSession() {
  collapse_count_ = 0;
  mode_ = OperationMode::kNormal;
}

}  // namespace theta_core
