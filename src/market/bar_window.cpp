#include "market/bar_window.h"

namespace theta_core {

void BarWindow::Push(const Bar& bar) {
  if (capacity_ == 0) {
    return;
  }
  bars_.push_back(bar);
  while (bars_.size() > capacity_) {
    bars_.pop_front();
  }
}

}  // namespace theta_core
