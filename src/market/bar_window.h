#pragma once

#include <cstddef>
#include <deque>

#include "core/types.h"

namespace theta_core {

/**
 * @brief 定长滑动 K 线窗口
 *
 * 只保留最近 `capacity` 根已校验 bar，当前 bar 位于末尾。
 * 窗口只追加，不回写历史 bar。
 */
class BarWindow {
 public:
  explicit BarWindow(std::size_t capacity) : capacity_(capacity) {}

  void Push(const Bar& bar);

  std::size_t size() const { return bars_.size(); }

  /// 按时间顺序访问，0 为最旧。
  const Bar& at(std::size_t i) const { return bars_.at(i); }
  const Bar& back() const { return bars_.back(); }
  const std::deque<Bar>& bars() const { return bars_; }

 private:
  std::size_t capacity_{0};
  std::deque<Bar> bars_;
};

}  // namespace theta_core
