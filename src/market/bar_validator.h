#pragma once

#include <optional>
#include <string>

#include "core/types.h"

namespace theta_core {

/**
 * @brief 坏 bar 检测
 *
 * 拒绝以下输入（只判定，不修复）：
 * 1. 任一价格/delta 为 NaN 或 Inf；
 * 2. high < low，或 open/close 落在 [low, high] 之外；
 * 3. 时间戳或 bar 序号未严格递增。
 *
 * 仅已接受的 bar 会推进“上一根”游标。
 */
class BarValidator {
 public:
  /// @return true 表示 bar 合法；false 时 `out_error` 给出原因。
  bool Check(const Bar& bar, std::string* out_error) const;

  /// 标记 bar 已被流水线接受；人工确认停机后仍要求相对该 bar 单调。
  void Accept(const Bar& bar);

 private:
  std::optional<Bar> last_;
};

}  // namespace theta_core
