#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/doctrine.h"
#include "core/types.h"

namespace theta_core {

/// 开仓请求：由决策核心在认证与策略放行（或影子探测）后构造。
struct OpenRequest {
  Direction direction{Direction::kLong};
  double entry_price{0.0};
  std::int64_t entry_index{0};
  std::int64_t zone_id{0};
  int theta{0};
  double size_multiplier{0.0};
  bool shadow{false};
  bool extension_allowed{false};  // θ≥3 且策略给出 trailing 许可。
};

/**
 * @brief 单仓风控状态机
 *
 * `OPEN -> TRAILING -> CLOSED`，并行单向 `DEFENSE` 修饰。
 *
 * 每根 bar 的处理顺序：
 * 1. 开盘价已越过止损/止盈：按开盘价离场（跳空）；
 * 2. 以 bar 开始时生效的止损、trail 与止盈判定盘中触发，同时触发时止损优先；
 * 3. 更新 MFE、冲击计数与水下时间；
 * 4. 更新 DEFENSE（持仓 ≥ lws_bars 且 MFE < 阈值，止损距离收紧，不可逆）；
 * 5. MFE 达到阈值进入 TRAILING，trail 只允许向有利方向移动；
 *    若本 bar 刚抬高的 trail 已被收盘价反穿，按 trail 价位离场。
 */
class RiskController {
 public:
  explicit RiskController(const LockedDoctrine& doctrine) : doctrine_(doctrine) {}

  /**
   * @brief 建立持仓
   * @return false 表示已有持仓（每个品种最多一个），`out_error` 给出原因
   */
  bool Open(const OpenRequest& request, std::string* out_error);

  /// 推进一根 bar；返回离场事件（如有），离场后持仓销毁。
  std::optional<ExitEvent> OnBar(const Bar& bar);

  /**
   * @brief 取消：按给定价格平仓并丢弃风控状态
   *
   * 该离场不写回 Zone Ledger，由调用方保证。
   */
  std::optional<ExitEvent> Flatten(std::int64_t bar_index, double price);

  bool has_position() const { return position_.has_value(); }
  const std::optional<Position>& position() const { return position_; }

 private:
  /// 当前生效的保护价位（止损与 trail 中更紧的一个）。
  double EffectiveStop(const Position& position) const;
  ExitEvent Close(ExitReason reason, std::int64_t bar_index, double exit_price);
  void UpdateExcursion(Position* position, const Bar& bar) const;
  void UpdateDefense(Position* position) const;
  /// @return true 表示 trail 在本 bar 向有利方向移动
  bool UpdateTrailing(Position* position) const;

  const LockedDoctrine& doctrine_;
  std::optional<Position> position_;
  std::int64_t next_position_id_{1};
};

}  // namespace theta_core
