#include "risk/risk_controller.h"

#include <algorithm>
#include <sstream>

#include "core/log.h"

namespace theta_core {

bool RiskController::Open(const OpenRequest& request, std::string* out_error) {
  if (position_.has_value()) {
    if (out_error != nullptr) {
      *out_error = "已有持仓，id=" + std::to_string(position_->id);
    }
    return false;
  }

  const double sign = DirectionSign(request.direction);
  Position position;
  position.id = next_position_id_++;
  position.direction = request.direction;
  position.entry_price = request.entry_price;
  position.entry_index = request.entry_index;
  position.zone_id = request.zone_id;
  position.theta_at_entry = request.theta;
  position.size_multiplier = request.size_multiplier;
  position.shadow = request.shadow;
  position.extension_allowed = request.extension_allowed;
  position.phase = PositionPhase::kOpen;
  position.stop_loss_distance = doctrine_.default_sl;
  position.stop_loss = request.entry_price - sign * doctrine_.default_sl;
  position.take_profit = request.entry_price + sign * doctrine_.take_profit;
  position_ = position;
  return true;
}

double RiskController::EffectiveStop(const Position& position) const {
  if (!position.trail_stop.has_value()) {
    return position.stop_loss;
  }
  return position.direction == Direction::kLong
             ? std::max(position.stop_loss, *position.trail_stop)
             : std::min(position.stop_loss, *position.trail_stop);
}

ExitEvent RiskController::Close(ExitReason reason, std::int64_t bar_index,
                                double exit_price) {
  const Position& position = *position_;
  const double sign = DirectionSign(position.direction);
  ExitEvent exit;
  exit.position_id = position.id;
  exit.bar_index = bar_index;
  exit.zone_id = position.zone_id;
  exit.direction = position.direction;
  exit.reason = reason;
  exit.entry_price = position.entry_price;
  exit.exit_price = exit_price;
  exit.pnl = sign * (exit_price - position.entry_price);
  exit.mfe = position.mfe;
  exit.shadow = position.shadow;
  exit.corroborated =
      position.impulse_count > doctrine_.retest_min_impulses &&
      position.max_underwater_run < doctrine_.retest_max_recovery_bars;
  position_.reset();
  return exit;
}

void RiskController::UpdateExcursion(Position* position, const Bar& bar) const {
  const double sign = DirectionSign(position->direction);
  const double extreme =
      position->direction == Direction::kLong ? bar.high : bar.low;
  const double favorable = sign * (extreme - position->entry_price);
  if (favorable > position->mfe) {
    position->mfe = favorable;
    ++position->impulse_count;
  }

  if (sign * (bar.close - position->entry_price) < 0.0) {
    ++position->underwater_run;
    position->max_underwater_run =
        std::max(position->max_underwater_run, position->underwater_run);
  } else {
    position->underwater_run = 0;
  }
}

void RiskController::UpdateDefense(Position* position) const {
  if (position->defense_active) {
    return;
  }
  if (position->bars_held < doctrine_.lws_bars ||
      position->mfe >= doctrine_.lws_mfe_threshold) {
    return;
  }
  const double sign = DirectionSign(position->direction);
  const double defense_stop = position->entry_price - sign * doctrine_.defense_sl;
  position->defense_active = true;
  position->stop_loss_distance = doctrine_.defense_sl;
  position->stop_loss = position->direction == Direction::kLong
                            ? std::max(position->stop_loss, defense_stop)
                            : std::min(position->stop_loss, defense_stop);

  std::ostringstream oss;
  oss << "DEFENSE_ESCALATION: position=" << position->id
      << ", bars_held=" << position->bars_held << ", mfe=" << position->mfe
      << ", stop_loss=" << position->stop_loss;
  LogInfo(oss.str());
}

bool RiskController::UpdateTrailing(Position* position) const {
  if (position->mfe < doctrine_.mfe_threshold) {
    return false;
  }
  const double sign = DirectionSign(position->direction);
  const double candidate =
      position->entry_price + sign * (position->mfe - doctrine_.trail_offset);
  if (position->phase == PositionPhase::kOpen) {
    position->phase = PositionPhase::kTrailing;
    position->trail_stop = candidate;
    return true;
  }
  const double current = *position->trail_stop;
  const double tightened = position->direction == Direction::kLong
                               ? std::max(current, candidate)
                               : std::min(current, candidate);
  position->trail_stop = tightened;
  return tightened != current;
}

std::optional<ExitEvent> RiskController::OnBar(const Bar& bar) {
  if (!position_.has_value()) {
    return std::nullopt;
  }
  Position& position = *position_;
  ++position.bars_held;

  const bool is_long = position.direction == Direction::kLong;
  const double stop = EffectiveStop(position);
  const bool trail_binding =
      position.trail_stop.has_value() && stop == *position.trail_stop;
  const bool target_active = !position.extension_allowed;

  // 1) 跳空：开盘已越过保护价位或止盈，按开盘价成交。
  const bool gap_stop = is_long ? bar.open <= stop : bar.open >= stop;
  const bool gap_target = target_active && (is_long ? bar.open >= position.take_profit
                                                    : bar.open <= position.take_profit);
  if (gap_stop || gap_target) {
    return Close(ExitReason::kGapAtOpen, bar.index, bar.open);
  }

  // 2) 盘中：止损优先。
  const bool stop_hit = is_long ? bar.low <= stop : bar.high >= stop;
  if (stop_hit) {
    return Close(trail_binding ? ExitReason::kTrailingStop : ExitReason::kStopLoss,
                 bar.index, stop);
  }
  const bool target_hit = target_active && (is_long ? bar.high >= position.take_profit
                                                    : bar.low <= position.take_profit);
  if (target_hit) {
    return Close(ExitReason::kTakeProfit, bar.index, position.take_profit);
  }

  // 3) ~ 5) 更新状态供下一根 bar 使用。
  UpdateExcursion(&position, bar);
  UpdateDefense(&position);
  const bool was_open = position.phase == PositionPhase::kOpen;
  const bool trail_moved = UpdateTrailing(&position);
  if (was_open && position.phase == PositionPhase::kTrailing) {
    std::ostringstream oss;
    oss << "TRAILING_ARMED: position=" << position.id << ", mfe=" << position.mfe
        << ", trail_stop=" << *position.trail_stop;
    LogInfo(oss.str());
  }
  // 收盘晚于最高/最低点：收盘已反穿新 trail，说明高点之后价格穿过了 trail。
  if (trail_moved) {
    const double trail = *position.trail_stop;
    const bool closed_through = is_long ? bar.close <= trail : bar.close >= trail;
    if (closed_through) {
      return Close(ExitReason::kTrailingStop, bar.index, trail);
    }
  }
  return std::nullopt;
}

std::optional<ExitEvent> RiskController::Flatten(std::int64_t bar_index,
                                                 double price) {
  if (!position_.has_value()) {
    return std::nullopt;
  }
  return Close(ExitReason::kFlattened, bar_index, price);
}

}  // namespace theta_core
