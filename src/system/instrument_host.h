#pragma once

#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include "system/decision_core.h"

namespace theta_core {

// bar/控制任务处理后的不可变摘要：由品种线程写入，主线程轮询消费。
struct BarSummary {
  std::string symbol;
  std::int64_t bar_index{0};
  CoreFault status{CoreFault::kNone};
  bool has_ignition{false};
  int theta{0};
  ReasonCode reason{ReasonCode::kNone};
  bool entry_opened{false};
  bool position_open{false};       ///< bar 结束时是否持仓（含影子仓）。
  bool live_position_open{false};  ///< bar 结束时是否持有实盘仓。
  std::vector<ExitEvent> exits;
  std::optional<DecisionRecord> record;
  bool session_reset{false};
  OperationMode mode{OperationMode::kNormal};
};

/**
 * @brief 多品种宿主（每品种一个工作线程）
 *
 * 1. 每个品种独立 DecisionCore，固定在自己的线程上顺序处理；
 * 2. 主线程只投递 bar，不阻塞在决策计算上；
 * 3. 跨品种聚合只读取已发布的摘要，不触碰各品种内部状态；
 * 4. 平仓/超时/会话重置等控制操作同样以任务投递，与 bar 在同一队列内有序执行。
 */
class InstrumentHost {
 public:
  InstrumentHost(const LockedDoctrine& doctrine, const AppConfig& config);
  ~InstrumentHost();

  InstrumentHost(const InstrumentHost&) = delete;
  InstrumentHost& operator=(const InstrumentHost&) = delete;

  /**
   * @brief 注册品种（必须在 Start 之前）
   * @param journal 该品种的账本日志（可为空），生命周期由外部管理
   */
  bool AddInstrument(const std::string& symbol,
                     const LedgerJournal* journal,
                     const std::vector<LedgerEvent>& restore_events,
                     std::string* out_error);

  /// 启动全部品种线程；重复调用无副作用。
  void Start();
  /// 投递 stop 任务并等待线程退出；已排队的 bar 会先处理完（幂等）。
  void Stop();

  /// 投递一根 bar；品种未注册返回 false。
  bool Submit(const std::string& symbol, const Bar& bar,
              const ExecutionFriction& friction = {});

  /// 投递人工确认：解除该品种的坏 bar 停机。
  bool AcknowledgeHalt(const std::string& symbol);

  /// 投递取消：按给定价格平掉该品种持仓（有离场时发布摘要）。
  bool Flatten(const std::string& symbol, double price);

  /// 投递外部计时器超时：该品种进入行情陈旧状态。
  bool ReportWatchdogTimeout(const std::string& symbol);

  /// 投递会话重置：清空该品种账本并恢复 NORMAL（发布摘要）。
  bool ResetSession(const std::string& symbol);

  /// 非阻塞轮询摘要；返回后 `out_summaries` 持有本轮全部摘要。
  void PollSummaries(std::vector<BarSummary>* out_summaries);

  /// 依据最近一次轮询到的各品种摘要统计实盘持仓数。
  int OpenLiveCount() const;

  std::size_t instrument_count() const { return workers_.size(); }

 private:
  struct Task {
    enum Type {
      kBar,
      kAcknowledge,
      kFlatten,
      kWatchdogTimeout,
      kResetSession,
      kStop,
    } type;
    Bar bar;
    ExecutionFriction friction;
    double price{0.0};  // 仅 kFlatten 使用。
  };

  struct Worker {
    std::string symbol;
    std::unique_ptr<DecisionCore> core;
    std::thread thread;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::queue<Task> tasks;
  };

  void WorkerLoop(Worker* worker);
  void RunControl(Worker* worker, const Task& task);
  static BarSummary MakeSummary(const Worker& worker, std::int64_t bar_index);
  bool Enqueue(const std::string& symbol, Task task);
  void Publish(BarSummary summary);

  const LockedDoctrine& doctrine_;
  AppConfig config_;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::map<std::string, Worker*> by_symbol_;
  bool started_{false};

  std::mutex result_mutex_;
  std::vector<BarSummary> results_;

  std::map<std::string, bool> latest_live_open_;  ///< 仅主线程访问。
};

}  // namespace theta_core
