#include "system/instrument_host.h"

#include <utility>

#include "core/log.h"

namespace theta_core {

InstrumentHost::InstrumentHost(const LockedDoctrine& doctrine,
                               const AppConfig& config)
    : doctrine_(doctrine), config_(config) {}

InstrumentHost::~InstrumentHost() {
  Stop();
}

bool InstrumentHost::AddInstrument(const std::string& symbol,
                                   const LedgerJournal* journal,
                                   const std::vector<LedgerEvent>& restore_events,
                                   std::string* out_error) {
  if (started_) {
    if (out_error != nullptr) {
      *out_error = "宿主已启动，无法注册品种: " + symbol;
    }
    return false;
  }
  if (by_symbol_.count(symbol) > 0) {
    if (out_error != nullptr) {
      *out_error = "品种重复注册: " + symbol;
    }
    return false;
  }

  auto worker = std::make_unique<Worker>();
  worker->symbol = symbol;
  worker->core = std::make_unique<DecisionCore>(doctrine_, config_, journal);
  if (!restore_events.empty()) {
    worker->core->RestoreLedger(restore_events);
  }
  by_symbol_[symbol] = worker.get();
  workers_.push_back(std::move(worker));
  return true;
}

void InstrumentHost::Start() {
  if (started_) {
    return;
  }
  started_ = true;
  for (auto& worker : workers_) {
    worker->thread = std::thread(&InstrumentHost::WorkerLoop, this, worker.get());
  }
}

void InstrumentHost::Stop() {
  for (auto& worker : workers_) {
    if (!worker->thread.joinable()) {
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(worker->queue_mutex);
      worker->tasks.push(
          Task{.type = Task::kStop, .bar = {}, .friction = {}, .price = 0.0});
    }
    worker->queue_cv.notify_one();
    worker->thread.join();
  }
}

bool InstrumentHost::Enqueue(const std::string& symbol, Task task) {
  const auto it = by_symbol_.find(symbol);
  if (it == by_symbol_.end()) {
    return false;
  }
  Worker* worker = it->second;
  {
    std::lock_guard<std::mutex> lock(worker->queue_mutex);
    worker->tasks.push(std::move(task));
  }
  worker->queue_cv.notify_one();
  return true;
}

bool InstrumentHost::Submit(const std::string& symbol, const Bar& bar,
                            const ExecutionFriction& friction) {
  return Enqueue(symbol, Task{.type = Task::kBar,
                              .bar = bar,
                              .friction = friction,
                              .price = 0.0});
}

bool InstrumentHost::AcknowledgeHalt(const std::string& symbol) {
  return Enqueue(symbol, Task{.type = Task::kAcknowledge,
                              .bar = {},
                              .friction = {},
                              .price = 0.0});
}

bool InstrumentHost::Flatten(const std::string& symbol, double price) {
  return Enqueue(symbol, Task{.type = Task::kFlatten,
                              .bar = {},
                              .friction = {},
                              .price = price});
}

bool InstrumentHost::ReportWatchdogTimeout(const std::string& symbol) {
  return Enqueue(symbol, Task{.type = Task::kWatchdogTimeout,
                              .bar = {},
                              .friction = {},
                              .price = 0.0});
}

bool InstrumentHost::ResetSession(const std::string& symbol) {
  return Enqueue(symbol, Task{.type = Task::kResetSession,
                              .bar = {},
                              .friction = {},
                              .price = 0.0});
}

void InstrumentHost::PollSummaries(std::vector<BarSummary>* out_summaries) {
  if (out_summaries == nullptr) return;
  out_summaries->clear();
  {
    std::lock_guard<std::mutex> lock(result_mutex_);
    out_summaries->swap(results_);
  }
  for (const BarSummary& summary : *out_summaries) {
    latest_live_open_[summary.symbol] = summary.live_position_open;
  }
}

int InstrumentHost::OpenLiveCount() const {
  int count = 0;
  for (const auto& [symbol, live_open] : latest_live_open_) {
    if (live_open) {
      ++count;
    }
  }
  return count;
}

void InstrumentHost::Publish(BarSummary summary) {
  std::lock_guard<std::mutex> lock(result_mutex_);
  results_.push_back(std::move(summary));
}

BarSummary InstrumentHost::MakeSummary(const Worker& worker,
                                       std::int64_t bar_index) {
  BarSummary summary;
  summary.symbol = worker.symbol;
  summary.bar_index = bar_index;
  const auto& position = worker.core->position();
  summary.position_open = position.has_value();
  summary.live_position_open = position.has_value() && !position->shadow;
  summary.mode = worker.core->mode();
  return summary;
}

void InstrumentHost::RunControl(Worker* worker, const Task& task) {
  DecisionCore& core = *worker->core;
  switch (task.type) {
    case Task::kAcknowledge:
      core.AcknowledgeHalt();
      return;
    case Task::kWatchdogTimeout:
      core.OnWatchdogTimeout();
      return;
    case Task::kFlatten: {
      const auto exit = core.Flatten(task.price);
      if (!exit.has_value()) {
        LogInfo(worker->symbol + " 无持仓，忽略平仓请求");
        return;
      }
      BarSummary summary = MakeSummary(*worker, exit->bar_index);
      summary.exits.push_back(*exit);
      Publish(std::move(summary));
      return;
    }
    case Task::kResetSession: {
      core.ResetSession();
      BarSummary summary = MakeSummary(*worker, core.last_bar_index());
      summary.session_reset = true;
      Publish(std::move(summary));
      return;
    }
    case Task::kBar:
    case Task::kStop:
      return;
  }
}

void InstrumentHost::WorkerLoop(Worker* worker) {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(worker->queue_mutex);
      worker->queue_cv.wait(lock, [worker] { return !worker->tasks.empty(); });
      task = worker->tasks.front();
      worker->tasks.pop();
    }
    if (task.type == Task::kStop) {
      break;
    }
    if (task.type != Task::kBar) {
      RunControl(worker, task);
      continue;
    }

    const BarDecision decision = worker->core->OnBar(task.bar, task.friction);
    BarSummary summary = MakeSummary(*worker, decision.bar_index);
    summary.status = decision.status;
    if (decision.entry.has_value()) {
      summary.has_ignition = true;
      summary.theta = decision.entry->theta;
      summary.reason = decision.entry->policy.reason;
      summary.entry_opened = decision.entry->opened;
    }
    summary.exits = decision.exits;
    summary.record = decision.record;
    summary.session_reset = decision.session_reset;
    summary.mode = decision.mode;
    if (decision.status == CoreFault::kCorruptBar) {
      LogError(worker->symbol + " 坏 bar 已丢弃，等待人工确认: " +
               decision.fault_detail);
    }
    Publish(std::move(summary));
  }
}

}  // namespace theta_core
