#include "storage/ledger_journal.h"

#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace theta_core {

namespace {

std::string Serialize(const LedgerEvent& event) {
  std::ostringstream oss;
  oss << ToString(event.type) << '\t' << event.ts_ms << '\t'
      << event.bar_index << '\t' << event.zone_id << '\t'
      << ToString(event.direction) << '\t' << ToString(event.outcome) << '\t'
      << (event.corroborated ? 1 : 0);
  return oss.str();
}

std::vector<std::string> SplitTab(const std::string& line) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream iss(line);
  while (std::getline(iss, current, '\t')) {
    parts.push_back(current);
  }
  return parts;
}

bool ParseEvent(const std::vector<std::string>& fields,
                LedgerEvent* out_event,
                std::string* out_error) {
  if (fields.size() != 7) {
    if (out_error != nullptr) {
      *out_error = "账本日志字段数异常";
    }
    return false;
  }

  LedgerEvent event;
  if (fields[0] == "OUTCOME") {
    event.type = LedgerEventType::kOutcome;
  } else if (fields[0] == "RETRY") {
    event.type = LedgerEventType::kRetry;
  } else if (fields[0] == "RESET") {
    event.type = LedgerEventType::kReset;
  } else {
    if (out_error != nullptr) {
      *out_error = "未知账本事件类型: " + fields[0];
    }
    return false;
  }

  if (fields[4] == "LONG") {
    event.direction = Direction::kLong;
  } else if (fields[4] == "SHORT") {
    event.direction = Direction::kShort;
  } else {
    if (out_error != nullptr) {
      *out_error = "账本日志 direction 非法: " + fields[4];
    }
    return false;
  }

  if (fields[5] == "WIN") {
    event.outcome = Outcome::kWin;
  } else if (fields[5] == "LOSS") {
    event.outcome = Outcome::kLoss;
  } else {
    if (out_error != nullptr) {
      *out_error = "账本日志 outcome 非法: " + fields[5];
    }
    return false;
  }

  try {
    event.ts_ms = std::stoll(fields[1]);
    event.bar_index = std::stoll(fields[2]);
    event.zone_id = std::stoll(fields[3]);
    event.corroborated = std::stoi(fields[6]) != 0;
  } catch (const std::exception&) {
    if (out_error != nullptr) {
      *out_error = "账本日志数值字段解析失败";
    }
    return false;
  }

  *out_event = event;
  return true;
}

}  // namespace

bool LedgerJournal::Initialize(std::string* out_error) const {
  const std::filesystem::path path(file_path_);
  const auto parent = path.parent_path();
  std::error_code ec;
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (out_error != nullptr) {
        *out_error = "创建账本日志目录失败: " + ec.message();
      }
      return false;
    }
  }

  std::ofstream out(file_path_, std::ios::app);
  if (!out.is_open()) {
    if (out_error != nullptr) {
      *out_error = "创建/打开账本日志失败: " + file_path_;
    }
    return false;
  }
  return true;
}

bool LedgerJournal::Append(const LedgerEvent& event,
                           std::string* out_error) const {
  std::ofstream out(file_path_, std::ios::app);
  if (!out.is_open()) {
    if (out_error != nullptr) {
      *out_error = "账本日志打开失败: " + file_path_;
    }
    return false;
  }
  out << Serialize(event) << '\n';
  out.flush();
  if (!out.good()) {
    if (out_error != nullptr) {
      *out_error = "账本日志写入失败";
    }
    return false;
  }
  return true;
}

bool LedgerJournal::LoadEvents(std::vector<LedgerEvent>* out_events,
                               std::string* out_error) const {
  if (out_events == nullptr) {
    if (out_error != nullptr) {
      *out_error = "LoadEvents 输出参数为空";
    }
    return false;
  }
  out_events->clear();

  std::ifstream in(file_path_);
  if (!in.is_open()) {
    return true;
  }

  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    LedgerEvent event;
    std::string parse_error;
    if (!ParseEvent(SplitTab(line), &event, &parse_error)) {
      if (out_error != nullptr) {
        *out_error = "账本日志行解析失败（line=" + std::to_string(line_no) +
                     "）: " + parse_error;
      }
      return false;
    }
    out_events->push_back(event);
  }
  return true;
}

}  // namespace theta_core
