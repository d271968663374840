#pragma once

#include <string>
#include <vector>

#include "zone/zone_ledger.h"

namespace theta_core {

/**
 * @brief Zone 账本追加日志
 *
 * 语义：
 * 1. 每条账本事件写一行制表符分隔文本（append + flush），字段为
 *    TYPE ts_ms bar_index zone DIR OUTCOME corroborated；
 * 2. 进程在会话内重启时，按顺序重放即可重建账本；
 * 3. 字段顺序固定，便于人工排障。
 */
class LedgerJournal {
 public:
  explicit LedgerJournal(std::string file_path)
      : file_path_(std::move(file_path)) {}

  /// 确保父目录存在并创建文件（若不存在）。
  bool Initialize(std::string* out_error) const;

  /// 追加一条账本事件。
  bool Append(const LedgerEvent& event, std::string* out_error) const;

  /// 读取全部事件；文件不存在视为无历史。
  bool LoadEvents(std::vector<LedgerEvent>* out_events,
                  std::string* out_error) const;

  const std::string& file_path() const { return file_path_; }

 private:
  std::string file_path_;
};

}  // namespace theta_core
