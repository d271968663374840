#pragma once

#include <string>
#include <vector>

#include "core/types.h"

namespace theta_core {

/**
 * @brief CSV 回放行情源
 *
 * 列顺序：`ts_ms,index,open,high,low,close,delta`，首行可为表头。
 * 数值无法解析的字段记为 NaN，交由 BarValidator 以 CorruptBar 处理；
 * 列数不足视为文件格式错误。
 */
bool LoadBarsFromCsv(const std::string& file_path,
                     std::vector<Bar>* out_bars,
                     std::string* out_error);

/// 解析单行 CSV（不含换行），供回放与测试共用。
bool ParseBarCsvLine(const std::string& line, Bar* out_bar,
                     std::string* out_error);

}  // namespace theta_core
