#include "market/csv_bar_feed.h"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace theta_core {

namespace {

std::vector<std::string> SplitComma(const std::string& line) {
  std::vector<std::string> parts;
  std::string current;
  std::istringstream iss(line);
  while (std::getline(iss, current, ',')) {
    parts.push_back(current);
  }
  return parts;
}

double ParseDoubleOrNan(const std::string& text) {
  const char* begin = text.c_str();
  char* end = nullptr;
  const double value = std::strtod(begin, &end);
  if (end == begin) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  while (*end == ' ' || *end == '\r') {
    ++end;
  }
  if (*end != '\0') {
    return std::numeric_limits<double>::quiet_NaN();
  }
  return value;
}

bool ParseInt64(const std::string& text, std::int64_t* out_value) {
  const char* begin = text.c_str();
  char* end = nullptr;
  const long long value = std::strtoll(begin, &end, 10);
  if (end == begin) {
    return false;
  }
  while (*end == ' ' || *end == '\r') {
    ++end;
  }
  if (*end != '\0') {
    return false;
  }
  *out_value = static_cast<std::int64_t>(value);
  return true;
}

}  // namespace

bool ParseBarCsvLine(const std::string& line, Bar* out_bar,
                     std::string* out_error) {
  if (out_bar == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_bar 为空";
    }
    return false;
  }
  const auto fields = SplitComma(line);
  if (fields.size() < 7) {
    if (out_error != nullptr) {
      *out_error = "bar 行字段数不足: " + std::to_string(fields.size());
    }
    return false;
  }

  Bar bar;
  if (!ParseInt64(fields[0], &bar.ts_ms) || !ParseInt64(fields[1], &bar.index)) {
    if (out_error != nullptr) {
      *out_error = "bar ts/index 解析失败";
    }
    return false;
  }
  bar.open = ParseDoubleOrNan(fields[2]);
  bar.high = ParseDoubleOrNan(fields[3]);
  bar.low = ParseDoubleOrNan(fields[4]);
  bar.close = ParseDoubleOrNan(fields[5]);
  bar.delta = ParseDoubleOrNan(fields[6]);
  *out_bar = bar;
  return true;
}

bool LoadBarsFromCsv(const std::string& file_path,
                     std::vector<Bar>* out_bars,
                     std::string* out_error) {
  if (out_bars == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_bars 为空";
    }
    return false;
  }
  std::ifstream input(file_path);
  if (!input.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法打开行情文件: " + file_path;
    }
    return false;
  }

  out_bars->clear();
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    if (line_no == 1 && line.rfind("ts", 0) == 0) {
      continue;  // 表头
    }
    Bar bar;
    std::string parse_error;
    if (!ParseBarCsvLine(line, &bar, &parse_error)) {
      if (out_error != nullptr) {
        *out_error = "行情行解析失败（line=" + std::to_string(line_no) +
                     "）: " + parse_error;
      }
      return false;
    }
    out_bars->push_back(bar);
  }
  return true;
}

}  // namespace theta_core
