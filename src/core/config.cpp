#include "core/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace theta_core {

namespace {

// 轻量 YAML 解析工具：
// - 通过缩进识别 section；
// - 仅覆盖当前项目使用到的配置字段。
std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  while (begin < text.size() &&
         std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }

  std::size_t end = text.size();
  while (end > begin &&
         std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return text.substr(begin, end - begin);
}

std::string StripInlineComment(const std::string& line) {
  // 仅剔除非引号上下文中的 `#` 注释，避免误伤字符串内容。
  bool in_single_quotes = false;
  bool in_double_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (ch == '\'' && !in_double_quotes) {
      in_single_quotes = !in_single_quotes;
      continue;
    }
    if (ch == '"' && !in_single_quotes) {
      in_double_quotes = !in_double_quotes;
      continue;
    }
    if (ch == '#' && !in_single_quotes && !in_double_quotes) {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string Unquote(const std::string& text) {
  if (text.size() < 2) {
    return text;
  }
  const bool single_quoted = text.front() == '\'' && text.back() == '\'';
  const bool double_quoted = text.front() == '"' && text.back() == '"';
  if (single_quoted || double_quoted) {
    return text.substr(1, text.size() - 2);
  }
  return text;
}

bool ParseDouble(const std::string& text, double* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  std::istringstream iss(text);
  double value = 0.0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseInt64(const std::string& text, std::int64_t* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  std::istringstream iss(text);
  std::int64_t value = 0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseInt(const std::string& text, int* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  std::istringstream iss(text);
  int value = 0;
  iss >> value;
  if (!iss.fail() && iss.eof()) {
    *out_value = value;
    return true;
  }
  return false;
}

bool ParseBool(const std::string& text, bool* out_value) {
  if (out_value == nullptr) {
    return false;
  }
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    *out_value = true;
    return true;
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    *out_value = false;
    return true;
  }
  return false;
}

bool ParseStringList(const std::string& text,
                     std::vector<std::string>* out_items) {
  if (out_items == nullptr) {
    return false;
  }

  std::string trimmed = Trim(text);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return false;
  }
  trimmed = trimmed.substr(1, trimmed.size() - 2);
  out_items->clear();
  std::string token;
  std::istringstream iss(trimmed);
  while (std::getline(iss, token, ',')) {
    const std::string item = Trim(Unquote(Trim(token)));
    if (!item.empty()) {
      out_items->push_back(item);
    }
  }
  return true;
}

bool Fail(const std::string& key, int line_no, std::string* out_error) {
  if (out_error != nullptr) {
    *out_error = key + " 解析失败，行号: " + std::to_string(line_no);
  }
  return false;
}

}  // namespace

bool LoadAppConfigFromYaml(const std::string& file_path,
                           AppConfig* out_config,
                           std::string* out_error) {
  if (out_config == nullptr) {
    if (out_error != nullptr) {
      *out_error = "out_config 为空";
    }
    return false;
  }

  std::ifstream input(file_path);
  if (!input.is_open()) {
    if (out_error != nullptr) {
      *out_error = "无法打开配置文件: " + file_path;
    }
    return false;
  }

  AppConfig config = *out_config;
  std::string current_section;
  std::string line;
  int line_no = 0;
  while (std::getline(input, line)) {
    ++line_no;
    const std::string no_comment = Trim(StripInlineComment(line));
    if (no_comment.empty()) {
      continue;
    }

    const std::size_t indent = line.find_first_not_of(' ');
    if (indent == std::string::npos) {
      continue;
    }

    if (indent == 0 && no_comment.back() == ':') {
      current_section = Trim(no_comment.substr(0, no_comment.size() - 1));
      continue;
    }

    const std::size_t colon_pos = no_comment.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }
    const std::string key = Trim(no_comment.substr(0, colon_pos));
    const std::string raw_value = Trim(no_comment.substr(colon_pos + 1));
    if (raw_value.empty()) {
      continue;
    }
    const std::string value = Unquote(raw_value);
    if (indent == 0) {
      current_section.clear();
    }

    if (current_section.empty()) {
      if (key == "mode") {
        config.mode = value;
      } else if (key == "symbols") {
        if (!ParseStringList(raw_value, &config.symbols) ||
            config.symbols.empty()) {
          return Fail("symbols", line_no, out_error);
        }
      } else if (key == "bars_path") {
        config.bars_path = value;
      } else if (key == "decision_log_path") {
        config.decision_log_path = value;
      } else if (key == "ledger_journal_path") {
        config.ledger_journal_path = value;
      } else if (key == "shadow_probe_enabled") {
        if (!ParseBool(value, &config.shadow_probe_enabled)) {
          return Fail("shadow_probe_enabled", line_no, out_error);
        }
      }
      continue;
    }

    if (current_section == "feed" && key == "stale_bound_ms") {
      if (!ParseInt64(value, &config.feed.stale_bound_ms) ||
          config.feed.stale_bound_ms <= 0) {
        return Fail("feed.stale_bound_ms", line_no, out_error);
      }
      continue;
    }
    if (current_section == "feed" && key == "resume_bars") {
      if (!ParseInt(value, &config.feed.resume_bars) ||
          config.feed.resume_bars < 1) {
        return Fail("feed.resume_bars", line_no, out_error);
      }
      continue;
    }
    if (current_section == "friction" && key == "max_latency_ms") {
      if (!ParseInt(value, &config.friction.max_latency_ms) ||
          config.friction.max_latency_ms < 0) {
        return Fail("friction.max_latency_ms", line_no, out_error);
      }
      continue;
    }
    if (current_section == "session" && key == "auto_reset_on_day_change") {
      if (!ParseBool(value, &config.session.auto_reset_on_day_change)) {
        return Fail("session.auto_reset_on_day_change", line_no, out_error);
      }
      continue;
    }
    if (current_section == "mode_switch" && key == "fast_collapse_threshold") {
      if (!ParseInt(value, &config.mode_switch.fast_collapse_threshold) ||
          config.mode_switch.fast_collapse_threshold < 0) {
        return Fail("mode_switch.fast_collapse_threshold", line_no, out_error);
      }
      continue;
    }
    if (current_section == "record" && key == "delta_large_threshold") {
      if (!ParseDouble(value, &config.record.delta_large_threshold) ||
          config.record.delta_large_threshold < 0.0) {
        return Fail("record.delta_large_threshold", line_no, out_error);
      }
      continue;
    }
    if (current_section == "doctrine" && key == "version") {
      config.doctrine.version = value;
      continue;
    }
    if (current_section == "doctrine" && key == "fingerprint") {
      config.doctrine.fingerprint = value;
      continue;
    }
    // doctrine 数值属于锁定参数，配置文件中出现即视为越权修改。
    if (current_section == "doctrine") {
      if (out_error != nullptr) {
        *out_error = "doctrine." + key +
                     " 为锁定参数，禁止在配置中覆盖，行号: " +
                     std::to_string(line_no);
      }
      return false;
    }
  }

  *out_config = config;
  return true;
}

}  // namespace theta_core
