#pragma once

#include <string_view>

namespace theta_core {

/**
 * @brief 输出 INFO 级日志
 *
 * 行为：
 * 1. 线程安全串行写入（多品种 worker 共享同一把锁）；
 * 2. 输出到 `stdout`；
 * 3. 自动附加本地时间戳和 `[INFO]` 前缀。
 */
void LogInfo(std::string_view message);

/// 输出 WARN 级日志（`stderr`），用于可恢复的降级事件，例如行情陈旧。
void LogWarn(std::string_view message);

/**
 * @brief 输出 ERROR 级日志
 *
 * 用于致命事件（如 CorruptBar 导致流水线停机），输出到 `stderr`。
 */
void LogError(std::string_view message);

}  // namespace theta_core
