/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 内核日志相关函数
 */

#ifndef PKTBUF_SRC_INCLUDE_KERNEL_LOG_HPP_
#define PKTBUF_SRC_INCLUDE_KERNEL_LOG_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <source_location>
#include <utility>

#include "config.h"
#include "sk_stdio.h"

namespace klog {
namespace detail {

/// ANSI 转义码，在支持 ANSI 转义码的终端中可以显示颜色
static constexpr const auto kReset = "\033[0m";
static constexpr const auto kRed = "\033[31m";
static constexpr const auto kYellow = "\033[33m";
static constexpr const auto kMagenta = "\033[35m";
static constexpr const auto kCyan = "\033[36m";

enum LogLevel {
  kDebug,
  kInfo,
  kWarn,
  kErr,
  kLogLevelMax,
};

constexpr std::array<const char*, kLogLevelMax> kLogColors = {
    // kDebug
    detail::kMagenta,
    // kInfo
    detail::kCyan,
    // kWarn
    detail::kYellow,
    // kErr
    detail::kRed,
};

constexpr std::array<const char*, kLogLevelMax> kLogTags = {
    "D",
    "I",
    "W",
    "E",
};

template <LogLevel Level, typename... Args>
struct LogBase {
  explicit LogBase(Args&&... args,
                   [[maybe_unused]] const std::source_location& location =
                       std::source_location::current()) {
    if constexpr (Level == kDebug && !kPktbufDebugLog) {
      return;
    }
    constexpr auto* color = kLogColors[Level];
    sk_printf("%s[pktbuf][%s]", color, kLogTags[Level]);
    if constexpr (Level == kDebug) {
      sk_printf("[%s] ", location.function_name());
    } else {
      sk_printf(" ");
    }
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-security"
    sk_printf(args...);
#pragma GCC diagnostic pop
    sk_printf("%s", detail::kReset);
  }
};

}  // namespace detail

template <typename... Args>
struct Debug : public detail::LogBase<detail::kDebug, Args...> {
  explicit Debug(Args&&... args, const std::source_location& location =
                                     std::source_location::current())
      : detail::LogBase<detail::kDebug, Args...>(std::forward<Args>(args)...,
                                                 location) {}
};
template <typename... Args>
Debug(Args&&...) -> Debug<Args...>;

/// 以十六进制打印一段内存，仅在开启调试日志时输出
inline void DebugBlob(const void* data, size_t size) {
  if constexpr (kPktbufDebugLog) {
    sk_printf("%s[pktbuf][D] ", detail::kMagenta);
    for (size_t i = 0; i < size; i++) {
      sk_printf("0x%02X ", static_cast<const uint8_t*>(data)[i]);
    }
    sk_printf("%s\n", detail::kReset);
  }
}

template <typename... Args>
struct Info : public detail::LogBase<detail::kInfo, Args...> {
  explicit Info(Args&&... args, const std::source_location& location =
                                    std::source_location::current())
      : detail::LogBase<detail::kInfo, Args...>(std::forward<Args>(args)...,
                                                location) {}
};
template <typename... Args>
Info(Args&&...) -> Info<Args...>;

template <typename... Args>
struct Warn : public detail::LogBase<detail::kWarn, Args...> {
  explicit Warn(Args&&... args, const std::source_location& location =
                                    std::source_location::current())
      : detail::LogBase<detail::kWarn, Args...>(std::forward<Args>(args)...,
                                                location) {}
};
template <typename... Args>
Warn(Args&&...) -> Warn<Args...>;

template <typename... Args>
struct Err : public detail::LogBase<detail::kErr, Args...> {
  explicit Err(Args&&... args, const std::source_location& location =
                                   std::source_location::current())
      : detail::LogBase<detail::kErr, Args...>(std::forward<Args>(args)...,
                                               location) {}
};
template <typename... Args>
Err(Args&&...) -> Err<Args...>;

}  // namespace klog

#endif /* PKTBUF_SRC_INCLUDE_KERNEL_LOG_HPP_ */
