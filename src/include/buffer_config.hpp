/** @copyright Copyright The pktbuf Contributors */

#ifndef PKTBUF_SRC_INCLUDE_BUFFER_CONFIG_HPP_
#define PKTBUF_SRC_INCLUDE_BUFFER_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

namespace pktbuf::config {

// ── 链式缓冲区 ──────────────────────────────────────────────────
/// 一条链最多包含的段数（含首段）
inline constexpr size_t kMaxChainDepth = 4;

// ── 多路复用层 ──────────────────────────────────────────────────
/// 单个 MuxLayer 可注册的最大设备数
inline constexpr size_t kMaxMuxDevices = 8;
/// Mux 帧尾标记字节
inline constexpr uint8_t kMuxFrameTerminator = 0xFF;

// ── 回环设备 ────────────────────────────────────────────────────
/// 回环设备一次 DMA 映射的最大段数
inline constexpr size_t kLoopbackMaxSegments = kMaxChainDepth;

}  // namespace pktbuf::config

#endif  // PKTBUF_SRC_INCLUDE_BUFFER_CONFIG_HPP_
