/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 数据包缓冲区的 DMA 映射
 */

#ifndef PKTBUF_SRC_INCLUDE_DMA_HPP_
#define PKTBUF_SRC_INCLUDE_DMA_HPP_

#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>

#include "expected.hpp"
#include "kernel_log.hpp"
#include "packet_buffer.hpp"

namespace pktbuf {

/**
 * @brief 内存屏障能力
 *
 * Mb: 全屏障；Rmb: 读屏障；Wmb: 写屏障
 */
template <typename T>
concept BarrierTraits = requires {
  { T::Mb() } -> std::same_as<void>;
  { T::Rmb() } -> std::same_as<void>;
  { T::Wmb() } -> std::same_as<void>;
};

/**
 * @brief DMA 地址转换能力
 */
template <typename T>
concept DmaTraits = requires(void* virt, uintptr_t phys) {
  { T::VirtToPhys(virt) } -> std::same_as<uintptr_t>;
  { T::PhysToVirt(phys) } -> std::same_as<void*>;
};

/**
 * @brief 零开销默认 Traits，所有方法在编译期消除
 *
 * 适用于物理地址等于虚拟地址且设备访问与 CPU 一致的平台。
 */
struct NullTraits {
  static auto Mb() -> void {}
  static auto Rmb() -> void {}
  static auto Wmb() -> void {}
  static auto VirtToPhys(void* virt) -> uintptr_t {
    return reinterpret_cast<uintptr_t>(virt);
  }
  static auto PhysToVirt(uintptr_t phys) -> void* {
    return reinterpret_cast<void*>(phys);
  }
};

/// 宿主环境：恒等映射，屏障由 C++ 内存模型提供
struct HostTraits : NullTraits {
  static auto Mb() -> void {
    std::atomic_thread_fence(std::memory_order_seq_cst);
  }
  static auto Rmb() -> void {
    std::atomic_thread_fence(std::memory_order_acquire);
  }
  static auto Wmb() -> void {
    std::atomic_thread_fence(std::memory_order_release);
  }
};

static_assert(BarrierTraits<NullTraits> && DmaTraits<NullTraits>);
static_assert(BarrierTraits<HostTraits> && DmaTraits<HostTraits>);

/// 设备可见的一段连续内存
struct DmaSegment {
  uintptr_t address;
  size_t length;
};

/**
 * @brief 生成缓冲区 payload 的分散/聚集描述
 * @tparam Traits 平台屏障与地址转换
 * @param  buffer 数据包缓冲区，沿 Next() 遍历各段
 * @param  segments 输出的段描述
 * @return Expected<size_t> 写入的段数；段数超过 segments 容量时返回
 *         kDmaTooManySegments
 * @post 成功时已执行写屏障，设备可以读取 payload
 */
template <typename Traits>
  requires BarrierTraits<Traits> && DmaTraits<Traits>
auto MapForDevice(PacketBufferBase& buffer, std::span<DmaSegment> segments)
    -> Expected<size_t> {
  size_t count = 0;
  // 链式缓冲区的首段 Payload() 只覆盖自身
  for (PacketBufferBase* link = &buffer; link != nullptr; link = link->Next()) {
    auto payload = link->Payload();
    if (payload.empty()) {
      continue;
    }
    if (count == segments.size()) {
      klog::Warn("MapForDevice: more than %zu segments\n", segments.size());
      return std::unexpected(Error(ErrorCode::kDmaTooManySegments));
    }
    segments[count++] = {Traits::VirtToPhys(payload.data()), payload.size()};
  }
  Traits::Wmb();
  return count;
}

/**
 * @brief 设备写入完成后，使 CPU 看到最新数据
 */
template <typename Traits>
  requires BarrierTraits<Traits>
auto UnmapFromDevice([[maybe_unused]] PacketBufferBase& buffer) -> void {
  Traits::Rmb();
}

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_DMA_HPP_
