/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 回环网络设备：发送的帧在下一次中断时送回接收端
 */

#ifndef PKTBUF_SRC_DEVICE_LOOPBACK_LOOPBACK_DEVICE_HPP_
#define PKTBUF_SRC_DEVICE_LOOPBACK_LOOPBACK_DEVICE_HPP_

#include <etl/optional.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

#include "buffer_config.hpp"
#include "dma.hpp"
#include "expected.hpp"
#include "kernel_log.hpp"
#include "packet_assert.hpp"
#include "packet_driver.hpp"
#include "sized_packet.hpp"

namespace loopback {

using pktbuf::DriverResult;
using pktbuf::Error;
using pktbuf::ErrorCode;
using pktbuf::Expected;
using pktbuf::PacketBufferMut;
using pktbuf::TransmitToken;

/**
 * @brief 回环设备
 *
 * 发送缓冲区在接受时完成 DMA 映射，HandleInterrupt() 模拟设备中断：
 * 完成发送，并将帧按分散/聚集描述拷贝进已提供的接收缓冲区。
 * 没有接收缓冲区时帧被丢弃并计数。
 *
 * @tparam kHeadroomBytes 对上层保证的 headroom
 * @tparam kTailroomBytes 对上层保证的 tailroom
 * @tparam Traits 平台屏障与地址转换
 */
template <size_t kHeadroomBytes, size_t kTailroomBytes,
          typename Traits = pktbuf::HostTraits>
  requires pktbuf::BarrierTraits<Traits> && pktbuf::DmaTraits<Traits>
class LoopbackDevice
    : public pktbuf::TransmitDriver<kHeadroomBytes, kTailroomBytes>,
      public pktbuf::ReceiveDriver<kHeadroomBytes, kTailroomBytes> {
 public:
  using Buffer = PacketBufferMut<kHeadroomBytes, kTailroomBytes>;

  /// @name 构造/析构函数
  /// @{
  LoopbackDevice() = default;
  LoopbackDevice(const LoopbackDevice&) = delete;
  LoopbackDevice(LoopbackDevice&&) = delete;
  auto operator=(const LoopbackDevice&) -> LoopbackDevice& = delete;
  auto operator=(LoopbackDevice&&) -> LoopbackDevice& = delete;
  ~LoopbackDevice() override = default;
  /// @}

  auto SetTransmitClient(
      pktbuf::TransmitClient<kHeadroomBytes, kTailroomBytes>* client)
      -> void override {
    tx_client_ = client;
  }

  auto SetReceiveClient(
      pktbuf::ReceiveClient<kHeadroomBytes, kTailroomBytes>* client)
      -> void override {
    rx_client_ = client;
  }

  auto Enable() -> void { enabled_ = true; }
  auto Disable() -> void { enabled_ = false; }
  [[nodiscard]] auto IsEnabled() const -> bool { return enabled_; }

  /// 下一次发送以 code 完成
  auto InjectError(ErrorCode code) -> void { injected_error_ = code; }

  auto Transmit(Buffer buffer, TransmitToken token)
      -> DriverResult<kHeadroomBytes, kTailroomBytes> override {
    if (!enabled_) {
      return pktbuf::Reject(Error(ErrorCode::kDriverOff), std::move(buffer));
    }
    if (tx_.IsValid()) {
      return pktbuf::Reject(Error(ErrorCode::kDriverBusy), std::move(buffer));
    }

    auto mapped = pktbuf::MapForDevice<Traits>(buffer.Get(), segments_);
    if (!mapped) {
      return pktbuf::Reject(mapped.error(), std::move(buffer));
    }
    segment_count_ = *mapped;
    tx_ = std::move(buffer);
    tx_token_ = token;
    return {};
  }

  /**
   * @brief 提供接收缓冲区
   * @return DriverResult 设备关闭时返回 kDriverOff；
   *         已有接收缓冲区时返回 kDriverBusy
   */
  auto Receive(Buffer buffer)
      -> DriverResult<kHeadroomBytes, kTailroomBytes> override {
    if (!enabled_) {
      return pktbuf::Reject(Error(ErrorCode::kDriverOff), std::move(buffer));
    }
    if (rx_.IsValid()) {
      return pktbuf::Reject(Error(ErrorCode::kDriverBusy), std::move(buffer));
    }
    auto cleared = buffer.CopyFrom({});
    if (!cleared) {
      return pktbuf::Reject(cleared.error(), std::move(buffer));
    }
    rx_ = std::move(buffer);
    return {};
  }

  /**
   * @brief 设备中断处理
   * @details 完成正在进行的发送；帧在交还发送缓冲区之前拷贝到接收端
   */
  auto HandleInterrupt() -> void {
    if (!tx_.IsValid()) {
      return;
    }

    Expected<void> result{};
    if (injected_error_.has_value()) {
      result = std::unexpected(Error(*injected_error_));
      injected_error_.reset();
    } else {
      Loop();
    }

    pktbuf::UnmapFromDevice<Traits>(tx_.Get());
    auto buffer = std::move(tx_);
    ++transmitted_;
    pktbuf_assert_msg(tx_client_ != nullptr,
                      "Loopback: transmit completion without client");
    tx_client_->TransmitDone(std::move(buffer), tx_token_, result);
  }

  [[nodiscard]] auto TransmittedCount() const -> size_t {
    return transmitted_;
  }
  [[nodiscard]] auto DroppedCount() const -> size_t { return dropped_; }
  [[nodiscard]] auto HasReceiveBuffer() const -> bool { return rx_.IsValid(); }

 private:
  /// 按 DMA 段描述将帧聚集进接收缓冲区
  auto Loop() -> void {
    if (!rx_.IsValid()) {
      ++dropped_;
      klog::Debug("Loopback: no receive buffer, frame dropped\n");
      return;
    }

    Expected<void> result{};
    for (size_t i = 0; i < segment_count_ && result; ++i) {
      const auto& segment = segments_[i];
      std::span<const uint8_t> bytes(
          static_cast<const uint8_t*>(Traits::PhysToVirt(segment.address)),
          segment.length);
      result = rx_.TryAppend(bytes);
    }
    if (!result) {
      klog::Warn("Loopback: frame does not fit receive buffer: %s\n",
                 result.error().message());
      auto cleared = rx_.CopyFrom({});
      if (!cleared) {
        result = cleared;
      }
    }

    pktbuf::UnmapFromDevice<Traits>(rx_.Get());
    klog::DebugBlob(rx_.Payload().data(), rx_.Payload().size());

    auto buffer = std::move(rx_);
    pktbuf_assert_msg(rx_client_ != nullptr,
                      "Loopback: received frame without client");
    const size_t length = buffer.Length();
    rx_client_->ReceivedBuffer(std::move(buffer), length, result);
  }

  pktbuf::TransmitClient<kHeadroomBytes, kTailroomBytes>* tx_client_{nullptr};
  pktbuf::ReceiveClient<kHeadroomBytes, kTailroomBytes>* rx_client_{nullptr};
  Buffer tx_;
  Buffer rx_;
  TransmitToken tx_token_{0};
  std::array<pktbuf::DmaSegment, pktbuf::config::kLoopbackMaxSegments>
      segments_{};
  size_t segment_count_{0};
  etl::optional<ErrorCode> injected_error_;
  size_t transmitted_{0};
  size_t dropped_{0};
  bool enabled_{true};
};

}  // namespace loopback

#endif  // PKTBUF_SRC_DEVICE_LOOPBACK_LOOPBACK_DEVICE_HPP_
