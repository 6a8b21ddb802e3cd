/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 多个虚拟设备共享一个下层发送驱动
 */

#ifndef PKTBUF_SRC_INCLUDE_MUX_LAYER_HPP_
#define PKTBUF_SRC_INCLUDE_MUX_LAYER_HPP_

#include <etl/optional.h>
#include <etl/queue.h>
#include <etl/vector.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "buffer_config.hpp"
#include "expected.hpp"
#include "kernel_log.hpp"
#include "packet_assert.hpp"
#include "packet_driver.hpp"
#include "sized_packet.hpp"

namespace pktbuf {

template <size_t kDeviceHead, size_t kDeviceTail>
  requires(kDeviceHead >= 1 && kDeviceTail >= 1)
class MuxLayer;

/**
 * @brief MuxLayer 上的一个虚拟设备
 *
 * 每个设备同一时刻最多有一帧在等待或发送中。
 */
template <size_t kDeviceHead, size_t kDeviceTail>
  requires(kDeviceHead >= 1 && kDeviceTail >= 1)
class MuxDevice : public TransmitDriver<kDeviceHead, kDeviceTail> {
 public:
  using Buffer = PacketBufferMut<kDeviceHead, kDeviceTail>;

  /// @name 构造/析构函数
  /// @{
  MuxDevice() = default;
  MuxDevice(const MuxDevice&) = delete;
  MuxDevice(MuxDevice&&) = delete;
  auto operator=(const MuxDevice&) -> MuxDevice& = delete;
  auto operator=(MuxDevice&&) -> MuxDevice& = delete;
  ~MuxDevice() override = default;
  /// @}

  auto SetTransmitClient(TransmitClient<kDeviceHead, kDeviceTail>* client)
      -> void override {
    client_ = client;
  }

  /**
   * @brief 提交一帧
   * @return DriverResult 未注册到 MuxLayer 时返回 kDriverOff；
   *         已有帧未完成时返回 kDriverBusy
   */
  auto Transmit(Buffer buffer, TransmitToken token)
      -> DriverResult<kDeviceHead, kDeviceTail> override {
    if (mux_ == nullptr) {
      return Reject(Error(ErrorCode::kDriverOff), std::move(buffer));
    }
    if (busy_) {
      return Reject(Error(ErrorCode::kDriverBusy), std::move(buffer));
    }
    busy_ = true;
    pending_ = std::move(buffer);
    token_ = token;
    mux_->Schedule(id_);
    return {};
  }

  [[nodiscard]] auto Id() const -> uint8_t { return id_; }
  [[nodiscard]] auto IsBusy() const -> bool { return busy_; }

 private:
  friend class MuxLayer<kDeviceHead, kDeviceTail>;

  auto Complete(Buffer buffer, Expected<void> result) -> void {
    busy_ = false;
    pktbuf_assert_msg(client_ != nullptr,
                      "MuxDevice %u: completion without client",
                      static_cast<unsigned>(id_));
    client_->TransmitDone(std::move(buffer), token_, result);
  }

  MuxLayer<kDeviceHead, kDeviceTail>* mux_{nullptr};
  TransmitClient<kDeviceHead, kDeviceTail>* client_{nullptr};
  Buffer pending_;
  TransmitToken token_{0};
  uint8_t id_{0};
  bool busy_{false};
};

/**
 * @brief 帧复用层
 *
 * 每帧前加一字节设备号，后加 config::kMuxFrameTerminator，
 * 下层同一时刻只有一帧在发送，等待的设备按先来先服务排队。
 * 下层发送的 token 为设备号。
 *
 * @tparam kDeviceHead 设备对上层保证的 headroom
 * @tparam kDeviceTail 设备对上层保证的 tailroom
 */
template <size_t kDeviceHead, size_t kDeviceTail>
  requires(kDeviceHead >= 1 && kDeviceTail >= 1)
class MuxLayer : public TransmitClient<kDeviceHead - 1, kDeviceTail - 1> {
 public:
  static constexpr size_t kLowerHead = kDeviceHead - 1;
  static constexpr size_t kLowerTail = kDeviceTail - 1;

  using Device = MuxDevice<kDeviceHead, kDeviceTail>;
  using LowerBuffer = PacketBufferMut<kLowerHead, kLowerTail>;

  /// @name 构造/析构函数
  /// @{
  MuxLayer() = default;
  MuxLayer(const MuxLayer&) = delete;
  MuxLayer(MuxLayer&&) = delete;
  auto operator=(const MuxLayer&) -> MuxLayer& = delete;
  auto operator=(MuxLayer&&) -> MuxLayer& = delete;
  ~MuxLayer() override = default;
  /// @}

  /// 连接下层发送驱动，并将自身注册为其客户端
  auto SetLower(TransmitDriver<kLowerHead, kLowerTail>& lower) -> void {
    lower_ = &lower;
    lower.SetTransmitClient(this);
  }

  /**
   * @brief 注册设备
   * @return Expected<uint8_t> 分配的设备号；超过 config::kMaxMuxDevices
   *         时返回 kDriverTooManyDevices
   */
  auto AddDevice(Device& device) -> Expected<uint8_t> {
    if (devices_.full()) {
      klog::Warn("MuxLayer: device table full (%zu)\n",
                 config::kMaxMuxDevices);
      return std::unexpected(Error(ErrorCode::kDriverTooManyDevices));
    }
    device.mux_ = this;
    device.id_ = static_cast<uint8_t>(devices_.size());
    devices_.push_back(&device);
    return device.id_;
  }

  auto TransmitDone(LowerBuffer buffer, TransmitToken token,
                    Expected<void> result) -> void override {
    pktbuf_assert_msg(inflight_.has_value() && *inflight_ == token,
                      "unexpected completion for device %u",
                      static_cast<unsigned>(token));
    inflight_.reset();
    devices_[token]->Complete(Unframe(std::move(buffer)), result);
    StartNext();
  }

  [[nodiscard]] auto DeviceCount() const -> size_t { return devices_.size(); }
  [[nodiscard]] auto IsIdle() const -> bool {
    return !inflight_.has_value() && waiting_.empty();
  }

 private:
  friend class MuxDevice<kDeviceHead, kDeviceTail>;

  auto Schedule(uint8_t id) -> void {
    // 每个设备最多排队一次，队列容量等于设备上限
    waiting_.push(id);
    StartNext();
  }

  auto StartNext() -> void {
    while (!inflight_.has_value() && !waiting_.empty()) {
      const uint8_t id = waiting_.front();
      waiting_.pop();
      Device& device = *devices_[id];

      const std::array<uint8_t, 1> header{id};
      const std::array<uint8_t, 1> trailer{config::kMuxFrameTerminator};
      auto framed = std::move(device.pending_)
                        .template Prepend<1>(header)
                        .template Append<1>(trailer);

      if (lower_ == nullptr) {
        device.Complete(Unframe(std::move(framed)),
                        std::unexpected(Error(ErrorCode::kDriverOff)));
        continue;
      }

      inflight_ = id;
      auto result = lower_->Transmit(std::move(framed), id);
      if (!result) {
        inflight_.reset();
        klog::Debug("MuxLayer: lower rejected device %u: %s\n",
                    static_cast<unsigned>(id), result.error().error.message());
        device.Complete(Unframe(std::move(result.error().buffer)),
                        std::unexpected(result.error().error));
      }
    }
  }

  auto Unframe(LowerBuffer buffer) -> typename Device::Buffer {
    auto stripped = buffer.Strip(1, 1);
    pktbuf_assert_msg(stripped.has_value(),
                      "lower layer returned a buffer without mux framing");
    auto upper = buffer.template TryRecover<PacketBufferBase, kDeviceHead,
                                            kDeviceTail>();
    pktbuf_assert_msg(upper.has_value(),
                      "buffer cannot carry device guarantees %zu/%zu",
                      kDeviceHead, kDeviceTail);
    return std::move(*upper);
  }

  TransmitDriver<kLowerHead, kLowerTail>* lower_{nullptr};
  etl::vector<Device*, config::kMaxMuxDevices> devices_;
  etl::queue<uint8_t, config::kMaxMuxDevices> waiting_;
  etl::optional<uint8_t> inflight_;
};

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_MUX_LAYER_HPP_
