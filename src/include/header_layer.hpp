/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 添加定长头部与尾部的协议层
 */

#ifndef PKTBUF_SRC_INCLUDE_HEADER_LAYER_HPP_
#define PKTBUF_SRC_INCLUDE_HEADER_LAYER_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>

#include "expected.hpp"
#include "kernel_log.hpp"
#include "packet_assert.hpp"
#include "packet_driver.hpp"
#include "sized_packet.hpp"

namespace pktbuf {

/**
 * @brief 协议层适配器
 *
 * 对上层表现为 <kUpHead, kUpTail> 的驱动，对下层表现为
 * <kUpHead - kHeaderLen, kUpTail - kTrailerLen> 的客户端。
 * 发送时在保证的空间内写入头部与尾部，完成与接收时去掉它们，
 * 并通过类型恢复重新附加上层的保证。
 *
 * @tparam kUpHead 上层保证的 headroom
 * @tparam kUpTail 上层保证的 tailroom
 * @tparam kHeaderLen 本层头部长度
 * @tparam kTrailerLen 本层尾部长度
 */
template <size_t kUpHead, size_t kUpTail, size_t kHeaderLen,
          size_t kTrailerLen>
  requires(kHeaderLen <= kUpHead && kTrailerLen <= kUpTail)
class HeaderLayer
    : public TransmitDriver<kUpHead, kUpTail>,
      public ReceiveDriver<kUpHead, kUpTail>,
      public TransmitClient<kUpHead - kHeaderLen, kUpTail - kTrailerLen>,
      public ReceiveClient<kUpHead - kHeaderLen, kUpTail - kTrailerLen> {
 public:
  static constexpr size_t kDownHead = kUpHead - kHeaderLen;
  static constexpr size_t kDownTail = kUpTail - kTrailerLen;

  using UpperBuffer = PacketBufferMut<kUpHead, kUpTail>;
  using LowerBuffer = PacketBufferMut<kDownHead, kDownTail>;

  /// @name 构造/析构函数
  /// @{
  HeaderLayer(const std::array<uint8_t, kHeaderLen>& header,
              const std::array<uint8_t, kTrailerLen>& trailer)
      : header_(header), trailer_(trailer) {}
  HeaderLayer(const HeaderLayer&) = delete;
  HeaderLayer(HeaderLayer&&) = delete;
  auto operator=(const HeaderLayer&) -> HeaderLayer& = delete;
  auto operator=(HeaderLayer&&) -> HeaderLayer& = delete;
  ~HeaderLayer() override = default;
  /// @}

  /// 连接下层发送驱动，并将自身注册为其客户端
  auto SetLowerTransmit(TransmitDriver<kDownHead, kDownTail>& lower) -> void {
    lower_tx_ = &lower;
    lower.SetTransmitClient(this);
  }

  /// 连接下层接收驱动，并将自身注册为其客户端
  auto SetLowerReceive(ReceiveDriver<kDownHead, kDownTail>& lower) -> void {
    lower_rx_ = &lower;
    lower.SetReceiveClient(this);
  }

  auto SetTransmitClient(TransmitClient<kUpHead, kUpTail>* client)
      -> void override {
    tx_client_ = client;
  }

  auto SetReceiveClient(ReceiveClient<kUpHead, kUpTail>* client)
      -> void override {
    rx_client_ = client;
  }

  auto Transmit(UpperBuffer buffer, TransmitToken token)
      -> DriverResult<kUpHead, kUpTail> override {
    if (lower_tx_ == nullptr) {
      return Reject(Error(ErrorCode::kDriverOff), std::move(buffer));
    }

    auto framed = std::move(buffer)
                      .template Prepend<kHeaderLen>(header_)
                      .template Append<kTrailerLen>(trailer_);
    auto result = lower_tx_->Transmit(std::move(framed), token);
    if (!result) {
      return Reject(result.error().error,
                    Unframe(std::move(result.error().buffer)));
    }
    return {};
  }

  auto TransmitDone(LowerBuffer buffer, TransmitToken token,
                    Expected<void> result) -> void override {
    pktbuf_assert_msg(tx_client_ != nullptr,
                      "HeaderLayer: transmit completion without client");
    auto upper = Unframe(std::move(buffer));
    tx_client_->TransmitDone(std::move(upper), token, result);
  }

  auto Receive(UpperBuffer buffer) -> DriverResult<kUpHead, kUpTail> override {
    if (lower_rx_ == nullptr) {
      return Reject(Error(ErrorCode::kDriverOff), std::move(buffer));
    }

    auto lowered = std::move(buffer)
                       .template ReduceHeadroom<kDownHead>()
                       .template ReduceTailroom<kDownTail>();
    auto result = lower_rx_->Receive(std::move(lowered));
    if (!result) {
      return Reject(result.error().error,
                    Restore(std::move(result.error().buffer)));
    }
    return {};
  }

  /**
   * @brief 去掉帧头帧尾后向上交付
   * @note 帧短于头部加尾部时以 kFrameTooShort 交付空 payload
   */
  auto ReceivedBuffer(LowerBuffer buffer, size_t length,
                      Expected<void> result) -> void override {
    if (result && buffer.Length() < kHeaderLen + kTrailerLen) {
      klog::Warn("HeaderLayer: frame of %zu bytes shorter than framing\n",
                 length);
      result = std::unexpected(Error(ErrorCode::kFrameTooShort));
    }

    if (result) {
      auto stripped = buffer.Strip(kHeaderLen, kTrailerLen);
      pktbuf_assert_msg(stripped.has_value(), "strip framing failed: %s",
                        stripped.error().message());
    } else {
      auto cleared = buffer.CopyFrom({});
      pktbuf_assert(cleared.has_value());
    }

    pktbuf_assert_msg(rx_client_ != nullptr,
                      "HeaderLayer: received buffer without client");
    auto upper = Restore(std::move(buffer));
    const size_t payload_length = upper.Length();
    rx_client_->ReceivedBuffer(std::move(upper), payload_length, result);
  }

 private:
  /// 去掉本层写入的帧头帧尾并恢复上层保证
  auto Unframe(LowerBuffer buffer) -> UpperBuffer {
    auto stripped = buffer.Strip(kHeaderLen, kTrailerLen);
    pktbuf_assert_msg(stripped.has_value(),
                      "lower layer returned a buffer without our framing");
    return Restore(std::move(buffer));
  }

  /// 下层归还的必须是本层交出的缓冲区，恢复失败说明下层违约
  auto Restore(LowerBuffer buffer) -> UpperBuffer {
    auto upper =
        buffer.template TryRecover<PacketBufferBase, kUpHead, kUpTail>();
    pktbuf_assert_msg(upper.has_value(),
                      "buffer with headroom %zu tailroom %zu cannot carry "
                      "%zu/%zu",
                      buffer.Headroom(), buffer.Tailroom(), kUpHead, kUpTail);
    return std::move(*upper);
  }

  std::array<uint8_t, kHeaderLen> header_;
  std::array<uint8_t, kTrailerLen> trailer_;
  TransmitDriver<kDownHead, kDownTail>* lower_tx_{nullptr};
  ReceiveDriver<kDownHead, kDownTail>* lower_rx_{nullptr};
  TransmitClient<kUpHead, kUpTail>* tx_client_{nullptr};
  ReceiveClient<kUpHead, kUpTail>* rx_client_{nullptr};
};

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_HEADER_LAYER_HPP_
