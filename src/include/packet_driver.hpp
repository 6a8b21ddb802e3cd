/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 分层驱动之间传递数据包缓冲区的接口
 */

#ifndef PKTBUF_SRC_INCLUDE_PACKET_DRIVER_HPP_
#define PKTBUF_SRC_INCLUDE_PACKET_DRIVER_HPP_

#include <cstddef>
#include <cstdint>
#include <expected>
#include <utility>

#include "expected.hpp"
#include "sized_packet.hpp"

namespace pktbuf {

/// 调用方为一次发送选择的标识，完成时原样返回
using TransmitToken = uint32_t;

/**
 * @brief 被拒绝的请求：错误码与原缓冲区一并归还
 */
template <size_t kHeadroomBytes, size_t kTailroomBytes>
struct Rejected {
  Error error;
  PacketBufferMut<kHeadroomBytes, kTailroomBytes> buffer;
};

/// 同步结果：被接受时缓冲区所有权已转移给下层，被拒绝时归还
template <size_t kHeadroomBytes, size_t kTailroomBytes>
using DriverResult =
    std::expected<void, Rejected<kHeadroomBytes, kTailroomBytes>>;

template <size_t kHeadroomBytes, size_t kTailroomBytes>
auto Reject(Error error, PacketBufferMut<kHeadroomBytes, kTailroomBytes> buffer)
    -> DriverResult<kHeadroomBytes, kTailroomBytes> {
  return std::unexpected(Rejected<kHeadroomBytes, kTailroomBytes>{
      error, std::move(buffer)});
}

/**
 * @brief 发送完成回调
 * @tparam kHeadroomBytes 本层交给下层时保证的 headroom
 * @tparam kTailroomBytes 本层交给下层时保证的 tailroom
 */
template <size_t kHeadroomBytes, size_t kTailroomBytes>
class TransmitClient {
 public:
  /**
   * @brief 下层完成一次发送，归还缓冲区
   * @param  buffer 发送时交出的缓冲区，声明的保证与发送时一致
   * @param  token 发送时传入的标识
   * @param  result 发送结果
   */
  virtual auto TransmitDone(
      PacketBufferMut<kHeadroomBytes, kTailroomBytes> buffer,
      TransmitToken token, Expected<void> result) -> void = 0;

  /// @name 构造/析构函数
  /// @{
  TransmitClient() = default;
  TransmitClient(const TransmitClient&) = delete;
  TransmitClient(TransmitClient&&) = delete;
  auto operator=(const TransmitClient&) -> TransmitClient& = delete;
  auto operator=(TransmitClient&&) -> TransmitClient& = delete;
  virtual ~TransmitClient() = default;
  /// @}
};

/**
 * @brief 发送方向的下层驱动
 *
 * 上层以 PacketBufferMut<kHeadroomBytes, kTailroomBytes> 交出缓冲区，
 * 下层可以在保证的空间内写入自己的头部与尾部。
 */
template <size_t kHeadroomBytes, size_t kTailroomBytes>
class TransmitDriver {
 public:
  virtual auto SetTransmitClient(
      TransmitClient<kHeadroomBytes, kTailroomBytes>* client) -> void = 0;

  /**
   * @brief 提交一次发送
   * @param  buffer 待发送的数据包
   * @param  token 完成时原样返回给 TransmitClient
   * @return DriverResult 被接受时稍后必定回调 TransmitDone；
   *         被拒绝时缓冲区随错误码一并归还
   */
  virtual auto Transmit(PacketBufferMut<kHeadroomBytes, kTailroomBytes> buffer,
                        TransmitToken token)
      -> DriverResult<kHeadroomBytes, kTailroomBytes> = 0;

  /// @name 构造/析构函数
  /// @{
  TransmitDriver() = default;
  TransmitDriver(const TransmitDriver&) = delete;
  TransmitDriver(TransmitDriver&&) = delete;
  auto operator=(const TransmitDriver&) -> TransmitDriver& = delete;
  auto operator=(TransmitDriver&&) -> TransmitDriver& = delete;
  virtual ~TransmitDriver() = default;
  /// @}
};

/**
 * @brief 接收回调
 */
template <size_t kHeadroomBytes, size_t kTailroomBytes>
class ReceiveClient {
 public:
  /**
   * @brief 下层填充了一个接收缓冲区
   * @param  buffer 接收时提供的缓冲区，payload 为收到的数据
   * @param  length 收到的字节数
   * @param  result 接收结果，失败时 payload 内容无意义
   */
  virtual auto ReceivedBuffer(
      PacketBufferMut<kHeadroomBytes, kTailroomBytes> buffer, size_t length,
      Expected<void> result) -> void = 0;

  /// @name 构造/析构函数
  /// @{
  ReceiveClient() = default;
  ReceiveClient(const ReceiveClient&) = delete;
  ReceiveClient(ReceiveClient&&) = delete;
  auto operator=(const ReceiveClient&) -> ReceiveClient& = delete;
  auto operator=(ReceiveClient&&) -> ReceiveClient& = delete;
  virtual ~ReceiveClient() = default;
  /// @}
};

/**
 * @brief 接收方向的下层驱动
 */
template <size_t kHeadroomBytes, size_t kTailroomBytes>
class ReceiveDriver {
 public:
  virtual auto SetReceiveClient(
      ReceiveClient<kHeadroomBytes, kTailroomBytes>* client) -> void = 0;

  /**
   * @brief 提供一个空缓冲区用于接收
   * @return DriverResult 被拒绝时缓冲区随错误码一并归还
   */
  virtual auto Receive(PacketBufferMut<kHeadroomBytes, kTailroomBytes> buffer)
      -> DriverResult<kHeadroomBytes, kTailroomBytes> = 0;

  /// @name 构造/析构函数
  /// @{
  ReceiveDriver() = default;
  ReceiveDriver(const ReceiveDriver&) = delete;
  ReceiveDriver(ReceiveDriver&&) = delete;
  auto operator=(const ReceiveDriver&) -> ReceiveDriver& = delete;
  auto operator=(ReceiveDriver&&) -> ReceiveDriver& = delete;
  virtual ~ReceiveDriver() = default;
  /// @}
};

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_PACKET_DRIVER_HPP_
