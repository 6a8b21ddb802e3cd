/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 带编译期 headroom/tailroom 保证的数据包句柄
 */

#ifndef PKTBUF_SRC_INCLUDE_SIZED_PACKET_HPP_
#define PKTBUF_SRC_INCLUDE_SIZED_PACKET_HPP_

#include <etl/optional.h>

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <type_traits>
#include <utility>

#include "expected.hpp"
#include "packet_assert.hpp"
#include "packet_buffer.hpp"
#include "type_id.hpp"

namespace pktbuf {

template <class Buffer, size_t kHeadroomBytes, size_t kTailroomBytes>
class SizedPacket;

/// 只知道能力接口、保留编译期保证的句柄
template <size_t kHeadroomBytes, size_t kTailroomBytes>
using PacketBufferMut =
    SizedPacket<PacketBufferBase, kHeadroomBytes, kTailroomBytes>;

/// 能力句柄：既不知道具体类型，也不携带任何空间保证
using PacketHandle = PacketBufferMut<0, 0>;

/// 布局在编译期已知的缓冲区类型（如 PacketArray）
template <class T>
concept StaticLayout = requires {
  { T::kDefaultHeadroom } -> std::convertible_to<size_t>;
  { T::kDefaultTailroom } -> std::convertible_to<size_t>;
};

/**
 * @brief 对缓冲区的独占引用，附带最小 headroom/tailroom 的编译期保证
 *
 * 不变式：所引用区域的实际 headroom >= kHeadroom，实际 tailroom >=
 * kTailroom。常量只允许低估，不允许高估。
 *
 * 常量只是类型标记，不影响对象布局（对象只含一个指针），
 * 因此在不同常量的句柄之间转换只是移动指针，不会重新解释内存。
 *
 * 句柄只能移动不能复制，传递句柄即转移所有权。
 * - 消耗自身、必定成功的操作以 && 限定，返回新类型的句柄
 * - 可能失败的操作返回 etl::optional，只在成功时取走所有权，
 *   失败时原句柄保持不变
 *
 * @tparam Buffer 被引用的区域类型，可以是具体类型或 PacketBufferBase
 * @tparam kHeadroomBytes 保证的最小 headroom
 * @tparam kTailroomBytes 保证的最小 tailroom
 */
template <class Buffer, size_t kHeadroomBytes, size_t kTailroomBytes>
class SizedPacket {
  static_assert(std::is_base_of_v<PacketBufferBase, Buffer>,
                "Buffer must implement PacketBufferBase");

 public:
  using BufferType = Buffer;
  static constexpr size_t kHeadroom = kHeadroomBytes;
  static constexpr size_t kTailroom = kTailroomBytes;

  /**
   * @brief 为区域创建句柄
   * @param  buffer 区域，调用方在此之后不得再直接访问它
   * @return Expected<SizedPacket> 实际 headroom 或 tailroom 小于声明值时
   *         返回 kBufferInsufficientHeadroom / kBufferInsufficientTailroom
   */
  static auto Create(Buffer& buffer) -> Expected<SizedPacket> {
    if (buffer.Headroom() < kHeadroom) {
      return std::unexpected(Error(ErrorCode::kBufferInsufficientHeadroom));
    }
    if (buffer.Tailroom() < kTailroom) {
      return std::unexpected(Error(ErrorCode::kBufferInsufficientTailroom));
    }
    return SizedPacket(&buffer);
  }

  /// @name 构造/析构函数
  /// @{
  SizedPacket() = default;
  SizedPacket(const SizedPacket&) = delete;
  SizedPacket(SizedPacket&& other) noexcept
      : buffer_(std::exchange(other.buffer_, nullptr)) {}
  auto operator=(const SizedPacket&) -> SizedPacket& = delete;
  auto operator=(SizedPacket&& other) noexcept -> SizedPacket& {
    if (this != &other) {
      buffer_ = std::exchange(other.buffer_, nullptr);
    }
    return *this;
  }
  ~SizedPacket() = default;
  /// @}

  /// 是否持有区域
  [[nodiscard]] auto IsValid() const -> bool { return buffer_ != nullptr; }

  /**
   * @brief 访问底层区域
   * @warning 绕过句柄直接移动区域边界可能破坏声明的保证，
   *          只用于提交 DMA 已写入的数据等场景
   * @pre IsValid()
   */
  [[nodiscard]] auto Get() -> Buffer& { return *buffer_; }
  [[nodiscard]] auto Get() const -> const Buffer& { return *buffer_; }

  /// @name 查询
  /// @pre IsValid()
  /// @{
  [[nodiscard]] auto Length() const -> size_t { return buffer_->Length(); }
  [[nodiscard]] auto Headroom() const -> size_t { return buffer_->Headroom(); }
  [[nodiscard]] auto Tailroom() const -> size_t { return buffer_->Tailroom(); }
  [[nodiscard]] auto Capacity() const -> size_t { return buffer_->Capacity(); }
  [[nodiscard]] auto Payload() -> std::span<uint8_t> {
    return buffer_->Payload();
  }
  [[nodiscard]] auto Payload() const -> std::span<const uint8_t> {
    return std::as_const(*buffer_).Payload();
  }
  /// @}

  /// 覆写 payload 中的数据，区域边界不变
  auto WritePayload(size_t offset, std::span<const uint8_t> data)
      -> Expected<void> {
    if (buffer_ == nullptr) {
      return std::unexpected(Error(ErrorCode::kBufferInvalidHandle));
    }
    return buffer_->WritePayload(offset, data);
  }

  /**
   * @brief 以 data 替换 payload
   * @return Expected<void> 写入后 tailroom 将低于 kTailroom 时返回
   *         kBufferInsufficientTailroom，区域不变
   */
  auto CopyFrom(std::span<const uint8_t> data) -> Expected<void> {
    if (buffer_ == nullptr) {
      return std::unexpected(Error(ErrorCode::kBufferInvalidHandle));
    }
    // 链式缓冲区只写首段，末段被清空，tailroom 不会减少
    if (buffer_->Next() == nullptr &&
        data.size() > buffer_->Capacity() - buffer_->Headroom() - kTailroom) {
      return std::unexpected(Error(ErrorCode::kBufferInsufficientTailroom));
    }
    return buffer_->CopyFrom(data);
  }

  /**
   * @brief 运行期前插，只使用超出 kHeadroom 的那部分 headroom
   * @return Expected<void> 空间不足时返回 kBufferInsufficientHeadroom
   */
  auto TryPrepend(std::span<const uint8_t> header) -> Expected<void> {
    if (buffer_ == nullptr) {
      return std::unexpected(Error(ErrorCode::kBufferInvalidHandle));
    }
    if (header.size() > buffer_->Headroom() - kHeadroom) {
      return std::unexpected(Error(ErrorCode::kBufferInsufficientHeadroom));
    }
    return buffer_->Prepend(header);
  }

  /// 运行期追加，只使用超出 kTailroom 的那部分 tailroom
  auto TryAppend(std::span<const uint8_t> trailer) -> Expected<void> {
    if (buffer_ == nullptr) {
      return std::unexpected(Error(ErrorCode::kBufferInvalidHandle));
    }
    if (trailer.size() > buffer_->Tailroom() - kTailroom) {
      return std::unexpected(Error(ErrorCode::kBufferInsufficientTailroom));
    }
    return buffer_->Append(trailer);
  }

  /**
   * @brief 从 payload 两端各去掉若干字节，归还给 headroom/tailroom
   * @return Expected<void> front + back > Length() 或越过段边界时失败，
   *         区域不变
   */
  auto Strip(size_t front, size_t back) -> Expected<void> {
    if (buffer_ == nullptr) {
      return std::unexpected(Error(ErrorCode::kBufferInvalidHandle));
    }
    if (front > buffer_->Length() || back > buffer_->Length() - front) {
      return std::unexpected(Error(ErrorCode::kBufferPayloadOverrun));
    }
    const size_t headroom = buffer_->Headroom();
    const size_t tailroom = buffer_->Tailroom();
    auto result = buffer_->ReclaimHeadroom(headroom + front);
    if (!result) {
      return result;
    }
    result = buffer_->ReclaimTailroom(tailroom + back);
    if (!result) {
      auto undo = buffer_->ReclaimHeadroom(headroom);
      pktbuf_assert(undo.has_value());
    }
    return result;
  }

  /**
   * @brief 降低声明的 headroom，运行期无开销
   * @tparam kNewHeadroom 新的保证值，大于当前值时无法通过编译
   */
  template <size_t kNewHeadroom>
    requires(kNewHeadroom <= kHeadroom)
  [[nodiscard]] auto ReduceHeadroom() &&
      -> SizedPacket<Buffer, kNewHeadroom, kTailroom> {
    return SizedPacket<Buffer, kNewHeadroom, kTailroom>(Release());
  }

  /// 与 ReduceHeadroom 对称
  template <size_t kNewTailroom>
    requires(kNewTailroom <= kTailroom)
  [[nodiscard]] auto ReduceTailroom() &&
      -> SizedPacket<Buffer, kHeadroom, kNewTailroom> {
    return SizedPacket<Buffer, kHeadroom, kNewTailroom>(Release());
  }

  /**
   * @brief 写入编译期定长的头部
   * @details 声明的 headroom 保证空间足够，写入不会失败；
   *          返回的句柄 headroom 保证减少 N
   */
  template <size_t N>
    requires(N <= kHeadroom)
  [[nodiscard]] auto Prepend(const std::array<uint8_t, N>& header) &&
      -> SizedPacket<Buffer, kHeadroom - N, kTailroom> {
    auto result = buffer_->Prepend(header);
    pktbuf_assert_msg(result.has_value(),
                      "headroom %zu below declared %zu", buffer_->Headroom(),
                      kHeadroom);
    return SizedPacket<Buffer, kHeadroom - N, kTailroom>(Release());
  }

  /// 与 Prepend 对称
  template <size_t N>
    requires(N <= kTailroom)
  [[nodiscard]] auto Append(const std::array<uint8_t, N>& trailer) &&
      -> SizedPacket<Buffer, kHeadroom, kTailroom - N> {
    auto result = buffer_->Append(trailer);
    pktbuf_assert_msg(result.has_value(),
                      "tailroom %zu below declared %zu", buffer_->Tailroom(),
                      kTailroom);
    return SizedPacket<Buffer, kHeadroom, kTailroom - N>(Release());
  }

  /**
   * @brief 在不丢弃数据的前提下提高声明的 headroom
   * @return 实际 headroom >= kNewHeadroom 时返回新句柄，否则 etl::nullopt
   *         且原句柄不变
   */
  template <size_t kNewHeadroom>
  [[nodiscard]] auto RestoreHeadroom()
      -> etl::optional<SizedPacket<Buffer, kNewHeadroom, kTailroom>> {
    return TryRecover<Buffer, kNewHeadroom, kTailroom>();
  }

  template <size_t kNewTailroom>
  [[nodiscard]] auto RestoreTailroom()
      -> etl::optional<SizedPacket<Buffer, kHeadroom, kNewTailroom>> {
    return TryRecover<Buffer, kHeadroom, kNewTailroom>();
  }

  /**
   * @brief 强制将 headroom 设为 kNewHeadroom，不写入数据
   * @return 越过 tailroom 边界时返回 etl::nullopt，原句柄不变
   */
  template <size_t kNewHeadroom>
  [[nodiscard]] auto ReclaimHeadroom()
      -> etl::optional<SizedPacket<Buffer, kNewHeadroom, kTailroom>> {
    if (buffer_ == nullptr || !buffer_->ReclaimHeadroom(kNewHeadroom)) {
      return etl::nullopt;
    }
    return SizedPacket<Buffer, kNewHeadroom, kTailroom>(Release());
  }

  template <size_t kNewTailroom>
  [[nodiscard]] auto ReclaimTailroom()
      -> etl::optional<SizedPacket<Buffer, kHeadroom, kNewTailroom>> {
    if (buffer_ == nullptr || !buffer_->ReclaimTailroom(kNewTailroom)) {
      return etl::nullopt;
    }
    return SizedPacket<Buffer, kHeadroom, kNewTailroom>(Release());
  }

  /**
   * @brief 回收缓冲区：清空 payload，恢复默认布局
   * @return 声明常量与区域实际布局一致的句柄
   * @pre IsValid()
   */
  template <class B = Buffer>
    requires StaticLayout<B>
  [[nodiscard]] auto Reset() &&
      -> SizedPacket<B, B::kDefaultHeadroom, B::kDefaultTailroom> {
    buffer_->Reset();
    return SizedPacket<B, B::kDefaultHeadroom, B::kDefaultTailroom>(Release());
  }

  /**
   * @brief 以指定的常量回收缓冲区
   * @return 区域放不下 kNewHeadroom + kNewTailroom 时返回 etl::nullopt，
   *         此时缓冲区不被修改；成功时 payload 被清空
   * @note 链式缓冲区的 headroom 由首段提供，tailroom 由末段提供
   */
  template <size_t kNewHeadroom, size_t kNewTailroom>
  [[nodiscard]] auto ResetTo()
      -> etl::optional<SizedPacket<Buffer, kNewHeadroom, kNewTailroom>> {
    if (buffer_ == nullptr) {
      return etl::nullopt;
    }
    PacketBufferBase* last = buffer_->Next();
    const size_t first_capacity =
        buffer_->Capacity() - (last != nullptr ? last->Capacity() : 0);
    if (kNewHeadroom > first_capacity) {
      return etl::nullopt;
    }
    size_t tailroom = first_capacity - kNewHeadroom;
    if (last != nullptr) {
      while (last->Next() != nullptr) {
        last = last->Next();
      }
      // 重置后后续各段 headroom 为 0，末段整段都是 tailroom
      tailroom = last->Capacity();
    }
    if (tailroom < kNewTailroom) {
      return etl::nullopt;
    }

    auto result = buffer_->Reset(kNewHeadroom);
    pktbuf_assert_msg(result.has_value(), "reset to checked headroom %zu: %s",
                      kNewHeadroom, result.error().message());
    return SizedPacket<Buffer, kNewHeadroom, kNewTailroom>(Release());
  }

  /// 擦除具体类型，保留编译期保证
  [[nodiscard]] auto Erase() && -> PacketBufferMut<kHeadroom, kTailroom> {
    return PacketBufferMut<kHeadroom, kTailroom>(
        static_cast<PacketBufferBase*>(Release()));
  }

  /// 擦除具体类型与编译期保证，得到能力句柄
  [[nodiscard]] auto IntoHandle() && -> PacketHandle {
    return PacketHandle(static_cast<PacketBufferBase*>(Release()));
  }

  /**
   * @brief 恢复具体类型与编译期保证
   * @tparam U 期望的具体类型；为 PacketBufferBase 时不检查类型
   * @tparam kNewHeadroom 重新附加的 headroom 保证
   * @tparam kNewTailroom 重新附加的 tailroom 保证
   * @return 区域的类型标识与 U 一致且实际空间满足新保证时返回指向
   *         同一区域的句柄；否则返回 etl::nullopt，原句柄不变
   */
  template <class U, size_t kNewHeadroom = kHeadroom,
            size_t kNewTailroom = kTailroom>
    requires std::derived_from<U, PacketBufferBase>
  [[nodiscard]] auto TryRecover()
      -> etl::optional<SizedPacket<U, kNewHeadroom, kNewTailroom>> {
    if (buffer_ == nullptr) {
      return etl::nullopt;
    }
    if constexpr (!std::is_same_v<U, PacketBufferBase>) {
      if (buffer_->GetTypeId() != TypeIdOf<U>()) {
        return etl::nullopt;
      }
    }
    if (buffer_->Headroom() < kNewHeadroom ||
        buffer_->Tailroom() < kNewTailroom) {
      return etl::nullopt;
    }
    auto* base = static_cast<PacketBufferBase*>(Release());
    return SizedPacket<U, kNewHeadroom, kNewTailroom>(static_cast<U*>(base));
  }

  /**
   * @brief 放弃句柄，交还底层区域
   * @post IsValid() == false
   */
  [[nodiscard]] auto Release() -> Buffer* {
    return std::exchange(buffer_, nullptr);
  }

 private:
  template <class, size_t, size_t>
  friend class SizedPacket;

  explicit SizedPacket(Buffer* buffer) : buffer_(buffer) {}

  Buffer* buffer_{nullptr};
};

static_assert(sizeof(PacketHandle) == sizeof(PacketBufferBase*),
              "compile-time guarantees must not affect handle layout");

/**
 * @brief 为具体区域创建带保证的句柄
 * @see SizedPacket::Create
 */
template <size_t kHeadroomBytes, size_t kTailroomBytes, class Buffer>
auto MakePacket(Buffer& buffer)
    -> Expected<SizedPacket<Buffer, kHeadroomBytes, kTailroomBytes>> {
  return SizedPacket<Buffer, kHeadroomBytes, kTailroomBytes>::Create(buffer);
}

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_SIZED_PACKET_HPP_
