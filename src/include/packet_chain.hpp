/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 非连续（链式）数据包缓冲区
 */

#ifndef PKTBUF_SRC_INCLUDE_PACKET_CHAIN_HPP_
#define PKTBUF_SRC_INCLUDE_PACKET_CHAIN_HPP_

#include <cstddef>
#include <cstdint>
#include <span>

#include "expected.hpp"
#include "packet_buffer.hpp"

namespace pktbuf {

/**
 * @brief 由若干段组成的缓冲区
 *
 * 每个 PacketChain 包装一段区域，并可链接到下一段（任意实现了
 * PacketBufferBase 的区域，包括另一个 PacketChain）。
 * - 只有首段暴露 headroom，只有末段暴露 tailroom
 * - Length() / Capacity() 为各段之和
 * - 跨越段边界的写入直接失败，不会自动拆分
 * - 整条链（从真正的首段算起）的总段数不超过 config::kMaxChainDepth
 * - 同一块区域在链中只能出现一次
 * - 一个 PacketChain 只能作为一条链的后继
 *
 * @pre  被包装的区域与后继的生存期长于该链
 */
class PacketChain : public PacketBufferBase {
 public:
  /// @name 构造/析构函数
  /// @{
  explicit PacketChain(PacketBufferBase& segment) : segment_(segment) {}
  PacketChain(const PacketChain&) = delete;
  PacketChain(PacketChain&&) = delete;
  auto operator=(const PacketChain&) -> PacketChain& = delete;
  auto operator=(PacketChain&&) -> PacketChain& = delete;
  ~PacketChain() override;
  /// @}

  /**
   * @brief 链接后继段
   * @param  next 后继区域
   * @return Expected<void> 本链已有后继，或 next 已是其它链的后继时返回
   *         kChainAlreadyLinked；next 或其后继与本链共用区域时返回
   *         kChainCycle；整条链总段数超限时返回 kChainTooDeep
   */
  auto Link(PacketBufferBase& next) -> Expected<void>;

  /**
   * @brief 断开后继段
   * @return PacketBufferBase* 原后继，没有后继时为 nullptr
   */
  auto Unlink() -> PacketBufferBase*;

  /// 从本环起（含本环）到链尾的段数
  [[nodiscard]] auto Depth() const -> size_t;

  /// 首段区域
  [[nodiscard]] auto Segment() -> PacketBufferBase& { return segment_; }

  [[nodiscard]] auto Length() const -> size_t override;
  [[nodiscard]] auto Headroom() const -> size_t override;
  [[nodiscard]] auto Tailroom() const -> size_t override;
  [[nodiscard]] auto Capacity() const -> size_t override;
  auto WritePayload(size_t offset, std::span<const uint8_t> data)
      -> Expected<void> override;
  auto Prepend(std::span<const uint8_t> header) -> Expected<void> override;
  auto Append(std::span<const uint8_t> trailer) -> Expected<void> override;
  auto AppendMax(std::span<const uint8_t> data) -> size_t override;
  auto CopyFrom(std::span<const uint8_t> data) -> Expected<void> override;
  auto ReclaimHeadroom(size_t new_headroom) -> Expected<void> override;
  auto ReclaimTailroom(size_t new_tailroom) -> Expected<void> override;
  auto Reset(size_t new_headroom) -> Expected<void> override;
  using PacketBufferBase::Reset;
  [[nodiscard]] auto DefaultHeadroom() const -> size_t override;
  [[nodiscard]] auto Payload() -> std::span<uint8_t> override;
  [[nodiscard]] auto Payload() const -> std::span<const uint8_t> override;
  [[nodiscard]] auto Next() const -> PacketBufferBase* override {
    return next_;
  }
  [[nodiscard]] auto GetTypeId() const -> TypeId override;

 private:
  /// link 为 PacketChain 时返回它，否则返回 nullptr
  static auto AsChain(PacketBufferBase* link) -> PacketChain*;
  /// link 实际引用的区域
  static auto RegionOf(PacketBufferBase* link) -> PacketBufferBase*;

  /// 沿前驱找到整条链的首环
  [[nodiscard]] auto Head() -> PacketChain&;
  /// 从本环到链尾是否已引用 link 或 link 所引用的区域
  [[nodiscard]] auto Contains(PacketBufferBase& link) -> bool;

  /// 末段（暴露 tailroom 的区域）
  [[nodiscard]] auto Last() -> PacketBufferBase&;
  [[nodiscard]] auto Last() const -> const PacketBufferBase&;

  PacketBufferBase& segment_;
  PacketBufferBase* next_{nullptr};
  /// next_ 为 PacketChain 时与之相同，用于维护其 prev_
  PacketChain* next_chain_{nullptr};
  PacketChain* prev_{nullptr};
};

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_PACKET_CHAIN_HPP_
