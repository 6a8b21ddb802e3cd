/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 借用外部内存的数据包缓冲区
 */

#ifndef PKTBUF_SRC_INCLUDE_PACKET_SLICE_HPP_
#define PKTBUF_SRC_INCLUDE_PACKET_SLICE_HPP_

#include <cstddef>
#include <cstdint>
#include <span>

#include "expected.hpp"
#include "packet_buffer.hpp"

namespace pktbuf {

/**
 * @brief 元数据内嵌于借用内存头部的缓冲区
 *
 * 借用的内存布局：
 * | 总长度 | headroom | tailroom | 默认 headroom | 数据区 ... |
 * 每个字段占一个机器字，按小端逐字节读写，不要求内存对齐。
 * 对象本身只保存内存起始地址，一段借用内存对应唯一一个 PacketSlice，
 * 不需要额外的簿记结构。
 *
 * @pre  借用内存的生存期长于该对象及所有指向它的句柄
 */
class PacketSlice : public PacketBufferImpl<PacketSlice> {
 public:
  /// 元数据字段宽度
  static constexpr size_t kWordSize = sizeof(size_t);
  static constexpr size_t kLengthOffset = 0;
  static constexpr size_t kHeadroomOffset = kWordSize;
  static constexpr size_t kTailroomOffset = 2 * kWordSize;
  static constexpr size_t kDefaultHeadroomOffset = 3 * kWordSize;
  /// 元数据总长度，数据区从此处开始
  static constexpr size_t kMetadataSize = 4 * kWordSize;

  /**
   * @brief 在借用内存上建立缓冲区
   * @param  memory 借用内存，起始地址可以不对齐
   * @param  headroom 初始（也是默认）headroom
   * @return Expected<PacketSlice> memory 不足以容纳元数据时返回
   *         kBufferSliceTooShort；headroom 超过数据区时返回 kInvalidArgument
   * @post payload 为空，tailroom 占据剩余数据区
   */
  static auto Create(std::span<uint8_t> memory, size_t headroom)
      -> Expected<PacketSlice>;

  /// @name 构造/析构函数
  /// @{
  PacketSlice() = default;
  PacketSlice(const PacketSlice&) = delete;
  PacketSlice(PacketSlice&& other) noexcept;
  auto operator=(const PacketSlice&) -> PacketSlice& = delete;
  auto operator=(PacketSlice&& other) noexcept -> PacketSlice&;
  ~PacketSlice() override = default;
  /// @}

  [[nodiscard]] auto DefaultHeadroom() const -> size_t override;

  /**
   * @brief 放弃缓冲区，取回最初借用的完整内存
   * @return std::span<uint8_t> 与 Create() 传入的内存相同，元数据区仍在其中
   * @post IsValid() == false
   */
  [[nodiscard]] auto IntoInner() -> std::span<uint8_t>;

  [[nodiscard]] auto IsValid() const -> bool { return memory_ != nullptr; }

 private:
  friend class PacketBufferImpl<PacketSlice>;

  explicit PacketSlice(uint8_t* memory) : memory_(memory) {}

  [[nodiscard]] auto TotalLength() const -> size_t;
  [[nodiscard]] auto Storage() -> std::span<uint8_t>;
  [[nodiscard]] auto Storage() const -> std::span<const uint8_t>;
  [[nodiscard]] auto LoadZones() const -> Zones;
  auto StoreZones(Zones zones) -> void;

  /// 借用内存起始地址，元数据位于其前 kMetadataSize 字节
  uint8_t* memory_{nullptr};
};

/**
 * @brief 元数据保存在对象内、整段借用内存均为数据区的缓冲区
 * @pre  借用内存的生存期长于该对象及所有指向它的句柄
 */
class PacketSpan : public PacketBufferImpl<PacketSpan> {
 public:
  /**
   * @brief 在借用内存上建立缓冲区
   * @return Expected<PacketSpan> headroom 超过内存长度时返回
   *         kInvalidArgument
   */
  static auto Create(std::span<uint8_t> memory, size_t headroom)
      -> Expected<PacketSpan>;

  /// @name 构造/析构函数
  /// @{
  PacketSpan() = default;
  PacketSpan(const PacketSpan&) = delete;
  PacketSpan(PacketSpan&& other) noexcept;
  auto operator=(const PacketSpan&) -> PacketSpan& = delete;
  auto operator=(PacketSpan&& other) noexcept -> PacketSpan&;
  ~PacketSpan() override = default;
  /// @}

  [[nodiscard]] auto DefaultHeadroom() const -> size_t override {
    return default_headroom_;
  }

 private:
  friend class PacketBufferImpl<PacketSpan>;

  PacketSpan(std::span<uint8_t> memory, size_t headroom)
      : memory_(memory),
        zones_{headroom, memory.size() - headroom},
        default_headroom_(headroom) {}

  [[nodiscard]] auto Storage() -> std::span<uint8_t> { return memory_; }
  [[nodiscard]] auto Storage() const -> std::span<const uint8_t> {
    return memory_;
  }
  [[nodiscard]] auto LoadZones() const -> Zones { return zones_; }
  auto StoreZones(Zones zones) -> void { zones_ = zones; }

  std::span<uint8_t> memory_;
  Zones zones_{0, 0};
  size_t default_headroom_{0};
};

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_PACKET_SLICE_HPP_
