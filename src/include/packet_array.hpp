/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 自带存储的定长数据包缓冲区
 */

#ifndef PKTBUF_SRC_INCLUDE_PACKET_ARRAY_HPP_
#define PKTBUF_SRC_INCLUDE_PACKET_ARRAY_HPP_

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "packet_buffer.hpp"

namespace pktbuf {

/**
 * @brief 字节存储位于对象内部的缓冲区
 *
 * 布局在编译期已知，SizedPacket::Reset() 据此给出与实际一致的
 * headroom/tailroom 常量。通常作为静态对象在初始化阶段创建。
 *
 * @tparam kCapacity 存储字节数
 * @tparam kDefaultHeadroomBytes 初始及回收时的 headroom
 */
template <size_t kCapacity, size_t kDefaultHeadroomBytes = 0>
class PacketArray
    : public PacketBufferImpl<PacketArray<kCapacity, kDefaultHeadroomBytes>> {
  static_assert(kDefaultHeadroomBytes <= kCapacity,
                "default headroom exceeds capacity");

 public:
  static constexpr size_t kDefaultHeadroom = kDefaultHeadroomBytes;
  static constexpr size_t kDefaultTailroom = kCapacity - kDefaultHeadroomBytes;

  /// @name 构造/析构函数
  /// @{
  PacketArray() = default;
  PacketArray(const PacketArray&) = delete;
  PacketArray(PacketArray&&) = delete;
  auto operator=(const PacketArray&) -> PacketArray& = delete;
  auto operator=(PacketArray&&) -> PacketArray& = delete;
  ~PacketArray() override = default;
  /// @}

  [[nodiscard]] auto DefaultHeadroom() const -> size_t override {
    return kDefaultHeadroom;
  }

 private:
  friend class PacketBufferImpl<PacketArray>;

  [[nodiscard]] auto Storage() -> std::span<uint8_t> { return data_; }
  [[nodiscard]] auto Storage() const -> std::span<const uint8_t> {
    return data_;
  }
  [[nodiscard]] auto LoadZones() const -> Zones { return zones_; }
  auto StoreZones(Zones zones) -> void { zones_ = zones; }

  std::array<uint8_t, kCapacity> data_{};
  Zones zones_{kDefaultHeadroom, kDefaultTailroom};
};

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_PACKET_ARRAY_HPP_
