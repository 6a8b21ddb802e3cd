/**
 * @copyright Copyright The pktbuf Contributors
 */

#include "packet_slice.hpp"

#include <utility>

#include "kernel_log.hpp"

namespace pktbuf {

namespace {

// 元数据所在地址由调用方提供，不保证对齐，只能逐字节组装
auto LoadWord(const uint8_t* src) -> size_t {
  size_t value = 0;
  for (size_t i = 0; i < PacketSlice::kWordSize; ++i) {
    value |= static_cast<size_t>(src[i]) << (i * 8);
  }
  return value;
}

auto StoreWord(uint8_t* dst, size_t value) -> void {
  for (size_t i = 0; i < PacketSlice::kWordSize; ++i) {
    dst[i] = static_cast<uint8_t>(value >> (i * 8));
  }
}

}  // namespace

auto PacketSlice::Create(std::span<uint8_t> memory, size_t headroom)
    -> Expected<PacketSlice> {
  if (memory.data() == nullptr || memory.size() < kMetadataSize) {
    klog::Warn("PacketSlice: %zu bytes cannot hold %zu bytes of metadata\n",
               memory.size(), kMetadataSize);
    return std::unexpected(Error(ErrorCode::kBufferSliceTooShort));
  }
  const size_t data_length = memory.size() - kMetadataSize;
  if (headroom > data_length) {
    klog::Warn("PacketSlice: headroom %zu exceeds data area %zu\n", headroom,
               data_length);
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }

  // 总长度字段写入后不再修改，IntoInner() 依赖它还原借用内存
  StoreWord(memory.data() + kLengthOffset, memory.size());
  StoreWord(memory.data() + kHeadroomOffset, headroom);
  StoreWord(memory.data() + kTailroomOffset, data_length - headroom);
  StoreWord(memory.data() + kDefaultHeadroomOffset, headroom);
  return PacketSlice(memory.data());
}

PacketSlice::PacketSlice(PacketSlice&& other) noexcept
    : PacketBufferImpl<PacketSlice>(),
      memory_(std::exchange(other.memory_, nullptr)) {}

auto PacketSlice::operator=(PacketSlice&& other) noexcept -> PacketSlice& {
  if (this != &other) {
    memory_ = std::exchange(other.memory_, nullptr);
  }
  return *this;
}

auto PacketSlice::DefaultHeadroom() const -> size_t {
  return LoadWord(memory_ + kDefaultHeadroomOffset);
}

auto PacketSlice::IntoInner() -> std::span<uint8_t> {
  const size_t length = TotalLength();
  return {std::exchange(memory_, nullptr), length};
}

auto PacketSlice::TotalLength() const -> size_t {
  return LoadWord(memory_ + kLengthOffset);
}

auto PacketSlice::Storage() -> std::span<uint8_t> {
  return {memory_ + kMetadataSize, TotalLength() - kMetadataSize};
}

auto PacketSlice::Storage() const -> std::span<const uint8_t> {
  return {memory_ + kMetadataSize, TotalLength() - kMetadataSize};
}

auto PacketSlice::LoadZones() const -> Zones {
  return {LoadWord(memory_ + kHeadroomOffset),
          LoadWord(memory_ + kTailroomOffset)};
}

auto PacketSlice::StoreZones(Zones zones) -> void {
  StoreWord(memory_ + kHeadroomOffset, zones.headroom);
  StoreWord(memory_ + kTailroomOffset, zones.tailroom);
}

auto PacketSpan::Create(std::span<uint8_t> memory, size_t headroom)
    -> Expected<PacketSpan> {
  if (headroom > memory.size()) {
    klog::Warn("PacketSpan: headroom %zu exceeds span %zu\n", headroom,
               memory.size());
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  return PacketSpan(memory, headroom);
}

PacketSpan::PacketSpan(PacketSpan&& other) noexcept
    : PacketBufferImpl<PacketSpan>(),
      memory_(std::exchange(other.memory_, {})),
      zones_(std::exchange(other.zones_, Zones{0, 0})),
      default_headroom_(std::exchange(other.default_headroom_, 0)) {}

auto PacketSpan::operator=(PacketSpan&& other) noexcept -> PacketSpan& {
  if (this != &other) {
    memory_ = std::exchange(other.memory_, {});
    zones_ = std::exchange(other.zones_, Zones{0, 0});
    default_headroom_ = std::exchange(other.default_headroom_, 0);
  }
  return *this;
}

}  // namespace pktbuf
