/**
 * @copyright Copyright The pktbuf Contributors
 */

#include "packet_buffer.hpp"

#include <algorithm>
#include <cstring>

#include "packet_assert.hpp"

namespace pktbuf {

auto PacketBufferBase::Reset() -> void {
  pktbuf_assert_msg(
      Headroom() <= Capacity() && Tailroom() <= Capacity() - Headroom(),
      "zones %zu + %zu exceed capacity %zu", Headroom(), Tailroom(),
      Capacity());
  auto result = Reset(DefaultHeadroom());
  pktbuf_assert_msg(result.has_value(),
                    "default headroom %zu exceeds capacity %zu",
                    DefaultHeadroom(), Capacity());
}

namespace detail {

auto ZoneWritePayload(std::span<uint8_t> storage, const Zones& zones,
                      size_t offset, std::span<const uint8_t> data)
    -> Expected<void> {
  const size_t length = storage.size() - zones.headroom - zones.tailroom;
  if (offset > length || data.size() > length - offset) {
    return std::unexpected(Error(ErrorCode::kBufferPayloadOverrun));
  }
  if (!data.empty()) {
    std::memcpy(storage.data() + zones.headroom + offset, data.data(),
                data.size());
  }
  return {};
}

auto ZonePrepend(std::span<uint8_t> storage, Zones& zones,
                 std::span<const uint8_t> header) -> Expected<void> {
  if (header.size() > zones.headroom) {
    return std::unexpected(Error(ErrorCode::kBufferInsufficientHeadroom));
  }
  zones.headroom -= header.size();
  if (!header.empty()) {
    std::memcpy(storage.data() + zones.headroom, header.data(),
                header.size());
  }
  return {};
}

auto ZoneAppend(std::span<uint8_t> storage, Zones& zones,
                std::span<const uint8_t> trailer) -> Expected<void> {
  if (trailer.size() > zones.tailroom) {
    return std::unexpected(Error(ErrorCode::kBufferInsufficientTailroom));
  }
  const size_t offset = storage.size() - zones.tailroom;
  if (!trailer.empty()) {
    std::memcpy(storage.data() + offset, trailer.data(), trailer.size());
  }
  zones.tailroom -= trailer.size();
  return {};
}

auto ZoneAppendMax(std::span<uint8_t> storage, Zones& zones,
                   std::span<const uint8_t> data) -> size_t {
  const size_t count = std::min(zones.tailroom, data.size());
  const size_t offset = storage.size() - zones.tailroom;
  if (count > 0) {
    std::memcpy(storage.data() + offset, data.data(), count);
  }
  zones.tailroom -= count;
  return count;
}

auto ZoneCopyFrom(std::span<uint8_t> storage, Zones& zones,
                  std::span<const uint8_t> data) -> Expected<void> {
  const size_t available = storage.size() - zones.headroom;
  if (data.size() > available) {
    return std::unexpected(Error(ErrorCode::kBufferPayloadOverrun));
  }
  if (!data.empty()) {
    std::memcpy(storage.data() + zones.headroom, data.data(), data.size());
  }
  zones.tailroom = available - data.size();
  return {};
}

auto ZoneReclaimHeadroom(size_t capacity, Zones& zones, size_t new_headroom)
    -> Expected<void> {
  if (new_headroom > capacity - zones.tailroom) {
    return std::unexpected(Error(ErrorCode::kBufferZoneOverlap));
  }
  zones.headroom = new_headroom;
  return {};
}

auto ZoneReclaimTailroom(size_t capacity, Zones& zones, size_t new_tailroom)
    -> Expected<void> {
  if (new_tailroom > capacity - zones.headroom) {
    return std::unexpected(Error(ErrorCode::kBufferZoneOverlap));
  }
  zones.tailroom = new_tailroom;
  return {};
}

auto ZoneReset(size_t capacity, Zones& zones, size_t new_headroom)
    -> Expected<void> {
  if (new_headroom > capacity) {
    return std::unexpected(Error(ErrorCode::kInvalidArgument));
  }
  zones.headroom = new_headroom;
  zones.tailroom = capacity - new_headroom;
  return {};
}

}  // namespace detail

}  // namespace pktbuf
