/**
 * @copyright Copyright The pktbuf Contributors
 */

#include "packet_slice.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <span>
#include <utility>

#include "test_bytes.hpp"

using ::testing::ElementsAre;
using pktbuf::ErrorCode;
using pktbuf::PacketSlice;
using pktbuf::PacketSpan;
using test_env::Bytes;

namespace {

constexpr size_t kMeta = PacketSlice::kMetadataSize;

auto ReadWord(const uint8_t* src) -> size_t {
  size_t value = 0;
  for (size_t i = 0; i < PacketSlice::kWordSize; ++i) {
    value |= static_cast<size_t>(src[i]) << (i * 8);
  }
  return value;
}

auto WriteWord(uint8_t* dst, size_t value) -> void {
  for (size_t i = 0; i < PacketSlice::kWordSize; ++i) {
    dst[i] = static_cast<uint8_t>(value >> (i * 8));
  }
}

}  // namespace

TEST(PacketSliceTest, CreateWritesMetadataAtFrontOfMemory) {
  std::array<uint8_t, kMeta + 32> memory{};
  auto slice = PacketSlice::Create(memory, 8);
  ASSERT_TRUE(slice.has_value());

  EXPECT_EQ(slice->Capacity(), 32U);
  EXPECT_EQ(slice->Headroom(), 8U);
  EXPECT_EQ(slice->Tailroom(), 24U);
  EXPECT_EQ(slice->Length(), 0U);
  EXPECT_EQ(slice->DefaultHeadroom(), 8U);

  EXPECT_EQ(ReadWord(memory.data() + PacketSlice::kLengthOffset),
            memory.size());
  EXPECT_EQ(ReadWord(memory.data() + PacketSlice::kHeadroomOffset), 8U);
  EXPECT_EQ(ReadWord(memory.data() + PacketSlice::kTailroomOffset), 24U);
  EXPECT_EQ(ReadWord(memory.data() + PacketSlice::kDefaultHeadroomOffset),
            8U);
}

TEST(PacketSliceTest, ObjectHoldsOnlyTheMemoryAddress) {
  EXPECT_EQ(sizeof(PacketSlice), sizeof(void*) + sizeof(void*));
}

TEST(PacketSliceTest, RejectsMemoryTooShortForMetadata) {
  std::array<uint8_t, kMeta - 1> memory{};
  auto slice = PacketSlice::Create(memory, 0);
  ASSERT_FALSE(slice.has_value());
  EXPECT_EQ(slice.error().code, ErrorCode::kBufferSliceTooShort);
}

TEST(PacketSliceTest, RejectsHeadroomLargerThanDataArea) {
  std::array<uint8_t, kMeta + 4> memory{};
  auto slice = PacketSlice::Create(memory, 5);
  ASSERT_FALSE(slice.has_value());
  EXPECT_EQ(slice.error().code, ErrorCode::kInvalidArgument);
}

TEST(PacketSliceTest, MetadataOnUnalignedMemory) {
  alignas(16) std::array<uint8_t, kMeta + 24 + 1> backing{};
  // 故意从奇数地址开始
  std::span<uint8_t> memory(backing.data() + 1, backing.size() - 1);
  auto slice = PacketSlice::Create(memory, 4);
  ASSERT_TRUE(slice.has_value());

  const std::array<uint8_t, 2> header{0xDE, 0xAD};
  const std::array<uint8_t, 3> trailer{0xBE, 0xEF, 0x01};
  ASSERT_TRUE(slice->Prepend(header).has_value());
  ASSERT_TRUE(slice->Append(trailer).has_value());

  EXPECT_THAT(Bytes(slice->Payload()),
              ElementsAre(0xDE, 0xAD, 0xBE, 0xEF, 0x01));
  EXPECT_EQ(slice->Headroom(), 2U);
  EXPECT_EQ(slice->Tailroom(), 17U);
  EXPECT_EQ(ReadWord(memory.data() + PacketSlice::kHeadroomOffset), 2U);
  EXPECT_EQ(ReadWord(memory.data() + PacketSlice::kTailroomOffset), 17U);
  // 数据区紧跟元数据
  EXPECT_EQ(slice->Payload().data(), memory.data() + kMeta + 2);
}

TEST(PacketSliceTest, MoveTransfersOwnership) {
  std::array<uint8_t, kMeta + 8> memory{};
  auto created = PacketSlice::Create(memory, 2);
  ASSERT_TRUE(created.has_value());

  PacketSlice slice = std::move(*created);
  EXPECT_FALSE(created->IsValid());
  ASSERT_TRUE(slice.IsValid());
  EXPECT_EQ(slice.Headroom(), 2U);
}

TEST(PacketSliceTest, IntoInnerReturnsOriginalMemory) {
  std::array<uint8_t, kMeta + 8> memory{};
  auto slice = PacketSlice::Create(memory, 0);
  ASSERT_TRUE(slice.has_value());
  const std::array<uint8_t, 1> data{0x42};
  ASSERT_TRUE(slice->Append(data).has_value());

  auto inner = slice->IntoInner();
  EXPECT_FALSE(slice->IsValid());
  EXPECT_EQ(inner.data(), memory.data());
  EXPECT_EQ(inner.size(), memory.size());
  EXPECT_EQ(inner[kMeta], 0x42);
}

TEST(PacketSliceTest, ResetUsesRecordedDefaultHeadroom) {
  std::array<uint8_t, kMeta + 16> memory{};
  auto slice = PacketSlice::Create(memory, 6);
  ASSERT_TRUE(slice.has_value());
  ASSERT_TRUE(slice->Reset(0).has_value());
  EXPECT_EQ(slice->Headroom(), 0U);

  slice->Reset();
  EXPECT_EQ(slice->Headroom(), 6U);
  EXPECT_EQ(slice->Tailroom(), 10U);
}

TEST(PacketSliceTest, ResetWithDefaultBeyondCapacityIsFatal) {
  std::array<uint8_t, kMeta + 8> memory{};
  auto slice = PacketSlice::Create(memory, 2);
  ASSERT_TRUE(slice.has_value());
  WriteWord(memory.data() + PacketSlice::kDefaultHeadroomOffset, 9);

  EXPECT_DEATH(slice->Reset(), "ASSERT FAILED");
}

TEST(PacketSliceTest, ResetWithOverlappingZonesIsFatal) {
  std::array<uint8_t, kMeta + 8> memory{};
  auto slice = PacketSlice::Create(memory, 2);
  ASSERT_TRUE(slice.has_value());
  // headroom + tailroom = 4 + 6 > 8
  WriteWord(memory.data() + PacketSlice::kHeadroomOffset, 4);

  EXPECT_DEATH(slice->Reset(), "exceed capacity");
}

TEST(PacketSliceTest, FailedOperationsLeaveMetadataUnchanged) {
  std::array<uint8_t, kMeta + 4> memory{};
  auto slice = PacketSlice::Create(memory, 1);
  ASSERT_TRUE(slice.has_value());

  const std::array<uint8_t, 2> header{1, 2};
  auto result = slice->Prepend(header);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kBufferInsufficientHeadroom);
  EXPECT_EQ(ReadWord(memory.data() + PacketSlice::kHeadroomOffset), 1U);
  EXPECT_EQ(ReadWord(memory.data() + PacketSlice::kTailroomOffset), 3U);
}

TEST(PacketSpanTest, KeepsMetadataOutsideBorrowedMemory) {
  std::array<uint8_t, 16> memory{};
  auto span = PacketSpan::Create(memory, 4);
  ASSERT_TRUE(span.has_value());

  EXPECT_EQ(span->Capacity(), 16U);
  EXPECT_EQ(span->Headroom(), 4U);
  EXPECT_EQ(span->Tailroom(), 12U);

  const std::array<uint8_t, 2> header{0xCA, 0xFE};
  ASSERT_TRUE(span->Prepend(header).has_value());
  EXPECT_EQ(memory[2], 0xCA);
  EXPECT_EQ(memory[3], 0xFE);
  EXPECT_EQ(span->Payload().data(), memory.data() + 2);
}

TEST(PacketSpanTest, RejectsHeadroomLargerThanMemory) {
  std::array<uint8_t, 4> memory{};
  auto span = PacketSpan::Create(memory, 5);
  ASSERT_FALSE(span.has_value());
  EXPECT_EQ(span.error().code, ErrorCode::kInvalidArgument);
}

TEST(PacketSpanTest, SliceAndSpanAreDifferentTypes) {
  std::array<uint8_t, kMeta + 4> slice_memory{};
  std::array<uint8_t, 4> span_memory{};
  auto slice = PacketSlice::Create(slice_memory, 0);
  auto span = PacketSpan::Create(span_memory, 0);
  ASSERT_TRUE(slice.has_value());
  ASSERT_TRUE(span.has_value());
  EXPECT_NE(slice->GetTypeId(), span->GetTypeId());
}
