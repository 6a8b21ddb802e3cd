/**
 * @copyright Copyright The pktbuf Contributors
 */

#include "sized_packet.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <type_traits>
#include <utility>

#include "packet_array.hpp"
#include "packet_chain.hpp"
#include "packet_slice.hpp"
#include "test_bytes.hpp"

using ::testing::ElementsAre;
using pktbuf::ErrorCode;
using pktbuf::PacketArray;
using pktbuf::PacketBufferMut;
using pktbuf::SizedPacket;
using test_env::Bytes;

namespace {

// 以下概念用于在编译期确认哪些转换可以通过编译
template <class P, size_t N>
concept CanReduceHeadroom =
    requires(P packet) { std::move(packet).template ReduceHeadroom<N>(); };

template <class P, size_t N>
concept CanReduceTailroom =
    requires(P packet) { std::move(packet).template ReduceTailroom<N>(); };

template <class P, size_t N>
concept CanPrepend = requires(P packet, const std::array<uint8_t, N>& bytes) {
  std::move(packet).template Prepend<N>(bytes);
};

template <class P, size_t N>
concept CanAppend = requires(P packet, const std::array<uint8_t, N>& bytes) {
  std::move(packet).template Append<N>(bytes);
};

template <class P>
concept CanReset = requires(P packet) { std::move(packet).Reset(); };

using Array64 = PacketArray<64, 32>;

// 保证只能降低
static_assert(CanReduceHeadroom<PacketBufferMut<8, 2>, 8>);
static_assert(CanReduceHeadroom<PacketBufferMut<8, 2>, 0>);
static_assert(!CanReduceHeadroom<PacketBufferMut<8, 2>, 9>);
static_assert(CanReduceTailroom<PacketBufferMut<8, 2>, 1>);
static_assert(!CanReduceTailroom<PacketBufferMut<8, 2>, 3>);

// 类型层面的写入不能超过声明的空间
static_assert(CanPrepend<PacketBufferMut<4, 0>, 4>);
static_assert(!CanPrepend<PacketBufferMut<4, 0>, 5>);
static_assert(CanAppend<PacketBufferMut<0, 2>, 2>);
static_assert(!CanAppend<PacketBufferMut<0, 2>, 3>);

// 只有布局在编译期已知的区域才能无条件回收
static_assert(CanReset<SizedPacket<Array64, 0, 0>>);
static_assert(!CanReset<PacketBufferMut<0, 0>>);
static_assert(!CanReset<SizedPacket<pktbuf::PacketSlice, 0, 0>>);

// 常量不影响布局
static_assert(sizeof(PacketBufferMut<8, 2>) == sizeof(void*));
static_assert(sizeof(SizedPacket<Array64, 32, 32>) == sizeof(void*));
static_assert(sizeof(PacketBufferMut<8, 2>) == sizeof(PacketBufferMut<0, 0>));

static_assert(!std::is_copy_constructible_v<PacketBufferMut<8, 2>>);
static_assert(std::is_nothrow_move_constructible_v<PacketBufferMut<8, 2>>);

}  // namespace

TEST(SizedPacketTest, CreateChecksActualRoom) {
  PacketArray<16, 4> buffer;

  EXPECT_TRUE((pktbuf::MakePacket<4, 12>(buffer).has_value()));

  auto too_much_head = pktbuf::MakePacket<5, 0>(buffer);
  ASSERT_FALSE(too_much_head.has_value());
  EXPECT_EQ(too_much_head.error().code,
            ErrorCode::kBufferInsufficientHeadroom);

  auto too_much_tail = pktbuf::MakePacket<0, 13>(buffer);
  ASSERT_FALSE(too_much_tail.has_value());
  EXPECT_EQ(too_much_tail.error().code,
            ErrorCode::kBufferInsufficientTailroom);
}

TEST(SizedPacketTest, ShrinkPrependAndResetScenario) {
  Array64 buffer;
  auto created = SizedPacket<Array64, 32, 32>::Create(buffer);
  ASSERT_TRUE(created.has_value());

  auto shrunk = std::move(*created).ReduceHeadroom<4>();
  static_assert(decltype(shrunk)::kHeadroom == 4);
  EXPECT_EQ(shrunk.Headroom(), 32U);

  const std::array<uint8_t, 4> header{0xAA, 0xBB, 0xCC, 0xDD};
  auto prepended = std::move(shrunk).Prepend(header);
  static_assert(decltype(prepended)::kHeadroom == 0);
  static_assert(decltype(prepended)::kTailroom == 32);
  EXPECT_FALSE(shrunk.IsValid());
  EXPECT_EQ(prepended.Headroom(), 28U);
  EXPECT_EQ(prepended.Length(), 4U);
  EXPECT_THAT(Bytes(prepended.Payload()), ElementsAre(0xAA, 0xBB, 0xCC, 0xDD));

  auto reset = std::move(prepended).Reset();
  static_assert(decltype(reset)::kHeadroom == 32);
  static_assert(decltype(reset)::kTailroom == 32);
  EXPECT_EQ(reset.Headroom(), 32U);
  EXPECT_EQ(reset.Tailroom(), 32U);
  EXPECT_EQ(reset.Length(), 0U);
  EXPECT_EQ(&reset.Get(), &buffer);
}

TEST(SizedPacketTest, PrependThenStripRoundTrip) {
  PacketArray<32, 16> buffer;
  auto packet = pktbuf::MakePacket<16, 8>(buffer);
  ASSERT_TRUE(packet.has_value());
  const std::array<uint8_t, 3> payload{1, 2, 3};
  ASSERT_TRUE(packet->CopyFrom(payload).has_value());

  const std::array<uint8_t, 2> header{0x10, 0x20};
  const std::array<uint8_t, 1> trailer{0x30};
  auto framed =
      std::move(*packet).ReduceHeadroom<2>().ReduceTailroom<1>().Prepend(
          header);
  auto full = std::move(framed).Append(trailer);
  EXPECT_THAT(Bytes(full.Payload()), ElementsAre(0x10, 0x20, 1, 2, 3, 0x30));

  ASSERT_TRUE(full.Strip(2, 1).has_value());
  auto restored = full.RestoreHeadroom<16>();
  ASSERT_TRUE(restored.has_value());
  auto original = std::move(*restored).RestoreTailroom<13>();
  ASSERT_TRUE(original.has_value());
  EXPECT_THAT(Bytes(original->Payload()), ElementsAre(1, 2, 3));
  EXPECT_EQ(original->Headroom(), 16U);
  EXPECT_EQ(original->Tailroom(), 13U);
}

TEST(SizedPacketTest, RuntimeWritesNeverUseDeclaredRoom) {
  PacketArray<16, 8> buffer;
  auto packet = pktbuf::MakePacket<6, 6>(buffer);
  ASSERT_TRUE(packet.has_value());

  const std::array<uint8_t, 2> two{1, 2};
  const std::array<uint8_t, 3> three{1, 2, 3};
  EXPECT_TRUE(packet->TryPrepend(two).has_value());
  auto head = packet->TryPrepend(two);
  ASSERT_FALSE(head.has_value());
  EXPECT_EQ(head.error().code, ErrorCode::kBufferInsufficientHeadroom);
  EXPECT_EQ(packet->Headroom(), 6U);

  EXPECT_TRUE(packet->TryAppend(two).has_value());
  auto tail = packet->TryAppend(two);
  ASSERT_FALSE(tail.has_value());
  EXPECT_EQ(tail.error().code, ErrorCode::kBufferInsufficientTailroom);
  EXPECT_EQ(packet->Tailroom(), 6U);

  // 当前 headroom 6，容量 16，保留 tailroom 6，最多容纳 4 字节
  auto copy = packet->CopyFrom(std::array<uint8_t, 5>{});
  ASSERT_FALSE(copy.has_value());
  EXPECT_EQ(copy.error().code, ErrorCode::kBufferInsufficientTailroom);
  EXPECT_EQ(packet->Length(), 4U);
  EXPECT_TRUE(packet->CopyFrom(three).has_value());
  EXPECT_EQ(packet->Tailroom(), 7U);
}

TEST(SizedPacketTest, StripRejectsMoreThanPayload) {
  PacketArray<8> buffer;
  auto packet = pktbuf::MakePacket<0, 0>(buffer);
  ASSERT_TRUE(packet.has_value());
  ASSERT_TRUE(packet->TryAppend(std::array<uint8_t, 3>{1, 2, 3}).has_value());

  auto result = packet->Strip(2, 2);
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kBufferPayloadOverrun);
  EXPECT_EQ(packet->Length(), 3U);

  ASSERT_TRUE(packet->Strip(1, 1).has_value());
  EXPECT_THAT(Bytes(packet->Payload()), ElementsAre(2));
}

TEST(SizedPacketTest, RestoreFailsWithoutConsumingHandle) {
  PacketArray<16, 4> buffer;
  auto packet = pktbuf::MakePacket<4, 4>(buffer);
  ASSERT_TRUE(packet.has_value());

  auto too_large = packet->RestoreHeadroom<5>();
  EXPECT_FALSE(too_large.has_value());
  EXPECT_TRUE(packet->IsValid());

  auto tail = packet->RestoreTailroom<12>();
  ASSERT_TRUE(tail.has_value());
  EXPECT_FALSE(packet->IsValid());
  static_assert(std::remove_cvref_t<decltype(*tail)>::kTailroom == 12);
}

TEST(SizedPacketTest, ReclaimSetsExactRoom) {
  PacketArray<16, 4> buffer;
  auto packet = pktbuf::MakePacket<4, 0>(buffer);
  ASSERT_TRUE(packet.has_value());
  ASSERT_TRUE(
      packet->TryAppend(std::array<uint8_t, 4>{1, 2, 3, 4}).has_value());

  auto head = packet->ReclaimHeadroom<6>();
  ASSERT_TRUE(head.has_value());
  EXPECT_EQ(head->Headroom(), 6U);
  EXPECT_THAT(Bytes(head->Payload()), ElementsAre(3, 4));

  // 越过 tailroom 边界时失败，原句柄不变
  auto crossing = head->ReclaimTailroom<11>();
  EXPECT_FALSE(crossing.has_value());
  ASSERT_TRUE(head->IsValid());

  auto tail = head->ReclaimTailroom<10>();
  ASSERT_TRUE(tail.has_value());
  EXPECT_EQ(tail->Length(), 0U);
}

TEST(SizedPacketTest, ResetToChecksCapacity) {
  PacketArray<16> buffer;
  auto packet = pktbuf::MakePacket<0, 0>(buffer);
  ASSERT_TRUE(packet.has_value());

  auto too_large = packet->ResetTo<10, 7>();
  EXPECT_FALSE(too_large.has_value());
  EXPECT_TRUE(packet->IsValid());

  auto reset = packet->ResetTo<10, 6>();
  ASSERT_TRUE(reset.has_value());
  EXPECT_EQ(reset->Headroom(), 10U);
  EXPECT_EQ(reset->Tailroom(), 6U);
}

TEST(SizedPacketTest, ResetToOnChainKeepsGuarantee) {
  PacketArray<16, 4> head;
  PacketArray<4> tail;
  pktbuf::PacketChain chain(head);
  ASSERT_TRUE(chain.Link(tail).has_value());
  auto packet = pktbuf::MakePacket<4, 4>(chain);
  ASSERT_TRUE(packet.has_value());
  ASSERT_TRUE(packet->CopyFrom(std::array<uint8_t, 2>{1, 2}).has_value());

  // 末段只有 4 字节，无法提供 tailroom 8
  auto reset = packet->ResetTo<2, 8>();
  EXPECT_FALSE(reset.has_value());
  ASSERT_TRUE(packet->IsValid());
  EXPECT_EQ(packet->Headroom(), 4U);
  EXPECT_EQ(packet->Tailroom(), 4U);
  EXPECT_THAT(Bytes(packet->Payload()), ElementsAre(1, 2));

  auto fits = std::move(*packet).ResetTo<2, 4>();
  ASSERT_TRUE(fits.has_value());
  EXPECT_EQ(fits->Headroom(), 2U);
  EXPECT_EQ(fits->Tailroom(), 4U);
  EXPECT_EQ(fits->Length(), 0U);
}

TEST(SizedPacketTest, ResetToBeyondFirstLinkLeavesChainUntouched) {
  PacketArray<16, 4> head;
  PacketArray<4> tail;
  pktbuf::PacketChain chain(head);
  ASSERT_TRUE(chain.Link(tail).has_value());
  auto packet = pktbuf::MakePacket<4, 4>(chain);
  ASSERT_TRUE(packet.has_value());
  ASSERT_TRUE(packet->CopyFrom(std::array<uint8_t, 3>{7, 8, 9}).has_value());

  // 总容量 20 放得下 18，但 headroom 只能由 16 字节的首段提供
  auto reset = packet->ResetTo<18, 0>();
  EXPECT_FALSE(reset.has_value());
  ASSERT_TRUE(packet->IsValid());
  EXPECT_EQ(packet->Headroom(), 4U);
  EXPECT_THAT(Bytes(packet->Payload()), ElementsAre(7, 8, 9));
}

TEST(SizedPacketTest, EmptyHandleReportsInvalid) {
  PacketBufferMut<0, 0> empty;
  EXPECT_FALSE(empty.IsValid());
  auto result = empty.WritePayload(0, std::array<uint8_t, 1>{1});
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kBufferInvalidHandle);
  EXPECT_FALSE((empty.ReclaimHeadroom<0>().has_value()));
  EXPECT_FALSE((empty.TryRecover<PacketArray<8>>().has_value()));
}

TEST(SizedPacketTest, MoveLeavesSourceEmpty) {
  PacketArray<8> buffer;
  auto packet = pktbuf::MakePacket<0, 4>(buffer);
  ASSERT_TRUE(packet.has_value());

  auto moved = std::move(*packet);
  EXPECT_FALSE(packet->IsValid());
  ASSERT_TRUE(moved.IsValid());
  EXPECT_EQ(moved.Release(), &buffer);
  EXPECT_FALSE(moved.IsValid());
}
