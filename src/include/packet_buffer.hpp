/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 数据包缓冲区能力接口
 */

#ifndef PKTBUF_SRC_INCLUDE_PACKET_BUFFER_HPP_
#define PKTBUF_SRC_INCLUDE_PACKET_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <span>

#include "expected.hpp"
#include "type_id.hpp"

namespace pktbuf {

/**
 * @brief 数据包缓冲区抽象基类
 * @details 一段线性存储被划分为三个区域：
 *          [headroom | payload | tailroom]
 *          headroom 与 tailroom 为预留的空闲空间，各层可以在不拷贝
 *          payload 的前提下向其中写入自己的头部与尾部。
 *          所有修改操作只移动区域边界，不改变容量；对单个区域始终满足
 *          Headroom() + Length() + Tailroom() == Capacity()。
 *
 *          所有操作都是同步、非阻塞的；容量不足以 Expected 返回，
 *          失败时区域保持不变。
 */
class PacketBufferBase {
 public:
  virtual ~PacketBufferBase() = default;

  /// payload 字节数（链式缓冲区为所有段之和）
  [[nodiscard]] virtual auto Length() const -> size_t = 0;

  /// 可用的 headroom 字节数
  [[nodiscard]] virtual auto Headroom() const -> size_t = 0;

  /// 可用的 tailroom 字节数
  [[nodiscard]] virtual auto Tailroom() const -> size_t = 0;

  /// 可写存储总量 = headroom + payload + tailroom
  [[nodiscard]] virtual auto Capacity() const -> size_t = 0;

  /**
   * @brief 覆写 payload 中的一段数据
   * @param  offset 相对 payload 起点的偏移
   * @param  data 待写入数据
   * @return Expected<void> offset + data.size() > Length() 时返回
   *         kBufferPayloadOverrun
   * @post 区域边界不变
   */
  virtual auto WritePayload(size_t offset, std::span<const uint8_t> data)
      -> Expected<void> = 0;

  /**
   * @brief 在 payload 之前写入头部，占用 headroom
   * @param  header 头部数据，写入后紧邻原 payload 起点
   * @return Expected<void> headroom 不足时返回
   *         kBufferInsufficientHeadroom，区域不变
   */
  virtual auto Prepend(std::span<const uint8_t> header) -> Expected<void> = 0;

  /**
   * @brief 在 payload 之后写入尾部，占用 tailroom
   * @return Expected<void> tailroom 不足时返回
   *         kBufferInsufficientTailroom，区域不变
   */
  virtual auto Append(std::span<const uint8_t> trailer) -> Expected<void> = 0;

  /**
   * @brief 尽可能多地追加数据
   * @return size_t 实际追加的字节数，不超过 Tailroom()
   */
  virtual auto AppendMax(std::span<const uint8_t> data) -> size_t = 0;

  /**
   * @brief 以 data 替换 payload，从当前 headroom 处开始写入
   * @return Expected<void> 存储末尾之前放不下时返回 kBufferPayloadOverrun
   */
  virtual auto CopyFrom(std::span<const uint8_t> data) -> Expected<void> = 0;

  /**
   * @brief 将 headroom 设置为 new_headroom，不写入数据
   * @details 小于当前值时 payload 向前扩展，大于当前值时从头部收缩
   * @return Expected<void> 越过 tailroom 边界时返回 kBufferZoneOverlap
   */
  virtual auto ReclaimHeadroom(size_t new_headroom) -> Expected<void> = 0;

  /// 与 ReclaimHeadroom 对称
  virtual auto ReclaimTailroom(size_t new_tailroom) -> Expected<void> = 0;

  /**
   * @brief 清空 payload，并以 new_headroom 重新划分区域
   * @return Expected<void> new_headroom > Capacity() 时返回
   *         kInvalidArgument
   * @post Length() == 0，Headroom() == new_headroom
   */
  virtual auto Reset(size_t new_headroom) -> Expected<void> = 0;

  /// 回收缓冲区时使用的默认 headroom
  [[nodiscard]] virtual auto DefaultHeadroom() const -> size_t = 0;

  /**
   * @brief 获取 payload 的原始视图，可交给 DMA 外设
   * @note 链式缓冲区只返回当前段，后续段通过 Next() 访问
   * @pre  调用方持有该缓冲区，并负责配对平台要求的内存屏障
   */
  [[nodiscard]] virtual auto Payload() -> std::span<uint8_t> = 0;
  [[nodiscard]] virtual auto Payload() const -> std::span<const uint8_t> = 0;

  /// 下一段，单一连续区域返回 nullptr
  [[nodiscard]] virtual auto Next() const -> PacketBufferBase* {
    return nullptr;
  }

  /// 具体实现类型的标识，用于类型恢复
  [[nodiscard]] virtual auto GetTypeId() const -> TypeId = 0;

  /**
   * @brief 恢复为默认布局并清空 payload
   * @note 当前边界或默认布局与容量不一致属于编程错误，将触发断言
   */
  auto Reset() -> void;
};

/// 单一区域的边界描述
struct Zones {
  size_t headroom;
  size_t tailroom;
};

namespace detail {

/// @name 单一连续区域的边界操作
/// 成功时更新 zones，失败时 storage 与 zones 均不变
/// @{
auto ZoneWritePayload(std::span<uint8_t> storage, const Zones& zones,
                      size_t offset, std::span<const uint8_t> data)
    -> Expected<void>;
auto ZonePrepend(std::span<uint8_t> storage, Zones& zones,
                 std::span<const uint8_t> header) -> Expected<void>;
auto ZoneAppend(std::span<uint8_t> storage, Zones& zones,
                std::span<const uint8_t> trailer) -> Expected<void>;
auto ZoneAppendMax(std::span<uint8_t> storage, Zones& zones,
                   std::span<const uint8_t> data) -> size_t;
auto ZoneCopyFrom(std::span<uint8_t> storage, Zones& zones,
                  std::span<const uint8_t> data) -> Expected<void>;
auto ZoneReclaimHeadroom(size_t capacity, Zones& zones, size_t new_headroom)
    -> Expected<void>;
auto ZoneReclaimTailroom(size_t capacity, Zones& zones, size_t new_tailroom)
    -> Expected<void>;
auto ZoneReset(size_t capacity, Zones& zones, size_t new_headroom)
    -> Expected<void>;
/// @}

}  // namespace detail

/**
 * @brief 单一连续区域的通用实现
 *
 * 派生类只需描述存储与边界元数据的位置，边界逻辑由本类统一提供。
 *
 * @tparam Derived 具体缓冲区类型，需提供：
 *   - Storage() / Storage() const：完整可写存储
 *   - LoadZones() const / StoreZones(Zones)：边界元数据读写
 */
template <class Derived>
class PacketBufferImpl : public PacketBufferBase {
 public:
  [[nodiscard]] auto Length() const -> size_t override {
    const auto zones = self().LoadZones();
    return self().Storage().size() - zones.headroom - zones.tailroom;
  }

  [[nodiscard]] auto Headroom() const -> size_t override {
    return self().LoadZones().headroom;
  }

  [[nodiscard]] auto Tailroom() const -> size_t override {
    return self().LoadZones().tailroom;
  }

  [[nodiscard]] auto Capacity() const -> size_t override {
    return self().Storage().size();
  }

  auto WritePayload(size_t offset, std::span<const uint8_t> data)
      -> Expected<void> override {
    return detail::ZoneWritePayload(self().Storage(), self().LoadZones(),
                                    offset, data);
  }

  auto Prepend(std::span<const uint8_t> header) -> Expected<void> override {
    auto zones = self().LoadZones();
    auto result = detail::ZonePrepend(self().Storage(), zones, header);
    if (result) {
      self().StoreZones(zones);
    }
    return result;
  }

  auto Append(std::span<const uint8_t> trailer) -> Expected<void> override {
    auto zones = self().LoadZones();
    auto result = detail::ZoneAppend(self().Storage(), zones, trailer);
    if (result) {
      self().StoreZones(zones);
    }
    return result;
  }

  auto AppendMax(std::span<const uint8_t> data) -> size_t override {
    auto zones = self().LoadZones();
    auto count = detail::ZoneAppendMax(self().Storage(), zones, data);
    self().StoreZones(zones);
    return count;
  }

  auto CopyFrom(std::span<const uint8_t> data) -> Expected<void> override {
    auto zones = self().LoadZones();
    auto result = detail::ZoneCopyFrom(self().Storage(), zones, data);
    if (result) {
      self().StoreZones(zones);
    }
    return result;
  }

  auto ReclaimHeadroom(size_t new_headroom) -> Expected<void> override {
    auto zones = self().LoadZones();
    auto result = detail::ZoneReclaimHeadroom(self().Storage().size(), zones,
                                              new_headroom);
    if (result) {
      self().StoreZones(zones);
    }
    return result;
  }

  auto ReclaimTailroom(size_t new_tailroom) -> Expected<void> override {
    auto zones = self().LoadZones();
    auto result = detail::ZoneReclaimTailroom(self().Storage().size(), zones,
                                              new_tailroom);
    if (result) {
      self().StoreZones(zones);
    }
    return result;
  }

  auto Reset(size_t new_headroom) -> Expected<void> override {
    auto zones = self().LoadZones();
    auto result =
        detail::ZoneReset(self().Storage().size(), zones, new_headroom);
    if (result) {
      self().StoreZones(zones);
    }
    return result;
  }

  using PacketBufferBase::Reset;

  [[nodiscard]] auto Payload() -> std::span<uint8_t> override {
    const auto zones = self().LoadZones();
    auto storage = self().Storage();
    return storage.subspan(
        zones.headroom, storage.size() - zones.headroom - zones.tailroom);
  }

  [[nodiscard]] auto Payload() const -> std::span<const uint8_t> override {
    const auto zones = self().LoadZones();
    auto storage = self().Storage();
    return storage.subspan(
        zones.headroom, storage.size() - zones.headroom - zones.tailroom);
  }

  [[nodiscard]] auto GetTypeId() const -> TypeId final {
    return TypeIdOf<Derived>();
  }

 protected:
  PacketBufferImpl() = default;
  ~PacketBufferImpl() override = default;

 private:
  auto self() -> Derived& { return static_cast<Derived&>(*this); }
  auto self() const -> const Derived& {
    return static_cast<const Derived&>(*this);
  }
};

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_PACKET_BUFFER_HPP_
