/**
 * @copyright Copyright The pktbuf Contributors
 */

#include "packet_chain.hpp"

#include <utility>

#include "buffer_config.hpp"
#include "kernel_log.hpp"

namespace pktbuf {

PacketChain::~PacketChain() {
  if (prev_ != nullptr) {
    prev_->next_ = nullptr;
    prev_->next_chain_ = nullptr;
  }
  if (next_chain_ != nullptr) {
    next_chain_->prev_ = nullptr;
  }
}

auto PacketChain::Link(PacketBufferBase& next) -> Expected<void> {
  if (next_ != nullptr) {
    return std::unexpected(Error(ErrorCode::kChainAlreadyLinked));
  }
  PacketChain* next_chain = AsChain(&next);
  if (next_chain != nullptr && next_chain->prev_ != nullptr) {
    klog::Warn("PacketChain: link target already belongs to a chain\n");
    return std::unexpected(Error(ErrorCode::kChainAlreadyLinked));
  }

  // 深度与别名都按整条链计算，本环可能是另一条链的后继
  PacketChain& head = Head();
  size_t depth = head.Depth();
  for (PacketBufferBase* link = &next; link != nullptr; link = link->Next()) {
    ++depth;
    if (depth > config::kMaxChainDepth) {
      klog::Warn("PacketChain: depth limit %zu exceeded\n",
                 config::kMaxChainDepth);
      return std::unexpected(Error(ErrorCode::kChainTooDeep));
    }
    if (head.Contains(*link)) {
      klog::Warn("PacketChain: link would alias a region already in chain\n");
      return std::unexpected(Error(ErrorCode::kChainCycle));
    }
  }

  next_ = &next;
  next_chain_ = next_chain;
  if (next_chain != nullptr) {
    next_chain->prev_ = this;
  }
  return {};
}

auto PacketChain::Unlink() -> PacketBufferBase* {
  if (next_chain_ != nullptr) {
    next_chain_->prev_ = nullptr;
    next_chain_ = nullptr;
  }
  return std::exchange(next_, nullptr);
}

auto PacketChain::Depth() const -> size_t {
  size_t depth = 1;
  for (const PacketBufferBase* link = next_; link != nullptr;
       link = link->Next()) {
    ++depth;
  }
  return depth;
}

auto PacketChain::AsChain(PacketBufferBase* link) -> PacketChain* {
  if (link == nullptr || link->GetTypeId() != TypeIdOf<PacketChain>()) {
    return nullptr;
  }
  return static_cast<PacketChain*>(link);
}

auto PacketChain::RegionOf(PacketBufferBase* link) -> PacketBufferBase* {
  PacketChain* chain = AsChain(link);
  return chain != nullptr ? &chain->segment_ : link;
}

auto PacketChain::Head() -> PacketChain& {
  PacketChain* head = this;
  while (head->prev_ != nullptr) {
    head = head->prev_;
  }
  return *head;
}

auto PacketChain::Contains(PacketBufferBase& link) -> bool {
  PacketBufferBase* region = RegionOf(&link);
  for (PacketBufferBase* node = this; node != nullptr; node = node->Next()) {
    if (node == &link || RegionOf(node) == region) {
      return true;
    }
  }
  return false;
}

auto PacketChain::Length() const -> size_t {
  return segment_.Length() + (next_ != nullptr ? next_->Length() : 0);
}

auto PacketChain::Headroom() const -> size_t { return segment_.Headroom(); }

auto PacketChain::Tailroom() const -> size_t { return Last().Tailroom(); }

auto PacketChain::Capacity() const -> size_t {
  return segment_.Capacity() + (next_ != nullptr ? next_->Capacity() : 0);
}

auto PacketChain::WritePayload(size_t offset, std::span<const uint8_t> data)
    -> Expected<void> {
  const size_t segment_length = segment_.Length();
  // 起点落在首段内时由首段检查，跨越段边界的写入在首段处失败
  if (offset < segment_length || next_ == nullptr) {
    return segment_.WritePayload(offset, data);
  }
  return next_->WritePayload(offset - segment_length, data);
}

auto PacketChain::Prepend(std::span<const uint8_t> header) -> Expected<void> {
  return segment_.Prepend(header);
}

auto PacketChain::Append(std::span<const uint8_t> trailer) -> Expected<void> {
  return Last().Append(trailer);
}

auto PacketChain::AppendMax(std::span<const uint8_t> data) -> size_t {
  return Last().AppendMax(data);
}

auto PacketChain::CopyFrom(std::span<const uint8_t> data) -> Expected<void> {
  auto result = segment_.CopyFrom(data);
  if (!result) {
    return result;
  }
  if (next_ != nullptr) {
    // 后续各段清空，空拷贝不会失败
    return next_->CopyFrom({});
  }
  return {};
}

auto PacketChain::ReclaimHeadroom(size_t new_headroom) -> Expected<void> {
  return segment_.ReclaimHeadroom(new_headroom);
}

auto PacketChain::ReclaimTailroom(size_t new_tailroom) -> Expected<void> {
  return Last().ReclaimTailroom(new_tailroom);
}

auto PacketChain::Reset(size_t new_headroom) -> Expected<void> {
  auto result = segment_.Reset(new_headroom);
  if (!result) {
    return result;
  }
  if (next_ != nullptr) {
    return next_->Reset(0);
  }
  return {};
}

auto PacketChain::DefaultHeadroom() const -> size_t {
  return segment_.DefaultHeadroom();
}

auto PacketChain::Payload() -> std::span<uint8_t> {
  return segment_.Payload();
}

auto PacketChain::Payload() const -> std::span<const uint8_t> {
  return std::as_const(segment_).Payload();
}

auto PacketChain::GetTypeId() const -> TypeId {
  return TypeIdOf<PacketChain>();
}

auto PacketChain::Last() -> PacketBufferBase& {
  return next_ != nullptr ? *next_ : segment_;
}

auto PacketChain::Last() const -> const PacketBufferBase& {
  return next_ != nullptr ? *next_ : segment_;
}

}  // namespace pktbuf
