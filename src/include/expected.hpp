/**
 * @copyright Copyright The pktbuf Contributors
 */

#ifndef PKTBUF_SRC_INCLUDE_EXPECTED_HPP_
#define PKTBUF_SRC_INCLUDE_EXPECTED_HPP_

#include <cstdint>
#include <expected>

namespace pktbuf {

/// 缓冲区层错误码
enum class ErrorCode : uint64_t {
  kSuccess = 0,
  // 缓冲区容量相关错误 (0x100 - 0x1FF)
  kBufferInsufficientHeadroom = 0x100,
  kBufferInsufficientTailroom = 0x101,
  kBufferPayloadOverrun = 0x102,
  kBufferZoneOverlap = 0x103,
  kBufferSliceTooShort = 0x104,
  kBufferInvalidHandle = 0x105,
  kFrameTooShort = 0x106,
  // 链式缓冲区相关错误 (0x200 - 0x2FF)
  kChainAlreadyLinked = 0x200,
  kChainTooDeep = 0x201,
  kChainCycle = 0x202,
  // 驱动相关错误 (0x300 - 0x3FF)
  kDriverBusy = 0x300,
  kDriverOff = 0x301,
  kDriverSendFailed = 0x302,
  kDriverTooManyDevices = 0x303,
  // DMA 相关错误 (0x400 - 0x4FF)
  kDmaTooManySegments = 0x400,
  // 通用错误 (0xF00 - 0xFFF)
  kInvalidArgument = 0xF00,
};

/// 获取错误码对应的错误信息
constexpr auto GetErrorMessage(ErrorCode code) -> const char* {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kBufferInsufficientHeadroom:
      return "Insufficient headroom";
    case ErrorCode::kBufferInsufficientTailroom:
      return "Insufficient tailroom";
    case ErrorCode::kBufferPayloadOverrun:
      return "Write exceeds payload";
    case ErrorCode::kBufferZoneOverlap:
      return "Zone boundary would cross the opposite boundary";
    case ErrorCode::kBufferSliceTooShort:
      return "Slice too short for packet metadata";
    case ErrorCode::kBufferInvalidHandle:
      return "Empty packet handle";
    case ErrorCode::kFrameTooShort:
      return "Frame shorter than its framing";
    case ErrorCode::kChainAlreadyLinked:
      return "Chain link already has a successor";
    case ErrorCode::kChainTooDeep:
      return "Chain depth limit exceeded";
    case ErrorCode::kChainCycle:
      return "Chain link would form a cycle";
    case ErrorCode::kDriverBusy:
      return "Driver busy";
    case ErrorCode::kDriverOff:
      return "Driver disabled";
    case ErrorCode::kDriverSendFailed:
      return "Transmission failed";
    case ErrorCode::kDriverTooManyDevices:
      return "Too many devices on multiplexer";
    case ErrorCode::kDmaTooManySegments:
      return "Too many DMA segments";
    case ErrorCode::kInvalidArgument:
      return "Invalid argument";
    default:
      return "Unknown error";
  }
}

/// 错误类型，用于 std::expected
struct Error {
  ErrorCode code;

  constexpr Error(ErrorCode c) : code(c) {}

  [[nodiscard]] constexpr auto message() const -> const char* {
    return GetErrorMessage(code);
  }
};

/// std::expected 别名模板
template <typename T>
using Expected = std::expected<T, Error>;

}  // namespace pktbuf

#endif /* PKTBUF_SRC_INCLUDE_EXPECTED_HPP_ */
