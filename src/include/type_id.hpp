/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 不依赖 RTTI 的类型标识
 */

#ifndef PKTBUF_SRC_INCLUDE_TYPE_ID_HPP_
#define PKTBUF_SRC_INCLUDE_TYPE_ID_HPP_

#include <type_traits>

namespace pktbuf {

/// 类型标识，以每个类型独有的静态对象地址表示
using TypeId = const void*;

namespace detail {

template <typename T>
struct TypeIdTag {
  // inline 变量在所有翻译单元中只有一个实例，地址唯一
  static constexpr char kTag = 0;
};

}  // namespace detail

/**
 * @brief 获取类型 T 的标识
 * @tparam T 任意类型，cv 限定符被忽略
 * @return 同一类型总是返回同一值，不同类型返回不同值
 */
template <typename T>
[[nodiscard]] constexpr auto TypeIdOf() -> TypeId {
  return &detail::TypeIdTag<std::remove_cv_t<T>>::kTag;
}

}  // namespace pktbuf

#endif  // PKTBUF_SRC_INCLUDE_TYPE_ID_HPP_
