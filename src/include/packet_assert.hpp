/**
 * @copyright Copyright The pktbuf Contributors
 * @brief 不可恢复错误的运行时断言
 */

#ifndef PKTBUF_SRC_INCLUDE_PACKET_ASSERT_HPP_
#define PKTBUF_SRC_INCLUDE_PACKET_ASSERT_HPP_

#include "kernel_log.hpp"

/**
 * @brief 运行时断言宏
 * @param expr 断言表达式
 * @note 断言失败时打印错误信息并终止当前执行流，只用于协议违例等
 *       无法继续运行的情况，容量不足等错误通过 Expected 返回
 */
#define pktbuf_assert(expr)                                                   \
  do {                                                                        \
    if (!(expr)) {                                                            \
      klog::Err("\n[ASSERT FAILED] %s:%d in %s\n Expression: %s\n", __FILE__, \
                __LINE__, __PRETTY_FUNCTION__, #expr);                        \
      __builtin_trap();                                                       \
    }                                                                         \
  } while (0)

/**
 * @brief 带自定义消息的运行时断言宏（支持变长参数）
 * @param expr 断言表达式
 * @param fmt 格式化字符串
 * @param ... 格式化参数
 */
#define pktbuf_assert_msg(expr, fmt, ...)                                  \
  do {                                                                     \
    if (!(expr)) {                                                         \
      klog::Err(                                                           \
          "\n[ASSERT FAILED] %s:%d in %s\n Expression: %s\n Message: " fmt \
          "\n",                                                            \
          __FILE__, __LINE__, __PRETTY_FUNCTION__, #expr, ##__VA_ARGS__);  \
      __builtin_trap();                                                    \
    }                                                                      \
  } while (0)

#endif /* PKTBUF_SRC_INCLUDE_PACKET_ASSERT_HPP_ */
