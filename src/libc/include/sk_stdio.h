/**
 * @file sk_stdio.h
 * @brief 日志输出接口，由板级代码提供实现
 * @copyright Copyright The pktbuf Contributors
 */

#ifndef PKTBUF_SRC_LIBC_INCLUDE_SK_STDIO_H_
#define PKTBUF_SRC_LIBC_INCLUDE_SK_STDIO_H_

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief 格式化输出
 * @note pktbuf 自身不提供实现，链接时由板级代码（或单元测试桩）提供
 */
int sk_printf(const char* format, ...) __attribute__((format(printf, 1, 2)));

#ifdef __cplusplus
}
#endif

#endif /* PKTBUF_SRC_LIBC_INCLUDE_SK_STDIO_H_ */
