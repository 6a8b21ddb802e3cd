/**
 * @file config.h
 * @brief 配置文件
 * @copyright Copyright The pktbuf Contributors
 */

#ifndef PKTBUF_SRC_INCLUDE_CONFIG_H_
#define PKTBUF_SRC_INCLUDE_CONFIG_H_

// 由 CMake 根据 project_config.h.in 生成
#include "project_config.h"

#endif /* PKTBUF_SRC_INCLUDE_CONFIG_H_ */
