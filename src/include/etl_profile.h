/**
 * @copyright Copyright The pktbuf Contributors
 * @brief ETL configuration for the pktbuf freestanding environment.
 */

#ifndef PKTBUF_SRC_INCLUDE_ETL_PROFILE_H_
#define PKTBUF_SRC_INCLUDE_ETL_PROFILE_H_

// Use generic C++23 profile as base
#define ETL_CPP23_SUPPORTED 1

#define ETL_NO_CHECKS 0

// No exceptions in kernel
#define ETL_NO_EXCEPTIONS 1

#endif  // PKTBUF_SRC_INCLUDE_ETL_PROFILE_H_
