#pragma once

#include <cstddef>

#include "constants.hpp"

namespace seqpart {

/**
 * S3 client settings used by the command line tool.
 */
inline constexpr size_t kS3MaxConnections = 64;
inline constexpr size_t kS3RequestTimeoutMs = 30'000;
inline constexpr size_t kS3ConnectTimeoutMs = 5'000;

/**
 * The S3 client runs asynchronous requests on a pooled executor with this many threads per available core.
 */
inline constexpr size_t kIoThreadPoolToCpuRatio = 4;

/**
 * Scan and fetch jobs are I/O bound, so the local executor oversubscribes the available cores by this factor.
 */
inline constexpr size_t kLocalExecutorThreadsPerCpu = 2;

}  // namespace seqpart
