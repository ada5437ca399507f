#pragma once

// Compile time feature switches. CMake defines these when the matching
// library is found; building without CMake falls back to the defaults.

#ifndef TERF_HAS_ZSTD
#define TERF_HAS_ZSTD 0
#endif

#ifndef TERF_DEFAULT_PER_SHARD
#define TERF_DEFAULT_PER_SHARD 1024
#endif

#ifndef TERF_DEFAULT_SHARD_NAME
#define TERF_DEFAULT_SHARD_NAME "train"
#endif
