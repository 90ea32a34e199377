#pragma once

#include <chrono>
#include <cstdint>

#define DUPFIND_EXPORT __attribute__((visibility("default")))

namespace dupfind {

// 10MiB
constexpr auto default_min_size = 10UL * 1024UL * 1024UL;
// 50MiB, lower bound of a suggested threshold
constexpr auto raise_floor = 50UL * 1024UL * 1024UL;
constexpr auto default_budget_min = 60U;

// 4KiB leading block for the xxhash pre-filter
constexpr auto prefix_blk_sz = 4096UL;
// 1MiB
constexpr auto buf_sz = 1024UL * 1024UL;

constexpr auto hash_seed = 0x178ee47c0190226cUL;

// directory entries pulled per advance() while scanning
constexpr auto scan_batch = 512UL;
// how long advance() waits for hashing workers before reporting back
constexpr auto poll_interval = std::chrono::milliseconds(200);
// no eta before this much elapsed time in a phase
constexpr auto min_eta_sample = std::chrono::seconds(2);

}  // namespace dupfind
