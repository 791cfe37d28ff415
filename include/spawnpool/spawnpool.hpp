#pragma once

/**
 * @file spawnpool.hpp
 * @brief Main header for spawnpool - reusable worker threads with idle reclamation
 *
 * Include this single header to access the full spawnpool API.
 */

#include "spawnpool/core/handoff.hpp"
#include "spawnpool/core/metrics.hpp"
#include "spawnpool/core/worker.hpp"
#include "spawnpool/core/pool_core.hpp"
#include "spawnpool/core/pool.hpp"

namespace spawnpool {

/**
 * @brief Library version information
 */
constexpr const char* VERSION = "0.1.0";
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

} // namespace spawnpool
