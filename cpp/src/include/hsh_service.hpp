#pragma once
/**
 * @file hsh_service.hpp
 * @brief Layer 2: Service modules built on hsh_base.
 *
 * Provides lifecycle management, logging, the retry engine, access configuration
 * and the process-wide file locking policy.
 * Include this when you need application lifecycle, Logger, retry(), AccessConfig
 * or LockingPolicy.
 */
#include "hsh_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/retry.hpp"
#include "utils/access_config.hpp"
#include "utils/locking_policy.hpp"
