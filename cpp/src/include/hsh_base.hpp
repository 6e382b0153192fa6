#pragma once
/**
 * @file hsh_base.hpp
 * @brief Layer 1: Basic modules built on hsh_platform.
 *
 * Provides format_tools, debug_info and module_def for lifecycle module registration.
 * Include this when you need formatting or debug utilities.
 */
#include "hsh_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/module_def.hpp"
