#pragma once
/**
 * @file amod_base.hpp
 * @brief Layer 1: Basic modules built on amod_platform.
 *
 * Provides format_tools, debug_info (stack traces, AMOD_PANIC, AMOD_DEBUG) and the
 * foundational RAII guards: recursion_guard and scope_guard.
 * Include this when you need formatting, debug utilities, or basic RAII guards.
 */
#include "amod_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/recursion_guard.hpp"
#include "utils/scope_guard.hpp"
