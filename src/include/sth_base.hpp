#pragma once
/**
 * @file sth_base.hpp
 * @brief Layer 1: Basic modules built on sth_platform.
 *
 * Provides format_tools, debug_info and the foundational RAII/result helpers: ScopeGuard and
 * Result<T, E>. Include this when you need formatting, debug output, or scope-exit cleanup.
 */
#include "sth_platform.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/result.hpp"
