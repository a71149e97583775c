#pragma once

#include <cstdio>
#include <format>
#include <print>

// Diagnostic tracing of schema derivation and reconstruction.
// 0 = off, 1 = top-level phases, 2 = per node, 3 = per token
#ifndef DYNARGS_DEBUG_LEVEL
    #define DYNARGS_DEBUG_LEVEL 0
#endif

#define DYNARGS_DEBUG_L1(fmt, ...) do { if constexpr (DYNARGS_DEBUG_LEVEL >= 1) std::println(stderr, "[DYNARGS_DBG: L1]: {}", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while(0)
#define DYNARGS_DEBUG_L2(fmt, ...) do { if constexpr (DYNARGS_DEBUG_LEVEL >= 2) std::println(stderr, "[DYNARGS_DBG: L2]: {}", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while(0)
#define DYNARGS_DEBUG_L3(fmt, ...) do { if constexpr (DYNARGS_DEBUG_LEVEL >= 3) std::println(stderr, "[DYNARGS_DBG: L3]: {}", std::format(fmt __VA_OPT__(,) __VA_ARGS__)); } while(0)
