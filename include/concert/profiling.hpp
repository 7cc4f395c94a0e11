#pragma once

// User can specify a "profiling include" to specify how profiling needs to be done
#ifdef CONCERT_PROFILING_INCLUDE
#include CONCERT_PROFILING_INCLUDE
#endif

#if TRACY_ENABLE

#include "Tracy.hpp"

#include <cstdio>
#include <cstring>

#define CONCERT_ENABLE_PROFILING 1

#define CONCERT_PROFILING_INIT() static_cast<void>(tracy::GetProfiler())
#define CONCERT_PROFILING_FUNCTION() ZoneScopedN(__FUNCTION__)
#define CONCERT_PROFILING_SCOPE_N(staticName) ZoneScopedN(staticName)
#define CONCERT_PROFILING_SCOPE_C(color) ZoneScopedC(color)
#define CONCERT_PROFILING_SCOPE_NC(staticName, color) ZoneScopedNC(staticName, color)
#define CONCERT_PROFILING_SET_TEXT_FMT(max_len, fmt, args...)                                      \
    char __IMPL_CONCERT_CONCAT(__concert_profiling_buf, __LINE__)[max_len];                        \
    snprintf(__IMPL_CONCERT_CONCAT(__concert_profiling_buf, __LINE__), max_len, fmt, args);        \
    ZoneText(__IMPL_CONCERT_CONCAT(__concert_profiling_buf, __LINE__),                             \
            strlen(__IMPL_CONCERT_CONCAT(__concert_profiling_buf, __LINE__)))
#define CONCERT_PROFILING_MESSAGE(text) TracyMessage(text, strlen(text))
#define CONCERT_PROFILING_PLOT(staticName, val) TracyPlot(staticName, val)

#define __IMPL_CONCERT_CONCAT2(x, y) x##y
#define __IMPL_CONCERT_CONCAT(x, y) __IMPL_CONCERT_CONCAT2(x, y)

#define CONCERT_PROFILING_COLOR_SILVER 0xC0C0C0
#define CONCERT_PROFILING_COLOR_RED 0xFF0000
#define CONCERT_PROFILING_COLOR_LIME 0x00FF00

#define CONCERT_PROFILING_SETTHREADNAME(staticName) tracy::SetThreadName(staticName)

#endif

#if !CONCERT_ENABLE_PROFILING

#define CONCERT_PROFILING_INIT()                              /*nothing*/
#define CONCERT_PROFILING_FUNCTION()                          /*nothing*/
#define CONCERT_PROFILING_SCOPE_N(staticName)                 /*nothing*/
#define CONCERT_PROFILING_SCOPE_C(color)                      /*nothing*/
#define CONCERT_PROFILING_SCOPE_NC(staticName, color)         /*nothing*/
#define CONCERT_PROFILING_SET_TEXT_FMT(max_len, fmt, args...) /*nothing*/
#define CONCERT_PROFILING_MESSAGE(text)                       /*nothing*/
#define CONCERT_PROFILING_PLOT(staticName, val)               /*nothing*/

#define CONCERT_PROFILING_COLOR_SILVER /*nothing*/
#define CONCERT_PROFILING_COLOR_RED    /*nothing*/
#define CONCERT_PROFILING_COLOR_LIME   /*nothing*/

#define CONCERT_PROFILING_SETTHREADNAME(staticName) /*nothing*/

#endif
