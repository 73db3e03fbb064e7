// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#pragma once

#include <arbor/core/likely.h>

#ifdef __cplusplus
extern "C"
{
#endif

[[noreturn]] void arbor_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg);

[[noreturn]] void arbor_assertion_failed_printf(
    char const *expr, char const *function, char const *file, long line,
    char const *format, ...) __attribute__((format(printf, 5, 6)));

#ifdef __cplusplus
}
#endif

#define ARBOR_ASSERT(expr)                                                     \
    if (ARBOR_LIKELY(expr)) {                                                  \
    }                                                                          \
    else {                                                                     \
        arbor_assertion_failed(                                                \
            #expr, __PRETTY_FUNCTION__, __FILE__, __LINE__, nullptr);          \
    }

#define ARBOR_ASSERT_PRINTF(expr, format, ...)                                 \
    if (ARBOR_LIKELY(expr)) {                                                  \
    }                                                                          \
    else {                                                                     \
        arbor_assertion_failed_printf(                                         \
            #expr,                                                             \
            __PRETTY_FUNCTION__,                                               \
            __FILE__,                                                          \
            __LINE__,                                                          \
            format,                                                            \
            __VA_ARGS__);                                                      \
    }

#define ARBOR_ABORT(msg)                                                       \
    arbor_assertion_failed(                                                    \
        nullptr, __PRETTY_FUNCTION__, __FILE__, __LINE__, msg);

#ifdef NDEBUG
    #define ARBOR_DEBUG_ASSERT(x)                                              \
        do {                                                                   \
            (void)sizeof(x);                                                   \
        }                                                                      \
        while (0)
#else
    #define ARBOR_DEBUG_ASSERT(x) ARBOR_ASSERT(x)
#endif
