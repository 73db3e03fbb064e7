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

#include <arbor/core/assert.h>

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

extern char const *__progname; // NOLINT(bugprone-reserved-identifier)

namespace
{
    void print_location(
        char const *expr, char const *function, char const *file, long line)
    {
        if (expr != nullptr) {
            fprintf(
                stderr,
                "%s: %s:%ld: %s: Assertion '%s' failed.\n",
                __progname,
                file,
                line,
                function,
                expr);
        }
        else {
            fprintf(
                stderr,
                "%s: %s:%ld: %s: Aborted.\n",
                __progname,
                file,
                line,
                function);
        }
    }
}

extern "C" void arbor_assertion_failed(
    char const *expr, char const *function, char const *file, long line,
    char const *msg)
{
    print_location(expr, function, file, line);
    if (msg != nullptr) {
        fprintf(stderr, "%s\n", msg);
    }
    fflush(stderr);
    abort();
}

extern "C" void arbor_assertion_failed_printf(
    char const *expr, char const *function, char const *file, long line,
    char const *format, ...)
{
    print_location(expr, function, file, line);
    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);
    fputc('\n', stderr);
    fflush(stderr);
    abort();
}
