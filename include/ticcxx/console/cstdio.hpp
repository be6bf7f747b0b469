/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2018-2019 Peter A. Bigot */

/** Diagnostic console output using cstdio.
 *
 * Implementation files include this header, or the interface
 * compatible <ticcxx/console/null.hpp>, depending on whether trace
 * output is desired:
 *
 *     #if (TICCXX_ENABLE_CONSOLE_TRACE - 0)
 *     #include <ticcxx/console/cstdio.hpp>
 *     #else
 *     #include <ticcxx/console/null.hpp>
 *     #endif
 *
 * By convention trace text begins with `*` for information, `**` for
 * unexpected but handled situations, and `***` for failures.
 *
 * @file */

#ifndef TICCXX_CONSOLE_HPP
#define TICCXX_CONSOLE_HPP
#pragma once

#include <cstdio>

#include <ticcxx/core.hpp>

namespace {

/** Formatted printf. */
template <typename ...Args>
inline void cprintf (const char* format, Args... args)
{
  printf(format, args...);
}

/** Pure text output with added newline. */
inline void cputs (const char* text)
{
  puts(text);
}

/** Report a non-success status code from operation @p what.
 *
 * Nothing is emitted when @p rc is not negative. */
inline void crc (const char* what,
                 int rc)
{
  if (0 > rc) {
    printf("*** %s: %s (%d)\n", what, ticcxx::return_code_text(rc), rc);
  }
}

/** Indicate whether console selection is cstdio or null */
inline bool cisstdio ()
{
  return true;
}

} // ns anonymous

#endif /* TICCXX_CONSOLE_HPP */
