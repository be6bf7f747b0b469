/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2018-2019 Peter A. Bigot */

/** Diagnostic console functions that discard all output.
 *
 * This has the same interface as <ticcxx/console/cstdio.hpp> and is
 * selected when #TICCXX_ENABLE_CONSOLE_TRACE is false.
 *
 * @file */

#ifndef TICCXX_CONSOLE_HPP
#define TICCXX_CONSOLE_HPP
#pragma once

/** @cond DOXYGEN_EXCLUDE */

namespace {

template <typename ...Args>
inline void cprintf (const char* format, Args... args)
{ }

inline void cputs (const char* text)
{ }

inline void crc (const char* what,
                 int rc)
{ }

inline bool cisstdio ()
{
  return false;
}

} // ns anonymous

/** @endcond */

#endif /* TICCXX_CONSOLE_HPP */
