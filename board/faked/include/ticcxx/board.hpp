/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Board-specific header for host-based unit tests and examples.
 *
 * The faked board has no timer hardware.  Its system counter is a
 * soft_counter at 32 KiHz that advances only when board::advance() is
 * invoked, which also services the system alarm as a timer interrupt
 * would.  All state is accessed from a single thread, so no mutex is
 * required.
 *
 * @file */

#ifndef TICCXX_BOARD_HPP
#define TICCXX_BOARD_HPP
#pragma once

#include <ticcxx/mux.hpp>
#include <ticcxx/soft.hpp>

namespace ticcxx {
namespace board {

/** Rate of the system counter. */
using counter_frequency = hil::freq32KHz;

/** Mutex protecting state shared with the timer servicing context. */
using mutex_type = null_mutex;

using counter_type = soft_counter<counter_frequency, mutex_type>;
using alarm_type = polled_alarm<counter_frequency, mutex_type>;
using mux_type = mux_alarm<counter_frequency, mutex_type>;

/** `true` iff the system counter can be stopped once started. */
constexpr bool counter_stoppable = true;

/** Perform board-specific initialization.
 *
 * This starts the system counter and connects its events to the
 * system alarm.
 *
 * @return zero on the first invocation, -1 if the board has already
 * been initialized, or the negative #return_code from starting the
 * counter. */
int initialize ();

/** The free-running system counter. */
hil::counter<counter_frequency>& system_counter ();

/** The alarm on the system counter.
 *
 * Its client slot is held by alarm_mux(); applications use
 * virtual_alarm instances on the mux rather than this alarm
 * directly. */
hil::alarm<counter_frequency>& system_alarm ();

/** The multiplexer sharing system_alarm(). */
mux_type& alarm_mux ();

/** Advance the system counter by @p tics and service the system
 * alarm.
 *
 * This stands in for the passage of time and the counter interrupt
 * on real hardware. */
void advance (hil::tic_type tics = 1);

} // namespace board
} // namespace ticcxx

#endif /* TICCXX_BOARD_HPP */
