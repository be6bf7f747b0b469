// SPDX-License-Identifier: Apache-2.0
// Copyright 2018-2019 Peter A. Bigot

#include <ticcxx/board.hpp>

#ifndef TICCXX_ENABLE_CONSOLE_TRACE
#define TICCXX_ENABLE_CONSOLE_TRACE 0
#endif /* TICCXX_ENABLE_CONSOLE_TRACE */

#if (TICCXX_ENABLE_CONSOLE_TRACE - 0)
#include <ticcxx/console/cstdio.hpp>
#else
#include <ticcxx/console/null.hpp>
#endif

namespace ticcxx {
namespace board {

namespace {

counter_type counter{counter_stoppable};
alarm_type alarm{counter};
mux_type mux{alarm};

} // ns anonymous

int
initialize ()
{
  static bool initialized;
  if (initialized) {
    return -1;
  }
  auto rc = counter.start();
  if (RC_SUCCESS != rc) {
    crc("board counter start", rc);
    return rc;
  }
  counter.set_notifier([]() {
      alarm.service();
    });
  initialized = true;
  cprintf("* board faked: counter at %u Hz\n", counter_frequency::Frequency_Hz);
  return 0;
}

hil::counter<counter_frequency>&
system_counter ()
{
  return counter;
}

hil::alarm<counter_frequency>&
system_alarm ()
{
  return alarm;
}

mux_type&
alarm_mux ()
{
  return mux;
}

void
advance (hil::tic_type tics)
{
  counter.advance(tics);
}

} // ns board
} // ns ticcxx
