// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2015-2019 Peter A. Bigot

/** Demonstrate the system counter.
 *
 * Shows the counter frequency, conversion of tic counts to standard
 * durations, and wraparound-safe comparison across the point where
 * the counter rolls over. */

#include <chrono>
#include <cstdio>

#include <ticcxx/board.hpp>

int
main (void)
{
  using namespace ticcxx;
  using freq_type = board::counter_frequency;

  setvbuf(stdout, NULL, _IONBF, 0);
  puts("\n\n" __FILE__ " " __DATE__ " " __TIME__);

  auto& ctr = board::system_counter();
  printf("Counter %u Hz, running %d\n", freq_type::Frequency_Hz, ctr.is_running());
  int rc = board::initialize();
  printf("Initialize %d, running %d\n", rc, ctr.is_running());

  auto t0 = ctr.now();
  board::advance(freq_type::Frequency_Hz / 4);
  auto dt = hil::tic_delta(t0, ctr.now());
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(freq_type::duration_type{dt});
  printf("Advanced %u tics = %u ms\n", static_cast<unsigned int>(dt),
         static_cast<unsigned int>(ms.count()));

  rc = ctr.stop();
  printf("Stop %d (%s)\n", rc, return_code_text(rc));
  board::advance(100);
  printf("Stopped at %u\n", static_cast<unsigned int>(ctr.now()));
  rc = ctr.start();
  printf("Start %d (%s)\n", rc, return_code_text(rc));

  const hil::tic_type before = 0xFFFFFFF0;
  const hil::tic_type after = 0x10;
  printf("%08x to %08x: delta %u, reached %d, remaining %u\n",
         static_cast<unsigned int>(before), static_cast<unsigned int>(after),
         static_cast<unsigned int>(hil::tic_delta(before, after)),
         hil::tic_reached(before, after),
         static_cast<unsigned int>(hil::tic_remaining(before, after)));
  return 0;
}
