// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2015-2019 Peter A. Bigot

/** Demonstrate repeating and one-shot timers.
 *
 * A 100 ms repeating timer counts periods.  A one-shot timer started
 * after the third period cancels the repeating timer when it
 * fires. */

#include <cstdio>

#include <ticcxx/board.hpp>
#include <ticcxx/timer.hpp>

namespace {

using namespace ticcxx;
using freq_type = board::counter_frequency;
using timer_type = alarm_timer<freq_type, board::mutex_type>;
using virtual_type = virtual_alarm<freq_type, board::mutex_type>;

constexpr hil::tic_type ms_to_tics (unsigned int ms)
{
  return (ms * static_cast<uint64_t>(freq_type::Frequency_Hz)) / 1000U;
}

class periodic : public hil::timer_client
{
public:
  periodic (timer_type& timer,
            timer_type& stopper) :
    timer_{timer},
    stopper_{stopper}
  { }

  void fired () override
  {
    ++count;
    printf("Period %u at %u, next %u, overruns %u\n", count,
           static_cast<unsigned int>(timer_.now()),
           static_cast<unsigned int>(timer_.deadline()),
           timer_.overruns());
    if (3 == count) {
      stopper_.oneshot(ms_to_tics(250));
    }
  }

  unsigned int count = 0;

private:
  timer_type& timer_;
  timer_type& stopper_;
};

class stopping : public hil::timer_client
{
public:
  explicit stopping (timer_type& victim) :
    victim_{victim}
  { }

  void fired () override
  {
    int rc = victim_.cancel();
    printf("Stop at %u: %s\n", static_cast<unsigned int>(victim_.now()),
           return_code_text(rc));
    done = true;
  }

  bool done = false;

private:
  timer_type& victim_;
};

} // ns anonymous

int
main (void)
{
  setvbuf(stdout, NULL, _IONBF, 0);
  puts("\n\n" __FILE__ " " __DATE__ " " __TIME__);

  board::initialize();

  virtual_type va{board::alarm_mux()};
  virtual_type vb{board::alarm_mux()};
  timer_type ticker{va};
  timer_type stopper{vb};
  periodic pc{ticker, stopper};
  stopping sc{ticker};

  ticker.set_client(pc);
  stopper.set_client(sc);
  ticker.repeat(ms_to_tics(100));
  printf("Repeat %u tics from %u\n", static_cast<unsigned int>(ticker.interval()),
         static_cast<unsigned int>(ticker.now()));

  while (!sc.done) {
    board::advance(37);
  }
  printf("Ticker enabled %d, remaining %u, %u periods\n",
         ticker.is_enabled(),
         static_cast<unsigned int>(ticker.time_remaining()),
         pc.count);
  return 0;
}
