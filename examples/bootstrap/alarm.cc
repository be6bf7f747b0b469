// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2015-2019 Peter A. Bigot

/** Demonstrate a one-shot alarm that re-arms itself.
 *
 * The alarm client schedules the next alarm a fixed distance from
 * the previous target, so the sequence of targets does not drift
 * even though the counter is advanced in uneven steps. */

#include <cstdio>

#include <ticcxx/board.hpp>

namespace {

using namespace ticcxx;
using freq_type = board::counter_frequency;

class blinker : public hil::alarm_client
{
public:
  blinker (hil::alarm<freq_type>& alarm,
           hil::tic_type interval) :
    alarm_{alarm},
    interval_{interval}
  { }

  void fired () override
  {
    ++count;
    printf("Fired %u at %u for %u\n", count,
           static_cast<unsigned int>(alarm_.now()),
           static_cast<unsigned int>(alarm_.get_alarm()));
    alarm_.set_alarm(alarm_.get_alarm() + interval_);
  }

  unsigned int count = 0;

private:
  hil::alarm<freq_type>& alarm_;
  hil::tic_type const interval_;
};

} // ns anonymous

int
main (void)
{
  setvbuf(stdout, NULL, _IONBF, 0);
  puts("\n\n" __FILE__ " " __DATE__ " " __TIME__);

  board::initialize();

  virtual_alarm<freq_type, board::mutex_type> alarm{board::alarm_mux()};
  blinker client{alarm, freq_type::Frequency_Hz / 10};
  alarm.set_client(client);
  alarm.set_alarm(alarm.now() + freq_type::Frequency_Hz / 10);

  unsigned int step = 1;
  while (10 > client.count) {
    board::advance(step);
    step = 1 + (step * 7) % 500;
  }
  int rc = alarm.disable();
  printf("Disable %d, enabled %d\n", rc, alarm.is_enabled());
  return 0;
}
