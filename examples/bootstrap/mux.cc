// SPDX-License-Identifier: CC-BY-SA-4.0
// Copyright 2015-2019 Peter A. Bigot

/** Demonstrate several alarms sharing the system alarm.
 *
 * Alarms are set out of order and across the point where the counter
 * wraps.  They are notified in target order. */

#include <cstdio>

#include <ticcxx/board.hpp>

namespace {

using namespace ticcxx;
using freq_type = board::counter_frequency;
using virtual_type = virtual_alarm<freq_type, board::mutex_type>;

class named_client : public hil::alarm_client
{
public:
  named_client (const char* name,
                const hil::alarm<freq_type>& alarm) :
    name_{name},
    alarm_{alarm}
  { }

  void fired () override
  {
    printf("%s target %08x at %08x\n", name_,
           static_cast<unsigned int>(alarm_.get_alarm()),
           static_cast<unsigned int>(alarm_.now()));
    ++fired_count;
  }

  static unsigned int fired_count;

private:
  const char* const name_;
  const hil::alarm<freq_type>& alarm_;
};

unsigned int named_client::fired_count;

} // ns anonymous

int
main (void)
{
  setvbuf(stdout, NULL, _IONBF, 0);
  puts("\n\n" __FILE__ " " __DATE__ " " __TIME__);

  board::initialize();

  auto& mux = board::alarm_mux();
  virtual_type va{mux};
  virtual_type vb{mux};
  virtual_type vc{mux};
  named_client ca{"a", va};
  named_client cb{"b", vb};
  named_client cc{"c", vc};
  va.set_client(ca);
  vb.set_client(cb);
  vc.set_client(cc);

  /* Move to just before the counter wraps. */
  auto now = mux.now();
  board::advance(0xFFFFFF00 - now);
  now = mux.now();
  printf("Now %08x\n", static_cast<unsigned int>(now));

  va.set_alarm(now + 0x180);
  vb.set_alarm(now + 0x080);
  vc.set_alarm(now + 0x200);
  printf("System alarm %08x\n", static_cast<unsigned int>(board::system_alarm().get_alarm()));

  int rc = vc.disable();
  printf("Disable c: %s, active %d\n", return_code_text(rc), mux.active());

  while (mux.active()) {
    board::advance(16);
  }
  printf("%u fired, %u faults, now %08x\n", named_client::fired_count,
         mux.faults(), static_cast<unsigned int>(mux.now()));
  return 0;
}
