// SPDX-License-Identifier: Apache-2.0
// Copyright 2015-2019 Peter A. Bigot

#include <ticcxx/timer.hpp>

#ifndef TICCXX_ENABLE_CONSOLE_TRACE
#define TICCXX_ENABLE_CONSOLE_TRACE 0
#endif /* TICCXX_ENABLE_CONSOLE_TRACE */

#if (TICCXX_ENABLE_CONSOLE_TRACE - 0)
#include <ticcxx/console/cstdio.hpp>
#else
#include <ticcxx/console/null.hpp>
#endif

namespace ticcxx {

hil::tic_type
interval_schedule::start (hil::mode_type mode,
                          hil::tic_type now,
                          hil::tic_type interval) noexcept
{
  mode_ = mode;
  interval_ = interval;
  target_ = now + interval;
  enabled_ = true;
  return target_;
}

return_code
interval_schedule::cancel () noexcept
{
  enabled_ = false;
  return RC_SUCCESS;
}

bool
interval_schedule::expire (hil::tic_type now) noexcept
{
  if (!enabled_) {
    /* Cancelled after the alarm committed to firing. */
    return false;
  }
  if (hil::MODE_repeating != mode_) {
    enabled_ = false;
    return true;
  }

  /* Advance from the previous deadline, not from now, so processing
   * latency does not accumulate. */
  target_ += interval_;
  if (hil::tic_reached(now, target_)) {
    ++overruns_;
    cprintf("** timer overrun: now %u next %u interval %u\n",
            static_cast<unsigned int>(now),
            static_cast<unsigned int>(target_),
            static_cast<unsigned int>(interval_));
  }
  return true;
}

hil::tic_type
interval_schedule::remaining (hil::tic_type now) const noexcept
{
  if (!enabled_) {
    return 0;
  }
  return hil::tic_remaining(now, target_);
}

} // namespace ticcxx
