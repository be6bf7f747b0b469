/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Interval timers layered on absolute-tic alarms.
 *
 * @file */
#ifndef TICCXX_TIMER_HPP
#define TICCXX_TIMER_HPP
#pragma once

#include <ticcxx/time.hpp>

namespace ticcxx {

/** Timer state recorded by an implementation of hil::timer.
 *
 * This tracks the mode, the interval, and the absolute deadline of the
 * next expiration.  Repeating deadlines advance by exactly interval()
 * from the previous deadline, independent of when the expiration is
 * processed.  It performs no locking. */
class interval_schedule
{
public:
  /** Begin timing @p interval tics from @p now.
   *
   * @return the absolute deadline, `now + interval`. */
  hil::tic_type start (hil::mode_type mode,
                       hil::tic_type now,
                       hil::tic_type interval) noexcept;

  /** Stop timing.  This is a no-op if not enabled().
   *
   * @return #RC_SUCCESS */
  return_code cancel () noexcept;

  /** Process expiration of the current deadline.
   *
   * A one-shot schedule becomes disabled.  A repeating schedule
   * remains enabled with target() advanced by interval().
   *
   * @param now the time at which the expiration is processed, used
   * only to diagnose repeating schedules that have fallen a full
   * interval behind.
   *
   * @return `true` iff the schedule was enabled, i.e. the client
   * should be notified. */
  bool expire (hil::tic_type now) noexcept;

  /** Tics from @p now until target(), or zero if disabled or
   * reached. */
  hil::tic_type remaining (hil::tic_type now) const noexcept;

  bool enabled () const noexcept
  {
    return enabled_;
  }

  hil::mode_type mode () const noexcept
  {
    return mode_;
  }

  hil::tic_type interval () const noexcept
  {
    return interval_;
  }

  /** The absolute deadline of the next expiration. */
  hil::tic_type target () const noexcept
  {
    return target_;
  }

  /** The number of repeating expirations processed after the
   * following deadline had already been reached. */
  unsigned int overruns () const noexcept
  {
    return overruns_;
  }

private:
  hil::tic_type interval_ = 0;
  hil::tic_type target_ = 0;
  unsigned int overruns_ = 0;
  hil::mode_type mode_ = hil::MODE_oneshot;
  bool enabled_ = false;
};

/** Implement hil::timer on top of a hil::alarm.
 *
 * The timer installs itself as the client of the alarm on
 * construction; the alarm must not be shared with other clients.  Use
 * a virtual_alarm to share one hardware alarm among several timers.
 *
 * When a repeating timer fires the alarm is re-armed at the next
 * deadline before the timer client is notified, so latency in the
 * client does not delay or shift later periods.
 *
 * @tparam FrequencyT the hil::frequency_tag of the alarm.
 *
 * @tparam MutexT the RAII type providing mutual exclusion between the
 * application and the context servicing the alarm.  Alarm operations
 * are invoked while it is held, so it must permit nesting the way
 * primask does. */
template <typename FrequencyT,
          typename MutexT = null_mutex>
class alarm_timer : public hil::timer<FrequencyT>,
                    private hil::alarm_client
{
public:
  using mutex_type = MutexT;

  explicit alarm_timer (hil::alarm<FrequencyT>& alarm) :
    alarm_{alarm}
  {
    alarm_.set_client(*this);
  }

  /* You can't move or copy these. */
  alarm_timer (const alarm_timer&) = delete;
  alarm_timer& operator= (const alarm_timer&) = delete;
  alarm_timer (alarm_timer&&) = delete;
  alarm_timer& operator= (alarm_timer&&) = delete;

  hil::tic_type now () const override
  {
    return alarm_.now();
  }

  void set_client (hil::timer_client& client) override
  {
    mutex_type mutex;
    client_ = &client;
  }

  void oneshot (hil::tic_type interval) override
  {
    start_(hil::MODE_oneshot, interval);
  }

  void repeat (hil::tic_type interval) override
  {
    start_(hil::MODE_repeating, interval);
  }

  hil::tic_type interval () const override
  {
    mutex_type mutex;
    return schedule_.interval();
  }

  hil::mode_type mode () const override
  {
    mutex_type mutex;
    return schedule_.mode();
  }

  hil::tic_type time_remaining () const override
  {
    mutex_type mutex;
    return schedule_.remaining(alarm_.now());
  }

  bool is_enabled () const override
  {
    mutex_type mutex;
    return schedule_.enabled();
  }

  return_code cancel () override
  {
    mutex_type mutex;
    schedule_.cancel();
    return alarm_.disable();
  }

  /** The absolute deadline of the next expiration.
   *
   * Meaningful only while is_enabled(). */
  hil::tic_type deadline () const
  {
    mutex_type mutex;
    return schedule_.target();
  }

  /** @copydoc interval_schedule::overruns */
  unsigned int overruns () const
  {
    mutex_type mutex;
    return schedule_.overruns();
  }

private:
  void start_ (hil::mode_type mode,
               hil::tic_type interval)
  {
    mutex_type mutex;
    alarm_.set_alarm(schedule_.start(mode, alarm_.now(), interval));
  }

  void fired () override
  {
    hil::timer_client* client = nullptr;
    {
      mutex_type mutex;
      if (schedule_.expire(alarm_.now())) {
        client = client_;
        if (schedule_.enabled()) {
          alarm_.set_alarm(schedule_.target());
        }
      }
    }
    if (client) {
      client->fired();
    }
  }

  hil::alarm<FrequencyT>& alarm_;
  interval_schedule schedule_;
  hil::timer_client* client_ = nullptr;
};

} // namespace ticcxx

#endif /* TICCXX_TIMER_HPP */
