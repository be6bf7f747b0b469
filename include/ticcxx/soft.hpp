/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Software implementations of the time capabilities.
 *
 * soft_counter models a free-running counter register whose value is
 * advanced explicitly, as on the faked host board or in unit tests.
 * polled_alarm implements hil::alarm over any hil::time source by
 * evaluating the alarm from a servicing context, which is how an alarm
 * is provided for counters that lack compare hardware.
 *
 * @file */
#ifndef TICCXX_SOFT_HPP
#define TICCXX_SOFT_HPP
#pragma once

#include <ticcxx/time.hpp>

namespace ticcxx {

/** State of a software counter register.
 *
 * This holds the counter value and the start/stop policy.  It performs
 * no locking; soft_counter provides the mutex. */
class counter_state
{
public:
  /** Construct a stopped counter at zero.
   *
   * @param stoppable `false` if the counter, once started, cannot be
   * stopped. */
  explicit counter_state (bool stoppable = true) :
    stoppable_{stoppable}
  { }

  /** The current counter value. */
  hil::tic_type value () const noexcept
  {
    return value_;
  }

  /** Load @p value into the counter. */
  void load (hil::tic_type value) noexcept
  {
    value_ = value;
  }

  /** Add @p tics to the counter if it is running. */
  void advance (hil::tic_type tics) noexcept
  {
    if (running_) {
      value_ += tics;
    }
  }

  /** Start the counter.
   *
   * @return #RC_SUCCESS if the counter is running on return, or
   * #RC_EBUSY if it was stopped and is reserved(). */
  return_code start () noexcept;

  /** Stop the counter.
   *
   * @return #RC_SUCCESS if the counter is stopped on return,
   * #RC_EBUSY if it was running and is reserved(), or #RC_ENOSUPPORT
   * if it was running and is not stoppable(). */
  return_code stop () noexcept;

  bool running () const noexcept
  {
    return running_;
  }

  /** Mark the counter as held, or released, by another owner.
   *
   * While reserved the running state of the counter cannot be
   * changed. */
  void reserve (bool held) noexcept
  {
    reserved_ = held;
  }

  bool reserved () const noexcept
  {
    return reserved_;
  }

  bool stoppable () const noexcept
  {
    return stoppable_;
  }

private:
  hil::tic_type value_ = 0;
  bool running_ = false;
  bool reserved_ = false;
  bool const stoppable_;
};

/** A counter implemented in software.
 *
 * The counter advances only when advance() is invoked.  A notifier
 * may be installed to be invoked after each advance, modelling the
 * hardware event that causes alarms to be serviced:
 *
 *     soft_counter<hil::freq32KHz> ctr;
 *     polled_alarm<hil::freq32KHz> alarm{ctr};
 *     ctr.set_notifier([&alarm]() { alarm.service(); });
 *
 * @tparam FrequencyT the hil::frequency_tag of the counter.
 *
 * @tparam MutexT the RAII type providing mutual exclusion between
 * the application and the context that advances the counter. */
template <typename FrequencyT,
          typename MutexT = null_mutex>
class soft_counter : public hil::counter<FrequencyT>
{
public:
  using mutex_type = MutexT;

  explicit soft_counter (bool stoppable = true) :
    state_{stoppable}
  { }

  /* You can't move or copy these. */
  soft_counter (const soft_counter&) = delete;
  soft_counter& operator= (const soft_counter&) = delete;
  soft_counter (soft_counter&&) = delete;
  soft_counter& operator= (soft_counter&&) = delete;

  hil::tic_type now () const override
  {
    mutex_type mutex;
    return state_.value();
  }

  /** A bare counter has nothing to disable. */
  return_code disable () override
  {
    return RC_SUCCESS;
  }

  bool is_armed () const override
  {
    return false;
  }

  return_code start () override
  {
    mutex_type mutex;
    return state_.start();
  }

  return_code stop () override
  {
    mutex_type mutex;
    return state_.stop();
  }

  bool is_running () const override
  {
    mutex_type mutex;
    return state_.running();
  }

  /** Advance the counter by @p tics, if it is running, then invoke the
   * notifier.
   *
   * The notifier is invoked whether or not the counter is running. */
  void advance (hil::tic_type tics = 1)
  {
    {
      mutex_type mutex;
      state_.advance(tics);
    }
    if (notifier_) {
      notifier_();
    }
  }

  /** Load @p value into the counter register.
   *
   * The notifier is not invoked. */
  void set_counter (hil::tic_type value)
  {
    mutex_type mutex;
    state_.load(value);
  }

  /** @copydoc counter_state::reserve */
  void reserve (bool held)
  {
    mutex_type mutex;
    state_.reserve(held);
  }

  bool reserved () const
  {
    mutex_type mutex;
    return state_.reserved();
  }

  bool stoppable () const
  {
    return state_.stoppable();
  }

  /** Install the function invoked after every advance().
   *
   * Pass an empty function to remove the notifier. */
  void set_notifier (notifier_type notifier)
  {
    notifier_ = notifier;
  }

private:
  counter_state state_;
  notifier_type notifier_;
};

/** An alarm evaluated from a servicing context.
 *
 * service() must be invoked from an interrupt handler or polling loop
 * often enough that the counter cannot advance #HALF_RANGE tics
 * between invocations.  It need not be invoked on every tic: the
 * alarm fires on the first service() at or after the target is
 * reached.
 *
 * @tparam FrequencyT the hil::frequency_tag of the time source.
 *
 * @tparam MutexT the RAII type providing mutual exclusion between the
 * application and the servicing context. */
template <typename FrequencyT,
          typename MutexT = null_mutex>
class polled_alarm : public hil::alarm<FrequencyT>
{
public:
  using mutex_type = MutexT;

  /** Construct an alarm using the clock @p source. */
  explicit polled_alarm (const hil::time<FrequencyT>& source) :
    source_{source}
  { }

  /* You can't move or copy these. */
  polled_alarm (const polled_alarm&) = delete;
  polled_alarm& operator= (const polled_alarm&) = delete;
  polled_alarm (polled_alarm&&) = delete;
  polled_alarm& operator= (polled_alarm&&) = delete;

  hil::tic_type now () const override
  {
    return source_.now();
  }

  void set_alarm (hil::tic_type tics) override
  {
    mutex_type mutex;
    compare_.set(tics);
  }

  hil::tic_type get_alarm () const override
  {
    mutex_type mutex;
    return compare_.target();
  }

  void set_client (hil::alarm_client& client) override
  {
    mutex_type mutex;
    client_ = &client;
  }

  bool is_enabled () const override
  {
    mutex_type mutex;
    return compare_.armed();
  }

  return_code enable () override
  {
    mutex_type mutex;
    return compare_.enable();
  }

  return_code disable () override
  {
    mutex_type mutex;
    return compare_.disable();
  }

  /** Check the alarm against the current time, and notify the client
   * if it has fired.
   *
   * The decision to fire and the disarming of the alarm occur within
   * the mutex; the client is invoked after the mutex is released so
   * that it may re-arm the alarm.  A re-armed alarm that is already
   * due fires on the next invocation of this function.
   *
   * @return `true` iff the alarm fired, whether or not there was a
   * client to notify. */
  bool service ()
  {
    hil::alarm_client* client = nullptr;
    bool fired;
    {
      mutex_type mutex;
      fired = compare_.poll(source_.now());
      if (fired) {
        client = client_;
      }
    }
    if (client) {
      client->fired();
    }
    return fired;
  }

private:
  const hil::time<FrequencyT>& source_;
  hil::tic_compare compare_;
  hil::alarm_client* client_ = nullptr;
};

} // namespace ticcxx

#endif /* TICCXX_SOFT_HPP */
