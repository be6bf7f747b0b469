/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Hardware-agnostic interfaces for counter-like resources.
 *
 * The capabilities form a hierarchy rooted in hil::time:
 * * hil::counter adds control over a free-running clock;
 * * hil::alarm adds a one-shot notification at an absolute tic value;
 * * hil::timer adds one-shot or repeating notification after a
 *   relative interval.
 *
 * Every capability is parameterized by a @link hil::frequency_tag
 * frequency tag@endlink so clients can convert tics to real time
 * without runtime cost.
 *
 * @file */
#ifndef TICCXX_TIME_HPP
#define TICCXX_TIME_HPP
#pragma once

#include <chrono>
#include <cstdint>

#include <ticcxx/core.hpp>

namespace ticcxx {

/** Hardware interface layer capabilities for time-related resources. */
namespace hil {

/** The representation of a hardware counter value.
 *
 * Values are full-width and wrap to zero after the maximum. */
using tic_type = uint32_t;

/** Half the range of #tic_type.
 *
 * A target is reached when the unsigned distance from it to the
 * current counter is less than this value.  Consequently alarms may be
 * set at most `HALF_RANGE` tics into the future; a target further
 * ahead is treated as already passed. */
constexpr tic_type HALF_RANGE = (1U << 31);

/** Calculate the tic count between two counter values.
 *
 * @return The value that when added to counter value @p from would
 * produce counter value @p to. */
constexpr tic_type tic_delta (tic_type from,
                              tic_type to)
{
  /* This relies on standard semantics for unsigned subtraction to
   * handle the case where to < from. */
  return to - from;
}

/** Determine whether @p now has reached or circularly passed @p
 * target.
 *
 * The tic space is treated as a circle: @p target is reached when
 * `now - target (mod 2^32)` is less than #HALF_RANGE.  This remains
 * correct across counter wraparound and when the exact target tic is
 * never observed. */
constexpr bool tic_reached (tic_type now,
                            tic_type target)
{
  return HALF_RANGE > tic_delta(target, now);
}

/** Tics from @p now until @p target, or zero if @p target has been
 * reached. */
constexpr tic_type tic_remaining (tic_type now,
                                  tic_type target)
{
  return tic_reached(now, target) ? 0 : tic_delta(now, target);
}

/** Compile-time tag describing the rate of a clock in Hz.
 *
 * Instances carry no state; the tag is used as the template parameter
 * of every capability so clients can portably convert native tics to
 * real time values.
 *
 * @tparam HZ the clock rate. */
template <unsigned int HZ>
struct frequency_tag
{
  /** Frequency of the clock as a symbolic constant. */
  constexpr static unsigned int Frequency_Hz = HZ;

  /** Frequency of the clock in Hz. */
  constexpr static unsigned int frequency ()
  {
    return Frequency_Hz;
  }

  /** A std::chrono duration with tic resolution.
   *
   * @warning As with other std::chrono durations the representation
   * type is signed. */
  using duration_type = std::chrono::duration<int64_t, std::ratio<1, Frequency_Hz>>;
};

/** 16 MHz frequency */
using freq16MHz = frequency_tag<16'000'000>;

/** 32 KiHz frequency */
using freq32KHz = frequency_tag<32768>;

/** 16 kHz frequency */
using freq16KHz = frequency_tag<16000>;

/** 1 kHz frequency */
using freq1KHz = frequency_tag<1000>;

/** A client of an implementor of hil::alarm. */
class alarm_client
{
public:
  /** Callback signaled when the alarm's clock reaches the value set
   * in alarm::set_alarm().
   *
   * This is invoked from the context that services the alarm (an
   * interrupt handler or a polling loop).  The alarm may be re-armed
   * from within the callback. */
  virtual void fired () = 0;

protected:
  ~alarm_client () = default;
};

/** A client of an implementor of hil::timer. */
class timer_client
{
public:
  /** Callback signaled when the timer's interval has elapsed. */
  virtual void fired () = 0;

protected:
  ~timer_client () = default;
};

/** Base capability for all time-related resources.
 *
 * @tparam FrequencyT a hil::frequency_tag giving the rate of now(). */
template <typename FrequencyT>
class time
{
public:
  /** The rate at which now() advances. */
  using frequency_type = FrequencyT;

  virtual ~time () = default;

  /** Return the current time in hardware clock units.
   *
   * This has no side effects and may be invoked from any context,
   * including a client callback. */
  virtual tic_type now () const = 0;

  /** Disable any outstanding alarm or timer.
   *
   * @return #RC_SUCCESS.  Disabling something that is not armed is a
   * no-op. */
  virtual return_code disable () = 0;

  /** Returns whether a timer or alarm is currently armed. */
  virtual bool is_armed () const = 0;
};

/** A free-running clock that can be started and stopped. */
template <typename FrequencyT>
class counter : public virtual time<FrequencyT>
{
public:
  /** Start the counter.
   *
   * @return #RC_SUCCESS if the counter is running on return, including
   * when it was already running.  #RC_EBUSY if the counter is held by
   * another owner. */
  virtual return_code start () = 0;

  /** Stop the counter.
   *
   * @return #RC_SUCCESS if the counter is stopped on return, including
   * when it was already stopped.  #RC_EBUSY if the counter is held by
   * another owner, or #RC_ENOSUPPORT if the counter cannot be
   * stopped. */
  virtual return_code stop () = 0;

  /** Return `true` iff the counter is running. */
  virtual bool is_running () const = 0;
};

/** A wrapping counter capable of notifying when the counter reaches a
 * certain value.
 *
 * Implementors use the alarm_client interface to signal when the
 * counter has reached the value specified in set_alarm().  Reaching is
 * decided by tic_reached(), so the target must be less than
 * #HALF_RANGE tics after the time it is set.
 *
 * Setting an alarm arms it.  enable() and disable() mask the armed
 * state without changing the target. */
template <typename FrequencyT>
class alarm : public virtual time<FrequencyT>
{
public:
  /** Set a one-shot alarm to fire when the clock reaches @p tics.
   *
   * The client fired() is signaled once when @p tics is reached, after
   * which the alarm is disarmed.  A typical invocation is:
   *
   *     alarm.set_alarm(alarm.now() + delta);
   */
  virtual void set_alarm (tic_type tics) = 0;

  /** Returns the value most recently passed to set_alarm(). */
  virtual tic_type get_alarm () const = 0;

  /** Install the client to be notified when the alarm fires.
   *
   * This replaces any previously installed client. */
  virtual void set_client (alarm_client& client) = 0;

  /** Return `true` iff the alarm is armed. */
  virtual bool is_enabled () const = 0;

  /** Re-arm the alarm at get_alarm().
   *
   * @return #RC_SUCCESS, or #RC_EINVAL if set_alarm() has never been
   * invoked. */
  virtual return_code enable () = 0;

  /** Disarm the alarm.
   *
   * @return #RC_SUCCESS always. */
  return_code disable () override = 0;

  bool is_armed () const override
  {
    return is_enabled();
  }
};

/** Constants identifying whether a timer fires once or repeatedly. */
enum mode_type : uint8_t
{
  /** The timer fires once after its interval. */
  MODE_oneshot,

  /** The timer fires every interval until cancelled. */
  MODE_repeating,
};

/** A timer that notifies when a particular interval has elapsed.
 *
 * A timer that has never been started is reported as a one-shot timer
 * with a zero interval. */
template <typename FrequencyT>
class timer : public virtual time<FrequencyT>
{
public:
  /** Install the client to be notified when the timer fires.
   *
   * This replaces any previously installed client. */
  virtual void set_client (timer_client& client) = 0;

  /** Set a one-shot timer to fire in @p interval tics. */
  virtual void oneshot (tic_type interval) = 0;

  /** Set a repeating timer to fire every @p interval tics.
   *
   * Each deadline is @p interval tics after the previous deadline, so
   * callback latency does not accumulate. */
  virtual void repeat (tic_type interval) = 0;

  /** The interval most recently passed to oneshot() or repeat(). */
  virtual tic_type interval () const = 0;

  /** Whether the timer is configured as one-shot or repeating. */
  virtual mode_type mode () const = 0;

  bool is_oneshot () const
  {
    return MODE_oneshot == mode();
  }

  bool is_repeating () const
  {
    return MODE_repeating == mode();
  }

  /** Tics until the timer fires.
   *
   * @return zero if the timer is disabled or its deadline has been
   * reached. */
  virtual tic_type time_remaining () const = 0;

  /** Return `true` iff the timer is armed. */
  virtual bool is_enabled () const = 0;

  /** Disarm the timer.
   *
   * @return #RC_SUCCESS always, including when the timer has already
   * fired or been cancelled. */
  virtual return_code cancel () = 0;

  return_code disable () override
  {
    return cancel();
  }

  bool is_armed () const override
  {
    return is_enabled();
  }
};

/** Alarm state recorded by an implementation of hil::alarm.
 *
 * This captures the target, whether a target has been set, and
 * whether the alarm is armed, and applies the tic_reached() law to
 * decide when the alarm is due.  It performs no locking; callers
 * provide the required mutex. */
class tic_compare
{
public:
  /** Record @p target and arm. */
  void set (tic_type target) noexcept;

  /** The value most recently passed to set(). */
  tic_type target () const noexcept
  {
    return target_;
  }

  /** `true` iff set() has been invoked at least once. */
  bool configured () const noexcept
  {
    return configured_;
  }

  /** `true` iff the alarm is armed. */
  bool armed () const noexcept
  {
    return armed_;
  }

  /** Re-arm at target().
   *
   * @return #RC_SUCCESS, or #RC_EINVAL if there is no target. */
  return_code enable () noexcept;

  /** Disarm.
   *
   * @return #RC_SUCCESS */
  return_code disable () noexcept;

  /** Determine whether the alarm fires at @p now.
   *
   * @return `true` iff the alarm was armed and @p now has reached
   * target().  In that case the alarm is disarmed, so a given arming
   * produces at most one `true` result. */
  bool poll (tic_type now) noexcept;

  /** Tics from @p now until the alarm is due, or zero if it is
   * disarmed or due. */
  tic_type remaining (tic_type now) const noexcept;

private:
  tic_type target_ = 0;
  bool configured_ = false;
  bool armed_ = false;
};

} // namespace hil
} // namespace ticcxx

#endif /* TICCXX_TIME_HPP */
