/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Virtualization of a single alarm among multiple clients.
 *
 * A hil::alarm holds one client and one target.  mux_alarm takes
 * ownership of the client slot of one alarm and allows an unbounded
 * number of virtual_alarm instances, each a complete hil::alarm, to
 * share it.
 *
 * @file */
#ifndef TICCXX_MUX_HPP
#define TICCXX_MUX_HPP
#pragma once

#include <ticcxx/time.hpp>

namespace ticcxx {

/** @cond DOXYGEN_EXCLUDE */
template <typename FrequencyT, typename MutexT> class mux_alarm;
template <typename FrequencyT, typename MutexT> class virtual_alarm;
/** @endcond */

/** The multiplexer state of a virtual alarm.
 *
 * This is the part of virtual_alarm that does not depend on the
 * frequency, so the queue that manages it need not be a template. */
class mux_entry
{
public:
  /** Constants identifying the entry state. */
  enum state_type : uint8_t
  {
    /** Entry is not armed: it has never been set, has fired, or has
     * been disabled.
     *
     * Transitions to #ST_scheduled when set or enabled. */
    ST_unscheduled,

    /** Entry is in the queue waiting for its target.
     *
     * Transitions to #ST_ready (when the underlying alarm fires) or
     * #ST_unscheduled (when disabled). */
    ST_scheduled,

    /** Entry target has been reached and its client will soon be
     * notified.
     *
     * If any entry is in this state the mux is processing a firing of
     * the underlying alarm.  Transitions to #ST_unscheduled
     * immediately before its client is notified, or when disabled. */
    ST_ready,
  };

  mux_entry () = default;

  /* You can't move or copy these. */
  mux_entry (const mux_entry&) = delete;
  mux_entry& operator= (const mux_entry&) = delete;
  mux_entry (mux_entry&&) = delete;
  mux_entry& operator= (mux_entry&&) = delete;

  /** The current state of the entry. */
  state_type state () const
  {
    return state_;
  }

private:
  friend class alarm_queue;
  template <typename FrequencyT, typename MutexT> friend class mux_alarm;
  template <typename FrequencyT, typename MutexT> friend class virtual_alarm;

  /** Calculate an ordinal for the entry relative to @p now.
   *
   * Entries that have reached their target under hil::tic_reached()
   * have non-positive ordinals, most overdue lowest.  Pending entries
   * have the positive number of tics remaining, up to
   * hil::HALF_RANGE. */
  int64_t ordinal_ (hil::tic_type now) const noexcept
  {
    if (hil::tic_reached(now, target_)) {
      return -static_cast<int64_t>(hil::tic_delta(target_, now));
    }
    return hil::tic_delta(now, target_);
  }

  hil::alarm_client* client_ = nullptr;
  mux_entry* next_ = nullptr;
  hil::tic_type target_ = 0;
  bool configured_ = false;
  state_type state_ = ST_unscheduled;
};

/** Queue of armed virtual alarms.
 *
 * Scheduled entries are kept in deadline order.  When the underlying
 * alarm fires the due prefix of the queue is moved to a ready queue,
 * from which entries are removed one at a time for notification.
 *
 * Functions with an `_ni` suffix must be invoked with the mux mutex
 * held. */
class alarm_queue
{
public:
  /** The entry with the nearest deadline, or a null pointer if
   * nothing is scheduled. */
  mux_entry* head () const noexcept
  {
    return scheduled_;
  }

  /** Insert @p entry, using @p now for ordinal calculation.
   *
   * The entry must not be in either queue.
   *
   * @return `true` iff the insertion changed head(). */
  bool schedule_ni (hil::tic_type now,
                    mux_entry& entry) noexcept;

  /** Remove @p entry from whichever queue holds it, marking it
   * unscheduled.
   *
   * @return `true` iff the removal changed head(). */
  bool cancel_ni (mux_entry& entry) noexcept;

  /** Move every scheduled entry that has reached its target at @p now
   * to the ready queue, then return the first ready entry as with
   * next_ready_ni(). */
  mux_entry* split_ni (hil::tic_type now) noexcept;

  /** Remove and return the next ready entry, marking it unscheduled,
   * or return a null pointer if there are no ready entries. */
  mux_entry* next_ready_ni () noexcept;

private:
  mux_entry** insertion_point_ni (hil::tic_type now,
                                  int64_t ord) noexcept;

  static mux_entry** search_ni (mux_entry** pos,
                                const mux_entry& entry) noexcept;

  mux_entry* scheduled_ = nullptr;
  mux_entry* ready_ = nullptr;
};

/** Multiplex virtual alarms onto one hil::alarm.
 *
 * The mux installs itself as the client of @p alarm on construction.
 * The underlying alarm is always armed at the deadline of the nearest
 * scheduled virtual alarm, and disabled when none are scheduled.
 *
 * @tparam FrequencyT the hil::frequency_tag of the alarm.
 *
 * @tparam MutexT the RAII type providing mutual exclusion between the
 * application and the context servicing the alarm.  Alarm operations
 * are invoked while it is held, so it must permit nesting the way
 * primask does. */
template <typename FrequencyT,
          typename MutexT = null_mutex>
class mux_alarm : private hil::alarm_client
{
public:
  using mutex_type = MutexT;

  explicit mux_alarm (hil::alarm<FrequencyT>& alarm) :
    alarm_{alarm}
  {
    alarm_.set_client(*this);
  }

  /* You can't move or copy these. */
  mux_alarm (const mux_alarm&) = delete;
  mux_alarm& operator= (const mux_alarm&) = delete;
  mux_alarm (mux_alarm&&) = delete;
  mux_alarm& operator= (mux_alarm&&) = delete;

  hil::tic_type now () const
  {
    return alarm_.now();
  }

  /** `true` iff any virtual alarm is scheduled. */
  bool active () const
  {
    mutex_type mutex;
    return nullptr != queue_.head();
  }

  /** The number of times the underlying alarm rejected an operation
   * during a context where the failure could not be returned. */
  unsigned int faults () const
  {
    mutex_type mutex;
    return faults_;
  }

private:
  friend class virtual_alarm<FrequencyT, MutexT>;

  void set_ (mux_entry& entry,
             hil::tic_type tics)
  {
    mutex_type mutex;
    auto now = alarm_.now();
    bool reset = queue_.cancel_ni(entry);
    entry.target_ = tics;
    entry.configured_ = true;
    reset |= queue_.schedule_ni(now, entry);
    if (reset) {
      record_(reset_ni_());
    }
  }

  return_code enable_ (mux_entry& entry)
  {
    mutex_type mutex;
    if (!entry.configured_) {
      return RC_EINVAL;
    }
    if (mux_entry::ST_unscheduled != entry.state_) {
      return RC_SUCCESS;
    }
    if (queue_.schedule_ni(alarm_.now(), entry)) {
      return reset_ni_();
    }
    return RC_SUCCESS;
  }

  return_code cancel_ (mux_entry& entry)
  {
    mutex_type mutex;
    if (queue_.cancel_ni(entry)) {
      return reset_ni_();
    }
    return RC_SUCCESS;
  }

  /** Arm the underlying alarm for the head of the queue. */
  return_code reset_ni_ ()
  {
    auto head = queue_.head();
    if (!head) {
      return alarm_.disable();
    }
    alarm_.set_alarm(head->target_);
    return RC_SUCCESS;
  }

  void record_ (return_code rc)
  {
    if (RC_SUCCESS != rc) {
      ++faults_;
    }
  }

  void fired () override
  {
    mux_entry* ep;
    hil::alarm_client* client = nullptr;
    {
      mutex_type mutex;
      ep = queue_.split_ni(alarm_.now());
      if (ep) {
        client = ep->client_;
      }
    }
    while (ep) {
      if (client) {
        client->fired();
      }
      mutex_type mutex;
      ep = queue_.next_ready_ni();
      client = ep ? ep->client_ : nullptr;
    }
    mutex_type mutex;
    record_(reset_ni_());
  }

  hil::alarm<FrequencyT>& alarm_;
  alarm_queue queue_;
  unsigned int faults_ = 0;
};

/** One of several alarms sharing a mux_alarm.
 *
 * Each instance provides the complete hil::alarm contract
 * independently of the others.  The instance is removed from the mux
 * when destroyed.
 *
 * @note If several virtual alarms are due when the underlying alarm
 * fires they are notified in deadline order. */
template <typename FrequencyT,
          typename MutexT = null_mutex>
class virtual_alarm : public hil::alarm<FrequencyT>,
                      private mux_entry
{
public:
  using mutex_type = MutexT;
  using mux_type = mux_alarm<FrequencyT, MutexT>;

  explicit virtual_alarm (mux_type& mux) :
    mux_{mux}
  { }

  ~virtual_alarm ()
  {
    mutex_type mutex;
    if (mux_.queue_.cancel_ni(*this)) {
      mux_.record_(mux_.reset_ni_());
    }
  }

  hil::tic_type now () const override
  {
    return mux_.now();
  }

  void set_alarm (hil::tic_type tics) override
  {
    mux_.set_(*this, tics);
  }

  hil::tic_type get_alarm () const override
  {
    mutex_type mutex;
    return target_;
  }

  void set_client (hil::alarm_client& client) override
  {
    mutex_type mutex;
    client_ = &client;
  }

  bool is_enabled () const override
  {
    mutex_type mutex;
    return ST_unscheduled != state_;
  }

  return_code enable () override
  {
    return mux_.enable_(*this);
  }

  return_code disable () override
  {
    return mux_.cancel_(*this);
  }

  using mux_entry::state;

private:
  mux_type& mux_;
};

} // namespace ticcxx

#endif /* TICCXX_MUX_HPP */
