// SPDX-License-Identifier: Apache-2.0
// Copyright 2015-2019 Peter A. Bigot

#include <ticcxx/mux.hpp>

#ifndef TICCXX_ENABLE_CONSOLE_TRACE
#define TICCXX_ENABLE_CONSOLE_TRACE 0
#endif /* TICCXX_ENABLE_CONSOLE_TRACE */

#if (TICCXX_ENABLE_CONSOLE_TRACE - 0)
#include <ticcxx/console/cstdio.hpp>
#else
#include <ticcxx/console/null.hpp>
#endif

namespace ticcxx {

/** Get a pointer to the link at which an entry with ordinal @p ord
 * relative to @p now should be inserted.  Entries with equal ordinals
 * remain in insertion order. */
mux_entry**
alarm_queue::insertion_point_ni (hil::tic_type now,
                                 int64_t ord) noexcept
{
  auto pos = &scheduled_;
  while (*pos && (ord >= (*pos)->ordinal_(now))) {
    pos = &(*pos)->next_;
  }
  return pos;
}

mux_entry**
alarm_queue::search_ni (mux_entry** pos,
                        const mux_entry& entry) noexcept
{
  while (*pos && (&entry != *pos)) {
    pos = &(*pos)->next_;
  }
  return pos;
}

bool
alarm_queue::schedule_ni (hil::tic_type now,
                          mux_entry& entry) noexcept
{
  auto front = scheduled_;
  auto pos = insertion_point_ni(now, entry.ordinal_(now));
  entry.state_ = mux_entry::ST_scheduled;
  entry.next_ = *pos;
  *pos = &entry;
  cprintf("* mux schedule %p for %u at %u\n", static_cast<void*>(&entry),
          static_cast<unsigned int>(entry.target_),
          static_cast<unsigned int>(now));
  return scheduled_ != front;
}

bool
alarm_queue::cancel_ni (mux_entry& entry) noexcept
{
  auto front = scheduled_;

  /* Look in scheduled first, then in ready. */
  auto pos = search_ni(&scheduled_, entry);
  if (!*pos) {
    pos = search_ni(&ready_, entry);
  }
  if (&entry == *pos) {
    *pos = entry.next_;
    entry.next_ = nullptr;
  }
  entry.state_ = mux_entry::ST_unscheduled;
  return scheduled_ != front;
}

mux_entry*
alarm_queue::split_ni (hil::tic_type now) noexcept
{
  /* Deadlines are ordered, so the due entries are a prefix. */
  auto pos = &scheduled_;
  while (*pos && hil::tic_reached(now, (*pos)->target_)) {
    (*pos)->state_ = mux_entry::ST_ready;
    pos = &(*pos)->next_;
  }
  if (&scheduled_ != pos) {
    /* Chop the due prefix off the front of the schedule and append it
     * to anything still ready. */
    auto tail = &ready_;
    while (*tail) {
      tail = &(*tail)->next_;
    }
    *tail = scheduled_;
    scheduled_ = *pos;
    *pos = nullptr;
  }
  return next_ready_ni();
}

mux_entry*
alarm_queue::next_ready_ni () noexcept
{
  mux_entry* rv = ready_;
  if (rv) {
    rv->state_ = mux_entry::ST_unscheduled;
    ready_ = rv->next_;
    rv->next_ = nullptr;
  }
  return rv;
}

} // namespace ticcxx
