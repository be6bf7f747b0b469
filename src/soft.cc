// SPDX-License-Identifier: Apache-2.0
// Copyright 2015-2019 Peter A. Bigot

#include <ticcxx/soft.hpp>

#ifndef TICCXX_ENABLE_CONSOLE_TRACE
#define TICCXX_ENABLE_CONSOLE_TRACE 0
#endif /* TICCXX_ENABLE_CONSOLE_TRACE */

#if (TICCXX_ENABLE_CONSOLE_TRACE - 0)
#include <ticcxx/console/cstdio.hpp>
#else
#include <ticcxx/console/null.hpp>
#endif

namespace ticcxx {

return_code
counter_state::start () noexcept
{
  if (running_) {
    return RC_SUCCESS;
  }
  if (reserved_) {
    crc("counter start", RC_EBUSY);
    return RC_EBUSY;
  }
  running_ = true;
  return RC_SUCCESS;
}

return_code
counter_state::stop () noexcept
{
  if (!running_) {
    return RC_SUCCESS;
  }
  if (reserved_) {
    crc("counter stop", RC_EBUSY);
    return RC_EBUSY;
  }
  if (!stoppable_) {
    /* Some counters cannot be halted once started; the caller must
     * leave it running. */
    crc("counter stop", RC_ENOSUPPORT);
    return RC_ENOSUPPORT;
  }
  running_ = false;
  return RC_SUCCESS;
}

} // namespace ticcxx
