// SPDX-License-Identifier: Apache-2.0
// Copyright 2015-2019 Peter A. Bigot

#include <ticcxx/time.hpp>

namespace ticcxx {
namespace hil {

void
tic_compare::set (tic_type target) noexcept
{
  target_ = target;
  configured_ = true;
  armed_ = true;
}

return_code
tic_compare::enable () noexcept
{
  if (!configured_) {
    return RC_EINVAL;
  }
  armed_ = true;
  return RC_SUCCESS;
}

return_code
tic_compare::disable () noexcept
{
  armed_ = false;
  return RC_SUCCESS;
}

bool
tic_compare::poll (tic_type now) noexcept
{
  if (armed_ && tic_reached(now, target_)) {
    armed_ = false;
    return true;
  }
  return false;
}

tic_type
tic_compare::remaining (tic_type now) const noexcept
{
  if (!armed_) {
    return 0;
  }
  return tic_remaining(now, target_);
}

} // namespace hil
} // namespace ticcxx
