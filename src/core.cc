// SPDX-License-Identifier: Apache-2.0
// Copyright 2015-2019 Peter A. Bigot

#include <ticcxx/core.hpp>

namespace ticcxx {

const char*
return_code_text (int rc)
{
  switch (rc) {
    case RC_SUCCESS:
      return "RC_SUCCESS";
    case RC_FAIL:
      return "RC_FAIL";
    case RC_EBUSY:
      return "RC_EBUSY";
    case RC_EALREADY:
      return "RC_EALREADY";
    case RC_EINVAL:
      return "RC_EINVAL";
    case RC_ENOSUPPORT:
      return "RC_ENOSUPPORT";
    case RC_ECANCEL:
      return "RC_ECANCEL";
  }
  return "RC_?";
}

} // namespace ticcxx
