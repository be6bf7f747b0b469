/* SPDX-License-Identifier: Apache-2.0 */
/* Copyright 2015-2019 Peter A. Bigot */

/** Primary header for ticcxx interface dependencies.
 *
 * This provides the shared status code enumeration used by all
 * fallible operations, and the RAII classes used to protect state
 * shared between application code and the context that services
 * timer events.
 *
 * @anchor ticcxx_mutex Mutex support classes:
 * * @link ticcxx::primask@endlink
 * * @link ticcxx::null_mutex@endlink
 *
 * @file */

#ifndef TICCXX_CORE_HPP
#define TICCXX_CORE_HPP
#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <functional>

#ifndef TICCXX_CROSS_COMPILING
/** Macro defined to a preprocessor true value when building for an
 * ARM Cortex-M target.
 *
 * When false (the default) the library is built for the host, and
 * interrupt masking operations compile to nothing. */
#define TICCXX_CROSS_COMPILING 0
#endif /* TICCXX_CROSS_COMPILING */

/** Primary namespace for ticcxx functionality */
namespace ticcxx {

/** Status codes returned by fallible operations.
 *
 * Success is zero; every failure is a negative `errno` value, so
 * callers can either compare against specific codes or use the usual
 * `0 > rc` test.
 *
 * Operations that are redundant (stopping a stopped counter,
 * cancelling a cancelled timer) are not failures and return
 * #RC_SUCCESS. */
enum return_code : int
{
  /** The operation completed. */
  RC_SUCCESS = 0,

  /** The hardware reported a fault. */
  RC_FAIL = -EIO,

  /** The resource is held by another owner or in an incompatible
   * mode. */
  RC_EBUSY = -EBUSY,

  /** The requested state is already in effect and the operation is
   * not defined as a no-op. */
  RC_EALREADY = -EALREADY,

  /** A precondition of the operation was not satisfied, e.g.
   * enabling an alarm that has never been given a target. */
  RC_EINVAL = -EINVAL,

  /** The resource cannot perform the operation at all, e.g. stopping
   * a counter that cannot be stopped. */
  RC_ENOSUPPORT = -ENOTSUP,

  /** The operation was cancelled before it completed. */
  RC_ECANCEL = -ECANCELED,
};

/** Return a short symbolic name for @p rc.
 *
 * Values that are not members of #return_code produce `"RC_?"`. */
const char* return_code_text (int rc);

/** Type used to hold a notifier.
 *
 * This type is used when an operation must record a callback to be
 * invoked when something happens, and that callback does not transfer
 * any information outside of the fact of its being invoked. */
using notifier_type = std::function<void()>;

/** RAII class that performs no mutex operations.
 *
 * This is used as the default value for template parameters that
 * identify the mutex required to protect an operation in cases where
 * the operation may not need protection, e.g. when every operation
 * and the servicing context execute in the same polling loop. */
class null_mutex
{
public:
  null_mutex ()
  { }

  null_mutex (const null_mutex&) = delete;
  null_mutex& operator= (const null_mutex&) = delete;
  null_mutex (null_mutex&& ) = delete;
  null_mutex& operator= (null_mutex&) = delete;
};

/** RAII class to block interrupts.
 *
 * The PRIMASK configuration is recorded and then disabled.  When the
 * instance is destructed the recorded PRIMASK configuration is
 * restored.
 *
 * Note that this class is safe to use in contexts where interrupts
 * are already disabled: they will not be re-enabled when the object
 * is destructed.
 *
 * On the host this has no effect. */
class primask
{
public:
  primask () :
    in_mask_{}
  {
#if (TICCXX_CROSS_COMPILING - 0)
    __asm__ volatile ("mrs\t%0, primask\n\t"
                      "cpsid\ti"
                      : "=r" (in_mask_)
                      :
                      : "memory");
#endif /* TICCXX_CROSS_COMPILING */
  }

  ~primask ()
  {
#if (TICCXX_CROSS_COMPILING - 0)
    __asm__ volatile ("msr\tprimask, %0"
                      :
                      : "r" (in_mask_)
                      : "memory");
#endif /* TICCXX_CROSS_COMPILING */
  }

  primask (const primask&) = delete;
  primask& operator= (const primask&) = delete;
  primask (primask&& ) = delete;
  primask& operator= (primask&) = delete;

private:
  uint32_t in_mask_;
};

} // namespace ticcxx

#endif /* TICCXX_CORE_HPP */
