/**
 * @file panic.hpp
 * @brief gt panic handler C++ wrapper
 */

#pragma once

#include "gt/panic.h"

namespace gt
{

/**
 * @brief C++ wrapper for GtPanicInfo
 */
using PanicInfo = GtPanicInfo;

/**
 * @brief C++ wrapper for GtPanicHandler
 */
using PanicHandler = GtPanicHandler;

/**
 * @brief Set panic handler (C++ wrapper)
 *
 * @param rt         Runtime
 * @param handler    Panic handler callback
 * @param user_data  User data passed to handler
 */
inline void set_panic_handler(GtRuntime *rt, PanicHandler handler, void *user_data = nullptr)
{
  gt_set_panic_handler(rt, handler, user_data);
}

}  // namespace gt
