/**
 * @file runtime_api.hpp
 * @brief gt runtime C++ API wrapper
 */

#pragma once

#include <functional>
#include <new>
#include <utility>

#include "gt/errors.h"
#include "gt/runtime_api.h"
#include "gt/task.h"

namespace gt
{

using Config = GtConfig;
using Runtime = GtRuntime;
using SlotState = gt_slot_state_t;

/**
 * @brief Spawn any callable as a task
 *
 * The callable is moved into a heap-allocated std::function owned by the
 * slot and destroyed when the task returns.
 *
 * @param rt  Runtime
 * @param fn  Callable taking no arguments
 * @return Slot id on success, negative error code otherwise
 */
template <typename F>
int spawn(Runtime *rt, F &&fn)
{
  auto *boxed = new (std::nothrow) std::function<void()>(std::forward<F>(fn));
  if (!boxed)
    return GT_ERR_OutOfMemory;

  int slot = gt_spawn_closure(
      rt, [](void *arg) { (*static_cast<std::function<void()> *>(arg))(); }, boxed,
      [](void *arg) { delete static_cast<std::function<void()> *>(arg); });
  if (slot < 0)
    delete boxed;
  return slot;
}

/**
 * @brief Yield to the next ready task (C++ wrapper)
 */
inline void yield()
{
  gt_yield();
}

/**
 * @brief Current slot id (C++ wrapper)
 */
inline int self()
{
  return gt_self();
}

}  // namespace gt
