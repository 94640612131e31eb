#pragma once
#include <stdint.h>

#include "gt/runtime_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Task Management API (Public)                                             */
  /* ========================================================================= */

  /**
   * @brief Slot lifecycle state
   *
   * AVAILABLE -(spawn)-> READY -(scheduled)-> RUNNING -(yield)-> READY
   * RUNNING -(task returns)-> AVAILABLE
   */
  typedef enum
  {
    GT_SLOT_AVAILABLE = 0,
    GT_SLOT_READY,
    GT_SLOT_RUNNING,
  } gt_slot_state_t;

  /**
   * @brief Spawn a task into the first AVAILABLE slot
   *
   * Lays out the first frame on the slot's stack and marks it READY. Nothing
   * runs until the scheduler picks the slot.
   *
   * A full pool is fatal: the runtime panics (PoolFull) and the process
   * aborts before any slot is touched.
   *
   * @param rt Runtime
   * @param fn Task body
   * @return Slot id (1..pool_size-1) on success
   *         InvalidArg: rt or fn is NULL
   */
  int gt_spawn(GtRuntime *rt, gt_task_fn fn);

  /**
   * @brief Spawn a task that owns state
   *
   * Same frame and capacity rules as gt_spawn(). The slot runs entry(arg);
   * once entry returns, release(arg) is called (if non-NULL) before the
   * slot goes back to AVAILABLE.
   *
   * @param rt      Runtime
   * @param entry   Task body
   * @param arg     State handed to entry and release
   * @param release State destructor (can be NULL)
   * @return Slot id on success, InvalidArg on NULL rt/entry
   */
  int gt_spawn_closure(GtRuntime *rt, gt_entry_fn entry, void *arg, gt_release_fn release);

  /**
   * @brief Yield to the next READY slot
   *
   * Uses the published runtime. If no other slot is READY the caller keeps
   * running. Panics (NotPublished) when no runtime is published.
   */
  void gt_yield(void);

  /**
   * @brief Drive the scheduler until no slot is READY
   *
   * Must be called from slot 0.
   *
   * @param rt Runtime (must be the published one)
   * @return 0 once every task has finished
   *         InvalidArg: NULL rt or called from inside a task
   *         NotPublished: rt is not the published runtime
   */
  gt_err gt_run_until_idle(GtRuntime *rt);

  /**
   * @brief Run every task to completion, then exit(0)
   *
   * Never returns. Panics (NotPublished) if rt is not the published runtime.
   *
   * @param rt Runtime
   */
#ifdef __cplusplus
  [[noreturn]]
#endif
  void gt_run(GtRuntime *rt);

  /**
   * @brief Current slot id
   *
   * @return Slot id of the RUNNING slot in the published runtime,
   *         NotPublished if no runtime is published
   */
  int gt_self(void);

  /**
   * @brief Get slot information
   *
   * @param rt              Runtime
   * @param slot_id         Slot id
   * @param[out] state      Lifecycle state (can be NULL)
   * @param[out] generation Number of tasks spawned into the slot so far (can be NULL)
   * @return 0 on success, InvalidArg on NULL rt, InvalidSlot if out of range
   */
  gt_err gt_slot_get_info(const GtRuntime *rt, uint32_t slot_id, gt_slot_state_t *state,
                          uint32_t *generation);

#ifdef __cplusplus
} /* extern "C" */
#endif
