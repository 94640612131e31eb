#pragma once
#include "gt/internal/runtime.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Scheduler Internal API                                                   */
  /* ========================================================================= */

  /**
   * @brief Select the next READY slot
   *
   * Circular scan starting just past the current slot. The current slot
   * itself is never selected.
   *
   * @param rt Runtime
   * @return Slot index, or -1 if no other slot is READY
   */
  int gt_select_next(const GtRuntime *rt);

  /**
   * @brief Switch to the next READY slot
   *
   * Demotes the current slot to READY (unless it is already AVAILABLE),
   * promotes the selected slot to RUNNING, makes it current and switches
   * contexts. Returns when the calling slot is scheduled again.
   *
   * @param rt Runtime
   * @return 1 if a READY slot was found and switched to,
   *         0 if none was found (no state change, no switch)
   */
  int gt_reschedule(GtRuntime *rt);

  /**
   * @brief Retire the current slot and reschedule
   *
   * Called from the return trampoline when a task body returns. Releases the
   * slot's closure state, marks it AVAILABLE and switches away. No-op for
   * slot 0.
   *
   * @param rt Runtime
   */
  void gt_recycle(GtRuntime *rt);

  /**
   * @brief Return trampoline placed in every fresh frame
   *
   * Reached by `ret` from gt_context_skip when a task body returns. Recycles
   * the slot through the published runtime. Never returns.
   */
  void gt_task_return_trampoline(void);

  /**
   * @brief Entry word used for closure spawns
   *
   * Runs entry(arg) of the current slot of the published runtime.
   */
  void gt_task_closure_launch(void);

#ifdef __cplusplus
} /* extern "C" */
#endif
