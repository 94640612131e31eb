#pragma once
#include <stdint.h>

#include "gt/runtime_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief Runtime panic diagnostic information
   *
   * Collected by gt_panic() right before the process is aborted.
   */
  typedef struct GtPanicInfo
  {
    int32_t error_code;        /**< Error code (Err enumeration value) */
    uint32_t current_slot;     /**< Slot RUNNING when the panic was raised */
    uint32_t pool_size;        /**< Number of slots (0 when no runtime is known) */
    uint32_t available;        /**< Slots in AVAILABLE */
    uint32_t ready;            /**< Slots in READY */
    uint32_t running;          /**< Slots in RUNNING */
    uint64_t context_switches; /**< Switch counter at panic time */
  } GtPanicInfo;

  /**
   * @brief Panic handler callback type
   *
   * Called once, after the diagnostic report and before abort(). The handler
   * may log or flush, but the process is terminated when it returns.
   *
   * @param user_data  User data pointer passed to gt_set_panic_handler
   * @param info       Panic diagnostic information
   */
  typedef void (*GtPanicHandler)(void *user_data, const GtPanicInfo *info);

  /**
   * @brief Set custom panic handler
   *
   * @param rt         Runtime
   * @param handler    Panic handler callback (NULL to disable)
   * @param user_data  User data passed to handler
   */
  void gt_set_panic_handler(GtRuntime *rt, GtPanicHandler handler, void *user_data);

  /**
   * @brief Report a fatal runtime error and abort
   *
   * Prints the diagnostic block to stdout, calls the runtime's panic handler
   * if one is set, then aborts the process.
   *
   * @param rt          Runtime (can be NULL when none is reachable)
   * @param error_code  Err value describing the failure
   */
#ifdef __cplusplus
  [[noreturn]]
#endif
  void gt_panic(const GtRuntime *rt, gt_err error_code);

#ifdef __cplusplus
}
#endif
