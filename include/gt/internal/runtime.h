#pragma once
#include <stdint.h>

#include "gt/context.h"
#include "gt/panic.h"
#include "gt/runtime_api.h"
#include "gt/task.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @brief One entry of the fixed slot pool.
   *
   * The stack buffer belongs to the slot for the runtime's whole lifetime and
   * is reused, not reallocated, by every spawn into the slot.
   */
  typedef struct GtSlot
  {
    uint32_t id;           /**< Index in the pool */
    gt_slot_state_t state; /**< Lifecycle state */
    uint8_t *stack;        /**< Stack buffer (NULL for slot 0) */
    size_t stack_size;     /**< Stack buffer size in bytes */
    GtContext ctx;         /**< Register snapshot while not RUNNING */

    /* Task bound to the slot (closure spawns only) */
    gt_entry_fn entry;
    void *arg;
    gt_release_fn release;

    uint32_t generation; /**< Spawns into this slot so far */
    uint32_t exec_count; /**< Times the slot was switched in */
  } GtSlot;

  /**
   * @brief Internal runtime structure (not part of the public API).
   *        Visible only for unit tests or tightly coupled components.
   */
  struct GtRuntime
  {
    GtSlot *slots;      /**< Fixed pool, slots[0] is the creating thread */
    uint32_t pool_size; /**< Number of slots */
    uint32_t current;   /**< Index of the RUNNING slot */

    size_t stack_size; /**< Stack bytes per slot */
    GtArena *arena;    /**< Stack source (NULL = malloc) */

    /* Statistics */
    uint64_t context_switches;
    uint64_t spawned;
    uint64_t completed;

    /* Panic handling */
    GtPanicHandler panic_handler;
    void *panic_user_data;
  };

#ifdef __cplusplus
} /* extern "C" */
#endif
