#pragma once
#include <stddef.h>
#include <stdint.h>

#include "gt/arena.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ------------------------------------------------------------------------- */
  /* Basic typedefs                                                            */
  /* ------------------------------------------------------------------------- */

  /** Error code type. 0 = OK, negative = error. */
  typedef int gt_err;

  /** Plain task body: no arguments, no captured state. */
  typedef void (*gt_task_fn)(void);

  /** Task body carrying its own state (see gt_spawn_closure). */
  typedef void (*gt_entry_fn)(void *arg);

  /** Releases the state handed to gt_spawn_closure once the task is done. */
  typedef void (*gt_release_fn)(void *arg);

  /* ------------------------------------------------------------------------- */
  /* Limits and defaults                                                       */
  /* ------------------------------------------------------------------------- */

#define GT_DEFAULT_POOL_SIZE 4u
#define GT_MAX_POOL_SIZE 64u
#define GT_DEFAULT_STACK_SIZE (2u * 1024u * 1024u)
#define GT_MIN_STACK_SIZE (8u * 1024u)

  /* ------------------------------------------------------------------------- */
  /* Runtime configuration                                                     */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Configuration used when creating a runtime.
   *
   * The pool is fixed at creation: pool_size slots, slot 0 standing for the
   * caller's own thread of execution and slots 1..pool_size-1 each owning a
   * stack of stack_size bytes.
   */
  typedef struct GtConfig
  {
    uint32_t pool_size; /**< Slots including slot 0 (0 = GT_DEFAULT_POOL_SIZE) */
    size_t stack_size;  /**< Bytes per slot stack (0 = GT_DEFAULT_STACK_SIZE) */
    GtArena *arena;     /**< Optional arena for slot stacks (NULL = use malloc) */
  } GtConfig;

  /**
   * @brief Counters kept by the scheduler.
   */
  typedef struct GtRuntimeStats
  {
    uint32_t pool_size;        /**< Number of slots */
    uint64_t context_switches; /**< Completed calls into gt_context_switch */
    uint64_t spawned;          /**< Tasks spawned over the runtime's lifetime */
    uint64_t completed;        /**< Tasks that returned and were recycled */
  } GtRuntimeStats;

  /* Forward declaration for the opaque runtime. */
  struct GtRuntime;
  typedef struct GtRuntime GtRuntime;

  /* ------------------------------------------------------------------------- */
  /* Lifecycle                                                                 */
  /* ------------------------------------------------------------------------- */

  /**
   * @brief Library version.
   */
  int gt_version(void);

  /**
   * @brief Create a runtime with a fixed slot pool.
   *
   * Slot 0 is marked RUNNING and represents the calling thread. Every other
   * slot starts AVAILABLE with its own stack.
   *
   * @param cfg  Configuration (NULL = all defaults)
   * @return New runtime, or NULL on invalid configuration or allocation failure
   */
  GtRuntime *gt_runtime_create(const GtConfig *cfg);

  /**
   * @brief Destroy a runtime and release its stacks.
   *
   * Withdraws the process-wide handle if it refers to @p rt. Must be called
   * from slot 0; tasks still READY are discarded without running.
   *
   * @param rt  Runtime to destroy (NULL-safe)
   * @return 0 on success, InvalidArg if called from inside a task
   */
  gt_err gt_runtime_destroy(GtRuntime *rt);

  /**
   * @brief Publish @p rt as the process-wide runtime.
   *
   * Task bodies reach the scheduler only through this handle, so it must be
   * published before the first gt_yield() or gt_run(). One runtime at a time.
   *
   * @param rt  Runtime to publish
   * @return 0 on success, AlreadyPublished if any runtime is published
   */
  gt_err gt_runtime_publish(GtRuntime *rt);

  /**
   * @brief The published runtime, or NULL.
   */
  GtRuntime *gt_runtime_published(void);

  /**
   * @brief Read scheduler counters.
   *
   * @param rt         Runtime
   * @param[out] stats Counter snapshot
   * @return 0 on success, InvalidArg on NULL
   */
  gt_err gt_runtime_stats(const GtRuntime *rt, GtRuntimeStats *stats);

  /**
   * @brief Print the slot table to stdout.
   */
  void gt_runtime_dump(const GtRuntime *rt);

#ifdef __cplusplus
} /* extern "C" */
#endif
