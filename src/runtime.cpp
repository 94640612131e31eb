#include <cstdlib>

#include "gt/errors.hpp"
#include "gt/internal/runtime.h"
#include "gt/runtime_api.h"

/* ========================================================================= */
/* Process-wide handle                                                       */
/* ========================================================================= */

// Written once by gt_runtime_publish() from slot 0, before any task runs.
// Only one slot executes at a time, so reads from task bodies need no
// synchronization.
static GtRuntime *published_runtime = nullptr;

/* ========================================================================= */
/* Stack storage                                                             */
/* ========================================================================= */

static uint8_t *alloc_stack(GtRuntime *rt)
{
  if (rt->arena)
    return static_cast<uint8_t *>(gt_arena_alloc(rt->arena, rt->stack_size, GT_STACK_ALIGN));

  return static_cast<uint8_t *>(malloc(rt->stack_size));
}

static void release_pool(GtRuntime *rt)
{
  if (!rt->slots)
    return;

  for (uint32_t i = 0; i < rt->pool_size; i++)
  {
    GtSlot *slot = &rt->slots[i];

    // Closure state of tasks that never finished
    if (slot->state != GT_SLOT_AVAILABLE && slot->release)
      slot->release(slot->arg);
    slot->release = nullptr;

    // Arena stacks are owned by the arena
    if (!rt->arena && slot->stack)
      free(slot->stack);
    slot->stack = nullptr;
  }

  free(rt->slots);
  rt->slots = nullptr;
}

/* ========================================================================= */
/* Lifecycle                                                                 */
/* ========================================================================= */

extern "C" int gt_version(void)
{
  return 1;
}

extern "C" GtRuntime *gt_runtime_create(const GtConfig *cfg)
{
  GtConfig defaults = {0, 0, nullptr};
  if (!cfg)
    cfg = &defaults;

  uint32_t pool_size = cfg->pool_size ? cfg->pool_size : GT_DEFAULT_POOL_SIZE;
  size_t stack_size = cfg->stack_size ? cfg->stack_size : GT_DEFAULT_STACK_SIZE;

  if (pool_size > GT_MAX_POOL_SIZE || stack_size < GT_MIN_STACK_SIZE)
    return nullptr;

  GtRuntime *rt = static_cast<GtRuntime *>(calloc(1, sizeof(GtRuntime)));
  if (!rt)
    return nullptr;

  rt->pool_size = pool_size;
  rt->stack_size = stack_size;
  rt->arena = cfg->arena;
  rt->current = 0;

  rt->slots = static_cast<GtSlot *>(calloc(pool_size, sizeof(GtSlot)));
  if (!rt->slots)
  {
    free(rt);
    return nullptr;
  }

  // Slot 0 is the thread calling us: already running on its own stack.
  rt->slots[0].id = 0;
  rt->slots[0].state = GT_SLOT_RUNNING;

  for (uint32_t i = 1; i < pool_size; i++)
  {
    GtSlot *slot = &rt->slots[i];
    slot->id = i;
    slot->state = GT_SLOT_AVAILABLE;
    slot->stack = alloc_stack(rt);
    if (!slot->stack)
    {
      release_pool(rt);
      free(rt);
      return nullptr;
    }
    slot->stack_size = stack_size;
  }

  return rt;
}

extern "C" gt_err gt_runtime_destroy(GtRuntime *rt)
{
  if (!rt)
    return GT_ERR(OK);

  // The stacks being freed may include the one we are running on
  if (rt->current != 0)
    return GT_ERR(InvalidArg);

  if (published_runtime == rt)
    published_runtime = nullptr;

  release_pool(rt);
  free(rt);

  return GT_ERR(OK);
}

extern "C" gt_err gt_runtime_publish(GtRuntime *rt)
{
  if (!rt)
    return GT_ERR(InvalidArg);

  if (published_runtime)
    return GT_ERR(AlreadyPublished);

  published_runtime = rt;
  return GT_ERR(OK);
}

extern "C" GtRuntime *gt_runtime_published(void)
{
  return published_runtime;
}

extern "C" gt_err gt_runtime_stats(const GtRuntime *rt, GtRuntimeStats *stats)
{
  if (!rt || !stats)
    return GT_ERR(InvalidArg);

  stats->pool_size = rt->pool_size;
  stats->context_switches = rt->context_switches;
  stats->spawned = rt->spawned;
  stats->completed = rt->completed;

  return GT_ERR(OK);
}
