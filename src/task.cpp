#include "gt/task.h"

#include <cstdio>
#include <cstdlib>

#include "gt/context.h"
#include "gt/errors.hpp"
#include "gt/internal/runtime.h"
#include "gt/internal/scheduler.hpp"
#include "gt/panic.h"

/* ========================================================================= */
/* Task Management API                                                       */
/* ========================================================================= */

static int spawn_into_pool(GtRuntime *rt, void (*entry_word)(void), gt_entry_fn entry,
                           void *arg, gt_release_fn release)
{
  // Find an AVAILABLE slot (slot 0 never is)
  GtSlot *slot = nullptr;
  for (uint32_t i = 1; i < rt->pool_size; i++)
  {
    if (rt->slots[i].state == GT_SLOT_AVAILABLE)
    {
      slot = &rt->slots[i];
      break;
    }
  }

  // Fixed capacity, no queueing. Nothing has been touched yet.
  if (!slot)
    gt_panic(rt, GT_ERR(PoolFull));

  gt_err err = gt_context_prepare(&slot->ctx, slot->stack, slot->stack_size, entry_word,
                                  gt_task_return_trampoline);
  if (err != GT_ERR(OK))
    return err;

  slot->entry = entry;
  slot->arg = arg;
  slot->release = release;
  slot->generation++;
  slot->state = GT_SLOT_READY;

  rt->spawned++;

  return static_cast<int>(slot->id);
}

extern "C" int gt_spawn(GtRuntime *rt, gt_task_fn fn)
{
  if (!rt || !fn)
    return GT_ERR(InvalidArg);

  return spawn_into_pool(rt, fn, nullptr, nullptr, nullptr);
}

extern "C" int gt_spawn_closure(GtRuntime *rt, gt_entry_fn entry, void *arg,
                                gt_release_fn release)
{
  if (!rt || !entry)
    return GT_ERR(InvalidArg);

  return spawn_into_pool(rt, gt_task_closure_launch, entry, arg, release);
}

extern "C" void gt_yield(void)
{
  GtRuntime *rt = gt_runtime_published();
  if (!rt)
    gt_panic(nullptr, GT_ERR(NotPublished));

  gt_reschedule(rt);
}

extern "C" gt_err gt_run_until_idle(GtRuntime *rt)
{
  if (!rt)
    return GT_ERR(InvalidArg);

  if (gt_runtime_published() != rt)
    return GT_ERR(NotPublished);

  if (rt->current != 0)
    return GT_ERR(InvalidArg);

  // Every task that returns hands control onward through gt_recycle, so the
  // loop only wakes up when slot 0 is selected again.
  while (gt_reschedule(rt))
  {
  }

  return GT_ERR(OK);
}

extern "C" void gt_run(GtRuntime *rt)
{
  gt_err err = gt_run_until_idle(rt);
  if (err != GT_ERR(OK))
    gt_panic(rt, err);

  fflush(stdout);
  exit(0);
}

extern "C" int gt_self(void)
{
  GtRuntime *rt = gt_runtime_published();
  if (!rt)
    return GT_ERR(NotPublished);

  return static_cast<int>(rt->current);
}

extern "C" gt_err gt_slot_get_info(const GtRuntime *rt, uint32_t slot_id,
                                   gt_slot_state_t *state, uint32_t *generation)
{
  if (!rt)
    return GT_ERR(InvalidArg);

  if (slot_id >= rt->pool_size)
    return GT_ERR(InvalidSlot);

  const GtSlot *slot = &rt->slots[slot_id];
  if (state)
    *state = slot->state;
  if (generation)
    *generation = slot->generation;

  return GT_ERR(OK);
}
