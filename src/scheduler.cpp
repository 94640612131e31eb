#include "gt/internal/scheduler.hpp"

#include "gt/context.h"
#include "gt/errors.hpp"
#include "gt/internal/runtime.h"
#include "gt/panic.h"

/* ========================================================================= */
/* Scheduler Core Implementation                                             */
/* ========================================================================= */

extern "C" int gt_select_next(const GtRuntime *rt)
{
  if (!rt)
    return -1;

  // Strict round-robin by slot index, starting just past the current slot
  for (uint32_t step = 1; step < rt->pool_size; step++)
  {
    uint32_t pos = (rt->current + step) % rt->pool_size;
    if (rt->slots[pos].state == GT_SLOT_READY)
      return static_cast<int>(pos);
  }

  return -1;
}

extern "C" int gt_reschedule(GtRuntime *rt)
{
  int next_id = gt_select_next(rt);
  if (next_id < 0)
    return 0;  // Nothing else to run; caller keeps the CPU

  GtSlot *prev = &rt->slots[rt->current];
  GtSlot *next = &rt->slots[next_id];

  // A slot that just finished stays AVAILABLE
  if (prev->state != GT_SLOT_AVAILABLE)
    prev->state = GT_SLOT_READY;

  next->state = GT_SLOT_RUNNING;
  next->exec_count++;

  rt->current = static_cast<uint32_t>(next_id);
  rt->context_switches++;

  gt_context_switch(&prev->ctx, &next->ctx);

  // Back on prev's stack: some other slot rescheduled us
  return 1;
}

extern "C" void gt_recycle(GtRuntime *rt)
{
  if (!rt || rt->current == 0)
    return;

  GtSlot *slot = &rt->slots[rt->current];

  gt_release_fn release = slot->release;
  void *arg = slot->arg;
  slot->entry = nullptr;
  slot->arg = nullptr;
  slot->release = nullptr;
  if (release)
    release(arg);

  slot->state = GT_SLOT_AVAILABLE;
  rt->completed++;

  // Slot 0 is never AVAILABLE and is READY while any task runs, so this
  // always switches away.
  gt_reschedule(rt);
}

/* ========================================================================= */
/* Trampolines                                                               */
/* ========================================================================= */

extern "C" void gt_task_return_trampoline(void)
{
  GtRuntime *rt = gt_runtime_published();
  if (!rt)
    gt_panic(nullptr, GT_ERR(NotPublished));

  gt_recycle(rt);

  // An AVAILABLE slot is only ever re-entered through a fresh frame
  gt_panic(rt, GT_ERR(TaskOverrun));
}

extern "C" void gt_task_closure_launch(void)
{
  GtRuntime *rt = gt_runtime_published();
  if (!rt)
    gt_panic(nullptr, GT_ERR(NotPublished));

  GtSlot *slot = &rt->slots[rt->current];
  slot->entry(slot->arg);
}
