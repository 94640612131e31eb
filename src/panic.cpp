#include "gt/panic.h"

#include <inttypes.h>
#include <stdio.h>
#include <stdlib.h>

#include "gt/errors.hpp"
#include "gt/internal/runtime.h"
#include "gt/panic.hpp"

static const char *state_name(gt_slot_state_t state)
{
  switch (state)
  {
    case GT_SLOT_AVAILABLE:
      return "AVAILABLE";
    case GT_SLOT_READY:
      return "READY";
    case GT_SLOT_RUNNING:
      return "RUNNING";
    default:
      return "?";
  }
}

extern "C"
{
  void gt_set_panic_handler(GtRuntime *rt, GtPanicHandler handler, void *user_data)
  {
    if (!rt)
      return;

    rt->panic_handler = handler;
    rt->panic_user_data = user_data;
  }

  void gt_runtime_dump(const GtRuntime *rt)
  {
    if (!rt)
    {
      printf("Runtime: <none>\n");
      return;
    }

    printf("Runtime: %" PRIu32 " slots, current=%" PRIu32 ", switches=%" PRIu64 "\n",
           rt->pool_size, rt->current, rt->context_switches);
    for (uint32_t i = 0; i < rt->pool_size; i++)
    {
      const GtSlot *slot = &rt->slots[i];
      printf("  [%" PRIu32 "] %-9s gen=%" PRIu32 " runs=%" PRIu32 " rsp=0x%016" PRIx64 "\n",
             slot->id, state_name(slot->state), slot->generation, slot->exec_count,
             slot->ctx.rsp);
    }
  }

  void gt_panic(const GtRuntime *rt, gt_err error_code)
  {
    using namespace gt;

    // Collect panic information
    PanicInfo info = {};
    info.error_code = error_code;
    if (rt)
    {
      info.current_slot = rt->current;
      info.pool_size = rt->pool_size;
      info.context_switches = rt->context_switches;
      for (uint32_t i = 0; i < rt->pool_size; i++)
      {
        switch (rt->slots[i].state)
        {
          case GT_SLOT_AVAILABLE:
            info.available++;
            break;
          case GT_SLOT_READY:
            info.ready++;
            break;
          case GT_SLOT_RUNNING:
            info.running++;
            break;
        }
      }
    }

    printf("\n");
    printf("========== GT PANIC ==========\n");

    Err err = static_cast<Err>(error_code);
    printf("Error: %s (code=%d)\n", err_str(err), error_code);

    if (rt)
    {
      printf("Slots: available=%" PRIu32 " ready=%" PRIu32 " running=%" PRIu32 "\n",
             info.available, info.ready, info.running);
      gt_runtime_dump(rt);
    }
    else
    {
      printf("Runtime: <none>\n");
    }

    printf("==============================\n");
    printf("\n");
    fflush(stdout);

    if (rt && rt->panic_handler)
    {
      rt->panic_handler(rt->panic_user_data, &info);
    }

    abort();
  }

}  // extern "C"
