#pragma once
#include <stddef.h>
#include <stdint.h>

#include "gt/runtime_api.h"

#ifdef __cplusplus
extern "C"
{
#endif

  /* ========================================================================= */
  /* Context Switch Layer (x86-64 System V)                                    */
  /* ========================================================================= */
  /**
   * Everything here is architecture specific. The scheduler only relies on
   * the three entry points below and on the frame contract of
   * gt_context_prepare().
   */

  /**
   * @brief Register snapshot of a paused computation
   *
   * Stack pointer plus the six callee-saved general registers. The layout is
   * fixed: gt_context_switch addresses the fields by offset.
   */
  typedef struct GtContext
  {
    uint64_t rsp; /**< 0x00 */
    uint64_t r15; /**< 0x08 */
    uint64_t r14; /**< 0x10 */
    uint64_t r13; /**< 0x18 */
    uint64_t r12; /**< 0x20 */
    uint64_t rbx; /**< 0x28 */
    uint64_t rbp; /**< 0x30 */
  } GtContext;

  /** Stack pointer alignment required by the ABI at a call site. */
#define GT_STACK_ALIGN 16u

  /** Words written by gt_context_prepare() below the aligned stack top. */
#define GT_CONTEXT_FRAME_WORDS 3u

  /**
   * @brief Save the running context into @p from, resume @p to
   *
   * Stores rsp and the callee-saved registers into @p from, loads the same set
   * from @p to, then executes `ret` on the restored stack. For a fresh frame
   * that lands on the task entry; for a paused context it lands just after
   * the gt_context_switch() call that paused it.
   *
   * Caller-saved registers are not preserved; the C calling convention
   * already treats them as clobbered across this call.
   *
   * @param from Snapshot of the outgoing context (written)
   * @param to   Snapshot of the incoming context (read)
   */
  void gt_context_switch(GtContext *from, const GtContext *to);

  /**
   * @brief Launch bridge: a bare `ret`
   *
   * Sits between the task entry and the return trampoline in a fresh frame.
   * When the task returns here, the `ret` pops the trampoline address.
   * Never call it directly.
   */
  void gt_context_skip(void);

  /**
   * @brief Lay out the first frame of a task
   *
   * Aligns the top of @p stack down to GT_STACK_ALIGN and writes, from high
   * to low address:
   *
   *   top - 16: on_return   (reached when the task returns through skip)
   *   top - 24: gt_context_skip
   *   top - 32: entry       (popped by gt_context_switch's ret)
   *
   * and points ctx->rsp at top - 32. No other snapshot field is touched.
   * On entry the task sees rsp == 8 (mod 16), as after a normal call.
   *
   * @param ctx       Snapshot receiving the initial stack pointer
   * @param stack     Lowest address of the stack buffer
   * @param size      Stack buffer size in bytes
   * @param entry     First code to run
   * @param on_return Code reached when entry returns; must not return itself
   * @return 0 on success, InvalidArg on NULL pointers, StackTooSmall if the
   *         frame does not fit
   */
  gt_err gt_context_prepare(GtContext *ctx, void *stack, size_t size, void (*entry)(void),
                            void (*on_return)(void));

#ifdef __cplusplus
} /* extern "C" */
#endif
