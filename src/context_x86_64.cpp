#include <cstddef>
#include <cstdint>

#include "gt/context.h"
#include "gt/errors.hpp"

#if !defined(__x86_64__)
#error "gt context switching supports x86-64 only"
#endif

/*
  x86-64 System V:

  arguments: %rdi, %rsi, %rdx, %rcx, %r8, %r9
  callee-saved: %rbp, %rbx, %r12, %r13, %r14, %r15, %rsp

  gt_context_switch(%rdi = from, %rsi = to). The return address pushed by
  the caller's `call` is on top of the stack when %rsp is saved, so the
  final `ret` on a resumed stack returns into that caller.

  GtContext offsets: rsp 0x00, r15 0x08, r14 0x10, r13 0x18, r12 0x20,
  rbx 0x28, rbp 0x30.
*/

asm(R"(.text
	.p2align 4
	.globl gt_context_switch
	.type gt_context_switch,@function
gt_context_switch:
	movq %rsp, 0x00(%rdi)
	movq %r15, 0x08(%rdi)
	movq %r14, 0x10(%rdi)
	movq %r13, 0x18(%rdi)
	movq %r12, 0x20(%rdi)
	movq %rbx, 0x28(%rdi)
	movq %rbp, 0x30(%rdi)

	movq 0x00(%rsi), %rsp
	movq 0x08(%rsi), %r15
	movq 0x10(%rsi), %r14
	movq 0x18(%rsi), %r13
	movq 0x20(%rsi), %r12
	movq 0x28(%rsi), %rbx
	movq 0x30(%rsi), %rbp

	ret
	.size gt_context_switch, .-gt_context_switch

	.p2align 4
	.globl gt_context_skip
	.type gt_context_skip,@function
gt_context_skip:
	ret
	.size gt_context_skip, .-gt_context_skip
)");

static_assert(offsetof(GtContext, rsp) == 0x00, "rsp offset");
static_assert(offsetof(GtContext, r15) == 0x08, "r15 offset");
static_assert(offsetof(GtContext, r12) == 0x20, "r12 offset");
static_assert(offsetof(GtContext, rbp) == 0x30, "rbp offset");
static_assert(sizeof(GtContext) == 7 * sizeof(uint64_t), "GtContext layout");

// Size of a machine word.
static constexpr size_t mword_size = sizeof(uintptr_t);

extern "C" gt_err gt_context_prepare(GtContext *ctx, void *stack, size_t size,
                                     void (*entry)(void), void (*on_return)(void))
{
  if (!ctx || !stack || !entry || !on_return)
    return GT_ERR(InvalidArg);

  uintptr_t base = reinterpret_cast<uintptr_t>(stack);
  uintptr_t top = (base + size) & ~static_cast<uintptr_t>(GT_STACK_ALIGN - 1);

  // Alignment slack, the unused word at top - 8, and the three frame words.
  if (top < base || top - base < (GT_CONTEXT_FRAME_WORDS + 1) * mword_size)
    return GT_ERR(StackTooSmall);

  auto *sp = reinterpret_cast<uintptr_t *>(top);
  sp[-2] = reinterpret_cast<uintptr_t>(on_return);
  sp[-3] = reinterpret_cast<uintptr_t>(gt_context_skip);
  sp[-4] = reinterpret_cast<uintptr_t>(entry);

  ctx->rsp = static_cast<uint64_t>(reinterpret_cast<uintptr_t>(sp - 4));

  return GT_ERR(OK);
}
