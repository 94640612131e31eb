#include "gt/arena.h"

extern "C" void gt_arena_init(GtArena* arena, uint8_t* buffer, size_t size)
{
  if (!arena)
    return;

  arena->buffer = buffer;
  arena->size = buffer ? size : 0;
  arena->used = 0;
}

extern "C" void* gt_arena_alloc(GtArena* arena, size_t bytes, size_t align)
{
  if (!arena || !arena->buffer || bytes == 0)
    return nullptr;

  if (align == 0 || (align & (align - 1)) != 0)
    return nullptr;

  // Align the absolute address, not the offset: the buffer itself may be
  // less aligned than the request.
  uintptr_t base = reinterpret_cast<uintptr_t>(arena->buffer);
  uintptr_t cursor = base + arena->used;
  uintptr_t aligned = (cursor + align - 1) & ~(static_cast<uintptr_t>(align) - 1);
  size_t offset = static_cast<size_t>(aligned - base);

  if (offset > arena->size || bytes > arena->size - offset)
    return nullptr;

  arena->used = offset + bytes;
  return arena->buffer + offset;
}

extern "C" void gt_arena_reset(GtArena* arena)
{
  if (!arena)
    return;

  arena->used = 0;
}

extern "C" size_t gt_arena_used(const GtArena* arena)
{
  return arena ? arena->used : 0;
}

extern "C" size_t gt_arena_available(const GtArena* arena)
{
  if (!arena)
    return 0;

  return arena->size - arena->used;
}
