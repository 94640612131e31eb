#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

  /**
   * @file arena.h
   * @brief Bump allocator for slot stacks
   *
   * A runtime configured with an arena carves every slot stack out of one
   * caller-supplied buffer instead of calling malloc() per slot. Useful when
   * the pool must live in a static region or a pre-mapped block.
   *
   * - Allocation is O(1) with power-of-2 alignment
   * - Nothing is freed individually; gt_arena_reset() drops everything
   * - The arena never owns its buffer
   */

  /**
   * @brief Arena allocator state
   */
  typedef struct GtArena
  {
    uint8_t *buffer; /**< Managed buffer base pointer */
    size_t size;     /**< Total buffer size in bytes */
    size_t used;     /**< Bytes handed out so far (including alignment padding) */
  } GtArena;

  /**
   * @brief Attach an arena to a buffer
   *
   * @param arena  Arena to initialize
   * @param buffer Backing buffer (not owned)
   * @param size   Size of buffer in bytes
   */
  void gt_arena_init(GtArena *arena, uint8_t *buffer, size_t size);

  /**
   * @brief Allocate an aligned block
   *
   * @param arena Arena
   * @param bytes Block size in bytes (must be non-zero)
   * @param align Alignment, a power of 2
   * @return Block pointer, or NULL if the arena cannot satisfy the request
   */
  void *gt_arena_alloc(GtArena *arena, size_t bytes, size_t align);

  /**
   * @brief Drop every allocation. Memory contents are left as they are.
   */
  void gt_arena_reset(GtArena *arena);

  /** @brief Bytes consumed, alignment padding included. */
  size_t gt_arena_used(const GtArena *arena);

  /** @brief Bytes still available at the end of the buffer. */
  size_t gt_arena_available(const GtArena *arena);

#ifdef __cplusplus
}
#endif
