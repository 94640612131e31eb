// Two cooperative tasks counting side by side on a 4-slot pool.
#include <cstdio>

#include "gt/errors.h"
#include "gt/runtime_api.h"
#include "gt/runtime_api.hpp"
#include "gt/task.h"

static void count_to(int id, int limit)
{
  printf("THREAD %d STARTING\n", id);
  for (int i = 0; i < limit; i++)
  {
    printf("thread: %d counter: %d\n", id, i);
    gt::yield();
  }
  printf("THREAD %d FINISHED\n", id);
}

int main()
{
  gt::Config cfg = {4, GT_DEFAULT_STACK_SIZE, nullptr};
  gt::Runtime *rt = gt_runtime_create(&cfg);
  if (!rt)
  {
    fprintf(stderr, "gt_runtime_create failed\n");
    return 1;
  }
  if (gt_runtime_publish(rt) != GT_ERR_OK)
  {
    fprintf(stderr, "gt_runtime_publish failed\n");
    return 1;
  }

  if (gt::spawn(rt, [] { count_to(1, 10); }) < 0 || gt::spawn(rt, [] { count_to(2, 15); }) < 0)
  {
    fprintf(stderr, "gt::spawn failed\n");
    return 1;
  }

  gt_run(rt);
}
