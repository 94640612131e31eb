#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <csignal>
#include <cstdio>
#include <string>

#include "child_process.h"
#include "doctest.h"
#include "gt/errors.h"
#include "gt/errors.hpp"
#include "gt/panic.hpp"
#include "gt/runtime_api.h"
#include "gt/task.h"

static void noop_task() {}

static void report_panic(void* user_data, const GtPanicInfo* info)
{
  printf("handler: tag=%s code=%d current=%u available=%u ready=%u running=%u\n",
         static_cast<const char*>(user_data), info->error_code, info->current_slot,
         info->available, info->ready, info->running);
  fflush(stdout);
}

/* ========================================================================= */
/* Child-side bodies                                                         */
/* ========================================================================= */

static void pool_full_body()
{
  GtConfig cfg = {3, 64 * 1024, nullptr};
  GtRuntime* rt = gt_runtime_create(&cfg);
  gt_runtime_publish(rt);
  gt::set_panic_handler(rt, report_panic, const_cast<char*>("full"));

  printf("spawned %d\n", gt_spawn(rt, noop_task));
  printf("spawned %d\n", gt_spawn(rt, noop_task));
  fflush(stdout);
  printf("spawned %d\n", gt_spawn(rt, noop_task));
}

static void yield_unpublished_body()
{
  printf("yielding\n");
  fflush(stdout);
  gt_yield();
  printf("returned\n");
}

static void task_yields_into_full_pool()
{
  // Spawning from inside a task hits the same capacity rule
  GtRuntime* rt = gt_runtime_published();
  gt_spawn(rt, noop_task);
}

static void spawn_from_task_body()
{
  GtConfig cfg = {2, 64 * 1024, nullptr};
  GtRuntime* rt = gt_runtime_create(&cfg);
  gt_runtime_publish(rt);
  gt::set_panic_handler(rt, report_panic, const_cast<char*>("task"));
  gt_spawn(rt, task_yields_into_full_pool);
  gt_run(rt);
}

static void recycled_slot_body()
{
  GtConfig cfg = {2, 64 * 1024, nullptr};
  GtRuntime* rt = gt_runtime_create(&cfg);
  gt_runtime_publish(rt);

  for (int round = 0; round < 3; round++)
  {
    printf("spawned %d\n", gt_spawn(rt, noop_task));
    gt_run_until_idle(rt);
  }
}

/* ========================================================================= */
/* Tests                                                                     */
/* ========================================================================= */

TEST_CASE("Error table")
{
  CHECK(GT_ERR_OK == 0);
  CHECK(GT_ERR_PoolFull == static_cast<int>(Err::PoolFull));
  CHECK(GT_ERR_NotPublished < 0);
  CHECK(std::string(err_str(Err::PoolFull)) == "no available slot in pool");
  CHECK(std::string(err_str(Err::TaskOverrun)) ==
        "task returned past its recycling trampoline");
  CHECK(std::string(err_str(static_cast<Err>(-1000))) == "unknown error");
}

TEST_CASE("Panic handler on NULL runtime is ignored")
{
  gt_set_panic_handler(nullptr, report_panic, nullptr);
}

TEST_CASE("Spawning into a full pool aborts")
{
  ChildResult r = run_in_child(pool_full_body);
  CHECK(r.signaled);
  CHECK(r.term_signal == SIGABRT);

  CHECK(r.output.find("spawned 1\nspawned 2\n") == 0);
  CHECK(r.output.find("spawned -") == std::string::npos);
  CHECK(r.output.find("========== GT PANIC ==========") != std::string::npos);
  CHECK(r.output.find("Error: no available slot in pool (code=-2)") != std::string::npos);

  // Checked before any slot was touched: both tasks still READY
  CHECK(r.output.find("handler: tag=full code=-2 current=0 available=0 ready=2 running=1") !=
        std::string::npos);
}

TEST_CASE("Spawning from a task into a full pool aborts")
{
  ChildResult r = run_in_child(spawn_from_task_body);
  CHECK(r.signaled);
  CHECK(r.term_signal == SIGABRT);
  CHECK(r.output.find("handler: tag=task code=-2 current=1 available=0 ready=1 running=1") !=
        std::string::npos);
}

TEST_CASE("Yield before publish aborts")
{
  ChildResult r = run_in_child(yield_unpublished_body);
  CHECK(r.signaled);
  CHECK(r.term_signal == SIGABRT);
  CHECK(r.output.find("yielding\n") == 0);
  CHECK(r.output.find("runtime handle not published") != std::string::npos);
  CHECK(r.output.find("Runtime: <none>") != std::string::npos);
  CHECK(r.output.find("returned") == std::string::npos);
}

TEST_CASE("A recycled slot is not a capacity violation")
{
  ChildResult r = run_in_child(recycled_slot_body);
  CHECK(r.exited);
  CHECK(r.exit_code == 0);
  CHECK(r.output == "spawned 1\nspawned 1\nspawned 1\n");
}
