#include "child_process.h"

#include <cerrno>
#include <cstdio>
#include <cstdlib>

#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

ChildResult run_in_child(void (*body)())
{
  ChildResult result = {false, -1, false, 0, std::string()};

  int fds[2];
  if (pipe(fds) != 0)
  {
    perror("pipe");
    return result;
  }

  // Keep buffered parent output from being duplicated into the child
  fflush(stdout);
  fflush(stderr);

  pid_t pid = fork();
  if (pid < 0)
  {
    perror("fork");
    close(fds[0]);
    close(fds[1]);
    return result;
  }

  if (pid == 0)
  {
    // No core files from expected aborts
    struct rlimit no_core = {0, 0};
    setrlimit(RLIMIT_CORE, &no_core);

    close(fds[0]);
    if (dup2(fds[1], STDOUT_FILENO) < 0)
      _exit(127);
    close(fds[1]);

    body();

    fflush(stdout);
    _exit(0);
  }

  close(fds[1]);

  char buf[512];
  for (;;)
  {
    ssize_t n = read(fds[0], buf, sizeof(buf));
    if (n > 0)
    {
      result.output.append(buf, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    break;
  }
  close(fds[0]);

  int status = 0;
  while (waitpid(pid, &status, 0) < 0)
  {
    if (errno != EINTR)
      return result;
  }

  if (WIFEXITED(status))
  {
    result.exited = true;
    result.exit_code = WEXITSTATUS(status);
  }
  else if (WIFSIGNALED(status))
  {
    result.signaled = true;
    result.term_signal = WTERMSIG(status);
  }

  return result;
}
