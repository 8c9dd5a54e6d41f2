/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "syscall_filter/spawn_probe.hpp"

#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>

namespace execlock::syscall_filter {

  namespace {
    bool isDenial(int err) {
      return err == EACCES or err == EPERM;
    }

    pid_t forkProcess() {
#if defined(__linux__) && defined(SYS_fork)
      // glibc fork() is implemented with clone, which the filter lets through
      return static_cast<pid_t>(::syscall(SYS_fork));
#else
      return ::fork();
#endif
    }
  }  // namespace

  SpawnProbeResult probeProcessSpawning() {
    SpawnProbeResult result{
        .fork_denied = false, .fork_error = 0, .exec_denied = false};

    auto pid = forkProcess();
    if (pid == 0) {
      ::_exit(EXIT_SUCCESS);
    }
    if (pid == -1) {
      result.fork_error = errno;
      result.fork_denied = isDenial(result.fork_error);
    } else {
      int status = 0;
      while (::waitpid(pid, &status, 0) == -1 and errno == EINTR) {
      }
    }

    const char *path = "/nonexistent/execlock-probe";
    char *const argv[] = {const_cast<char *>(path), nullptr};
    char *const envp[] = {nullptr};
    ::execve(path, argv, envp);
    result.exec_error = errno;
    result.exec_denied = isDenial(result.exec_error);
    return result;
  }

}  // namespace execlock::syscall_filter
