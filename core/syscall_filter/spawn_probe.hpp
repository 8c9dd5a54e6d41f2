/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace execlock::syscall_filter {

  struct SpawnProbeResult {
    bool fork_denied;
    // errno of the denied fork, 0 if fork succeeded
    int fork_error;
    bool exec_denied;
    // errno of the failed exec
    int exec_error;

    bool spawningDenied() const {
      return fork_denied and exec_denied;
    }
  };

  /**
   * Checks whether the calling process can still fork and exec.
   *
   * On Linux the fork syscall itself is made rather than libc fork(), which
   * uses clone. A forked child exits at once and is reaped. Exec targets a
   * path that cannot exist, so an unrestricted process gets ENOENT and keeps
   * running.
   */
  SpawnProbeResult probeProcessSpawning();

}  // namespace execlock::syscall_filter
