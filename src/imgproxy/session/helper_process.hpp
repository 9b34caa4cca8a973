/* Flow-IPC: Image proxy
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#pragma once

#include "imgproxy/session/app.hpp"
#include "imgproxy/util/owned_native_handle.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <optional>

namespace imgproxy::session
{

// Types.

/**
 * A running (or exited but not yet reaped) helper process, spawned per a Helper_app with one end of a channel
 * bound to its Helper_app::m_socket_fd_slot.  The constructor spawns; wait_exit() (or else the destructor) reaps.
 *
 * ### Spawning ###
 * The ctor `fork()`s; the child `dup2()`s the given channel end into the slot (which also clears its close-on-exec
 * flag there) and `exec`s helper_command_line().  The parent learns of `exec()` failure synchronously, via a
 * close-on-exec status pipe on which the child reports `errno` only if `exec()` fails; in that case the ctor reaps
 * the child and emits the system error (such as `ENOENT`).  In any case the parent's copy of the channel end is
 * closed before the ctor returns.
 *
 * ### Reaping ###
 * wait_exit() blocks until the process exits and translates its status: exit code 0 is success; any other exit code
 * yields error::Code::S_HELPER_EXITED_ABNORMALLY; death by signal yields error::Code::S_HELPER_TERMINATED_BY_SIGNAL.
 * The destructor, if wait_exit() was never called, does the same and logs the outcome; so no zombie outlives
 * `*this`.  The destructor does *not* kill the helper: the caller must first give it a reason to exit (such as
 * closing the channel, or sending it a shutdown request), else the destructor blocks.
 *
 * ### Thread safety ###
 * A given object is not safe for concurrent use.
 */
class Helper_process :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Spawns the helper.  On error `*this` is in a "no process" state, in which wait_exit() returns `false`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param helper_app
   *        Helper description.  Copied.
   * @param image_ref
   *        Image reference for the helper's command line.
   * @param channel_end
   *        The helper's end of the channel.  Closed (in this process) by the time the ctor returns, error or not.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes from `fork()`, `pipe2()`, or `exec()` in the child (e.g., `ENOENT`, `EACCES`).
   */
  explicit Helper_process(flow::log::Logger* logger_ptr, const Helper_app& helper_app, util::String_view image_ref,
                          util::Owned_native_handle&& channel_end, Error_code* err_code = 0);

  /// Reaps the process if wait_exit() has not done so, logging its exit status.  Blocks until it exits.
  ~Helper_process();

  // Methods.

  /**
   * Blocks until the process exits; reaps it; reports how it exited.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_HELPER_EXITED_ABNORMALLY, error::Code::S_HELPER_TERMINATED_BY_SIGNAL,
   *        system codes from `waitpid()`.
   * @return `false` if there is no process to reap (spawn failed, or already reaped); `*err_code` untouched.
   *         Else `true`.
   */
  bool wait_exit(Error_code* err_code = 0);

  /**
   * The process ID; or 0 if spawning failed.  Remains valid after reaping, for logging.
   * @return See above.
   */
  process_id_t pid() const;

  /**
   * The exit code, if the process has been reaped and exited normally; else `nullopt`.
   * @return See above.
   */
  std::optional<int> exit_code() const;

  /**
   * The signal that killed the process, if it has been reaped and died that way; else `nullopt`.
   * @return See above.
   */
  std::optional<int> exit_signal() const;

  /**
   * The helper description.
   * @return See above.
   */
  const Helper_app& helper_app() const;

private:
  // Data.

  /// See helper_app().
  const Helper_app m_helper_app;

  /// See pid().
  process_id_t m_pid;

  /// Whether #m_pid has been reaped (or never existed).
  bool m_reaped;

  /// See exit_code().
  std::optional<int> m_exit_code;

  /// See exit_signal().
  std::optional<int> m_exit_signal;
}; // class Helper_process

} // namespace imgproxy::session
