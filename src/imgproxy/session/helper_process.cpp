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
#include "imgproxy/session/helper_process.hpp"
#include "imgproxy/session/error.hpp"
#include <flow/error/error.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/system/system_error.hpp>
#include <sys/wait.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstring>

namespace imgproxy::session
{

// Implementations.

Helper_process::Helper_process(flow::log::Logger* logger_ptr, const Helper_app& helper_app,
                               util::String_view image_ref, util::Owned_native_handle&& channel_end_moved,
                               Error_code* err_code) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_helper_app(helper_app),
  m_pid(0),
  m_reaped(true)
{
  using util::Owned_native_handle;
  using flow::error::Runtime_error;
  using boost::algorithm::join;
  using boost::system::system_category;
  using std::string;
  using std::vector;
  // using ::errno; // It's a macro apparently.

  // Take it over, so that it is closed in this process no matter how we exit.
  Owned_native_handle channel_end(std::move(channel_end_moved));

  /* Everything the child needs is prepared now: between fork() and exec() the child may only make
   * async-signal-safe calls (no allocation, no logging). */
  const auto argv_strs = helper_command_line(m_helper_app, image_ref);
  vector<char*> argv;
  for (const auto& arg : argv_strs)
  {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  const int slot = m_helper_app.m_socket_fd_slot;

  Error_code sys_err_code;

  FLOW_LOG_INFO("Helper process: Spawning [" << m_helper_app << "]; command line [" << join(argv_strs, " ") << "]; "
                "channel end [" << channel_end << "] to be bound to slot [" << slot << "].");

  // Reports exec() failure from child to us.  Write end vanishes on successful exec() (close-on-exec).
  int status_pipe[2];
  if (::pipe2(status_pipe, O_CLOEXEC) == -1)
  {
    sys_err_code = Error_code(errno, system_category());
    FLOW_ERROR_SYS_ERROR_LOG_WARNING();
  }
  else
  {
    Owned_native_handle status_rd(status_pipe[0]);
    Owned_native_handle status_wr(status_pipe[1]);

    const auto pid = ::fork();
    if (pid == -1)
    {
      sys_err_code = Error_code(errno, system_category());
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
    }
    else if (pid == 0)
    {
      // Child.  Async-signal-safe calls only.
      int rc;
      if (channel_end.native_handle() == slot)
      {
        // Already there; just let it survive exec().
        rc = ::fcntl(slot, F_SETFD, 0);
      }
      else
      {
        rc = ::dup2(channel_end.native_handle(), slot);
      }
      if (rc != -1)
      {
        ::execvp(argv[0], argv.data());
      }
      // Failed.
      const int exec_errno = errno;
      [[maybe_unused]] const auto n_written = ::write(status_wr.native_handle(), &exec_errno, sizeof(exec_errno));
      ::_exit(127);
    }
    else
    {
      // Parent.
      m_pid = pid;
      m_reaped = false;
      status_wr = Owned_native_handle(); // Else we'd never see EOF below.
      channel_end = Owned_native_handle();

      int exec_errno;
      ssize_t n_read;
      do
      {
        n_read = ::read(status_rd.native_handle(), &exec_errno, sizeof(exec_errno));
      }
      while ((n_read == -1) && (errno == EINTR));

      if (n_read == -1)
      {
        sys_err_code = Error_code(errno, system_category());
        FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      }
      else if (n_read == sizeof(exec_errno))
      {
        sys_err_code = Error_code(exec_errno, system_category());
        FLOW_LOG_WARNING("Helper process: Child [" << m_pid << "] could not execute [" << argv_strs.front() << "]: "
                         "[" << sys_err_code << "] [" << sys_err_code.message() << "].");
      }
      // else: 0 bytes (EOF): exec() succeeded.

      if (sys_err_code)
      {
        // The child is exiting (or exited) with 127 on its own, or will see its channel closed; reap it.
        Error_code ignored_exit_err_code;
        wait_exit(&ignored_exit_err_code);
        m_pid = 0;
      }
      else
      {
        FLOW_LOG_INFO("Helper process: Running as PID [" << m_pid << "].");
      }
    } // else if (pid != 0)
  } // if (pipe2() succeeded)

  if (err_code)
  {
    *err_code = sys_err_code;
  }
  else if (sys_err_code)
  {
    throw Runtime_error(sys_err_code, "Helper_process::Helper_process()");
  }
} // Helper_process::Helper_process()

Helper_process::~Helper_process()
{
  if (m_reaped)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Helper process [" << *this << "]: Destroying while not yet reaped; awaiting exit.");
  Error_code err_code;
  wait_exit(&err_code);
  if (err_code)
  {
    FLOW_LOG_WARNING("Helper process [" << *this << "]: Reaped in destructor: exit was not clean: "
                     "[" << err_code << "] [" << err_code.message() << "].");
  }
}

bool Helper_process::wait_exit(Error_code* err_code)
{
  using boost::system::system_category;
  // using ::errno; // It's a macro apparently.

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Helper_process::wait_exit, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_reaped)
  {
    FLOW_LOG_TRACE("Helper process [" << *this << "]: Asked to await exit, but nothing to reap.  Ignoring.");
    return false;
  }
  // else

  FLOW_LOG_TRACE("Helper process [" << *this << "]: Awaiting exit.");

  int status;
  process_id_t rc;
  do
  {
    rc = ::waitpid(m_pid, &status, 0);
  }
  while ((rc == -1) && (errno == EINTR));

  if (rc == -1)
  {
    // Only ECHILD is plausible; somebody else reaped it (SIGCHLD set to SIG_IGN?).  Nothing left to wait for.
    *err_code = Error_code(errno, system_category());
    m_reaped = true;
    FLOW_LOG_WARNING("Helper process [" << *this << "]: waitpid() failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return true;
  }
  // else

  m_reaped = true;
  if (WIFEXITED(status))
  {
    m_exit_code = WEXITSTATUS(status);
    if (*m_exit_code == 0)
    {
      err_code->clear();
      FLOW_LOG_INFO("Helper process [" << *this << "]: Exited cleanly.");
      return true;
    }
    // else
    *err_code = error::Code::S_HELPER_EXITED_ABNORMALLY;
  }
  else
  {
    // WIFSIGNALED(status) since we did not ask for stop/continue notifications.
    m_exit_signal = WTERMSIG(status);
    *err_code = error::Code::S_HELPER_TERMINATED_BY_SIGNAL;
  }

  FLOW_LOG_WARNING("Helper process [" << *this << "]: Exited abnormally: "
                   "[" << *err_code << "] [" << err_code->message() << "].");
  return true;
} // Helper_process::wait_exit()

process_id_t Helper_process::pid() const
{
  return m_pid;
}

std::optional<int> Helper_process::exit_code() const
{
  return m_exit_code;
}

std::optional<int> Helper_process::exit_signal() const
{
  return m_exit_signal;
}

const Helper_app& Helper_process::helper_app() const
{
  return m_helper_app;
}

std::ostream& operator<<(std::ostream& os, const Helper_process& val)
{
  os << "pid[" << val.pid() << "] exec[" << val.helper_app().m_exec_path.filename().string() << ']';
  if (val.exit_code())
  {
    os << " exit_code[" << *val.exit_code() << ']';
  }
  else if (val.exit_signal())
  {
    os << " signal[" << *val.exit_signal() << ']';
  }
  return os;
}

} // namespace imgproxy::session
