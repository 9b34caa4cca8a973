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
#include "imgproxy/session/detail/pipe_drain.hpp"
#include <flow/async/single_thread_task_loop.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/thread/future.hpp>
#include <boost/system/system_error.hpp>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>

namespace imgproxy::session::detail
{

// Implementations.

void sync_drain_pipe_with_handshake(flow::log::Logger* logger_ptr, util::Owned_native_handle&& pipe_moved,
                                    util::pipe_id_t pipe_id, const Drain_handshake_func& handshake_func,
                                    util::Blob* content, Error_code* err_code)
{
  using util::Owned_native_handle;
  using util::Blob;
  using flow::async::Single_thread_task_loop;
  using flow::util::ostream_op_string;
  using boost::promise;
  using boost::system::system_category;
  // using ::errno; // It's a macro apparently.

  assert((!pipe_moved.null()) && "Disallowed per contract.");

  /* Take it over now: the drain task (copyable, as flow::async::Task must be) then takes it over from here by
   * reference.  So even if that task never runs, it is closed when we return. */
  Owned_native_handle pipe(std::move(pipe_moved));

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { sync_drain_pipe_with_handshake(logger_ptr, std::move(pipe), pipe_id, handshake_func,
                                            content, actual_err_code); },
         err_code, "session::detail::sync_drain_pipe_with_handshake()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_SESSION);

  /* Wake-up pipe for thread D: closing the write end (EOF on the read end) tells it to stop waiting on `pipe`.
   * Needed if the handshake fails while the producer keeps its write end open: otherwise the join would never
   * complete. */
  Owned_native_handle cancel_rd;
  Owned_native_handle cancel_wr;
  {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1)
    {
      Error_code sys_err_code(errno, system_category());
      FLOW_ERROR_SYS_ERROR_LOG_WARNING();
      FLOW_LOG_WARNING("Pipe [" << pipe_id << "] drain: Could not create wake-up pipe; closing [" << pipe << "] "
                       "without draining it or performing handshake.");
      *err_code = sys_err_code;
      return;
    }
    // else
    cancel_rd = Owned_native_handle(fds[0]);
    cancel_wr = Owned_native_handle(fds[1]);
  }

  FLOW_LOG_TRACE("Pipe [" << pipe_id << "] drain: Starting drain of [" << pipe << "] concurrently with handshake.");

  // The drain path's terminal result, delivered to the join point below.  Nothing else is shared.
  struct Drain_result
  {
    Error_code m_err_code;
    Blob m_content;
  };
  promise<Drain_result> drain_promise;

  Single_thread_task_loop drain_thread(logger_ptr, ostream_op_string("pipe_drain[", pipe_id, ']'));
  drain_thread.start();
  drain_thread.post([&]()
  {
    // We are in thread D.
    const Owned_native_handle our_pipe(std::move(pipe)); // Closed when we leave this scope, whatever happens.
    const auto fd = our_pipe.native_handle();
    Drain_result result;

    // Non-blocking reads, so that a wait for more data happens in poll(), together with the wake-up pipe.
    const int flags = ::fcntl(fd, F_GETFL);
    if ((flags == -1) || (::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1))
    {
      result.m_err_code = Error_code(errno, system_category());
      drain_promise.set_value(std::move(result));
      return;
    }
    // else

    constexpr size_t CHUNK_SZ = 64 * 1024;
    while (true)
    {
      const auto prev_sz = result.m_content.size();
      result.m_content.resize(prev_sz + CHUNK_SZ);
      const auto n_read = ::read(fd, result.m_content.data() + prev_sz, CHUNK_SZ);
      if (n_read >= 0)
      {
        result.m_content.resize(prev_sz + size_t(n_read));
        if (n_read == 0)
        {
          break; // EOF: writer closed its end.
        }
        continue;
      }
      // else
      const auto read_errno = errno;
      result.m_content.resize(prev_sz);

      if (read_errno == EINTR)
      {
        continue;
      }
      if ((read_errno != EAGAIN) && (read_errno != EWOULDBLOCK))
      {
        result.m_err_code = Error_code(read_errno, system_category());
        break;
      }
      // else: Nothing to read yet.  Wait for data, EOF, or wake-up.

      ::pollfd pfds[2] = { { fd, POLLIN, 0 }, { cancel_rd.native_handle(), POLLIN, 0 } };
      int n_ready;
      do
      {
        n_ready = ::poll(pfds, 2, -1);
      }
      while ((n_ready == -1) && (errno == EINTR));

      if (n_ready == -1)
      {
        result.m_err_code = Error_code(errno, system_category());
        break;
      }
      // else
      if (pfds[1].revents != 0)
      {
        result.m_err_code = Error_code(ECANCELED, system_category());
        break;
      }
      // else: pipe readable, or hung up, or in error; the next read() says which.
    } // while (true)

    FLOW_LOG_TRACE("Pipe [" << pipe_id << "] drain: Done after [" << result.m_content.size() << "] bytes; "
                   "result [" << result.m_err_code << "]; closing [" << our_pipe << "].");
    drain_promise.set_value(std::move(result));
  }); // drain_thread.post()

  // Meanwhile, in thread U.
  Error_code handshake_err_code;
  handshake_func(&handshake_err_code);
  if (handshake_err_code)
  {
    /* The producer need not ever close its end now; so do not wait for EOF.  (If the drain is already done, this
     * has no effect.) */
    cancel_wr = Owned_native_handle();
  }

  // Join.
  auto drain_result = drain_promise.get_future().get();
  drain_thread.stop();

  if (drain_result.m_err_code)
  {
    FLOW_LOG_WARNING("Pipe [" << pipe_id << "] drain: Read failed after [" << drain_result.m_content.size() << "] "
                     "bytes: [" << drain_result.m_err_code << "] [" << drain_result.m_err_code.message() << "].");
  }
  if (handshake_err_code)
  {
    FLOW_LOG_WARNING("Pipe [" << pipe_id << "] drain: Handshake failed: "
                     "[" << handshake_err_code << "] [" << handshake_err_code.message() << "].  "
                     "Drain result: [" << drain_result.m_err_code << "].");
    *err_code = handshake_err_code;
    return;
  }
  // else
  if (drain_result.m_err_code)
  {
    *err_code = drain_result.m_err_code;
    return;
  }
  // else

  FLOW_LOG_TRACE("Pipe [" << pipe_id << "] drain: Success: [" << drain_result.m_content.size() << "] bytes.");
  *content = std::move(drain_result.m_content);
  err_code->clear();
} // sync_drain_pipe_with_handshake()

} // namespace imgproxy::session::detail
