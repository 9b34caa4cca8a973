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
#include "imgproxy/transport/seqpacket_channel.hpp"
#include "imgproxy/transport/error.hpp"
#include <flow/error/error.hpp>
#include <boost/system/system_error.hpp>
#include <sys/socket.h>
#include <cstring>
#include <vector>

namespace imgproxy::transport
{

// Implementations.

Seqpacket_channel::Seqpacket_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                                     util::Owned_native_handle&& native_handle) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str),
  m_socket(std::move(native_handle))
{
  assert((!m_socket.null()) && "Disallowed per contract.");
  FLOW_LOG_TRACE("Seqpacket_channel [" << *this << "]: Created from existing socket.");
}

Seqpacket_channel::Seqpacket_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSPORT),
  m_nickname(nickname_str)
{
  FLOW_LOG_TRACE("Seqpacket_channel [" << *this << "]: Created in null state.");
}

Seqpacket_channel::~Seqpacket_channel()
{
  if (!m_socket.null())
  {
    FLOW_LOG_TRACE("Seqpacket_channel [" << *this << "]: Closing socket.");
  }
  // m_socket dtor closes it.
}

bool Seqpacket_channel::create_pair(Seqpacket_channel* local, util::Owned_native_handle* remote_end,
                                    Error_code* err_code) // Static.
{
  using util::Owned_native_handle;
  using boost::system::system_category;
  // using ::errno; // It's a macro apparently.

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Seqpacket_channel::create_pair, local, remote_end, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(local && remote_end);
  FLOW_LOG_SET_CONTEXT(local->get_logger(), Log_component::S_TRANSPORT);

  if (!local->m_socket.null())
  {
    FLOW_LOG_WARNING("Seqpacket_channel [" << *local << "]: Asked to load with new socket pair, but already "
                     "holds socket [" << local->m_socket << "].  Ignoring.");
    return false;
  }
  // else

  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_SEQPACKET | SOCK_CLOEXEC, 0, fds) == -1)
  {
    *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Seqpacket_channel [" << *local << "]: socketpair() failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return true;
  }
  // else

  local->m_socket = Owned_native_handle(fds[0]);
  *remote_end = Owned_native_handle(fds[1]);
  err_code->clear();

  FLOW_LOG_INFO("Seqpacket_channel [" << *local << "]: Created socket pair; remote end is "
                "[" << *remote_end << "].");
  return true;
} // Seqpacket_channel::create_pair()

void Seqpacket_channel::send(util::String_view msg, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send_impl(msg, nullptr, actual_err_code); },
         err_code, "transport::Seqpacket_channel::send()"))
  {
    return;
  }
  // else
  send_impl(msg, nullptr, err_code);
}

void Seqpacket_channel::send_with_native_handle(util::String_view msg, const util::Owned_native_handle& native_handle,
                                                Error_code* err_code)
{
  assert((!native_handle.null()) && "Disallowed per contract.");
  assert((!msg.empty()) && "Disallowed per contract.");

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { send_impl(msg, &native_handle, actual_err_code); },
         err_code, "transport::Seqpacket_channel::send_with_native_handle()"))
  {
    return;
  }
  // else
  send_impl(msg, &native_handle, err_code);
}

void Seqpacket_channel::send_impl(util::String_view msg, const util::Owned_native_handle* native_handle_or_null,
                                  Error_code* err_code)
{
  using boost::system::system_category;
  using std::memcpy;
  // using ::errno; // It's a macro apparently.

  if (msg.size() > S_MAX_MSG_SZ)
  {
    *err_code = error::Code::S_SEND_MESSAGE_TOO_LARGE;
    FLOW_LOG_WARNING("Seqpacket_channel [" << *this << "]: Asked to send message of [" << msg.size() << "] bytes; "
                     "limit is [" << S_MAX_MSG_SZ << "]: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  ::iovec iov;
  iov.iov_base = const_cast<char*>(msg.data());
  iov.iov_len = msg.size();

  ::msghdr hdr;
  std::memset(&hdr, 0, sizeof(hdr));
  hdr.msg_iov = &iov;
  hdr.msg_iovlen = 1;

  // Properly aligned ancillary buffer able to hold exactly one descriptor.
  union
  {
    char m_buf[CMSG_SPACE(sizeof(int))];
    ::cmsghdr m_align;
  } ctl;

  if (native_handle_or_null)
  {
    std::memset(ctl.m_buf, 0, sizeof(ctl.m_buf));
    hdr.msg_control = ctl.m_buf;
    hdr.msg_controllen = sizeof(ctl.m_buf);

    auto cmsg = CMSG_FIRSTHDR(&hdr);
    cmsg->cmsg_level = SOL_SOCKET;
    cmsg->cmsg_type = SCM_RIGHTS;
    cmsg->cmsg_len = CMSG_LEN(sizeof(int));
    const int fd = native_handle_or_null->native_handle();
    memcpy(CMSG_DATA(cmsg), &fd, sizeof(int));
  }

  ssize_t n_sent;
  do
  {
    // MSG_NOSIGNAL: a vanished peer yields EPIPE, not a process-killing SIGPIPE.
    n_sent = ::sendmsg(m_socket.native_handle(), &hdr, MSG_NOSIGNAL);
  }
  while ((n_sent == -1) && (errno == EINTR));

  if (n_sent == -1)
  {
    *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Seqpacket_channel [" << *this << "]: sendmsg() of [" << msg.size() << "] bytes "
                     "(handle [" << (native_handle_or_null ? *native_handle_or_null : util::Owned_native_handle())
                     << "]) failed: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else
  if (size_t(n_sent) != msg.size())
  {
    *err_code = error::Code::S_SEND_INCOMPLETE;
    FLOW_LOG_WARNING("Seqpacket_channel [" << *this << "]: sendmsg() accepted only [" << n_sent << "] of "
                     "[" << msg.size() << "] bytes: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  err_code->clear();
  if (native_handle_or_null)
  {
    FLOW_LOG_TRACE("Seqpacket_channel [" << *this << "]: Sent [" << n_sent << "] bytes with "
                   "handle [" << *native_handle_or_null << "].");
  }
  else
  {
    FLOW_LOG_TRACE("Seqpacket_channel [" << *this << "]: Sent [" << n_sent << "] bytes.");
  }
} // Seqpacket_channel::send_impl()

void Seqpacket_channel::sync_receive(std::string* msg, std::optional<util::Owned_native_handle>* native_handle_or_none,
                                     Error_code* err_code)
{
  using util::Owned_native_handle;
  using boost::system::system_category;
  using std::vector;
  using std::memcpy;
  // using ::errno; // It's a macro apparently.

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { sync_receive(msg, native_handle_or_none, actual_err_code); },
         err_code, "transport::Seqpacket_channel::sync_receive()"))
  {
    return;
  }
  // else

  assert(msg && native_handle_or_none);
  native_handle_or_none->reset();

  msg->resize(S_MAX_MSG_SZ);
  ::iovec iov;
  iov.iov_base = msg->data();
  iov.iov_len = msg->size();

  /* Room for several descriptors, even though we accept only 1: that way an over-eager peer gets a clean
   * S_RECEIVE_TOO_MANY_HANDLES (with all the extras closed), rather than a truncation whose victims we cannot close. */
  constexpr size_t MAX_HANDLES = 8;
  union
  {
    char m_buf[CMSG_SPACE(sizeof(int) * MAX_HANDLES)];
    ::cmsghdr m_align;
  } ctl;
  std::memset(ctl.m_buf, 0, sizeof(ctl.m_buf));

  ::msghdr hdr;
  std::memset(&hdr, 0, sizeof(hdr));
  hdr.msg_iov = &iov;
  hdr.msg_iovlen = 1;
  hdr.msg_control = ctl.m_buf;
  hdr.msg_controllen = sizeof(ctl.m_buf);

  ssize_t n_rcvd;
  do
  {
    n_rcvd = ::recvmsg(m_socket.native_handle(), &hdr, MSG_CMSG_CLOEXEC);
  }
  while ((n_rcvd == -1) && (errno == EINTR));

  if (n_rcvd == -1)
  {
    *err_code = Error_code(errno, system_category());
    FLOW_LOG_WARNING("Seqpacket_channel [" << *this << "]: recvmsg() failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  // Take ownership of every delivered descriptor first, so that any early return below closes them all.
  vector<Owned_native_handle> handles;
  bool foreign_ancillary = false;
  for (auto cmsg = CMSG_FIRSTHDR(&hdr); cmsg; cmsg = CMSG_NXTHDR(&hdr, cmsg))
  {
    if ((cmsg->cmsg_level == SOL_SOCKET) && (cmsg->cmsg_type == SCM_RIGHTS))
    {
      const size_t n_fds = (cmsg->cmsg_len - CMSG_LEN(0)) / sizeof(int);
      for (size_t idx = 0; idx != n_fds; ++idx)
      {
        int fd;
        memcpy(&fd, CMSG_DATA(cmsg) + idx * sizeof(int), sizeof(int));
        handles.emplace_back(fd);
      }
    }
    else
    {
      foreign_ancillary = true;
    }
  }

  if (hdr.msg_flags & MSG_CTRUNC)
  {
    *err_code = error::Code::S_RECEIVE_ANCILLARY_TRUNCATED;
  }
  else if (hdr.msg_flags & MSG_TRUNC)
  {
    *err_code = error::Code::S_RECEIVE_MESSAGE_TRUNCATED;
  }
  else if (foreign_ancillary)
  {
    *err_code = error::Code::S_RECEIVE_UNEXPECTED_ANCILLARY;
  }
  else if (handles.size() > 1)
  {
    *err_code = error::Code::S_RECEIVE_TOO_MANY_HANDLES;
  }
  else if (n_rcvd == 0)
  {
    *err_code = error::Code::S_RECEIVE_PEER_CLOSED;
    FLOW_LOG_INFO("Seqpacket_channel [" << *this << "]: Received end-of-stream; peer has closed the channel.");
    return;
  }
  else
  {
    err_code->clear();
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Seqpacket_channel [" << *this << "]: recvmsg() yielded [" << n_rcvd << "] bytes and "
                     "[" << handles.size() << "] handles (flags [" << hdr.msg_flags << "]) but: "
                     "[" << *err_code << "] [" << err_code->message() << "].  Closing all received handles.");
    return;
  }
  // else

  msg->resize(size_t(n_rcvd));
  if (!handles.empty())
  {
    native_handle_or_none->emplace(std::move(handles.front()));
    FLOW_LOG_TRACE("Seqpacket_channel [" << *this << "]: Received [" << n_rcvd << "] bytes with "
                   "handle [" << **native_handle_or_none << "].");
  }
  else
  {
    FLOW_LOG_TRACE("Seqpacket_channel [" << *this << "]: Received [" << n_rcvd << "] bytes.");
  }
} // Seqpacket_channel::sync_receive()

void Seqpacket_channel::close()
{
  if (!m_socket.null())
  {
    FLOW_LOG_TRACE("Seqpacket_channel [" << *this << "]: Closing socket on request.");
    m_socket = util::Owned_native_handle();
  }
}

util::native_handle_t Seqpacket_channel::native_handle() const
{
  return m_socket.native_handle();
}

const std::string& Seqpacket_channel::nickname() const
{
  return m_nickname;
}

std::ostream& operator<<(std::ostream& os, const Seqpacket_channel& val)
{
  return os << '[' << val.nickname() << "]@" << static_cast<const void*>(&val) << " sock[" << val.native_handle()
            << ']';
}

} // namespace imgproxy::transport
