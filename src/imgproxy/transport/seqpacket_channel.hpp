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

#include "imgproxy/transport/transport_fwd.hpp"
#include "imgproxy/util/owned_native_handle.hpp"
#include <flow/log/log.hpp>
#include <boost/noncopyable.hpp>
#include <optional>
#include <string>

namespace imgproxy::transport
{

// Types.

/**
 * One end of a private, connected, message-boundary-preserving local channel (a `SOCK_SEQPACKET` Unix domain
 * socket), able to transmit a message together with up to one native handle.  Operations are synchronous and
 * blocking.
 *
 * ### Creating the pair ###
 * Use create_pair(): it loads one Seqpacket_channel (the local end, which we use) and one raw
 * util::Owned_native_handle (the remote end, to be handed to a child process).  Both ends are created
 * close-on-exec; whoever hands the remote end to a child must arrange for that child's copy to survive `exec()`
 * (session::Helper_process does so by `dup2()`ing it into the configured slot).
 *
 * Alternatively wrap an existing connected socket with the constructor; the helper side of the conversation does
 * this with the descriptor number it was told about on its command line.
 *
 * ### Messages ###
 * A message is an arbitrary byte sequence of at most #S_MAX_MSG_SZ bytes.  On receipt an empty read signifies that
 * the peer closed its end (that is how the OS reports it); so do not send an empty message: the peer would take it
 * for closure.
 *
 * ### Native handles ###
 * send_with_native_handle() passes a descriptor via `SCM_RIGHTS`.  The OS duplicates it into the receiver; the
 * sender's copy stays open and remains the sender's to close.  sync_receive() yields either no handle or exactly one,
 * wrapped in util::Owned_native_handle (close-on-exec, via `MSG_CMSG_CLOEXEC`).  If the OS delivered more than one,
 * or the ancillary data got truncated, the receive fails, and all delivered descriptors are closed, so none leak.
 *
 * ### Thread safety ###
 * A given object is not safe for concurrent use.  Note, though, that the OS treats send and receive independently.
 *
 * ### Error semantics ###
 * Each fallible method takes `Error_code* err_code`, per Flow convention: if null, a failure throws
 * `flow::error::Runtime_error`.  After a failure the channel is not "hosed" as such, but the caller should generally
 * treat the conversation as over.
 */
class Seqpacket_channel :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constants.

  /// The size of the receive buffer; hence the largest message that can be received intact.
  static constexpr size_t S_MAX_MSG_SZ = 16 * 1024;

  // Constructors/destructor.

  /**
   * Constructs the channel by taking ownership of an existing connected `SOCK_SEQPACKET` socket.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        Human-readable nickname of the new object, as of this writing for use in `operator<<(ostream)` and
   *        logging only.
   * @param native_handle
   *        The socket.  Becomes null.  Must not be null.
   */
  explicit Seqpacket_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str,
                             util::Owned_native_handle&& native_handle);

  /**
   * Constructs the channel in null state, for use as the target of create_pair().
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param nickname_str
   *        See other ctor.
   */
  explicit Seqpacket_channel(flow::log::Logger* logger_ptr, util::String_view nickname_str);

  /// Closes the socket (if any); the peer will receive an empty message (error::Code::S_RECEIVE_PEER_CLOSED).
  ~Seqpacket_channel();

  // Methods.

  /**
   * Creates a connected pair, loading `*local` (which must be in null state, such as via 2-arg ctor) with
   * one end and `*remote_end` with the other.  Both are close-on-exec.
   *
   * @param local
   *        Target channel, in null state.  Untouched on error.
   * @param remote_end
   *        Target handle; loaded with the other end.  Untouched on error.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes from `socketpair()`.
   * @return `false` if `*local` was not in null state (no-op); else `true`.
   */
  static bool create_pair(Seqpacket_channel* local, util::Owned_native_handle* remote_end, Error_code* err_code = 0);

  /**
   * Sends the given message, with no native handle.
   *
   * @param msg
   *        The message.  At most #S_MAX_MSG_SZ bytes.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_SEND_MESSAGE_TOO_LARGE, error::Code::S_SEND_INCOMPLETE,
   *        system codes from `sendmsg()` (`EPIPE` if peer is gone, `ECONNRESET`...).
   */
  void send(util::String_view msg, Error_code* err_code = 0);

  /**
   * Sends the given message along with a copy of the given native handle.  `native_handle` itself is not touched:
   * it remains open and owned by caller.
   *
   * @param msg
   *        The message.  At most #S_MAX_MSG_SZ bytes; must be non-empty (the OS drops ancillary data
   *        sent with zero bytes of payload).
   * @param native_handle
   *        The handle to pass.  Must not be null.
   * @param err_code
   *        See send().
   */
  void send_with_native_handle(util::String_view msg, const util::Owned_native_handle& native_handle,
                               Error_code* err_code = 0);

  /**
   * Blocks until a message arrives; then loads it (and the native handle that arrived with it, if any) into the
   * given targets.
   *
   * @param msg
   *        On success loaded with the message (never empty).  On error unspecified.
   * @param native_handle_or_none
   *        On success loaded with the handle that arrived with the message, or `nullopt` if none.
   *        On error `nullopt` (any handles delivered with a bad message are closed).
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_RECEIVE_PEER_CLOSED, error::Code::S_RECEIVE_MESSAGE_TRUNCATED,
   *        error::Code::S_RECEIVE_ANCILLARY_TRUNCATED, error::Code::S_RECEIVE_TOO_MANY_HANDLES,
   *        error::Code::S_RECEIVE_UNEXPECTED_ANCILLARY, system codes from `recvmsg()`.
   */
  void sync_receive(std::string* msg, std::optional<util::Owned_native_handle>* native_handle_or_none,
                    Error_code* err_code = 0);

  /**
   * Closes the socket now, as if by destructor.  Subsequent send/receive will fail with `EBADF`.
   */
  void close();

  /**
   * Returns the socket descriptor, still owned by `*this`, or util::Owned_native_handle::S_NULL_HANDLE.
   * @return See above.
   */
  util::native_handle_t native_handle() const;

  /**
   * Returns nickname, a brief string suitable for logging.
   * @return See above.
   */
  const std::string& nickname() const;

private:
  // Methods.

  /**
   * Implementation of send() and send_with_native_handle().
   *
   * @param msg
   *        See send().
   * @param native_handle_or_null
   *        Handle to pass along; or null for none.
   * @param err_code
   *        See send().  Not null.
   */
  void send_impl(util::String_view msg, const util::Owned_native_handle* native_handle_or_null,
                 Error_code* err_code);

  // Data.

  /// See nickname().
  const std::string m_nickname;

  /// The socket; null if in null state or after close().
  util::Owned_native_handle m_socket;
}; // class Seqpacket_channel

} // namespace imgproxy::transport
