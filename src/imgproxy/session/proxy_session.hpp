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
#include "imgproxy/session/helper_process.hpp"
#include "imgproxy/transport/seqpacket_channel.hpp"
#include "imgproxy/protocol/protocol_fwd.hpp"
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <boost/noncopyable.hpp>
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace imgproxy::session
{

// Types.

/// Result of Proxy_session::get_manifest().
struct Manifest_result
{
  // Data.

  /// The manifest digest, as reported by the helper, e.g., `sha256:...`.
  std::string m_digest;

  /// The manifest itself, exactly as read from the pipe.
  util::Blob m_content;
}; // struct Manifest_result

/// Result of Proxy_session::get_blob().
struct Blob_result
{
  // Data.

  /// The digest requested.
  std::string m_digest;

  /// The size announced by the helper before transfer; or -1 if it did not know.
  int64_t m_announced_size = -1;

  /// The blob itself, exactly as read from the pipe.
  util::Blob m_content;
}; // struct Blob_result

/**
 * A conversation with one image proxy helper process, about one image.  Owns both the helper process and our end
 * of the private channel to it.
 *
 * ### Lifecycle ###
 * Construction yields NULL state: nothing is spawned yet.  sync_start() creates the channel pair, spawns the helper
 * (Helper_process) with the other end bound to its slot, and enters OPEN state.  In OPEN state the calls
 * (get_manifest(), get_blob(), finish_pipe()) may be issued, one at a time.  shutdown() asks the helper to exit,
 * reaps it, and enters SHUT_DOWN state, from which there is no return.  In any state other than the one a method
 * requires, it returns `false` and does nothing else.
 *
 * If `*this` is destroyed while OPEN (no shutdown()), our channel end is closed (the helper sees end-of-stream
 * and exits) and the helper is reaped; the outcome is logged.  So in no case does a helper process or a descriptor
 * outlive `*this`.
 *
 * ### Calls ###
 * The protocol allows one call in flight: a call is a request message, then exactly one reply message.
 * If the reply says `success` is false, the call fails with error::Code::S_REMOTE_ERROR, whatever the method;
 * last_remote_error() then returns the helper's message verbatim.
 *
 * get_manifest() and get_blob() also receive the read end of a pipe along with the reply: the body arrives through
 * it.  Such a call drains the pipe on a separate thread while this thread tells the helper, via finish_pipe(),
 * that the pipe was received; it returns once both are done.  (See detail::sync_drain_pipe_with_handshake() for
 * why both must proceed at once.)  The pipe is closed by the time the call returns, whatever the outcome.
 *
 * ### Error semantics ###
 * Every error is fatal to the call that met it; nothing is retried.  Any error other than S_REMOTE_ERROR likely
 * means the helper is broken or gone; the only sensible thing left to do is shutdown() (or destruction).
 * Errors come from transport::error (channel trouble), protocol::error (malformed or inconsistent reply),
 * error (this module: remote failure, broken reply expectations, abnormal helper exit), and system codes.
 *
 * ### Thread safety ###
 * A given object is not safe for concurrent use; nor do the protocol semantics permit it.
 *
 * @todo Add a per-call timeout.  As it stands a hung helper hangs the caller forever.
 */
class Proxy_session :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Constructs session in NULL state; sync_start() to start it.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param helper_app
   *        Helper description.  Copied.
   * @param image_ref
   *        The image reference passed to the helper, e.g., `docker://quay.io/example/image:latest`.
   */
  explicit Proxy_session(flow::log::Logger* logger_ptr, const Helper_app& helper_app, util::String_view image_ref);

  /**
   * If OPEN: closes our channel end, then reaps the helper, which is expected to exit upon seeing that.
   * Blocks until it does.
   */
  ~Proxy_session();

  // Methods.

  /**
   * Creates the channel, spawns the helper, and (on success) enters OPEN state.  On error remains in NULL state
   * and may be retried.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes from creating the channel pair or spawning (see Helper_process ctor).
   * @return `false` if not in NULL state (no-op); else `true`.
   */
  bool sync_start(Error_code* err_code = 0);

  /**
   * Issues `GetManifest`; drains the manifest from the pipe handed back, while acknowledging it via finish_pipe().
   *
   * @param result
   *        On success loaded with the digest and the manifest.  On error unspecified.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_REMOTE_ERROR (see last_remote_error()), error::Code::S_PROTOCOL_MISSING_HANDLE,
   *        error::Code::S_PROTOCOL_BAD_VALUE, anything from finish_pipe(), protocol::error codes,
   *        transport::error codes, system codes (from channel or pipe I/O).
   * @return `false` if not in OPEN state (no-op); else `true`.
   */
  bool get_manifest(Manifest_result* result, Error_code* err_code = 0);

  /**
   * Issues `GetBlob` for the given digest; otherwise just like get_manifest().  Additionally, if the helper
   * announced the size, the amount drained must match it.
   *
   * @param digest
   *        Blob digest, e.g., `sha256:...`.
   * @param result
   *        On success loaded with the blob and related info.  On error unspecified.
   * @param err_code
   *        Same as get_manifest(); plus error::Code::S_PROTOCOL_BLOB_SIZE_MISMATCH.
   * @return `false` if not in OPEN state (no-op); else `true`.
   */
  bool get_blob(util::String_view digest, Blob_result* result, Error_code* err_code = 0);

  /**
   * Issues `FinishPipe`, telling the helper we have taken the given pipe's read end and it may finish up
   * (close its write end) at will.  get_manifest() and get_blob() do this on their own; users rarely need to.
   *
   * @param pipe_id
   *        Pipe ID from an earlier reply.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_REMOTE_ERROR, error::Code::S_PROTOCOL_UNEXPECTED_HANDLE, protocol::error codes,
   *        transport::error codes, system codes.
   * @return `false` if not in OPEN state (no-op); else `true`.
   */
  bool finish_pipe(util::pipe_id_t pipe_id, Error_code* err_code = 0);

  /**
   * Issues `Shutdown`, closes our channel end, and reaps the helper.  Enters SHUT_DOWN state regardless of
   * outcome.  If the helper exits without replying to `Shutdown`, that is not an error in itself: its exit status
   * decides.  If both the call and the exit status indicate failure, the call's error is emitted (both are logged).
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_REMOTE_ERROR, error::Code::S_PROTOCOL_UNEXPECTED_HANDLE,
   *        error::Code::S_HELPER_EXITED_ABNORMALLY, error::Code::S_HELPER_TERMINATED_BY_SIGNAL,
   *        protocol::error codes, transport::error codes, system codes.
   * @return `false` if not in OPEN state (no-op); else `true`.
   */
  bool shutdown(Error_code* err_code = 0);

  /**
   * The helper's message from the most recent reply with `success` false; empty if none yet.
   * @return See above.
   */
  const std::string& last_remote_error() const;

  /**
   * The helper description.
   * @return See above.
   */
  const Helper_app& helper_app() const;

  /**
   * The image reference.
   * @return See above.
   */
  const std::string& image_ref() const;

  /**
   * The helper PID; 0 if not started.
   * @return See above.
   */
  process_id_t helper_pid() const;

private:
  // Types.

  /// See class doc header.
  enum class State
  {
    /// Not started.
    S_NULL,
    /// Started: calls allowed.
    S_OPEN,
    /// shutdown() called.  Final.
    S_SHUT_DOWN
  };

  /// Short-hand for optional native handle.
  using Native_handle_or_none = std::optional<util::Owned_native_handle>;

  // Methods.

  /**
   * Performs one call: sends it; receives and decodes the reply; checks `success`.
   *
   * @param call
   *        The call.
   * @param reply
   *        On success loaded with the reply.
   * @param handle_or_none
   *        On success loaded with the handle that came with the reply if any.  On error `nullopt` (if a handle did
   *        come, it has been closed).
   * @param err_code
   *        Not null.  Any error mentioned in class doc header.
   */
  void call(const protocol::Call& call, protocol::Reply* reply, Native_handle_or_none* handle_or_none,
            Error_code* err_code);

  /**
   * Performs one call which must carry no handle back.
   *
   * @param call
   *        The call.
   * @param reply
   *        On success loaded with the reply.
   * @param err_code
   *        Not null.
   */
  void call_no_pipe(const protocol::Call& call, protocol::Reply* reply, Error_code* err_code);

  /**
   * Performs one call which must carry a pipe back; checks its value via `value_ok`; drains the pipe while
   * acknowledging it via finish_pipe().
   *
   * @param call
   *        The call.
   * @param value_type
   *        Expected type of the reply value, for logging.
   * @param value_ok
   *        Returns whether the reply value is acceptable.
   * @param value
   *        On success loaded with the reply value.
   * @param content
   *        On success loaded with the pipe contents.
   * @param err_code
   *        Not null.
   */
  void call_with_pipe(const protocol::Call& call, util::String_view value_type,
                      const flow::Function<bool (const Json::Value&)>& value_ok,
                      Json::Value* value, util::Blob* content, Error_code* err_code);

  /**
   * Body of finish_pipe(), sans state check.
   *
   * @param pipe_id
   *        See finish_pipe().
   * @param err_code
   *        Not null.
   */
  void finish_pipe_impl(util::pipe_id_t pipe_id, Error_code* err_code);

  /**
   * Returns `true` if in OPEN state; else logs and returns `false`.
   *
   * @param op_name
   *        For logging.
   * @return See above.
   */
  bool check_open(util::String_view op_name) const;

  // Data.

  /// See helper_app().
  const Helper_app m_helper_app;

  /// See image_ref().
  const std::string m_image_ref;

  /// See class doc header.
  State m_state;

  /// Our end of the channel.  Null state until sync_start() succeeds.
  transport::Seqpacket_channel m_channel;

  /// The helper.  Null until sync_start() succeeds.
  boost::movelib::unique_ptr<Helper_process> m_helper;

  /// See last_remote_error().
  std::string m_last_remote_error;
}; // class Proxy_session

} // namespace imgproxy::session
