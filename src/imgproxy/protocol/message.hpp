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

#include "imgproxy/protocol/protocol_fwd.hpp"
#include <flow/log/log.hpp>
#include <json/json.h>
#include <string>
#include <vector>

namespace imgproxy::protocol
{

// Types.

/**
 * A request, as sent by the client: `{"method": <string>, "args": [<value>, ...]}`.  `args` is always present on
 * the wire, possibly as the empty array.  Build one per call; it is not reused.
 */
struct Call
{
  // Data.

  /// Method name, e.g., #S_METHOD_GET_MANIFEST.
  std::string m_method;

  /// Arguments in order.  Arbitrary JSON values.
  std::vector<Json::Value> m_args;
}; // struct Call

/**
 * A reply, as sent by the helper: `{"success": <bool>, "error": <string>, "pipeid": <uint32>, "value": <value>}`.
 * All four fields are required on the wire.
 *
 * Invariant for a decoded Reply: #m_pipe_id is nonzero if and only if a native handle arrived along with it.
 * decode_reply() enforces this.
 */
struct Reply
{
  // Data.

  /// Whether the call succeeded.
  bool m_success = false;

  /// If `!m_success`: human-readable failure reason, verbatim from the helper.  Else empty.
  std::string m_error;

  /// ID of the pipe whose read end accompanies this reply; or 0 if none does.
  util::pipe_id_t m_pipe_id = 0;

  /// Method-specific result; `null` if the method has none.
  Json::Value m_value;
}; // struct Reply

// Constants.

/// Method: get the manifest.  No args.  Value: digest string.  Hands back a pipe carrying the manifest body.
constexpr util::String_view S_METHOD_GET_MANIFEST = "GetManifest";

/**
 * Method: get a blob.  Args: `[digest]`.  Value: size in bytes, or -1 if unknown.  Hands back a pipe carrying
 * the blob body.
 */
constexpr util::String_view S_METHOD_GET_BLOB = "GetBlob";

/// Method: acknowledge receipt of a pipe's read end.  Args: `[pipe_id]`.  No value; no pipe.
constexpr util::String_view S_METHOD_FINISH_PIPE = "FinishPipe";

/// Method: ask helper to exit.  No args.  No value; no pipe.
constexpr util::String_view S_METHOD_SHUTDOWN = "Shutdown";

// Free functions.

/**
 * Serializes the given call into a compact (single-line) JSON payload, ready to be sent as one transport message.
 *
 * @param call
 *        The call.
 * @return See above.
 */
std::string encode_call(const Call& call);

/**
 * Deserializes a call from the given payload.  The helper side of the protocol (and tests) use this.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param payload
 *        The bytes of one transport message.
 * @param call
 *        Target.  Untouched on error.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_DECODE_BAD_JSON, error::Code::S_DECODE_BAD_STRUCTURE.
 */
void decode_call(flow::log::Logger* logger_ptr, util::String_view payload, Call* call, Error_code* err_code = 0);

/**
 * Serializes the given reply into a compact (single-line) JSON payload.  The helper side of the protocol (and tests)
 * use this.
 *
 * @param reply
 *        The reply.
 * @return See above.
 */
std::string encode_reply(const Reply& reply);

/**
 * Deserializes a reply from the given payload and checks the pipe-ID against whether a native handle came with it.
 *
 * A failure reply (`success` false) is *not* an error at this layer: it decodes fine, and the caller decides what
 * to do with it.  The pairing check is applied regardless of `success`.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param payload
 *        The bytes of one transport message.
 * @param handle_attached
 *        Whether a native handle arrived with `payload`.
 * @param reply
 *        Target.  Untouched on error.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        error::Code::S_DECODE_BAD_JSON, error::Code::S_DECODE_BAD_STRUCTURE,
 *        error::Code::S_HANDLE_WITHOUT_PIPE_ID, error::Code::S_PIPE_ID_WITHOUT_HANDLE.
 */
void decode_reply(flow::log::Logger* logger_ptr, util::String_view payload, bool handle_attached, Reply* reply,
                  Error_code* err_code = 0);

} // namespace imgproxy::protocol
