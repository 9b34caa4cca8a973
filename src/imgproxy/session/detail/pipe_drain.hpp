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

#include "imgproxy/util/owned_native_handle.hpp"
#include <flow/log/log.hpp>

namespace imgproxy::session::detail
{

// Types.

/// Short-hand for the handshake performed while draining: `finish_pipe()` in practice.
using Drain_handshake_func = flow::Function<void (Error_code* err_code)>;

// Free functions.

/**
 * Reads the given pipe to end-of-stream on a separate thread while concurrently, in the calling thread,
 * running the given handshake; joins the two; reports the combined outcome.
 *
 * The two must overlap: the producer of the pipe's contents may block writing until it sees the handshake
 * (FinishPipe), and the handshake's reply may in turn not come until the producer is done writing.  So doing either
 * one fully before the other can deadlock.
 *
 * The two paths share nothing but their terminal results.  The drain thread takes over `pipe` and closes it (by
 * destruction) once it is done reading, whatever the outcome.  If the handshake fails, the drain stops waiting for
 * end-of-stream and gives up (the producer may never close its end in that case); so a failed handshake is reported
 * promptly.  No thread outlives the call.
 *
 * If both fail, both failures are logged, and the handshake's is emitted, as that one is the more informative
 * about why the producer stopped.
 *
 * @param logger_ptr
 *        Logger to use for logging subsequently.
 * @param pipe
 *        The read end of the pipe.  Must not be null.  Becomes null immediately; closed by the time we return.
 * @param pipe_id
 *        ID of the pipe, for logging.
 * @param handshake_func
 *        Invoked synchronously, once, in the calling thread, with a non-null `Error_code*` it must set.
 * @param content
 *        On success loaded with everything read from the pipe.  On error unspecified.
 * @param err_code
 *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
 *        whatever `handshake_func` emits; system codes from `read()`, `poll()`, `fcntl()`, `pipe2()`.
 */
void sync_drain_pipe_with_handshake(flow::log::Logger* logger_ptr, util::Owned_native_handle&& pipe,
                                    util::pipe_id_t pipe_id, const Drain_handshake_func& handshake_func,
                                    util::Blob* content, Error_code* err_code = 0);

} // namespace imgproxy::session::detail
