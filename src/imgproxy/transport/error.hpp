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

#include "imgproxy/common.hpp"

/**
 * Namespace containing the imgproxy::transport module's extension of boost.system error conventions, so that that
 * API can return codes/messages from within its own new set of error codes/messages.
 *
 * Failures reported by the OS itself (`socketpair()`, `sendmsg()`, `recvmsg()`) are not given codes here: they
 * are emitted as-is, as `boost::system::system_category()` codes built from `errno`.  The codes below cover the
 * conditions the OS considers success but the channel does not.
 *
 * The imgproxy::protocol and imgproxy::session modules follow this same pattern for their own codes.
 */
namespace imgproxy::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by imgproxy::transport functions/methods *outside of*
 * system-triggered errors such as `boost::asio::error::connection_reset`.
 *
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus extend
 * the set of errors that #Error_code can represent.
 *
 * When you modify this, make sure to update the `error.cpp` switch statements accordingly.
 */
enum class Code
{
  /// Send: message exceeds the maximum size the channel's receiver is guaranteed to accept.
  S_SEND_MESSAGE_TOO_LARGE = S_CODE_LOWEST_INT_VALUE,

  /// Send: OS reported success but accepted fewer bytes than the message comprises.
  S_SEND_INCOMPLETE,

  /// Receive: read an empty message, meaning the peer closed its end of the channel (or exited).
  S_RECEIVE_PEER_CLOSED,

  /// Receive: message exceeded the receive buffer and was truncated by the OS.
  S_RECEIVE_MESSAGE_TRUNCATED,

  /// Receive: ancillary data exceeded the ancillary buffer and was truncated by the OS; a handle may be lost.
  S_RECEIVE_ANCILLARY_TRUNCATED,

  /// Receive: message carried more than one native handle; all of them were closed.
  S_RECEIVE_TOO_MANY_HANDLES,

  /// Receive: message carried ancillary data other than native handles.
  S_RECEIVE_UNEXPECTED_ANCILLARY,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a matching #Error_code, of the category in this namespace.
 * Required by boost.system so that `Error_code = Code::S_...` compiles.
 *
 * @param err_code
 *        `enum` value.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream: either the symbol (such as
 * `RECEIVE_PEER_CLOSED`, case-insensitive) or the number.  An unknown value yields `S_END_SENTINEL`.
 *
 * @param is
 *        Stream from which to read.
 * @param val
 *        Value read; untouched on stream error.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream, as its symbol (such as `RECEIVE_PEER_CLOSED`).
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace imgproxy::transport::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::imgproxy::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
