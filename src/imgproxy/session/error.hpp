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
 * Namespace containing the imgproxy::session module's extension of boost.system error conventions.  The notes in
 * imgproxy::transport::error apply equally here.
 *
 * Note that a Proxy_session operation may also emit codes from imgproxy::transport::error,
 * imgproxy::protocol::error, and the system category: those pass through unchanged.
 */
namespace imgproxy::session::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by imgproxy::session functions/methods *outside of*
 * errors passed through from lower layers (imgproxy::transport and system codes).
 *
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus extend
 * the set of errors that #Error_code can represent.
 *
 * When you modify this, make sure to update the `error.cpp` switch statements accordingly.
 */
enum class Code
{
  /// Helper replied with failure; its message is available from the session.
  S_REMOTE_ERROR = S_CODE_LOWEST_INT_VALUE,

  /// Protocol: reply to a call that must hand back a pipe carried no native handle.
  S_PROTOCOL_MISSING_HANDLE,

  /// Protocol: reply to a call that must not hand back a pipe carried a native handle.
  S_PROTOCOL_UNEXPECTED_HANDLE,

  /// Protocol: reply succeeded but its value is not of the type the call requires.
  S_PROTOCOL_BAD_VALUE,

  /// Protocol: drained blob size differs from the size the helper announced.
  S_PROTOCOL_BLOB_SIZE_MISMATCH,

  /// Helper process exited with non-zero status.
  S_HELPER_EXITED_ABNORMALLY,

  /// Helper process was terminated by a signal.
  S_HELPER_TERMINATED_BY_SIGNAL,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Analogous to transport::error::make_error_code().
 *
 * @param err_code
 *        See above.
 * @return See above.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a session::error::Code from a standard input stream: either the symbol (such as
 * `REMOTE_ERROR`, case-insensitive) or the number.  An unknown value yields `S_END_SENTINEL`.
 *
 * @param is
 *        Stream from which to read.
 * @param val
 *        Value read; untouched on stream error.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a session::error::Code to a standard output stream, as its symbol (such as `REMOTE_ERROR`).
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace imgproxy::session::error

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
struct is_error_code_enum<::imgproxy::session::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
