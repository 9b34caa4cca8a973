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
#include "imgproxy/transport/error.hpp"
#include "imgproxy/util/util_fwd.hpp"

namespace imgproxy::transport::error
{

// Types.

/**
 * The boost.system category for errors returned by the imgproxy::transport module.  Think of it as the
 * polymorphic counterpart of Code, and it kicks in when, for example, someone says
 * `err_code = Code::S_RECEIVE_PEER_CLOSED;`.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's name/identity.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Given the integer value of a Code, returns a string describing that error.
   *
   * @param val
   *        Integer value of a Code.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns a string representation of the given code's symbol, such as "RECEIVE_PEER_CLOSED".
   *
   * @param code
   *        Code value.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "imgproxy/transport";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_SEND_MESSAGE_TOO_LARGE:
    return "Send: message exceeds the maximum size the channel's receiver is guaranteed to accept.";
  case Code::S_SEND_INCOMPLETE:
    return "Send: OS reported success but accepted fewer bytes than the message comprises.";
  case Code::S_RECEIVE_PEER_CLOSED:
    return "Receive: read an empty message, meaning the peer closed its end of the channel (or exited).";
  case Code::S_RECEIVE_MESSAGE_TRUNCATED:
    return "Receive: message exceeded the receive buffer and was truncated by the OS.";
  case Code::S_RECEIVE_ANCILLARY_TRUNCATED:
    return "Receive: ancillary data exceeded the ancillary buffer and was truncated by the OS; "
           "a handle may be lost.";
  case Code::S_RECEIVE_TOO_MANY_HANDLES:
    return "Receive: message carried more than one native handle; all of them were closed.";
  case Code::S_RECEIVE_UNEXPECTED_ANCILLARY:
    return "Receive: message carried ancillary data other than native handles.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_SEND_MESSAGE_TOO_LARGE:
    return "SEND_MESSAGE_TOO_LARGE";
  case Code::S_SEND_INCOMPLETE:
    return "SEND_INCOMPLETE";
  case Code::S_RECEIVE_PEER_CLOSED:
    return "RECEIVE_PEER_CLOSED";
  case Code::S_RECEIVE_MESSAGE_TRUNCATED:
    return "RECEIVE_MESSAGE_TRUNCATED";
  case Code::S_RECEIVE_ANCILLARY_TRUNCATED:
    return "RECEIVE_ANCILLARY_TRUNCATED";
  case Code::S_RECEIVE_TOO_MANY_HANDLES:
    return "RECEIVE_TOO_MANY_HANDLES";
  case Code::S_RECEIVE_UNEXPECTED_ANCILLARY:
    return "RECEIVE_UNEXPECTED_ANCILLARY";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace imgproxy::transport::error
