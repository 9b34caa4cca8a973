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
#include "imgproxy/session/error.hpp"
#include "imgproxy/util/util_fwd.hpp"

namespace imgproxy::session::error
{

// Types.

/**
 * The boost.system category for errors returned by the imgproxy::session module.  Analogous to
 * transport::error::Category.  All notes therein apply.
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
   * Analogous to transport::error::Category::name().
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Analogous to transport::error::Category::message().
   *
   * @param val
   *        See above.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Analogous to transport::error::Category::code_symbol().
   * @param code
   *        See above.
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
  return "imgproxy/session";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_REMOTE_ERROR:
    return "Helper replied with failure; its message is available from the session.";
  case Code::S_PROTOCOL_MISSING_HANDLE:
    return "Protocol: reply to a call that must hand back a pipe carried no native handle.";
  case Code::S_PROTOCOL_UNEXPECTED_HANDLE:
    return "Protocol: reply to a call that must not hand back a pipe carried a native handle.";
  case Code::S_PROTOCOL_BAD_VALUE:
    return "Protocol: reply succeeded but its value is not of the type the call requires.";
  case Code::S_PROTOCOL_BLOB_SIZE_MISMATCH:
    return "Protocol: drained blob size differs from the size the helper announced.";
  case Code::S_HELPER_EXITED_ABNORMALLY:
    return "Helper process exited with non-zero status.";
  case Code::S_HELPER_TERMINATED_BY_SIGNAL:
    return "Helper process was terminated by a signal.";

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
  case Code::S_REMOTE_ERROR:
    return "REMOTE_ERROR";
  case Code::S_PROTOCOL_MISSING_HANDLE:
    return "PROTOCOL_MISSING_HANDLE";
  case Code::S_PROTOCOL_UNEXPECTED_HANDLE:
    return "PROTOCOL_UNEXPECTED_HANDLE";
  case Code::S_PROTOCOL_BAD_VALUE:
    return "PROTOCOL_BAD_VALUE";
  case Code::S_PROTOCOL_BLOB_SIZE_MISMATCH:
    return "PROTOCOL_BLOB_SIZE_MISMATCH";
  case Code::S_HELPER_EXITED_ABNORMALLY:
    return "HELPER_EXITED_ABNORMALLY";
  case Code::S_HELPER_TERMINATED_BY_SIGNAL:
    return "HELPER_TERMINATED_BY_SIGNAL";

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

} // namespace imgproxy::session::error
