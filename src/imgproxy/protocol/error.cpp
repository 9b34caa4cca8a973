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
#include "imgproxy/protocol/error.hpp"
#include "imgproxy/util/util_fwd.hpp"

namespace imgproxy::protocol::error
{

// Types.

/**
 * The boost.system category for errors returned by the imgproxy::protocol module.  Analogous to
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
  return "imgproxy/protocol";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_DECODE_BAD_JSON:
    return "Decode: payload is not valid JSON (or has trailing garbage, duplicate keys, or a non-object root).";
  case Code::S_DECODE_BAD_STRUCTURE:
    return "Decode: payload is valid JSON but lacks a required field or a field has the wrong type.";
  case Code::S_HANDLE_WITHOUT_PIPE_ID:
    return "Protocol: a native handle arrived with the reply, but the reply's pipe-ID is 0.";
  case Code::S_PIPE_ID_WITHOUT_HANDLE:
    return "Protocol: the reply's pipe-ID is nonzero, but no native handle arrived with it.";

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
  case Code::S_DECODE_BAD_JSON:
    return "DECODE_BAD_JSON";
  case Code::S_DECODE_BAD_STRUCTURE:
    return "DECODE_BAD_STRUCTURE";
  case Code::S_HANDLE_WITHOUT_PIPE_ID:
    return "HANDLE_WITHOUT_PIPE_ID";
  case Code::S_PIPE_ID_WITHOUT_HANDLE:
    return "PIPE_ID_WITHOUT_HANDLE";

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

} // namespace imgproxy::protocol::error
