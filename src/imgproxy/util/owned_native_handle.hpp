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

#include "imgproxy/util/util_fwd.hpp"

namespace imgproxy::util
{

// Types.

/**
 * Sole owner of an open native handle (descriptor): closes it when destroyed unless ownership has been
 * given up via release().  Movable, not copyable; a moved-from object is null (holds #S_NULL_HANDLE).
 *
 * This is the token form of a descriptor that crossed the channel via `SCM_RIGHTS`: whoever holds the object
 * holds the descriptor, and exactly one object ever holds it.  Absence of a descriptor (e.g., a reply that carried
 * none) is modeled by the holder, typically as `std::optional<Owned_native_handle>`, not by a null object.
 *
 * ### Thread safety ###
 * Same as for `int`: distinct objects are independent; a given object must not be accessed concurrently.
 */
class Owned_native_handle
{
public:
  // Constants.

  /// The value of a null handle.
  static constexpr native_handle_t S_NULL_HANDLE = -1;

  // Constructors/destructor.

  /// Constructs null object.
  Owned_native_handle();

  /**
   * Takes ownership of the given open descriptor.
   *
   * @param native_handle
   *        The descriptor; or #S_NULL_HANDLE (then equivalent to default ctor).
   */
  explicit Owned_native_handle(native_handle_t native_handle);

  /**
   * Move-constructs: `src` becomes null.
   *
   * @param src
   *        Source object.
   */
  Owned_native_handle(Owned_native_handle&& src);

  /// Disallowed.
  Owned_native_handle(const Owned_native_handle&) = delete;

  /// Closes the descriptor, if any.  Errors are logged nowhere and ignored; use close() to observe them.
  ~Owned_native_handle();

  // Methods.

  /**
   * Move-assigns: closes our descriptor (if any); takes `src`'s; `src` becomes null.
   *
   * @param src
   *        Source object.
   * @return `*this`.
   */
  Owned_native_handle& operator=(Owned_native_handle&& src);

  /// Disallowed.
  Owned_native_handle& operator=(const Owned_native_handle&) = delete;

  /**
   * Returns the descriptor without affecting ownership.
   * @return See above; #S_NULL_HANDLE if null().
   */
  native_handle_t native_handle() const;

  /**
   * Returns `true` if and only if no descriptor is held.
   * @return See above.
   */
  bool null() const;

  /**
   * Gives up ownership: returns the descriptor, and `*this` becomes null; caller must close it eventually.
   * @return See above.
   */
  native_handle_t release();

  /**
   * Closes the descriptor now (if not null()); `*this` becomes null either way.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        system codes from `close()` (`EBADF`, `EIO`...).
   */
  void close(Error_code* err_code = 0);

private:
  // Data.

  /// The descriptor or #S_NULL_HANDLE.
  native_handle_t m_native_handle;
}; // class Owned_native_handle

} // namespace imgproxy::util
