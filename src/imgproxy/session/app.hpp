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

#include "imgproxy/session/session_fwd.hpp"
#include <string>
#include <vector>

namespace imgproxy::session
{

// Types.

/**
 * A description of the helper application: what to execute, and how to tell it where its end of the channel is.
 * Aggregate; fill it out directly.  The defaults describe a stock `container-image-proxy` found in `PATH`.
 *
 * The command line built from it (see helper_command_line()) is:
 *
 *   `<m_exec_path> --sockfd=<m_socket_fd_slot> [--quiet] [<m_extra_args>...] <image reference>`
 */
struct Helper_app
{
  // Constants.

  /// Default for #m_exec_path.
  static const fs::path S_DEFAULT_EXEC_PATH;

  // Data.

  /**
   * The executable.  If it contains no slash it is searched for in `PATH` (as a shell would); otherwise it is used
   * as-is, relative to the current working directory if not absolute.
   */
  fs::path m_exec_path = S_DEFAULT_EXEC_PATH;

  /**
   * The descriptor number at which the helper finds its end of the channel.  The helper's copy is `dup2()`ed there
   * just before `exec()`; so whatever that slot would otherwise have inherited (for 0: standard input) is replaced.
   */
  util::native_handle_t m_socket_fd_slot = 0;

  /// If `true` the helper is told (`--quiet`) to suppress its progress output.
  bool m_quiet = false;

  /// Further arguments, placed right before the image reference.
  std::vector<std::string> m_extra_args;
}; // struct Helper_app

// Free functions.

/**
 * Builds the full `argv` (including `argv[0]`, which is Helper_app::m_exec_path) with which to execute the helper
 * so that it fetches the given image.
 *
 * @param helper_app
 *        Helper description.
 * @param image_ref
 *        Image reference, e.g., `docker://quay.io/example/image:latest`.  Passed through verbatim.
 * @return See above.
 */
std::vector<std::string> helper_command_line(const Helper_app& helper_app, util::String_view image_ref);

} // namespace imgproxy::session
