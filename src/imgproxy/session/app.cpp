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
#include "imgproxy/session/app.hpp"
#include <boost/algorithm/string/join.hpp>

namespace imgproxy::session
{

// Static initializations.

const fs::path Helper_app::S_DEFAULT_EXEC_PATH = "container-image-proxy";

// Implementations.

std::vector<std::string> helper_command_line(const Helper_app& helper_app, util::String_view image_ref)
{
  using std::string;
  using std::to_string;

  std::vector<string> argv{ helper_app.m_exec_path.string(),
                            "--sockfd=" + to_string(helper_app.m_socket_fd_slot) };
  if (helper_app.m_quiet)
  {
    argv.emplace_back("--quiet");
  }
  argv.insert(argv.end(), helper_app.m_extra_args.begin(), helper_app.m_extra_args.end());
  argv.emplace_back(image_ref);
  return argv;
}

std::ostream& operator<<(std::ostream& os, const Helper_app& val)
{
  using boost::algorithm::join;

  os << "exec[" << val.m_exec_path.string() << "] sockfd[" << val.m_socket_fd_slot << ']';
  if (val.m_quiet)
  {
    os << " quiet";
  }
  if (!val.m_extra_args.empty())
  {
    os << " extra_args[" << join(val.m_extra_args, " ") << ']';
  }
  return os;
}

} // namespace imgproxy::session
