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

#include "test_common.hpp"
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>
#include <iostream>

namespace imgproxy::test
{

flow::log::Logger* test_logger()
{
  using flow::log::Config;
  using flow::log::Simple_ostream_logger;
  using flow::log::Sev;
  using flow::Flow_log_component;

  static Config s_config = []()
  {
    Config config;
    config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
    config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "test-");
    config.init_component_to_union_idx_mapping<Log_component>(2000, 999);
    config.init_component_names<Log_component>(S_IMGPROXY_LOG_COMPONENT_NAME_MAP, false, "test-");
    config.configure_default_verbosity(Sev::S_WARNING, true);
    return config;
  }();
  static Simple_ostream_logger s_logger(&s_config, std::cerr, std::cerr);
  return &s_logger;
}

size_t count_open_fds()
{
  size_t count = 0;
  for (fs::directory_iterator it("/proc/self/fd"), end; it != end; ++it)
  {
    ++count;
  }
  // Don't count the descriptor the iteration itself had open while listing.
  return count - 1;
}

session::Helper_app fake_helper_app()
{
  session::Helper_app helper_app;
  helper_app.m_exec_path = IMGPROXY_TEST_FAKE_HELPER_PATH;
  return helper_app;
}

} // namespace imgproxy::test
