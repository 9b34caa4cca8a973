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

#include <imgproxy/session/proxy_session.hpp>
#include <imgproxy/session/error.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>
#include <flow/error/error.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <iostream>
#include <sstream>
#include <cstdlib>

namespace
{

/// Prints usage to `os`.
void print_usage(std::ostream& os, const char* argv0)
{
  os << "Usage: " << argv0 << " [--helper=PATH] [--quiet] [--verbosity=SEV] [--blob=DIGEST]... IMAGE\n"
        "  IMAGE            image reference handed to the helper (e.g., docker://quay.io/example/image:latest)\n"
        "  --helper=PATH    helper executable (default: $IMGPROXY_HELPER, else container-image-proxy via PATH)\n"
        "  --quiet          tell the helper to suppress its progress output\n"
        "  --verbosity=SEV  log severity: NONE, FATAL, ERROR, WARNING (default), INFO, DATA, TRACE\n"
        "  --blob=DIGEST    after the manifest also fetch this blob (may be repeated)\n";
}

} // namespace (anon)

/* Fetches the manifest (and optionally some blobs) of the given image via the image proxy helper; prints
 * the digest and size of each.  Logs go to stderr; results to stdout, and only once everything succeeded. */
int main(int argc, char const * const * argv)
{
  using imgproxy::session::Helper_app;
  using imgproxy::session::Proxy_session;
  using imgproxy::session::Manifest_result;
  using imgproxy::session::Blob_result;
  using flow::log::Simple_ostream_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Flow_log_component;
  using flow::error::Runtime_error;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::starts_with;
  using std::string;
  using std::vector;
  using std::cerr;
  using std::cout;
  using std::exception;

  constexpr int BAD_EXIT = 1;
  constexpr int USAGE_EXIT = 2;
  constexpr char HELPER_ENV_VAR[] = "IMGPROXY_HELPER";

  Helper_app helper_app;
  if (const char* const env_helper = std::getenv(HELPER_ENV_VAR))
  {
    helper_app.m_exec_path = env_helper;
  }
  Sev verbosity = Sev::S_WARNING;
  vector<string> blob_digests;
  vector<string> positionals;

  for (int idx = 1; idx != argc; ++idx)
  {
    const string arg(argv[idx]);
    if (starts_with(arg, "--helper="))
    {
      helper_app.m_exec_path = arg.substr(string("--helper=").size());
    }
    else if (arg == "--quiet")
    {
      helper_app.m_quiet = true;
    }
    else if (starts_with(arg, "--verbosity="))
    {
      try
      {
        verbosity = lexical_cast<Sev>(arg.substr(string("--verbosity=").size()));
      }
      catch (const bad_lexical_cast&)
      {
        cerr << "Bad severity in [" << arg << "].\n";
        print_usage(cerr, argv[0]);
        return USAGE_EXIT;
      }
    }
    else if (starts_with(arg, "--blob="))
    {
      blob_digests.push_back(arg.substr(string("--blob=").size()));
    }
    else if ((arg == "--help") || (arg == "-h"))
    {
      print_usage(cout, argv[0]);
      return 0;
    }
    else if (starts_with(arg, "-"))
    {
      cerr << "Unknown option [" << arg << "].\n";
      print_usage(cerr, argv[0]);
      return USAGE_EXIT;
    }
    else
    {
      positionals.push_back(arg);
    }
  } // for (idx)

  if (positionals.size() != 1)
  {
    print_usage(cerr, argv[0]);
    return USAGE_EXIT;
  }
  // else
  const auto& image_ref = positionals.front();

  // Set up logging.  Everything goes to stderr: stdout is for results.
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "imgproxy-");
  std_log_config.init_component_to_union_idx_mapping<imgproxy::Log_component>(2000, 999);
  std_log_config.init_component_names<imgproxy::Log_component>(imgproxy::S_IMGPROXY_LOG_COMPONENT_NAME_MAP, false,
                                                               "imgproxy-");
  std_log_config.configure_default_verbosity(verbosity, true);
  Simple_ostream_logger std_logger(&std_log_config, cerr, cerr);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  Proxy_session session(&std_logger, helper_app, image_ref);
  try
  {
    session.sync_start();

    Manifest_result manifest;
    session.get_manifest(&manifest);

    vector<Blob_result> blobs(blob_digests.size());
    for (size_t idx = 0; idx != blob_digests.size(); ++idx)
    {
      session.get_blob(blob_digests[idx], &blobs[idx]);
    }

    session.shutdown();

    std::ostringstream out;
    out << "digest: " << manifest.m_digest << " (" << manifest.m_content.size() << " bytes)\n";
    for (const auto& blob : blobs)
    {
      out << "digest: " << blob.m_digest << " (" << blob.m_content.size() << " bytes)\n";
    }
    cout << out.str() << std::flush;
  } // try
  catch (const Runtime_error& exc)
  {
    cerr << argv[0] << ": " << image_ref << ": error [" << exc.code() << "] [" << exc.code().message() << "]";
    if (exc.code() == imgproxy::session::error::Code::S_REMOTE_ERROR)
    {
      cerr << ": helper says [" << session.last_remote_error() << ']';
    }
    cerr << '\n';
    FLOW_LOG_INFO("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }
  catch (const exception& exc)
  {
    cerr << argv[0] << ": " << image_ref << ": " << exc.what() << '\n';
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
