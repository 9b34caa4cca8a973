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

#include <imgproxy/transport/seqpacket_channel.hpp>
#include <imgproxy/transport/error.hpp>
#include <imgproxy/protocol/message.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/config.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <iostream>
#include <map>
#include <vector>
#include <csignal>
#include <fcntl.h>
#include <unistd.h>

/* A stand-in for the real image proxy helper, for the unit tests.  It speaks the helper side of the protocol over
 * the channel end it finds at --sockfd=N, and behaves per the scenario named by its image reference, e.g.,
 * `test:manifest`.  It checks the client's side of the conversation too: if the client misbehaves, it exits
 * non-zero upon Shutdown, so tests see the violation via Proxy_session::shutdown().
 *
 * Bodies are written into a pipe only once the client has sent FinishPipe for it, and only then is FinishPipe
 * answered; so a client that insists on draining before acknowledging deadlocks here. */

namespace
{

using imgproxy::Error_code;
using imgproxy::util::Owned_native_handle;
using imgproxy::util::pipe_id_t;
using imgproxy::util::String_view;
using imgproxy::transport::Seqpacket_channel;
using imgproxy::protocol::Call;
using imgproxy::protocol::Reply;
using std::string;

// Exit codes.
constexpr int S_EXIT_OK = 0;
constexpr int S_EXIT_USAGE = 2;
constexpr int S_EXIT_CHANNEL_ERROR = 3;
constexpr int S_EXIT_CLIENT_MISBEHAVED = 4;

/// The scenario-specific manifest; its digest; the one pipe ID the plain scenario hands out first.
const string S_MANIFEST = "{\"schemaVersion\":2,\"mediaType\":\"application/vnd.oci.image.manifest.v1+json\"}";
const string S_MANIFEST_DIGEST = "sha256:abc123";
constexpr pipe_id_t S_FIRST_PIPE_ID = 7;
constexpr size_t S_BIG_BODY_SZ = 1024 * 1024;

/// Deterministic body of `size` bytes.
string make_body(size_t size)
{
  string body(size, '\0');
  for (size_t idx = 0; idx != size; ++idx)
  {
    body[idx] = char(idx % 251);
  }
  return body;
}

/// The helper.
class Fake_helper
{
public:
  Fake_helper(flow::log::Logger* logger_ptr, Owned_native_handle&& sock, const string& scenario, bool quiet) :
    m_logger_ptr(logger_ptr),
    m_channel(logger_ptr, "fake_helper", std::move(sock)),
    m_scenario(scenario),
    m_quiet(quiet),
    m_next_pipe_id(S_FIRST_PIPE_ID),
    m_misbehaved(false),
    m_finished_first_pipe(false),
    m_n_failed_calls(0)
  {
    // Nothing else.
  }

  /// Serves calls until Shutdown or channel closure; returns the exit code.
  int run()
  {
    using imgproxy::transport::error::Code;

    while (true)
    {
      string payload;
      std::optional<Owned_native_handle> handle_or_none;
      Error_code err_code;
      m_channel.sync_receive(&payload, &handle_or_none, &err_code);
      if (err_code == Code::S_RECEIVE_PEER_CLOSED)
      {
        return m_misbehaved ? S_EXIT_CLIENT_MISBEHAVED : S_EXIT_OK;
      }
      if (err_code)
      {
        return S_EXIT_CHANNEL_ERROR;
      }
      // else

      if (handle_or_none)
      {
        m_misbehaved = true; // Client never sends handles.
      }

      Call call;
      imgproxy::protocol::decode_call(m_logger_ptr, payload, &call, &err_code);
      if (err_code)
      {
        return S_EXIT_CLIENT_MISBEHAVED;
      }
      // else

      int exit_code;
      if (!dispatch(call, &exit_code))
      {
        return exit_code;
      }
    }
  } // run()

private:
  struct Pending_pipe
  {
    Owned_native_handle m_write_end;
    string m_body;
  };

  /// Handles one call; returns `false` (and sets `*exit_code`) if we should exit now.
  bool dispatch(const Call& call, int* exit_code)
  {
    using imgproxy::protocol::S_METHOD_GET_MANIFEST;
    using imgproxy::protocol::S_METHOD_GET_BLOB;
    using imgproxy::protocol::S_METHOD_FINISH_PIPE;
    using imgproxy::protocol::S_METHOD_SHUTDOWN;

    if (call.m_method == S_METHOD_SHUTDOWN)
    {
      return on_shutdown(call, exit_code);
    }
    // else

    if ((m_scenario == "test:remote-error") || (m_scenario == "test:remote-error-then-ok"))
    {
      if ((m_scenario == "test:remote-error") && (call.m_method == S_METHOD_FINISH_PIPE))
      {
        m_misbehaved = true; // Nothing was handed out; so nothing to finish.
      }
      if ((m_scenario == "test:remote-error") || (m_n_failed_calls++ == 0))
      {
        return reply_error("image not found", exit_code);
      }
    }
    // else

    if (call.m_method == S_METHOD_GET_MANIFEST)
    {
      if (!call.m_args.empty())
      {
        m_misbehaved = true;
      }
      return on_get_manifest(exit_code);
    }
    // else
    if (call.m_method == S_METHOD_GET_BLOB)
    {
      if ((call.m_args.size() != 1) || (!call.m_args[0].isString()))
      {
        m_misbehaved = true;
        return reply_error("GetBlob: bad args", exit_code);
      }
      // else
      return on_get_blob(call.m_args[0].asString(), exit_code);
    }
    // else
    if (call.m_method == S_METHOD_FINISH_PIPE)
    {
      if ((call.m_args.size() != 1) || (!call.m_args[0].isUInt()))
      {
        m_misbehaved = true;
        return reply_error("FinishPipe: bad args", exit_code);
      }
      // else
      return on_finish_pipe(call.m_args[0].asUInt(), exit_code);
    }
    // else

    m_misbehaved = true;
    return reply_error("unknown method " + call.m_method, exit_code);
  } // dispatch()

  bool on_get_manifest(int* exit_code)
  {
    Reply reply;
    reply.m_success = true;
    reply.m_value = S_MANIFEST_DIGEST;

    if (m_scenario == "test:bad-json")
    {
      return send_raw("{\"success\": true, \"pipeid\": ", exit_code);
    }
    // else
    if (m_scenario == "test:no-handle")
    {
      return send_reply(reply, nullptr, exit_code);
    }
    // else
    if (m_scenario == "test:pipe-id-without-handle")
    {
      reply.m_pipe_id = 5;
      return send_reply(reply, nullptr, exit_code);
    }
    // else
    if (m_scenario == "test:bad-value")
    {
      reply.m_value = 42;
    }
    const auto body = (m_scenario == "test:write-after-finish") ? make_body(S_BIG_BODY_SZ) : S_MANIFEST;
    return reply_with_pipe(std::move(reply), body, exit_code);
  }

  bool on_get_blob(const string& digest, int* exit_code)
  {
    const auto body = "blob:" + digest + ':' + make_body(200 * 1000);
    Reply reply;
    reply.m_success = true;
    if (m_scenario == "test:blob-unknown-size")
    {
      reply.m_value = -1;
    }
    else if (m_scenario == "test:blob-size-mismatch")
    {
      reply.m_value = Json::Int64(body.size() + 1);
    }
    else
    {
      reply.m_value = Json::Int64(body.size());
    }
    return reply_with_pipe(std::move(reply), body, exit_code);
  }

  bool on_finish_pipe(pipe_id_t pipe_id, int* exit_code)
  {
    const auto it = m_pending_pipes.find(pipe_id);
    if (it == m_pending_pipes.end())
    {
      m_misbehaved = true;
      return reply_error("pipe not found", exit_code);
    }
    // else

    auto pending = std::move(it->second);
    m_pending_pipes.erase(it);
    if (pipe_id == S_FIRST_PIPE_ID)
    {
      m_finished_first_pipe = true;
    }

    if (m_scenario == "test:finish-pipe-fails-writer-open")
    {
      // Keep the write end (and thus the client's read end) open across the failure and beyond.
      m_held_write_ends.push_back(std::move(pending.m_write_end));
      return reply_error("pipe finish failed", exit_code);
    }
    // else
    if (m_scenario == "test:finish-pipe-fails")
    {
      // pending.m_write_end closed with nothing written: client sees empty body.
      return reply_error("pipe finish failed", exit_code);
    }
    // else

    // Blocks until client has drained enough (if body exceeds pipe capacity).
    const char* data = pending.m_body.data();
    size_t left = pending.m_body.size();
    while (left != 0)
    {
      const auto n_written = ::write(pending.m_write_end.native_handle(), data, left);
      if (n_written == -1)
      {
        if (errno == EINTR)
        {
          continue;
        }
        // else
        m_misbehaved = true; // EPIPE: client closed its read end early.
        break;
      }
      // else
      data += n_written;
      left -= size_t(n_written);
    }
    pending.m_write_end = Owned_native_handle(); // EOF for the client.

    Reply reply;
    reply.m_success = true;
    if (m_scenario == "test:unexpected-handle-on-finish")
    {
      int fds[2];
      if (::pipe2(fds, O_CLOEXEC) == -1)
      {
        *exit_code = S_EXIT_CHANNEL_ERROR;
        return false;
      }
      // else
      const Owned_native_handle rd(fds[0]);
      const Owned_native_handle wr(fds[1]);
      reply.m_pipe_id = 99;
      return send_reply(reply, &rd, exit_code);
    }
    // else
    return send_reply(reply, nullptr, exit_code);
  } // on_finish_pipe()

  bool on_shutdown(const Call& call, int* exit_code)
  {
    if (!call.m_args.empty())
    {
      m_misbehaved = true;
    }
    if ((m_scenario == "test:manifest") && (!m_finished_first_pipe))
    {
      m_misbehaved = true; // The client must have acknowledged the manifest pipe.
    }
    if ((m_scenario == "test:expect-quiet") && (!m_quiet))
    {
      m_misbehaved = true;
    }

    if (m_scenario == "test:killed")
    {
      ::kill(::getpid(), SIGKILL);
    }
    if (m_scenario == "test:exit-without-reply")
    {
      *exit_code = S_EXIT_OK;
      return false;
    }
    // else

    bool ok;
    if (m_scenario == "test:shutdown-remote-error")
    {
      ok = reply_error("shutdown refused", exit_code);
    }
    else
    {
      Reply reply;
      reply.m_success = true;
      ok = send_reply(reply, nullptr, exit_code);
    }
    if (!ok)
    {
      return false;
    }
    // else

    if (m_scenario == "test:exit-137")
    {
      *exit_code = 137;
    }
    else
    {
      *exit_code = m_misbehaved ? S_EXIT_CLIENT_MISBEHAVED : S_EXIT_OK;
    }
    return false;
  } // on_shutdown()

  bool reply_with_pipe(Reply&& reply, const string& body, int* exit_code)
  {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) == -1)
    {
      *exit_code = S_EXIT_CHANNEL_ERROR;
      return false;
    }
    // else
    const Owned_native_handle read_end(fds[0]);
    Pending_pipe pending{ Owned_native_handle(fds[1]), body };

    if (m_scenario == "test:handle-without-pipe-id")
    {
      reply.m_pipe_id = 0;
      return send_reply(reply, &read_end, exit_code);
    }
    // else

    reply.m_pipe_id = m_next_pipe_id++;
    m_pending_pipes.emplace(reply.m_pipe_id, std::move(pending));
    return send_reply(reply, &read_end, exit_code);
    // Our copy of read end closed here; client has its own.
  }

  bool reply_error(const string& msg, int* exit_code)
  {
    Reply reply;
    reply.m_success = false;
    reply.m_error = msg;
    return send_reply(reply, nullptr, exit_code);
  }

  bool send_reply(const Reply& reply, const Owned_native_handle* handle_or_null, int* exit_code)
  {
    const auto payload = imgproxy::protocol::encode_reply(reply);
    Error_code err_code;
    if (handle_or_null)
    {
      m_channel.send_with_native_handle(payload, *handle_or_null, &err_code);
    }
    else
    {
      m_channel.send(payload, &err_code);
    }
    if (err_code)
    {
      *exit_code = S_EXIT_CHANNEL_ERROR;
      return false;
    }
    // else
    return true;
  }

  bool send_raw(String_view payload, int* exit_code)
  {
    Error_code err_code;
    m_channel.send(payload, &err_code);
    if (err_code)
    {
      *exit_code = S_EXIT_CHANNEL_ERROR;
      return false;
    }
    // else
    return true;
  }

  flow::log::Logger* const m_logger_ptr;
  Seqpacket_channel m_channel;
  const string m_scenario;
  const bool m_quiet;
  pipe_id_t m_next_pipe_id;
  std::map<pipe_id_t, Pending_pipe> m_pending_pipes;
  std::vector<Owned_native_handle> m_held_write_ends;
  bool m_misbehaved;
  bool m_finished_first_pipe;
  unsigned int m_n_failed_calls;
}; // class Fake_helper

} // namespace (anon)

int main(int argc, char const * const * argv)
{
  using flow::log::Simple_ostream_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using boost::lexical_cast;
  using boost::bad_lexical_cast;
  using boost::algorithm::starts_with;

  // Writes into a pipe the client closed early must yield EPIPE, not death.
  ::signal(SIGPIPE, SIG_IGN);

  int sock_fd = -1;
  bool quiet = false;
  string image_ref;
  for (int idx = 1; idx != argc; ++idx)
  {
    const string arg(argv[idx]);
    if (starts_with(arg, "--sockfd="))
    {
      try
      {
        sock_fd = lexical_cast<int>(arg.substr(string("--sockfd=").size()));
      }
      catch (const bad_lexical_cast&)
      {
        return S_EXIT_USAGE;
      }
    }
    else if (arg == "--quiet")
    {
      quiet = true;
    }
    else if (!starts_with(arg, "-"))
    {
      image_ref = arg;
    }
  }
  if ((sock_fd < 0) || image_ref.empty())
  {
    std::cerr << "Usage: " << argv[0] << " --sockfd=N [--quiet] IMAGE\n";
    return S_EXIT_USAGE;
  }
  // else

  Config log_config;
  log_config.init_component_to_union_idx_mapping<imgproxy::Log_component>(2000, 999);
  log_config.init_component_names<imgproxy::Log_component>(imgproxy::S_IMGPROXY_LOG_COMPONENT_NAME_MAP, false,
                                                           "fake_helper-");
  log_config.configure_default_verbosity(Sev::S_WARNING, true);
  Simple_ostream_logger logger(&log_config, std::cerr, std::cerr);

  // Don't leak the channel to any child of ours (we have none, but still).
  ::fcntl(sock_fd, F_SETFD, FD_CLOEXEC);

  Fake_helper helper(&logger, Owned_native_handle(sock_fd), image_ref, quiet);
  return helper.run();
} // main()
