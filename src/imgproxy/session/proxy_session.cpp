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
#include "imgproxy/session/proxy_session.hpp"
#include "imgproxy/session/detail/pipe_drain.hpp"
#include "imgproxy/session/error.hpp"
#include "imgproxy/protocol/message.hpp"
#include "imgproxy/transport/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <boost/move/make_unique.hpp>

namespace imgproxy::session
{

// Implementations.

Proxy_session::Proxy_session(flow::log::Logger* logger_ptr, const Helper_app& helper_app,
                             util::String_view image_ref) :
  flow::log::Log_context(logger_ptr, Log_component::S_SESSION),
  m_helper_app(helper_app),
  m_image_ref(image_ref),
  m_state(State::S_NULL),
  m_channel(logger_ptr, flow::util::ostream_op_string("proxy_sess[", image_ref, ']'))
{
  FLOW_LOG_TRACE("Proxy session [" << *this << "]: Created.  Helper not yet spawned.");
}

Proxy_session::~Proxy_session()
{
  if (m_state != State::S_OPEN)
  {
    return;
  }
  // else

  FLOW_LOG_INFO("Proxy session [" << *this << "]: Destroying without shutdown.  Closing channel; then awaiting "
                "helper exit.");
  m_channel.close();
  m_helper.reset(); // Its dtor reaps and logs.
}

bool Proxy_session::sync_start(Error_code* err_code)
{
  using util::Owned_native_handle;
  using transport::Seqpacket_channel;
  using boost::movelib::make_unique;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Proxy_session::sync_start, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (m_state != State::S_NULL)
  {
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Start requested, but already started.  Ignoring.");
    return false;
  }
  // else

  FLOW_LOG_INFO("Proxy session [" << *this << "]: Starting: helper [" << m_helper_app << "].");

  Owned_native_handle remote_end;
  Seqpacket_channel::create_pair(&m_channel, &remote_end, err_code);
  if (*err_code)
  {
    return true;
  }
  // else

  auto helper = make_unique<Helper_process>(get_logger(), m_helper_app, m_image_ref, std::move(remote_end),
                                            err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Could not spawn helper: "
                     "[" << *err_code << "] [" << err_code->message() << "].  Staying in NULL state.");
    m_channel.close();
    return true;
  }
  // else

  m_helper = std::move(helper);
  m_state = State::S_OPEN;
  FLOW_LOG_INFO("Proxy session [" << *this << "]: Started.");
  return true;
} // Proxy_session::sync_start()

bool Proxy_session::get_manifest(Manifest_result* result, Error_code* err_code)
{
  using protocol::Call;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Proxy_session::get_manifest, result, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(result);
  if (!check_open("get-manifest"))
  {
    return false;
  }
  // else

  Call call{ std::string(protocol::S_METHOD_GET_MANIFEST), {} };
  Json::Value value;
  call_with_pipe(call, "digest string", [](const Json::Value& val) { return val.isString(); },
                 &value, &result->m_content, err_code);
  if (*err_code)
  {
    return true;
  }
  // else

  result->m_digest = value.asString();
  FLOW_LOG_INFO("Proxy session [" << *this << "]: Got manifest [" << result->m_digest << "] of "
                "[" << result->m_content.size() << "] bytes.");
  return true;
} // Proxy_session::get_manifest()

bool Proxy_session::get_blob(util::String_view digest, Blob_result* result, Error_code* err_code)
{
  using protocol::Call;
  using std::string;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Proxy_session::get_blob, digest, result, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  assert(result);
  if (!check_open("get-blob"))
  {
    return false;
  }
  // else

  Call call{ string(protocol::S_METHOD_GET_BLOB), { Json::Value(string(digest)) } };
  Json::Value value;
  call_with_pipe(call, "size (integer >= -1)",
                 [](const Json::Value& val) { return val.isInt64() && (val.asInt64() >= -1); },
                 &value, &result->m_content, err_code);
  if (*err_code)
  {
    return true;
  }
  // else

  result->m_digest = string(digest);
  result->m_announced_size = value.asInt64();
  if ((result->m_announced_size != -1) && (uint64_t(result->m_announced_size) != result->m_content.size()))
  {
    *err_code = error::Code::S_PROTOCOL_BLOB_SIZE_MISMATCH;
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Blob [" << digest << "]: helper announced "
                     "[" << result->m_announced_size << "] bytes, but pipe yielded [" << result->m_content.size() << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return true;
  }
  // else

  FLOW_LOG_INFO("Proxy session [" << *this << "]: Got blob [" << digest << "] of "
                "[" << result->m_content.size() << "] bytes.");
  return true;
} // Proxy_session::get_blob()

bool Proxy_session::finish_pipe(util::pipe_id_t pipe_id, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Proxy_session::finish_pipe, pipe_id, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!check_open("finish-pipe"))
  {
    return false;
  }
  // else

  finish_pipe_impl(pipe_id, err_code);
  return true;
}

void Proxy_session::finish_pipe_impl(util::pipe_id_t pipe_id, Error_code* err_code)
{
  using protocol::Call;
  using protocol::Reply;

  Call call{ std::string(protocol::S_METHOD_FINISH_PIPE), { Json::Value(Json::UInt(pipe_id)) } };
  Reply reply;
  call_no_pipe(call, &reply, err_code);
}

bool Proxy_session::shutdown(Error_code* err_code)
{
  using protocol::Call;
  using protocol::Reply;

  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, Proxy_session::shutdown, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!check_open("shutdown"))
  {
    return false;
  }
  // else

  FLOW_LOG_INFO("Proxy session [" << *this << "]: Shutting down.");
  m_state = State::S_SHUT_DOWN;

  Error_code call_err_code;
  Reply reply;
  call_no_pipe(Call{ std::string(protocol::S_METHOD_SHUTDOWN), {} }, &reply, &call_err_code);
  if (call_err_code == transport::error::Code::S_RECEIVE_PEER_CLOSED)
  {
    FLOW_LOG_INFO("Proxy session [" << *this << "]: Helper closed channel instead of replying to shutdown "
                  "request.  Its exit status shall decide the outcome.");
    call_err_code.clear();
  }

  m_channel.close();

  Error_code exit_err_code;
  m_helper->wait_exit(&exit_err_code);

  if (call_err_code)
  {
    if (exit_err_code)
    {
      FLOW_LOG_WARNING("Proxy session [" << *this << "]: Shutdown request failed, and helper exited abnormally too "
                       "([" << exit_err_code << "] [" << exit_err_code.message() << "]); "
                       "reporting the former.");
    }
    *err_code = call_err_code;
  }
  else
  {
    *err_code = exit_err_code;
  }

  if (*err_code)
  {
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Shut down with error: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
  }
  else
  {
    FLOW_LOG_INFO("Proxy session [" << *this << "]: Shut down cleanly.");
  }
  return true;
} // Proxy_session::shutdown()

void Proxy_session::call(const protocol::Call& call, protocol::Reply* reply, Native_handle_or_none* handle_or_none,
                         Error_code* err_code)
{
  using std::string;

  FLOW_LOG_TRACE("Proxy session [" << *this << "]: Call [" << call << "]: sending.");

  handle_or_none->reset();
  m_channel.send(protocol::encode_call(call), err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Call [" << call << "]: send failed; see above.");
    return;
  }
  // else

  string payload;
  m_channel.sync_receive(&payload, handle_or_none, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Call [" << call << "]: receiving reply failed: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  protocol::decode_reply(get_logger(), payload, bool(*handle_or_none), reply, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Call [" << call << "]: bad reply; closing received handle "
                     "(if any).");
    handle_or_none->reset();
    return;
  }
  // else

  if (!reply->m_success)
  {
    m_last_remote_error = reply->m_error;
    *err_code = error::Code::S_REMOTE_ERROR;
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Call [" << call << "]: helper replied with error "
                     "[" << reply->m_error << "].");
    handle_or_none->reset();
    return;
  }
  // else

  FLOW_LOG_TRACE("Proxy session [" << *this << "]: Call [" << call << "]: got reply [" << *reply << "].");
} // Proxy_session::call()

void Proxy_session::call_no_pipe(const protocol::Call& call, protocol::Reply* reply, Error_code* err_code)
{
  Native_handle_or_none handle_or_none;
  this->call(call, reply, &handle_or_none, err_code);
  if ((!*err_code) && handle_or_none)
  {
    *err_code = error::Code::S_PROTOCOL_UNEXPECTED_HANDLE;
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Call [" << call << "]: reply carried handle "
                     "[" << *handle_or_none << "] (pipe-ID [" << reply->m_pipe_id << "]), but none is expected; "
                     "closing it: [" << *err_code << "] [" << err_code->message() << "].");
  }
  // handle_or_none (if any) closed here.
}

void Proxy_session::call_with_pipe(const protocol::Call& call, util::String_view value_type,
                                   const flow::Function<bool (const Json::Value&)>& value_ok,
                                   Json::Value* value, util::Blob* content, Error_code* err_code)
{
  using protocol::Reply;

  Reply reply;
  Native_handle_or_none handle_or_none;
  this->call(call, &reply, &handle_or_none, err_code);
  if (*err_code)
  {
    return;
  }
  // else

  if (!handle_or_none)
  {
    *err_code = error::Code::S_PROTOCOL_MISSING_HANDLE;
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Call [" << call << "]: reply carried no pipe: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else
  if (!value_ok(reply.m_value))
  {
    *err_code = error::Code::S_PROTOCOL_BAD_VALUE;
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Call [" << call << "]: reply value is not "
                     "[" << value_type << "]; closing pipe [" << reply.m_pipe_id << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  const auto pipe_id = reply.m_pipe_id;
  detail::sync_drain_pipe_with_handshake(get_logger(), std::move(*handle_or_none), pipe_id,
                                         [&](Error_code* handshake_err_code)
  {
    finish_pipe_impl(pipe_id, handshake_err_code);
  }, content, err_code);
  if (*err_code)
  {
    FLOW_LOG_WARNING("Proxy session [" << *this << "]: Call [" << call << "]: transfer through pipe "
                     "[" << pipe_id << "] failed; see above.");
    return;
  }
  // else

  *value = std::move(reply.m_value);
} // Proxy_session::call_with_pipe()

bool Proxy_session::check_open(util::String_view op_name) const
{
  if (m_state == State::S_OPEN)
  {
    return true;
  }
  // else
  FLOW_LOG_WARNING("Proxy session [" << *this << "]: Operation [" << op_name << "] requested, but session is "
                   "not open (not started or already shut down).  Ignoring.");
  return false;
}

const std::string& Proxy_session::last_remote_error() const
{
  return m_last_remote_error;
}

const Helper_app& Proxy_session::helper_app() const
{
  return m_helper_app;
}

const std::string& Proxy_session::image_ref() const
{
  return m_image_ref;
}

process_id_t Proxy_session::helper_pid() const
{
  return m_helper ? m_helper->pid() : 0;
}

std::ostream& operator<<(std::ostream& os, const Proxy_session& val)
{
  return os << '[' << val.image_ref() << " | helper_pid=" << val.helper_pid() << "]@"
            << static_cast<const void*>(&val);
}

} // namespace imgproxy::session
