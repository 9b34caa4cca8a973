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
#include "imgproxy/protocol/message.hpp"
#include "imgproxy/protocol/error.hpp"
#include <flow/error/error.hpp>
#include <memory>

namespace imgproxy::protocol
{

// Local helpers.

namespace
{

/* The JSON dialect: strict parsing (no comments, no trailing garbage, no duplicate keys, object or array root),
 * compact writing (no indentation or newlines). */

const Json::StreamWriterBuilder& writer_builder()
{
  static const Json::StreamWriterBuilder s_builder = []()
  {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return builder;
  }();
  return s_builder;
}

/**
 * Parses `payload` as a JSON object into `*root`; on failure logs and sets `*err_code`.
 *
 * @param logger_ptr
 *        Logger.
 * @param what
 *        "call" or "reply", for logging.
 * @param payload
 *        Bytes.
 * @param root
 *        Target.
 * @param err_code
 *        Not null.
 */
void parse_object(flow::log::Logger* logger_ptr, util::String_view what, util::String_view payload,
                  Json::Value* root, Error_code* err_code)
{
  using std::unique_ptr;
  using std::string;

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_PROTOCOL);

  Json::CharReaderBuilder builder;
  Json::CharReaderBuilder::strictMode(&builder.settings_);
  const unique_ptr<Json::CharReader> reader(builder.newCharReader());

  string errs;
  if (!reader->parse(payload.data(), payload.data() + payload.size(), root, &errs))
  {
    *err_code = error::Code::S_DECODE_BAD_JSON;
    FLOW_LOG_WARNING("Decoding [" << what << "] of [" << payload.size() << "] bytes: JSON parser said "
                     "[" << errs << "]: [" << *err_code << "] [" << err_code->message() << "].  "
                     "Payload: [" << payload.substr(0, 256) << "].");
    return;
  }
  // else
  if (!root->isObject())
  {
    *err_code = error::Code::S_DECODE_BAD_STRUCTURE;
    FLOW_LOG_WARNING("Decoding [" << what << "]: root is not a JSON object: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else
  err_code->clear();
} // parse_object()

/**
 * Checks that `root[key]` exists and satisfies `type_ok`; on failure logs and sets `*err_code`.
 *
 * @param logger_ptr
 *        Logger.
 * @param what
 *        "call" or "reply", for logging.
 * @param root
 *        JSON object.
 * @param key
 *        Member name.
 * @param type_desc
 *        Expected type, for logging.
 * @param type_ok
 *        Type predicate.
 * @param err_code
 *        Not null.
 * @return `true` if and only if OK.
 */
bool check_member(flow::log::Logger* logger_ptr, util::String_view what, const Json::Value& root, const char* key,
                  util::String_view type_desc, bool (Json::Value::*type_ok)() const, Error_code* err_code)
{
  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_PROTOCOL);

  if (!root.isMember(key))
  {
    *err_code = error::Code::S_DECODE_BAD_STRUCTURE;
    FLOW_LOG_WARNING("Decoding [" << what << "]: required field [" << key << "] absent: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else
  if (type_ok && (!(root[key].*type_ok)()))
  {
    *err_code = error::Code::S_DECODE_BAD_STRUCTURE;
    FLOW_LOG_WARNING("Decoding [" << what << "]: field [" << key << "] is not of type [" << type_desc << "]: "
                     "[" << *err_code << "] [" << err_code->message() << "].");
    return false;
  }
  // else
  return true;
} // check_member()

} // namespace (anon)

// Implementations.

std::string encode_call(const Call& call)
{
  Json::Value root(Json::objectValue);
  root["method"] = call.m_method;
  auto& args = root["args"] = Json::Value(Json::arrayValue);
  for (const auto& arg : call.m_args)
  {
    args.append(arg);
  }
  return Json::writeString(writer_builder(), root);
}

void decode_call(flow::log::Logger* logger_ptr, util::String_view payload, Call* call, Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { decode_call(logger_ptr, payload, call, actual_err_code); },
         err_code, "protocol::decode_call()"))
  {
    return;
  }
  // else

  Json::Value root;
  parse_object(logger_ptr, "call", payload, &root, err_code);
  if (*err_code
      || (!check_member(logger_ptr, "call", root, "method", "string", &Json::Value::isString, err_code))
      || (!check_member(logger_ptr, "call", root, "args", "array", &Json::Value::isArray, err_code)))
  {
    return;
  }
  // else

  call->m_method = root["method"].asString();
  call->m_args.clear();
  for (const auto& arg : root["args"])
  {
    call->m_args.push_back(arg);
  }
  err_code->clear();
} // decode_call()

std::string encode_reply(const Reply& reply)
{
  Json::Value root(Json::objectValue);
  root["success"] = reply.m_success;
  root["error"] = reply.m_error;
  root["pipeid"] = Json::UInt(reply.m_pipe_id);
  root["value"] = reply.m_value;
  return Json::writeString(writer_builder(), root);
}

void decode_reply(flow::log::Logger* logger_ptr, util::String_view payload, bool handle_attached, Reply* reply,
                  Error_code* err_code)
{
  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code)
           { decode_reply(logger_ptr, payload, handle_attached, reply, actual_err_code); },
         err_code, "protocol::decode_reply()"))
  {
    return;
  }
  // else

  FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_PROTOCOL);

  Json::Value root;
  parse_object(logger_ptr, "reply", payload, &root, err_code);
  if (*err_code
      || (!check_member(logger_ptr, "reply", root, "success", "bool", &Json::Value::isBool, err_code))
      || (!check_member(logger_ptr, "reply", root, "error", "string", &Json::Value::isString, err_code))
      // isUInt(): any integral value in [0, 2^32).
      || (!check_member(logger_ptr, "reply", root, "pipeid", "uint32", &Json::Value::isUInt, err_code))
      || (!check_member(logger_ptr, "reply", root, "value", "any", nullptr, err_code)))
  {
    return;
  }
  // else

  const util::pipe_id_t pipe_id = root["pipeid"].asUInt();
  if (handle_attached && (pipe_id == 0))
  {
    *err_code = error::Code::S_HANDLE_WITHOUT_PIPE_ID;
  }
  else if ((!handle_attached) && (pipe_id != 0))
  {
    *err_code = error::Code::S_PIPE_ID_WITHOUT_HANDLE;
  }
  if (*err_code)
  {
    FLOW_LOG_WARNING("Decoded reply with pipe-ID [" << pipe_id << "], native handle attached? = "
                     "[" << handle_attached << "]: [" << *err_code << "] [" << err_code->message() << "].");
    return;
  }
  // else

  reply->m_success = root["success"].asBool();
  reply->m_error = root["error"].asString();
  reply->m_pipe_id = pipe_id;
  reply->m_value = std::move(root["value"]);
  err_code->clear();

  FLOW_LOG_TRACE("Decoded reply [" << *reply << "].");
} // decode_reply()

std::ostream& operator<<(std::ostream& os, const Call& val)
{
  return os << "method[" << val.m_method << "] n_args[" << val.m_args.size() << ']';
}

std::ostream& operator<<(std::ostream& os, const Reply& val)
{
  os << "success[" << val.m_success << "] pipeid[" << val.m_pipe_id << ']';
  if (!val.m_success)
  {
    os << " error[" << val.m_error << ']';
  }
  return os;
}

} // namespace imgproxy::protocol
