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
#include <imgproxy/protocol/message.hpp>
#include <imgproxy/protocol/error.hpp>
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <gtest/gtest.h>
#include <sstream>

namespace imgproxy::protocol::test
{

namespace
{

using imgproxy::test::test_logger;
using std::string;

Error_code decode(util::String_view payload, bool handle_attached, Reply* reply)
{
  Error_code err_code;
  decode_reply(test_logger(), payload, handle_attached, reply, &err_code);
  return err_code;
}

} // namespace (anon)

TEST(Message, Call_survives_encoding)
{
  Json::Value nested(Json::objectValue);
  nested["k"] = Json::Value(Json::arrayValue);
  nested["k"].append("v");
  nested["k"].append(Json::Value());

  const Call calls[] = { { "GetManifest", {} },
                         { "FinishPipe", { Json::Value(7) } },
                         { "GetBlob", { Json::Value("sha256:0123"), Json::Value(true), Json::Value(-3.5), nested } } };
  for (const auto& call : calls)
  {
    const auto payload = encode_call(call);
    EXPECT_EQ(payload.find('\n'), string::npos);

    Call decoded;
    Error_code err_code;
    decode_call(test_logger(), payload, &decoded, &err_code);
    ASSERT_FALSE(err_code) << payload;
    EXPECT_EQ(decoded.m_method, call.m_method);
    EXPECT_EQ(decoded.m_args, call.m_args);
  }
}

TEST(Message, Call_wire_format)
{
  // args is present even when empty.
  Json::Value root;
  std::istringstream is(encode_call(Call{ "Shutdown", {} }));
  string errs;
  ASSERT_TRUE(Json::parseFromStream(Json::CharReaderBuilder(), is, &root, &errs)) << errs;
  EXPECT_EQ(root.size(), 2u);
  EXPECT_EQ(root["method"], "Shutdown");
  EXPECT_TRUE(root["args"].isArray());
  EXPECT_EQ(root["args"].size(), 0u);
}

TEST(Message, Reply_with_pipe)
{
  Reply reply;
  ASSERT_FALSE(decode(R"({"success":true,"error":"","pipeid":7,"value":"sha256:abc123"})", true, &reply));
  EXPECT_TRUE(reply.m_success);
  EXPECT_EQ(reply.m_error, "");
  EXPECT_EQ(reply.m_pipe_id, 7u);
  EXPECT_EQ(reply.m_value, "sha256:abc123");
}

TEST(Message, Remote_failure_decodes)
{
  Reply reply;
  ASSERT_FALSE(decode(R"({"success":false,"error":"image not found","pipeid":0,"value":null})", false, &reply));
  EXPECT_FALSE(reply.m_success);
  EXPECT_EQ(reply.m_error, "image not found");
  EXPECT_TRUE(reply.m_value.isNull());

  // Round trip through our own encoder too.
  Reply reply2;
  ASSERT_FALSE(decode(encode_reply(reply), false, &reply2));
  EXPECT_EQ(reply2.m_error, "image not found");
}

TEST(Message, Pipe_id_must_match_handle_presence)
{
  Reply reply;
  EXPECT_EQ(decode(R"({"success":true,"error":"","pipeid":0,"value":"d"})", true, &reply),
            error::Code::S_HANDLE_WITHOUT_PIPE_ID);
  EXPECT_EQ(decode(R"({"success":true,"error":"","pipeid":3,"value":"d"})", false, &reply),
            error::Code::S_PIPE_ID_WITHOUT_HANDLE);
  // Also on failure replies.
  EXPECT_EQ(decode(R"({"success":false,"error":"x","pipeid":0,"value":null})", true, &reply),
            error::Code::S_HANDLE_WITHOUT_PIPE_ID);
}

TEST(Message, Malformed_replies)
{
  Reply reply;
  EXPECT_EQ(decode("", false, &reply), error::Code::S_DECODE_BAD_JSON);
  EXPECT_EQ(decode("{\"success\":true", false, &reply), error::Code::S_DECODE_BAD_JSON);
  EXPECT_EQ(decode(R"({"success":true,"error":"","pipeid":0,"value":1} trailing)", false, &reply),
            error::Code::S_DECODE_BAD_JSON);
  EXPECT_EQ(decode(R"({"success":true,"success":true,"error":"","pipeid":0,"value":1})", false, &reply),
            error::Code::S_DECODE_BAD_JSON);
  EXPECT_EQ(decode("[1,2]", false, &reply), error::Code::S_DECODE_BAD_STRUCTURE);
  // Missing fields.
  EXPECT_EQ(decode(R"({"error":"","pipeid":0,"value":1})", false, &reply), error::Code::S_DECODE_BAD_STRUCTURE);
  EXPECT_EQ(decode(R"({"success":true,"error":"","pipeid":0})", false, &reply),
            error::Code::S_DECODE_BAD_STRUCTURE);
  // Wrong types.
  EXPECT_EQ(decode(R"({"success":"yes","error":"","pipeid":0,"value":1})", false, &reply),
            error::Code::S_DECODE_BAD_STRUCTURE);
  EXPECT_EQ(decode(R"({"success":true,"error":null,"pipeid":0,"value":1})", false, &reply),
            error::Code::S_DECODE_BAD_STRUCTURE);
  EXPECT_EQ(decode(R"({"success":true,"error":"","pipeid":-1,"value":1})", false, &reply),
            error::Code::S_DECODE_BAD_STRUCTURE);
  EXPECT_EQ(decode(R"({"success":true,"error":"","pipeid":4294967296,"value":1})", true, &reply),
            error::Code::S_DECODE_BAD_STRUCTURE);
  EXPECT_EQ(decode(R"({"success":true,"error":"","pipeid":"7","value":1})", true, &reply),
            error::Code::S_DECODE_BAD_STRUCTURE);
}

TEST(Message, Malformed_calls)
{
  Call call;
  Error_code err_code;
  decode_call(test_logger(), R"({"method":"GetManifest"})", &call, &err_code);
  EXPECT_EQ(err_code, error::Code::S_DECODE_BAD_STRUCTURE);
  decode_call(test_logger(), R"({"method":5,"args":[]})", &call, &err_code);
  EXPECT_EQ(err_code, error::Code::S_DECODE_BAD_STRUCTURE);
  EXPECT_THROW(decode_call(test_logger(), "nope", &call), flow::error::Runtime_error);
}

TEST(Protocol_error, Codes_stream_and_parse)
{
  const Error_code err_code = error::Code::S_HANDLE_WITHOUT_PIPE_ID;
  EXPECT_EQ(string(err_code.category().name()), "imgproxy/protocol");
  EXPECT_FALSE(err_code.message().empty());
  EXPECT_EQ(flow::util::ostream_op_string(error::Code::S_DECODE_BAD_JSON), "DECODE_BAD_JSON");

  std::istringstream is("PIPE_ID_WITHOUT_HANDLE");
  auto code = error::Code::S_DECODE_BAD_JSON;
  is >> code;
  EXPECT_EQ(code, error::Code::S_PIPE_ID_WITHOUT_HANDLE);
}

} // namespace imgproxy::protocol::test
