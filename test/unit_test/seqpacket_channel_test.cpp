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
#include <imgproxy/transport/seqpacket_channel.hpp>
#include <imgproxy/transport/error.hpp>
#include <flow/error/error.hpp>
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <memory>

namespace imgproxy::transport::test
{

namespace
{

using util::Owned_native_handle;
using imgproxy::test::test_logger;
using imgproxy::test::count_open_fds;
using std::string;
using std::optional;

/// A connected pair of channels, as if one were in the helper.
struct Channel_pair
{
  Channel_pair() :
    m_local(test_logger(), "local")
  {
    Owned_native_handle remote_end;
    Error_code err_code;
    EXPECT_TRUE(Seqpacket_channel::create_pair(&m_local, &remote_end, &err_code));
    EXPECT_FALSE(err_code) << err_code.message();
    m_remote_fd = remote_end.native_handle();
    m_remote = std::make_unique<Seqpacket_channel>(test_logger(), "remote", std::move(remote_end));
  }

  Seqpacket_channel m_local;
  std::unique_ptr<Seqpacket_channel> m_remote;
  int m_remote_fd;
};

} // namespace (anon)

TEST(Seqpacket_channel, Message_boundaries_preserved)
{
  Channel_pair chans;
  chans.m_remote->send("first");
  chans.m_remote->send("second message");

  string msg;
  optional<Owned_native_handle> handle;
  chans.m_local.sync_receive(&msg, &handle);
  EXPECT_EQ(msg, "first");
  EXPECT_FALSE(handle);
  chans.m_local.sync_receive(&msg, &handle);
  EXPECT_EQ(msg, "second message");
  EXPECT_FALSE(handle);

  // Other direction.
  chans.m_local.send("{\"method\":\"Shutdown\",\"args\":[]}");
  chans.m_remote->sync_receive(&msg, &handle);
  EXPECT_EQ(msg, "{\"method\":\"Shutdown\",\"args\":[]}");
}

TEST(Seqpacket_channel, Native_handle_crosses_channel)
{
  Channel_pair chans;

  int fds[2];
  ASSERT_EQ(::pipe2(fds, O_CLOEXEC), 0);
  const Owned_native_handle pipe_rd(fds[0]);
  Owned_native_handle pipe_wr(fds[1]);

  chans.m_remote->send_with_native_handle("here is a pipe", pipe_rd);
  // Our copy stays open.
  EXPECT_NE(::fcntl(pipe_rd.native_handle(), F_GETFD), -1);

  string msg;
  optional<Owned_native_handle> handle;
  chans.m_local.sync_receive(&msg, &handle);
  EXPECT_EQ(msg, "here is a pipe");
  ASSERT_TRUE(handle);
  EXPECT_NE(handle->native_handle(), pipe_rd.native_handle());
  EXPECT_TRUE(::fcntl(handle->native_handle(), F_GETFD) & FD_CLOEXEC);

  // It really is the same pipe.
  ASSERT_EQ(::write(pipe_wr.native_handle(), "xyz", 3), 3);
  pipe_wr.close();
  char buf[8];
  EXPECT_EQ(::read(handle->native_handle(), buf, sizeof(buf)), 3);
  EXPECT_EQ(string(buf, 3), "xyz");
}

TEST(Seqpacket_channel, Peer_closed)
{
  Channel_pair chans;
  chans.m_remote.reset();

  string msg;
  optional<Owned_native_handle> handle;
  Error_code err_code;
  chans.m_local.sync_receive(&msg, &handle, &err_code);
  EXPECT_EQ(err_code, error::Code::S_RECEIVE_PEER_CLOSED);

  chans.m_local.send("anybody there?", &err_code);
  EXPECT_EQ(err_code, boost::system::errc::broken_pipe);
}

TEST(Seqpacket_channel, Errors_throw_without_err_code)
{
  Channel_pair chans;
  chans.m_remote.reset();

  string msg;
  optional<Owned_native_handle> handle;
  try
  {
    chans.m_local.sync_receive(&msg, &handle);
    ADD_FAILURE() << "Should have thrown.";
  }
  catch (const flow::error::Runtime_error& exc)
  {
    EXPECT_EQ(exc.code(), error::Code::S_RECEIVE_PEER_CLOSED);
  }
}

TEST(Seqpacket_channel, Oversized_messages)
{
  Channel_pair chans;

  Error_code err_code;
  chans.m_remote->send(string(Seqpacket_channel::S_MAX_MSG_SZ + 1, 'x'), &err_code);
  EXPECT_EQ(err_code, error::Code::S_SEND_MESSAGE_TOO_LARGE);

  chans.m_remote->send(string(Seqpacket_channel::S_MAX_MSG_SZ, 'x'), &err_code);
  EXPECT_FALSE(err_code);
  string msg;
  optional<Owned_native_handle> handle;
  chans.m_local.sync_receive(&msg, &handle, &err_code);
  EXPECT_FALSE(err_code);
  EXPECT_EQ(msg.size(), Seqpacket_channel::S_MAX_MSG_SZ);

  // Bypass our own check: the receiver must notice truncation.
  const string big(Seqpacket_channel::S_MAX_MSG_SZ + 100, 'y');
  ASSERT_EQ(::send(chans.m_remote_fd, big.data(), big.size(), MSG_NOSIGNAL), ssize_t(big.size()));
  chans.m_local.sync_receive(&msg, &handle, &err_code);
  EXPECT_EQ(err_code, error::Code::S_RECEIVE_MESSAGE_TRUNCATED);
}

TEST(Seqpacket_channel, Too_many_handles_all_closed)
{
  Channel_pair chans;

  int fds[2];
  ASSERT_EQ(::pipe2(fds, O_CLOEXEC), 0);
  const Owned_native_handle pipe_rd(fds[0]);
  const Owned_native_handle pipe_wr(fds[1]);

  const auto n_fds_before = count_open_fds();

  // Hand-craft a message with 2 descriptors.
  char byte = 'x';
  ::iovec iov{ &byte, 1 };
  union
  {
    char m_buf[CMSG_SPACE(sizeof(int) * 2)];
    ::cmsghdr m_align;
  } ctl;
  std::memset(ctl.m_buf, 0, sizeof(ctl.m_buf));
  ::msghdr hdr;
  std::memset(&hdr, 0, sizeof(hdr));
  hdr.msg_iov = &iov;
  hdr.msg_iovlen = 1;
  hdr.msg_control = ctl.m_buf;
  hdr.msg_controllen = sizeof(ctl.m_buf);
  auto cmsg = CMSG_FIRSTHDR(&hdr);
  cmsg->cmsg_level = SOL_SOCKET;
  cmsg->cmsg_type = SCM_RIGHTS;
  cmsg->cmsg_len = CMSG_LEN(sizeof(int) * 2);
  std::memcpy(CMSG_DATA(cmsg), fds, sizeof(int) * 2);
  ASSERT_EQ(::sendmsg(chans.m_remote_fd, &hdr, MSG_NOSIGNAL), 1);

  string msg;
  optional<Owned_native_handle> handle;
  Error_code err_code;
  chans.m_local.sync_receive(&msg, &handle, &err_code);
  EXPECT_EQ(err_code, error::Code::S_RECEIVE_TOO_MANY_HANDLES);
  EXPECT_FALSE(handle);
  EXPECT_EQ(count_open_fds(), n_fds_before);
}

TEST(Seqpacket_channel, Create_pair_only_from_null_state)
{
  Channel_pair chans;
  Owned_native_handle remote_end;
  Error_code err_code;
  EXPECT_FALSE(Seqpacket_channel::create_pair(&chans.m_local, &remote_end, &err_code));
  EXPECT_TRUE(remote_end.null());
}

TEST(Seqpacket_channel, Error_codes_stream)
{
  EXPECT_EQ(flow::util::ostream_op_string(error::Code::S_RECEIVE_PEER_CLOSED), "RECEIVE_PEER_CLOSED");
  EXPECT_EQ(string(Error_code(error::Code::S_RECEIVE_PEER_CLOSED).category().name()), "imgproxy/transport");
}

} // namespace imgproxy::transport::test
