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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>
#include <boost/filesystem.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/**
 * Client library for the container image proxy helper: spawns the helper process, talks to it over a private
 * descriptor-passing channel, and streams manifest and blob bodies out of the pipes it hands back.
 *
 * The sub-namespaces are layered bottom-up:
 *   - imgproxy::util: owned descriptor token, byte buffer aliases.
 *   - imgproxy::transport: the datagram channel (`SOCK_SEQPACKET` pair) able to carry one descriptor per message.
 *   - imgproxy::protocol: the JSON request/reply codec.
 *   - imgproxy::session: helper configuration and process supervision, plus Proxy_session which ties it
 *     all together.
 */
namespace imgproxy
{

// Types.

/// Short-hand for Flow's boost.system-based error code; used in every `Error_code* err_code` out-arg.
using Error_code = flow::Error_code;

/**
 * The `flow::log::Component` payload enumeration for all logging done by this project.  Register it with
 * a `flow::log::Config` along with #S_IMGPROXY_LOG_COMPONENT_NAME_MAP, as one would with Flow's own
 * `flow::Flow_log_component`.
 */
enum class Log_component
{
  /// Uncategorized; avoid using.
  S_UNCAT = 0,
  /// imgproxy::util.
  S_UTIL,
  /// imgproxy::transport.
  S_TRANSPORT,
  /// imgproxy::protocol.
  S_PROTOCOL,
  /// imgproxy::session.
  S_SESSION,
  /// SENTINEL: Not a component.
  S_END_SENTINEL
}; // enum class Log_component

// Globals.

/// Maps each #Log_component to its human-readable name, for `flow::log::Config::init_component_names()`.
extern const boost::unordered_multimap<Log_component, std::string> S_IMGPROXY_LOG_COMPONENT_NAME_MAP;

} // namespace imgproxy

/// Boost.filesystem namespace alias used throughout.
namespace fs = boost::filesystem;
