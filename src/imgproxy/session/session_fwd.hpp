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

#include "imgproxy/util/util_fwd.hpp"
#include <sys/types.h>

/**
 * Sessions with the image proxy helper: describing the helper (Helper_app), running it (Helper_process), and
 * conversing with it (Proxy_session).  Proxy_session is the main entry point of the whole library.
 *
 * A typical use:
 *
 *   ~~~
 *   session::Helper_app helper_app;
 *   helper_app.m_exec_path = "/usr/libexec/container-image-proxy";
 *   session::Proxy_session session(logger_ptr, helper_app, "docker://quay.io/example/image:latest");
 *   session.sync_start(); // Throws on error; or pass an Error_code*.
 *   session::Manifest_result manifest;
 *   session.get_manifest(&manifest);
 *   // ...use manifest.m_digest, manifest.m_content...
 *   session.shutdown();
 *   ~~~
 */
namespace imgproxy::session
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Helper_app;
class Helper_process;
class Proxy_session;
struct Manifest_result;
struct Blob_result;

/// Process ID type.
using process_id_t = ::pid_t;

// Free functions.

/**
 * Prints string representation of the given Helper_app to the given `ostream`.
 *
 * @relatesalso Helper_app
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Helper_app& val);

/**
 * Prints string representation of the given Helper_process to the given `ostream`.
 *
 * @relatesalso Helper_process
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Helper_process& val);

/**
 * Prints string representation of the given Proxy_session to the given `ostream`.
 *
 * @relatesalso Proxy_session
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Proxy_session& val);

} // namespace imgproxy::session
