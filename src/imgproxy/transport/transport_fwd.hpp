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

/**
 * Transport: the datagram channel over which a request/reply exchange with the helper happens, able to carry at most
 * one native handle (descriptor) alongside each message.
 *
 * Only one concrete transport exists: Seqpacket_channel, one end of a private `AF_UNIX`/`SOCK_SEQPACKET` socket
 * pair.  Message boundaries are preserved by the OS; a message and the handle sent with it arrive together.
 */
namespace imgproxy::transport
{

// Types.

// Find doc headers near the bodies of these compound types.

class Seqpacket_channel;

// Free functions.

/**
 * Prints string representation of the given channel to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Seqpacket_channel& val);

} // namespace imgproxy::transport
