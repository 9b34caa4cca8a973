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
 * The request/reply wire protocol spoken with the helper: each transport message carries one JSON object, either a
 * Call (client to helper) or a Reply (helper to client).  See message.hpp for the formats.
 *
 * The protocol is strictly one-call-in-flight: there are no call IDs, and a reply answers the most recent call.
 */
namespace imgproxy::protocol
{

// Types.

// Find doc headers near the bodies of these compound types.

struct Call;
struct Reply;

// Free functions.

/**
 * Prints string representation of the given call (method and argument count) to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Call& val);

/**
 * Prints string representation of the given reply (all scalar fields; not the value) to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Reply& val);

} // namespace imgproxy::protocol
