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

#include "imgproxy/common.hpp"
#include <flow/util/util.hpp>
#include <vector>
#include <cstdint>

/// Small utilities shared by the other imgproxy modules.
namespace imgproxy::util
{

// Types.

// Find doc headers near the bodies of these compound types.

class Owned_native_handle;

/// Short-hand for Flow's `String_view`.
using String_view = flow::util::String_view;

/// A contiguous, owned, growable byte buffer: a drained pipe body.
using Blob = std::vector<uint8_t>;

/// A raw, non-owned native handle (a Unix file descriptor).
using native_handle_t = int;

/// Identifier the helper assigns to each pipe it hands back; 0 means "no pipe".
using pipe_id_t = uint32_t;

// Free functions.

/**
 * Prints string representation of the given handle wrapper to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Owned_native_handle& val);

} // namespace imgproxy::util
