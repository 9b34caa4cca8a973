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
#include "imgproxy/util/owned_native_handle.hpp"
#include <boost/system/system_error.hpp>
#include <unistd.h>

namespace imgproxy::util
{

// Implementations.

Owned_native_handle::Owned_native_handle() :
  m_native_handle(S_NULL_HANDLE)
{
  // Nothing else.
}

Owned_native_handle::Owned_native_handle(native_handle_t native_handle) :
  m_native_handle(native_handle)
{
  // Nothing else.
}

Owned_native_handle::Owned_native_handle(Owned_native_handle&& src) :
  m_native_handle(src.release())
{
  // Nothing else.
}

Owned_native_handle::~Owned_native_handle()
{
  if (!null())
  {
    ::close(m_native_handle);
  }
}

Owned_native_handle& Owned_native_handle::operator=(Owned_native_handle&& src)
{
  if (&src != this)
  {
    Owned_native_handle victim(m_native_handle); // Closes our old descriptor (if any) upon return.
    m_native_handle = src.release();
  }
  return *this;
}

native_handle_t Owned_native_handle::native_handle() const
{
  return m_native_handle;
}

bool Owned_native_handle::null() const
{
  return m_native_handle == S_NULL_HANDLE;
}

native_handle_t Owned_native_handle::release()
{
  const auto native_handle = m_native_handle;
  m_native_handle = S_NULL_HANDLE;
  return native_handle;
}

void Owned_native_handle::close(Error_code* err_code)
{
  using boost::system::system_category;
  // using ::errno; // It's a macro apparently.

  if (flow::error::exec_void_and_throw_on_error
        ([&](Error_code* actual_err_code) { close(actual_err_code); },
         err_code, "util::Owned_native_handle::close()"))
  {
    return;
  }
  // else

  err_code->clear();
  if (null())
  {
    return;
  }
  // else

  // Linux close() releases the descriptor even when it reports an error; so never retry.
  if (::close(release()) == -1)
  {
    *err_code = Error_code(errno, system_category());
  }
} // Owned_native_handle::close()

std::ostream& operator<<(std::ostream& os, const Owned_native_handle& val)
{
  if (val.null())
  {
    return os << "null_hndl";
  }
  // else
  return os << "native_hndl[" << val.native_handle() << ']';
}

} // namespace imgproxy::util
