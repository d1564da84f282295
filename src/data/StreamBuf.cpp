// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#include "data/StreamBuf.h"

#include <stddef.h>

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"

namespace FIO {

namespace Data {

using boost::to_string;
using FIO::Exception::FIOException;

// --------------------------------------------------------------------------
StreamBuf::StreamBuf(const Buffer &buf, size_t lengthToUse)
    : m_buffer(buf), m_length(lengthToUse) {
  if (!m_buffer) {
    throw FIOException("Streambuf over null buffer");
  }
  if (m_length > m_buffer->size()) {
    throw FIOException("Streambuf only has a " +
                       to_string(m_buffer->size()) +
                       " bytes buffer, but want stream to see " +
                       to_string(m_length) + " bytes of it");
  }
  setp(begin(), end());
  setg(begin(), begin(), end());
}

// --------------------------------------------------------------------------
StreamBuf::pos_type StreamBuf::seekoff(off_type off, std::ios_base::seekdir dir,
                                       std::ios_base::openmode which) {
  if (dir == std::ios_base::beg) {
    return seekpos(off, which);
  } else if (dir == std::ios_base::end) {
    return seekpos(static_cast<off_type>(m_length) + off, which);
  } else if (dir == std::ios_base::cur) {
    if (which == std::ios_base::in) {
      return seekpos((gptr() - eback()) + off, which);
    } else if (which == std::ios_base::out) {
      return seekpos((pptr() - pbase()) + off, which);
    }
  }
  return pos_type(off_type(-1));
}

// --------------------------------------------------------------------------
StreamBuf::pos_type StreamBuf::seekpos(pos_type pos,
                                       std::ios_base::openmode which) {
  off_type offset = static_cast<off_type>(pos);
  if (offset < 0 || static_cast<size_t>(offset) > m_length) {
    return pos_type(off_type(-1));
  }

  size_t szPos = static_cast<size_t>(offset);
  if (which & std::ios_base::in) {
    setg(begin(), begin() + szPos, end());
  }
  if (which & std::ios_base::out) {
    setp(begin(), end());
    pbump(static_cast<int>(szPos));
  }
  return pos;
}

}  // namespace Data
}  // namespace FIO
