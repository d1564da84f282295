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

#include "data/ReorderBuffer.h"

#include <map>

#include "boost/date_time/posix_time/posix_time.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"

namespace FIO {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using boost::unique_lock;
using boost::posix_time::microsec_clock;
using boost::posix_time::ptime;
using FIO::Exception::TransferError;
using std::map;

// --------------------------------------------------------------------------
ReorderBuffer::ReorderBuffer(size_t capacity, int64_t chunkCount)
    : m_capacity(capacity > 0 ? capacity : 1),
      m_chunkCount(chunkCount),
      m_next(0),
      m_maxBuffered(0),
      m_closed(false),
      m_failedIndex(-1) {}

// --------------------------------------------------------------------------
bool ReorderBuffer::Reserve(int64_t index) {
  unique_lock<mutex> lock(m_lock);
  while (!m_closed && !m_failure &&
         index >= m_next + static_cast<int64_t>(m_capacity)) {
    m_roomAvailable.wait(lock);
  }
  return !m_closed && !m_failure;
}

// --------------------------------------------------------------------------
void ReorderBuffer::Put(int64_t index, const Buffer &chunk) {
  {
    lock_guard<mutex> lock(m_lock);
    if (m_closed || index < m_next || index >= m_chunkCount) {
      DebugWarning("Drop chunk " + to_string(index) + " [next:" +
                   to_string(m_next) + "]");
      return;
    }
    m_chunks[index] = chunk;
    if (m_chunks.size() > m_maxBuffered) {
      m_maxBuffered = m_chunks.size();
    }
  }
  m_chunkAvailable.notify_all();
}

// --------------------------------------------------------------------------
void ReorderBuffer::Fail(int64_t index, const TransferError &err) {
  {
    lock_guard<mutex> lock(m_lock);
    if (!m_failure || index < m_failedIndex) {
      m_failedIndex = index;
      m_failure = shared_ptr<TransferError>(new TransferError(err));
    }
  }
  m_chunkAvailable.notify_all();
  m_roomAvailable.notify_all();
}

// --------------------------------------------------------------------------
TakeStatus::Value ReorderBuffer::Take(Buffer *chunk, const ptime &deadline) {
  unique_lock<mutex> lock(m_lock);
  while (true) {
    if (m_next >= m_chunkCount) {
      return TakeStatus::Finished;
    }
    map<int64_t, Buffer>::iterator it = m_chunks.find(m_next);
    if (it != m_chunks.end()) {
      if (chunk != NULL) {
        *chunk = it->second;
      }
      m_chunks.erase(it);
      ++m_next;
      lock.unlock();
      m_roomAvailable.notify_all();
      return TakeStatus::Ready;
    }
    if (m_failure && m_failedIndex <= m_next) {
      return TakeStatus::Failed;
    }
    if (m_closed) {
      return TakeStatus::Closed;
    }
    if (deadline.is_special()) {
      m_chunkAvailable.wait(lock);
    } else {
      if (microsec_clock::universal_time() >= deadline) {
        return TakeStatus::Expired;
      }
      m_chunkAvailable.timed_wait(lock, deadline);
    }
  }
}

// --------------------------------------------------------------------------
void ReorderBuffer::Close() {
  {
    lock_guard<mutex> lock(m_lock);
    m_closed = true;
    m_chunks.clear();
  }
  m_chunkAvailable.notify_all();
  m_roomAvailable.notify_all();
}

// --------------------------------------------------------------------------
bool ReorderBuffer::HasFailed() const {
  lock_guard<mutex> lock(m_lock);
  return static_cast<bool>(m_failure);
}

// --------------------------------------------------------------------------
shared_ptr<TransferError> ReorderBuffer::GetFailure() const {
  lock_guard<mutex> lock(m_lock);
  return m_failure;
}

// --------------------------------------------------------------------------
bool ReorderBuffer::IsClosed() const {
  lock_guard<mutex> lock(m_lock);
  return m_closed;
}

// --------------------------------------------------------------------------
int64_t ReorderBuffer::GetNextIndex() const {
  lock_guard<mutex> lock(m_lock);
  return m_next;
}

// --------------------------------------------------------------------------
size_t ReorderBuffer::GetBufferedCount() const {
  lock_guard<mutex> lock(m_lock);
  return m_chunks.size();
}

// --------------------------------------------------------------------------
size_t ReorderBuffer::GetMaxBufferedCount() const {
  lock_guard<mutex> lock(m_lock);
  return m_maxBuffered;
}

}  // namespace Data
}  // namespace FIO
