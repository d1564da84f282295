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

#include "data/ChunkSlots.h"

#include "boost/thread/locks.hpp"

namespace FIO {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::unique_lock;

// --------------------------------------------------------------------------
ChunkSlots::ChunkSlots(size_t count)
    : m_count(count > 0 ? count : 1),
      m_inUse(0),
      m_maxInUse(0),
      m_shutdown(false) {}

// --------------------------------------------------------------------------
bool ChunkSlots::Acquire() {
  unique_lock<mutex> lock(m_lock);
  while (!m_shutdown && m_inUse >= m_count) {
    m_slotReleased.wait(lock);
  }
  if (m_shutdown) {
    return false;
  }
  ++m_inUse;
  if (m_inUse > m_maxInUse) {
    m_maxInUse = m_inUse;
  }
  return true;
}

// --------------------------------------------------------------------------
void ChunkSlots::Release() {
  {
    lock_guard<mutex> lock(m_lock);
    if (m_inUse > 0) {
      --m_inUse;
    }
  }
  m_slotReleased.notify_all();
}

// --------------------------------------------------------------------------
void ChunkSlots::Shutdown() {
  {
    lock_guard<mutex> lock(m_lock);
    m_shutdown = true;
  }
  m_slotReleased.notify_all();
}

// --------------------------------------------------------------------------
void ChunkSlots::WaitAllReleased() {
  unique_lock<mutex> lock(m_lock);
  while (m_inUse > 0) {
    m_slotReleased.wait(lock);
  }
}

// --------------------------------------------------------------------------
bool ChunkSlots::IsShutdown() const {
  lock_guard<mutex> lock(m_lock);
  return m_shutdown;
}

// --------------------------------------------------------------------------
size_t ChunkSlots::GetInUse() const {
  lock_guard<mutex> lock(m_lock);
  return m_inUse;
}

// --------------------------------------------------------------------------
size_t ChunkSlots::GetMaxInUse() const {
  lock_guard<mutex> lock(m_lock);
  return m_maxInUse;
}

}  // namespace Data
}  // namespace FIO
