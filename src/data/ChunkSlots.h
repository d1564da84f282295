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

#ifndef FILEIO_DATA_CHUNKSLOTS_H_
#define FILEIO_DATA_CHUNKSLOTS_H_

#include <stddef.h>  // for size_t

#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

namespace FIO {

namespace Data {

/**
 * Counting semaphore bounding the chunks of one operation in flight.
 *
 * Acquire will block waiting on a free slot.
 * Release will cause one blocked acquisition to unblock.
 * After Shutdown, Acquire returns false at once; slots already acquired
 * must still be released.
 */
class ChunkSlots : private boost::noncopyable {
 public:
  explicit ChunkSlots(size_t count);

 public:
  // Take a slot
  //
  // @param  : void
  // @return : false if shut down
  bool Acquire();

  void Release();

  // Stop handing out slots and wake up waiting acquisitions
  void Shutdown();

  // Block until every acquired slot is released
  void WaitAllReleased();

  bool IsShutdown() const;
  size_t GetCount() const { return m_count; }
  size_t GetInUse() const;
  // Highest number of slots held at once
  size_t GetMaxInUse() const;

 private:
  size_t m_count;
  size_t m_inUse;
  size_t m_maxInUse;
  bool m_shutdown;
  mutable boost::mutex m_lock;
  boost::condition_variable m_slotReleased;
};

}  // namespace Data
}  // namespace FIO

#endif  // FILEIO_DATA_CHUNKSLOTS_H_
