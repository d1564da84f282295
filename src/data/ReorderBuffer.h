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

#ifndef FILEIO_DATA_REORDERBUFFER_H_
#define FILEIO_DATA_REORDERBUFFER_H_

#include <stddef.h>
#include <stdint.h>

#include <map>

#include "boost/date_time/posix_time/posix_time_types.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

#include "base/Exception.h"
#include "data/StreamBuf.h"

namespace FIO {

namespace Data {

struct TakeStatus {
  enum Value {
    Ready,     // chunk is returned
    Finished,  // every chunk has been taken
    Failed,    // next chunk failed, see GetFailure
    Closed,    // buffer closed before the next chunk arrived
    Expired    // deadline passed before the next chunk arrived
  };
};

/**
 * Index keyed, capacity bounded buffer between concurrent chunk producers
 * and one in-order consumer.
 *
 * A producer reserves the index of its chunk before starting it and blocks
 * while the index is not within capacity of the next index the consumer
 * waits for. So the chunks buffered or in flight never exceed capacity.
 * The consumer takes chunks strictly in index order and blocks until the
 * next one arrives.
 *
 * When a chunk fails, the consumer still gets every chunk before it, then
 * the failure of the lowest failed index.
 */
class ReorderBuffer : private boost::noncopyable {
 public:
  ReorderBuffer(size_t capacity, int64_t chunkCount);

 public:
  // Wait for room of chunk index
  //
  // @param  : chunk index
  // @return : false if closed or some chunk failed
  bool Reserve(int64_t index);

  // Hand over a finished chunk, index must be reserved
  void Put(int64_t index, const Buffer &chunk);

  // Record failure of a chunk, the lowest failed index wins
  void Fail(int64_t index, const FIO::Exception::TransferError &err);

  // Take the next chunk in index order
  //
  // @param  : chunk output, deadline (pos_infin for none)
  // @return : status, chunk is set only if Ready
  TakeStatus::Value Take(Buffer *chunk,
                         const boost::posix_time::ptime &deadline);

  // Wake up every producer and the consumer, no more chunks are accepted
  void Close();

  bool HasFailed() const;
  // Failure of the lowest failed index, null if none
  boost::shared_ptr<FIO::Exception::TransferError> GetFailure() const;

  bool IsClosed() const;
  size_t GetCapacity() const { return m_capacity; }
  int64_t GetChunkCount() const { return m_chunkCount; }
  int64_t GetNextIndex() const;
  size_t GetBufferedCount() const;
  // Highest number of chunks held at once
  size_t GetMaxBufferedCount() const;

 private:
  size_t m_capacity;
  int64_t m_chunkCount;
  int64_t m_next;  // next index to take
  std::map<int64_t, Buffer> m_chunks;
  size_t m_maxBuffered;
  bool m_closed;
  int64_t m_failedIndex;
  boost::shared_ptr<FIO::Exception::TransferError> m_failure;

  mutable boost::mutex m_lock;
  boost::condition_variable m_roomAvailable;
  boost::condition_variable m_chunkAvailable;
};

}  // namespace Data
}  // namespace FIO

#endif  // FILEIO_DATA_REORDERBUFFER_H_
