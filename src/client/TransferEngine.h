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

#ifndef FILEIO_CLIENT_TRANSFERENGINE_H_
#define FILEIO_CLIENT_TRANSFERENGINE_H_

#include <stddef.h>
#include <stdint.h>

#include <iosfwd>
#include <string>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/shared_ptr.hpp"

#include "client/Backend.h"
#include "client/RetryPolicy.h"
#include "client/TransferTask.h"
#include "configure/PerformanceProfile.h"

namespace FIO {

namespace FileSystem {
class PathHandle;
}  // namespace FileSystem

namespace Threading {
class ThreadPool;
}  // namespace Threading

namespace Client {

class TransferControl;

// How one object is cut into chunks
struct TransferPlan {
  TransferPlan()
      : chunkSize(0), bufferSize(0), concurrency(1), multipart(false) {}

  std::string ToString() const;

  std::string tierName;
  size_t chunkSize;
  size_t bufferSize;
  size_t concurrency;
  bool multipart;
};

//
// ConcurrentTransferEngine
//
// Reads, writes and copies objects in chunks with bounded concurrency.
//
// Read: chunks are fetched concurrently and handed to the sink strictly in
// index order, at most the reorder capacity of chunks are buffered or in
// flight. A failed chunk surfaces once every chunk before it is delivered.
//
// Write: chunks are uploaded concurrently, the object is completed only
// after all of them succeeded. On failure the remaining chunks are
// cancelled and the partial object or multipart upload is discarded
// before the error is raised.
//
// Copy: reads the source and writes the destination at the same time with
// the destination's chunk plan.
//
// An object whose size the backend cannot report is read one chunk of the
// default tier after another until a short chunk.
//
// Every operation takes an optional TransferControl to cancel it or put a
// deadline on it.
//
class ConcurrentTransferEngine : private boost::noncopyable {
 public:
  typedef boost::function<void(const char *data, size_t length)> ChunkSink;
  // Bytes of a chunk, called in index order on the dispatching thread
  typedef boost::function<Buffer(const TransferTask &task)> ChunkSource;

  // @param  : performance profile, retry policy, worker count (0 to size the
  //           pool after the profile)
  ConcurrentTransferEngine(const Configure::PerformanceProfile &profile,
                           const RetryPolicy &retryPolicy,
                           size_t poolSize = 0);
  ~ConcurrentTransferEngine();

 public:
  // Read the whole object into sink in index order
  //
  // Throws TransferError when a chunk fails for good, CancelledError or
  // TimeoutError when the control stops the read. Exceptions thrown by the
  // sink stop the read and are propagated.
  boost::shared_ptr<TransferOperation> Read(
      const FileSystem::PathHandle &src, const ChunkSink &sink,
      TransferControl *control = NULL);

  std::string ReadToString(const FileSystem::PathHandle &src,
                           TransferControl *control = NULL);

  // Write payload to dst, atomically where the backend allows it
  boost::shared_ptr<TransferOperation> Write(
      const FileSystem::PathHandle &dst, const std::string &payload,
      TransferControl *control = NULL);
  boost::shared_ptr<TransferOperation> Write(
      const FileSystem::PathHandle &dst, const char *data, size_t size,
      TransferControl *control = NULL);

  // Write size bytes read from stream
  boost::shared_ptr<TransferOperation> WriteFromStream(
      const FileSystem::PathHandle &dst, std::istream &stream, uint64_t size,
      TransferControl *control = NULL);

  boost::shared_ptr<TransferOperation> Copy(const FileSystem::PathHandle &src,
                                            const FileSystem::PathHandle &dst,
                                            TransferControl *control = NULL);

  // Delete the object, succeeds if it does not exist
  void Remove(const FileSystem::PathHandle &path,
              TransferControl *control = NULL);

  // Abort a multipart upload left behind, throws MultipartAbortError
  void AbortMultipartUpload(const FileSystem::PathHandle &path,
                            const std::string &uploadId);

  // Chunk plan of an object of size on backend
  TransferPlan PlanFor(uint64_t size, const Backend &backend) const;

  // Chunk plan of an object of unknown size, sequential in the default tier
  TransferPlan PlanForUnknownSize() const;

  // Reorder capacity of a plan: max(concurrency, bufferSize / chunkSize)
  static size_t GetReorderCapacity(const TransferPlan &plan);

  const Configure::PerformanceProfile &GetProfile() const { return m_profile; }
  const RetryPolicy &GetRetryPolicy() const { return m_retryPolicy; }
  size_t GetPoolSize() const;

 private:
  boost::shared_ptr<TransferOperation> WriteChunks(
      const FileSystem::PathHandle &dst, uint64_t size,
      const TransferPlan &plan, const ChunkSource &source,
      TransferDirection::Value direction, TransferControl *control);

  boost::shared_ptr<TransferOperation> ReadUntilShortChunk(
      const FileSystem::PathHandle &src, const ChunkSink &sink,
      TransferControl *control);

  ObjectStat StatObject(const FileSystem::PathHandle &path,
                        TransferControl *control);

 private:
  Configure::PerformanceProfile m_profile;
  RetryPolicy m_retryPolicy;
  boost::scoped_ptr<FIO::Threading::ThreadPool> m_pool;

  friend class TransferEngineTest;
};

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_TRANSFERENGINE_H_
