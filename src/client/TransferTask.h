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

#ifndef FILEIO_CLIENT_TRANSFERTASK_H_
#define FILEIO_CLIENT_TRANSFERTASK_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

namespace FIO {

namespace Client {

typedef boost::shared_ptr<std::vector<char> > Buffer;

struct TaskState {
  enum Value { Pending, InFlight, Retrying, Done, Failed };
};

std::string TaskStateToString(TaskState::Value state);

bool IsFinishedTaskState(TaskState::Value state);

// Pending -> InFlight -> {Done | (Retrying -> InFlight)* -> Failed}.
// A task that is stopped before or between attempts may go to Failed.
bool AllowTaskTransition(TaskState::Value current, TaskState::Value next);

//
// TransferTask
//
// One chunk of one transfer. Owned by the TransferOperation which
// created it, never reused.
//
class TransferTask : private boost::noncopyable {
 public:
  TransferTask(int64_t index, uint64_t offset, size_t length);

 public:
  int64_t GetIndex() const { return m_index; }
  uint64_t GetOffset() const { return m_offset; }
  size_t GetLength() const { return m_length; }
  // 1 based part number for multipart upload
  int GetPartNumber() const { return static_cast<int>(m_index + 1); }

  TaskState::Value GetState() const;
  uint16_t GetAttempts() const;
  std::string GetLastError() const;
  std::string GetETag() const;

  // Move to next state, no-op and return false if transition is not allowed
  bool TransitionTo(TaskState::Value next);

  // Enter InFlight and count one more attempt
  bool BeginAttempt();

  void SetLastError(const std::string &err);
  void SetETag(const std::string &eTag);

  const Buffer &GetBuffer() const { return m_buffer; }
  void SetBuffer(const Buffer &buffer) { m_buffer = buffer; }
  void ReleaseBuffer() { m_buffer.reset(); }

  std::string ToString() const;

 private:
  int64_t m_index;
  uint64_t m_offset;
  size_t m_length;
  Buffer m_buffer;

  TaskState::Value m_state;
  uint16_t m_attempts;
  std::string m_lastError;
  std::string m_eTag;
  mutable boost::mutex m_lock;
};

struct OperationState {
  enum Value { InProgress, Complete, Aborted };
};

std::string OperationStateToString(OperationState::Value state);

struct TransferDirection {
  enum Value { Read, Write, Copy };
};

//
// TransferOperation
//
// Aggregate of the tasks of one read, write or copy. Complete iff every
// task is Done, Aborted once any task failed or the transfer was stopped.
//
class TransferOperation : private boost::noncopyable {
 public:
  TransferOperation(TransferDirection::Value direction,
                    const std::string &path, uint64_t size);

 public:
  TransferDirection::Value GetDirection() const { return m_direction; }
  const std::string &GetPath() const { return m_path; }
  uint64_t GetSize() const { return m_size; }

  // Plan of the transfer
  void SetPlan(const std::string &tierName, size_t chunkSize,
               size_t concurrency, bool multipart);
  const std::string &GetTierName() const { return m_tierName; }
  size_t GetChunkSize() const { return m_chunkSize; }
  size_t GetConcurrency() const { return m_concurrency; }
  bool IsMultipart() const { return m_multipart; }

  void SetUploadId(const std::string &uploadId) { m_uploadId = uploadId; }
  const std::string &GetUploadId() const { return m_uploadId; }

  // Partition [0, size) into tasks of chunk size, the last one may be
  // shorter. Empty object gets one empty task.
  void Partition();

  // Add a task of length right after the last one, for a transfer whose
  // size is not known up front
  const boost::shared_ptr<TransferTask> &AppendTask(size_t length);
  // Size found once an open ended transfer reaches its end
  void SetSize(uint64_t size) { m_size = size; }

  const std::vector<boost::shared_ptr<TransferTask> > &GetTasks() const {
    return m_tasks;
  }
  size_t GetTaskCount() const { return m_tasks.size(); }
  const boost::shared_ptr<TransferTask> &GetTask(size_t index) const {
    return m_tasks.at(index);
  }

  OperationState::Value GetState() const;

  // Mark complete, return false and stay in progress if some task is
  // not done
  bool MarkComplete();
  void MarkAborted();

  uint16_t GetTotalAttempts() const;

  std::string ToString() const;

 private:
  TransferDirection::Value m_direction;
  std::string m_path;
  uint64_t m_size;

  std::string m_tierName;
  size_t m_chunkSize;
  size_t m_concurrency;
  bool m_multipart;
  std::string m_uploadId;

  std::vector<boost::shared_ptr<TransferTask> > m_tasks;
  OperationState::Value m_state;
  mutable boost::mutex m_stateLock;
};

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_TRANSFERTASK_H_
