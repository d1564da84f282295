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

#include "client/TransferTask.h"

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/thread/locks.hpp"

namespace FIO {

namespace Client {

using boost::lock_guard;
using boost::make_shared;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using std::string;

// --------------------------------------------------------------------------
string TaskStateToString(TaskState::Value state) {
  switch (state) {
    case TaskState::Pending:
      return "Pending";
    case TaskState::InFlight:
      return "InFlight";
    case TaskState::Retrying:
      return "Retrying";
    case TaskState::Done:
      return "Done";
    case TaskState::Failed:
      return "Failed";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
bool IsFinishedTaskState(TaskState::Value state) {
  return state == TaskState::Done || state == TaskState::Failed;
}

// --------------------------------------------------------------------------
bool AllowTaskTransition(TaskState::Value current, TaskState::Value next) {
  switch (current) {
    case TaskState::Pending:
      return next == TaskState::InFlight || next == TaskState::Failed;
    case TaskState::InFlight:
      return next == TaskState::Done || next == TaskState::Failed ||
             next == TaskState::Retrying;
    case TaskState::Retrying:
      return next == TaskState::InFlight || next == TaskState::Failed;
    default:
      return false;  // terminal
  }
}

// --------------------------------------------------------------------------
TransferTask::TransferTask(int64_t index, uint64_t offset, size_t length)
    : m_index(index),
      m_offset(offset),
      m_length(length),
      m_state(TaskState::Pending),
      m_attempts(0) {}

// --------------------------------------------------------------------------
TaskState::Value TransferTask::GetState() const {
  lock_guard<mutex> lock(m_lock);
  return m_state;
}

// --------------------------------------------------------------------------
uint16_t TransferTask::GetAttempts() const {
  lock_guard<mutex> lock(m_lock);
  return m_attempts;
}

// --------------------------------------------------------------------------
string TransferTask::GetLastError() const {
  lock_guard<mutex> lock(m_lock);
  return m_lastError;
}

// --------------------------------------------------------------------------
string TransferTask::GetETag() const {
  lock_guard<mutex> lock(m_lock);
  return m_eTag;
}

// --------------------------------------------------------------------------
bool TransferTask::TransitionTo(TaskState::Value next) {
  lock_guard<mutex> lock(m_lock);
  if (!AllowTaskTransition(m_state, next)) {
    return false;
  }
  m_state = next;
  return true;
}

// --------------------------------------------------------------------------
bool TransferTask::BeginAttempt() {
  lock_guard<mutex> lock(m_lock);
  if (!AllowTaskTransition(m_state, TaskState::InFlight)) {
    return false;
  }
  m_state = TaskState::InFlight;
  ++m_attempts;
  return true;
}

// --------------------------------------------------------------------------
void TransferTask::SetLastError(const string &err) {
  lock_guard<mutex> lock(m_lock);
  m_lastError = err;
}

// --------------------------------------------------------------------------
void TransferTask::SetETag(const string &eTag) {
  lock_guard<mutex> lock(m_lock);
  m_eTag = eTag;
}

// --------------------------------------------------------------------------
string TransferTask::ToString() const {
  lock_guard<mutex> lock(m_lock);
  return "[chunk=" + to_string(m_index) + " offset=" + to_string(m_offset) +
         " length=" + to_string(m_length) + " state=" +
         TaskStateToString(m_state) + " attempts=" + to_string(m_attempts) +
         "]";
}

// --------------------------------------------------------------------------
string OperationStateToString(OperationState::Value state) {
  switch (state) {
    case OperationState::InProgress:
      return "InProgress";
    case OperationState::Complete:
      return "Complete";
    case OperationState::Aborted:
      return "Aborted";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
TransferOperation::TransferOperation(TransferDirection::Value direction,
                                     const string &path, uint64_t size)
    : m_direction(direction),
      m_path(path),
      m_size(size),
      m_chunkSize(0),
      m_concurrency(1),
      m_multipart(false),
      m_state(OperationState::InProgress) {}

// --------------------------------------------------------------------------
void TransferOperation::SetPlan(const string &tierName, size_t chunkSize,
                                size_t concurrency, bool multipart) {
  m_tierName = tierName;
  m_chunkSize = chunkSize;
  m_concurrency = concurrency == 0 ? 1 : concurrency;
  m_multipart = multipart;
}

// --------------------------------------------------------------------------
void TransferOperation::Partition() {
  m_tasks.clear();
  if (m_size == 0 || m_chunkSize == 0) {
    m_tasks.push_back(make_shared<TransferTask>(0, 0, 0));
    return;
  }
  uint64_t count = (m_size + m_chunkSize - 1) / m_chunkSize;
  m_tasks.reserve(count);
  for (uint64_t i = 0; i < count; ++i) {
    uint64_t offset = i * m_chunkSize;
    uint64_t remaining = m_size - offset;
    size_t len = remaining < m_chunkSize ? static_cast<size_t>(remaining)
                                         : m_chunkSize;
    m_tasks.push_back(
        make_shared<TransferTask>(static_cast<int64_t>(i), offset, len));
  }
}

// --------------------------------------------------------------------------
const shared_ptr<TransferTask> &TransferOperation::AppendTask(size_t length) {
  uint64_t offset = 0;
  if (!m_tasks.empty()) {
    const shared_ptr<TransferTask> &last = m_tasks.back();
    offset = last->GetOffset() + last->GetLength();
  }
  m_tasks.push_back(make_shared<TransferTask>(
      static_cast<int64_t>(m_tasks.size()), offset, length));
  return m_tasks.back();
}

// --------------------------------------------------------------------------
OperationState::Value TransferOperation::GetState() const {
  lock_guard<mutex> lock(m_stateLock);
  return m_state;
}

// --------------------------------------------------------------------------
bool TransferOperation::MarkComplete() {
  BOOST_FOREACH(const shared_ptr<TransferTask> &task, m_tasks) {
    if (task->GetState() != TaskState::Done) {
      return false;
    }
  }
  lock_guard<mutex> lock(m_stateLock);
  if (m_state != OperationState::InProgress) {
    return false;
  }
  m_state = OperationState::Complete;
  return true;
}

// --------------------------------------------------------------------------
void TransferOperation::MarkAborted() {
  lock_guard<mutex> lock(m_stateLock);
  m_state = OperationState::Aborted;
}

// --------------------------------------------------------------------------
uint16_t TransferOperation::GetTotalAttempts() const {
  uint16_t total = 0;
  BOOST_FOREACH(const shared_ptr<TransferTask> &task, m_tasks) {
    total += task->GetAttempts();
  }
  return total;
}

// --------------------------------------------------------------------------
string TransferOperation::ToString() const {
  return "[path=" + m_path + " size=" + to_string(m_size) + " tier=" +
         m_tierName + " chunk=" + to_string(m_chunkSize) + " concurrency=" +
         to_string(m_concurrency) + " chunks=" + to_string(m_tasks.size()) +
         (m_multipart ? " multipart" : "") + "]";
}

}  // namespace Client
}  // namespace FIO
