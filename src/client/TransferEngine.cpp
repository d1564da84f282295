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
#include "client/TransferEngine.h"

#include <string.h>  // for memcpy

#include <algorithm>
#include <istream>
#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/exception_ptr.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/weak_ptr.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/ThreadPool.h"
#include "client/Backend.h"
#include "client/ClientError.h"
#include "client/ProviderConfig.h"
#include "client/TransferControl.h"
#include "configure/Default.h"
#include "data/ChunkSlots.h"
#include "data/ReorderBuffer.h"
#include "filesystem/PathHandle.h"

namespace FIO {
namespace Client {

using boost::bind;
using boost::exception_ptr;
using boost::lock_guard;
using boost::make_shared;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using boost::weak_ptr;
using FIO::Configure::Default::GetMultipartMaxPartCount;
using FIO::Configure::PerformanceProfile;
using FIO::Configure::PerformanceTier;
using FIO::Data::ChunkSlots;
using FIO::Data::ReorderBuffer;
using FIO::Data::TakeStatus;
using FIO::Exception::CancelledError;
using FIO::Exception::MultipartAbortError;
using FIO::Exception::TimeoutError;
using FIO::Exception::TransferError;
using FIO::FileSystem::PathHandle;
using FIO::Threading::ThreadPool;
using std::istream;
using std::string;
using std::vector;

namespace {

// --------------------------------------------------------------------------
ClientError StatInto(Backend *backend, const ObjectLocation &loc,
                     ObjectStat *stat) {
  StatOutcome outcome = backend->Stat(loc);
  if (outcome.IsSuccess()) {
    *stat = outcome.GetResult();
  }
  return outcome.GetError();
}

// --------------------------------------------------------------------------
// A short read of a stat'ed object means it changed under us, retrying
// would not help
ClientError ReadExact(Backend *backend, const ObjectLocation &loc,
                      uint64_t offset, size_t length, vector<char> *data) {
  ClientError err = backend->ReadChunk(loc, offset, length, data);
  if (err.IsGood() && data->size() != length) {
    return ClientError(ErrorCode::IO_ERROR,
                       "ReadChunk object=" + loc.ToString(),
                       "Short read at offset " + to_string(offset) +
                           ", expect " + to_string(length) + " bytes, got " +
                           to_string(data->size()),
                       false);
  }
  return err;
}

// --------------------------------------------------------------------------
const char *DataOf(const Buffer &chunk) {
  return chunk->empty() ? NULL : &(*chunk)[0];
}

// --------------------------------------------------------------------------
ClientError WriteChunkOf(Backend *backend, const ObjectLocation &loc,
                         const string &writeId, uint64_t offset,
                         const Buffer &chunk) {
  return backend->WriteChunk(loc, writeId, offset, DataOf(chunk),
                             chunk->size());
}

// --------------------------------------------------------------------------
ClientError UploadPartOf(Backend *backend, const ObjectLocation &loc,
                         const string &uploadId, int partNumber,
                         const Buffer &chunk, string *eTag) {
  return backend->UploadPart(loc, uploadId, partNumber, DataOf(chunk),
                             chunk->size(), eTag);
}

// --------------------------------------------------------------------------
Buffer SliceOf(const char *data, const TransferTask &task) {
  Buffer chunk = make_shared<vector<char> >(task.GetLength());
  if (task.GetLength() > 0) {
    memcpy(&(*chunk)[0], data + task.GetOffset(), task.GetLength());
  }
  return chunk;
}

// --------------------------------------------------------------------------
void AppendTo(string *out, const char *data, size_t length) {
  out->append(data, length);
}

// --------------------------------------------------------------------------
// Tasks are asked for in index order, so the stream is read sequentially
Buffer ReadFromStream(istream *stream, const string &path,
                      const TransferTask &task) {
  Buffer chunk = make_shared<vector<char> >(task.GetLength());
  if (task.GetLength() > 0) {
    stream->read(&(*chunk)[0], static_cast<std::streamsize>(task.GetLength()));
    size_t got = static_cast<size_t>(stream->gcount());
    if (got != task.GetLength()) {
      throw TransferError(path, task.GetIndex(), 0,
                          "Stream ended at offset " +
                              to_string(task.GetOffset() + got) +
                              ", expect " + to_string(task.GetLength()) +
                              " bytes for this chunk",
                          ErrorCode::IO_ERROR);
    }
  }
  return chunk;
}

// --------------------------------------------------------------------------
// Override the retry count with <PREFIX>MAX_RETRIES if the provider sets it,
// 0 included
RetryPolicy PolicyFor(const RetryPolicy &policy,
                      const ProviderConfig &config) {
  if (!config.HasMaxRetries() ||
      static_cast<uint16_t>(config.GetMaxRetries()) ==
          policy.GetMaxRetries()) {
    return policy;
  }
  return RetryPolicy(static_cast<uint16_t>(config.GetMaxRetries()),
                     policy.GetBaseDelayInMs(),
                     policy.GetFactor(), policy.HasJitter());
}

//
// Everything the chunk tasks of one read share. Held by shared pointer so
// that a task still queued on the pool keeps it alive.
//
struct ReadState : private boost::noncopyable {
  ReadState(const PathHandle &src, const shared_ptr<TransferOperation> &o,
            const RetryPolicy &policy, size_t concurrency, size_t capacity,
            const shared_ptr<TransferControl> &ctrl)
      : backend(src.GetBackend()),
        loc(src.GetLocation()),
        path(src.ToString()),
        op(o),
        retryPolicy(policy),
        slots(concurrency),
        buffer(capacity, static_cast<int64_t>(o->GetTaskCount())),
        control(ctrl) {}

  shared_ptr<Backend> backend;
  ObjectLocation loc;
  string path;
  shared_ptr<TransferOperation> op;
  RetryPolicy retryPolicy;
  ChunkSlots slots;
  ReorderBuffer buffer;
  shared_ptr<TransferControl> control;
};

// --------------------------------------------------------------------------
void CloseReadState(const weak_ptr<ReadState> &weakState) {
  shared_ptr<ReadState> state = weakState.lock();
  if (state) {
    state->buffer.Close();
    state->slots.Shutdown();
  }
}

// --------------------------------------------------------------------------
void ReadChunkTask(const shared_ptr<ReadState> &state, size_t index) {
  const shared_ptr<TransferTask> &task = state->op->GetTask(index);
  int64_t chunkIndex = task->GetIndex();
  Buffer chunk = make_shared<vector<char> >();
  try {
    state->retryPolicy.Execute(
        bind(&ReadExact, state->backend.get(), state->loc, task->GetOffset(),
             task->GetLength(), chunk.get()),
        task.get(), state->path, state->control.get());
    state->buffer.Put(chunkIndex, chunk);
  } catch (const TransferError &err) {
    state->buffer.Fail(chunkIndex, err);
  } catch (const CancelledError &) {
    // the reader reports the stop
  } catch (const TimeoutError &) {
    // the reader reports the stop
  } catch (const std::exception &err) {
    task->TransitionTo(TaskState::Failed);
    state->buffer.Fail(chunkIndex,
                       TransferError(state->path, chunkIndex,
                                     task->GetAttempts(), err.what()));
  }
  state->slots.Release();
}

// --------------------------------------------------------------------------
void DispatchReads(ThreadPool *pool, const shared_ptr<ReadState> &state) {
  size_t count = state->op->GetTaskCount();
  for (size_t i = 0; i < count; ++i) {
    if (state->control->ShouldStop()) {
      break;
    }
    if (!state->buffer.Reserve(static_cast<int64_t>(i))) {
      break;
    }
    if (!state->slots.Acquire()) {
      break;
    }
    pool->Submit(bind(&ReadChunkTask, state, i));
  }
}

//
// ReadPipeline
//
// Fetches the chunks of one operation on the pool and hands them out in
// index order. A dispatcher thread reserves room in the reorder buffer
// before submitting each chunk, so a slow consumer holds back the fetch.
//
class ReadPipeline : private boost::noncopyable {
 public:
  ReadPipeline(ThreadPool *pool, const shared_ptr<ReadState> &state)
      : m_pool(pool), m_state(state), m_stopped(false) {
    m_state->control->AddCancelListener(
        bind(&CloseReadState, weak_ptr<ReadState>(m_state)));
    m_dispatcher.reset(
        new boost::thread(bind(&DispatchReads, m_pool, m_state)));
  }

  ~ReadPipeline() { Stop(); }

  // @return : false once every chunk has been handed out
  bool Next(Buffer *chunk) {
    TakeStatus::Value status =
        m_state->buffer.Take(chunk, m_state->control->GetDeadline());
    switch (status) {
      case TakeStatus::Ready:
        return true;
      case TakeStatus::Finished:
        return false;
      case TakeStatus::Failed: {
        shared_ptr<TransferError> failure = m_state->buffer.GetFailure();
        throw *failure;
      }
      default:
        break;
    }
    m_state->control->ThrowIfStopped(m_state->path);
    throw CancelledError(m_state->path);
  }

  // Chunk of the reading side of a copy, sized like the task
  Buffer NextFor(const TransferTask &task) {
    Buffer chunk;
    if (!Next(&chunk) || chunk->size() != task.GetLength()) {
      throw TransferError(m_state->path, task.GetIndex(), 0,
                          "Source chunk does not line up with destination",
                          ErrorCode::IO_ERROR);
    }
    return chunk;
  }

  // Cancel what is left and wait for every chunk task to return
  void Stop() {
    if (m_stopped) {
      return;
    }
    m_stopped = true;
    m_state->control->Cancel();
    m_dispatcher->join();
    m_state->slots.WaitAllReleased();
  }

 private:
  ThreadPool *m_pool;
  shared_ptr<ReadState> m_state;
  boost::scoped_ptr<boost::thread> m_dispatcher;
  bool m_stopped;
};

//
// Shared by the chunk tasks of one write
//
struct WriteState : private boost::noncopyable {
  WriteState(const PathHandle &dst, const shared_ptr<TransferOperation> &o,
             const RetryPolicy &policy, size_t concurrency,
             const shared_ptr<TransferControl> &ctrl)
      : backend(dst.GetBackend()),
        loc(dst.GetLocation()),
        path(dst.ToString()),
        op(o),
        retryPolicy(policy),
        slots(concurrency),
        control(ctrl),
        failedIndex(0) {}

  // Keep the failure of the lowest chunk index and stop the other chunks
  void RecordFailure(int64_t index, const exception_ptr &err) {
    {
      lock_guard<mutex> lock(failureLock);
      if (!failure || index < failedIndex) {
        failure = err;
        failedIndex = index;
      }
    }
    control->Cancel();
  }

  bool HasFailed() const {
    lock_guard<mutex> lock(failureLock);
    return static_cast<bool>(failure);
  }

  exception_ptr GetFailure() const {
    lock_guard<mutex> lock(failureLock);
    return failure;
  }

  shared_ptr<Backend> backend;
  ObjectLocation loc;
  string path;
  shared_ptr<TransferOperation> op;
  RetryPolicy retryPolicy;
  ChunkSlots slots;
  shared_ptr<TransferControl> control;
  string writeId;  // streaming write
  string uploadId;  // multipart upload

  mutable mutex failureLock;
  int64_t failedIndex;
  exception_ptr failure;
};

// --------------------------------------------------------------------------
void WriteChunkTask(const shared_ptr<WriteState> &state, size_t index,
                    const Buffer &chunk) {
  const shared_ptr<TransferTask> &task = state->op->GetTask(index);
  int64_t chunkIndex = task->GetIndex();
  try {
    if (state->op->IsMultipart()) {
      string eTag;
      state->retryPolicy.Execute(
          bind(&UploadPartOf, state->backend.get(), state->loc,
               state->uploadId, task->GetPartNumber(), chunk, &eTag),
          task.get(), state->path, state->control.get());
      task->SetETag(eTag);
    } else {
      state->retryPolicy.Execute(
          bind(&WriteChunkOf, state->backend.get(), state->loc,
               state->writeId, task->GetOffset(), chunk),
          task.get(), state->path, state->control.get());
    }
  } catch (const TransferError &err) {
    state->RecordFailure(chunkIndex, boost::copy_exception(err));
  } catch (const CancelledError &) {
    // the writer reports the stop
  } catch (const TimeoutError &) {
    // the writer reports the stop
  } catch (const std::exception &err) {
    task->TransitionTo(TaskState::Failed);
    state->RecordFailure(
        chunkIndex, boost::copy_exception(TransferError(
                        state->path, chunkIndex, task->GetAttempts(),
                        err.what())));
  }
  state->slots.Release();
}

// --------------------------------------------------------------------------
// Discard the partial object or the multipart upload
//
// @return : error message, empty if cleaned up
string CleanUpWrite(const WriteState &state) {
  try {
    if (state.op->IsMultipart()) {
      if (!state.uploadId.empty()) {
        state.retryPolicy.Execute(
            bind(&Backend::AbortMultipartUpload, state.backend, state.loc,
                 state.uploadId),
            TransferError::kNoChunk, state.path);
      }
    } else if (!state.writeId.empty()) {
      state.retryPolicy.Execute(
          bind(&Backend::AbortWrite, state.backend, state.loc, state.writeId),
          TransferError::kNoChunk, state.path);
    }
  } catch (const TransferError &err) {
    Error("Fail to clean up " << state.path
                              << (state.op->IsMultipart()
                                      ? " multipart upload " + state.uploadId
                                      : " partial write " + state.writeId)
                              << ": " << err.what());
    return err.what();
  }
  return string();
}

}  // namespace

// --------------------------------------------------------------------------
string TransferPlan::ToString() const {
  return "[tier:" + tierName + ", chunk:" + to_string(chunkSize) +
         ", buffer:" + to_string(bufferSize) +
         ", concurrency:" + to_string(concurrency) +
         ", multipart:" + (multipart ? "true" : "false") + "]";
}

// --------------------------------------------------------------------------
ConcurrentTransferEngine::ConcurrentTransferEngine(
    const PerformanceProfile &profile, const RetryPolicy &retryPolicy,
    size_t poolSize)
    : m_profile(profile), m_retryPolicy(retryPolicy) {
  if (poolSize == 0) {
    size_t maxConcurrency = 1;
    BOOST_FOREACH(const PerformanceTier &tier, m_profile.GetTiers()) {
      maxConcurrency = std::max(maxConcurrency, tier.maxConcurrency);
    }
    size_t transfers = m_profile.GetSettings().maxConcurrentTransfers;
    poolSize = maxConcurrency * (transfers > 0 ? transfers : 1);
  }
  m_pool.reset(new ThreadPool(poolSize));
  DebugInfo("Transfer engine with " << poolSize << " workers, profile "
                                    << m_profile.ToString());
}

// --------------------------------------------------------------------------
ConcurrentTransferEngine::~ConcurrentTransferEngine() {}

// --------------------------------------------------------------------------
size_t ConcurrentTransferEngine::GetPoolSize() const {
  return m_pool->GetPoolSize();
}

// --------------------------------------------------------------------------
TransferPlan ConcurrentTransferEngine::PlanFor(uint64_t size,
                                               const Backend &backend) const {
  const PerformanceTier &tier = m_profile.TierFor(size);
  TransferPlan plan;
  plan.tierName = tier.name;
  plan.bufferSize = tier.bufferSize;
  plan.concurrency = std::max(tier.maxConcurrency, static_cast<size_t>(1));

  if (m_profile.ShouldUseMultipart(size) && backend.SupportsMultipart()) {
    // part count of a multipart upload is limited
    uint64_t maxParts = GetMultipartMaxPartCount();
    uint64_t minChunk = (size + maxParts - 1) / maxParts;
    plan.multipart = true;
    plan.chunkSize = std::max(m_profile.GetMultipartChunkSize(),
                              static_cast<size_t>(minChunk));
  } else if (!m_profile.ShouldAutoOptimize(size)) {
    plan.chunkSize = size > 0 ? static_cast<size_t>(size) : 1;
    plan.concurrency = 1;
  } else {
    plan.chunkSize = tier.chunkSize;
  }

  size_t instanceMax = backend.GetConfig()->GetMaxConcurrency();
  if (instanceMax > 0 && instanceMax < plan.concurrency) {
    plan.concurrency = instanceMax;
  }
  if (plan.bufferSize < plan.chunkSize) {
    plan.bufferSize = plan.chunkSize;
  }
  return plan;
}

// --------------------------------------------------------------------------
TransferPlan ConcurrentTransferEngine::PlanForUnknownSize() const {
  const PerformanceTier &tier = m_profile.DefaultTier();
  TransferPlan plan;
  plan.tierName = tier.name;
  plan.chunkSize = tier.chunkSize;
  plan.bufferSize = tier.bufferSize;
  plan.concurrency = 1;
  return plan;
}

// --------------------------------------------------------------------------
size_t ConcurrentTransferEngine::GetReorderCapacity(const TransferPlan &plan) {
  size_t chunks = plan.chunkSize > 0 ? plan.bufferSize / plan.chunkSize : 0;
  return std::max(std::max(plan.concurrency, chunks), static_cast<size_t>(1));
}

// --------------------------------------------------------------------------
ObjectStat ConcurrentTransferEngine::StatObject(const PathHandle &path,
                                              TransferControl *control) {
  if (!path.HasCachedStat()) {
    ObjectStat stat;
    TransferTask statTask(TransferError::kNoChunk, 0, 0);
    RetryPolicy policy = PolicyFor(m_retryPolicy, *path.GetConfig());
    policy.Execute(bind(&StatInto, path.GetBackend().get(),
                        path.GetLocation(), &stat),
                   &statTask, path.ToString(), control);
    path.SetCachedStat(stat);
  }
  const ObjectStat &stat = path.Stat();
  if (stat.isDirectory) {
    throw TransferError(path.ToString(), TransferError::kNoChunk, 1,
                        "Is a directory", ErrorCode::MALFORMED_REQUEST);
  }
  return stat;
}

// --------------------------------------------------------------------------
shared_ptr<TransferOperation> ConcurrentTransferEngine::Read(
    const PathHandle &src, const ChunkSink &sink, TransferControl *control) {
  shared_ptr<TransferControl> opControl = TransferControl::CreateChild(control);
  ObjectStat stat = StatObject(src, opControl.get());
  if (!stat.sizeKnown) {
    return ReadUntilShortChunk(src, sink, opControl.get());
  }
  uint64_t size = stat.size;
  TransferPlan plan = PlanFor(size, *src.GetBackend());

  shared_ptr<TransferOperation> op = boost::make_shared<TransferOperation>(
      TransferDirection::Read, src.ToString(), size);
  op->SetPlan(plan.tierName, plan.chunkSize, plan.concurrency, plan.multipart);
  op->Partition();
  Info("Read " << src.ToString() << " " << size << " bytes in "
               << op->GetTaskCount() << " chunks " << plan.ToString());

  shared_ptr<ReadState> state(new ReadState(
      src, op, PolicyFor(m_retryPolicy, *src.GetConfig()), plan.concurrency,
      GetReorderCapacity(plan), opControl));
  ReadPipeline reader(m_pool.get(), state);
  try {
    Buffer chunk;
    while (reader.Next(&chunk)) {
      if (!chunk->empty()) {
        sink(&(*chunk)[0], chunk->size());
      }
      chunk.reset();
    }
  } catch (...) {
    op->MarkAborted();
    Error("Read of " << src.ToString() << " aborted " << op->ToString());
    throw;
  }
  ErrorIf(!op->MarkComplete(),
          "Read of " << src.ToString() << " ended with unfinished chunks");
  return op;
}

// --------------------------------------------------------------------------
shared_ptr<TransferOperation> ConcurrentTransferEngine::ReadUntilShortChunk(
    const PathHandle &src, const ChunkSink &sink, TransferControl *control) {
  TransferPlan plan = PlanForUnknownSize();
  shared_ptr<TransferOperation> op = boost::make_shared<TransferOperation>(
      TransferDirection::Read, src.ToString(), 0);
  op->SetPlan(plan.tierName, plan.chunkSize, plan.concurrency, false);
  Info("Read " << src.ToString() << " of unknown size " << plan.ToString());

  RetryPolicy policy = PolicyFor(m_retryPolicy, *src.GetConfig());
  const string path = src.ToString();
  uint64_t size = 0;
  try {
    for (;;) {
      control->ThrowIfStopped(path);
      shared_ptr<TransferTask> task = op->AppendTask(plan.chunkSize);
      vector<char> chunk;
      policy.Execute(bind(&Backend::ReadChunk, src.GetBackend(),
                          src.GetLocation(), task->GetOffset(),
                          task->GetLength(), &chunk),
                     task.get(), path, control);
      size += chunk.size();
      if (!chunk.empty()) {
        sink(&chunk[0], chunk.size());
      }
      if (chunk.size() < task->GetLength()) {
        break;
      }
    }
  } catch (...) {
    op->MarkAborted();
    Error("Read of " << path << " aborted " << op->ToString());
    throw;
  }
  op->SetSize(size);
  ErrorIf(!op->MarkComplete(),
          "Read of " << path << " ended with unfinished chunks");
  return op;
}

// --------------------------------------------------------------------------
string ConcurrentTransferEngine::ReadToString(const PathHandle &src,
                                              TransferControl *control) {
  string out;
  Read(src, bind(&AppendTo, &out, _1, _2), control);
  return out;
}

// --------------------------------------------------------------------------
shared_ptr<TransferOperation> ConcurrentTransferEngine::Write(
    const PathHandle &dst, const string &payload, TransferControl *control) {
  return Write(dst, payload.data(), payload.size(), control);
}

// --------------------------------------------------------------------------
shared_ptr<TransferOperation> ConcurrentTransferEngine::Write(
    const PathHandle &dst, const char *data, size_t size,
    TransferControl *control) {
  TransferPlan plan = PlanFor(size, *dst.GetBackend());
  return WriteChunks(dst, size, plan, bind(&SliceOf, data, _1),
                     TransferDirection::Write, control);
}

// --------------------------------------------------------------------------
shared_ptr<TransferOperation> ConcurrentTransferEngine::WriteFromStream(
    const PathHandle &dst, istream &stream, uint64_t size,
    TransferControl *control) {
  TransferPlan plan = PlanFor(size, *dst.GetBackend());
  return WriteChunks(dst, size, plan,
                     bind(&ReadFromStream, &stream, dst.ToString(), _1),
                     TransferDirection::Write, control);
}

// --------------------------------------------------------------------------
shared_ptr<TransferOperation> ConcurrentTransferEngine::Copy(
    const PathHandle &src, const PathHandle &dst, TransferControl *control) {
  shared_ptr<TransferControl> opControl = TransferControl::CreateChild(control);
  ObjectStat stat = StatObject(src, opControl.get());
  if (!stat.sizeKnown) {
    // the write plan needs the size, so the source is taken in whole first
    string data;
    ReadUntilShortChunk(src, bind(&AppendTo, &data, _1, _2), opControl.get());
    TransferPlan plan = PlanFor(data.size(), *dst.GetBackend());
    return WriteChunks(dst, data.size(), plan, bind(&SliceOf, data.data(), _1),
                       TransferDirection::Copy, opControl.get());
  }
  uint64_t size = stat.size;
  TransferPlan readPlan = PlanFor(size, *src.GetBackend());
  TransferPlan writePlan = PlanFor(size, *dst.GetBackend());

  // both sides use the chunks of the destination, so each source chunk is
  // one destination chunk, and the lower of the two concurrencies
  TransferPlan plan = writePlan;
  plan.concurrency = std::min(readPlan.concurrency, writePlan.concurrency);
  shared_ptr<TransferOperation> readOp =
      boost::make_shared<TransferOperation>(TransferDirection::Read,
                                            src.ToString(), size);
  readOp->SetPlan(plan.tierName, plan.chunkSize, plan.concurrency, false);
  readOp->Partition();
  Info("Copy " << src.ToString() << " to " << dst.ToString() << " "
               << size << " bytes " << plan.ToString());

  shared_ptr<ReadState> state(new ReadState(
      src, readOp, PolicyFor(m_retryPolicy, *src.GetConfig()),
      plan.concurrency, GetReorderCapacity(plan), opControl));
  ReadPipeline reader(m_pool.get(), state);
  shared_ptr<TransferOperation> op =
      WriteChunks(dst, size, plan, bind(&ReadPipeline::NextFor, &reader, _1),
                  TransferDirection::Copy, opControl.get());
  ErrorIf(!readOp->MarkComplete(),
          "Copy of " << src.ToString() << " ended with unfinished reads");
  return op;
}

// --------------------------------------------------------------------------
shared_ptr<TransferOperation> ConcurrentTransferEngine::WriteChunks(
    const PathHandle &dst, uint64_t size, const TransferPlan &plan,
    const ChunkSource &source, TransferDirection::Value direction,
    TransferControl *control) {
  shared_ptr<TransferControl> opControl = TransferControl::CreateChild(control);
  shared_ptr<TransferOperation> op =
      boost::make_shared<TransferOperation>(direction, dst.ToString(), size);
  op->SetPlan(plan.tierName, plan.chunkSize, plan.concurrency, plan.multipart);
  op->Partition();
  DebugInfo("Write " << dst.ToString() << " " << size << " bytes in "
                     << op->GetTaskCount() << " chunks "
                     << plan.ToString());

  shared_ptr<WriteState> state(new WriteState(
      dst, op, PolicyFor(m_retryPolicy, *dst.GetConfig()), plan.concurrency,
      opControl));
  const string &path = state->path;

  try {
    if (plan.multipart) {
      state->retryPolicy.Execute(
          bind(&Backend::InitiateMultipartUpload, state->backend, state->loc,
               &state->uploadId),
          NULL, path, opControl.get());
      op->SetUploadId(state->uploadId);
    } else {
      state->retryPolicy.Execute(bind(&Backend::BeginWrite, state->backend,
                                      state->loc, size, &state->writeId),
                                 NULL, path, opControl.get());
    }
  } catch (...) {
    op->MarkAborted();
    throw;
  }

  size_t count = op->GetTaskCount();
  for (size_t i = 0; i < count; ++i) {
    if (opControl->ShouldStop() || !state->slots.Acquire()) {
      break;
    }
    Buffer chunk;
    try {
      chunk = source(*op->GetTask(i));
    } catch (...) {
      state->slots.Release();
      op->GetTask(i)->TransitionTo(TaskState::Failed);
      state->RecordFailure(static_cast<int64_t>(i), boost::current_exception());
      break;
    }
    m_pool->Submit(bind(&WriteChunkTask, state, i, chunk));
  }
  state->slots.WaitAllReleased();

  if (state->HasFailed() || opControl->ShouldStop()) {
    string cleanupError = CleanUpWrite(*state);
    op->MarkAborted();
    Error("Write of " << path << " aborted " << op->ToString());
    if (state->HasFailed()) {
      try {
        boost::rethrow_exception(state->GetFailure());
      } catch (TransferError &err) {
        if (!cleanupError.empty()) {
          err.SetCleanupError(cleanupError);
        }
        throw;
      }
    }
    opControl->ThrowIfStopped(path);
  }

  try {
    if (plan.multipart) {
      vector<CompletedPart> parts;
      parts.reserve(count);
      BOOST_FOREACH(const shared_ptr<TransferTask> &task, op->GetTasks()) {
        parts.push_back(CompletedPart(task->GetPartNumber(), task->GetETag()));
      }
      state->retryPolicy.Execute(
          bind(&Backend::CompleteMultipartUpload, state->backend, state->loc,
               state->uploadId, parts),
          NULL, path, opControl.get());
    } else {
      state->retryPolicy.Execute(bind(&Backend::CommitWrite, state->backend,
                                      state->loc, state->writeId),
                                 NULL, path, opControl.get());
    }
  } catch (TransferError &err) {
    string cleanupError = CleanUpWrite(*state);
    if (!cleanupError.empty()) {
      err.SetCleanupError(cleanupError);
    }
    op->MarkAborted();
    throw;
  } catch (...) {
    CleanUpWrite(*state);
    op->MarkAborted();
    throw;
  }

  ErrorIf(!op->MarkComplete(),
          "Write of " << path << " ended with unfinished chunks");
  dst.InvalidateStat();
  return op;
}

// --------------------------------------------------------------------------
void ConcurrentTransferEngine::Remove(const PathHandle &path,
                                      TransferControl *control) {
  RetryPolicy policy = PolicyFor(m_retryPolicy, *path.GetConfig());
  policy.Execute(bind(&Backend::DeleteObject, path.GetBackend(),
                      path.GetLocation()),
                 NULL, path.ToString(), control);
  path.InvalidateStat();
  DebugInfo("Removed " << path.ToString());
}

// --------------------------------------------------------------------------
void ConcurrentTransferEngine::AbortMultipartUpload(
    const PathHandle &path, const string &uploadId) {
  RetryPolicy policy = PolicyFor(m_retryPolicy, *path.GetConfig());
  try {
    policy.Execute(bind(&Backend::AbortMultipartUpload, path.GetBackend(),
                        path.GetLocation(), uploadId),
                   TransferError::kNoChunk, path.ToString());
  } catch (const TransferError &err) {
    throw MultipartAbortError(path.ToString(), uploadId, err.what());
  }
}

}  // namespace Client
}  // namespace FIO
