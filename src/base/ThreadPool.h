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

#ifndef FILEIO_BASE_THREADPOOL_H_
#define FILEIO_BASE_THREADPOOL_H_

#include <stddef.h>  // for size_t

#include <deque>

#include "boost/function.hpp"
#include "boost/make_shared.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"

namespace FIO {

namespace Threading {

typedef boost::function<void()> Task;

//
// ThreadPool
//
// A fixed number of worker threads draining one task queue. Tasks left in
// the queue when the pool is destroyed are dropped, running tasks are
// joined.
//
class ThreadPool : private boost::noncopyable {
 public:
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

 public:
  void Submit(const Task &task) { SubmitToThread(task, false); }
  void SubmitPrioritized(const Task &task) { SubmitToThread(task, true); }

  // Submit a callable and get a future of its result
  template <typename R>
  boost::unique_future<R> SubmitCallable(const boost::function<R()> &func) {
    boost::shared_ptr<boost::packaged_task<R> > task =
        boost::make_shared<boost::packaged_task<R> >(func);
    boost::unique_future<R> future = task->get_future();
    SubmitToThread(PackagedTaskRunner<R>(task), false);
    return future;
  }

  size_t GetPoolSize() const { return m_poolSize; }

  // Number of tasks waiting for a worker
  size_t GetQueuedTaskCount();

 private:
  template <typename R>
  struct PackagedTaskRunner {
    explicit PackagedTaskRunner(
        const boost::shared_ptr<boost::packaged_task<R> > &t)
        : task(t) {}
    void operator()() { (*task)(); }
    boost::shared_ptr<boost::packaged_task<R> > task;
  };

  void SubmitToThread(const Task &task, bool prioritized);
  void WorkerLoop();
  void StopProcessing();

 private:
  size_t m_poolSize;
  bool m_stopped;
  std::deque<Task> m_tasks;
  boost::mutex m_queueLock;
  boost::condition_variable m_queueCond;
  boost::thread_group m_workers;

  friend class ThreadPoolTest;
};

}  // namespace Threading
}  // namespace FIO


#endif  // FILEIO_BASE_THREADPOOL_H_
