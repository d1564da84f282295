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

#ifndef FILEIO_CLIENT_TRANSFERCONTROL_H_
#define FILEIO_CLIENT_TRANSFERCONTROL_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "boost/date_time/posix_time/posix_time_types.hpp"
#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/weak_ptr.hpp"

namespace FIO {

namespace Client {

//
// TransferControl
//
// Cancellation flag and optional deadline shared by every chunk of one
// transfer. Cancel is idempotent.
//
class TransferControl : private boost::noncopyable {
 public:
  typedef boost::function<void()> Listener;

  TransferControl();
  // @param  : timeout in milliseconds from now, 0 for no deadline
  explicit TransferControl(uint32_t timeoutInMs);

  // Control of one operation, sharing the deadline of parent and cancelled
  // along with it. Parent may be null. Parent only holds a weak reference,
  // the child goes away with the operation.
  static boost::shared_ptr<TransferControl> CreateChild(
      TransferControl *parent);

 public:
  void Cancel();

  bool IsCancelled() const;
  bool IsExpired() const;
  bool ShouldStop() const { return IsCancelled() || IsExpired(); }

  bool HasDeadline() const { return m_timeoutInMs > 0; }
  uint32_t GetTimeoutInMs() const { return m_timeoutInMs; }
  const boost::posix_time::ptime &GetDeadline() const { return m_deadline; }

  // Sleep for the given time
  //
  // @param  : milliseconds
  // @return : false if woken up by cancellation or deadline
  bool WaitFor(uint32_t milliseconds);

  // Throw CancelledError or TimeoutError if the transfer should stop
  void ThrowIfStopped(const std::string &path) const;

  // Listener is called once on the cancelling thread, or at once if the
  // control is already cancelled
  void AddCancelListener(const Listener &listener);

  // Number of child references held, expired ones are dropped whenever a
  // child is added
  size_t GetChildCount() const;

 private:
  TransferControl(uint32_t timeoutInMs,
                  const boost::posix_time::ptime &deadline);

  void AddChild(const boost::shared_ptr<TransferControl> &child);

  uint32_t m_timeoutInMs;
  boost::posix_time::ptime m_deadline;
  bool m_cancelled;
  std::vector<Listener> m_listeners;
  std::vector<boost::weak_ptr<TransferControl> > m_children;
  mutable boost::mutex m_lock;
  boost::condition_variable m_cancelSignal;
};

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_TRANSFERCONTROL_H_
