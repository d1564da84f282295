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

#include "client/TransferControl.h"

#include <string>
#include <vector>

#include "boost/date_time/posix_time/posix_time.hpp"
#include "boost/foreach.hpp"
#include "boost/thread/locks.hpp"

#include "base/Exception.h"

namespace FIO {

namespace Client {

using boost::lock_guard;
using boost::shared_ptr;
using boost::mutex;
using boost::unique_lock;
using boost::weak_ptr;
using boost::posix_time::microsec_clock;
using boost::posix_time::milliseconds;
using boost::posix_time::ptime;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
TransferControl::TransferControl()
    : m_timeoutInMs(0), m_deadline(boost::posix_time::pos_infin),
      m_cancelled(false) {}

// --------------------------------------------------------------------------
TransferControl::TransferControl(uint32_t timeoutInMs)
    : m_timeoutInMs(timeoutInMs),
      m_deadline(timeoutInMs > 0
                     ? microsec_clock::universal_time() +
                           milliseconds(timeoutInMs)
                     : ptime(boost::posix_time::pos_infin)),
      m_cancelled(false) {}

// --------------------------------------------------------------------------
TransferControl::TransferControl(uint32_t timeoutInMs, const ptime &deadline)
    : m_timeoutInMs(timeoutInMs), m_deadline(deadline), m_cancelled(false) {}

// --------------------------------------------------------------------------
shared_ptr<TransferControl> TransferControl::CreateChild(
    TransferControl *parent) {
  if (parent == NULL) {
    return shared_ptr<TransferControl>(new TransferControl());
  }
  shared_ptr<TransferControl> child(
      new TransferControl(parent->m_timeoutInMs, parent->m_deadline));
  parent->AddChild(child);
  return child;
}

// --------------------------------------------------------------------------
void TransferControl::AddChild(const shared_ptr<TransferControl> &child) {
  {
    lock_guard<mutex> lock(m_lock);
    if (!m_cancelled) {
      vector<weak_ptr<TransferControl> > live;
      live.reserve(m_children.size() + 1);
      BOOST_FOREACH(const weak_ptr<TransferControl> &ref, m_children) {
        if (!ref.expired()) {
          live.push_back(ref);
        }
      }
      live.push_back(child);
      m_children.swap(live);
      return;
    }
  }
  child->Cancel();
}

// --------------------------------------------------------------------------
size_t TransferControl::GetChildCount() const {
  lock_guard<mutex> lock(m_lock);
  return m_children.size();
}

// --------------------------------------------------------------------------
void TransferControl::Cancel() {
  vector<Listener> listeners;
  vector<weak_ptr<TransferControl> > children;
  {
    lock_guard<mutex> lock(m_lock);
    if (m_cancelled) {
      return;
    }
    m_cancelled = true;
    listeners.swap(m_listeners);
    children.swap(m_children);
  }
  m_cancelSignal.notify_all();
  BOOST_FOREACH(const weak_ptr<TransferControl> &ref, children) {
    shared_ptr<TransferControl> child = ref.lock();
    if (child) {
      child->Cancel();
    }
  }
  BOOST_FOREACH(Listener &listener, listeners) { listener(); }
}

// --------------------------------------------------------------------------
bool TransferControl::IsCancelled() const {
  lock_guard<mutex> lock(m_lock);
  return m_cancelled;
}

// --------------------------------------------------------------------------
bool TransferControl::IsExpired() const {
  return HasDeadline() && microsec_clock::universal_time() >= m_deadline;
}

// --------------------------------------------------------------------------
bool TransferControl::WaitFor(uint32_t ms) {
  ptime until = microsec_clock::universal_time() + milliseconds(ms);
  if (until > m_deadline) {
    until = m_deadline;
  }
  unique_lock<mutex> lock(m_lock);
  while (!m_cancelled && microsec_clock::universal_time() < until) {
    m_cancelSignal.timed_wait(lock, until);
  }
  return !m_cancelled && !IsExpired();
}

// --------------------------------------------------------------------------
void TransferControl::ThrowIfStopped(const string &path) const {
  if (IsCancelled()) {
    throw FIO::Exception::CancelledError(path);
  }
  if (IsExpired()) {
    throw FIO::Exception::TimeoutError(path, m_timeoutInMs);
  }
}

// --------------------------------------------------------------------------
void TransferControl::AddCancelListener(const Listener &listener) {
  {
    lock_guard<mutex> lock(m_lock);
    if (!m_cancelled) {
      m_listeners.push_back(listener);
      return;
    }
  }
  listener();
}

}  // namespace Client
}  // namespace FIO
