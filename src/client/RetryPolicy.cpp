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

#include "client/RetryPolicy.h"

#include <math.h>

#include <string>

#include "boost/date_time/posix_time/posix_time.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/functional/hash.hpp"
#include "boost/random/mersenne_twister.hpp"
#include "boost/random/uniform_int_distribution.hpp"
#include "boost/thread/thread.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "configure/Default.h"
#include "configure/PerformanceProfile.h"
#include "client/TransferControl.h"
#include "client/TransferTask.h"

namespace FIO {

namespace Client {

using boost::to_string;
using FIO::Exception::TransferError;
using std::string;

// --------------------------------------------------------------------------
RetryPolicy::RetryPolicy()
    : m_maxRetries(Configure::Default::GetDefaultMaxRetries()),
      m_baseDelayInMs(Configure::Default::GetDefaultRetryDelayInMs()),
      m_factor(Configure::Default::GetDefaultRetryBackoffFactor()),
      m_jitter(true),
      m_maxDelayInMs(Configure::Default::GetDefaultRetryMaxDelayInMs()) {}

// --------------------------------------------------------------------------
RetryPolicy::RetryPolicy(uint16_t maxRetries, uint32_t baseDelayInMs,
                         double factor, bool jitter, uint32_t maxDelayInMs)
    : m_maxRetries(maxRetries),
      m_baseDelayInMs(baseDelayInMs),
      m_factor(factor < 1.0 ? 1.0 : factor),
      m_jitter(jitter),
      m_maxDelayInMs(maxDelayInMs) {}

// --------------------------------------------------------------------------
RetryPolicy RetryPolicy::FromProfile(
    const Configure::PerformanceProfile &profile) {
  const Configure::PerformanceSettings &settings = profile.GetSettings();
  return RetryPolicy(settings.maxRetries, settings.retryDelayInMs,
                     Configure::Default::GetDefaultRetryBackoffFactor(), true,
                     Configure::Default::GetDefaultRetryMaxDelayInMs());
}

// --------------------------------------------------------------------------
bool RetryPolicy::ShouldRetry(const ClientError &error,
                              uint16_t attemptedRetryTimes) const {
  if (attemptedRetryTimes >= m_maxRetries) {
    return false;
  }
  return error.ShouldRetry();
}

// --------------------------------------------------------------------------
uint32_t RetryPolicy::CalculateDelayBeforeNextRetry(
    uint16_t attemptedRetryTimes) const {
  double delay = m_baseDelayInMs * pow(m_factor, attemptedRetryTimes);
  if (delay > m_maxDelayInMs) {
    return m_maxDelayInMs;
  }
  return static_cast<uint32_t>(delay);
}

// --------------------------------------------------------------------------
uint32_t RetryPolicy::Jitter(uint32_t delay,
                             uint16_t attemptedRetryTimes) const {
  if (!m_jitter || delay < 2) {
    return delay;
  }
  size_t seed = 0;
  boost::hash_combine(seed, boost::this_thread::get_id());
  boost::hash_combine(seed, boost::posix_time::microsec_clock::universal_time()
                                .time_of_day()
                                .total_microseconds());
  boost::hash_combine(seed, attemptedRetryTimes);
  boost::random::mt19937 gen(static_cast<uint32_t>(seed));
  boost::random::uniform_int_distribution<uint32_t> dist(delay / 2, delay);
  return dist(gen);
}

// --------------------------------------------------------------------------
uint16_t RetryPolicy::Execute(const Operation &operation, TransferTask *task,
                              const string &path,
                              TransferControl *control) const {
  int64_t chunkIndex =
      task != NULL ? task->GetIndex() : TransferError::kNoChunk;
  uint16_t attempts = 0;
  while (true) {
    if (control != NULL && control->ShouldStop()) {
      if (task != NULL) {
        task->TransitionTo(TaskState::Failed);
      }
      control->ThrowIfStopped(path);
    }

    if (task != NULL) {
      task->BeginAttempt();
    }
    ++attempts;
    ClientError err = operation();
    if (err.IsGood()) {
      if (task != NULL) {
        task->TransitionTo(TaskState::Done);
      }
      return attempts;
    }

    if (task != NULL) {
      task->SetLastError(err.ToString());
    }
    uint16_t retried = attempts - 1;
    if (!ShouldRetry(err, retried)) {
      if (task != NULL) {
        task->TransitionTo(TaskState::Failed);
      }
      ErrorIf(err.ShouldRetry(),
              "Giving up after " << attempts << " attempts [path=" << path
                                 << " chunk=" << chunkIndex << "] "
                                 << err.ToString());
      throw TransferError(path, chunkIndex, attempts, err.ToString(),
                          static_cast<int>(err.GetError()), err.ShouldRetry());
    }

    if (task != NULL) {
      task->TransitionTo(TaskState::Retrying);
    }
    uint32_t delay = Jitter(CalculateDelayBeforeNextRetry(retried), retried);
    Warning("Retry in " << delay << "ms [path=" << path << " chunk="
                        << chunkIndex << " attempt=" << attempts << "] "
                        << err.ToString());
    if (control != NULL) {
      if (!control->WaitFor(delay)) {
        if (task != NULL) {
          task->TransitionTo(TaskState::Failed);
        }
        control->ThrowIfStopped(path);
      }
    } else if (delay > 0) {
      boost::this_thread::sleep(boost::posix_time::milliseconds(delay));
    }
  }
}

// --------------------------------------------------------------------------
uint16_t RetryPolicy::Execute(const Operation &operation, int64_t chunkIndex,
                              const string &path) const {
  TransferTask task(chunkIndex, 0, 0);
  return Execute(operation, &task, path, NULL);
}

}  // namespace Client
}  // namespace FIO
