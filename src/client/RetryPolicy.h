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

#ifndef FILEIO_CLIENT_RETRYPOLICY_H_
#define FILEIO_CLIENT_RETRYPOLICY_H_

#include <stdint.h>

#include <string>

#include "boost/function.hpp"

#include "client/ClientError.h"

namespace FIO {

namespace Configure {
class PerformanceProfile;
}  // namespace Configure

namespace Client {

class TransferControl;
class TransferTask;

//
// RetryPolicy
//
// Bounded exponential backoff around one chunk operation. The delay before
// retry n (0 based) is baseDelay * factor^n, capped at maxDelay, and drawn
// uniformly from [delay/2, delay] when jitter is on.
// Holds no state between calls to Execute.
//
class RetryPolicy {
 public:
  typedef boost::function<ClientError()> Operation;

  RetryPolicy();
  RetryPolicy(uint16_t maxRetries, uint32_t baseDelayInMs,
              double factor = 2.0, bool jitter = true,
              uint32_t maxDelayInMs = 60 * 1000);

  static RetryPolicy FromProfile(const Configure::PerformanceProfile &profile);

 public:
  bool ShouldRetry(const ClientError &error,
                   uint16_t attemptedRetryTimes) const;

  // Delay before the next retry without jitter, in milliseconds
  uint32_t CalculateDelayBeforeNextRetry(uint16_t attemptedRetryTimes) const;

  // Run operation until it succeeds, fails fatally or retries are used up
  //
  // @param  : operation, task the attempts are recorded on, path for error
  //           context, transfer control (may be null)
  // @return : number of attempts made
  //
  // Throws TransferError annotated with the task's chunk index, the number
  // of attempts and the last error. Throws CancelledError or TimeoutError
  // when the control stops the transfer, no retry is scheduled after that.
  uint16_t Execute(const Operation &operation, TransferTask *task,
                   const std::string &path, TransferControl *control) const;

  // Same as above for a standalone call
  uint16_t Execute(const Operation &operation, int64_t chunkIndex,
                   const std::string &path) const;

  uint16_t GetMaxRetries() const { return m_maxRetries; }
  uint32_t GetBaseDelayInMs() const { return m_baseDelayInMs; }
  double GetFactor() const { return m_factor; }
  bool HasJitter() const { return m_jitter; }

 private:
  uint32_t Jitter(uint32_t delay, uint16_t attemptedRetryTimes) const;

  uint16_t m_maxRetries;
  uint32_t m_baseDelayInMs;
  double m_factor;
  bool m_jitter;
  uint32_t m_maxDelayInMs;
};

}  // namespace Client
}  // namespace FIO

#endif  // FILEIO_CLIENT_RETRYPOLICY_H_
