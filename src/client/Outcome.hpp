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

#ifndef FILEIO_CLIENT_OUTCOME_HPP_
#define FILEIO_CLIENT_OUTCOME_HPP_

#include "client/ClientError.h"

namespace FIO {

namespace Client {

// Either the result of a backend call or the error it failed with.
// Check IsSuccess before using the result.
template <typename Result>
class Outcome {
 public:
  Outcome() {}
  explicit Outcome(const Result &result) : m_result(result) {}
  explicit Outcome(const ClientError &error) : m_error(error) {}

 public:
  const Result &GetResult() const { return m_result; }
  Result &GetResult() { return m_result; }
  const ClientError &GetError() const { return m_error; }
  bool IsSuccess() const { return m_error.IsGood(); }

 private:
  Result m_result;
  ClientError m_error;  // GOOD on success
};

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_OUTCOME_HPP_
