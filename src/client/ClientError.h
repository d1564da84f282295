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

#ifndef FILEIO_CLIENT_CLIENTERROR_H_
#define FILEIO_CLIENT_CLIENTERROR_H_

#include <string>

namespace FIO {

namespace Client {

struct ErrorCode {
  enum Value {
    UNKNOWN,
    GOOD,
    NOT_FOUND,
    PARAMETER_MISSING,
    NOT_SUPPORTED,
    AUTHENTICATION_FAILED,
    ACCESS_DENIED,
    MALFORMED_REQUEST,
    REQUEST_TIMEOUT,
    CONNECTION_RESET,
    SERVER_ERROR,
    THROTTLED,
    IO_ERROR,
    CANCELLED
  };
};

std::string ErrorCodeToString(ErrorCode::Value err);

// Timeouts, connection resets, throttling and 5xx are worth retrying,
// everything else fails fast.
bool IsRetryableErrorCode(ErrorCode::Value err);

// Map HTTP status code to error code, 2xx and 3xx map to GOOD
ErrorCode::Value HttpStatusToErrorCode(int status);

// Map errno of a filesystem call to error code
ErrorCode::Value ErrnoToErrorCode(int errnum);

//
// ClientError
//
// Result of a backend call. Backends never throw on a remote failure, they
// return the error and let the retry policy decide.
//
class ClientError {
 public:
  ClientError() : m_error(ErrorCode::GOOD), m_isRetryable(false) {}

  ClientError(ErrorCode::Value err, const std::string &exceptionName,
              const std::string &errorMsg, bool isRetryable)
      : m_error(err),
        m_exceptionName(exceptionName),
        m_message(errorMsg),
        m_isRetryable(isRetryable) {}

  // Retryable flag follows the error code
  ClientError(ErrorCode::Value err, const std::string &exceptionName,
              const std::string &errorMsg)
      : m_error(err),
        m_exceptionName(exceptionName),
        m_message(errorMsg),
        m_isRetryable(IsRetryableErrorCode(err)) {}

 public:
  ErrorCode::Value GetError() const { return m_error; }
  const std::string &GetExceptionName() const { return m_exceptionName; }
  const std::string &GetMessage() const { return m_message; }
  bool ShouldRetry() const { return m_isRetryable; }
  bool IsGood() const { return m_error == ErrorCode::GOOD; }

  // "ErrorName, exceptionName:message"
  std::string ToString() const;

 private:
  ErrorCode::Value m_error;
  std::string m_exceptionName;
  std::string m_message;
  bool m_isRetryable;
};

inline ClientError GoodError() { return ClientError(); }

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_CLIENTERROR_H_
