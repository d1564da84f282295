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

#include "client/ClientError.h"

#include <errno.h>

#include <string>
#include <utility>

namespace FIO {

namespace Client {

using std::make_pair;
using std::pair;
using std::string;

// --------------------------------------------------------------------------
string ErrorCodeToString(ErrorCode::Value err) {
  static const pair<ErrorCode::Value, const char *> errToNames[] = {
      // keep in enum order
      make_pair(ErrorCode::UNKNOWN, "Unknown"),
      make_pair(ErrorCode::GOOD, "Good"),
      make_pair(ErrorCode::NOT_FOUND, "NotFound"),
      make_pair(ErrorCode::PARAMETER_MISSING, "ParameterMissing"),
      make_pair(ErrorCode::NOT_SUPPORTED, "NotSupported"),
      make_pair(ErrorCode::AUTHENTICATION_FAILED, "AuthenticationFailed"),
      make_pair(ErrorCode::ACCESS_DENIED, "AccessDenied"),
      make_pair(ErrorCode::MALFORMED_REQUEST, "MalformedRequest"),
      make_pair(ErrorCode::REQUEST_TIMEOUT, "RequestTimeout"),
      make_pair(ErrorCode::CONNECTION_RESET, "ConnectionReset"),
      make_pair(ErrorCode::SERVER_ERROR, "ServerError"),
      make_pair(ErrorCode::THROTTLED, "Throttled"),
      make_pair(ErrorCode::IO_ERROR, "IOError"),
      make_pair(ErrorCode::CANCELLED, "Cancelled"),
  };
  size_t n = sizeof(errToNames) / sizeof(errToNames[0]);
  size_t idx = static_cast<size_t>(err);
  return idx < n ? errToNames[idx].second : "Unknown";
}

// --------------------------------------------------------------------------
bool IsRetryableErrorCode(ErrorCode::Value err) {
  switch (err) {
    case ErrorCode::REQUEST_TIMEOUT:
    case ErrorCode::CONNECTION_RESET:
    case ErrorCode::SERVER_ERROR:
    case ErrorCode::THROTTLED:
      return true;
    default:
      return false;
  }
}

// --------------------------------------------------------------------------
ErrorCode::Value HttpStatusToErrorCode(int status) {
  if (status >= 200 && status < 400) {
    return ErrorCode::GOOD;
  }
  switch (status) {
    case 400:
    case 411:
    case 413:
    case 416:
      return ErrorCode::MALFORMED_REQUEST;
    case 401:
      return ErrorCode::AUTHENTICATION_FAILED;
    case 403:
      return ErrorCode::ACCESS_DENIED;
    case 404:
      return ErrorCode::NOT_FOUND;
    case 408:
      return ErrorCode::REQUEST_TIMEOUT;
    case 429:
      return ErrorCode::THROTTLED;
    default:
      break;
  }
  if (status >= 500 && status < 600) {
    return ErrorCode::SERVER_ERROR;
  }
  return ErrorCode::UNKNOWN;
}

// --------------------------------------------------------------------------
ErrorCode::Value ErrnoToErrorCode(int errnum) {
  switch (errnum) {
    case 0:
      return ErrorCode::GOOD;
    case ENOENT:
    case ENOTDIR:
      return ErrorCode::NOT_FOUND;
    case EACCES:
    case EPERM:
    case EROFS:
      return ErrorCode::ACCESS_DENIED;
    case EINVAL:
    case EISDIR:
    case ENAMETOOLONG:
      return ErrorCode::MALFORMED_REQUEST;
    case ETIMEDOUT:
      return ErrorCode::REQUEST_TIMEOUT;
    // a mounted network share reports these on transient failures
    case EINTR:
    case EAGAIN:
    case ECONNRESET:
    case EIO:
      return ErrorCode::CONNECTION_RESET;
    default:
      return ErrorCode::IO_ERROR;
  }
}

// --------------------------------------------------------------------------
string ClientError::ToString() const {
  return ErrorCodeToString(m_error) + ", " + m_exceptionName + ":" + m_message;
}

}  // namespace Client
}  // namespace FIO
