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

#include "client/S3Error.h"

#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"

namespace FIO {

namespace Client {

using boost::to_string;
using QingStor::Http::HttpResponseCode;
using std::make_pair;
using std::pair;
using std::string;

// --------------------------------------------------------------------------
int SDKResponseCodeToInt(HttpResponseCode code) {
  using namespace QingStor::Http;  // NOLINT
  pair<HttpResponseCode, int> codeToNums[] = {
      // keep in sorted order
      make_pair(REQUEST_NOT_MADE, 0),
      make_pair(CONTINUE, 100),
      make_pair(OK, 200),
      make_pair(CREATED, 201),
      make_pair(ACCEPTED, 202),
      make_pair(NO_CONTENT, 204),
      make_pair(PARTIAL_CONTENT, 206),
      make_pair(MOVED_PERMANENTLY, 301),
      make_pair(FOUND, 302),
      make_pair(NOT_MODIFIED, 304),
      make_pair(TEMPORARY_REDIRECT, 307),
      make_pair(BAD_REQUEST, 400),
      make_pair(UNAUTHORIZED_OR_EXPIRED, 401),
      make_pair(FORBIDDEN, 403),
      make_pair(NOT_FOUND, 404),
      make_pair(METHOD_NOT_ALLOWED, 405),
      make_pair(CONFLICT, 409),
      make_pair(PRECONDITION_FAILED, 412),
      make_pair(INVALID_RANGE, 416),
      make_pair(TOO_MANY_REQUESTS, 429),
      make_pair(INTERNAL_SERVER_ERROR, 500),
      make_pair(SERVICE_UNAVAILABLE, 503),
      make_pair(GATEWAY_TIMEOUT, 504),
      make_pair(INSUFFICIENT_STORAGE, 507),
      make_pair(NETWORK_READ_TIMEOUT, 598),
      make_pair(NETWORK_CONNECT_TIMEOUT, 599),
  };

  int n = sizeof(codeToNums) / sizeof(codeToNums[0]);
  // binary search
  int low = 0;
  int high = n - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (code == codeToNums[mid].first) {
      return codeToNums[mid].second;
    }
    if (static_cast<int>(code) < static_cast<int>(codeToNums[mid].first)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return -1;
}

// --------------------------------------------------------------------------
bool SDKResponseSuccess(QsError sdkErr, HttpResponseCode code) {
  if (sdkErr == QS_ERR_NO_ERROR) {
    return true;
  }
  int status = SDKResponseCodeToInt(code);
  return sdkErr == QS_ERR_UNEXCEPTED_RESPONSE && status >= 200 && status < 300;
}

// --------------------------------------------------------------------------
ErrorCode::Value SDKResponseToErrorCode(QsError sdkErr,
                                        HttpResponseCode code) {
  switch (sdkErr) {
    case QS_ERR_NO_ERROR:
      return ErrorCode::GOOD;
    case QS_ERR_NO_REQUIRED_PARAMETER:
      return ErrorCode::PARAMETER_MISSING;
    case QS_ERR_SIGN_WITH_INVAILD_KEY:
      return ErrorCode::AUTHENTICATION_FAILED;
    case QS_ERR_INVAILD_CONFIG_FILE:
      return ErrorCode::MALFORMED_REQUEST;
    case QS_ERR_SEND_REQUEST_ERROR:
      return ErrorCode::CONNECTION_RESET;
    case QS_ERR_UNEXCEPTED_RESPONSE:
      break;
    default:
      return ErrorCode::UNKNOWN;
  }

  int status = SDKResponseCodeToInt(code);
  if (status == 598 || status == 599) {
    return ErrorCode::REQUEST_TIMEOUT;
  } else if (status == 0) {
    return ErrorCode::CONNECTION_RESET;
  }
  return HttpStatusToErrorCode(status);
}

// --------------------------------------------------------------------------
ClientError BuildS3Error(QsError sdkErr, const string &exceptionName,
                         const QingStor::QsOutput &output) {
  HttpResponseCode rspCode =
      const_cast<QingStor::QsOutput &>(output).GetResponseCode();
  ErrorCode::Value err = SDKResponseToErrorCode(sdkErr, rspCode);

  string errMsg = "[status:" + to_string(SDKResponseCodeToInt(rspCode)) + "]";
  if (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE) {
    QingStor::ResponseErrorInfo errInfo = output.GetResponseErrInfo();
    errMsg += "[code:" + errInfo.code;
    errMsg += "; message:" + errInfo.message;
    errMsg += "; request:" + errInfo.requestID;
    errMsg += "; url:" + errInfo.url;
    errMsg += "]";
  }
  return ClientError(err, exceptionName, errMsg);
}

}  // namespace Client
}  // namespace FIO
