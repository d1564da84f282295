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

#ifndef FILEIO_CLIENT_S3ERROR_H_
#define FILEIO_CLIENT_S3ERROR_H_

#include <string>

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"
#include "qingstor/Types.h"

#include "client/ClientError.h"

namespace FIO {

namespace Client {

// Numeric http status of sdk response code, -1 if unknown
int SDKResponseCodeToInt(QingStor::Http::HttpResponseCode code);

// Sdk returns QS_ERR_UNEXCEPTED_RESPONSE for some 2xx responses which are
// not listed in its api specs, treat them as success too
bool SDKResponseSuccess(QsError sdkErr,
                        QingStor::Http::HttpResponseCode code);

ErrorCode::Value SDKResponseToErrorCode(QsError sdkErr,
                                        QingStor::Http::HttpResponseCode code);

// Build error from a failed sdk call
ClientError BuildS3Error(QsError sdkErr, const std::string &exceptionName,
                         const QingStor::QsOutput &output);

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_S3ERROR_H_
