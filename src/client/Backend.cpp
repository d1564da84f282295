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

#include "client/Backend.h"

#include <string>
#include <utility>
#include <vector>

namespace FIO {

namespace Client {

using std::make_pair;
using std::pair;
using std::string;
using std::vector;

namespace {

const pair<PresignOperation::Value, const char *> kPresignOperations[] = {
    make_pair(PresignOperation::GetObject, "get_object"),
    make_pair(PresignOperation::PutObject, "put_object"),
    make_pair(PresignOperation::DeleteObject, "delete_object"),
    make_pair(PresignOperation::HeadObject, "head_object"),
};

const size_t kPresignOperationCount =
    sizeof(kPresignOperations) / sizeof(kPresignOperations[0]);

}  // namespace

// --------------------------------------------------------------------------
string ObjectLocation::ToString() const {
  return container.empty() ? key : container + "/" + key;
}

// --------------------------------------------------------------------------
string PresignOperationToString(PresignOperation::Value op) {
  for (size_t i = 0; i < kPresignOperationCount; ++i) {
    if (kPresignOperations[i].first == op) {
      return kPresignOperations[i].second;
    }
  }
  return "unknown_operation";
}

// --------------------------------------------------------------------------
bool StringToPresignOperation(const string &name,
                              PresignOperation::Value *op) {
  for (size_t i = 0; i < kPresignOperationCount; ++i) {
    if (name == kPresignOperations[i].second) {
      if (op != NULL) {
        *op = kPresignOperations[i].first;
      }
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
string PresignOperationToMethod(PresignOperation::Value op) {
  switch (op) {
    case PresignOperation::PutObject:
      return "PUT";
    case PresignOperation::DeleteObject:
      return "DELETE";
    case PresignOperation::HeadObject:
      return "HEAD";
    case PresignOperation::GetObject:
    default:
      return "GET";
  }
}

// --------------------------------------------------------------------------
ClientError Backend::InitiateMultipartUpload(const ObjectLocation &loc,
                                             string *uploadId) {
  return NotSupported("InitiateMultipartUpload object=" + loc.ToString());
}

// --------------------------------------------------------------------------
ClientError Backend::UploadPart(const ObjectLocation &loc,
                                const string &uploadId, int partNumber,
                                const char *data, size_t length,
                                string *eTag) {
  return NotSupported("UploadPart object=" + loc.ToString());
}

// --------------------------------------------------------------------------
ClientError Backend::CompleteMultipartUpload(
    const ObjectLocation &loc, const string &uploadId,
    const vector<CompletedPart> &parts) {
  return NotSupported("CompleteMultipartUpload object=" + loc.ToString());
}

// --------------------------------------------------------------------------
ClientError Backend::AbortMultipartUpload(const ObjectLocation &loc,
                                          const string &uploadId) {
  return NotSupported("AbortMultipartUpload object=" + loc.ToString());
}

// --------------------------------------------------------------------------
ClientError Backend::PresignUrl(const ObjectLocation &loc,
                                PresignOperation::Value op,
                                uint32_t expiresInSec,
                                const QueryParams &params, string *url) {
  return NotSupported("PresignUrl object=" + loc.ToString());
}

// --------------------------------------------------------------------------
ClientError Backend::NotSupported(const string &exceptionName) const {
  return ClientError(ErrorCode::NOT_SUPPORTED, exceptionName,
                     ProviderFamilyToString(GetFamily()) +
                         " backend of scheme " + m_config->GetScheme() +
                         " does not support this operation",
                     false);
}

}  // namespace Client
}  // namespace FIO
