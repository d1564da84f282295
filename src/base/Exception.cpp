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

#include "base/Exception.h"

#include <string>

#include "boost/exception/to_string.hpp"

namespace FIO {

namespace Exception {

using boost::to_string;
using std::string;

// --------------------------------------------------------------------------
UnknownSchemeError::UnknownSchemeError(const string &scheme)
    : FIOException("UnknownSchemeError: no provider is bound to scheme [" +
                   scheme + "]"),
      m_scheme(scheme) {}

// --------------------------------------------------------------------------
DuplicateSchemeError::DuplicateSchemeError(const string &scheme,
                                           const string &existingBinding,
                                           const string &requestedBinding)
    : FIOException("DuplicateSchemeError: scheme [" + scheme +
                   "] is bound to " + existingBinding + ", cannot rebind to " +
                   requestedBinding),
      m_scheme(scheme) {}

// --------------------------------------------------------------------------
ProviderConfigError::ProviderConfigError(const string &scheme,
                                         const string &reason)
    : FIOException("ProviderConfigError: [scheme=" + scheme + "] " + reason),
      m_scheme(scheme) {}

// --------------------------------------------------------------------------
InvalidPathError::InvalidPathError(const string &path, const string &reason)
    : FIOException("InvalidPathError: " + reason + " [path=" + path + "]"),
      m_path(path) {}

const int64_t TransferError::kNoChunk;

// --------------------------------------------------------------------------
TransferError::TransferError(const string &path, int64_t chunkIndex,
                             uint16_t attempts, const string &cause,
                             int errorCode, bool retryable)
    : FIOException("TransferError: [path=" + path + "] chunk=" +
                   (chunkIndex == kNoChunk ? string("none")
                                           : to_string(chunkIndex)) +
                   " attempts=" + to_string(attempts) + " cause: " + cause),
      m_path(path),
      m_chunkIndex(chunkIndex),
      m_attempts(attempts),
      m_cause(cause),
      m_errorCode(errorCode),
      m_retryable(retryable) {}

// --------------------------------------------------------------------------
MultipartAbortError::MultipartAbortError(const string &path,
                                         const string &uploadId,
                                         const string &cause)
    : FIOException("MultipartAbortError: [path=" + path +
                   "] uploadId=" + uploadId + " cause: " + cause),
      m_path(path),
      m_uploadId(uploadId) {}

// --------------------------------------------------------------------------
TimeoutError::TimeoutError(const string &path, uint32_t deadlineInMs)
    : FIOException("TimeoutError: [path=" + path + "] deadline of " +
                   to_string(deadlineInMs) + "ms exceeded"),
      m_path(path) {}

// --------------------------------------------------------------------------
CancelledError::CancelledError(const string &path)
    : FIOException("CancelledError: [path=" + path + "] transfer cancelled"),
      m_path(path) {}

}  // namespace Exception
}  // namespace FIO
