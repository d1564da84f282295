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

#include "client/SMBBackend.h"

#include <string>
#include <utility>

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Utils.h"

namespace FIO {

namespace Client {

using boost::shared_ptr;
using FIO::Exception::ProviderConfigError;
using FIO::Utils::HasParentReference;
using FIO::Utils::IsDirectory;
using FIO::Utils::JoinPath;
using std::pair;
using std::string;

// --------------------------------------------------------------------------
SMBBackend::SMBBackend(const shared_ptr<const ProviderConfig> &config)
    : LocalBackend(config), m_mountRoot(config->GetMountRoot()) {
  if (m_mountRoot.empty()) {
    throw ProviderConfigError(config->GetScheme(), "SMB mount root is empty");
  }
  pair<bool, string> res = IsDirectory(m_mountRoot);
  if (!res.first) {
    throw ProviderConfigError(
        config->GetScheme(),
        "SMB mount root " + m_mountRoot + " is not a directory: " + res.second);
  }
  DebugInfo("SMB backend of scheme " + config->GetScheme() + " mounted at " +
            m_mountRoot);
}

// --------------------------------------------------------------------------
ClientError SMBBackend::ResolvePath(const ObjectLocation &loc,
                                   string *path) const {
  string exceptionName = "SMBResolvePath object=" + loc.ToString();
  if (loc.container.empty() || loc.key.empty()) {
    return ClientError(ErrorCode::MALFORMED_REQUEST, exceptionName,
                       "Share and path are required", false);
  }
  // keep every path under the mount root
  if (HasParentReference(loc.key)) {
    return ClientError(ErrorCode::MALFORMED_REQUEST, exceptionName,
                       "Parent directory reference is not allowed", false);
  }
  if (loc.container == "..") {
    return ClientError(ErrorCode::MALFORMED_REQUEST, exceptionName,
                       "Invalid share name", false);
  }
  *path = JoinPath(JoinPath(m_mountRoot, loc.container), loc.key);
  return GoodError();
}

}  // namespace Client
}  // namespace FIO
