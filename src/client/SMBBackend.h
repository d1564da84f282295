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

#ifndef FILEIO_CLIENT_SMBBACKEND_H_
#define FILEIO_CLIENT_SMBBACKEND_H_

#include <string>

#include "boost/shared_ptr.hpp"

#include "client/LocalBackend.h"

namespace FIO {

namespace Client {

//
// SMBBackend
//
// SMB share reached through its mount point. "smb://share/dir/file" maps to
// "<MOUNT_ROOT>/share/dir/file". Writes are atomic the same way as local
// ones.
//
class SMBBackend : public LocalBackend {
 public:
  // Throws ProviderConfigError if the mount root is not a directory
  explicit SMBBackend(const boost::shared_ptr<const ProviderConfig> &config);

 public:
  const std::string &GetMountRoot() const { return m_mountRoot; }

 protected:
  ClientError ResolvePath(const ObjectLocation &loc, std::string *path) const;
  std::string GetExceptionPrefix() const { return "SMB"; }

 private:
  std::string m_mountRoot;
};

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_SMBBACKEND_H_
