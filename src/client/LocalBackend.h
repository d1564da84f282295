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

#ifndef FILEIO_CLIENT_LOCALBACKEND_H_
#define FILEIO_CLIENT_LOCALBACKEND_H_

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "client/Backend.h"

namespace FIO {

namespace Client {

//
// LocalBackend
//
// Backend over the local filesystem. A write goes to a sibling partial
// file "<path>.<writeId>.fileio-part" and is renamed into place at commit,
// so readers see either the old object or the complete new one.
//
class LocalBackend : public Backend {
 public:
  explicit LocalBackend(const boost::shared_ptr<const ProviderConfig> &config);
  virtual ~LocalBackend();

 public:
  StatOutcome Stat(const ObjectLocation &loc);
  ClientError ReadChunk(const ObjectLocation &loc, uint64_t offset,
                        size_t length, std::vector<char> *data);

  ClientError BeginWrite(const ObjectLocation &loc, uint64_t size,
                         std::string *writeId);
  ClientError WriteChunk(const ObjectLocation &loc, const std::string &writeId,
                         uint64_t offset, const char *data, size_t length);
  ClientError CommitWrite(const ObjectLocation &loc,
                          const std::string &writeId);
  ClientError AbortWrite(const ObjectLocation &loc, const std::string &writeId);

  ClientError DeleteObject(const ObjectLocation &loc);

  // Number of writes begun but not yet committed or aborted
  size_t GetPendingWriteCount() const;

 protected:
  // Filesystem path of the object
  //
  // @param  : location, output path
  // @return : MALFORMED_REQUEST if location cannot be mapped
  virtual ClientError ResolvePath(const ObjectLocation &loc,
                                  std::string *path) const;

  // Prefix of exception names, e.g. "Local"
  virtual std::string GetExceptionPrefix() const { return "Local"; }

  ClientError BuildErrnoError(const std::string &exceptionName,
                              int errnum) const;

 private:
  struct PendingWrite {
    PendingWrite() : fd(-1) {}

    int fd;  // -1 once closed
    std::string partialPath;
    std::string targetPath;
  };

  bool TakePendingWrite(const std::string &writeId, PendingWrite *write);
  bool FindPendingWrite(const std::string &writeId, PendingWrite *write) const;
  void MarkPendingWriteClosed(const std::string &writeId);
  std::string NextWriteId();

 private:
  std::map<std::string, PendingWrite> m_pendingWrites;
  mutable boost::mutex m_pendingWritesLock;
  uint64_t m_writeCounter;
};

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_LOCALBACKEND_H_
