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

#include "client/LocalBackend.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace FIO {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using FIO::Configure::Default::GetDefineFileMode;
using FIO::Utils::CreateDirectoryIfNotExists;
using FIO::Utils::GetDirName;
using FIO::Utils::JoinPath;
using FIO::Utils::MakePartialPath;
using std::map;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
LocalBackend::LocalBackend(const shared_ptr<const ProviderConfig> &config)
    : Backend(config), m_writeCounter(0) {}

// --------------------------------------------------------------------------
LocalBackend::~LocalBackend() {
  lock_guard<mutex> lock(m_pendingWritesLock);
  for (map<string, PendingWrite>::iterator it = m_pendingWrites.begin();
       it != m_pendingWrites.end(); ++it) {
    ::close(it->second.fd);
    if (::unlink(it->second.partialPath.c_str()) != 0) {
      Warning("Fail to remove partial file " + it->second.partialPath + " : " +
              strerror(errno));
    }
  }
  m_pendingWrites.clear();
}

// --------------------------------------------------------------------------
StatOutcome LocalBackend::Stat(const ObjectLocation &loc) {
  string exceptionName = GetExceptionPrefix() + "Stat";
  string path;
  ClientError err = ResolvePath(loc, &path);
  if (!err.IsGood()) {
    return StatOutcome(err);
  }
  exceptionName.append(" path=" + path);

  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return StatOutcome(BuildErrnoError(exceptionName, errno));
  }

  ObjectStat objStat;
  objStat.size = S_ISDIR(st.st_mode) ? 0 : static_cast<uint64_t>(st.st_size);
  objStat.mtime = st.st_mtime;
  objStat.isDirectory = S_ISDIR(st.st_mode);
  return StatOutcome(objStat);
}

// --------------------------------------------------------------------------
ClientError LocalBackend::ReadChunk(const ObjectLocation &loc, uint64_t offset,
                                   size_t length, vector<char> *data) {
  string exceptionName = GetExceptionPrefix() + "ReadChunk";
  if (data == NULL) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Null output buffer", false);
  }
  string path;
  ClientError err = ResolvePath(loc, &path);
  if (!err.IsGood()) {
    return err;
  }
  exceptionName.append(" path=" + path + " offset=" + to_string(offset));

  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return BuildErrnoError(exceptionName, errno);
  }

  data->resize(length);
  size_t total = 0;
  while (total < length) {
    ssize_t n = ::pread(fd, &(*data)[total], length - total,
                        static_cast<off_t>(offset + total));
    if (n < 0) {
      if (errno == EINTR) continue;
      int errnum = errno;
      ::close(fd);
      data->clear();
      return BuildErrnoError(exceptionName, errnum);
    }
    if (n == 0) {
      break;  // eof
    }
    total += static_cast<size_t>(n);
  }
  ::close(fd);
  data->resize(total);
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError LocalBackend::BeginWrite(const ObjectLocation &loc, uint64_t size,
                                    string *writeId) {
  string exceptionName = GetExceptionPrefix() + "BeginWrite";
  if (writeId == NULL) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Null write id", false);
  }
  string path;
  ClientError err = ResolvePath(loc, &path);
  if (!err.IsGood()) {
    return err;
  }
  exceptionName.append(" path=" + path);

  string dir = GetDirName(path);
  if (!CreateDirectoryIfNotExists(dir)) {
    return ClientError(ErrorCode::IO_ERROR, exceptionName,
                       "Unable to create directory " + dir, false);
  }

  string id = NextWriteId();
  PendingWrite write;
  write.targetPath = path;
  write.partialPath = MakePartialPath(path, id);
  write.fd = ::open(write.partialPath.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                    GetDefineFileMode());
  if (write.fd < 0) {
    return BuildErrnoError(exceptionName, errno);
  }
  if (size > 0 && ::ftruncate(write.fd, static_cast<off_t>(size)) != 0) {
    int errnum = errno;
    ::close(write.fd);
    ::unlink(write.partialPath.c_str());
    return BuildErrnoError(exceptionName, errnum);
  }

  {
    lock_guard<mutex> lock(m_pendingWritesLock);
    m_pendingWrites[id] = write;
  }
  *writeId = id;
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError LocalBackend::WriteChunk(const ObjectLocation &loc,
                                    const string &writeId, uint64_t offset,
                                    const char *data, size_t length) {
  string exceptionName = GetExceptionPrefix() + "WriteChunk write=" + writeId +
                         " offset=" + to_string(offset);
  int fd = -1;
  {
    lock_guard<mutex> lock(m_pendingWritesLock);
    map<string, PendingWrite>::const_iterator it =
        m_pendingWrites.find(writeId);
    if (it != m_pendingWrites.end()) {
      fd = it->second.fd;
    }
  }
  if (fd < 0) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Unknown write id", false);
  }

  size_t total = 0;
  while (total < length) {
    ssize_t n = ::pwrite(fd, data + total, length - total,
                         static_cast<off_t>(offset + total));
    if (n < 0) {
      if (errno == EINTR) continue;
      return BuildErrnoError(exceptionName, errno);
    }
    total += static_cast<size_t>(n);
  }
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError LocalBackend::CommitWrite(const ObjectLocation &loc,
                                     const string &writeId) {
  string exceptionName = GetExceptionPrefix() + "CommitWrite write=" + writeId;
  PendingWrite write;
  if (!FindPendingWrite(writeId, &write)) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Unknown write id", false);
  }
  exceptionName.append(" path=" + write.targetPath);

  // the write stays pending until renamed, a failed commit may be retried
  // or aborted
  if (write.fd >= 0) {
    if (::fsync(write.fd) != 0) {
      return BuildErrnoError(exceptionName, errno);
    }
    int rc = ::close(write.fd);
    int errnum = errno;
    MarkPendingWriteClosed(writeId);
    if (rc != 0) {
      // written data may be lost, do not publish it on a retry
      ClientError err = BuildErrnoError(exceptionName, errnum);
      return ClientError(err.GetError(), err.GetExceptionName(),
                         err.GetMessage(), false);
    }
  }
  if (::rename(write.partialPath.c_str(), write.targetPath.c_str()) != 0) {
    return BuildErrnoError(exceptionName, errno);
  }
  TakePendingWrite(writeId, &write);
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError LocalBackend::AbortWrite(const ObjectLocation &loc,
                                    const string &writeId) {
  PendingWrite write;
  if (!TakePendingWrite(writeId, &write)) {
    return GoodError();
  }
  if (write.fd >= 0) {
    ::close(write.fd);
  }
  if (::unlink(write.partialPath.c_str()) != 0 && errno != ENOENT) {
    return BuildErrnoError(GetExceptionPrefix() + "AbortWrite path=" +
                               write.partialPath,
                           errno);
  }
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError LocalBackend::DeleteObject(const ObjectLocation &loc) {
  string exceptionName = GetExceptionPrefix() + "DeleteObject";
  string path;
  ClientError err = ResolvePath(loc, &path);
  if (!err.IsGood()) {
    return err;
  }
  exceptionName.append(" path=" + path);
  if (::unlink(path.c_str()) != 0 && errno != ENOENT) {
    return BuildErrnoError(exceptionName, errno);
  }
  return GoodError();
}

// --------------------------------------------------------------------------
size_t LocalBackend::GetPendingWriteCount() const {
  lock_guard<mutex> lock(m_pendingWritesLock);
  return m_pendingWrites.size();
}

// --------------------------------------------------------------------------
ClientError LocalBackend::ResolvePath(const ObjectLocation &loc,
                                     string *path) const {
  if (loc.key.empty()) {
    return ClientError(ErrorCode::MALFORMED_REQUEST,
                       GetExceptionPrefix() + "ResolvePath",
                       "Empty path", false);
  }
  *path = loc.container.empty() ? loc.key : JoinPath(loc.container, loc.key);
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError LocalBackend::BuildErrnoError(const string &exceptionName,
                                         int errnum) const {
  return ClientError(ErrnoToErrorCode(errnum), exceptionName,
                     strerror(errnum));
}

// --------------------------------------------------------------------------
bool LocalBackend::TakePendingWrite(const string &writeId,
                                    PendingWrite *write) {
  lock_guard<mutex> lock(m_pendingWritesLock);
  map<string, PendingWrite>::iterator it = m_pendingWrites.find(writeId);
  if (it == m_pendingWrites.end()) {
    return false;
  }
  *write = it->second;
  m_pendingWrites.erase(it);
  return true;
}

// --------------------------------------------------------------------------
bool LocalBackend::FindPendingWrite(const string &writeId,
                                    PendingWrite *write) const {
  lock_guard<mutex> lock(m_pendingWritesLock);
  map<string, PendingWrite>::const_iterator it = m_pendingWrites.find(writeId);
  if (it == m_pendingWrites.end()) {
    return false;
  }
  *write = it->second;
  return true;
}

// --------------------------------------------------------------------------
void LocalBackend::MarkPendingWriteClosed(const string &writeId) {
  lock_guard<mutex> lock(m_pendingWritesLock);
  map<string, PendingWrite>::iterator it = m_pendingWrites.find(writeId);
  if (it != m_pendingWrites.end()) {
    it->second.fd = -1;
  }
}

// --------------------------------------------------------------------------
string LocalBackend::NextWriteId() {
  lock_guard<mutex> lock(m_pendingWritesLock);
  ++m_writeCounter;
  return to_string(::getpid()) + "-" + to_string(m_writeCounter);
}

}  // namespace Client
}  // namespace FIO
