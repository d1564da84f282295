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

#ifndef FILEIO_CLIENT_BACKEND_H_
#define FILEIO_CLIENT_BACKEND_H_

#include <stddef.h>
#include <stdint.h>
#include <time.h>

#include <map>
#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "client/ClientError.h"
#include "client/Outcome.hpp"
#include "client/ProviderConfig.h"

namespace FIO {

namespace Client {

// Object addressed inside one backend instance. Container is empty for
// local paths.
struct ObjectLocation {
  ObjectLocation() {}
  ObjectLocation(const std::string &c, const std::string &k)
      : container(c), key(k) {}

  std::string ToString() const;

  std::string container;
  std::string key;
};

struct ObjectStat {
  ObjectStat() : size(0), sizeKnown(true), mtime(0), isDirectory(false) {}

  uint64_t size;
  bool sizeKnown;  // false if the backend could not report the size
  time_t mtime;
  std::string eTag;
  bool isDirectory;
};

typedef Outcome<ObjectStat> StatOutcome;

struct PresignOperation {
  enum Value { GetObject, PutObject, DeleteObject, HeadObject };
};

// "get_object", "put_object", "delete_object", "head_object"
std::string PresignOperationToString(PresignOperation::Value op);

// @return : false if name is not a presignable operation
bool StringToPresignOperation(const std::string &name,
                              PresignOperation::Value *op);

// HTTP method of the operation
std::string PresignOperationToMethod(PresignOperation::Value op);

struct CompletedPart {
  CompletedPart() : partNumber(0) {}
  CompletedPart(int number, const std::string &tag)
      : partNumber(number), eTag(tag) {}

  int partNumber;
  std::string eTag;
};

typedef std::map<std::string, std::string> QueryParams;

//
// Backend
//
// Capability interface of one provider instance. The engine only ever
// talks to this interface, the variant is chosen by the provider family
// tag of the config.
//
// Calls may come from several worker threads at once. Remote and
// filesystem failures are returned as ClientError, never thrown.
//
class Backend : private boost::noncopyable {
 public:
  explicit Backend(const boost::shared_ptr<const ProviderConfig> &config)
      : m_config(config) {}

  virtual ~Backend() {}

 public:
  const boost::shared_ptr<const ProviderConfig> &GetConfig() const {
    return m_config;
  }
  ProviderFamily::Value GetFamily() const { return m_config->GetFamily(); }

  virtual bool SupportsMultipart() const { return false; }

  virtual StatOutcome Stat(const ObjectLocation &loc) = 0;

  // Read [offset, offset + length) into data, data is resized to the bytes
  // actually read
  virtual ClientError ReadChunk(const ObjectLocation &loc, uint64_t offset,
                                size_t length, std::vector<char> *data) = 0;

  // Streaming write: chunks may arrive in any order, the object only
  // becomes visible at CommitWrite. AbortWrite discards everything written
  // so far and is a no-op for an unknown write id.
  virtual ClientError BeginWrite(const ObjectLocation &loc, uint64_t size,
                                 std::string *writeId) = 0;
  virtual ClientError WriteChunk(const ObjectLocation &loc,
                                 const std::string &writeId, uint64_t offset,
                                 const char *data, size_t length) = 0;
  virtual ClientError CommitWrite(const ObjectLocation &loc,
                                  const std::string &writeId) = 0;
  virtual ClientError AbortWrite(const ObjectLocation &loc,
                                 const std::string &writeId) = 0;

  // Multipart primitives, NOT_SUPPORTED unless SupportsMultipart
  virtual ClientError InitiateMultipartUpload(const ObjectLocation &loc,
                                              std::string *uploadId);
  virtual ClientError UploadPart(const ObjectLocation &loc,
                                 const std::string &uploadId, int partNumber,
                                 const char *data, size_t length,
                                 std::string *eTag);
  virtual ClientError CompleteMultipartUpload(
      const ObjectLocation &loc, const std::string &uploadId,
      const std::vector<CompletedPart> &parts);
  virtual ClientError AbortMultipartUpload(const ObjectLocation &loc,
                                           const std::string &uploadId);

  // Deleting a missing object succeeds
  virtual ClientError DeleteObject(const ObjectLocation &loc) = 0;

  // @param  : location, operation, expiry in seconds, extra signed query
  //           parameters, output url
  virtual ClientError PresignUrl(const ObjectLocation &loc,
                                 PresignOperation::Value op,
                                 uint32_t expiresInSec,
                                 const QueryParams &params, std::string *url);

 protected:
  ClientError NotSupported(const std::string &exceptionName) const;

 private:
  boost::shared_ptr<const ProviderConfig> m_config;
};

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_BACKEND_H_
