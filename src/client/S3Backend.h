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

#ifndef FILEIO_CLIENT_S3BACKEND_H_
#define FILEIO_CLIENT_S3BACKEND_H_

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "client/Backend.h"
#include "client/Presigner.h"
#include "data/StreamBuf.h"

namespace QingStor {
class Bucket;
class QsConfig;
}  // namespace QingStor

namespace FIO {

namespace Client {

//
// S3Backend
//
// Backend for the S3 compatible family (AWS, MinIO, R2 and generic S3)
// over the sdk transport client. One sdk bucket per container is created
// on first use and kept for the backend's lifetime.
//
// A streaming write is staged in memory and sent as one PutObject at
// commit, an aborted write leaves nothing behind.
//
// Requests are signed and addressed the way the sdk Bucket does it for
// QingStor. Stores that only accept SigV4 reject them. Presigned URLs are
// built by Presigner and are not affected.
//
class S3Backend : public Backend {
 public:
  explicit S3Backend(const boost::shared_ptr<const ProviderConfig> &config);
  ~S3Backend();

 public:
  bool SupportsMultipart() const { return true; }

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

  ClientError InitiateMultipartUpload(const ObjectLocation &loc,
                                      std::string *uploadId);
  ClientError UploadPart(const ObjectLocation &loc,
                         const std::string &uploadId, int partNumber,
                         const char *data, size_t length, std::string *eTag);
  ClientError CompleteMultipartUpload(const ObjectLocation &loc,
                                      const std::string &uploadId,
                                      const std::vector<CompletedPart> &parts);
  ClientError AbortMultipartUpload(const ObjectLocation &loc,
                                   const std::string &uploadId);

  ClientError DeleteObject(const ObjectLocation &loc);

  ClientError PresignUrl(const ObjectLocation &loc, PresignOperation::Value op,
                         uint32_t expiresInSec, const QueryParams &params,
                         std::string *url);

  bool IsVirtualHostedStyle(const std::string &container) const;

 private:
  boost::shared_ptr<QingStor::Bucket> GetBucket(const std::string &container);
  ClientError CheckLocation(const ObjectLocation &loc,
                            const std::string &exceptionName) const;

  static void StartSDK();

 private:
  boost::shared_ptr<QingStor::QsConfig> m_sdkConfig;

  std::map<std::string, boost::shared_ptr<QingStor::Bucket> > m_buckets;
  boost::mutex m_bucketsLock;

  struct StagedWrite {
    FIO::Data::Buffer buffer;
    size_t size;
  };
  std::map<std::string, StagedWrite> m_stagedWrites;
  boost::mutex m_stagedWritesLock;
  uint64_t m_writeCounter;
};

}  // namespace Client
}  // namespace FIO


#endif  // FILEIO_CLIENT_S3BACKEND_H_
