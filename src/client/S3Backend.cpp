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

#include "client/S3Backend.h"

#include <string.h>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "qingstor/Bucket.h"
#include "qingstor/HttpCommon.h"
#include "qingstor/QingStor.h"
#include "qingstor/QsConfig.h"
#include "qingstor/QsErrors.h"
#include "qingstor/QsSdkOption.h"
#include "qingstor/types/ObjectPartType.h"

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/make_shared.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/once.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/TimeUtils.h"
#include "base/Utils.h"
#include "client/S3Error.h"
#include "configure/Default.h"
#include "data/IOStream.h"

namespace FIO {

namespace Client {

using boost::call_once;
using boost::lock_guard;
using boost::make_shared;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using FIO::Data::Buffer;
using FIO::Data::IOStream;
using FIO::Exception::ValidationError;
using FIO::TimeUtils::RFC822GMTToSeconds;
using QingStor::AbortMultipartUploadInput;
using QingStor::AbortMultipartUploadOutput;
using QingStor::Bucket;
using QingStor::CompleteMultipartUploadInput;
using QingStor::CompleteMultipartUploadOutput;
using QingStor::DeleteObjectInput;
using QingStor::DeleteObjectOutput;
using QingStor::GetObjectInput;
using QingStor::GetObjectOutput;
using QingStor::HeadObjectInput;
using QingStor::HeadObjectOutput;
using QingStor::InitiateMultipartUploadInput;
using QingStor::InitiateMultipartUploadOutput;
using QingStor::PutObjectInput;
using QingStor::PutObjectOutput;
using QingStor::QsConfig;  // sdk config
using QingStor::UploadMultipartInput;
using QingStor::UploadMultipartOutput;
using std::iostream;
using std::map;
using std::string;
using std::vector;

namespace {

boost::once_flag onceFlagStartSDK = BOOST_ONCE_INIT;
QingStor::SDKOptions sdkOptions;

const char *GetSDKLogDir() {
  static string logdir;
  logdir = FIO::Utils::AppendPathDelim(
      FIO::Utils::JoinPath(FIO::Configure::Default::GetDefaultLogDirectory(),
                           FIO::Configure::Default::GetSDKLogFolderBaseName()));
  return logdir.c_str();
}

// "bytes=0-1023"
string BuildRange(uint64_t offset, size_t length) {
  return "bytes=" + to_string(offset) + "-" + to_string(offset + length - 1);
}

}  // namespace

// --------------------------------------------------------------------------
void S3Backend::StartSDK() {
  sdkOptions.logPath = GetSDKLogDir();
  InitializeSDK(sdkOptions);
}

// --------------------------------------------------------------------------
S3Backend::S3Backend(const shared_ptr<const ProviderConfig> &config)
    : Backend(config), m_writeCounter(0) {
  call_once(onceFlagStartSDK, S3Backend::StartSDK);

  const Credentials &credentials = config->GetCredentials();
  m_sdkConfig = shared_ptr<QsConfig>(
      new QsConfig(credentials.GetAccessKeyId(), credentials.GetSecretKey()));
  m_sdkConfig->additionalUserAgent = FIO::Configure::Default::GetProgramName();
  m_sdkConfig->host = config->GetEndpoint().host;
  m_sdkConfig->protocol =
      Http::ProtocolToString(config->GetEndpoint().protocol);
  m_sdkConfig->port = config->GetEndpoint().port;
  // retries are driven by RetryPolicy, not by the sdk
  m_sdkConfig->connectionRetries = 0;
  m_sdkConfig->timeOutPeriod = config->GetTimeoutInSec();

  DebugInfo("S3 backend of scheme " + config->GetScheme() + " at " +
            config->GetEndpoint().ToString());
}

// --------------------------------------------------------------------------
S3Backend::~S3Backend() {
  lock_guard<mutex> lock(m_stagedWritesLock);
  DebugWarningIf(!m_stagedWrites.empty(),
                 "Discard " + to_string(m_stagedWrites.size()) +
                     " uncommitted writes");
  m_stagedWrites.clear();
}

// --------------------------------------------------------------------------
StatOutcome S3Backend::Stat(const ObjectLocation &loc) {
  string exceptionName = "S3HeadObject";
  ClientError err = CheckLocation(loc, exceptionName);
  if (!err.IsGood()) {
    return StatOutcome(err);
  }
  exceptionName.append(" object=" + loc.ToString());

  HeadObjectInput input;
  HeadObjectOutput output;
  QsError sdkErr = GetBucket(loc.container)->HeadObject(loc.key, input, output);
  if (!SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return StatOutcome(BuildS3Error(sdkErr, exceptionName, output));
  }

  ObjectStat stat;
  int64_t contentLength = output.GetContentLength();
  stat.sizeKnown = contentLength >= 0;
  stat.size = stat.sizeKnown ? static_cast<uint64_t>(contentLength) : 0;
  stat.mtime = RFC822GMTToSeconds(output.GetLastModified());
  stat.eTag = output.GetETag();
  stat.isDirectory = false;
  return StatOutcome(stat);
}

// --------------------------------------------------------------------------
ClientError S3Backend::ReadChunk(const ObjectLocation &loc, uint64_t offset,
                                size_t length, vector<char> *data) {
  string exceptionName = "S3GetObject";
  if (data == NULL) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Null output buffer", false);
  }
  ClientError err = CheckLocation(loc, exceptionName);
  if (!err.IsGood()) {
    return err;
  }
  data->clear();
  if (length == 0) {
    return GoodError();
  }
  string range = BuildRange(offset, length);
  exceptionName.append(" object=" + loc.ToString() + " range=" + range);

  GetObjectInput input;
  input.SetRange(range);
  GetObjectOutput output;
  QsError sdkErr = GetBucket(loc.container)->GetObject(loc.key, input, output);
  if (!SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    // range starts at or past the end of object
    if (SDKResponseCodeToInt(output.GetResponseCode()) == 416) {
      return GoodError();
    }
    return BuildS3Error(sdkErr, exceptionName, output);
  }

  iostream *body = output.GetBody();
  if (body == NULL) {
    return ClientError(ErrorCode::CONNECTION_RESET, exceptionName,
                       "Response has no body");
  }
  data->resize(length);
  body->seekg(0, std::ios_base::beg);
  body->read(&(*data)[0], length);
  size_t got = static_cast<size_t>(body->gcount());
  data->resize(got);
  // a short body without eof of object is a broken transfer
  if (got < length &&
      static_cast<uint64_t>(output.GetContentLength()) > got) {
    return ClientError(ErrorCode::CONNECTION_RESET, exceptionName,
                       "Short read " + to_string(got) + " of " +
                           to_string(output.GetContentLength()) + " bytes");
  }
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::BeginWrite(const ObjectLocation &loc, uint64_t size,
                                 string *writeId) {
  string exceptionName = "S3BeginWrite";
  if (writeId == NULL) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Null write id", false);
  }
  ClientError err = CheckLocation(loc, exceptionName);
  if (!err.IsGood()) {
    return err;
  }

  StagedWrite write;
  write.size = static_cast<size_t>(size);
  write.buffer = make_shared<vector<char> >(write.size);

  lock_guard<mutex> lock(m_stagedWritesLock);
  ++m_writeCounter;
  *writeId = loc.ToString() + "#" + to_string(m_writeCounter);
  m_stagedWrites[*writeId] = write;
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::WriteChunk(const ObjectLocation &loc,
                                 const string &writeId, uint64_t offset,
                                 const char *data, size_t length) {
  string exceptionName = "S3WriteChunk write=" + writeId;
  Buffer buffer;
  {
    lock_guard<mutex> lock(m_stagedWritesLock);
    map<string, StagedWrite>::iterator it = m_stagedWrites.find(writeId);
    if (it != m_stagedWrites.end()) {
      buffer = it->second.buffer;
    }
  }
  if (!buffer) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Unknown write id", false);
  }
  if (offset + length > buffer->size()) {
    return ClientError(ErrorCode::MALFORMED_REQUEST, exceptionName,
                       "Chunk exceeds declared object size " +
                           to_string(buffer->size()),
                       false);
  }
  if (length > 0) {
    memcpy(&(*buffer)[offset], data, length);
  }
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::CommitWrite(const ObjectLocation &loc,
                                  const string &writeId) {
  string exceptionName = "S3PutObject object=" + loc.ToString();
  StagedWrite write;
  {
    lock_guard<mutex> lock(m_stagedWritesLock);
    map<string, StagedWrite>::iterator it = m_stagedWrites.find(writeId);
    if (it == m_stagedWrites.end()) {
      return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                         "Unknown write id", false);
    }
    write = it->second;
  }

  PutObjectInput input;
  input.SetContentLength(write.size);
  shared_ptr<IOStream> body;
  if (write.size > 0) {
    body = boost::make_shared<IOStream>(write.buffer, write.size);
    input.SetBody(body.get());
  }
  PutObjectOutput output;
  QsError sdkErr = GetBucket(loc.container)->PutObject(loc.key, input, output);
  if (!SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    // keep the staging buffer, commit may be retried
    return BuildS3Error(sdkErr, exceptionName, output);
  }

  lock_guard<mutex> lock(m_stagedWritesLock);
  m_stagedWrites.erase(writeId);
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::AbortWrite(const ObjectLocation &loc,
                                 const string &writeId) {
  lock_guard<mutex> lock(m_stagedWritesLock);
  m_stagedWrites.erase(writeId);
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::InitiateMultipartUpload(const ObjectLocation &loc,
                                              string *uploadId) {
  string exceptionName = "S3InitiateMultipartUpload";
  ClientError err = CheckLocation(loc, exceptionName);
  if (!err.IsGood()) {
    return err;
  }
  exceptionName.append(" object=" + loc.ToString());

  InitiateMultipartUploadInput input;
  InitiateMultipartUploadOutput output;
  QsError sdkErr = GetBucket(loc.container)
                       ->InitiateMultipartUpload(loc.key, input, output);
  if (!SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return BuildS3Error(sdkErr, exceptionName, output);
  }
  if (uploadId != NULL) {
    *uploadId = output.GetUploadID();
  }
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::UploadPart(const ObjectLocation &loc,
                                 const string &uploadId, int partNumber,
                                 const char *data, size_t length,
                                 string *eTag) {
  string exceptionName = "S3UploadMultipart";
  ClientError err = CheckLocation(loc, exceptionName);
  if (!err.IsGood()) {
    return err;
  }
  exceptionName.append(" object=" + loc.ToString() +
                       " part=" + to_string(partNumber));

  UploadMultipartInput input;
  input.SetUploadID(uploadId);
  input.SetPartNumber(partNumber);
  input.SetContentLength(length);
  shared_ptr<IOStream> body;
  if (length > 0) {
    Buffer buffer = make_shared<vector<char> >(data, data + length);
    body = boost::make_shared<IOStream>(buffer, length);
    input.SetBody(body.get());
  }
  UploadMultipartOutput output;
  QsError sdkErr =
      GetBucket(loc.container)->UploadMultipart(loc.key, input, output);
  if (!SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return BuildS3Error(sdkErr, exceptionName, output);
  }
  // sdk identifies parts by number at completion
  if (eTag != NULL) {
    eTag->clear();
  }
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::CompleteMultipartUpload(
    const ObjectLocation &loc, const string &uploadId,
    const vector<CompletedPart> &parts) {
  string exceptionName = "S3CompleteMultipartUpload";
  ClientError err = CheckLocation(loc, exceptionName);
  if (!err.IsGood()) {
    return err;
  }
  exceptionName.append(" object=" + loc.ToString() + " upload=" + uploadId);

  CompleteMultipartUploadInput input;
  input.SetUploadID(uploadId);
  vector<QingStor::ObjectPartType> objParts;
  BOOST_FOREACH (const CompletedPart &completed, parts) {
    QingStor::ObjectPartType part;
    part.SetPartNumber(completed.partNumber);
    objParts.push_back(part);
  }
  input.SetObjectParts(objParts);
  CompleteMultipartUploadOutput output;
  QsError sdkErr = GetBucket(loc.container)
                       ->CompleteMultipartUpload(loc.key, input, output);
  if (!SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return BuildS3Error(sdkErr, exceptionName, output);
  }
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::AbortMultipartUpload(const ObjectLocation &loc,
                                           const string &uploadId) {
  string exceptionName = "S3AbortMultipartUpload";
  ClientError err = CheckLocation(loc, exceptionName);
  if (!err.IsGood()) {
    return err;
  }
  exceptionName.append(" object=" + loc.ToString() + " upload=" + uploadId);

  AbortMultipartUploadInput input;
  input.SetUploadID(uploadId);
  AbortMultipartUploadOutput output;
  QsError sdkErr =
      GetBucket(loc.container)->AbortMultipartUpload(loc.key, input, output);
  if (!SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return BuildS3Error(sdkErr, exceptionName, output);
  }
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::DeleteObject(const ObjectLocation &loc) {
  string exceptionName = "S3DeleteObject";
  ClientError err = CheckLocation(loc, exceptionName);
  if (!err.IsGood()) {
    return err;
  }
  exceptionName.append(" object=" + loc.ToString());

  DeleteObjectInput input;
  DeleteObjectOutput output;
  QsError sdkErr =
      GetBucket(loc.container)->DeleteObject(loc.key, input, output);
  if (!SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    ClientError deleteErr = BuildS3Error(sdkErr, exceptionName, output);
    if (deleteErr.GetError() != ErrorCode::NOT_FOUND) {
      return deleteErr;
    }
  }
  return GoodError();
}

// --------------------------------------------------------------------------
ClientError S3Backend::PresignUrl(const ObjectLocation &loc,
                                 PresignOperation::Value op,
                                 uint32_t expiresInSec,
                                 const QueryParams &params, string *url) {
  string exceptionName = "S3PresignUrl";
  ClientError err = CheckLocation(loc, exceptionName);
  if (!err.IsGood()) {
    return err;
  }
  exceptionName.append(" object=" + loc.ToString() +
                       " operation=" + PresignOperationToString(op));
  if (url == NULL) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Null output url", false);
  }
  const ProviderConfig &config = *GetConfig();
  if (config.IsAnonymous() || config.GetCredentials().IsEmpty()) {
    return ClientError(ErrorCode::AUTHENTICATION_FAILED, exceptionName,
                       "Anonymous access has no credentials to sign with",
                       false);
  }

  Presigner presigner(config.GetCredentials(), config.GetRegion(),
                      config.GetEndpoint(),
                      IsVirtualHostedStyle(loc.container));
  try {
    *url = presigner.Presign(loc, op, expiresInSec, params);
  } catch (const ValidationError &e) {
    return ClientError(ErrorCode::MALFORMED_REQUEST, exceptionName, e.what(),
                       false);
  }
  return GoodError();
}

// --------------------------------------------------------------------------
bool S3Backend::IsVirtualHostedStyle(const string &container) const {
  switch (GetConfig()->GetAddressingStyle()) {
    case AddressingStyle::Virtual:
      return true;
    case AddressingStyle::Path:
      return false;
    case AddressingStyle::Auto:
    default:
      // custom endpoints rarely serve bucket sub domains
      return GetConfig()->GetProviderName() == "AWS" &&
             Presigner::IsDnsCompatibleBucketName(container);
  }
}

// --------------------------------------------------------------------------
shared_ptr<Bucket> S3Backend::GetBucket(const string &container) {
  lock_guard<mutex> lock(m_bucketsLock);
  map<string, shared_ptr<Bucket> >::iterator it = m_buckets.find(container);
  if (it != m_buckets.end()) {
    return it->second;
  }
  string zone = GetConfig()->GetRegion();
  shared_ptr<Bucket> bucket(new Bucket(*m_sdkConfig, container, zone));
  m_buckets[container] = bucket;
  return bucket;
}

// --------------------------------------------------------------------------
ClientError S3Backend::CheckLocation(const ObjectLocation &loc,
                                    const string &exceptionName) const {
  if (loc.container.empty()) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Empty bucket", false);
  }
  if (loc.key.empty()) {
    return ClientError(ErrorCode::PARAMETER_MISSING, exceptionName,
                       "Empty ObjectKey", false);
  }
  return GoodError();
}

}  // namespace Client
}  // namespace FIO
