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

#include "filesystem/PathHandle.h"

#include <string>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/function.hpp"

#include "base/Exception.h"
#include "base/ThreadPool.h"
#include "configure/Default.h"

namespace FIO {

namespace FileSystem {

using boost::shared_ptr;
using boost::to_string;
using FIO::Client::Backend;
using FIO::Client::ClientError;
using FIO::Client::ErrorCode;
using FIO::Client::ObjectStat;
using FIO::Client::PresignOperation;
using FIO::Client::ProviderConfig;
using FIO::Client::QueryParams;
using FIO::Client::StatOutcome;
using FIO::Configure::Default::GetMaxPresignExpires;
using FIO::Exception::InvalidPathError;
using FIO::Exception::NotSupportedError;
using FIO::Exception::TransferError;
using FIO::Exception::ValidationError;
using std::string;

// --------------------------------------------------------------------------
PathHandle::PathHandle(const string &scheme, const string &container,
                       const string &key,
                       const shared_ptr<const ProviderConfig> &config,
                       const shared_ptr<Backend> &backend)
    : m_scheme(scheme),
      m_container(container),
      m_key(key),
      m_config(config),
      m_backend(backend) {
  if (!m_config || !m_backend) {
    throw InvalidPathError(ToString(), "path is not bound to a backend");
  }
}

// --------------------------------------------------------------------------
const ObjectStat &PathHandle::Stat(bool refresh) const {
  if (m_stat && !refresh) {
    return *m_stat;
  }
  StatOutcome outcome = m_backend->Stat(GetLocation());
  if (!outcome.IsSuccess()) {
    const ClientError &err = outcome.GetError();
    throw TransferError(ToString(), TransferError::kNoChunk, 1,
                        err.ToString(), err.GetError(), err.ShouldRetry());
  }
  m_stat = outcome.GetResult();
  return *m_stat;
}

// --------------------------------------------------------------------------
bool PathHandle::Exists() const {
  if (m_stat) {
    return true;
  }
  StatOutcome outcome = m_backend->Stat(GetLocation());
  if (outcome.IsSuccess()) {
    m_stat = outcome.GetResult();
    return true;
  }
  const ClientError &err = outcome.GetError();
  if (err.GetError() == ErrorCode::NOT_FOUND) {
    return false;
  }
  throw TransferError(ToString(), TransferError::kNoChunk, 1, err.ToString(),
                      err.GetError(), err.ShouldRetry());
}

// --------------------------------------------------------------------------
string PathHandle::Url(uint32_t expiresInSec, PresignOperation::Value op,
                       const QueryParams &params) const {
  if (expiresInSec < 1 || expiresInSec > GetMaxPresignExpires()) {
    throw ValidationError("presign expiry " + to_string(expiresInSec) +
                          " of " + ToString() + " is out of range [1, " +
                          to_string(GetMaxPresignExpires()) + "]");
  }
  string url;
  ClientError err =
      m_backend->PresignUrl(GetLocation(), op, expiresInSec, params, &url);
  if (err.GetError() == ErrorCode::NOT_SUPPORTED) {
    throw NotSupportedError("presigned url of " + ToString() + " (" +
                            Client::ProviderFamilyToString(GetFamily()) +
                            ")");
  }
  if (!err.IsGood()) {
    throw TransferError(ToString(), TransferError::kNoChunk, 1, err.ToString(),
                        err.GetError(), err.ShouldRetry());
  }
  return url;
}

// --------------------------------------------------------------------------
string PathHandle::Url(uint32_t expiresInSec) const {
  return Url(expiresInSec, PresignOperation::GetObject, QueryParams());
}

// --------------------------------------------------------------------------
boost::unique_future<string> PathHandle::UrlAsync(
    FIO::Threading::ThreadPool &pool, uint32_t expiresInSec,
    PresignOperation::Value op, const QueryParams &params) const {
  typedef string (PathHandle::*UrlFn)(uint32_t, PresignOperation::Value,
                                      const QueryParams &) const;
  UrlFn fn = &PathHandle::Url;
  // the task owns a copy of the handle
  boost::function<string()> task =
      boost::bind(fn, PathHandle(*this), expiresInSec, op, params);
  return pool.SubmitCallable<string>(task);
}

// --------------------------------------------------------------------------
string PathHandle::ToString() const {
  if (m_config && m_config->GetFamily() == Client::ProviderFamily::Local &&
      m_container.empty()) {
    return m_key;
  }
  return m_scheme + "://" + m_container + "/" + m_key;
}

// --------------------------------------------------------------------------
bool PathHandle::operator==(const PathHandle &rhs) const {
  return m_scheme == rhs.m_scheme && m_container == rhs.m_container &&
         m_key == rhs.m_key && m_config == rhs.m_config;
}

}  // namespace FileSystem
}  // namespace FIO
