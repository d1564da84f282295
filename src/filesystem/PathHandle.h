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

#ifndef FILEIO_FILESYSTEM_PATHHANDLE_H_
#define FILEIO_FILESYSTEM_PATHHANDLE_H_

#include <stdint.h>

#include <string>

#include "boost/optional.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/future.hpp"

#include "client/Backend.h"
#include "client/ProviderConfig.h"

namespace FIO {

namespace Threading {
class ThreadPool;
}  // namespace Threading

namespace FileSystem {

//
// PathHandle
//
// A local file or an object of one backend instance. Cheap to copy, holds
// no connection. The provider config and backend are fixed at construction.
//
// Stat metadata is fetched on first use and cached on the handle, a
// handle is not meant to be shared by concurrent operations.
//
class PathHandle {
 public:
  PathHandle(const std::string &scheme, const std::string &container,
             const std::string &key,
             const boost::shared_ptr<const Client::ProviderConfig> &config,
             const boost::shared_ptr<Client::Backend> &backend);

 public:
  const std::string &GetScheme() const { return m_scheme; }
  const std::string &GetContainer() const { return m_container; }
  const std::string &GetKey() const { return m_key; }
  const boost::shared_ptr<const Client::ProviderConfig> &GetConfig() const {
    return m_config;
  }
  const boost::shared_ptr<Client::Backend> &GetBackend() const {
    return m_backend;
  }
  Client::ProviderFamily::Value GetFamily() const {
    return m_config->GetFamily();
  }
  bool IsLocal() const {
    return GetFamily() == Client::ProviderFamily::Local;
  }
  Client::ObjectLocation GetLocation() const {
    return Client::ObjectLocation(m_container, m_key);
  }

  // Stat the object, cached after the first successful call
  //
  // @param  : flag to bypass the cache
  // @return : stat
  //
  // Throws TransferError if the backend fails.
  const Client::ObjectStat &Stat(bool refresh = false) const;

  // @return : false if the object does not exist, throws TransferError on
  //           other failures
  bool Exists() const;

  uint64_t Size() const { return Stat().size; }

  bool HasCachedStat() const { return static_cast<bool>(m_stat); }
  void SetCachedStat(const Client::ObjectStat &stat) const { m_stat = stat; }
  void InvalidateStat() const { m_stat = boost::none; }

  // Presigned url of the object
  //
  // @param  : expiry in seconds, operation, extra signed query params
  // @return : url
  //
  // Throws ValidationError if the expiry is out of [1, 604800],
  // NotSupportedError if the backend cannot presign, TransferError if
  // presigning fails.
  std::string Url(uint32_t expiresInSec, Client::PresignOperation::Value op,
                  const Client::QueryParams &params) const;
  std::string Url(uint32_t expiresInSec) const;

  // Same as Url, computed on the pool
  boost::unique_future<std::string> UrlAsync(
      FIO::Threading::ThreadPool &pool, uint32_t expiresInSec,
      Client::PresignOperation::Value op,
      const Client::QueryParams &params) const;

  // "scheme://container/key", or the plain path of a local file
  std::string ToString() const;

  // Compare scheme, container, key and config identity, not the stat
  bool operator==(const PathHandle &rhs) const;
  bool operator!=(const PathHandle &rhs) const { return !(*this == rhs); }

 private:
  std::string m_scheme;
  std::string m_container;
  std::string m_key;
  boost::shared_ptr<const Client::ProviderConfig> m_config;
  boost::shared_ptr<Client::Backend> m_backend;
  mutable boost::optional<Client::ObjectStat> m_stat;
};

}  // namespace FileSystem
}  // namespace FIO


#endif  // FILEIO_FILESYSTEM_PATHHANDLE_H_
