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

#ifndef FILEIO_FILESYSTEM_PATHFACTORY_H_
#define FILEIO_FILESYSTEM_PATHFACTORY_H_

#include <map>
#include <string>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "filesystem/PathHandle.h"

namespace FIO {

namespace Client {
class Backend;
class BackendFactory;
class ProviderConfig;
class ProviderConfigResolver;
}  // namespace Client

namespace FileSystem {

// Components of a path string
struct ParsedPath {
  ParsedPath() : isLocal(false) {}

  std::string scheme;
  std::string container;  // empty for local
  std::string key;
  bool isLocal;  // schemeless string or file:// uri
};

typedef boost::function<PathHandle(const std::string &)> PathCoercer;

//
// PathFactory
//
// Turns path strings into handles. "<scheme>://<container>/<key>" is bound
// to the config of its scheme, a schemeless string is a local path.
// One backend instance is kept per provider config.
//
class PathFactory : private boost::noncopyable {
 public:
  // @param  : resolver, backend factory (null for the default one)
  PathFactory(const boost::shared_ptr<Client::ProviderConfigResolver> &resolver,
              const boost::shared_ptr<Client::BackendFactory> &backendFactory);
  explicit PathFactory(
      const boost::shared_ptr<Client::ProviderConfigResolver> &resolver);

 public:
  // Open a handle of path
  //
  // Throws InvalidPathError on a malformed uri, UnknownSchemeError if the
  // scheme is not bound, ProviderConfigError if its config is incomplete.
  PathHandle Open(const std::string &path);

  // Same as Open, for validation layers coercing strings to handles
  PathHandle CoercePath(const std::string &path) { return Open(path); }

  // Coercion function bound to this factory
  PathCoercer GetCoercer();

  // Split path into its components without resolving anything
  //
  // Throws InvalidPathError on a malformed uri.
  static ParsedPath ParsePath(const std::string &path);

  boost::shared_ptr<Client::Backend> GetBackend(
      const boost::shared_ptr<const Client::ProviderConfig> &config);

  Client::ProviderConfigResolver &GetResolver() { return *m_resolver; }

 private:
  boost::shared_ptr<Client::ProviderConfigResolver> m_resolver;
  boost::shared_ptr<Client::BackendFactory> m_backendFactory;

  typedef std::map<const Client::ProviderConfig *,
                   boost::shared_ptr<Client::Backend> >
      BackendMap;
  BackendMap m_backends;
  boost::mutex m_backendsLock;
};

}  // namespace FileSystem
}  // namespace FIO


#endif  // FILEIO_FILESYSTEM_PATHFACTORY_H_
