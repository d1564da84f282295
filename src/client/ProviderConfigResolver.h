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

#ifndef FILEIO_CLIENT_PROVIDERCONFIGRESOLVER_H_
#define FILEIO_CLIENT_PROVIDERCONFIGRESOLVER_H_

#include <map>
#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ProviderConfig.h"

namespace FIO {

namespace Configure {
class Environment;
}  // namespace Configure

namespace Client {

struct SchemeBinding {
  SchemeBinding() : family(ProviderFamily::Local), isDefault(false) {}

  std::string ToString() const;

  std::string prefix;
  std::string scheme;
  std::string providerName;
  ProviderFamily::Value family;
  bool isDefault;  // a provider's own scheme with its unprefixed variables
};

//
// ProviderConfigResolver
//
// Maps a scheme to its ProviderConfig. Every provider's canonical scheme
// and aliases are bound to its default prefix. Additional instances are
// bound with RegisterBinding or through FILEIO_<PROVIDER>_ENV_PREFIXES,
// e.g. FILEIO_MINIO_ENV_PREFIXES="MINIO_PROD_:mcp,MINIO_DEV_:mcd".
//
// Configs are built on first Resolve and cached, concurrent first
// resolutions of one scheme produce a single instance.
//
class ProviderConfigResolver : private boost::noncopyable {
 public:
  // Reads FILEIO_<PROVIDER>_ENV_PREFIXES of every provider, throws
  // ProviderConfigError on a malformed entry and DuplicateSchemeError on a
  // conflicting one.
  explicit ProviderConfigResolver(
      const boost::shared_ptr<Configure::Environment> &env);

 public:
  // Bind scheme to a prefix of a provider
  //
  // @param  : env var prefix, scheme, provider name such as "MINIO"
  // @return : void
  //
  // Re-registering the same binding is a no-op. Throws DuplicateSchemeError
  // if scheme is bound to a different prefix or provider, and
  // ProviderConfigError if the provider is unknown or the scheme is empty.
  void RegisterBinding(const std::string &prefix, const std::string &scheme,
                       const std::string &providerName);

  // Bind scheme to a prefix of the family's generic provider
  void RegisterBinding(const std::string &prefix, const std::string &scheme,
                       ProviderFamily::Value family);

  // Resolve scheme to its config
  //
  // @param  : scheme, case sensitive
  // @return : the cached config of scheme
  //
  // Throws UnknownSchemeError if the scheme is not bound, ProviderConfigError
  // if required fields are missing or invalid.
  boost::shared_ptr<const ProviderConfig> Resolve(const std::string &scheme);

  bool IsKnownScheme(const std::string &scheme) const;

  std::vector<SchemeBinding> GetBindings() const;

  // Parse FILEIO_<PROVIDER>_ENV_PREFIXES of every provider
  void LoadBindingsFromEnvironment();

 private:
  struct ResolutionSlot {
    boost::mutex lock;
    boost::shared_ptr<const ProviderConfig> config;
  };

  void RegisterDefaultBindings();
  void AddBinding(const SchemeBinding &binding);
  SchemeBinding FindBinding(const std::string &scheme) const;
  boost::shared_ptr<ResolutionSlot> GetSlot(const std::string &scheme);
  boost::shared_ptr<const ProviderConfig> Build(
      const SchemeBinding &binding) const;

  // Read <prefix><name>, falls back to the deprecated prefix for a default
  // binding
  bool ReadVar(const SchemeBinding &binding, const ProviderDescriptor &desc,
               const std::string &name, std::string *value) const;

 private:
  boost::shared_ptr<Configure::Environment> m_env;

  std::map<std::string, SchemeBinding> m_bindings;
  mutable boost::mutex m_bindingsLock;

  std::map<std::string, boost::shared_ptr<ResolutionSlot> > m_slots;
  boost::mutex m_slotsLock;

  friend class ProviderConfigResolverTest;
};

}  // namespace Client
}  // namespace FIO

#endif  // FILEIO_CLIENT_PROVIDERCONFIGRESOLVER_H_
